#pragma once

#include "common/domain/DomainEvent.hpp"

#include <cstdint>

// ==================== 现场单元连接事件 ====================

/**
 * @brief 现场单元接入（aggregateId 为对端 IP）
 */
struct FieldUnitConnected : DomainEvent {
    explicit FieldUnitConnected(std::string peerIp)
        : DomainEvent("FieldUnitConnected", std::move(peerIp), "FieldUnit") {}
};

/**
 * @brief 现场单元断开
 */
struct FieldUnitDisconnected : DomainEvent {
    std::string locationId;
    uint64_t packets = 0;
    uint64_t errors = 0;

    FieldUnitDisconnected(std::string peerIp, std::string location, uint64_t p, uint64_t e)
        : DomainEvent("FieldUnitDisconnected", std::move(peerIp), "FieldUnit")
        , locationId(std::move(location)), packets(p), errors(e) {}
};
