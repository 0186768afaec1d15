#pragma once

#include <chrono>
#include <string>

/**
 * @brief 领域事件基类
 *
 * 用于解耦核心流水线与外部协作方（告警联动、看板、日志）。
 * 聚合根标识统一为字符串（位置 ID、设备 ID）。
 *
 * 具体事件定义在各模块的 domain/Events.hpp 中。
 */
struct DomainEvent {
    std::string type;                    // 事件类型标识
    std::string aggregateId;             // 聚合根 ID
    std::string aggregateType;           // 聚合根类型
    std::chrono::system_clock::time_point occurredAt;  // 发生时间

    DomainEvent() : occurredAt(std::chrono::system_clock::now()) {}

    DomainEvent(std::string eventType, std::string aggId, std::string aggType)
        : type(std::move(eventType))
        , aggregateId(std::move(aggId))
        , aggregateType(std::move(aggType))
        , occurredAt(std::chrono::system_clock::now()) {}

    virtual ~DomainEvent() = default;

    DomainEvent(const DomainEvent&) = default;
    DomainEvent& operator=(const DomainEvent&) = default;
    DomainEvent(DomainEvent&&) = default;
    DomainEvent& operator=(DomainEvent&&) = default;
};
