#pragma once

#include "common/domain/DomainEvent.hpp"
#include "Command.hpp"

// ==================== 设备相关事件 ====================

/**
 * @brief 一次指令下发完成（成功或失败）
 */
struct CommandDispatched : DomainEvent {
    CommandOutcome outcome;

    explicit CommandDispatched(CommandOutcome o)
        : DomainEvent("CommandDispatched", std::to_string(o.deviceId), "Device")
        , outcome(std::move(o)) {}
};

struct DeviceRegistered : DomainEvent {
    explicit DeviceRegistered(int deviceId)
        : DomainEvent("DeviceRegistered", std::to_string(deviceId), "Device") {}
};

struct DeviceUpdated : DomainEvent {
    explicit DeviceUpdated(int deviceId)
        : DomainEvent("DeviceUpdated", std::to_string(deviceId), "Device") {}
};

struct DeviceRemoved : DomainEvent {
    explicit DeviceRemoved(int deviceId)
        : DomainEvent("DeviceRemoved", std::to_string(deviceId), "Device") {}
};
