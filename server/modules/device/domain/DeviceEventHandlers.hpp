#pragma once

#include "Events.hpp"
#include "common/domain/EventBus.hpp"
#include "common/network/IngestionEvents.hpp"
#include "modules/device/DeviceScheduler.hpp"
#include "modules/device/DeviceStatusTracker.hpp"

#include <trantor/utils/Logger.h>

/**
 * @brief 设备相关事件处理器
 *
 * 订阅现场单元连接、指令下发结果和设备增删改事件，
 * 转交给调度器与在线状态跟踪。需在任何组件启动之前注册。
 */
class DeviceEventHandlers {
public:
    static void registerAll(EventBus& bus, DeviceScheduler& scheduler, DeviceStatusTracker& tracker) {
        // 现场单元接入：同 IP 的 Continuous 设备重新安排 PERIOD_ON，并标记在线
        bus.subscribe<FieldUnitConnected>([&scheduler, &tracker](const FieldUnitConnected& event) {
            scheduler.rearmPeriodOn(event.aggregateId);
            tracker.onFieldUnitConnected(event.aggregateId);
        });

        bus.subscribe<FieldUnitDisconnected>([&tracker](const FieldUnitDisconnected& event) {
            LOG_DEBUG << "[DeviceEvents] Field unit " << event.aggregateId << " (" << event.locationId
                      << ") closed after " << event.packets << " packets, " << event.errors << " errors";
            tracker.onFieldUnitDisconnected(event.aggregateId);
        });

        bus.subscribe<CommandDispatched>([&tracker](const CommandDispatched& event) {
            LOG_TRACE << "[Dispatch] " << event.outcome.toJson().toStyledString();
            tracker.onCommandOutcome(event.outcome);
        });

        // 注册表已先于事件修改，直接按注册表重新同步
        bus.subscribe<DeviceRegistered>([&tracker](const DeviceRegistered&) { tracker.sync(); });
        bus.subscribe<DeviceUpdated>([&tracker](const DeviceUpdated&) { tracker.sync(); });
        bus.subscribe<DeviceRemoved>([&tracker](const DeviceRemoved&) { tracker.sync(); });

        LOG_INFO << "[DeviceEvents] Handlers registered";
    }
};
