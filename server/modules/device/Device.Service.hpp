#pragma once

#include "DeviceRegistry.hpp"
#include "DeviceRepository.hpp"
#include "DeviceScheduler.hpp"
#include "DeviceStatusTracker.hpp"
#include "domain/Events.hpp"
#include "common/AppContext.hpp"

#include <map>

/**
 * @brief 设备管理服务
 *
 * 先写 pfds_devices 表，成功后再更新内存注册表，
 * 调度器在下一个 tick 按注册表版本号同步。
 */
class DeviceService {
public:
    template<typename T = void>
    using Task = drogon::Task<T>;

    DeviceService(AppContext& ctx, DeviceRepository& repository, DeviceRegistry& registry,
                  DeviceScheduler& scheduler, DeviceStatusTracker& deviceStatus)
        : ctx_(ctx)
        , repository_(repository)
        , registry_(registry)
        , scheduler_(scheduler)
        , deviceStatus_(deviceStatus) {}

    Json::Value list() const {
        Json::Value items(Json::arrayValue);
        for (const auto& device : registry_.snapshot()) {
            items.append(device.toJson());
        }
        return items;
    }

    /**
     * @throws NotFoundException 设备不存在
     */
    Json::Value detail(int id) const {
        auto device = registry_.find(id);
        if (!device) {
            throw NotFoundException("设备不存在: " + std::to_string(id));
        }
        return device->toJson();
    }

    Task<Json::Value> create(const Json::Value& data) {
        auto draft = Device::fromJson(0, data, defaultPort());
        auto device = co_await repository_.insert(draft);
        registry_.add(device);

        LOG_INFO << "[Registry] Device registered: " << device.name() << " (id=" << device.id()
                 << ", " << device.ip() << ":" << device.port() << ", "
                 << deviceModeToString(device.mode()) << ")";
        ctx_.eventBus.publish(DeviceRegistered{device.id()});
        co_return device.toJson();
    }

    Task<Json::Value> update(int id, const Json::Value& data) {
        if (!registry_.find(id)) {
            throw NotFoundException("设备不存在: " + std::to_string(id));
        }
        auto device = Device::fromJson(id, data, defaultPort());
        co_await repository_.update(device);
        registry_.update(device);

        LOG_INFO << "[Registry] Device updated: " << device.name() << " (id=" << id << ")";
        ctx_.eventBus.publish(DeviceUpdated{id});
        co_return device.toJson();
    }

    Task<> remove(int id) {
        co_await repository_.remove(id);
        registry_.remove(id);

        LOG_INFO << "[Registry] Device removed: id=" << id;
        ctx_.eventBus.publish(DeviceRemoved{id});
    }

    /**
     * @brief 调度状态，每台设备附带在线状态
     */
    Json::Value schedule() const {
        std::map<int, Json::Value> health;
        size_t online = 0;
        for (const auto& h : deviceStatus_.status()) {
            if (h.online) ++online;
            health.emplace(h.deviceId, h.toJson());
        }

        Json::Value items(Json::arrayValue);
        for (const auto& s : scheduler_.status()) {
            auto item = s.toJson();
            auto it = health.find(s.deviceId);
            if (it != health.end()) {
                for (const auto& key : it->second.getMemberNames()) {
                    if (!item.isMember(key)) item[key] = it->second[key];
                }
            } else {
                item["online"] = false;
            }
            items.append(item);
        }
        Json::Value result;
        result["list"] = items;
        result["in_flight"] = static_cast<Json::UInt64>(scheduler_.inFlightCount());
        result["online"] = static_cast<Json::UInt64>(online);
        result["offline"] = static_cast<Json::UInt64>(health.size() - online);
        return result;
    }

private:
    AppContext& ctx_;
    DeviceRepository& repository_;
    DeviceRegistry& registry_;
    DeviceScheduler& scheduler_;
    DeviceStatusTracker& deviceStatus_;

    uint16_t defaultPort() const { return ctx_.config.scheduler.devicePort; }
};
