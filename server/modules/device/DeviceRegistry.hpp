#pragma once

#include "domain/Device.hpp"
#include "common/utils/AppException.hpp"

#include <trantor/utils/Logger.h>

#include <atomic>
#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

/**
 * @brief 内存中的设备注册表
 *
 * 单写者锁 + 并发读：管理接口修改时持 unique_lock，
 * 调度器每个 tick 只取一次快照。
 * 每次修改递增 version，调度器据此增量同步运行时状态。
 */
class DeviceRegistry {
public:
    DeviceRegistry() = default;
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief 启动加载：整体替换
     */
    void replaceAll(const std::vector<Device>& devices) {
        std::map<int, Device> fresh;
        for (const auto& device : devices) {
            if (device.id() <= 0) {
                LOG_WARN << "[Registry] Skipping device without id: " << device.name();
                continue;
            }
            if (!fresh.emplace(device.id(), device).second) {
                LOG_WARN << "[Registry] Duplicate device id " << device.id() << ", keeping first";
            }
        }
        {
            std::unique_lock lock(mutex_);
            devices_.swap(fresh);
        }
        version_.fetch_add(1, std::memory_order_release);
        LOG_INFO << "[Registry] Loaded " << size() << " devices";
    }

    /**
     * @throws ValidationException 未分配 ID
     * @throws ConflictException ID 已存在
     */
    void add(const Device& device) {
        if (device.id() <= 0) {
            throw ValidationException("设备ID必须为正数");
        }
        {
            std::unique_lock lock(mutex_);
            if (!devices_.emplace(device.id(), device).second) {
                throw ConflictException("设备ID已存在: " + std::to_string(device.id()));
            }
        }
        version_.fetch_add(1, std::memory_order_release);
    }

    /**
     * @throws NotFoundException 设备不存在
     */
    void update(const Device& device) {
        {
            std::unique_lock lock(mutex_);
            auto it = devices_.find(device.id());
            if (it == devices_.end()) {
                throw NotFoundException("设备不存在: " + std::to_string(device.id()));
            }
            it->second = device;
        }
        version_.fetch_add(1, std::memory_order_release);
    }

    /**
     * @throws NotFoundException 设备不存在
     */
    void remove(int id) {
        {
            std::unique_lock lock(mutex_);
            if (devices_.erase(id) == 0) {
                throw NotFoundException("设备不存在: " + std::to_string(id));
            }
        }
        version_.fetch_add(1, std::memory_order_release);
    }

    std::optional<Device> find(int id) const {
        std::shared_lock lock(mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Device> findByIp(const std::string& ip) const {
        std::vector<Device> result;
        std::shared_lock lock(mutex_);
        for (const auto& [id, device] : devices_) {
            if (device.ip() == ip) result.push_back(device);
        }
        return result;
    }

    /**
     * @brief 按 ID 升序的快照
     */
    std::vector<Device> snapshot() const {
        std::vector<Device> result;
        std::shared_lock lock(mutex_);
        result.reserve(devices_.size());
        for (const auto& [id, device] : devices_) {
            result.push_back(device);
        }
        return result;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return devices_.size();
    }

    uint64_t version() const { return version_.load(std::memory_order_acquire); }

private:
    mutable std::shared_mutex mutex_;
    std::map<int, Device> devices_;
    std::atomic<uint64_t> version_{0};
};
