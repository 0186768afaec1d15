#pragma once

#include "DeviceRegistry.hpp"
#include "domain/Command.hpp"
#include "common/AppContext.hpp"

#include <trantor/net/EventLoop.h>
#include <trantor/utils/Date.h>
#include <trantor/utils/Logger.h>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief 设备在线状态跟踪
 *
 * 以注册表中的设备为准，按三类信号维护在线/离线：
 * - 现场单元从设备 IP 接入即在线；该 IP 的最后一条连接断开即离线
 * - 指令下发成功即在线并清零连续失败次数；失败累计次数并记录原因
 * - 周期巡检：没有打开的连接、且超过 offline_timeout_seconds 无任何活动的设备判定离线
 *
 * 新登记的设备在收到第一次活动前为离线。
 * 每个入口都有注入时间的重载，测试不依赖真实时钟。
 */
class DeviceStatusTracker {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using EventLoop = trantor::EventLoop;

    /**
     * @brief 单台设备的在线状态（只读视图）
     */
    struct DeviceHealth {
        int deviceId = 0;
        std::string name;
        std::string ip;
        bool online = false;
        size_t openConnections = 0;
        uint32_t connectionAttempts = 0;    // 连续失败次数
        std::string failureReason;
        std::optional<trantor::Date> lastSeen;
        std::optional<double> secondsSinceSeen;

        Json::Value toJson() const {
            Json::Value json;
            json["device_id"] = deviceId;
            json["name"] = name;
            json["ip"] = ip;
            json["online"] = online;
            json["open_connections"] = static_cast<Json::UInt64>(openConnections);
            json["connection_attempts"] = connectionAttempts;
            json["failure_reason"] = failureReason.empty()
                ? Json::Value(Json::nullValue) : Json::Value(failureReason);
            json["last_seen"] = lastSeen
                ? Json::Value(lastSeen->toDbString()) : Json::Value(Json::nullValue);
            json["seconds_since_seen"] = secondsSinceSeen
                ? Json::Value(*secondsSinceSeen) : Json::Value(Json::nullValue);
            return json;
        }
    };

    DeviceStatusTracker(AppContext& ctx, const DeviceRegistry& registry)
        : config_(ctx.config.scheduler)
        , registry_(registry) {}

    ~DeviceStatusTracker() {
        stop();
    }

    DeviceStatusTracker(const DeviceStatusTracker&) = delete;
    DeviceStatusTracker& operator=(const DeviceStatusTracker&) = delete;

    // ==================== 生命周期 ====================

    /**
     * @brief 在指定 EventLoop 上启动离线巡检
     */
    void start(EventLoop* loop) {
        if (!loop) return;
        loop_ = loop;
        timerId_ = loop->runEvery(config_.tickSeconds, [this]() { safeSweep(); });
        LOG_INFO << "[DeviceStatus] Started: offline timeout=" << config_.offlineTimeoutSeconds << "s";
    }

    void stop() {
        if (loop_) {
            loop_->invalidateTimer(timerId_);
            timerId_ = trantor::TimerId{0};
            loop_ = nullptr;
        }
    }

    // ==================== 状态输入 ====================

    /**
     * @brief 按注册表当前内容增删条目
     *
     * IP 变化的设备重新开始跟踪；若新 IP 上已有打开的连接则直接在线。
     */
    void sync() {
        sync(Clock::now());
    }

    void sync(TimePoint now) {
        auto devices = registry_.snapshot();

        std::lock_guard lock(mutex_);
        std::map<int, Entry> next;
        for (auto& device : devices) {
            int id = device.id();
            auto it = entries_.find(id);
            if (it != entries_.end() && it->second.device.ip() == device.ip()) {
                it->second.device = std::move(device);
                next.emplace(id, std::move(it->second));
                continue;
            }
            Entry entry{std::move(device)};
            if (openConnectionsLocked(entry.device.ip()) > 0) {
                markActive(entry, now);
            }
            next.emplace(id, std::move(entry));
        }
        entries_.swap(next);
    }

    void onFieldUnitConnected(const std::string& ip) {
        onFieldUnitConnected(ip, Clock::now());
    }

    void onFieldUnitConnected(const std::string& ip, TimePoint now) {
        std::lock_guard lock(mutex_);
        ++openConnections_[ip];
        for (auto& [id, entry] : entries_) {
            if (entry.device.ip() == ip) markActive(entry, now);
        }
    }

    void onFieldUnitDisconnected(const std::string& ip) {
        onFieldUnitDisconnected(ip, Clock::now());
    }

    /**
     * @brief 同一 IP 可能有多条连接，只有最后一条断开才判定离线
     */
    void onFieldUnitDisconnected(const std::string& ip, TimePoint now) {
        std::lock_guard lock(mutex_);
        auto it = openConnections_.find(ip);
        if (it == openConnections_.end()) return;
        if (--it->second > 0) return;
        openConnections_.erase(it);

        for (auto& [id, entry] : entries_) {
            if (entry.device.ip() != ip) continue;
            entry.lastActivity = now;
            markOffline(entry, "Field unit disconnected");
        }
    }

    void onCommandOutcome(const CommandOutcome& outcome) {
        onCommandOutcome(outcome, Clock::now());
    }

    void onCommandOutcome(const CommandOutcome& outcome, TimePoint now) {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(outcome.deviceId);
        if (it == entries_.end()) return;
        auto& entry = it->second;

        if (outcome.success) {
            markActive(entry, now);
            return;
        }
        ++entry.connectionAttempts;
        entry.failureReason = outcome.error
            ? std::string(dispatchErrorKindToString(outcome.error->kind)) + ": " + outcome.error->message
            : std::string("dispatch failed");
        LOG_DEBUG << "[DeviceStatus] " << entry.device.name() << " attempt "
                  << entry.connectionAttempts << " failed: " << entry.failureReason;
    }

    /**
     * @brief 离线巡检
     * @return 本次转为离线的设备数
     */
    size_t sweep(TimePoint now) {
        auto timeout = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(config_.offlineTimeoutSeconds));

        size_t changed = 0;
        std::lock_guard lock(mutex_);
        for (auto& [id, entry] : entries_) {
            if (!entry.online || !entry.lastActivity) continue;
            if (openConnectionsLocked(entry.device.ip()) > 0) continue;
            if (now - *entry.lastActivity <= timeout) continue;

            markOffline(entry, "No activity for " + formatSeconds(config_.offlineTimeoutSeconds) + "s");
            ++changed;
        }
        return changed;
    }

    // ==================== 查询 ====================

    std::vector<DeviceHealth> status() const {
        return status(Clock::now());
    }

    std::vector<DeviceHealth> status(TimePoint now) const {
        std::vector<DeviceHealth> result;
        std::lock_guard lock(mutex_);
        result.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            result.push_back(toHealth(entry, now));
        }
        return result;
    }

    std::optional<DeviceHealth> find(int deviceId) const {
        return find(deviceId, Clock::now());
    }

    std::optional<DeviceHealth> find(int deviceId, TimePoint now) const {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(deviceId);
        if (it == entries_.end()) return std::nullopt;
        return toHealth(it->second, now);
    }

    size_t onlineCount() const {
        size_t count = 0;
        std::lock_guard lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            if (entry.online) ++count;
        }
        return count;
    }

private:
    struct Entry {
        Device device;
        bool online = false;
        std::optional<TimePoint> lastActivity;
        std::optional<trantor::Date> lastSeen;
        uint32_t connectionAttempts = 0;
        std::string failureReason;
    };

    SchedulerConfig config_;
    const DeviceRegistry& registry_;

    EventLoop* loop_ = nullptr;
    trantor::TimerId timerId_{0};

    mutable std::mutex mutex_;
    std::map<int, Entry> entries_;
    std::map<std::string, size_t> openConnections_;

    void safeSweep() {
        try {
            sweep(Clock::now());
        } catch (const std::exception& e) {
            LOG_ERROR << "[DeviceStatus] Sweep exception: " << e.what();
        }
    }

    size_t openConnectionsLocked(const std::string& ip) const {
        auto it = openConnections_.find(ip);
        return it == openConnections_.end() ? 0 : it->second;
    }

    void markActive(Entry& entry, TimePoint now) {
        entry.lastActivity = now;
        entry.lastSeen = trantor::Date::now();
        entry.connectionAttempts = 0;
        if (entry.online) return;
        entry.online = true;
        entry.failureReason.clear();
        LOG_INFO << "[DeviceStatus] " << entry.device.name() << " (" << entry.device.ip() << ") online";
    }

    /** 只有在线设备才会转为离线，重复的离线信号不覆盖首次原因 */
    static void markOffline(Entry& entry, std::string reason) {
        if (!entry.online) return;
        entry.online = false;
        entry.failureReason = std::move(reason);
        LOG_WARN << "[DeviceStatus] " << entry.device.name() << " (" << entry.device.ip()
                 << ") offline: " << entry.failureReason;
    }

    DeviceHealth toHealth(const Entry& entry, TimePoint now) const {
        DeviceHealth h;
        h.deviceId = entry.device.id();
        h.name = entry.device.name();
        h.ip = entry.device.ip();
        h.online = entry.online;
        h.openConnections = openConnectionsLocked(entry.device.ip());
        h.connectionAttempts = entry.connectionAttempts;
        h.failureReason = entry.failureReason;
        h.lastSeen = entry.lastSeen;
        if (entry.lastActivity) {
            h.secondsSinceSeen = std::chrono::duration<double>(now - *entry.lastActivity).count();
        }
        return h;
    }

    static std::string formatSeconds(double seconds) {
        auto whole = static_cast<long long>(seconds);
        if (static_cast<double>(whole) == seconds) return std::to_string(whole);
        return std::to_string(seconds);
    }
};
