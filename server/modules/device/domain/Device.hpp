#pragma once

#include "common/protocol/wire/Wire.Utils.hpp"
#include "common/utils/AppException.hpp"
#include "common/utils/Constants.hpp"

#include <json/json.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief 设备工作模式
 *
 * - Continuous：启动时下发一次 PERIOD_ON 进入连续上报，之后按周期 REQUEST1
 * - OnDemand：只按周期 REQUEST1
 */
enum class DeviceMode {
    Continuous,
    OnDemand
};

inline const char* deviceModeToString(DeviceMode mode) {
    switch (mode) {
        case DeviceMode::Continuous: return Constants::DEVICE_MODE_CONTINUOUS;
        case DeviceMode::OnDemand:   return Constants::DEVICE_MODE_ON_DEMAND;
    }
    return Constants::DEVICE_MODE_ON_DEMAND;
}

/**
 * @brief 解析模式字符串（兼容 "On Demand" / "OnDemand"）
 */
inline std::optional<DeviceMode> parseDeviceMode(std::string_view text) {
    if (wire::WireUtils::equalsNoCase(text, Constants::DEVICE_MODE_CONTINUOUS)) {
        return DeviceMode::Continuous;
    }
    if (wire::WireUtils::equalsNoCase(text, Constants::DEVICE_MODE_ON_DEMAND) ||
        wire::WireUtils::equalsNoCase(text, "OnDemand")) {
        return DeviceMode::OnDemand;
    }
    return std::nullopt;
}

/**
 * @brief 响应设备（PFDS）
 *
 * 只能通过 Device::create() 构造，字段一经校验不再可变；
 * 修改通过构造新实例并整体替换完成。
 *
 * 使用示例：
 * @code
 * auto device = Device::create(0, "Hall-PFDS", "192.168.1.50", 9001, "RoomA",
 *                              DeviceMode::Continuous, 30);
 * registry.add(device.withId(newId));
 * @endcode
 */
class Device {
public:
    static constexpr size_t NAME_MAX_LENGTH = 128;

    /**
     * @brief 校验型工厂
     * @param id 0 表示尚未入库
     * @throws ValidationException 任一字段非法
     */
    static Device create(int id, std::string name, std::string ip, uint16_t port,
                         std::string locationId, DeviceMode mode, int pollSeconds) {
        if (id < 0) {
            throw ValidationException("设备ID不能为负数");
        }
        auto trimmedName = wire::WireUtils::trim(name);
        if (trimmedName.empty()) {
            throw ValidationException("设备名称不能为空");
        }
        if (trimmedName.size() > NAME_MAX_LENGTH) {
            throw ValidationException("设备名称过长（最多 128 字符）");
        }
        if (!isValidIp(ip)) {
            throw ValidationException("设备IP地址无效: " + ip);
        }
        if (port == 0) {
            throw ValidationException("设备端口无效（有效范围: 1-65535）");
        }
        if (!locationId.empty() && !wire::WireUtils::isValidLocationId(locationId)) {
            throw ValidationException("位置标识无效: " + locationId);
        }
        if (pollSeconds < Constants::POLL_INTERVAL_MIN_SEC || pollSeconds > Constants::POLL_INTERVAL_MAX_SEC) {
            throw ValidationException("轮询间隔必须在 1-3600 秒之间");
        }

        Device device;
        device.id_ = id;
        device.name_ = std::string(trimmedName);
        device.ip_ = std::move(ip);
        device.port_ = port;
        device.locationId_ = std::move(locationId);
        device.mode_ = mode;
        device.pollSeconds_ = pollSeconds;
        return device;
    }

    /**
     * @brief 从管理接口的 JSON 构造
     *
     * 必填：name, ip, mode, poll_seconds；可选：location_id, port
     * @throws ValidationException 字段缺失、类型或取值非法
     */
    static Device fromJson(int id, const Json::Value& data, uint16_t defaultPort) {
        if (!data.isObject()) {
            throw ValidationException("请求体必须是 JSON 对象");
        }
        auto requireString = [&data](const char* key) {
            if (!data.isMember(key) || !data[key].isString()) {
                throw ValidationException(std::string("缺少字段或类型错误: ") + key);
            }
            return data[key].asString();
        };

        std::string name = requireString("name");
        std::string ip = requireString("ip");
        std::string modeText = requireString("mode");

        auto mode = parseDeviceMode(modeText);
        if (!mode) {
            throw ValidationException("未知的设备模式: " + modeText + "（可选: Continuous / On Demand）");
        }

        if (!data.isMember("poll_seconds") || !data["poll_seconds"].isInt()) {
            throw ValidationException("缺少字段或类型错误: poll_seconds");
        }
        int pollSeconds = data["poll_seconds"].asInt();

        std::string locationId;
        if (data.isMember("location_id") && !data["location_id"].isNull()) {
            if (!data["location_id"].isString()) {
                throw ValidationException("字段类型错误: location_id");
            }
            locationId = data["location_id"].asString();
        }

        uint16_t port = defaultPort;
        if (data.isMember("port") && !data["port"].isNull()) {
            if (!data["port"].isInt() || data["port"].asInt() < 1 || data["port"].asInt() > 65535) {
                throw ValidationException("设备端口无效（有效范围: 1-65535）");
            }
            port = static_cast<uint16_t>(data["port"].asInt());
        }

        return create(id, std::move(name), std::move(ip), port, std::move(locationId), *mode, pollSeconds);
    }

    /**
     * @brief 入库后补上 ID
     */
    Device withId(int id) const {
        return create(id, name_, ip_, port_, locationId_, mode_, pollSeconds_);
    }

    // ==================== Getters ====================

    int id() const { return id_; }
    const std::string& name() const { return name_; }
    const std::string& ip() const { return ip_; }
    uint16_t port() const { return port_; }
    const std::string& locationId() const { return locationId_; }
    DeviceMode mode() const { return mode_; }
    int pollSeconds() const { return pollSeconds_; }
    bool isContinuous() const { return mode_ == DeviceMode::Continuous; }

    /**
     * @brief 调度相关字段是否变化（需要重置调度状态）
     */
    bool scheduleDiffers(const Device& other) const {
        return ip_ != other.ip_ || port_ != other.port_ ||
               mode_ != other.mode_ || pollSeconds_ != other.pollSeconds_;
    }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = id_;
        json["name"] = name_;
        json["ip"] = ip_;
        json["port"] = static_cast<int>(port_);
        json["location_id"] = locationId_.empty() ? Json::Value(Json::nullValue) : Json::Value(locationId_);
        json["mode"] = deviceModeToString(mode_);
        json["poll_seconds"] = pollSeconds_;
        return json;
    }

    static bool isValidIp(const std::string& ip) {
        unsigned char buf[sizeof(struct in6_addr)];
        return inet_pton(AF_INET, ip.c_str(), buf) == 1 ||
               inet_pton(AF_INET6, ip.c_str(), buf) == 1;
    }

private:
    Device() = default;

    int id_ = 0;
    std::string name_;
    std::string ip_;
    uint16_t port_ = Constants::DEFAULT_DEVICE_PORT;
    std::string locationId_;
    DeviceMode mode_ = DeviceMode::OnDemand;
    int pollSeconds_ = Constants::POLL_INTERVAL_MIN_SEC;
};
