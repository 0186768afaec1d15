#pragma once

#include <trantor/utils/Logger.h>

#include <cstdint>
#include <optional>
#include <string>

/**
 * @brief 单个接入连接的状态（挂在 TcpConnection::setContext 上）
 *
 * 只在所属 IO 线程上访问，不需要加锁。
 * 位置绑定一旦建立便不可更改；未绑定时以对端 IP 作为位置标识。
 */
class ConnectionContext {
public:
    explicit ConnectionContext(std::string peerIp) : peerIp_(std::move(peerIp)) {}

    const std::string& peerIp() const { return peerIp_; }
    const std::string& serial() const { return serial_; }
    const std::optional<std::string>& boundLocation() const { return boundLocation_; }

    /**
     * @brief 绑定位置
     * @return false 表示已绑定到其他位置，本次绑定被忽略
     */
    bool bindLocation(const std::string& locationId) {
        if (!boundLocation_) {
            boundLocation_ = locationId;
            return true;
        }
        return *boundLocation_ == locationId;
    }

    void setSerial(const std::string& serial) { serial_ = serial; }

    /**
     * @brief 计数与日志使用的位置：已绑定位置，否则对端 IP
     */
    const std::string& effectiveLocation() const {
        return boundLocation_ ? *boundLocation_ : peerIp_;
    }

    /**
     * @brief 记录实际归属的位置：报文自带 > 连接绑定 > 对端 IP
     */
    const std::string& resolveLocation(const std::string& recordLocation) const {
        if (!recordLocation.empty()) return recordLocation;
        return effectiveLocation();
    }

    // 超长报文的剩余部分需要跳到下一个换行
    bool discarding = false;

    uint64_t packets = 0;
    uint64_t errors = 0;
    uint64_t bytes = 0;

private:
    std::string peerIp_;
    std::string serial_;
    std::optional<std::string> boundLocation_;
};
