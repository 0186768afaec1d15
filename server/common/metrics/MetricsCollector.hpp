#pragma once

#include "common/utils/Constants.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <vector>

/**
 * @brief 带标签的指标族（计数器或仪表）
 *
 * 标签组合首次出现时在写锁下创建条目，之后只持读锁做原子更新，
 * 高频路径（每条报文）不会互相阻塞。
 */
template<typename Value>
class LabeledFamily {
public:
    LabeledFamily(std::string name, std::string help, const char* type,
                  std::vector<std::string> labelNames)
        : name_(std::string(Constants::METRICS_PREFIX) + std::move(name))
        , help_(std::move(help))
        , type_(type)
        , labelNames_(std::move(labelNames)) {}

    void add(const std::vector<std::string>& labels, Value delta) {
        auto& slot = entry(labels);
        slot.value.fetch_add(delta, std::memory_order_relaxed);
    }

    void set(const std::vector<std::string>& labels, Value value) {
        entry(labels).value.store(value, std::memory_order_relaxed);
    }

    Value get(const std::vector<std::string>& labels) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(joinKey(labels));
        return it == entries_.end() ? Value{} : it->second->value.load(std::memory_order_relaxed);
    }

    Value sum() const {
        std::shared_lock lock(mutex_);
        Value total{};
        for (const auto& [key, e] : entries_) {
            total += e->value.load(std::memory_order_relaxed);
        }
        return total;
    }

    /**
     * @brief 输出 Prometheus 文本格式
     */
    void render(std::ostream& out) const {
        out << "# HELP " << name_ << " " << help_ << "\n";
        out << "# TYPE " << name_ << " " << type_ << "\n";
        std::shared_lock lock(mutex_);
        for (const auto& [key, e] : entries_) {
            out << name_;
            if (!labelNames_.empty()) {
                out << "{";
                for (size_t i = 0; i < labelNames_.size(); ++i) {
                    if (i > 0) out << ",";
                    out << labelNames_[i] << "=\"" << escapeLabel(e->labels[i]) << "\"";
                }
                out << "}";
            }
            out << " " << e->value.load(std::memory_order_relaxed) << "\n";
        }
    }

private:
    struct Entry {
        std::vector<std::string> labels;
        std::atomic<Value> value{};
    };

    std::string name_;
    std::string help_;
    const char* type_;
    std::vector<std::string> labelNames_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::unique_ptr<Entry>> entries_;

    static std::string joinKey(const std::vector<std::string>& labels) {
        std::string key;
        for (const auto& l : labels) {
            key += l;
            key += '\x1f';
        }
        return key;
    }

    static std::string escapeLabel(const std::string& value) {
        std::string out;
        out.reserve(value.size());
        for (char c : value) {
            if (c == '\\') out += "\\\\";
            else if (c == '"') out += "\\\"";
            else if (c == '\n') out += "\\n";
            else out += c;
        }
        return out;
    }

    Entry& entry(const std::vector<std::string>& labels) {
        auto key = joinKey(labels);
        {
            std::shared_lock lock(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end()) return *it->second;
        }
        std::unique_lock lock(mutex_);
        auto& slot = entries_[key];
        if (!slot) {
            slot = std::make_unique<Entry>();
            slot->labels = labels;
        }
        return *slot;
    }
};

/**
 * @brief 进程级指标采集器
 *
 * 由 AppContext 持有并注入各组件，线程安全，只保存当前值。
 * 通过 /metrics 以 Prometheus 文本格式拉取。
 */
class MetricsCollector {
public:
    using Clock = std::chrono::steady_clock;

    MetricsCollector() : startTime_(Clock::now()) {}

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    // ==================== 接入 ====================

    void recordPacket(const std::string& locationId) { packetsReceived_.add({locationId}, 1); }
    void recordPacketError(const std::string& locationId) { packetErrors_.add({locationId}, 1); }
    void recordThermalFrame(const std::string& locationId) { thermalFrames_.add({locationId}, 1); }
    void recordSensorSample(const std::string& locationId) { sensorSamples_.add({locationId}, 1); }
    void recordDrop(const std::string& locationId) { recordsDropped_.add({locationId}, 1); }

    void setQueueDepth(const std::string& locationId, size_t depth) {
        queueDepth_.set({locationId}, static_cast<int64_t>(depth));
    }

    void connectionOpened() { activeConnections_.fetch_add(1, std::memory_order_relaxed); }
    void connectionClosed() { activeConnections_.fetch_sub(1, std::memory_order_relaxed); }

    // ==================== 融合 ====================

    void recordFusion(const std::string& locationId, bool alarmRaised) {
        fusionInvocations_.add({locationId}, 1);
        if (alarmRaised) fusionAlarms_.add({locationId}, 1);
    }

    // ==================== 指令下发 ====================

    void recordDispatch(const std::string& deviceId, const std::string& command,
                        bool success, double latencyMs) {
        dispatches_.add({deviceId, command, success ? "success" : "failure"}, 1);
        dispatchLatency_.set({deviceId}, latencyMs);
    }

    // ==================== 帧率 ====================

    void setStreamFps(const std::string& streamId, double fps) {
        streamFps_.set({streamId}, fps);
    }

    // ==================== 查询 ====================

    int64_t packetsReceived(const std::string& locationId) const { return packetsReceived_.get({locationId}); }
    int64_t packetErrors(const std::string& locationId) const { return packetErrors_.get({locationId}); }
    int64_t thermalFrames(const std::string& locationId) const { return thermalFrames_.get({locationId}); }
    int64_t sensorSamples(const std::string& locationId) const { return sensorSamples_.get({locationId}); }
    int64_t recordsDropped(const std::string& locationId) const { return recordsDropped_.get({locationId}); }
    int64_t queueDepth(const std::string& locationId) const { return queueDepth_.get({locationId}); }
    int64_t fusionInvocations(const std::string& locationId) const { return fusionInvocations_.get({locationId}); }
    int64_t fusionAlarms(const std::string& locationId) const { return fusionAlarms_.get({locationId}); }
    double streamFps(const std::string& streamId) const { return streamFps_.get({streamId}); }

    int64_t dispatchCount(const std::string& deviceId, const std::string& command, bool success) const {
        return dispatches_.get({deviceId, command, success ? "success" : "failure"});
    }

    int64_t totalPacketsReceived() const { return packetsReceived_.sum(); }
    int64_t totalPacketErrors() const { return packetErrors_.sum(); }
    int64_t activeConnections() const { return activeConnections_.load(std::memory_order_relaxed); }

    double uptimeSeconds() const {
        return std::chrono::duration<double>(Clock::now() - startTime_).count();
    }

    /**
     * @brief 生成 Prometheus 文本（exposition format 0.0.4）
     */
    std::string exposition() const {
        std::ostringstream out;
        packetsReceived_.render(out);
        packetErrors_.render(out);
        thermalFrames_.render(out);
        sensorSamples_.render(out);
        recordsDropped_.render(out);
        queueDepth_.render(out);
        fusionInvocations_.render(out);
        fusionAlarms_.render(out);
        dispatches_.render(out);
        dispatchLatency_.render(out);
        streamFps_.render(out);

        std::string prefix = Constants::METRICS_PREFIX;
        out << "# HELP " << prefix << "active_connections Open field unit connections\n";
        out << "# TYPE " << prefix << "active_connections gauge\n";
        out << prefix << "active_connections " << activeConnections() << "\n";
        out << "# HELP " << prefix << "uptime_seconds Seconds since process start\n";
        out << "# TYPE " << prefix << "uptime_seconds gauge\n";
        out << prefix << "uptime_seconds " << static_cast<int64_t>(uptimeSeconds()) << "\n";
        return out.str();
    }

private:
    Clock::time_point startTime_;
    std::atomic<int64_t> activeConnections_{0};

    LabeledFamily<int64_t> packetsReceived_{"packets_received_total",
        "Well-formed packets received", "counter", {"location_id"}};
    LabeledFamily<int64_t> packetErrors_{"packet_errors_total",
        "Malformed packets rejected by the decoder", "counter", {"location_id"}};
    LabeledFamily<int64_t> thermalFrames_{"thermal_frames_total",
        "Thermal frames received", "counter", {"location_id"}};
    LabeledFamily<int64_t> sensorSamples_{"sensor_samples_total",
        "Sensor samples received", "counter", {"location_id"}};
    LabeledFamily<int64_t> recordsDropped_{"records_dropped_total",
        "Records dropped from a full handoff queue (oldest first)", "counter", {"location_id"}};
    LabeledFamily<int64_t> queueDepth_{"queue_depth",
        "Records waiting for fusion", "gauge", {"location_id"}};
    LabeledFamily<int64_t> fusionInvocations_{"fusion_invocations_total",
        "Fusion evaluations", "counter", {"location_id"}};
    LabeledFamily<int64_t> fusionAlarms_{"fusion_alarms_total",
        "Alarms raised by fusion", "counter", {"location_id"}};
    LabeledFamily<int64_t> dispatches_{"command_dispatch_total",
        "Device command dispatches by outcome", "counter", {"device_id", "command", "outcome"}};
    LabeledFamily<double> dispatchLatency_{"command_latency_ms",
        "Latency of the last command dispatch", "gauge", {"device_id"}};
    LabeledFamily<double> streamFps_{"stream_fps",
        "Recommended capture rate per stream", "gauge", {"stream_id"}};
};
