#pragma once

#include "AppException.hpp"
#include "Constants.hpp"

#include <cmath>
#include <cstdint>
#include <map>
#include <string>

/**
 * @brief 运行配置（由 ConfigManager 从 custom_config 提取）
 *
 * 每个配置段都带 validate()，越界时抛出 ValidationException，
 * 下游组件拿到的配置一定是合法的。
 */

// ==================== 接入服务 ====================

struct IngestionConfig {
    std::string host = "0.0.0.0";
    uint16_t port = Constants::DEFAULT_INGESTION_PORT;
    size_t ioThreads = 0;                 // 0 表示使用 CPU 核心数
    size_t fusionThreads = 2;
    size_t queueCapacity = Constants::DEFAULT_QUEUE_CAPACITY;
    size_t maxPacketBytes = Constants::DEFAULT_MAX_PACKET_BYTES;
    int idleTimeoutSeconds = Constants::DEFAULT_IDLE_TIMEOUT_SEC;
    std::string greeting = Constants::COMMAND_PERIOD_ON;   // 空字符串表示不发送

    void validate() const {
        if (host.empty()) {
            throw ValidationException("[ingestion] host 不能为空");
        }
        if (port == 0) {
            throw ValidationException("[ingestion] port 值无效（有效范围: 1-65535）");
        }
        if (fusionThreads == 0) {
            throw ValidationException("[ingestion] fusion_threads 必须大于 0");
        }
        if (queueCapacity == 0) {
            throw ValidationException("[ingestion] queue_capacity 必须大于 0");
        }
        if (maxPacketBytes < 64) {
            throw ValidationException("[ingestion] max_packet_bytes 过小（至少 64）");
        }
        if (idleTimeoutSeconds < 0) {
            throw ValidationException("[ingestion] idle_timeout_seconds 不能为负数");
        }
    }
};

// ==================== 热成像标定 ====================

/**
 * @brief 热成像标定参数：value = raw * scale + offset
 */
struct ThermalCalibration {
    bool isSigned = true;
    double scale = 0.01;
    double offset = 27.0;

    void validate() const {
        if (!std::isfinite(scale) || scale == 0.0) {
            throw ValidationException("[calibration] scale 必须是非零有限数");
        }
        if (!std::isfinite(offset)) {
            throw ValidationException("[calibration] offset 必须是有限数");
        }
    }
};

// ==================== 融合引擎 ====================

struct FusionConfig {
    double tempThreshold = 40.0;          // °C
    double gasThreshold = 400.0;          // ppm
    double smokeThreshold = 25.0;         // %
    double flameThreshold = 25.0;         // %
    double visionThreshold = 0.7;         // 置信度
    int minSources = 2;
    double holdSeconds = 10.0;
    double hotCellDecaySeconds = 5.0;
    std::string confidencePolicy = "mean";
    std::map<std::string, double> weights = {
        {"thermal", 0.4}, {"smoke", 0.5}, {"flame", 0.3}, {"vision", 0.4}, {"gas", 0.5}
    };

    void validate() const {
        auto positive = [](double v, const char* name) {
            if (!std::isfinite(v) || v <= 0.0) {
                throw ValidationException(std::string("[fusion] ") + name + " 必须是正数");
            }
        };
        positive(tempThreshold, "temp_threshold");
        positive(gasThreshold, "gas_threshold");
        positive(smokeThreshold, "smoke_threshold");
        positive(flameThreshold, "flame_threshold");
        positive(visionThreshold, "vision_threshold");
        positive(hotCellDecaySeconds, "hot_cell_decay_seconds");

        if (visionThreshold > 1.0) {
            throw ValidationException("[fusion] vision_threshold 必须在 (0, 1] 内");
        }
        if (minSources < 1 || minSources > 5) {
            throw ValidationException("[fusion] min_sources 必须在 1-5 之间");
        }
        if (!std::isfinite(holdSeconds) || holdSeconds < 0.0) {
            throw ValidationException("[fusion] hold_seconds 不能为负数");
        }
        for (const auto& [source, weight] : weights) {
            if (source != "thermal" && source != "gas" && source != "smoke" &&
                source != "flame" && source != "vision") {
                throw ValidationException("[fusion] 未知的权重来源: " + source);
            }
            if (!std::isfinite(weight) || weight < 0.0) {
                throw ValidationException("[fusion] 权重不能为负数: " + source);
            }
        }
    }
};

// ==================== 气体传感器（MQ-135） ====================

/**
 * @brief MQ-135 曲线参数：ppm = a * (Rs/R0)^b
 */
struct GasSensorConfig {
    double curveA = 116.6020682;          // CO2 曲线
    double curveB = -2.769034857;
    double loadResistance = 10.0;         // RL，kΩ
    double supplyVoltage = 5.0;           // Vin，V
    double r0 = 76.63;                    // 洁净空气下的 R0，kΩ
    int adcResolution = Constants::ADC_MAX + 1;

    void validate() const {
        if (!std::isfinite(curveA) || curveA <= 0.0 || !std::isfinite(curveB)) {
            throw ValidationException("[gas_sensor] 曲线参数 a 必须为正数，b 必须为有限数");
        }
        if (loadResistance <= 0.0 || supplyVoltage <= 0.0 || r0 <= 0.0) {
            throw ValidationException("[gas_sensor] load_resistance / supply_voltage / r0 必须为正数");
        }
        if (adcResolution < 2) {
            throw ValidationException("[gas_sensor] adc_resolution 无效");
        }
    }
};

// ==================== 自适应帧率 ====================

struct RateControllerConfig {
    double baseFps = 25.0;
    double minFps = 5.0;
    double maxFps = 30.0;
    int highWatermark = 8;
    int lowWatermark = 2;
    double cooldownSeconds = 1.0;

    void validate() const {
        if (!(minFps > 0.0) || !(maxFps >= minFps)) {
            throw ValidationException("[rate_controller] 需要 0 < min_fps <= max_fps");
        }
        if (baseFps < minFps || baseFps > maxFps) {
            throw ValidationException("[rate_controller] base_fps 必须在 [min_fps, max_fps] 内");
        }
        if (lowWatermark < 0 || highWatermark <= lowWatermark) {
            throw ValidationException("[rate_controller] 需要 0 <= low_watermark < high_watermark");
        }
        if (!std::isfinite(cooldownSeconds) || cooldownSeconds < 0.0) {
            throw ValidationException("[rate_controller] adjustment_cooldown 不能为负数");
        }
    }
};

// ==================== 设备调度 ====================

struct SchedulerConfig {
    double tickSeconds = 1.0;
    int ackTimeoutMs = Constants::DEFAULT_ACK_TIMEOUT_MS;
    uint16_t devicePort = Constants::DEFAULT_DEVICE_PORT;
    double periodOnRetrySeconds = Constants::PERIOD_ON_RETRY_SEC;
    double periodOnRetryGrowth = 1.0;     // 1 表示固定节奏
    double periodOnRetryMaxSeconds = Constants::PERIOD_ON_RETRY_MAX_SEC;
    double failureLogIntervalSeconds = Constants::FAILURE_LOG_INTERVAL_SEC;
    double offlineTimeoutSeconds = Constants::DEVICE_OFFLINE_TIMEOUT_SEC;
    size_t dispatchThreads = 2;

    void validate() const {
        if (!(tickSeconds > 0.0) || tickSeconds > 60.0) {
            throw ValidationException("[scheduler] tick_seconds 必须在 (0, 60] 内");
        }
        if (ackTimeoutMs < 100 || ackTimeoutMs > 60000) {
            throw ValidationException("[scheduler] ack_timeout_ms 必须在 100-60000 之间");
        }
        if (devicePort == 0) {
            throw ValidationException("[scheduler] device_port 值无效");
        }
        if (periodOnRetrySeconds < tickSeconds) {
            throw ValidationException("[scheduler] period_on_retry_seconds 不能小于 tick_seconds");
        }
        if (!std::isfinite(periodOnRetryGrowth) || periodOnRetryGrowth < 1.0) {
            throw ValidationException("[scheduler] period_on_retry_growth 不能小于 1");
        }
        if (periodOnRetryMaxSeconds < periodOnRetrySeconds) {
            throw ValidationException("[scheduler] period_on_retry_max_seconds 不能小于 period_on_retry_seconds");
        }
        if (failureLogIntervalSeconds < 0.0) {
            throw ValidationException("[scheduler] failure_log_interval_seconds 不能为负数");
        }
        if (offlineTimeoutSeconds < tickSeconds) {
            throw ValidationException("[scheduler] offline_timeout_seconds 不能小于 tick_seconds");
        }
        if (dispatchThreads == 0) {
            throw ValidationException("[scheduler] dispatch_threads 必须大于 0");
        }
    }
};

// ==================== 汇总 ====================

struct AppConfig {
    std::string configPath;
    std::string logLevel = "INFO";
    std::string logDir = "./logs";
    bool consoleLog = false;
    IngestionConfig ingestion;
    ThermalCalibration calibration;
    FusionConfig fusion;
    GasSensorConfig gasSensor;
    RateControllerConfig rateController;
    std::map<std::string, std::string> streams;   // stream_id → location_id
    SchedulerConfig scheduler;
};
