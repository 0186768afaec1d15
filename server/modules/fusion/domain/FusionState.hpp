#pragma once

#include "FusionTypes.hpp"
#include "HotCellGrid.hpp"

#include <chrono>
#include <mutex>
#include <string>

/**
 * @brief 单个位置的融合状态
 *
 * 每个位置一份，首条记录到达时创建，连接断开不会销毁。
 * 所有字段由 mutex 保护，同一时刻只有一个写者。
 */
struct FusionState {
    using TimePoint = std::chrono::steady_clock::time_point;

    explicit FusionState(std::string id) : locationId(std::move(id)) {}

    const std::string locationId;
    mutable std::mutex mutex;

    // 热点网格
    HotCellGrid grid;
    double maxTemperature = 0.0;

    // 最新读数
    double gasPpm = 0.0;
    double smokePct = 0.0;
    double flamePct = 0.0;
    bool flameDetected = false;
    double visionConfidence = 0.0;

    // 统计
    uint64_t framesSeen = 0;
    uint64_t samplesSeen = 0;

    // 告警 / 保持期
    bool alarmActive = false;
    TimePoint holdUntil{};
    FusionResult lastResult;
};

/**
 * @brief 融合状态快照（锁外读取用）
 */
struct FusionSnapshot {
    std::string locationId;
    double maxTemperature = 0.0;
    int hotCellCount = 0;
    double gasPpm = 0.0;
    double smokePct = 0.0;
    double flamePct = 0.0;
    bool flameDetected = false;
    double visionConfidence = 0.0;
    uint64_t framesSeen = 0;
    uint64_t samplesSeen = 0;
    bool alarmActive = false;
    bool inHold = false;
    FusionResult lastResult;

    Json::Value toJson() const {
        Json::Value json;
        json["location_id"] = locationId;
        json["max_temperature"] = maxTemperature;
        json["hot_cells"] = hotCellCount;
        json["gas_ppm"] = gasPpm;
        json["smoke_pct"] = smokePct;
        json["flame_pct"] = flamePct;
        json["flame_detected"] = flameDetected;
        json["vision_confidence"] = visionConfidence;
        json["frames"] = static_cast<Json::UInt64>(framesSeen);
        json["samples"] = static_cast<Json::UInt64>(samplesSeen);
        json["alarm_active"] = alarmActive;
        json["in_hold"] = inHold;
        json["last_result"] = lastResult.toJson();
        return json;
    }
};
