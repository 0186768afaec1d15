#pragma once

#include <json/json.h>

#include <set>
#include <string>

/**
 * @brief 融合输入来源
 */
enum class SensorSource {
    Thermal,
    Gas,
    Smoke,
    Flame,
    Vision
};

inline const char* sensorSourceToString(SensorSource source) {
    switch (source) {
        case SensorSource::Thermal: return "thermal";
        case SensorSource::Gas:     return "gas";
        case SensorSource::Smoke:   return "smoke";
        case SensorSource::Flame:   return "flame";
        case SensorSource::Vision:  return "vision";
    }
    return "unknown";
}

/**
 * @brief 一次融合判定的输入（已换算为工程单位）
 */
struct FusionInputs {
    double temperature = 0.0;     // °C
    double gasPpm = 0.0;
    double smokePct = 0.0;
    double flamePct = 0.0;
    double visionConfidence = 0.0;
};

/**
 * @brief 单个来源的判定读数（供置信度策略使用）
 */
struct SourceReading {
    SensorSource source;
    double value = 0.0;
    double threshold = 0.0;

    /**
     * @brief 归一化超限程度：value / (2 * threshold)，截断到 [0, 1]
     *
     * 刚达阈值为 0.5，达到两倍阈值饱和为 1。
     */
    double normalizedExceedance() const {
        if (threshold <= 0.0) return 1.0;
        double e = value / (2.0 * threshold);
        if (e < 0.0) return 0.0;
        if (e > 1.0) return 1.0;
        return e;
    }
};

/**
 * @brief 融合判定结果
 */
struct FusionResult {
    bool alarm = false;
    double confidence = 0.0;              // [0, 1]
    int sourcesTriggered = 0;
    std::set<SensorSource> contributing;
    bool held = false;                    // 保持期内返回的冻结结果

    Json::Value toJson() const {
        Json::Value json;
        json["alarm"] = alarm;
        json["confidence"] = confidence;
        json["sources_triggered"] = sourcesTriggered;
        json["held"] = held;
        Json::Value sources(Json::arrayValue);
        for (auto s : contributing) {
            sources.append(sensorSourceToString(s));
        }
        json["contributing"] = sources;
        return json;
    }
};
