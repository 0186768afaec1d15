#pragma once

#include "common/utils/AppConfig.hpp"
#include "common/utils/Constants.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

/**
 * @brief ADC 读数 → 百分比（12 位满量程）
 */
inline double adcToPercent(int adc) {
    return static_cast<double>(std::clamp(adc, 0, Constants::ADC_MAX)) * 100.0 / Constants::ADC_MAX;
}

/**
 * @brief MQ-135 气体传感器模型
 *
 * Vout = adc / resolution × Vin
 * Rs   = Vin × RL / Vout − RL（下限 0.1 kΩ）
 * ppm  = a × (Rs / R0)^b
 *
 * ADC 为 0 时 Rs 视为无穷大，浓度为 0。
 */
class GasSensorModel {
public:
    explicit GasSensorModel(GasSensorConfig config = {}) : config_(config) {}

    double resistance(int adc) const {
        if (adc <= 0) return std::numeric_limits<double>::infinity();
        double vout = static_cast<double>(adc) / config_.adcResolution * config_.supplyVoltage;
        double rs = (config_.supplyVoltage * config_.loadResistance) / vout - config_.loadResistance;
        return std::max(rs, 0.1);
    }

    double ppm(int adc) const {
        double rs = resistance(adc);
        if (std::isinf(rs)) return 0.0;
        return config_.curveA * std::pow(rs / config_.r0, config_.curveB);
    }

    const GasSensorConfig& config() const { return config_; }

private:
    GasSensorConfig config_;
};
