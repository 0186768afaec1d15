#pragma once

#include "domain/FusionTypes.hpp"
#include "common/utils/AppConfig.hpp"
#include "common/utils/AppException.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief 置信度聚合策略（可替换）
 *
 * 输入为本次超限的来源读数，输出 [0, 1] 的置信度。
 * 告警与否只由 min_sources 决定，策略只影响置信度数值。
 */
class ConfidencePolicy {
public:
    virtual ~ConfidencePolicy() = default;

    virtual double aggregate(const std::vector<SourceReading>& contributing) const = 0;
    virtual std::string name() const = 0;
};

/**
 * @brief 均值策略：超限来源归一化程度的算术平均（默认）
 */
class MeanExceedancePolicy : public ConfidencePolicy {
public:
    double aggregate(const std::vector<SourceReading>& contributing) const override {
        if (contributing.empty()) return 0.0;
        double sum = 0.0;
        for (const auto& r : contributing) sum += r.normalizedExceedance();
        return std::clamp(sum / static_cast<double>(contributing.size()), 0.0, 1.0);
    }

    std::string name() const override { return "mean"; }
};

/**
 * @brief 最大值策略：取最强的单一来源
 */
class MaxExceedancePolicy : public ConfidencePolicy {
public:
    double aggregate(const std::vector<SourceReading>& contributing) const override {
        double best = 0.0;
        for (const auto& r : contributing) best = std::max(best, r.normalizedExceedance());
        return best;
    }

    std::string name() const override { return "max"; }
};

/**
 * @brief 加权策略：Σ weight(source) × 归一化程度，封顶 1
 */
class WeightedExceedancePolicy : public ConfidencePolicy {
public:
    explicit WeightedExceedancePolicy(std::map<std::string, double> weights)
        : weights_(std::move(weights)) {}

    double aggregate(const std::vector<SourceReading>& contributing) const override {
        double sum = 0.0;
        for (const auto& r : contributing) {
            auto it = weights_.find(sensorSourceToString(r.source));
            double w = it == weights_.end() ? 0.0 : it->second;
            sum += w * r.normalizedExceedance();
        }
        return std::clamp(sum, 0.0, 1.0);
    }

    std::string name() const override { return "weighted"; }

private:
    std::map<std::string, double> weights_;
};

/**
 * @brief 按配置名创建策略
 * @throws ValidationException 未知策略名
 */
inline std::unique_ptr<ConfidencePolicy> makeConfidencePolicy(const FusionConfig& config) {
    if (config.confidencePolicy == "mean") {
        return std::make_unique<MeanExceedancePolicy>();
    }
    if (config.confidencePolicy == "max") {
        return std::make_unique<MaxExceedancePolicy>();
    }
    if (config.confidencePolicy == "weighted") {
        return std::make_unique<WeightedExceedancePolicy>(config.weights);
    }
    throw ValidationException("[fusion] 未知的置信度策略: " + config.confidencePolicy
                              + "（可选: mean / max / weighted）");
}
