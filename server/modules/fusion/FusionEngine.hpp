#pragma once

#include "ConfidencePolicy.hpp"
#include "SensorConversion.hpp"
#include "domain/Events.hpp"
#include "domain/FusionState.hpp"
#include "common/AppContext.hpp"
#include "common/protocol/wire/Wire.Types.hpp"

#include <trantor/utils/Logger.h>

#include <cmath>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>

/**
 * @brief 多源传感器融合引擎
 *
 * 职责：
 * - 按位置维护 FusionState（热点网格、最新读数、告警/保持期）
 * - 每个输入与其阈值比较，超限来源数 >= min_sources 即告警
 * - 热成像额外经过热点去抖：超限像素在衰减窗口内持续计为热点
 * - 告警后进入保持期，期间冻结判定；保持期结束后重新评估
 * - 告警升起/解除时发布 AlarmRaised / AlarmCleared 事件
 *
 * 并发：位置表由 shared_mutex 保护，单个位置的状态由各自的 mutex 保护，
 * 不同位置之间互不阻塞。
 */
class FusionEngine {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    explicit FusionEngine(AppContext& ctx)
        : FusionEngine(ctx, makeConfidencePolicy(ctx.config.fusion)) {}

    FusionEngine(AppContext& ctx, std::unique_ptr<ConfidencePolicy> policy)
        : ctx_(ctx)
        , config_(ctx.config.fusion)
        , gasModel_(ctx.config.gasSensor)
        , policy_(std::move(policy)) {
        config_.validate();
        LOG_INFO << "[Fusion] Engine ready: min_sources=" << config_.minSources
                 << ", hold=" << config_.holdSeconds << "s"
                 << ", decay=" << config_.hotCellDecaySeconds << "s"
                 << ", policy=" << policy_->name();
    }

    FusionEngine(const FusionEngine&) = delete;
    FusionEngine& operator=(const FusionEngine&) = delete;

    // ==================== 判定入口 ====================

    /**
     * @brief 以显式读数进行一次融合判定（同时更新该位置的最新读数）
     */
    FusionResult fuse(const std::string& locationId, double temperature, double gasPpm,
                      double smokePct, double flamePct, double visionConfidence) {
        return fuse(locationId,
                    FusionInputs{temperature, gasPpm, smokePct, flamePct, visionConfidence},
                    Clock::now());
    }

    FusionResult fuse(const std::string& locationId, const FusionInputs& inputs, TimePoint now) {
        auto state = stateFor(locationId);
        Transition transition;
        FusionResult result;
        {
            std::lock_guard lock(state->mutex);
            state->maxTemperature = inputs.temperature;
            state->gasPpm = inputs.gasPpm;
            state->smokePct = inputs.smokePct;
            state->flamePct = inputs.flamePct;
            state->visionConfidence = inputs.visionConfidence;
            result = evaluateLocked(*state, inputs, now, transition);
        }
        afterEvaluate(locationId, result, transition);
        return result;
    }

    /**
     * @brief 处理接入侧交来的记录（热成像帧 / 传感器采样）
     * @return 触发了判定时返回结果；身份记录不参与融合
     */
    std::optional<FusionResult> ingest(const std::string& locationId, const wire::DecodedRecord& record) {
        return ingest(locationId, record, Clock::now());
    }

    std::optional<FusionResult> ingest(const std::string& locationId, const wire::DecodedRecord& record,
                                       TimePoint now) {
        if (std::holds_alternative<wire::IdentityRecord>(record)) {
            return std::nullopt;
        }

        auto state = stateFor(locationId);
        Transition transition;
        FusionResult result;
        {
            std::lock_guard lock(state->mutex);
            if (const auto* frame = std::get_if<wire::ThermalFrame>(&record)) {
                auto decay = std::chrono::duration_cast<Clock::duration>(
                    std::chrono::duration<double>(config_.hotCellDecaySeconds));
                int exceeded = state->grid.update(frame->celsius, config_.tempThreshold, now, decay);
                state->maxTemperature = frame->maxTemperature();
                ++state->framesSeen;
                if (exceeded > 0) {
                    LOG_TRACE << "[Fusion] " << locationId << ": " << exceeded
                              << " cells above " << config_.tempThreshold << "C";
                }
            } else if (const auto* sample = std::get_if<wire::SensorSample>(&record)) {
                state->smokePct = adcToPercent(sample->adc1);
                state->gasPpm = gasModel_.ppm(sample->adc1);
                state->flameDetected = sample->flameFlag;
                state->flamePct = sample->flameFlag ? 100.0 : adcToPercent(sample->adc2);
                ++state->samplesSeen;
            }
            result = evaluateLocked(*state, currentInputs(*state), now, transition);
        }
        afterEvaluate(locationId, result, transition);
        return result;
    }

    /**
     * @brief 外部视觉检测模块提交置信度
     * @throws ValidationException 置信度不在 [0, 1]
     */
    FusionResult setVisionConfidence(const std::string& locationId, double confidence) {
        return setVisionConfidence(locationId, confidence, Clock::now());
    }

    FusionResult setVisionConfidence(const std::string& locationId, double confidence, TimePoint now) {
        if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0) {
            throw ValidationException("视觉置信度必须在 [0, 1] 内");
        }
        auto state = stateFor(locationId);
        Transition transition;
        FusionResult result;
        {
            std::lock_guard lock(state->mutex);
            state->visionConfidence = confidence;
            result = evaluateLocked(*state, currentInputs(*state), now, transition);
        }
        afterEvaluate(locationId, result, transition);
        return result;
    }

    // ==================== 查询 ====================

    std::optional<FusionSnapshot> snapshot(const std::string& locationId) const {
        return snapshot(locationId, Clock::now());
    }

    std::optional<FusionSnapshot> snapshot(const std::string& locationId, TimePoint now) const {
        std::shared_ptr<FusionState> state;
        {
            std::shared_lock lock(statesMutex_);
            auto it = states_.find(locationId);
            if (it == states_.end()) return std::nullopt;
            state = it->second;
        }

        std::lock_guard lock(state->mutex);
        FusionSnapshot snap;
        snap.locationId = state->locationId;
        snap.maxTemperature = state->maxTemperature;
        snap.hotCellCount = state->grid.activeCount(now);
        snap.gasPpm = state->gasPpm;
        snap.smokePct = state->smokePct;
        snap.flamePct = state->flamePct;
        snap.flameDetected = state->flameDetected;
        snap.visionConfidence = state->visionConfidence;
        snap.framesSeen = state->framesSeen;
        snap.samplesSeen = state->samplesSeen;
        snap.alarmActive = state->alarmActive;
        snap.inHold = state->alarmActive && now < state->holdUntil;
        snap.lastResult = state->lastResult;
        return snap;
    }

    size_t locationCount() const {
        std::shared_lock lock(statesMutex_);
        return states_.size();
    }

    const FusionConfig& config() const { return config_; }

    /**
     * @brief 运行时替换置信度策略
     */
    void setConfidencePolicy(std::unique_ptr<ConfidencePolicy> policy) {
        std::unique_lock lock(policyMutex_);
        LOG_INFO << "[Fusion] Confidence policy " << policy_->name() << " -> " << policy->name();
        policy_ = std::move(policy);
    }

private:
    struct Transition {
        bool raised = false;
        bool cleared = false;
    };

    AppContext& ctx_;
    FusionConfig config_;
    GasSensorModel gasModel_;

    mutable std::shared_mutex policyMutex_;
    std::shared_ptr<ConfidencePolicy> policy_;

    mutable std::shared_mutex statesMutex_;
    std::map<std::string, std::shared_ptr<FusionState>> states_;

    std::shared_ptr<FusionState> stateFor(const std::string& locationId) {
        {
            std::shared_lock lock(statesMutex_);
            auto it = states_.find(locationId);
            if (it != states_.end()) return it->second;
        }
        std::unique_lock lock(statesMutex_);
        auto& slot = states_[locationId];
        if (!slot) {
            slot = std::make_shared<FusionState>(locationId);
            LOG_INFO << "[Fusion] New location state: " << locationId;
        }
        return slot;
    }

    static FusionInputs currentInputs(const FusionState& state) {
        return FusionInputs{state.maxTemperature, state.gasPpm, state.smokePct,
                            state.flamePct, state.visionConfidence};
    }

    /**
     * @brief 调用方已持有 state.mutex
     */
    FusionResult evaluateLocked(FusionState& state, const FusionInputs& inputs, TimePoint now,
                                Transition& transition) {
        // 保持期内冻结判定
        if (state.alarmActive && now < state.holdUntil) {
            FusionResult held = state.lastResult;
            held.held = true;
            return held;
        }

        std::vector<SourceReading> contributing;
        auto check = [&contributing](SensorSource source, double value, double threshold, bool latched) {
            if (value >= threshold || latched) {
                contributing.push_back(SourceReading{source, value, threshold});
            }
        };

        bool hotLatched = state.grid.activeCount(now) > 0;
        check(SensorSource::Thermal, inputs.temperature, config_.tempThreshold, hotLatched);
        check(SensorSource::Gas, inputs.gasPpm, config_.gasThreshold, false);
        check(SensorSource::Smoke, inputs.smokePct, config_.smokeThreshold, false);
        check(SensorSource::Flame, inputs.flamePct, config_.flameThreshold, false);
        check(SensorSource::Vision, inputs.visionConfidence, config_.visionThreshold, false);

        FusionResult result;
        result.sourcesTriggered = static_cast<int>(contributing.size());
        result.alarm = result.sourcesTriggered >= config_.minSources;
        for (const auto& r : contributing) {
            result.contributing.insert(r.source);
        }
        {
            std::shared_lock lock(policyMutex_);
            result.confidence = policy_->aggregate(contributing);
        }

        if (result.alarm) {
            if (!state.alarmActive) transition.raised = true;
            state.alarmActive = true;
            state.holdUntil = now + std::chrono::duration_cast<Clock::duration>(
                std::chrono::duration<double>(config_.holdSeconds));
        } else if (state.alarmActive) {
            transition.cleared = true;
            state.alarmActive = false;
        }
        state.lastResult = result;
        return result;
    }

    void afterEvaluate(const std::string& locationId, const FusionResult& result, const Transition& transition) {
        ctx_.metrics.recordFusion(locationId, transition.raised);

        if (transition.raised) {
            LOG_WARN << "[Fusion] ALARM at " << locationId
                     << ": sources=" << result.sourcesTriggered
                     << ", confidence=" << result.confidence;
            ctx_.eventBus.publish(AlarmRaised{locationId, result});
        } else if (transition.cleared) {
            LOG_INFO << "[Fusion] Alarm cleared at " << locationId;
            ctx_.eventBus.publish(AlarmCleared{locationId, result});
        }
    }
};
