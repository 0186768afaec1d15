#pragma once

#include "common/AppContext.hpp"
#include "common/utils/AppConfig.hpp"

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

/**
 * @brief 自适应帧率控制器
 *
 * 按视频流把积压深度换算为推荐帧率：
 * - depth > high_watermark：fps × 0.75，下限 min_fps
 * - depth < low_watermark：fps + 1，上限 max_fps
 * - 其余情况保持不变
 *
 * 同一流在 adjustment_cooldown 窗口内最多调整一次。
 * 纯计算组件，时间由调用方传入，给定深度序列与时钟结果确定。
 */
class AdaptiveRateController {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    static constexpr double DECREASE_FACTOR = 0.75;
    static constexpr double INCREASE_STEP = 1.0;

    explicit AdaptiveRateController(RateControllerConfig config)
        : config_(std::move(config)) {
        config_.validate();
    }

    /**
     * @brief 绑定进程上下文：帧率同步到 firewatch_stream_fps，流到位置的映射来自配置
     */
    explicit AdaptiveRateController(AppContext& ctx)
        : config_(ctx.config.rateController)
        , metrics_(&ctx.metrics)
        , streams_(ctx.config.streams) {
        config_.validate();
        LOG_INFO << "[RateControl] base=" << config_.baseFps
                 << " range=[" << config_.minFps << ", " << config_.maxFps << "]"
                 << " watermarks=" << config_.lowWatermark << "/" << config_.highWatermark
                 << " cooldown=" << config_.cooldownSeconds << "s"
                 << " streams=" << streams_.size();
    }

    AdaptiveRateController(const AdaptiveRateController&) = delete;
    AdaptiveRateController& operator=(const AdaptiveRateController&) = delete;

    /**
     * @brief 上报积压深度，返回调整后的帧率
     */
    double update(const std::string& streamId, int depth) {
        return update(streamId, depth, Clock::now());
    }

    double update(const std::string& streamId, int depth, TimePoint now) {
        double fps;
        {
            std::lock_guard lock(mutex_);
            auto& state = stateFor(streamId);

            bool coolingDown = state.lastAdjustment &&
                now - *state.lastAdjustment < std::chrono::duration<double>(config_.cooldownSeconds);

            if (!coolingDown) {
                double next = state.fps;
                if (depth > config_.highWatermark) {
                    next = std::max(config_.minFps, state.fps * DECREASE_FACTOR);
                } else if (depth < config_.lowWatermark) {
                    next = std::min(config_.maxFps, state.fps + INCREASE_STEP);
                }
                if (next != state.fps) {
                    LOG_DEBUG << "[RateControl] " << streamId << ": depth=" << depth
                              << " fps " << state.fps << " -> " << next;
                    state.fps = next;
                    state.lastAdjustment = now;
                }
            }
            fps = state.fps;
        }

        if (metrics_) {
            metrics_->setStreamFps(streamId, fps);
        }
        return fps;
    }

    /**
     * @brief 当前帧率（未见过的流返回 base_fps）
     */
    double fps(const std::string& streamId) const {
        std::lock_guard lock(mutex_);
        auto it = states_.find(streamId);
        return it == states_.end() ? config_.baseFps : it->second.fps;
    }

    /**
     * @brief 推荐帧间隔（毫秒）
     */
    double intervalMs(const std::string& streamId) const {
        return 1000.0 / fps(streamId);
    }

    /**
     * @brief 流对应的位置（未配置映射时返回 nullopt）
     */
    std::optional<std::string> locationFor(const std::string& streamId) const {
        auto it = streams_.find(streamId);
        if (it == streams_.end()) return std::nullopt;
        return it->second;
    }

    const RateControllerConfig& config() const { return config_; }

private:
    struct StreamState {
        double fps;
        std::optional<TimePoint> lastAdjustment;
    };

    RateControllerConfig config_;
    MetricsCollector* metrics_ = nullptr;
    std::map<std::string, std::string> streams_;

    mutable std::mutex mutex_;
    std::map<std::string, StreamState> states_;

    StreamState& stateFor(const std::string& streamId) {
        auto it = states_.find(streamId);
        if (it == states_.end()) {
            it = states_.emplace(streamId, StreamState{config_.baseFps, std::nullopt}).first;
        }
        return it->second;
    }
};
