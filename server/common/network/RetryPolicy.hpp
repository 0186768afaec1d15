#pragma once

#include "common/utils/Constants.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>

/**
 * @brief 失败重试节奏
 *
 * - 基础间隔默认 30 秒（PERIOD_ON 重试）
 * - growth > 1 时按次数指数放大，封顶 cap
 * - 不带随机抖动：调度器按 tick 驱动，重试时刻必须可预测
 *
 * 只决定"下次何时再试"，与失败日志的频率无关（见 LogThrottle）。
 */
class RetryCadence {
public:
    RetryCadence(double baseSeconds = Constants::PERIOD_ON_RETRY_SEC,
                 double growth = 1.0,
                 double capSeconds = Constants::PERIOD_ON_RETRY_MAX_SEC)
        : base_(baseSeconds), growth_(std::max(growth, 1.0)), cap_(std::max(capSeconds, baseSeconds)) {}

    /**
     * @brief 当前重试间隔（秒）
     */
    double delay() const {
        double d = base_ * std::pow(growth_, static_cast<double>(failures_));
        return (std::min)(d, cap_);
    }

    /**
     * @brief 记录一次失败，返回下次重试前应等待的秒数
     */
    double recordFailure() {
        double d = delay();
        ++failures_;
        return d;
    }

    void reset() { failures_ = 0; }

    int failures() const { return failures_; }

private:
    double base_;
    double growth_;
    double cap_;
    int failures_ = 0;
};

/**
 * @brief 日志限流
 *
 * 每个 interval 内最多放行一条日志，其余计入 suppressed，
 * 下次放行时一并报告被压掉的条数。
 */
class LogThrottle {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    explicit LogThrottle(double intervalSeconds = Constants::FAILURE_LOG_INTERVAL_SEC)
        : interval_(std::chrono::duration_cast<Clock::duration>(
              std::chrono::duration<double>(intervalSeconds))) {}

    /**
     * @brief 判断此刻是否可以输出日志
     * @return 可以输出时返回此前被压掉的条数，否则 nullopt
     */
    std::optional<uint64_t> admit(TimePoint now) {
        if (lastLogged_ && now - *lastLogged_ < interval_) {
            ++suppressed_;
            return std::nullopt;
        }
        lastLogged_ = now;
        uint64_t n = suppressed_;
        suppressed_ = 0;
        return n;
    }

    /**
     * @brief 恢复正常后清零，下一次失败立即可见
     */
    void reset() {
        lastLogged_.reset();
        suppressed_ = 0;
    }

    uint64_t suppressed() const { return suppressed_; }

private:
    Clock::duration interval_;
    std::optional<TimePoint> lastLogged_;
    uint64_t suppressed_ = 0;
};
