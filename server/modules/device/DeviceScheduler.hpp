#pragma once

#include "DeviceRegistry.hpp"
#include "domain/Command.hpp"
#include "domain/Events.hpp"
#include "common/AppContext.hpp"
#include "common/network/RetryPolicy.hpp"

#include <trantor/net/EventLoop.h>
#include <trantor/utils/Logger.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

/**
 * @brief 设备指令调度器
 *
 * 单一 tick 循环（默认 1 秒）独立评估每台设备：
 * - Continuous 设备先下发一次 PERIOD_ON，失败按 RetryCadence 重试，成功后转入 REQUEST1 轮询
 * - 距上次 REQUEST1 达到 poll_seconds 即再次下发
 * - 同一设备同一时刻最多一条指令在途，不同设备并发下发
 * - 下发失败不移出调度；失败日志按 LogThrottle 限流，与重试频率无关
 *
 * 选择在锁内完成，实际下发在锁外调用 DispatchFunction（默认由 CommandDispatcher 提供），
 * 测试中可替换为假的传输层并注入时间。
 */
class DeviceScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using EventLoop = trantor::EventLoop;
    using CompletionCallback = std::function<void(CommandOutcome)>;
    using DispatchFunction = std::function<void(const Device&, CommandType, CompletionCallback)>;

    /**
     * @brief 单台设备的调度状态（只读视图）
     */
    struct DeviceStatus {
        int deviceId = 0;
        std::string name;
        std::string mode;
        bool periodOnDone = false;
        bool inFlight = false;
        uint64_t dispatched = 0;
        uint64_t failures = 0;
        std::optional<double> secondsSinceRequest;

        Json::Value toJson() const {
            Json::Value json;
            json["device_id"] = deviceId;
            json["name"] = name;
            json["mode"] = mode;
            json["period_on_done"] = periodOnDone;
            json["in_flight"] = inFlight;
            json["dispatched"] = static_cast<Json::UInt64>(dispatched);
            json["failures"] = static_cast<Json::UInt64>(failures);
            json["seconds_since_request"] = secondsSinceRequest
                ? Json::Value(*secondsSinceRequest) : Json::Value(Json::nullValue);
            return json;
        }
    };

    DeviceScheduler(AppContext& ctx, DeviceRegistry& registry, DispatchFunction dispatch)
        : ctx_(ctx)
        , config_(ctx.config.scheduler)
        , registry_(registry)
        , dispatch_(std::move(dispatch)) {}

    ~DeviceScheduler() {
        stop(std::chrono::milliseconds(0));
    }

    DeviceScheduler(const DeviceScheduler&) = delete;
    DeviceScheduler& operator=(const DeviceScheduler&) = delete;

    // ==================== 生命周期 ====================

    /**
     * @brief 在指定 EventLoop 上启动 tick 定时器，并立即执行第一次 tick
     */
    void start(EventLoop* loop) {
        if (!loop) return;
        stopping_.store(false, std::memory_order_release);
        loop_ = loop;

        loop->runInLoop([this]() { safeTick(); });
        timerId_ = loop->runEvery(config_.tickSeconds, [this]() { safeTick(); });

        LOG_INFO << "[Scheduler] Started: " << registry_.size() << " devices, tick="
                 << config_.tickSeconds << "s, PERIOD_ON retry=" << config_.periodOnRetrySeconds << "s";
    }

    /**
     * @brief 优雅停止
     *
     * 不再产生新的 tick；正在执行的 tick 会把已选中的设备下发完，
     * 然后等待在途指令完成（最多 timeout）。
     * @return 在途指令是否全部完成
     */
    bool stop(std::chrono::milliseconds timeout) {
        stopping_.store(true, std::memory_order_release);
        if (loop_) {
            loop_->invalidateTimer(timerId_);
            timerId_ = trantor::TimerId{0};
            loop_ = nullptr;
        }

        {
            // 等待当前 tick 结束
            std::lock_guard tickLock(tickMutex_);
        }

        std::unique_lock lock(mutex_);
        bool drained = cv_.wait_for(lock, timeout, [this]() { return inFlight_ == 0; });
        if (!drained) {
            LOG_WARN << "[Scheduler] Stopped with " << inFlight_ << " commands still in flight";
        }
        return drained;
    }

    // ==================== 调度 ====================

    /**
     * @brief 执行一次调度评估
     */
    void tick(TimePoint now) {
        if (stopping_.load(std::memory_order_acquire)) return;
        std::lock_guard tickLock(tickMutex_);
        if (stopping_.load(std::memory_order_acquire)) return;

        syncRegistry();

        struct Selected {
            Device device;
            CommandType command;
        };
        std::vector<Selected> selected;
        {
            std::lock_guard lock(mutex_);
            for (auto& [id, rt] : runtimes_) {
                if (rt.inFlight) continue;

                if (rt.device.isContinuous() && !rt.periodOnDone) {
                    if (!rt.nextPeriodOnAttempt || now >= *rt.nextPeriodOnAttempt) {
                        rt.inFlight = true;
                        ++inFlight_;
                        selected.push_back({rt.device, CommandType::PeriodOn});
                    }
                    continue;
                }

                auto interval = std::chrono::seconds(rt.device.pollSeconds());
                if (!rt.lastRequest || now - *rt.lastRequest >= interval) {
                    rt.lastRequest = now;
                    rt.inFlight = true;
                    ++inFlight_;
                    selected.push_back({rt.device, CommandType::Request1});
                }
            }
        }

        for (const auto& item : selected) {
            int deviceId = item.device.id();
            CommandType command = item.command;
            LOG_DEBUG << "[Scheduler] " << commandTypeToString(command) << " -> "
                      << item.device.name() << " (" << item.device.ip() << ":" << item.device.port() << ")";
            try {
                dispatch_(item.device, command, [this, deviceId, command, now](CommandOutcome outcome) {
                    onOutcome(deviceId, command, now, std::move(outcome));
                });
            } catch (const std::exception& e) {
                LOG_ERROR << "[Scheduler] Dispatch threw for device " << deviceId << ": " << e.what();
                onOutcome(deviceId, command, now, CommandOutcome::failed(
                    deviceId, command, DispatchErrorKind::Unreachable, e.what(), 0.0,
                    std::chrono::system_clock::now()));
            }
        }
    }

    /**
     * @brief 现场单元重新接入时，为同 IP 的 Continuous 设备重新安排一次 PERIOD_ON
     *
     * 距上次 PERIOD_ON 成功不足一个重试周期时忽略，避免设备因 PERIOD_ON 重连而形成循环。
     */
    void rearmPeriodOn(const std::string& ip) {
        rearmPeriodOn(ip, Clock::now());
    }

    void rearmPeriodOn(const std::string& ip, TimePoint now) {
        auto minGap = std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(config_.periodOnRetrySeconds));

        std::lock_guard lock(mutex_);
        for (auto& [id, rt] : runtimes_) {
            if (rt.device.ip() != ip || !rt.device.isContinuous() || !rt.periodOnDone) continue;
            if (rt.lastPeriodOnSuccess && now - *rt.lastPeriodOnSuccess < minGap) continue;

            rt.periodOnDone = false;
            rt.nextPeriodOnAttempt.reset();
            rt.cadence.reset();
            LOG_INFO << "[Scheduler] Field unit " << ip << " reconnected, PERIOD_ON re-armed for "
                     << rt.device.name();
        }
    }

    // ==================== 查询 ====================

    std::vector<DeviceStatus> status() const {
        return status(Clock::now());
    }

    std::vector<DeviceStatus> status(TimePoint now) const {
        std::vector<DeviceStatus> result;
        std::lock_guard lock(mutex_);
        result.reserve(runtimes_.size());
        for (const auto& [id, rt] : runtimes_) {
            DeviceStatus s;
            s.deviceId = id;
            s.name = rt.device.name();
            s.mode = deviceModeToString(rt.device.mode());
            s.periodOnDone = rt.periodOnDone;
            s.inFlight = rt.inFlight;
            s.dispatched = rt.dispatched;
            s.failures = rt.failures;
            if (rt.lastRequest) {
                s.secondsSinceRequest = std::chrono::duration<double>(now - *rt.lastRequest).count();
            }
            result.push_back(std::move(s));
        }
        return result;
    }

    size_t inFlightCount() const {
        std::lock_guard lock(mutex_);
        return inFlight_;
    }

private:
    struct Runtime {
        explicit Runtime(Device d, const SchedulerConfig& cfg)
            : device(std::move(d))
            , cadence(cfg.periodOnRetrySeconds, cfg.periodOnRetryGrowth, cfg.periodOnRetryMaxSeconds)
            , throttle(cfg.failureLogIntervalSeconds) {}

        Device device;
        std::optional<TimePoint> lastRequest;
        bool periodOnDone = false;
        std::optional<TimePoint> nextPeriodOnAttempt;
        std::optional<TimePoint> lastPeriodOnSuccess;
        bool inFlight = false;
        RetryCadence cadence;
        LogThrottle throttle;
        uint64_t dispatched = 0;
        uint64_t failures = 0;
    };

    AppContext& ctx_;
    SchedulerConfig config_;
    DeviceRegistry& registry_;
    DispatchFunction dispatch_;

    EventLoop* loop_ = nullptr;
    trantor::TimerId timerId_{0};
    std::atomic<bool> stopping_{false};

    std::mutex tickMutex_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<int, Runtime> runtimes_;
    size_t inFlight_ = 0;
    std::optional<uint64_t> seenVersion_;

    void safeTick() {
        try {
            tick(Clock::now());
        } catch (const std::exception& e) {
            LOG_ERROR << "[Scheduler] Tick exception: " << e.what();
        }
    }

    /**
     * @brief 注册表变化时增量同步运行时状态（调用方持有 tickMutex_）
     */
    void syncRegistry() {
        uint64_t version = registry_.version();
        if (seenVersion_ && *seenVersion_ == version) return;
        auto devices = registry_.snapshot();

        std::lock_guard lock(mutex_);
        std::map<int, Runtime> next;
        for (auto& device : devices) {
            auto it = runtimes_.find(device.id());
            if (it == runtimes_.end()) {
                next.emplace(device.id(), Runtime(device, config_));
                continue;
            }
            if (it->second.device.scheduleDiffers(device)) {
                // 调度参数变化：重新开始（在途标记保留，保证串行）
                Runtime fresh(device, config_);
                fresh.inFlight = it->second.inFlight;
                next.emplace(device.id(), std::move(fresh));
                LOG_INFO << "[Scheduler] Schedule reset for " << device.name();
            } else {
                it->second.device = device;
                next.emplace(device.id(), std::move(it->second));
            }
        }
        runtimes_.swap(next);
        seenVersion_ = version;
    }

    void onOutcome(int deviceId, CommandType command, TimePoint startedAt, CommandOutcome outcome) {
        const char* commandName = commandTypeToString(command);
        ctx_.metrics.recordDispatch(std::to_string(deviceId), commandName, outcome.success, outcome.latencyMs);

        {
            std::lock_guard lock(mutex_);
            auto it = runtimes_.find(deviceId);
            if (it != runtimes_.end()) {
                auto& rt = it->second;
                rt.inFlight = false;
                ++rt.dispatched;

                if (outcome.success) {
                    if (command == CommandType::PeriodOn) {
                        rt.periodOnDone = true;
                        rt.lastPeriodOnSuccess = startedAt;
                        rt.cadence.reset();
                        LOG_INFO << "[Scheduler] PERIOD_ON acknowledged by " << rt.device.name()
                                 << " (" << outcome.latencyMs << "ms)";
                    } else {
                        LOG_TRACE << "[Scheduler] REQUEST1 acknowledged by " << rt.device.name()
                                  << " (" << outcome.latencyMs << "ms)";
                    }
                    rt.throttle.reset();
                } else {
                    ++rt.failures;
                    std::string retryNote;
                    if (command == CommandType::PeriodOn) {
                        double delay = rt.cadence.recordFailure();
                        rt.nextPeriodOnAttempt = startedAt + std::chrono::duration_cast<Clock::duration>(
                            std::chrono::duration<double>(delay));
                        retryNote = ", retry in " + std::to_string(static_cast<int>(delay)) + "s";
                    }
                    if (auto suppressed = rt.throttle.admit(startedAt)) {
                        LOG_WARN << "[Scheduler] " << commandName << " to " << rt.device.name()
                                 << " (" << rt.device.ip() << ") failed: "
                                 << (outcome.error ? outcome.error->message : "unknown")
                                 << retryNote
                                 << (*suppressed > 0 ? " (" + std::to_string(*suppressed) + " similar failures suppressed)" : "");
                    }
                }
            }
            if (inFlight_ > 0) --inFlight_;
        }
        cv_.notify_all();

        ctx_.eventBus.publish(CommandDispatched{std::move(outcome)});
    }
};
