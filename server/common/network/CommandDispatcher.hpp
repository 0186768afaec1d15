#pragma once

#include "common/AppContext.hpp"
#include "modules/device/domain/Command.hpp"
#include "modules/device/domain/Device.hpp"

#include <trantor/net/EventLoopThreadPool.h>
#include <trantor/net/TcpClient.h>
#include <trantor/utils/Logger.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

/**
 * @brief 设备指令下发（短连接）
 *
 * 每条指令新建一个 TcpClient：连接 → 发送 "<COMMAND>\n" → 等待任意应答字节。
 * 结果只回调一次：
 * - 收到数据：成功
 * - 连接失败：Unreachable
 * - 应答前连接关闭：Closed
 * - ack_timeout_ms 内无应答：Timeout
 *
 * 连接分布在独立的 EventLoop 线程池上，不同设备的下发互不阻塞。
 */
class CommandDispatcher {
public:
    using TcpClient = trantor::TcpClient;
    using TcpConnectionPtr = trantor::TcpConnectionPtr;
    using MsgBuffer = trantor::MsgBuffer;
    using EventLoop = trantor::EventLoop;
    using EventLoopThreadPool = trantor::EventLoopThreadPool;
    using InetAddress = trantor::InetAddress;
    using Callback = std::function<void(CommandOutcome)>;

    explicit CommandDispatcher(AppContext& ctx)
        : ackTimeoutMs_(ctx.config.scheduler.ackTimeoutMs)
        , threads_(ctx.config.scheduler.dispatchThreads) {}

    ~CommandDispatcher() {
        stop();
    }

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    void start() {
        if (pool_) return;
        pool_ = std::make_unique<EventLoopThreadPool>(threads_, "DispatchPool");
        pool_->start();
        LOG_INFO << "[Dispatch] Command dispatcher started: " << threads_
                 << " threads, ack timeout " << ackTimeoutMs_ << "ms";
    }

    /**
     * @brief 停止线程池，仍在途的指令以 Closed 结束
     */
    void stop() {
        if (!pool_) return;

        std::map<uint64_t, std::shared_ptr<DispatchState>> leftovers;
        {
            std::lock_guard lock(mutex_);
            leftovers.swap(pending_);
        }
        for (auto& [id, state] : leftovers) {
            state->loop->runInLoop([this, state]() {
                finish(state, false, DispatchErrorKind::Closed, "dispatcher stopped");
            });
        }

        for (auto* loop : pool_->getLoops()) {
            loop->quit();
        }
        pool_->wait();
        pool_.reset();
        LOG_INFO << "[Dispatch] Command dispatcher stopped";
    }

    /**
     * @brief 异步下发一条指令，完成后在 IO 线程上回调 done
     */
    void dispatch(const Device& device, CommandType command, Callback done) {
        auto dispatchedAt = std::chrono::system_clock::now();
        if (!pool_) {
            done(CommandOutcome::failed(device.id(), command, DispatchErrorKind::Unreachable,
                                        "dispatcher not running", 0.0, dispatchedAt));
            return;
        }
        if (!Device::isValidIp(device.ip()) || device.port() == 0) {
            done(CommandOutcome::failed(device.id(), command, DispatchErrorKind::InvalidTarget,
                                        "invalid target " + device.ip(), 0.0, dispatchedAt));
            return;
        }

        auto state = std::make_shared<DispatchState>();
        state->id = nextId_.fetch_add(1, std::memory_order_relaxed);
        state->deviceId = device.id();
        state->command = command;
        state->callback = std::move(done);
        state->startedAt = std::chrono::steady_clock::now();
        state->dispatchedAt = dispatchedAt;
        state->loop = pool_->getNextLoop();

        {
            std::lock_guard lock(mutex_);
            pending_[state->id] = state;
        }

        std::string ip = device.ip();
        uint16_t port = device.port();
        state->loop->queueInLoop([this, state, ip, port]() {
            try {
                begin(state, ip, port);
            } catch (const std::exception& e) {
                finish(state, false, DispatchErrorKind::Unreachable, e.what());
            }
        });
    }

    /**
     * @brief 作为 DeviceScheduler 的传输层
     */
    std::function<void(const Device&, CommandType, Callback)> asDispatchFunction() {
        return [this](const Device& device, CommandType command, Callback done) {
            dispatch(device, command, std::move(done));
        };
    }

    size_t pendingCount() const {
        std::lock_guard lock(mutex_);
        return pending_.size();
    }

private:
    struct DispatchState {
        uint64_t id = 0;
        int deviceId = 0;
        CommandType command = CommandType::Request1;
        Callback callback;
        std::chrono::steady_clock::time_point startedAt;
        std::chrono::system_clock::time_point dispatchedAt;
        EventLoop* loop = nullptr;
        std::shared_ptr<TcpClient> client;
        trantor::TimerId timer{0};
        std::atomic<bool> done{false};
    };

    int ackTimeoutMs_;
    size_t threads_;
    std::unique_ptr<EventLoopThreadPool> pool_;
    std::atomic<uint64_t> nextId_{1};

    mutable std::mutex mutex_;
    std::map<uint64_t, std::shared_ptr<DispatchState>> pending_;

    // 在 state->loop 线程上执行
    void begin(const std::shared_ptr<DispatchState>& state, const std::string& ip, uint16_t port) {
        bool ipv6 = ip.find(':') != std::string::npos;
        InetAddress addr(ip, port, ipv6);
        auto client = std::make_shared<TcpClient>(
            state->loop, addr, "Cmd_" + std::to_string(state->deviceId));
        state->client = client;

        std::string payload = std::string(commandTypeToString(state->command)) + "\n";
        std::weak_ptr<DispatchState> stateWeak = state;

        client->setConnectionCallback([this, stateWeak, payload](const TcpConnectionPtr& conn) {
            auto st = stateWeak.lock();
            if (!st) return;
            if (conn->connected()) {
                conn->send(payload);
            } else {
                finish(st, false, DispatchErrorKind::Closed, "connection closed before acknowledgement");
            }
        });

        client->setMessageCallback([this, stateWeak](const TcpConnectionPtr&, MsgBuffer* buf) {
            buf->retrieveAll();
            auto st = stateWeak.lock();
            if (!st) return;
            finish(st, true, DispatchErrorKind::Unreachable, "");
        });

        client->setConnectionErrorCallback([this, stateWeak]() {
            auto st = stateWeak.lock();
            if (!st) return;
            finish(st, false, DispatchErrorKind::Unreachable, "connection refused or unreachable");
        });

        state->timer = state->loop->runAfter(ackTimeoutMs_ / 1000.0, [this, stateWeak]() {
            auto st = stateWeak.lock();
            if (!st) return;
            finish(st, false, DispatchErrorKind::Timeout,
                   "no acknowledgement within " + std::to_string(ackTimeoutMs_) + "ms");
        });

        client->connect();
    }

    void finish(const std::shared_ptr<DispatchState>& state, bool success,
                DispatchErrorKind kind, const std::string& message) {
        if (state->done.exchange(true, std::memory_order_acq_rel)) return;

        state->loop->invalidateTimer(state->timer);
        {
            std::lock_guard lock(mutex_);
            pending_.erase(state->id);
        }

        double latencyMs = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - state->startedAt).count();

        auto outcome = success
            ? CommandOutcome::ok(state->deviceId, state->command, latencyMs, state->dispatchedAt)
            : CommandOutcome::failed(state->deviceId, state->command, kind, message,
                                     latencyMs, state->dispatchedAt);

        // 不在 TcpClient 自己的回调栈里析构它
        auto client = std::move(state->client);
        state->loop->queueInLoop([client]() {
            if (client) client->disconnect();
        });

        try {
            if (state->callback) state->callback(std::move(outcome));
        } catch (const std::exception& e) {
            LOG_ERROR << "[Dispatch] Completion callback failed for device "
                      << state->deviceId << ": " << e.what();
        }
    }
};
