#pragma once

#include "common/AppContext.hpp"
#include "common/protocol/wire/Wire.Types.hpp"
#include "common/utils/Constants.hpp"

#include <trantor/net/EventLoopThreadPool.h>
#include <trantor/utils/Logger.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <vector>

/**
 * @brief 排队中的记录
 */
struct QueuedRecord {
    wire::DecodedRecord record;
    std::chrono::steady_clock::time_point receivedAt;
};

/**
 * @brief 单个位置的有界交接队列
 *
 * 满时丢弃最旧的记录（而不是新到的），保证融合看到的总是最新数据。
 */
class LocationQueue {
public:
    explicit LocationQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    /**
     * @brief 入队
     * @return true 表示为腾出空间丢弃了一条最旧记录
     */
    bool push(QueuedRecord item) {
        std::lock_guard lock(mutex_);
        bool dropped = false;
        if (items_.size() >= capacity_) {
            items_.pop_front();
            dropped = true;
        }
        items_.push_back(std::move(item));
        return dropped;
    }

    /**
     * @brief 按到达顺序取出至多 max 条
     */
    std::vector<QueuedRecord> popBatch(size_t max) {
        std::vector<QueuedRecord> batch;
        std::lock_guard lock(mutex_);
        size_t n = std::min(max, items_.size());
        batch.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            batch.push_back(std::move(items_.front()));
            items_.pop_front();
        }
        return batch;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<QueuedRecord> items_;
};

/**
 * @brief 接入 → 融合的非阻塞交接
 *
 * - 每个位置一个 LocationQueue，首次提交时按轮询分配到一个融合 EventLoop
 * - 同一位置只在其所属 EventLoop 上消费，且同一时刻最多一个消费任务在排队（draining 标记），
 *   因此单个位置的 FusionState 始终只有一个写者，记录按到达顺序处理
 * - submit() 只做入队与投递，从不等待融合完成
 */
class RecordDispatcher {
public:
    using EventLoop = trantor::EventLoop;
    using EventLoopThreadPool = trantor::EventLoopThreadPool;
    using TimePoint = std::chrono::steady_clock::time_point;
    using Consumer = std::function<void(const std::string& locationId,
                                        const wire::DecodedRecord& record,
                                        TimePoint receivedAt)>;

    RecordDispatcher(AppContext& ctx, Consumer consumer)
        : ctx_(ctx)
        , consumer_(std::move(consumer))
        , capacity_(ctx.config.ingestion.queueCapacity)
        , threads_(ctx.config.ingestion.fusionThreads) {}

    ~RecordDispatcher() {
        stop();
    }

    RecordDispatcher(const RecordDispatcher&) = delete;
    RecordDispatcher& operator=(const RecordDispatcher&) = delete;

    /**
     * @brief 启动融合消费线程池
     */
    void start() {
        std::unique_lock life(lifecycleMutex_);
        if (pool_) {
            LOG_WARN << "[Dispatch] Record dispatcher already started";
            return;
        }
        pool_ = std::make_unique<EventLoopThreadPool>(threads_, "FusionPool");
        pool_->start();
        stopping_.store(false, std::memory_order_release);
        LOG_INFO << "[Dispatch] Record dispatcher started: " << threads_
                 << " fusion threads, queue capacity " << capacity_;
    }

    /**
     * @brief 停止消费线程池，队列中尚未消费的记录被丢弃
     */
    void stop() {
        // 独占生命周期锁：等待进行中的 submit 投递完成，之后的 submit 看到 pool_ 为空
        std::unique_lock life(lifecycleMutex_);
        if (!pool_) return;
        stopping_.store(true, std::memory_order_release);
        for (auto* loop : pool_->getLoops()) {
            loop->quit();
        }
        pool_->wait();
        pool_.reset();
        {
            // 通道持有旧线程池的 EventLoop 指针，重启后重新分配
            std::unique_lock lock(mutex_);
            channels_.clear();
        }
        LOG_INFO << "[Dispatch] Record dispatcher stopped";
    }

    /**
     * @brief 提交一条记录（IO 线程调用，非阻塞）
     * @return false 表示队列已满，丢弃了该位置最旧的一条记录
     */
    bool submit(const std::string& locationId, wire::DecodedRecord record) {
        std::shared_lock life(lifecycleMutex_);
        if (!pool_ || stopping_.load(std::memory_order_acquire)) {
            LOG_DEBUG << "[Dispatch] Not running, record for " << locationId << " discarded";
            return false;
        }

        auto channel = channelFor(locationId);
        bool dropped = channel->queue.push(QueuedRecord{std::move(record), std::chrono::steady_clock::now()});
        if (dropped) {
            ctx_.metrics.recordDrop(locationId);
            LOG_DEBUG << "[Dispatch] Queue full for " << locationId << ", oldest record dropped";
        }
        ctx_.metrics.setQueueDepth(locationId, channel->queue.size());
        scheduleDrain(channel);
        return !dropped;
    }

    /**
     * @brief 等待所有队列清空且没有消费任务在执行
     */
    bool waitUntilIdle(std::chrono::milliseconds timeout) const {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (isIdle()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return isIdle();
    }

    size_t depth(const std::string& locationId) const {
        std::shared_lock lock(mutex_);
        auto it = channels_.find(locationId);
        return it == channels_.end() ? 0 : it->second->queue.size();
    }

    size_t locationCount() const {
        std::shared_lock lock(mutex_);
        return channels_.size();
    }

private:
    struct Channel {
        Channel(std::string id, size_t capacity, EventLoop* l)
            : locationId(std::move(id)), queue(capacity), loop(l) {}

        const std::string locationId;
        LocationQueue queue;
        EventLoop* loop;
        std::atomic<bool> draining{false};
    };
    using ChannelPtr = std::shared_ptr<Channel>;

    AppContext& ctx_;
    Consumer consumer_;
    size_t capacity_;
    size_t threads_;

    // 保护 pool_ 的创建与销毁；消费任务不取此锁
    mutable std::shared_mutex lifecycleMutex_;
    std::unique_ptr<EventLoopThreadPool> pool_;
    std::atomic<bool> stopping_{false};

    mutable std::shared_mutex mutex_;
    std::map<std::string, ChannelPtr> channels_;

    ChannelPtr channelFor(const std::string& locationId) {
        {
            std::shared_lock lock(mutex_);
            auto it = channels_.find(locationId);
            if (it != channels_.end()) return it->second;
        }
        std::unique_lock lock(mutex_);
        auto& slot = channels_[locationId];
        if (!slot) {
            slot = std::make_shared<Channel>(locationId, capacity_, pool_->getNextLoop());
            LOG_DEBUG << "[Dispatch] New channel for " << locationId;
        }
        return slot;
    }

    void scheduleDrain(const ChannelPtr& channel) {
        if (channel->draining.exchange(true, std::memory_order_acq_rel)) return;
        channel->loop->queueInLoop([this, channel]() { drain(channel); });
    }

    void drain(const ChannelPtr& channel) {
        if (stopping_.load(std::memory_order_acquire)) {
            channel->draining.store(false, std::memory_order_release);
            return;
        }

        auto batch = channel->queue.popBatch(Constants::FUSION_DRAIN_BATCH);
        for (const auto& item : batch) {
            try {
                consumer_(channel->locationId, item.record, item.receivedAt);
            } catch (const std::exception& e) {
                LOG_ERROR << "[Dispatch] Fusion failed for " << channel->locationId << ": " << e.what();
            }
        }
        ctx_.metrics.setQueueDepth(channel->locationId, channel->queue.size());

        if (channel->queue.size() > 0) {
            // 让出 EventLoop，同一线程上的其他位置也能被处理
            channel->loop->queueInLoop([this, channel]() { drain(channel); });
            return;
        }

        channel->draining.store(false, std::memory_order_release);
        // 清除标记与 IO 线程入队之间可能交错，复查一次避免漏掉唤醒
        if (channel->queue.size() > 0) {
            scheduleDrain(channel);
        }
    }

    bool isIdle() const {
        std::shared_lock lock(mutex_);
        for (const auto& [id, channel] : channels_) {
            if (channel->queue.size() > 0 || channel->draining.load(std::memory_order_acquire)) {
                return false;
            }
        }
        return true;
    }
};
