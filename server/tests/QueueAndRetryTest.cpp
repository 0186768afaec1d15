#include "common/protocol/RecordDispatcher.hpp"
#include "common/network/RetryPolicy.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

wire::SensorSample sampleWithAdc(int adc1) {
    wire::SensorSample s;
    s.adc1 = adc1;
    return s;
}

int adcOf(const wire::DecodedRecord& record) {
    return std::get<wire::SensorSample>(record).adc1;
}

}  // namespace

// ==================== 交接队列 ====================

TEST(LocationQueueTest, DropsOldestWhenFull) {
    LocationQueue queue(3);
    auto now = std::chrono::steady_clock::now();

    for (int i = 1; i <= 3; ++i) {
        EXPECT_FALSE(queue.push(QueuedRecord{sampleWithAdc(i), now}));
    }
    EXPECT_TRUE(queue.push(QueuedRecord{sampleWithAdc(4), now}));
    EXPECT_EQ(queue.size(), 3u);

    auto batch = queue.popBatch(10);
    ASSERT_EQ(batch.size(), 3u);
    EXPECT_EQ(adcOf(batch[0].record), 2);
    EXPECT_EQ(adcOf(batch[1].record), 3);
    EXPECT_EQ(adcOf(batch[2].record), 4);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(LocationQueueTest, PopBatchRespectsLimit) {
    LocationQueue queue(10);
    auto now = std::chrono::steady_clock::now();
    for (int i = 0; i < 5; ++i) queue.push(QueuedRecord{sampleWithAdc(i), now});

    EXPECT_EQ(queue.popBatch(2).size(), 2u);
    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(LocationQueue(0).capacity(), 1u);
}

TEST(RecordDispatcherTest, PreservesPerLocationOrder) {
    AppConfig cfg;
    cfg.ingestion.fusionThreads = 3;
    cfg.ingestion.queueCapacity = 10000;
    AppContext ctx(std::move(cfg));

    std::mutex mutex;
    std::map<std::string, std::vector<int>> seen;
    RecordDispatcher dispatcher(ctx, [&](const std::string& loc, const wire::DecodedRecord& record,
                                         RecordDispatcher::TimePoint) {
        std::lock_guard lock(mutex);
        seen[loc].push_back(adcOf(record));
    });
    dispatcher.start();

    const std::vector<std::string> locations = {"RoomA", "RoomB", "RoomC", "RoomD"};
    for (int i = 0; i < 500; ++i) {
        for (const auto& loc : locations) {
            EXPECT_TRUE(dispatcher.submit(loc, sampleWithAdc(i)));
        }
    }

    ASSERT_TRUE(dispatcher.waitUntilIdle(5000ms));
    dispatcher.stop();

    EXPECT_EQ(dispatcher.locationCount(), 0u);   // stop 后通道被清空
    std::lock_guard lock(mutex);
    for (const auto& loc : locations) {
        const auto& values = seen[loc];
        ASSERT_EQ(values.size(), 500u) << loc;
        for (int i = 0; i < 500; ++i) {
            EXPECT_EQ(values[static_cast<size_t>(i)], i) << loc;
        }
    }
}

TEST(RecordDispatcherTest, ConsumerFailureDoesNotStopLocation) {
    AppContext ctx(AppConfig{});

    std::mutex mutex;
    std::vector<int> seen;
    RecordDispatcher dispatcher(ctx, [&](const std::string&, const wire::DecodedRecord& record,
                                         RecordDispatcher::TimePoint) {
        int adc = adcOf(record);
        if (adc == 1) throw std::runtime_error("boom");
        std::lock_guard lock(mutex);
        seen.push_back(adc);
    });
    dispatcher.start();

    for (int i = 0; i < 3; ++i) dispatcher.submit("RoomA", sampleWithAdc(i));
    ASSERT_TRUE(dispatcher.waitUntilIdle(2000ms));
    dispatcher.stop();

    std::lock_guard lock(mutex);
    EXPECT_EQ(seen, (std::vector<int>{0, 2}));
}

TEST(RecordDispatcherTest, RejectsWhenNotRunning) {
    AppContext ctx(AppConfig{});
    RecordDispatcher dispatcher(ctx, [](const std::string&, const wire::DecodedRecord&,
                                        RecordDispatcher::TimePoint) {});

    EXPECT_FALSE(dispatcher.submit("RoomA", sampleWithAdc(1)));
    EXPECT_EQ(dispatcher.depth("RoomA"), 0u);
    EXPECT_TRUE(dispatcher.waitUntilIdle(10ms));
}

TEST(RecordDispatcherTest, SubmitRacingStopIsSafe) {
    AppConfig cfg;
    cfg.ingestion.fusionThreads = 2;
    AppContext ctx(std::move(cfg));

    std::atomic<int> consumed{0};
    RecordDispatcher dispatcher(ctx, [&consumed](const std::string&, const wire::DecodedRecord&,
                                                 RecordDispatcher::TimePoint) {
        consumed.fetch_add(1, std::memory_order_relaxed);
    });
    dispatcher.start();

    std::atomic<bool> go{false};
    std::atomic<int> accepted{0};
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&, t]() {
            while (!go.load()) std::this_thread::yield();
            std::string loc = "Race" + std::to_string(t);
            for (int i = 0; i < 2000; ++i) {
                if (dispatcher.submit(loc, sampleWithAdc(i % 4096))) {
                    accepted.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }

    go.store(true);
    std::this_thread::sleep_for(2ms);
    dispatcher.stop();
    for (auto& t : producers) t.join();

    // stop 返回后消费线程已退出，不再有记录被处理
    int afterStop = consumed.load();
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(consumed.load(), afterStop);
    EXPECT_LE(afterStop, accepted.load());

    EXPECT_FALSE(dispatcher.submit("Race0", sampleWithAdc(1)));
    EXPECT_EQ(dispatcher.locationCount(), 0u);
}

// ==================== 重试节奏 ====================

TEST(RetryCadenceTest, FixedIntervalByDefault) {
    RetryCadence cadence;
    EXPECT_DOUBLE_EQ(cadence.recordFailure(), 30.0);
    EXPECT_DOUBLE_EQ(cadence.recordFailure(), 30.0);
    EXPECT_EQ(cadence.failures(), 2);

    cadence.reset();
    EXPECT_EQ(cadence.failures(), 0);
}

TEST(RetryCadenceTest, GrowsUpToCap) {
    RetryCadence cadence(10.0, 2.0, 50.0);
    EXPECT_DOUBLE_EQ(cadence.recordFailure(), 10.0);
    EXPECT_DOUBLE_EQ(cadence.recordFailure(), 20.0);
    EXPECT_DOUBLE_EQ(cadence.recordFailure(), 40.0);
    EXPECT_DOUBLE_EQ(cadence.recordFailure(), 50.0);
    EXPECT_DOUBLE_EQ(cadence.delay(), 50.0);

    cadence.reset();
    EXPECT_DOUBLE_EQ(cadence.delay(), 10.0);
}

// ==================== 日志限流 ====================

TEST(LogThrottleTest, AdmitsOncePerInterval) {
    LogThrottle throttle(60.0);
    auto t0 = LogThrottle::Clock::now();

    auto first = throttle.admit(t0);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 0u);

    EXPECT_FALSE(throttle.admit(t0 + 10s).has_value());
    EXPECT_FALSE(throttle.admit(t0 + 59s).has_value());
    EXPECT_EQ(throttle.suppressed(), 2u);

    auto next = throttle.admit(t0 + 60s);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, 2u);
    EXPECT_EQ(throttle.suppressed(), 0u);
}

TEST(LogThrottleTest, ResetMakesNextFailureVisible) {
    LogThrottle throttle(60.0);
    auto t0 = LogThrottle::Clock::now();

    throttle.admit(t0);
    throttle.reset();
    EXPECT_TRUE(throttle.admit(t0 + 1s).has_value());
}
