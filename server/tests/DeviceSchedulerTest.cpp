#include "modules/device/DeviceScheduler.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <vector>

using namespace std::chrono_literals;

namespace {

using Clock = DeviceScheduler::Clock;

/**
 * @brief 假的下发通道：记录调用，按设定立即或延后完成
 */
class FakeTransport {
public:
    struct Call {
        int deviceId;
        CommandType command;
    };

    bool deferred = false;
    bool succeed = true;
    bool throwOnDispatch = false;

    std::vector<Call> calls;
    std::vector<DeviceScheduler::CompletionCallback> pending;

    DeviceScheduler::DispatchFunction function() {
        return [this](const Device& device, CommandType command, DeviceScheduler::CompletionCallback done) {
            calls.push_back({device.id(), command});
            if (throwOnDispatch) throw std::runtime_error("socket exhausted");
            if (deferred) {
                pending.push_back(std::move(done));
                return;
            }
            done(outcome(device.id(), command));
        };
    }

    void completeAll() {
        auto callbacks = std::move(pending);
        pending.clear();
        for (auto& cb : callbacks) {
            cb(CommandOutcome::ok(0, CommandType::Request1, 1.0, std::chrono::system_clock::now()));
        }
    }

    std::vector<CommandType> commandsFor(int deviceId) const {
        std::vector<CommandType> result;
        for (const auto& c : calls) {
            if (c.deviceId == deviceId) result.push_back(c.command);
        }
        return result;
    }

private:
    CommandOutcome outcome(int deviceId, CommandType command) const {
        auto now = std::chrono::system_clock::now();
        if (succeed) return CommandOutcome::ok(deviceId, command, 2.0, now);
        return CommandOutcome::failed(deviceId, command, DispatchErrorKind::Unreachable,
                                      "Connection refused", 0.5, now);
    }
};

Device continuousDevice(int id, int pollSeconds = 10, const std::string& ip = "10.0.0.5") {
    return Device::create(id, "PFDS-" + std::to_string(id), ip, 9001, "RoomA",
                          DeviceMode::Continuous, pollSeconds);
}

Device onDemandDevice(int id, int pollSeconds = 10) {
    return Device::create(id, "PFDS-" + std::to_string(id), "10.0.0.9", 9001, "",
                          DeviceMode::OnDemand, pollSeconds);
}

const auto PO = CommandType::PeriodOn;
const auto R1 = CommandType::Request1;

}  // namespace

TEST(DeviceSchedulerTest, ContinuousSendsPeriodOnBeforePolling) {
    AppContext ctx(AppConfig{});
    DeviceRegistry registry;
    registry.add(continuousDevice(1));
    FakeTransport transport;
    DeviceScheduler scheduler(ctx, registry, transport.function());

    auto t0 = Clock::now();
    scheduler.tick(t0);
    scheduler.tick(t0 + 1s);
    scheduler.tick(t0 + 5s);
    scheduler.tick(t0 + 10s);
    scheduler.tick(t0 + 11s);

    EXPECT_EQ(transport.commandsFor(1), (std::vector<CommandType>{PO, R1, R1}));
    EXPECT_EQ(ctx.metrics.dispatchCount("1", "PERIOD_ON", true), 1);
    EXPECT_EQ(ctx.metrics.dispatchCount("1", "REQUEST1", true), 2);

    auto status = scheduler.status(t0 + 11s);
    ASSERT_EQ(status.size(), 1u);
    EXPECT_TRUE(status[0].periodOnDone);
    EXPECT_EQ(status[0].dispatched, 3u);
    ASSERT_TRUE(status[0].secondsSinceRequest.has_value());
    EXPECT_DOUBLE_EQ(*status[0].secondsSinceRequest, 0.0);
}

TEST(DeviceSchedulerTest, OnDemandOnlyPolls) {
    AppContext ctx(AppConfig{});
    DeviceRegistry registry;
    registry.add(onDemandDevice(2, 5));
    FakeTransport transport;
    DeviceScheduler scheduler(ctx, registry, transport.function());

    auto t0 = Clock::now();
    for (int s = 0; s <= 10; ++s) scheduler.tick(t0 + std::chrono::seconds(s));

    EXPECT_EQ(transport.commandsFor(2), (std::vector<CommandType>{R1, R1, R1}));
}

TEST(DeviceSchedulerTest, FailedPeriodOnRetriesAfterThirtySeconds) {
    AppContext ctx(AppConfig{});
    DeviceRegistry registry;
    registry.add(continuousDevice(1));
    FakeTransport transport;
    transport.succeed = false;
    DeviceScheduler scheduler(ctx, registry, transport.function());

    auto t0 = Clock::now();
    for (int s = 0; s < 30; ++s) scheduler.tick(t0 + std::chrono::seconds(s));
    EXPECT_EQ(transport.commandsFor(1), (std::vector<CommandType>{PO}));

    scheduler.tick(t0 + 30s);
    EXPECT_EQ(transport.commandsFor(1), (std::vector<CommandType>{PO, PO}));

    // 恢复后进入轮询
    transport.succeed = true;
    scheduler.tick(t0 + 60s);
    scheduler.tick(t0 + 61s);
    EXPECT_EQ(transport.commandsFor(1), (std::vector<CommandType>{PO, PO, PO, R1}));

    auto status = scheduler.status(t0 + 61s);
    EXPECT_EQ(status[0].failures, 2u);
    EXPECT_EQ(ctx.metrics.dispatchCount("1", "PERIOD_ON", false), 2);
}

TEST(DeviceSchedulerTest, AtMostOneCommandInFlightPerDevice) {
    AppContext ctx(AppConfig{});
    DeviceRegistry registry;
    registry.add(onDemandDevice(3, 1));
    FakeTransport transport;
    transport.deferred = true;
    DeviceScheduler scheduler(ctx, registry, transport.function());

    auto t0 = Clock::now();
    scheduler.tick(t0);
    scheduler.tick(t0 + 5s);
    scheduler.tick(t0 + 20s);
    EXPECT_EQ(transport.calls.size(), 1u);
    EXPECT_EQ(scheduler.inFlightCount(), 1u);
    EXPECT_TRUE(scheduler.status(t0 + 20s)[0].inFlight);

    transport.completeAll();
    EXPECT_EQ(scheduler.inFlightCount(), 0u);

    scheduler.tick(t0 + 21s);
    EXPECT_EQ(transport.calls.size(), 2u);
}

TEST(DeviceSchedulerTest, DevicesAreDispatchedIndependently) {
    AppContext ctx(AppConfig{});
    DeviceRegistry registry;
    registry.add(onDemandDevice(4, 1));
    registry.add(onDemandDevice(5, 1));
    FakeTransport transport;
    transport.deferred = true;
    DeviceScheduler scheduler(ctx, registry, transport.function());

    scheduler.tick(Clock::now());
    EXPECT_EQ(transport.commandsFor(4).size(), 1u);
    EXPECT_EQ(transport.commandsFor(5).size(), 1u);
    EXPECT_EQ(scheduler.inFlightCount(), 2u);

    transport.completeAll();
    EXPECT_TRUE(scheduler.stop(0ms));
}

TEST(DeviceSchedulerTest, FailuresKeepDeviceScheduled) {
    AppContext ctx(AppConfig{});
    DeviceRegistry registry;
    registry.add(onDemandDevice(6, 2));
    FakeTransport transport;
    transport.succeed = false;
    DeviceScheduler scheduler(ctx, registry, transport.function());

    auto t0 = Clock::now();
    for (int s = 0; s <= 6; s += 2) scheduler.tick(t0 + std::chrono::seconds(s));

    EXPECT_EQ(transport.commandsFor(6).size(), 4u);
    EXPECT_EQ(scheduler.status(t0 + 6s)[0].failures, 4u);
    EXPECT_EQ(ctx.metrics.dispatchCount("6", "REQUEST1", false), 4);
}

TEST(DeviceSchedulerTest, ThrowingTransportCountsAsFailure) {
    AppContext ctx(AppConfig{});
    DeviceRegistry registry;
    registry.add(onDemandDevice(7, 1));
    FakeTransport transport;
    transport.throwOnDispatch = true;
    DeviceScheduler scheduler(ctx, registry, transport.function());

    EXPECT_NO_THROW(scheduler.tick(Clock::now()));
    EXPECT_EQ(scheduler.inFlightCount(), 0u);
    EXPECT_EQ(ctx.metrics.dispatchCount("7", "REQUEST1", false), 1);
}

TEST(DeviceSchedulerTest, ReconnectRearmsPeriodOn) {
    AppContext ctx(AppConfig{});
    DeviceRegistry registry;
    registry.add(continuousDevice(1, 100, "10.0.0.5"));
    registry.add(continuousDevice(2, 100, "10.0.0.6"));
    FakeTransport transport;
    DeviceScheduler scheduler(ctx, registry, transport.function());

    auto t0 = Clock::now();
    scheduler.tick(t0);        // 两台都 PERIOD_ON
    scheduler.tick(t0 + 1s);   // 两台都 REQUEST1

    // PERIOD_ON 成功不足 30 秒的重连忽略
    scheduler.rearmPeriodOn("10.0.0.5", t0 + 10s);
    scheduler.tick(t0 + 11s);
    EXPECT_EQ(transport.commandsFor(1), (std::vector<CommandType>{PO, R1}));

    scheduler.rearmPeriodOn("10.0.0.5", t0 + 40s);
    scheduler.tick(t0 + 41s);
    EXPECT_EQ(transport.commandsFor(1), (std::vector<CommandType>{PO, R1, PO}));
    EXPECT_EQ(transport.commandsFor(2), (std::vector<CommandType>{PO, R1}));
}

TEST(DeviceSchedulerTest, FollowsRegistryChanges) {
    AppContext ctx(AppConfig{});
    DeviceRegistry registry;
    registry.add(onDemandDevice(8, 1));
    FakeTransport transport;
    DeviceScheduler scheduler(ctx, registry, transport.function());

    auto t0 = Clock::now();
    scheduler.tick(t0);
    registry.remove(8);
    registry.add(onDemandDevice(9, 1));
    scheduler.tick(t0 + 1s);
    scheduler.tick(t0 + 2s);

    EXPECT_EQ(transport.commandsFor(8).size(), 1u);
    EXPECT_EQ(transport.commandsFor(9).size(), 2u);
    EXPECT_EQ(scheduler.status(t0 + 2s).size(), 1u);
}

TEST(DeviceSchedulerTest, ScheduleChangeRestartsDevice) {
    AppContext ctx(AppConfig{});
    DeviceRegistry registry;
    registry.add(onDemandDevice(10, 60));
    FakeTransport transport;
    DeviceScheduler scheduler(ctx, registry, transport.function());

    auto t0 = Clock::now();
    scheduler.tick(t0);
    registry.update(continuousDevice(10, 60));
    scheduler.tick(t0 + 1s);

    EXPECT_EQ(transport.commandsFor(10), (std::vector<CommandType>{R1, PO}));
}

TEST(DeviceSchedulerTest, PublishesOutcomeEvents) {
    AppContext ctx(AppConfig{});
    DeviceRegistry registry;
    registry.add(onDemandDevice(11, 1));
    FakeTransport transport;
    DeviceScheduler scheduler(ctx, registry, transport.function());

    std::vector<CommandOutcome> outcomes;
    ctx.eventBus.subscribe<CommandDispatched>([&outcomes](const CommandDispatched& e) {
        outcomes.push_back(e.outcome);
    });

    scheduler.tick(Clock::now());
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].success);
    EXPECT_EQ(outcomes[0].deviceId, 11);
    EXPECT_EQ(outcomes[0].toJson()["command"].asString(), "REQUEST1");
}
