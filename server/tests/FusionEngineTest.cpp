#include "modules/fusion/FusionEngine.hpp"
#include "common/protocol/wire/Wire.Builder.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

using namespace std::chrono_literals;

namespace {

using Clock = FusionEngine::Clock;

AppConfig configWithHold(double holdSeconds) {
    AppConfig cfg;
    cfg.fusion.holdSeconds = holdSeconds;
    return cfg;
}

wire::ThermalFrame frameWithHotCells(int hotCells, double hot, double ambient = 22.0) {
    wire::ThermalFrame frame;
    frame.celsius.assign(Constants::THERMAL_CELLS, ambient);
    for (int i = 0; i < hotCells; ++i) frame.celsius[static_cast<size_t>(i)] = hot;
    frame.raw.assign(Constants::THERMAL_CELLS, 0);
    return frame;
}

wire::SensorSample sample(int adc1, int adc2, bool flame) {
    wire::SensorSample s;
    s.adc1 = adc1;
    s.adc2 = adc2;
    s.flameFlag = flame;
    return s;
}

}  // namespace

// ==================== 判定规则 ====================

TEST(FusionEngineTest, SingleSourceDoesNotAlarm) {
    AppContext ctx(AppConfig{});
    FusionEngine engine(ctx);

    auto result = engine.fuse("RoomA", FusionInputs{45.0, 100.0, 5.0, 0.0, 0.1}, Clock::now());
    EXPECT_FALSE(result.alarm);
    EXPECT_EQ(result.sourcesTriggered, 1);
    EXPECT_EQ(result.contributing.count(SensorSource::Thermal), 1u);
}

TEST(FusionEngineTest, TwoSourcesRaiseAlarmWithMeanConfidence) {
    AppContext ctx(AppConfig{});
    FusionEngine engine(ctx);

    // 温度 60/(2*40)=0.75，烟雾 50/(2*25)=1.0 → 均值 0.875
    auto result = engine.fuse("RoomA", FusionInputs{60.0, 0.0, 50.0, 0.0, 0.0}, Clock::now());
    EXPECT_TRUE(result.alarm);
    EXPECT_EQ(result.sourcesTriggered, 2);
    EXPECT_NEAR(result.confidence, 0.875, 1e-9);
    EXPECT_EQ(ctx.metrics.fusionAlarms("RoomA"), 1);
}

TEST(FusionEngineTest, ThresholdIsInclusive) {
    AppContext ctx(AppConfig{});
    FusionEngine engine(ctx);

    auto result = engine.fuse("RoomA", FusionInputs{40.0, 400.0, 0.0, 0.0, 0.0}, Clock::now());
    EXPECT_TRUE(result.alarm);
    EXPECT_NEAR(result.confidence, 0.5, 1e-9);
}

TEST(FusionEngineTest, HoldFreezesResultUntilExpiry) {
    AppContext ctx(configWithHold(10.0));
    FusionEngine engine(ctx);
    auto t0 = Clock::now();

    ASSERT_TRUE(engine.fuse("RoomA", FusionInputs{60.0, 0.0, 50.0, 0.0, 0.0}, t0).alarm);

    auto during = engine.fuse("RoomA", FusionInputs{}, t0 + 5s);
    EXPECT_TRUE(during.alarm);
    EXPECT_TRUE(during.held);

    auto after = engine.fuse("RoomA", FusionInputs{}, t0 + 11s);
    EXPECT_FALSE(after.alarm);
    EXPECT_FALSE(after.held);
}

TEST(FusionEngineTest, PublishesRaiseAndClearOnce) {
    AppContext ctx(configWithHold(0.0));
    FusionEngine engine(ctx);

    int raised = 0;
    int cleared = 0;
    ctx.eventBus.subscribe<AlarmRaised>([&raised](const AlarmRaised& e) {
        EXPECT_EQ(e.aggregateId, "RoomB");
        ++raised;
    });
    ctx.eventBus.subscribe<AlarmCleared>([&cleared](const AlarmCleared&) { ++cleared; });

    auto t0 = Clock::now();
    FusionInputs hot{60.0, 0.0, 50.0, 0.0, 0.0};
    engine.fuse("RoomB", hot, t0);
    engine.fuse("RoomB", hot, t0 + 1s);
    engine.fuse("RoomB", FusionInputs{}, t0 + 2s);
    engine.fuse("RoomB", FusionInputs{}, t0 + 3s);

    EXPECT_EQ(raised, 1);
    EXPECT_EQ(cleared, 1);
    EXPECT_EQ(ctx.metrics.fusionInvocations("RoomB"), 4);
}

TEST(FusionEngineTest, LocationsAreIndependent) {
    AppContext ctx(AppConfig{});
    FusionEngine engine(ctx);
    auto now = Clock::now();

    engine.fuse("RoomA", FusionInputs{60.0, 0.0, 50.0, 0.0, 0.0}, now);
    auto other = engine.fuse("RoomB", FusionInputs{}, now);

    EXPECT_FALSE(other.alarm);
    EXPECT_EQ(engine.locationCount(), 2u);
    EXPECT_TRUE(engine.snapshot("RoomA", now)->alarmActive);
    EXPECT_FALSE(engine.snapshot("RoomB", now)->alarmActive);
    EXPECT_FALSE(engine.snapshot("RoomC", now).has_value());
}

// ==================== 记录接入 ====================

TEST(FusionEngineTest, IngestCombinesFrameAndSensor) {
    AppContext ctx(configWithHold(0.0));
    FusionEngine engine(ctx);
    auto now = Clock::now();

    auto afterFrame = engine.ingest("RoomA", frameWithHotCells(4, 65.0), now);
    ASSERT_TRUE(afterFrame.has_value());
    EXPECT_FALSE(afterFrame->alarm);
    EXPECT_EQ(afterFrame->contributing.count(SensorSource::Thermal), 1u);

    // MPY30=1 → flame_pct=100
    auto afterSample = engine.ingest("RoomA", sample(0, 0, true), now + 1s);
    ASSERT_TRUE(afterSample.has_value());
    EXPECT_TRUE(afterSample->alarm);
    EXPECT_EQ(afterSample->contributing.count(SensorSource::Flame), 1u);

    auto snap = engine.snapshot("RoomA", now + 1s);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->framesSeen, 1u);
    EXPECT_EQ(snap->samplesSeen, 1u);
    EXPECT_DOUBLE_EQ(snap->flamePct, 100.0);
    EXPECT_TRUE(snap->flameDetected);
    EXPECT_DOUBLE_EQ(snap->maxTemperature, 65.0);
}

TEST(FusionEngineTest, IdentityRecordsAreIgnored) {
    AppContext ctx(AppConfig{});
    FusionEngine engine(ctx);

    EXPECT_FALSE(engine.ingest("RoomA", wire::IdentityRecord{"SIM001", ""}).has_value());
    EXPECT_EQ(engine.locationCount(), 0u);
}

TEST(FusionEngineTest, HotCellsLatchThermalThroughDecay) {
    AppContext ctx(configWithHold(0.0));   // 衰减默认 5 秒
    FusionEngine engine(ctx);
    auto t0 = Clock::now();

    engine.ingest("RoomA", frameWithHotCells(2, 70.0), t0);

    // 下一帧已经冷却，但热点仍在衰减窗口内
    auto cool = engine.ingest("RoomA", frameWithHotCells(0, 0.0), t0 + 2s);
    EXPECT_EQ(cool->contributing.count(SensorSource::Thermal), 1u);
    EXPECT_EQ(engine.snapshot("RoomA", t0 + 2s)->hotCellCount, 2);

    auto expired = engine.ingest("RoomA", frameWithHotCells(0, 0.0), t0 + 6s);
    EXPECT_EQ(expired->contributing.count(SensorSource::Thermal), 0u);
    EXPECT_EQ(engine.snapshot("RoomA", t0 + 6s)->hotCellCount, 0);
}

TEST(FusionEngineTest, VisionConfidenceIsValidated) {
    AppContext ctx(AppConfig{});
    FusionEngine engine(ctx);

    EXPECT_THROW(engine.setVisionConfidence("RoomA", 1.5), ValidationException);
    EXPECT_THROW(engine.setVisionConfidence("RoomA", -0.1), ValidationException);

    auto result = engine.setVisionConfidence("RoomA", 0.9);
    EXPECT_EQ(result.contributing.count(SensorSource::Vision), 1u);
    EXPECT_FALSE(result.alarm);
}

// ==================== 热点网格 ====================

TEST(HotCellGridTest, DeadlineOnlyMovesForward) {
    HotCellGrid grid;
    auto t0 = HotCellGrid::Clock::now();
    std::vector<double> frame(Constants::THERMAL_CELLS, 20.0);
    frame[10] = 50.0;

    EXPECT_EQ(grid.update(frame, 40.0, t0, 5s), 1);
    EXPECT_EQ(grid.decayDeadline(10), t0 + 5s);

    // 更短的衰减不会把截止时间往回拉
    grid.update(frame, 40.0, t0 + 1s, 1s);
    EXPECT_EQ(grid.decayDeadline(10), t0 + 5s);

    EXPECT_TRUE(grid.isHot(10, t0 + 5s));
    EXPECT_FALSE(grid.isHot(10, t0 + 5s + 1ms));
    EXPECT_EQ(grid.hotCells(t0 + 3s), std::vector<int>{10});
}

// ==================== 置信度策略 ====================

TEST(ConfidencePolicyTest, PoliciesAggregateDifferently) {
    std::vector<SourceReading> readings = {
        {SensorSource::Thermal, 80.0, 40.0},   // 1.0
        {SensorSource::Smoke, 25.0, 25.0},     // 0.5
    };

    EXPECT_NEAR(MeanExceedancePolicy().aggregate(readings), 0.75, 1e-9);
    EXPECT_NEAR(MaxExceedancePolicy().aggregate(readings), 1.0, 1e-9);

    FusionConfig cfg;
    cfg.confidencePolicy = "weighted";
    auto weighted = makeConfidencePolicy(cfg);
    // 0.4 × 1.0 + 0.5 × 0.5
    EXPECT_NEAR(weighted->aggregate(readings), 0.65, 1e-9);
    EXPECT_EQ(weighted->name(), "weighted");
}

TEST(ConfidencePolicyTest, UnknownPolicyIsRejected) {
    FusionConfig cfg;
    cfg.confidencePolicy = "median";
    EXPECT_THROW(makeConfidencePolicy(cfg), ValidationException);
}

TEST(ConfidencePolicyTest, EngineAcceptsReplacementPolicy) {
    AppContext ctx(AppConfig{});
    FusionEngine engine(ctx, std::make_unique<MaxExceedancePolicy>());

    auto result = engine.fuse("RoomA", FusionInputs{80.0, 0.0, 25.0, 0.0, 0.0}, Clock::now());
    EXPECT_NEAR(result.confidence, 1.0, 1e-9);
}

// ==================== 传感器换算 ====================

TEST(SensorConversionTest, AdcScalesToPercent) {
    EXPECT_DOUBLE_EQ(adcToPercent(0), 0.0);
    EXPECT_DOUBLE_EQ(adcToPercent(4095), 100.0);
    EXPECT_DOUBLE_EQ(adcToPercent(5000), 100.0);
}

TEST(SensorConversionTest, GasCurveIsMonotonic) {
    GasSensorModel model;
    EXPECT_DOUBLE_EQ(model.ppm(0), 0.0);
    EXPECT_LT(model.ppm(500), model.ppm(1500));
    EXPECT_LT(model.ppm(1500), model.ppm(3000));
    EXPECT_GE(model.resistance(4095), 0.1);
}
