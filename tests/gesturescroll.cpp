#include "axisframe.hpp"
#include "gesturescroll.hpp"
#include "testutils.hpp"
#include <gtest/gtest.h>
#include <cmath>

// 6.25 px every 0.0625 s is an exact 100 px/s
constexpr double STEP_TIME  = 0.0625;
constexpr double STEP_DELTA = 6.25;

class GestureScrollEngineTest : public testing::Test {
  protected:
    CManualFrameClock    clock;
    CRecordingSink       sink;
    SVector              pointer{500.0, 200.0};
    CGestureScrollEngine engine{clock, sink, [this]() { return pointer; }};

    // Began followed by `changes` Changed events, all at STEP_TIME intervals
    void swipe(const SVector& step, int changes = 5) {
        engine.feed(step, INPUT_PHASE_BEGAN);
        for (int i = 0; i < changes; ++i) {
            clock.advance(STEP_TIME);
            engine.feed(step, INPUT_PHASE_CHANGED);
        }
    }

    void swipeAndRelease(const SVector& step, int changes = 5) {
        swipe(step, changes);
        clock.advance(STEP_TIME);
        engine.feed({}, INPUT_PHASE_ENDED);
    }

    std::vector<SScrollEventDescriptor> momentumEvents() const {
        std::vector<SScrollEventDescriptor> out;
        for (const auto& e : sink.events) {
            if (e.momentumPhase != MOMENTUM_PHASE_NONE)
                out.push_back(e);
        }
        return out;
    }
};

TEST(GestureScrollVectors, LineAndGestureScaling) {
    const SVector line = lineVectorFromPointVector({10.0, 0.0}, 10.0);
    EXPECT_DOUBLE_EQ(line.x, 1.0);
    EXPECT_DOUBLE_EQ(line.y, 0.0);

    const SVector gesture = gestureVectorFromPointVector({10.0, -4.0}, 1.15);
    EXPECT_NEAR(gesture.x, 11.5, 1e-12);
    EXPECT_NEAR(gesture.y, -4.6, 1e-12);
}

TEST(GestureScrollVectors, InitialVelocityTransform) {
    const SVector identity = initialVelocityFromExitVelocity({-40.0, 90.0}, 1.0);
    EXPECT_DOUBLE_EQ(identity.x, -40.0);
    EXPECT_DOUBLE_EQ(identity.y, 90.0);

    const SVector curved = initialVelocityFromExitVelocity({-4.0, 9.0}, 0.5);
    EXPECT_DOUBLE_EQ(curved.x, -2.0);
    EXPECT_DOUBLE_EQ(curved.y, 3.0);
}

TEST(GestureScrollVectors, UnitVectorOfZeroIsZero) {
    EXPECT_TRUE(unitVector({}).isZero());
    EXPECT_DOUBLE_EQ(magnitudeOfVector(unitVector({3.0, 4.0})), 1.0);
}

TEST_F(GestureScrollEngineTest, BeganEmitsQuantizedVectors) {
    engine.feed({10.0, 0.0}, INPUT_PHASE_BEGAN);

    ASSERT_EQ(sink.events.size(), 1u);
    const auto& e = sink.events[0];
    EXPECT_EQ(e.phase, INPUT_PHASE_BEGAN);
    EXPECT_EQ(e.momentumPhase, MOMENTUM_PHASE_NONE);
    EXPECT_EQ(e.point, (SVector{10.0, 0.0}));
    EXPECT_EQ(e.line, (SVector{1.0, 0.0}));
    EXPECT_EQ(e.gesture.x, std::round(e.gesture.x));
    EXPECT_NEAR(e.gesture.x, 11.5, 0.5 + 1e-9);
    EXPECT_EQ(e.location, pointer);
    EXPECT_EQ(engine.state(), CGestureScrollEngine::STATE_ACTIVE);
}

TEST_F(GestureScrollEngineTest, ChangedConservesFractionalDeltas) {
    engine.feed({0.4, 0.0}, INPUT_PHASE_BEGAN);
    for (int i = 0; i < 9; ++i) {
        clock.advance(0.01);
        engine.feed({0.4, 0.0}, INPUT_PHASE_CHANGED);
    }

    double pointSum = 0.0;
    for (const auto& e : sink.events) {
        EXPECT_EQ(e.point.x, std::round(e.point.x));
        pointSum += e.point.x;
    }
    // 10 * 0.4
    EXPECT_NEAR(pointSum, 4.0, 0.5 + 1e-9);
    EXPECT_EQ(sink.countPhase(INPUT_PHASE_CHANGED), 9u);
}

TEST_F(GestureScrollEngineTest, ZeroDeltaIsRejected) {
    engine.feed({}, INPUT_PHASE_BEGAN);
    EXPECT_TRUE(sink.events.empty());
    EXPECT_EQ(engine.state(), CGestureScrollEngine::STATE_IDLE);

    engine.feed({1.0, 0.0}, INPUT_PHASE_BEGAN);
    engine.feed({}, INPUT_PHASE_CHANGED);
    EXPECT_EQ(sink.events.size(), 1u);
}

TEST_F(GestureScrollEngineTest, ChangedWithoutBeganStartsSession) {
    engine.feed({3.0, 0.0}, INPUT_PHASE_CHANGED);

    ASSERT_EQ(sink.events.size(), 1u);
    EXPECT_EQ(sink.events[0].phase, INPUT_PHASE_BEGAN);
    EXPECT_EQ(engine.state(), CGestureScrollEngine::STATE_ACTIVE);
}

TEST_F(GestureScrollEngineTest, OriginIsReadAtBegan) {
    engine.feed({1.0, 1.0}, INPUT_PHASE_BEGAN);
    pointer = {10.0, 20.0};
    clock.advance(STEP_TIME);
    engine.feed({1.0, 1.0}, INPUT_PHASE_CHANGED);

    EXPECT_EQ(engine.origin(), (SVector{500.0, 200.0}));
    EXPECT_EQ(sink.events.back().location, (SVector{10.0, 20.0}));
}

TEST_F(GestureScrollEngineTest, NoMomentumAfterLongPause) {
    swipe({STEP_DELTA, 0.0});
    const size_t before = sink.events.size();

    clock.advance(0.5);
    engine.feed({}, INPUT_PHASE_ENDED);

    ASSERT_EQ(sink.events.size(), before + 1);
    const auto& e = sink.events.back();
    EXPECT_EQ(e.phase, INPUT_PHASE_ENDED);
    EXPECT_EQ(e.momentumPhase, MOMENTUM_PHASE_NONE);
    EXPECT_TRUE(e.point.isZero());
    EXPECT_TRUE(e.line.isZero());
    EXPECT_TRUE(e.gesture.isZero());

    EXPECT_FALSE(engine.isMomentumRunning());
    EXPECT_EQ(clock.runUntilIdle(), 0);
    EXPECT_EQ(sink.countMomentum(), 0u);
    EXPECT_EQ(sink.events.size(), before + 1);
}

TEST_F(GestureScrollEngineTest, NoMomentumWithoutChanged) {
    engine.feed({STEP_DELTA, 0.0}, INPUT_PHASE_BEGAN);
    clock.advance(0.01);
    engine.feed({}, INPUT_PHASE_ENDED);

    EXPECT_EQ(sink.events.size(), 2u);
    EXPECT_FALSE(engine.isMomentumRunning());
    EXPECT_EQ(clock.runUntilIdle(), 0);
    EXPECT_EQ(sink.countMomentum(), 0u);
}

TEST_F(GestureScrollEngineTest, EndedWithoutBeganOnlyEnds) {
    engine.feed({}, INPUT_PHASE_ENDED);

    ASSERT_EQ(sink.events.size(), 1u);
    EXPECT_EQ(sink.events[0].phase, INPUT_PHASE_ENDED);
    EXPECT_FALSE(engine.isMomentumRunning());
    EXPECT_EQ(engine.state(), CGestureScrollEngine::STATE_IDLE);
}

TEST_F(GestureScrollEngineTest, NoMomentumBelowStopSpeed) {
    // 0.05 px per 0.0625 s = 0.8 px/s
    swipeAndRelease({0.05, 0.0});

    EXPECT_EQ(sink.countPhase(INPUT_PHASE_ENDED), 1u);
    EXPECT_FALSE(engine.isMomentumRunning());
    EXPECT_EQ(clock.runUntilIdle(), 0);
    EXPECT_EQ(sink.countMomentum(), 0u);
}

TEST_F(GestureScrollEngineTest, MomentumRunsDragCurve) {
    swipeAndRelease({STEP_DELTA, 0.0});

    ASSERT_TRUE(engine.isMomentumRunning());
    EXPECT_EQ(engine.state(), CGestureScrollEngine::STATE_MOMENTUM);

    const CDragCurve* curve = engine.momentumCurve();
    ASSERT_NE(curve, nullptr);
    EXPECT_NEAR(curve->params().initialSpeed, 100.0, 1e-9);
    EXPECT_GT(curve->duration(), 0.0);

    const CDragCurve expected(SDragCurveParams{.coefficient = 30.0, .exponent = 0.7, .initialSpeed = 100.0, .stopSpeed = 1.0});
    EXPECT_NEAR(curve->totalDistance(), expected.totalDistance(), 1e-6);

    EXPECT_GT(clock.runUntilIdle(), 0);
    EXPECT_FALSE(engine.isMomentumRunning());
    EXPECT_EQ(engine.state(), CGestureScrollEngine::STATE_IDLE);

    const auto momentum = momentumEvents();
    ASSERT_GE(momentum.size(), 2u);
    EXPECT_EQ(momentum.front().momentumPhase, MOMENTUM_PHASE_BEGIN);
    EXPECT_EQ(momentum.back().momentumPhase, MOMENTUM_PHASE_END);

    double sumX = 0.0;
    for (size_t i = 0; i < momentum.size(); ++i) {
        const auto& e = momentum[i];
        EXPECT_EQ(e.phase, INPUT_PHASE_UNDEFINED);
        EXPECT_TRUE(e.gesture.isZero());
        EXPECT_EQ(e.point.y, 0.0);
        EXPECT_GE(e.point.x, 0.0);
        if (i > 0 && i + 1 < momentum.size())
            EXPECT_EQ(e.momentumPhase, MOMENTUM_PHASE_CONTINUE);
        sumX += e.point.x;
    }
    EXPECT_LE(std::abs(sumX - expected.totalDistance()), 1.0);
}

TEST_F(GestureScrollEngineTest, EndedFeedsLastSmoothedValuesBack) {
    engine.feed({1.0, 0.0}, INPUT_PHASE_BEGAN);
    for (double dx : {2.0, 4.0, 6.0, 8.0, 10.0, 12.0}) {
        clock.advance(0.03125);
        engine.feed({dx, 0.0}, INPUT_PHASE_CHANGED);
    }
    clock.advance(0.0625);
    engine.feed({}, INPUT_PHASE_ENDED);

    ASSERT_TRUE(engine.isMomentumRunning());

    // distances: mean of {4..12} is 8, re-fed once gives mean of {6, 8, 10, 12, 8} = 8.8
    // times: four 0.03125 gaps and the 0.0625 gap before the end give 0.0375
    EXPECT_NEAR(engine.momentumCurve()->params().initialSpeed, 8.8 / 0.0375, 1e-9);
}

TEST_F(GestureScrollEngineTest, DiagonalFramesKeepSpeedAndDirection) {
    CAxisFrame frame;
    uint32_t   timeMs = 1000;

    // per frame: a vertical and a horizontal axis event with one timestamp
    for (int i = 0; i < 6; ++i) {
        if (i > 0)
            clock.advance(STEP_TIME);
        EXPECT_FALSE(frame.add(timeMs, {0.0, STEP_DELTA}).has_value());
        EXPECT_FALSE(frame.add(timeMs, {STEP_DELTA, 0.0}).has_value());
        const auto delta = frame.flush();
        ASSERT_TRUE(delta.has_value());
        engine.feed(*delta, i == 0 ? INPUT_PHASE_BEGAN : INPUT_PHASE_CHANGED);
        timeMs += 62;
    }
    clock.advance(STEP_TIME);
    engine.feed({}, INPUT_PHASE_ENDED);

    ASSERT_TRUE(engine.isMomentumRunning());
    EXPECT_NEAR(engine.momentumCurve()->params().initialSpeed, 100.0 * std::sqrt(2.0), 1e-9);

    clock.runUntilIdle();
    double sumX = 0.0, sumY = 0.0;
    for (const auto& e : momentumEvents()) {
        sumX += e.point.x;
        sumY += e.point.y;
    }
    EXPECT_EQ(sumX, sumY);
}

TEST_F(GestureScrollEngineTest, EmittedEventsAreInputOrMomentum) {
    swipeAndRelease({STEP_DELTA, -STEP_DELTA});
    clock.tick();
    engine.stop();
    engine.feed({}, INPUT_PHASE_ENDED);

    ASSERT_GT(sink.countMomentum(), 0u);
    for (const auto& e : sink.events)
        EXPECT_TRUE(isValidScrollEvent(e));
}

TEST(GestureScrollVectors, ScrollEventValidity) {
    SScrollEventDescriptor e;
    e.phase         = INPUT_PHASE_CHANGED;
    e.momentumPhase = MOMENTUM_PHASE_NONE;
    EXPECT_TRUE(isValidScrollEvent(e));

    e.phase         = INPUT_PHASE_UNDEFINED;
    e.momentumPhase = MOMENTUM_PHASE_CONTINUE;
    EXPECT_TRUE(isValidScrollEvent(e));

    e.phase = INPUT_PHASE_ENDED;
    EXPECT_FALSE(isValidScrollEvent(e));
}

TEST_F(GestureScrollEngineTest, MomentumFollowsSwipeDirection) {
    // (-60, 80) px per step => (-960, 1280) px/s
    swipeAndRelease({-60.0, 80.0});
    ASSERT_TRUE(engine.isMomentumRunning());

    const double total = engine.momentumCurve()->totalDistance();
    clock.runUntilIdle();

    double sumX = 0.0, sumY = 0.0, sumLineY = 0.0;
    for (const auto& e : momentumEvents()) {
        sumX += e.point.x;
        sumY += e.point.y;
        sumLineY += e.line.y;
    }

    EXPECT_NEAR(sumX, -0.6 * total, 1.5);
    EXPECT_NEAR(sumY, 0.8 * total, 1.5);
    EXPECT_NEAR(sumLineY, sumY / 10.0, 1.5);
}

TEST_F(GestureScrollEngineTest, BeganStopsRunningMomentum) {
    swipeAndRelease({STEP_DELTA, 0.0});
    ASSERT_TRUE(engine.isMomentumRunning());
    clock.tick();
    clock.tick();
    const size_t before = sink.events.size();

    engine.feed({3.0, 0.0}, INPUT_PHASE_BEGAN);

    EXPECT_FALSE(engine.isMomentumRunning());
    ASSERT_EQ(sink.events.size(), before + 2);
    EXPECT_EQ(sink.events[before].phase, INPUT_PHASE_UNDEFINED);
    EXPECT_EQ(sink.events[before].momentumPhase, MOMENTUM_PHASE_END);
    EXPECT_EQ(sink.events[before + 1].phase, INPUT_PHASE_BEGAN);

    // nothing from the old run
    EXPECT_EQ(clock.runUntilIdle(), 0);
    EXPECT_EQ(sink.events.size(), before + 2);
}

TEST_F(GestureScrollEngineTest, StopIsIdempotent) {
    swipeAndRelease({STEP_DELTA, 0.0});
    ASSERT_TRUE(engine.isMomentumRunning());
    clock.tick();
    const size_t before = sink.events.size();

    engine.stop();
    ASSERT_EQ(sink.events.size(), before + 1);
    const auto& e = sink.events.back();
    EXPECT_EQ(e.phase, INPUT_PHASE_UNDEFINED);
    EXPECT_EQ(e.momentumPhase, MOMENTUM_PHASE_END);
    EXPECT_TRUE(e.point.isZero());
    EXPECT_TRUE(e.line.isZero());
    EXPECT_TRUE(e.gesture.isZero());

    engine.stop();
    EXPECT_EQ(sink.events.size(), before + 1);
    EXPECT_EQ(clock.runUntilIdle(), 0);
}

TEST_F(GestureScrollEngineTest, StopWhenIdleDoesNothing) {
    engine.stop();
    EXPECT_TRUE(sink.events.empty());

    swipe({STEP_DELTA, 0.0});
    const size_t before = sink.events.size();
    engine.stop();
    EXPECT_EQ(sink.events.size(), before);
}

TEST_F(GestureScrollEngineTest, StopAfterMomentumFinishedDoesNothing) {
    swipeAndRelease({STEP_DELTA, 0.0});
    clock.runUntilIdle();
    const size_t before = sink.events.size();

    engine.stop();
    EXPECT_EQ(sink.events.size(), before);
}

TEST_F(GestureScrollEngineTest, ConfigAppliesFromNextSession) {
    engine.feed({10.0, 0.0}, INPUT_PHASE_BEGAN);

    SGestureScrollConfig config;
    config.pixelsPerLine = 5.0;
    engine.setConfig(config);

    clock.advance(STEP_TIME);
    engine.feed({10.0, 0.0}, INPUT_PHASE_CHANGED);
    EXPECT_EQ(sink.events.back().line.x, 1.0);

    clock.advance(STEP_TIME);
    engine.feed({}, INPUT_PHASE_ENDED);
    engine.stop();

    engine.feed({10.0, 0.0}, INPUT_PHASE_BEGAN);
    EXPECT_EQ(sink.events.back().line.x, 2.0);
    EXPECT_DOUBLE_EQ(engine.config().pixelsPerLine, 5.0);
}

TEST_F(GestureScrollEngineTest, MaxGapIsConfigurable) {
    SGestureScrollConfig config;
    config.maxMomentumStartGap = 1.0;
    engine.setConfig(config);

    swipe({STEP_DELTA, 0.0});
    clock.advance(0.5);
    engine.feed({}, INPUT_PHASE_ENDED);

    EXPECT_TRUE(engine.isMomentumRunning());
}

using GestureScrollEngineDeathTest = GestureScrollEngineTest;

TEST_F(GestureScrollEngineDeathTest, UndefinedInputPhaseAborts) {
    EXPECT_DEATH(engine.feed({1.0, 0.0}, INPUT_PHASE_UNDEFINED), "");
    EXPECT_DEATH(engine.feed({1.0, 0.0}, static_cast<eInputPhase>(42)), "");
}
