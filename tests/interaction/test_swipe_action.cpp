/*
Beacon — SwipeActionController Tests
Role: Verify offset clamping, drag-delta stream and left/right action thresholds
*/
#include <gtest/gtest.h>
#include <QSignalSpy>
#include "interaction/SwipeActionController.hpp"
#include "../fixtures/pointer_samples.hpp"
#include "../fixtures/spy_gesture_sink.hpp"

using namespace samples;

class SwipeActionTest : public ::testing::Test {
protected:
    SwipeActionController swipe;
    SpyGestureSink sink;

    void SetUp() override {
        sink.attach(&swipe);
    }
};

TEST_F(SwipeActionTest, OffsetFollowsFingerWithinLimit) {
    swipe.onSampleStart(start(200, 40, 0));
    swipe.onSampleMove(move(230, 40, 10));
    EXPECT_DOUBLE_EQ(swipe.offset(), 30.0);

    swipe.onSampleMove(move(120, 40, 20));
    EXPECT_DOUBLE_EQ(swipe.offset(), -80.0);
}

TEST_F(SwipeActionTest, OffsetIsClampedToMaxOffset) {
    swipe.onSampleStart(start(0, 0, 0));
    swipe.onSampleMove(move(90, 0, 10));
    swipe.onSampleMove(move(400, 0, 20));
    EXPECT_DOUBLE_EQ(swipe.offset(), 100.0);

    // Further travel past the clamp produces no delta
    swipe.onSampleMove(move(500, 0, 30));
    ASSERT_EQ(sink.eventCount(), 2u);
    EXPECT_DOUBLE_EQ(sink.events()[0].dragDx, 90.0);
    EXPECT_DOUBLE_EQ(sink.events()[1].dragDx, 10.0);
}

TEST_F(SwipeActionTest, NegativeMaxOffsetPinsOffsetAtZero) {
    SwipeActionConfig config;
    config.maxOffset = -5.0;
    SwipeActionController pinned(config);

    pinned.onSampleStart(start(0, 0, 0));
    pinned.onSampleMove(move(80, 0, 10));
    EXPECT_DOUBLE_EQ(pinned.offset(), 0.0);
}

TEST_F(SwipeActionTest, DeltasSumToOffset) {
    swipe.onSampleStart(start(0, 0, 0));
    for (double x : { 12.0, -30.0, 45.0, 70.0, -150.0, -20.0 }) {
        swipe.onSampleMove(move(x, 0, 10));
    }

    double total = 0.0;
    for (const auto& e : sink.events()) {
        EXPECT_EQ(e.type, GestureType::DragDelta);
        total += e.dragDx;
    }
    EXPECT_DOUBLE_EQ(total, swipe.offset());
}

TEST_F(SwipeActionTest, ReleasePastThresholdTriggersLeftAction) {
    QSignalSpy leftSpy(&swipe, &SwipeActionController::leftActionTriggered);
    QSignalSpy rightSpy(&swipe, &SwipeActionController::rightActionTriggered);

    swipe.onSampleStart(start(0, 0, 0));
    swipe.onSampleMove(move(60, 0, 10));
    swipe.onSampleEnd(end(60, 0, 20));

    EXPECT_EQ(leftSpy.count(), 1);
    EXPECT_EQ(rightSpy.count(), 0);
    EXPECT_DOUBLE_EQ(swipe.offset(), 0.0);
    EXPECT_FALSE(swipe.isSwiping());
}

TEST_F(SwipeActionTest, ReleasePastNegativeThresholdTriggersRightAction) {
    QSignalSpy leftSpy(&swipe, &SwipeActionController::leftActionTriggered);
    QSignalSpy rightSpy(&swipe, &SwipeActionController::rightActionTriggered);

    swipe.onSampleStart(start(100, 0, 0));
    swipe.onSampleMove(move(30, 0, 10));
    swipe.onSampleEnd(end(30, 0, 20));

    EXPECT_EQ(leftSpy.count(), 0);
    EXPECT_EQ(rightSpy.count(), 1);
}

TEST_F(SwipeActionTest, ReleaseAtThresholdDoesNothing) {
    QSignalSpy leftSpy(&swipe, &SwipeActionController::leftActionTriggered);
    QSignalSpy offsetSpy(&swipe, &SwipeActionController::offsetChanged);

    swipe.onSampleStart(start(0, 0, 0));
    swipe.onSampleMove(move(50, 0, 10));
    swipe.onSampleEnd(end(50, 0, 20));

    EXPECT_EQ(leftSpy.count(), 0);
    ASSERT_EQ(offsetSpy.count(), 2);
    EXPECT_DOUBLE_EQ(offsetSpy.at(1).at(0).toDouble(), 0.0);
}

TEST_F(SwipeActionTest, CancelResetsWithoutAction) {
    QSignalSpy leftSpy(&swipe, &SwipeActionController::leftActionTriggered);

    swipe.onSampleStart(start(0, 0, 0));
    swipe.onSampleMove(move(90, 0, 10));
    swipe.onSampleCancel(cancel(90, 0, 20));

    EXPECT_EQ(leftSpy.count(), 0);
    EXPECT_DOUBLE_EQ(swipe.offset(), 0.0);

    // Moves after cancel belong to no session
    swipe.onSampleMove(move(150, 0, 30));
    EXPECT_DOUBLE_EQ(swipe.offset(), 0.0);
}
