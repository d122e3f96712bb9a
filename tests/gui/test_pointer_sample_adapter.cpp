/*
Beacon — PointerSampleAdapter / InteractionSurface Tests
Role: Verify Qt mouse and touch events become the right PointerSamples and reach the router,
      and that the Qt probe answers on a headless platform
Testing Strategy: Synthetic QMouseEvent/QTouchEvent instances delivered directly, VirtualClockScheduler as clock
*/
#include <gtest/gtest.h>
#include <QEvent>
#include <QMouseEvent>
#include <QPointingDevice>
#include <QSignalSpy>
#include <QTest>
#include <QTouchEvent>
#include <memory>
#include <vector>
#include "InteractionSurface.hpp"
#include "PointerSampleAdapter.hpp"
#include "QtPlatformProbe.hpp"
#include "interaction/GestureRecognizer.hpp"
#include "interaction/InteractionRouter.hpp"
#include "scheduling/VirtualClockScheduler.hpp"

namespace {

QMouseEvent mouse(QEvent::Type type, QPointF pos, Qt::MouseButton button = Qt::LeftButton,
                  const QPointingDevice* device = QPointingDevice::primaryPointingDevice()) {
    const Qt::MouseButtons held = type == QEvent::MouseButtonRelease ? Qt::NoButton : Qt::MouseButtons(button);
    return QMouseEvent(type, pos, pos, button, held, Qt::NoModifier, device);
}

QPointingDevice* touchScreen() {
    static QPointingDevice* device = QTest::createTouchDevice();
    return device;
}

QTouchEvent touch(QEvent::Type type, const QList<QEventPoint>& points) {
    return QTouchEvent(type, touchScreen(), Qt::NoModifier, points);
}

std::vector<PointerPhase> phasesOf(const std::vector<PointerSample>& samples) {
    std::vector<PointerPhase> phases;
    for (const auto& s : samples) phases.push_back(s.phase);
    return phases;
}

} // namespace

// =============================================================================
// Mouse
// =============================================================================

class PointerSampleAdapterTest : public ::testing::Test {
protected:
    VirtualClockScheduler clock{5000};
    PointerSampleAdapter adapter{clock};
};

TEST_F(PointerSampleAdapterTest, LeftButtonSessionMapsToStartMoveEnd) {
    auto press = mouse(QEvent::MouseButtonPress, QPointF(10, 20));
    auto pressed = adapter.translate(&press);
    ASSERT_EQ(pressed.size(), 1u);
    EXPECT_EQ(pressed[0].phase, PointerPhase::Start);
    EXPECT_DOUBLE_EQ(pressed[0].x, 10.0);
    EXPECT_DOUBLE_EQ(pressed[0].y, 20.0);
    EXPECT_EQ(pressed[0].t, 5000);
    EXPECT_EQ(pressed[0].pointerId, 0);
    EXPECT_TRUE(adapter.hasActiveContact());

    clock.advanceBy(16);
    auto move = mouse(QEvent::MouseMove, QPointF(30, 20), Qt::NoButton);
    auto moved = adapter.translate(&move);
    ASSERT_EQ(moved.size(), 1u);
    EXPECT_EQ(moved[0].phase, PointerPhase::Move);
    EXPECT_EQ(moved[0].t, 5016);

    auto release = mouse(QEvent::MouseButtonRelease, QPointF(40, 22));
    auto released = adapter.translate(&release);
    ASSERT_EQ(released.size(), 1u);
    EXPECT_EQ(released[0].phase, PointerPhase::End);
    EXPECT_FALSE(adapter.hasActiveContact());
}

TEST_F(PointerSampleAdapterTest, HoverAndOtherButtonsAreIgnored) {
    auto hover = mouse(QEvent::MouseMove, QPointF(5, 5), Qt::NoButton);
    EXPECT_TRUE(adapter.translate(&hover).empty());

    auto right = mouse(QEvent::MouseButtonPress, QPointF(5, 5), Qt::RightButton);
    EXPECT_TRUE(adapter.translate(&right).empty());

    auto strayRelease = mouse(QEvent::MouseButtonRelease, QPointF(5, 5));
    EXPECT_TRUE(adapter.translate(&strayRelease).empty());
}

TEST_F(PointerSampleAdapterTest, MouseSynthesizedFromTouchIsDropped) {
    auto press = mouse(QEvent::MouseButtonPress, QPointF(5, 5), Qt::LeftButton, touchScreen());
    EXPECT_TRUE(adapter.translate(&press).empty());
    EXPECT_FALSE(adapter.hasActiveContact());
}

TEST_F(PointerSampleAdapterTest, LeaveCancelsOpenMouseSession) {
    auto press = mouse(QEvent::MouseButtonPress, QPointF(12, 14));
    adapter.translate(&press);

    QEvent leave(QEvent::Leave);
    auto cancelled = adapter.translate(&leave);
    ASSERT_EQ(cancelled.size(), 1u);
    EXPECT_EQ(cancelled[0].phase, PointerPhase::Cancel);
    EXPECT_DOUBLE_EQ(cancelled[0].x, 12.0);

    // Nothing left to cancel
    EXPECT_TRUE(adapter.translate(&leave).empty());
}

TEST_F(PointerSampleAdapterTest, UnrelatedEventsProduceNothing) {
    QEvent show(QEvent::Show);
    EXPECT_TRUE(adapter.translate(&show).empty());
    EXPECT_TRUE(adapter.translate(nullptr).empty());
}

// =============================================================================
// Touch
// =============================================================================

TEST_F(PointerSampleAdapterTest, TouchPhasesCarryPointId) {
    auto begin = touch(QEvent::TouchBegin, { QEventPoint(3, QEventPoint::State::Pressed, QPointF(1, 1), QPointF(1, 1)) });
    auto started = adapter.translate(&begin);
    ASSERT_EQ(started.size(), 1u);
    EXPECT_EQ(started[0].phase, PointerPhase::Start);
    EXPECT_EQ(started[0].pointerId, 3);

    auto update = touch(QEvent::TouchUpdate, { QEventPoint(3, QEventPoint::State::Updated, QPointF(1, 9), QPointF(1, 9)) });
    EXPECT_EQ(phasesOf(adapter.translate(&update)), std::vector<PointerPhase>{PointerPhase::Move});

    auto end = touch(QEvent::TouchEnd, { QEventPoint(3, QEventPoint::State::Released, QPointF(1, 9), QPointF(1, 9)) });
    auto ended = adapter.translate(&end);
    ASSERT_EQ(ended.size(), 1u);
    EXPECT_EQ(ended[0].phase, PointerPhase::End);
    EXPECT_EQ(ended[0].pointerId, 3);
    EXPECT_FALSE(adapter.hasActiveContact());
}

TEST_F(PointerSampleAdapterTest, UpdatesForUnknownPointsAreDropped) {
    auto update = touch(QEvent::TouchUpdate, { QEventPoint(9, QEventPoint::State::Updated, QPointF(1, 1), QPointF(1, 1)) });
    EXPECT_TRUE(adapter.translate(&update).empty());
}

TEST_F(PointerSampleAdapterTest, TouchCancelEndsEveryContact) {
    auto begin = touch(QEvent::TouchBegin, {
        QEventPoint(1, QEventPoint::State::Pressed, QPointF(1, 1), QPointF(1, 1)),
        QEventPoint(2, QEventPoint::State::Pressed, QPointF(50, 1), QPointF(50, 1))
    });
    EXPECT_EQ(adapter.translate(&begin).size(), 2u);

    auto cancel = touch(QEvent::TouchCancel, {});
    auto cancelled = adapter.translate(&cancel);
    EXPECT_EQ(phasesOf(cancelled), (std::vector<PointerPhase>{PointerPhase::Cancel, PointerPhase::Cancel}));
    EXPECT_EQ(cancelled[0].pointerId, 1);
    EXPECT_EQ(cancelled[1].pointerId, 2);
    EXPECT_FALSE(adapter.hasActiveContact());
}

// =============================================================================
// InteractionSurface
// =============================================================================

namespace {

class ProbeSurface : public InteractionSurface {
public:
    using InteractionSurface::mousePressEvent;
    using InteractionSurface::mouseReleaseEvent;
    using InteractionSurface::mouseUngrabEvent;
};

} // namespace

class InteractionSurfaceTest : public ::testing::Test {
protected:
    InteractionSurfaceTest() {
        GestureConfig config;
        config.tapDebounceMs = 0;
        recognizer = std::make_unique<GestureRecognizer>(clock, config);
        router = std::make_unique<InteractionRouter>(*recognizer);
        surface.setSize(QSizeF(200, 100));
    }

    VirtualClockScheduler clock;
    std::unique_ptr<GestureRecognizer> recognizer;
    std::unique_ptr<InteractionRouter> router;
    ProbeSurface surface;
};

TEST_F(InteractionSurfaceTest, AttachTogglesProperty) {
    QSignalSpy attachedSpy(&surface, &InteractionSurface::attachedChanged);
    EXPECT_FALSE(surface.isAttached());

    surface.attach(router.get(), clock);
    EXPECT_TRUE(surface.isAttached());

    surface.detach();
    EXPECT_FALSE(surface.isAttached());
    EXPECT_EQ(attachedSpy.count(), 2);
}

TEST_F(InteractionSurfaceTest, ClickBecomesTapSignal) {
    surface.attach(router.get(), clock);
    QSignalSpy gestureSpy(&surface, &InteractionSurface::gesture);

    auto press = mouse(QEvent::MouseButtonPress, QPointF(40, 30));
    surface.mousePressEvent(&press);
    EXPECT_TRUE(press.isAccepted());

    clock.advanceBy(60);
    auto release = mouse(QEvent::MouseButtonRelease, QPointF(41, 30));
    surface.mouseReleaseEvent(&release);

    ASSERT_EQ(gestureSpy.count(), 1);
    EXPECT_EQ(gestureSpy.at(0).at(0).toString(), QStringLiteral("Tap"));
    EXPECT_DOUBLE_EQ(gestureSpy.at(0).at(1).toDouble(), 41.0);
}

TEST_F(InteractionSurfaceTest, UngrabCancelsTheSession) {
    surface.attach(router.get(), clock);
    QSignalSpy gestureSpy(&surface, &InteractionSurface::gesture);

    auto press = mouse(QEvent::MouseButtonPress, QPointF(40, 30));
    surface.mousePressEvent(&press);
    surface.mouseUngrabEvent();
    clock.advanceBy(2000);

    EXPECT_EQ(gestureSpy.count(), 0);
    EXPECT_EQ(router->sessionOwner(), InteractionRouter::Owner::None);
}

TEST_F(InteractionSurfaceTest, DetachedSurfaceIgnoresInput) {
    auto press = mouse(QEvent::MouseButtonPress, QPointF(40, 30));
    surface.mousePressEvent(&press);
    EXPECT_FALSE(press.isAccepted());
}

// =============================================================================
// QtPlatformProbe
// =============================================================================

TEST(QtPlatformProbe, ReadsWhatTheHostExposes) {
    QtPlatformProbe probe;
    const PlatformSignals platformSignals = probe.probe();

    ASSERT_TRUE(platformSignals.hardwareConcurrency.has_value());
    EXPECT_GT(*platformSignals.hardwareConcurrency, 0);
    ASSERT_TRUE(platformSignals.hasTouchSupport.has_value());
    EXPECT_EQ(platformSignals.hasCoarsePointer, platformSignals.hasTouchSupport);

    // Whatever was read must still produce a usable profile
    const CapabilityProfile profile = DeviceCapabilities::buildProfile(platformSignals);
    EXPECT_GT(profile.memoryTierGB, 0.0);
}
