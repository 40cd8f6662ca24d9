/**
 * SwipeList - Swipe Gesture Controller tests
 */

#include "view/swipe_gesture.hpp"
#include "fake_swipe_host.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace swipelist {
namespace {

using test::FakeRow;
using test::FakeSwipeHost;

constexpr int ROW_KIND_NORMAL = 0;
constexpr int ROW_KIND_TITLE = 7;

struct SwipeCall {
    int index;
    int64_t id;
    SwipeRow* row;
};

class SwipeGestureControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Row 0 is a header, row 7 a footer, row 5 a title row
        for (int i = 0; i < 8; i++) {
            m_host.addRow(100 + i, i == 5 ? ROW_KIND_TITLE : ROW_KIND_NORMAL);
        }
        m_host.setHeaderFooter(1, 1);

        m_controller.setOnRowSwiped([this](SwipeListHost& list, SwipeRow* row, int index, int64_t id) {
            EXPECT_EQ(&list, &m_host);
            m_swipes.push_back({index, id, row});
        });
        m_controller.getTapListener().registerReal([this](int index) {
            m_taps.push_back(index);
        });
    }

    bool down(int index, float x, int64_t t = 0) {
        m_downY = m_host.rowCentreY(index);
        return m_controller.onPointerDown({x, m_downY, t});
    }

    bool move(float x, int64_t t, float dy = 0.0f) {
        return m_controller.onPointerMove({x, m_downY + dy, t});
    }

    bool up(float x, int64_t t) {
        return m_controller.onPointerUp({x, m_downY, t});
    }

    // Down at x=100, latch at 140, then drag to 100 + 40 + dx
    void latchAndDrag(int index, float dx, int64_t latchTime, int64_t dragTime) {
        down(index, 100.0f, 0);
        move(140.0f, latchTime);
        move(140.0f + dx, dragTime);
    }

    FakeSwipeHost m_host;
    SwipeGestureController m_controller{&m_host};
    std::vector<SwipeCall> m_swipes;
    std::vector<int> m_taps;
    float m_downY = 0.0f;
};

TEST_F(SwipeGestureControllerTest, DownOnHeaderOrFooterStartsNoSession) {
    for (int index : {0, 7}) {
        for (float x : {1.0f, 200.0f, 399.0f}) {
            EXPECT_FALSE(down(index, x));
            EXPECT_EQ(m_controller.getPhase(), SwipePhase::IDLE);

            EXPECT_FALSE(move(x + 100.0f, 10));
            EXPECT_EQ(m_controller.getPhase(), SwipePhase::IDLE);
            EXPECT_FLOAT_EQ(m_host.row(index)->translationX, 0.0f);
        }
    }
}

TEST_F(SwipeGestureControllerTest, DownOnDividerStartsNoSession) {
    float dividerY = 3 * FakeSwipeHost::ROW_HEIGHT - 1.0f;
    EXPECT_FALSE(m_controller.onPointerDown({100.0f, dividerY, 0}));
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::IDLE);
}

TEST_F(SwipeGestureControllerTest, DownWithoutSwipeListenerStartsNoSession) {
    m_controller.setOnRowSwiped(nullptr);
    EXPECT_FALSE(m_controller.hasSwipeListener());

    down(3, 100.0f);
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::IDLE);
}

TEST_F(SwipeGestureControllerTest, IgnoredRowKindIsNotSwipeable) {
    m_controller.setIgnoredRowKind(ROW_KIND_TITLE);
    down(5, 100.0f);
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::IDLE);

    down(4, 100.0f);
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::ARMED);
    up(100.0f, 10);

    m_controller.clearIgnoredRowKind();
    down(5, 100.0f);
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::ARMED);
}

TEST_F(SwipeGestureControllerTest, VerticalMoveLatchesScrollingForTheSession) {
    down(3, 100.0f);

    EXPECT_FALSE(move(110.0f, 10, 45.0f));
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::SCROLLING);

    // Horizontal travel later in the same session never starts a swipe
    EXPECT_FALSE(move(300.0f, 20, 45.0f));
    EXPECT_FALSE(move(380.0f, 30, 0.0f));
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::SCROLLING);
    EXPECT_FALSE(m_controller.isSwiping());
    EXPECT_FLOAT_EQ(m_host.row(3)->translationX, 0.0f);

    up(380.0f, 40);
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::IDLE);

    // Next session may swipe again
    down(3, 100.0f);
    EXPECT_TRUE(move(150.0f, 10));
    EXPECT_TRUE(m_controller.isSwiping());
}

TEST_F(SwipeGestureControllerTest, SmallMovesKeepTheSessionArmed) {
    down(3, 100.0f);
    EXPECT_FALSE(move(130.0f, 10, 20.0f));
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::ARMED);
    EXPECT_FALSE(m_host.selectorFaded);
}

TEST_F(SwipeGestureControllerTest, HorizontalMoveLatchesSwipeFromNewBaseline) {
    down(3, 100.0f);

    EXPECT_TRUE(move(140.0f, 10));
    EXPECT_TRUE(m_controller.isSwiping());
    EXPECT_TRUE(m_host.selectorFaded);
    EXPECT_FALSE(m_host.row(3)->pressed);
    // No jump on the latching move
    EXPECT_FLOAT_EQ(m_host.row(3)->translationX, 0.0f);

    EXPECT_TRUE(move(190.0f, 20));
    EXPECT_FLOAT_EQ(m_host.row(3)->translationX, 50.0f * 0.75f);

    EXPECT_TRUE(move(60.0f, 30));
    EXPECT_FLOAT_EQ(m_host.row(3)->translationX, -80.0f * 0.75f);
}

TEST_F(SwipeGestureControllerTest, VerticalDriftAfterSwipeLatchStillSwipes) {
    down(3, 100.0f);
    move(140.0f, 10);

    EXPECT_TRUE(move(170.0f, 20, 120.0f));
    EXPECT_TRUE(m_controller.isSwiping());
}

TEST_F(SwipeGestureControllerTest, RowAlphaFallsWithDistanceDownToFloor) {
    down(3, 100.0f);
    move(140.0f, 10);

    float previous = 1.0f;
    for (int dx = 0; dx <= 400; dx += 10) {
        move(140.0f + dx, 20 + dx);
        float alpha = m_host.row(3)->alpha;
        EXPECT_LE(alpha, previous) << "dx=" << dx;
        EXPECT_GE(alpha, 0.4f) << "dx=" << dx;
        previous = alpha;
    }
    EXPECT_FLOAT_EQ(previous, 0.4f);

    EXPECT_FLOAT_EQ(swipeRowAlpha(SwipeConfig(), 100.0f, 400.0f), 0.75f);
    EXPECT_FLOAT_EQ(swipeRowAlpha(SwipeConfig(), -100.0f, 400.0f), 0.75f);
    EXPECT_FLOAT_EQ(swipeRowAlpha(SwipeConfig(), 300.0f, 400.0f), 0.4f);
}

TEST(SwipeResolutionTest, DecisionFollowsFlickAndDistanceRules) {
    SwipeConfig config;
    config.minSwipeDistance = 40.0f;
    config.swipeVelocityThreshold = 1200.0f;

    // Fast flick, 90 >= 2 * 40
    EXPECT_EQ(resolveSwipeRelease(config, 90.0f, 1500.0f, 400.0f), SwipeResolution::COMMIT);
    // Too slow and 90 < 400 / 2.5
    EXPECT_EQ(resolveSwipeRelease(config, 90.0f, 500.0f, 400.0f), SwipeResolution::REVERT);
    // Fast but too short for a flick
    EXPECT_EQ(resolveSwipeRelease(config, 70.0f, 3000.0f, 400.0f), SwipeResolution::REVERT);
    // Most of the way out, speed doesn't matter
    EXPECT_EQ(resolveSwipeRelease(config, 160.0f, 0.0f, 400.0f), SwipeResolution::COMMIT);
    EXPECT_EQ(resolveSwipeRelease(config, -160.0f, 0.0f, 400.0f), SwipeResolution::COMMIT);
    EXPECT_EQ(resolveSwipeRelease(config, -90.0f, -1500.0f, 400.0f), SwipeResolution::COMMIT);
    EXPECT_EQ(resolveSwipeRelease(config, 55.0f, 100.0f, 400.0f), SwipeResolution::REVERT);
}

TEST_F(SwipeGestureControllerTest, ShortSlowReleaseSnapsBack) {
    down(3, 100.0f, 0);
    move(140.0f, 10);
    move(190.0f, 400);
    EXPECT_FLOAT_EQ(m_host.row(3)->translationX, 50.0f * 0.75f);

    // 55 px at 100 px/s
    move(195.0f, 450);
    EXPECT_FALSE(up(195.0f, 460));

    EXPECT_EQ(m_controller.getPhase(), SwipePhase::SNAPPING_BACK);
    EXPECT_FALSE(m_controller.isBlocked());
    EXPECT_TRUE(m_controller.getTapListener().isDetached());
    EXPECT_FALSE(m_host.selectorFaded);

    FakeRow* row = m_host.row(3);
    EXPECT_FLOAT_EQ(row->targetX, 0.0f);
    EXPECT_FLOAT_EQ(row->targetAlpha, 1.0f);
    EXPECT_EQ(row->lastDurationMs, 300);

    row->finishAnimation();
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::IDLE);
    EXPECT_FLOAT_EQ(row->translationX, 0.0f);
    EXPECT_FLOAT_EQ(row->alpha, 1.0f);
    EXPECT_FALSE(m_controller.getTapListener().isDetached());
    EXPECT_TRUE(m_swipes.empty());

    EXPECT_TRUE(m_controller.getTapListener().dispatch(3));
    EXPECT_EQ(m_taps, std::vector<int>{3});
}

TEST_F(SwipeGestureControllerTest, SlowMediumReleaseSnapsBack) {
    down(3, 100.0f, 0);
    move(140.0f, 10);
    move(180.0f, 200);
    move(230.0f, 300);  // 90 px at 500 px/s
    up(230.0f, 310);

    EXPECT_EQ(m_controller.getPhase(), SwipePhase::SNAPPING_BACK);
}

TEST_F(SwipeGestureControllerTest, FastFlickCommitsAndNotifiesOnce) {
    latchAndDrag(3, 90.0f, 5, 60);  // 130 px over 60 ms
    up(230.0f, 61);

    EXPECT_EQ(m_controller.getPhase(), SwipePhase::COMMITTING_OUT);
    EXPECT_TRUE(m_controller.isBlocked());
    FakeRow* row = m_host.row(3);
    EXPECT_FLOAT_EQ(row->targetX, 400.0f);
    EXPECT_EQ(row->lastDurationMs, 300);

    // Input is ignored while the row leaves
    EXPECT_FALSE(down(4, 100.0f, 100));
    EXPECT_FALSE(move(200.0f, 110));
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::COMMITTING_OUT);
    EXPECT_FLOAT_EQ(m_host.row(4)->translationX, 0.0f);

    row->finishAnimation();
    ASSERT_EQ(m_swipes.size(), 1u);
    EXPECT_EQ(m_swipes[0].index, 3);
    EXPECT_EQ(m_swipes[0].id, 103);
    EXPECT_EQ(m_swipes[0].row, row);
    EXPECT_FALSE(m_controller.getTapListener().isDetached());

    // Neutral values only come back after the short delay
    EXPECT_TRUE(m_controller.isBlocked());
    EXPECT_FLOAT_EQ(row->translationX, 400.0f);
    EXPECT_EQ(m_host.lastDelayMs, 50);

    m_host.runDelayed();
    EXPECT_FALSE(m_controller.isBlocked());
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::IDLE);
    EXPECT_FLOAT_EQ(row->translationX, 0.0f);
    EXPECT_FLOAT_EQ(row->alpha, 1.0f);
    EXPECT_EQ(m_swipes.size(), 1u);
}

TEST_F(SwipeGestureControllerTest, DraggingMostOfTheWayLeftCommitsToTheLeft) {
    down(2, 300.0f, 0);
    move(260.0f, 10);
    move(60.0f, 1000);  // -200 px, slow
    up(60.0f, 2000);

    EXPECT_TRUE(m_controller.isBlocked());
    EXPECT_FLOAT_EQ(m_host.row(2)->targetX, -400.0f);
}

TEST_F(SwipeGestureControllerTest, CancelResolvesLikeRelease) {
    latchAndDrag(3, 200.0f, 10, 1000);
    EXPECT_FALSE(m_controller.onPointerCancel({340.0f, m_downY, 1010}));

    EXPECT_TRUE(m_controller.isBlocked());
    EXPECT_TRUE(m_controller.getTapListener().isDetached());
}

TEST_F(SwipeGestureControllerTest, BlockedClearsOnlyAfterCompletionAndCleanup) {
    latchAndDrag(3, 200.0f, 10, 1000);
    up(340.0f, 1010);

    EXPECT_TRUE(m_controller.isBlocked());
    m_host.row(3)->finishAnimation();
    EXPECT_TRUE(m_controller.isBlocked());
    EXPECT_EQ(m_host.pendingDelayed(), 1u);

    m_host.runDelayed();
    EXPECT_FALSE(m_controller.isBlocked());

    // Nothing else is queued that could flip it again
    EXPECT_EQ(m_host.pendingDelayed(), 0u);
    down(4, 100.0f);
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::ARMED);
}

TEST_F(SwipeGestureControllerTest, TapListenerRestoredToLastNonNullRegistration) {
    std::vector<int> second;
    m_controller.getTapListener().registerReal([&second](int index) { second.push_back(index); });
    m_controller.getTapListener().registerReal(nullptr);

    latchAndDrag(3, 200.0f, 10, 1000);
    up(340.0f, 1010);

    // The synthetic click of the release goes nowhere
    EXPECT_FALSE(m_controller.getTapListener().dispatch(3));

    m_host.row(3)->finishAnimation();
    m_host.runDelayed();

    EXPECT_TRUE(m_controller.getTapListener().dispatch(4));
    EXPECT_EQ(second, std::vector<int>{4});
    EXPECT_TRUE(m_taps.empty());
}

TEST_F(SwipeGestureControllerTest, RegisteringSameListenerTwiceNotifiesOnce) {
    int calls = 0;
    SwipeListener listener = [&calls](SwipeListHost&, SwipeRow*, int, int64_t) { calls++; };
    m_controller.setOnRowSwiped(listener);
    m_controller.setOnRowSwiped(listener);

    latchAndDrag(3, 200.0f, 10, 1000);
    up(340.0f, 1010);
    m_host.row(3)->finishAnimation();
    m_host.runDelayed();

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(m_swipes.empty());
}

TEST_F(SwipeGestureControllerTest, RecycledRowStillNotifiesAndUnblocks) {
    latchAndDrag(3, 200.0f, 10, 1000);
    up(340.0f, 1010);

    auto onEnd = std::move(m_host.row(3)->pendingEnd);
    m_host.recycleRow(3);
    onEnd();

    ASSERT_EQ(m_swipes.size(), 1u);
    EXPECT_EQ(m_swipes[0].row, nullptr);
    EXPECT_EQ(m_swipes[0].id, 103);
    EXPECT_FALSE(m_controller.getTapListener().isDetached());

    m_host.runDelayed();
    EXPECT_FALSE(m_controller.isBlocked());
}

TEST_F(SwipeGestureControllerTest, RowRemovedByListenerSkipsCleanup) {
    m_controller.setOnRowSwiped([this](SwipeListHost&, SwipeRow*, int index, int64_t) {
        m_host.removeRow(index);
    });

    latchAndDrag(3, 200.0f, 10, 1000);
    up(340.0f, 1010);
    m_host.row(3)->finishAnimation();

    // Row 3 is now the former row 4, it must stay untouched
    m_host.row(3)->translationX = 12.0f;
    m_host.runDelayed();

    EXPECT_FLOAT_EQ(m_host.row(3)->translationX, 12.0f);
    EXPECT_EQ(m_host.getRowStableId(3), 104);
    EXPECT_FALSE(m_controller.isBlocked());
}

TEST_F(SwipeGestureControllerTest, RowMovedBeforeCleanupIsFoundById) {
    latchAndDrag(4, 200.0f, 10, 1000);
    up(340.0f, 1010);
    FakeRow* swiped = m_host.row(4);
    swiped->finishAnimation();

    m_host.removeRow(2);
    ASSERT_EQ(m_host.row(3), swiped);

    m_host.runDelayed();
    EXPECT_FLOAT_EQ(swiped->translationX, 0.0f);
    EXPECT_FLOAT_EQ(swiped->alpha, 1.0f);
}

TEST_F(SwipeGestureControllerTest, SecondGestureDuringSnapBackKeepsTapDetached) {
    down(3, 100.0f, 0);
    move(140.0f, 10);
    move(160.0f, 500);
    up(160.0f, 510);
    ASSERT_EQ(m_controller.getPhase(), SwipePhase::SNAPPING_BACK);

    // New session on another row while the first one is still animating
    down(4, 100.0f, 520);
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::ARMED);
    up(100.0f, 530);
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::SNAPPING_BACK);

    // A tap released in that window is dropped
    EXPECT_FALSE(m_controller.getTapListener().dispatch(4));

    m_host.row(3)->finishAnimation();
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::IDLE);
    EXPECT_TRUE(m_controller.getTapListener().dispatch(4));
}

TEST_F(SwipeGestureControllerTest, OverlappingSnapBacksReattachOnlyAfterBoth) {
    down(3, 100.0f, 0);
    move(140.0f, 10);
    move(160.0f, 500);
    up(160.0f, 510);

    down(4, 100.0f, 520);
    move(140.0f, 530);
    move(160.0f, 1000);
    up(160.0f, 1010);
    EXPECT_EQ(m_controller.getTapListener().getDetachDepth(), 2);

    m_host.row(3)->finishAnimation();
    EXPECT_TRUE(m_controller.getTapListener().isDetached());
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::SNAPPING_BACK);

    m_host.row(4)->finishAnimation();
    EXPECT_FALSE(m_controller.getTapListener().isDetached());
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::IDLE);
}

TEST_F(SwipeGestureControllerTest, DownOnRowStillSnappingBackIsDeclined) {
    down(3, 100.0f, 0);
    move(140.0f, 10);
    move(160.0f, 500);
    up(160.0f, 510);

    down(3, 100.0f, 520);
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::SNAPPING_BACK);
    EXPECT_FALSE(move(200.0f, 530));
}

TEST_F(SwipeGestureControllerTest, RowLostMidSwipeAbandonsTheSession) {
    down(3, 100.0f, 0);
    move(140.0f, 10);
    ASSERT_TRUE(m_host.selectorFaded);

    m_host.recycleRow(3);
    EXPECT_FALSE(move(200.0f, 20));
    EXPECT_EQ(m_controller.getPhase(), SwipePhase::IDLE);
    EXPECT_FALSE(m_host.selectorFaded);

    up(200.0f, 30);
    EXPECT_FALSE(m_controller.getTapListener().isDetached());
}

TEST_F(SwipeGestureControllerTest, ResetUnblocksAndDropsStaleCompletion) {
    latchAndDrag(3, 200.0f, 10, 1000);
    up(340.0f, 1010);
    ASSERT_TRUE(m_controller.isBlocked());

    m_controller.reset();
    EXPECT_FALSE(m_controller.isBlocked());
    EXPECT_FALSE(m_controller.getTapListener().isDetached());

    m_host.row(3)->finishAnimation();
    EXPECT_TRUE(m_swipes.empty());
    EXPECT_EQ(m_host.pendingDelayed(), 0u);
}

TEST_F(SwipeGestureControllerTest, ConfigChangesThresholds) {
    SwipeConfig config;
    config.minSwipeDistance = 10.0f;
    config.speedDamping = 0.5f;
    config.commitDurationMs = 120;
    m_controller.setConfig(config);

    down(3, 100.0f, 0);
    EXPECT_TRUE(move(110.0f, 10));
    EXPECT_TRUE(move(150.0f, 2000));
    EXPECT_FLOAT_EQ(m_host.row(3)->translationX, 20.0f);

    move(280.0f, 4000);
    up(280.0f, 4010);
    EXPECT_EQ(m_host.row(3)->lastDurationMs, 120);
}

TEST(SwipePhaseTest, NamesAreReadable) {
    EXPECT_STREQ(swipePhaseName(SwipePhase::IDLE), "idle");
    EXPECT_STREQ(swipePhaseName(SwipePhase::COMMITTING_OUT), "committing");
}

} // namespace
} // namespace swipelist
