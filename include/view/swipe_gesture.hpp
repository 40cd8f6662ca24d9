/**
 * SwipeList - Swipe Gesture Controller
 * Touch state machine that tells vertical scrolling apart from horizontal
 * swipe-to-dismiss on list rows, drives the row while it is dragged and
 * resolves the release into a swipe-out or a snap-back.
 *
 * The controller knows nothing about the toolkit. The list it is attached to
 * implements SwipeListHost, each row implements SwipeRow.
 */

#pragma once

#include "utils/tap_listener_slot.hpp"
#include "utils/velocity_tracker.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace swipelist {

// Tunables, defaults match the original list behaviour
struct SwipeConfig {
    float minSwipeDistance = 40.0f;         // Travel before a move counts as scroll or swipe
    float speedDamping = 0.75f;             // Row moves slower than the finger
    float swipeVelocityThreshold = 1200.0f; // px/s for a fast flick to commit
    float fullSwipeRatio = 2.5f;            // Commit when |dx| >= rowWidth / ratio
    float minRowAlpha = 0.4f;
    int commitDurationMs = 300;
    int snapBackDurationMs = 300;
    int selectorFadeMs = 500;
    int resetDelayMs = 50;                  // Delay before a swiped row is made neutral again
    std::optional<int> ignoredRowKind;      // Rows of this kind can't be swiped
};

enum class SwipePhase {
    IDLE,
    ARMED,          // Pointer down on a swipeable row, direction unknown
    SCROLLING,      // Vertical movement won, no swipe until pointer up
    SWIPING,
    COMMITTING_OUT, // Row animating off screen, input blocked
    SNAPPING_BACK
};

enum class SwipeResolution {
    COMMIT,
    REVERT
};

const char* swipePhaseName(SwipePhase phase);

// Commit on a fast flick that travelled at least twice the minimum distance,
// or once the row has been dragged most of the way out.
SwipeResolution resolveSwipeRelease(const SwipeConfig& config, float deltaX, float velocityX, float rowWidth);

// Row opacity while dragging: 1 at rest, fading with |deltaX|, floored at minRowAlpha
float swipeRowAlpha(const SwipeConfig& config, float deltaX, float rowWidth);

// Visual element of one row
class SwipeRow {
public:
    virtual ~SwipeRow() = default;

    virtual float getRowWidth() const = 0;
    virtual float getRowTranslationX() const = 0;
    virtual void setRowTranslationX(float translationX) = 0;
    virtual float getRowAlpha() const = 0;
    virtual void setRowAlpha(float alpha) = 0;
    virtual void setRowPressed(bool pressed) = 0;
    virtual bool isRowAnimating() const = 0;

    // Tween translation and alpha. onEnd is called exactly once, when the
    // tween finishes or when the row goes away before it does.
    virtual void animateRow(float translationX, float alpha, int durationMs, std::function<void()> onEnd) = 0;
};

// Position plus stable id, re-validated before every use
struct SwipeRowHandle {
    int index = -1;
    int64_t stableId = -1;
};

// What the controller needs from the list widget
class SwipeListHost {
public:
    static constexpr int INVALID_POSITION = -1;

    virtual ~SwipeListHost() = default;

    // Row index under a point in list coordinates, INVALID_POSITION for none
    virtual int getRowAtPoint(float x, float y) const = 0;
    virtual int getRowCount() const = 0;
    virtual int getHeaderCount() const = 0;
    virtual int getFooterCount() const = 0;
    virtual int getRowKind(int index) const = 0;
    virtual int64_t getRowStableId(int index) const = 0;

    // nullptr when the row is not currently laid out
    virtual SwipeRow* getVisibleRow(int index) = 0;

    // Fade the list's press/selection highlight out (true) or back in (false)
    virtual void setSelectorFaded(bool faded, int durationMs) = 0;

    // Run action on the UI thread after delayMs
    virtual void postDelayed(int delayMs, std::function<void()> action) = 0;
};

// Called once per committed swipe. row is nullptr when the row view was
// recycled before the swipe-out finished.
using SwipeListener = std::function<void(SwipeListHost& list, SwipeRow* row, int index, int64_t stableId)>;

struct SwipePointerEvent {
    float x = 0.0f;
    float y = 0.0f;
    int64_t timeMs = 0;
};

class SwipeGestureController {
public:
    explicit SwipeGestureController(SwipeListHost* host);
    ~SwipeGestureController();

    SwipeGestureController(const SwipeGestureController&) = delete;
    SwipeGestureController& operator=(const SwipeGestureController&) = delete;

    // Pointer handlers return true when the event was consumed and must not
    // reach the list's own touch handling.
    bool onPointerDown(const SwipePointerEvent& event);
    bool onPointerMove(const SwipePointerEvent& event);
    bool onPointerUp(const SwipePointerEvent& event);
    bool onPointerCancel(const SwipePointerEvent& event);

    // Single listener slot, registering again replaces it
    void setOnRowSwiped(SwipeListener listener);
    bool hasSwipeListener() const { return static_cast<bool>(m_swipeListener); }

    void setIgnoredRowKind(int kind);
    void clearIgnoredRowKind();

    void setConfig(const SwipeConfig& config);
    const SwipeConfig& getConfig() const { return m_config; }

    // Wraps the host's row tap listener
    TapListenerSlot& getTapListener() { return m_tapListener; }
    const TapListenerSlot& getTapListener() const { return m_tapListener; }

    bool isSwiping() const { return m_phase == SwipePhase::SWIPING; }
    bool isBlocked() const { return m_phase == SwipePhase::COMMITTING_OUT; }
    SwipePhase getPhase() const { return m_phase; }

    // Forget every session and pending animation. For when the host drops
    // all of its rows at once.
    void reset();

private:
    struct GestureSession {
        SwipeRowHandle row;
        float downX = 0.0f;
        float downY = 0.0f;
        float rowOriginalX = 0.0f;
        float deltaX = 0.0f;
        float velocityX = 0.0f;
    };

    bool hasActiveSession() const;
    SwipeRow* resolveRow(const SwipeRowHandle& handle) const;
    void beginSwipe(float x);
    void releaseSwipe();
    void abandonSwipe();
    void startCommit(SwipeRow* row);
    void startSnapBack(SwipeRow* row);
    void onCommitFinished(SwipeRowHandle handle, uint64_t generation);
    void onCommitCleanup(SwipeRowHandle handle, uint64_t generation);
    void onSnapBackFinished(uint64_t generation);

    SwipeListHost* m_host;
    SwipeConfig m_config;
    SwipeListener m_swipeListener;
    TapListenerSlot m_tapListener;
    VelocityTracker m_velocity;

    SwipePhase m_phase = SwipePhase::IDLE;
    GestureSession m_session;
    int m_pendingSnapBacks = 0;
    uint64_t m_generation = 0;  // Bumped by reset() to drop stale completions

    std::shared_ptr<bool> m_alive;
};

} // namespace swipelist
