/**
 * SwipeList - Swipe Gesture Controller implementation
 */

#include "view/swipe_gesture.hpp"

#include <algorithm>
#include <cmath>

namespace swipelist {

const char* swipePhaseName(SwipePhase phase) {
    switch (phase) {
        case SwipePhase::IDLE: return "idle";
        case SwipePhase::ARMED: return "armed";
        case SwipePhase::SCROLLING: return "scrolling";
        case SwipePhase::SWIPING: return "swiping";
        case SwipePhase::COMMITTING_OUT: return "committing";
        case SwipePhase::SNAPPING_BACK: return "snapping back";
        default: return "unknown";
    }
}

SwipeResolution resolveSwipeRelease(const SwipeConfig& config, float deltaX, float velocityX, float rowWidth) {
    float distance = std::abs(deltaX);

    bool swipedFast = std::abs(velocityX) >= config.swipeVelocityThreshold &&
                      distance >= config.minSwipeDistance * 2.0f;

    bool swipedFull = rowWidth > 0.0f && config.fullSwipeRatio > 0.0f &&
                      distance >= rowWidth / config.fullSwipeRatio;

    return (swipedFast || swipedFull) ? SwipeResolution::COMMIT : SwipeResolution::REVERT;
}

float swipeRowAlpha(const SwipeConfig& config, float deltaX, float rowWidth) {
    if (rowWidth <= 0.0f) {
        return 1.0f;
    }
    float alpha = 1.0f - std::abs(deltaX) / rowWidth;
    return std::max(config.minRowAlpha, std::min(1.0f, alpha));
}

SwipeGestureController::SwipeGestureController(SwipeListHost* host)
    : m_host(host)
{
    m_alive = std::make_shared<bool>(true);
}

SwipeGestureController::~SwipeGestureController() {
    *m_alive = false;
}

void SwipeGestureController::setOnRowSwiped(SwipeListener listener) {
    m_swipeListener = std::move(listener);
}

void SwipeGestureController::setIgnoredRowKind(int kind) {
    m_config.ignoredRowKind = kind;
}

void SwipeGestureController::clearIgnoredRowKind() {
    m_config.ignoredRowKind.reset();
}

void SwipeGestureController::setConfig(const SwipeConfig& config) {
    m_config = config;
}

bool SwipeGestureController::hasActiveSession() const {
    return m_phase == SwipePhase::ARMED ||
           m_phase == SwipePhase::SCROLLING ||
           m_phase == SwipePhase::SWIPING;
}

bool SwipeGestureController::onPointerDown(const SwipePointerEvent& event) {
    // Down without a matching up: settle the old session before starting over
    if (m_phase == SwipePhase::SWIPING) {
        releaseSwipe();
    } else if (m_phase == SwipePhase::ARMED || m_phase == SwipePhase::SCROLLING) {
        m_phase = m_pendingSnapBacks > 0 ? SwipePhase::SNAPPING_BACK : SwipePhase::IDLE;
    }

    if (isBlocked()) {
        return false;
    }

    m_velocity.clear();

    if (!m_host || !m_swipeListener) {
        return false;
    }

    int index = m_host->getRowAtPoint(event.x, event.y);
    if (index == SwipeListHost::INVALID_POSITION) {
        return false;
    }

    // Headers and footers are never swiped
    if (index < m_host->getHeaderCount() ||
        index >= m_host->getRowCount() - m_host->getFooterCount()) {
        return false;
    }

    if (m_config.ignoredRowKind && m_host->getRowKind(index) == *m_config.ignoredRowKind) {
        return false;
    }

    SwipeRow* row = m_host->getVisibleRow(index);
    if (!row || row->isRowAnimating()) {
        return false;
    }

    m_session = GestureSession();
    m_session.row.index = index;
    m_session.row.stableId = m_host->getRowStableId(index);
    m_session.downX = event.x;
    m_session.downY = event.y;
    m_session.rowOriginalX = row->getRowTranslationX();

    m_velocity.addMovement(event.x, event.timeMs);
    m_phase = SwipePhase::ARMED;
    return false;
}

bool SwipeGestureController::onPointerMove(const SwipePointerEvent& event) {
    if (!hasActiveSession()) {
        return false;
    }

    m_velocity.addMovement(event.x, event.timeMs);

    float deltaX = event.x - m_session.downX;
    float deltaY = event.y - m_session.downY;

    if (m_phase == SwipePhase::ARMED) {
        if (std::abs(deltaY) >= m_config.minSwipeDistance) {
            // The list scrolls, this session will never swipe
            m_phase = SwipePhase::SCROLLING;
            return false;
        }
        if (std::abs(deltaX) >= m_config.minSwipeDistance) {
            beginSwipe(event.x);
            deltaX = 0.0f;
        }
    }

    if (m_phase != SwipePhase::SWIPING) {
        return false;
    }

    SwipeRow* row = resolveRow(m_session.row);
    if (!row) {
        abandonSwipe();
        return false;
    }

    m_session.deltaX = deltaX;
    m_session.velocityX = m_velocity.computeVelocity();

    row->setRowTranslationX(m_session.rowOriginalX + deltaX * m_config.speedDamping);
    row->setRowPressed(false);
    row->setRowAlpha(swipeRowAlpha(m_config, deltaX, row->getRowWidth()));
    return true;
}

bool SwipeGestureController::onPointerUp(const SwipePointerEvent& event) {
    (void)event;

    if (m_phase == SwipePhase::SWIPING) {
        releaseSwipe();
    } else if (m_phase == SwipePhase::ARMED || m_phase == SwipePhase::SCROLLING) {
        m_phase = m_pendingSnapBacks > 0 ? SwipePhase::SNAPPING_BACK : SwipePhase::IDLE;
    }

    m_velocity.clear();
    return false;
}

bool SwipeGestureController::onPointerCancel(const SwipePointerEvent& event) {
    return onPointerUp(event);
}

void SwipeGestureController::reset() {
    if (m_phase == SwipePhase::SWIPING && m_host) {
        m_host->setSelectorFaded(false, 0);
    }

    m_generation++;
    m_pendingSnapBacks = 0;
    m_tapListener.forceReattach();
    m_velocity.clear();
    m_session = GestureSession();
    m_phase = SwipePhase::IDLE;
}

SwipeRow* SwipeGestureController::resolveRow(const SwipeRowHandle& handle) const {
    if (!m_host || handle.index < 0) {
        return nullptr;
    }

    int count = m_host->getRowCount();
    if (handle.index < count && m_host->getRowStableId(handle.index) == handle.stableId) {
        return m_host->getVisibleRow(handle.index);
    }

    // Rows above were inserted or removed, look the id up again
    int end = count - m_host->getFooterCount();
    for (int i = m_host->getHeaderCount(); i < end; i++) {
        if (m_host->getRowStableId(i) == handle.stableId) {
            return m_host->getVisibleRow(i);
        }
    }

    return nullptr;
}

void SwipeGestureController::beginSwipe(float x) {
    m_phase = SwipePhase::SWIPING;

    // Re-baseline so the row doesn't jump by minSwipeDistance
    m_session.downX = x;
    m_session.deltaX = 0.0f;

    m_host->setSelectorFaded(true, m_config.selectorFadeMs);
}

void SwipeGestureController::abandonSwipe() {
    m_host->setSelectorFaded(false, m_config.selectorFadeMs);
    m_session = GestureSession();
    m_phase = m_pendingSnapBacks > 0 ? SwipePhase::SNAPPING_BACK : SwipePhase::IDLE;
}

void SwipeGestureController::releaseSwipe() {
    SwipeRow* row = resolveRow(m_session.row);
    if (!row) {
        abandonSwipe();
        return;
    }

    // The list's own up handling may still produce a click on this row
    m_tapListener.detach();

    SwipeResolution resolution = resolveSwipeRelease(
        m_config, m_session.deltaX, m_session.velocityX, row->getRowWidth());

    if (resolution == SwipeResolution::COMMIT) {
        startCommit(row);
    } else {
        startSnapBack(row);
    }

    m_host->setSelectorFaded(false, m_config.selectorFadeMs);
    m_velocity.clear();
}

void SwipeGestureController::startCommit(SwipeRow* row) {
    m_phase = SwipePhase::COMMITTING_OUT;

    float width = row->getRowWidth();
    float targetX = m_session.deltaX > 0.0f ? width : -width;

    SwipeRowHandle handle = m_session.row;
    uint64_t generation = m_generation;
    std::weak_ptr<bool> aliveWeak = m_alive;

    row->animateRow(targetX, row->getRowAlpha(), m_config.commitDurationMs,
        [this, aliveWeak, handle, generation]() {
            auto alive = aliveWeak.lock();
            if (!alive || !*alive) return;
            onCommitFinished(handle, generation);
        });
}

void SwipeGestureController::startSnapBack(SwipeRow* row) {
    m_phase = SwipePhase::SNAPPING_BACK;
    m_pendingSnapBacks++;

    uint64_t generation = m_generation;
    std::weak_ptr<bool> aliveWeak = m_alive;

    row->animateRow(0.0f, 1.0f, m_config.snapBackDurationMs,
        [this, aliveWeak, generation]() {
            auto alive = aliveWeak.lock();
            if (!alive || !*alive) return;
            onSnapBackFinished(generation);
        });
}

void SwipeGestureController::onCommitFinished(SwipeRowHandle handle, uint64_t generation) {
    if (generation != m_generation) {
        return;
    }

    m_tapListener.reattach();

    SwipeRow* row = resolveRow(handle);
    if (m_swipeListener) {
        // Copy: the listener may replace itself
        SwipeListener listener = m_swipeListener;
        listener(*m_host, row, handle.index, handle.stableId);
    }

    // The listener reset the host, nothing left to clean up
    if (generation != m_generation) {
        return;
    }

    std::weak_ptr<bool> aliveWeak = m_alive;
    m_host->postDelayed(m_config.resetDelayMs, [this, aliveWeak, handle, generation]() {
        auto alive = aliveWeak.lock();
        if (!alive || !*alive) return;
        onCommitCleanup(handle, generation);
    });
}

void SwipeGestureController::onCommitCleanup(SwipeRowHandle handle, uint64_t generation) {
    if (generation != m_generation) {
        return;
    }

    SwipeRow* row = resolveRow(handle);
    if (row) {
        row->setRowTranslationX(0.0f);
        row->setRowAlpha(1.0f);
    }

    if (m_phase == SwipePhase::COMMITTING_OUT) {
        m_phase = m_pendingSnapBacks > 0 ? SwipePhase::SNAPPING_BACK : SwipePhase::IDLE;
    }
}

void SwipeGestureController::onSnapBackFinished(uint64_t generation) {
    if (generation != m_generation) {
        return;
    }

    if (m_pendingSnapBacks > 0) {
        m_pendingSnapBacks--;
    }
    m_tapListener.reattach();

    if (m_phase == SwipePhase::SNAPPING_BACK && m_pendingSnapBacks == 0) {
        m_phase = SwipePhase::IDLE;
    }
}

} // namespace swipelist
