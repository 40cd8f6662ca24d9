/**
 * SwipeList - Velocity Tracker implementation
 */

#include "utils/velocity_tracker.hpp"

namespace swipelist {

void VelocityTracker::clear() {
    m_samples.clear();
}

void VelocityTracker::addMovement(float x, int64_t timeMs) {
    // Out-of-order timestamps restart the history
    if (!m_samples.empty() && timeMs < m_samples.back().timeMs) {
        m_samples.clear();
    }

    m_samples.push_back({x, timeMs});

    while (m_samples.size() > MAX_SAMPLES) {
        m_samples.pop_front();
    }
    while (m_samples.size() > 1 && timeMs - m_samples.front().timeMs > HISTORY_WINDOW_MS) {
        m_samples.pop_front();
    }
}

float VelocityTracker::computeVelocity() const {
    if (m_samples.size() < 2) {
        return 0.0f;
    }

    const Sample& oldest = m_samples.front();
    const Sample& newest = m_samples.back();
    int64_t dt = newest.timeMs - oldest.timeMs;
    if (dt <= 0) {
        return 0.0f;
    }

    return (newest.x - oldest.x) * 1000.0f / static_cast<float>(dt);
}

} // namespace swipelist
