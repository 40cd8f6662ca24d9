/**
 * SwipeList - Velocity Tracker
 * Estimates horizontal pointer velocity (px/s) from recent movement history
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

namespace swipelist {

class VelocityTracker {
public:
    void clear();
    void addMovement(float x, int64_t timeMs);

    // Velocity over the samples inside the history window, 0 if not enough data
    float computeVelocity() const;

    size_t getSampleCount() const { return m_samples.size(); }

private:
    struct Sample {
        float x;
        int64_t timeMs;
    };

    std::deque<Sample> m_samples;

    static constexpr int64_t HISTORY_WINDOW_MS = 100;  // Older samples don't describe the flick
    static constexpr size_t MAX_SAMPLES = 20;
};

} // namespace swipelist
