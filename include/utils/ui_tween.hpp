/**
 * SwipeList - UI Tween
 * Main-thread tweens and delayed actions driven by a brls::sync tick chain.
 * Nothing here spawns threads: every tick is queued back onto the UI loop.
 */

#pragma once

#include <borealis.hpp>
#include <chrono>
#include <functional>
#include <memory>

namespace swipelist {

class UiTween {
public:
    using TickCallback = std::function<void(float progress)>;  // eased, 0..1
    using EndCallback = std::function<void()>;

    UiTween();
    ~UiTween();

    UiTween(const UiTween&) = delete;
    UiTween& operator=(const UiTween&) = delete;

    // Restarting a running tween replaces it; the old end callback is not called
    void start(int durationMs, TickCallback onTick, EndCallback onEnd);

    // Stop without reaching the end, returns the end callback that was pending
    EndCallback stop();

    bool isRunning() const { return m_running; }

    static float easeOutCubic(float t);

private:
    void tick();

    TickCallback m_onTick;
    EndCallback m_onEnd;
    std::chrono::steady_clock::time_point m_startTime;
    int m_durationMs = 0;
    bool m_running = false;
    int m_generation = 0;

    std::shared_ptr<bool> m_alive;
};

// Run action on the UI thread once delayMs have passed. Dropped if the
// guard expires first.
void runDelayed(int delayMs, std::function<void()> action, std::weak_ptr<bool> aliveGuard);

} // namespace swipelist
