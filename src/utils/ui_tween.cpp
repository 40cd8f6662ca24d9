/**
 * SwipeList - UI Tween implementation
 */

#include "utils/ui_tween.hpp"

#include <algorithm>

namespace swipelist {

UiTween::UiTween() {
    m_alive = std::make_shared<bool>(true);
}

UiTween::~UiTween() {
    *m_alive = false;
}

float UiTween::easeOutCubic(float t) {
    t = std::max(0.0f, std::min(1.0f, t));
    return 1.0f - (1.0f - t) * (1.0f - t) * (1.0f - t);
}

void UiTween::start(int durationMs, TickCallback onTick, EndCallback onEnd) {
    m_onTick = std::move(onTick);
    m_onEnd = std::move(onEnd);
    m_durationMs = std::max(0, durationMs);
    m_startTime = std::chrono::steady_clock::now();
    m_running = true;
    m_generation++;

    tick();
}

UiTween::EndCallback UiTween::stop() {
    m_running = false;
    m_generation++;
    m_onTick = nullptr;

    EndCallback pending = std::move(m_onEnd);
    m_onEnd = nullptr;
    return pending;
}

void UiTween::tick() {
    std::weak_ptr<bool> aliveWeak = m_alive;
    int generation = m_generation;

    brls::sync([this, aliveWeak, generation]() {
        auto alive = aliveWeak.lock();
        if (!alive || !*alive) return;
        if (!m_running || generation != m_generation) return;

        auto now = std::chrono::steady_clock::now();
        int elapsed = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now - m_startTime).count());

        float t = m_durationMs > 0 ? std::min(1.0f, static_cast<float>(elapsed) / m_durationMs) : 1.0f;

        if (m_onTick) {
            m_onTick(easeOutCubic(t));
        }

        // The tick callback may have restarted or stopped us
        if (!m_running || generation != m_generation) return;

        if (t >= 1.0f) {
            m_running = false;
            m_onTick = nullptr;
            EndCallback onEnd = std::move(m_onEnd);
            m_onEnd = nullptr;
            if (onEnd) {
                onEnd();
            }
        } else {
            tick();
        }
    });
}

// Re-queued every frame until the deadline, the UI loop never blocks
static void pollDelayed(std::chrono::steady_clock::time_point deadline, std::function<void()> action,
                        std::weak_ptr<bool> aliveGuard) {
    brls::sync([deadline, action, aliveGuard]() {
        auto alive = aliveGuard.lock();
        if (!alive || !*alive) return;

        if (std::chrono::steady_clock::now() < deadline) {
            pollDelayed(deadline, action, aliveGuard);
            return;
        }
        action();
    });
}

void runDelayed(int delayMs, std::function<void()> action, std::weak_ptr<bool> aliveGuard) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(0, delayMs));
    pollDelayed(deadline, std::move(action), std::move(aliveGuard));
}

} // namespace swipelist
