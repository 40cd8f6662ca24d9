/**
 * SwipeList - Tap Listener Slot
 * Holds the host's row tap listener so it can be detached while a swipe
 * resolves without the real listener being lost.
 */

#pragma once

#include <functional>

namespace swipelist {

class TapListenerSlot {
public:
    using Listener = std::function<void(int index)>;

    // Remember a new real listener. An empty listener is a no-op registration:
    // the previously remembered listener is kept.
    void registerReal(Listener listener);

    // Detach/reattach nest: the real listener is active again only once every
    // detach has been matched by a reattach.
    void detach();
    void reattach();
    void forceReattach();

    bool isDetached() const { return m_detachDepth > 0; }
    int getDetachDepth() const { return m_detachDepth; }
    bool hasRealListener() const { return static_cast<bool>(m_real); }

    // Listener currently installed (empty while detached)
    Listener getActive() const;

    // Invoke the installed listener; returns false when nothing was called
    bool dispatch(int index) const;

private:
    Listener m_real;
    int m_detachDepth = 0;
};

} // namespace swipelist
