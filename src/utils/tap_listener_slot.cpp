/**
 * SwipeList - Tap Listener Slot implementation
 */

#include "utils/tap_listener_slot.hpp"

namespace swipelist {

void TapListenerSlot::registerReal(Listener listener) {
    if (listener) {
        m_real = std::move(listener);
    }
}

void TapListenerSlot::detach() {
    m_detachDepth++;
}

void TapListenerSlot::reattach() {
    if (m_detachDepth > 0) {
        m_detachDepth--;
    }
}

void TapListenerSlot::forceReattach() {
    m_detachDepth = 0;
}

TapListenerSlot::Listener TapListenerSlot::getActive() const {
    if (m_detachDepth > 0) {
        return nullptr;
    }
    return m_real;
}

bool TapListenerSlot::dispatch(int index) const {
    if (m_detachDepth > 0 || !m_real) {
        return false;
    }
    m_real(index);
    return true;
}

} // namespace swipelist
