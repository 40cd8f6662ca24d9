/**
 * SwipeList - Swipe Gesture Recognizer implementation
 */

#include "view/swipe_gesture_recognizer.hpp"
#include "view/swipe_list_view.hpp"

#include <chrono>

namespace swipelist {

static int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

SwipeGestureRecognizer::SwipeGestureRecognizer(SwipeListView* list)
    : m_list(list)
{
    this->state = brls::GestureState::FAILED;
}

brls::GestureState SwipeGestureRecognizer::recognitionLoop(
    brls::TouchState touch, brls::MouseState mouse, brls::View* view, brls::Sound* soundToPlay)
{
    SwipeGestureController& gesture = m_list->getGestureController();

    brls::TouchPhase phase = touch.phase;
    brls::Point position = touch.position;

    // Also handle mouse
    if (phase == brls::TouchPhase::NONE) {
        position = mouse.position;
        phase = mouse.leftButton;
    }

    if (!enabled || phase == brls::TouchPhase::NONE) {
        // Input vanished mid-gesture, resolve it like a release
        if (m_tracking) {
            gesture.onPointerCancel({m_lastPosition.x, m_lastPosition.y, nowMs()});
            m_list->setTouchedRowPressed(m_lastPosition.x, m_lastPosition.y, false);
            m_tracking = false;
        }
        this->state = brls::GestureState::FAILED;
        return this->state;
    }

    // The list started scrolling, or a row's tap won
    if (this->state == brls::GestureState::INTERRUPTED) {
        if (m_tracking) {
            brls::Logger::debug("SwipeGestureRecognizer: interrupted while {}",
                                swipePhaseName(gesture.getPhase()));
            gesture.onPointerCancel({position.x, position.y, nowMs()});
            m_list->setTouchedRowPressed(position.x, position.y, false);
            m_tracking = false;
        }
        return this->state;
    }

    SwipePointerEvent event{position.x, position.y, nowMs()};
    m_lastPosition = position;

    switch (phase) {
        case brls::TouchPhase::START: {
            m_tracking = true;
            m_list->setTouchedRowPressed(position.x, position.y, true);
            gesture.onPointerDown(event);
            this->state = brls::GestureState::UNSURE;
            break;
        }

        case brls::TouchPhase::STAY: {
            if (!m_tracking) {
                break;
            }

            bool consumed = gesture.onPointerMove(event);
            if (consumed) {
                // First consumed move claims the touch
                bool claimed = this->state == brls::GestureState::START ||
                               this->state == brls::GestureState::STAY;
                this->state = claimed ? brls::GestureState::STAY : brls::GestureState::START;
            } else if (gesture.getPhase() == SwipePhase::SCROLLING) {
                m_list->setTouchedRowPressed(position.x, position.y, false);
                this->state = brls::GestureState::FAILED;
            }
            break;
        }

        case brls::TouchPhase::END: {
            bool wasSwiping = gesture.isSwiping();
            gesture.onPointerUp(event);
            if (wasSwiping) {
                brls::Logger::debug("SwipeGestureRecognizer: released, {}",
                                    swipePhaseName(gesture.getPhase()));
            }
            m_list->setTouchedRowPressed(position.x, position.y, false);
            m_tracking = false;
            this->state = wasSwiping ? brls::GestureState::END : brls::GestureState::FAILED;
            break;
        }

        case brls::TouchPhase::NONE:
            m_tracking = false;
            this->state = brls::GestureState::FAILED;
            break;
    }

    return this->state;
}

} // namespace swipelist
