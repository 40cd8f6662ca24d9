/**
 * SwipeList - Swipe Gesture Recognizer
 * Feeds touch and mouse input of a SwipeListView into its gesture controller.
 * Reports START/STAY only while a row swipe owns the touch, which interrupts
 * the list's scrolling and the row's tap recognizer.
 */

#pragma once

#include <borealis.hpp>

namespace swipelist {

class SwipeListView;

class SwipeGestureRecognizer : public brls::GestureRecognizer {
public:
    explicit SwipeGestureRecognizer(SwipeListView* list);

    brls::GestureState recognitionLoop(brls::TouchState touch, brls::MouseState mouse,
                                        brls::View* view, brls::Sound* soundToPlay) override;

private:
    SwipeListView* m_list;
    bool m_tracking = false;
    brls::Point m_lastPosition;
};

} // namespace swipelist
