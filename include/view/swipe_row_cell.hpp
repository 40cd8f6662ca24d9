/**
 * SwipeList - Swipe Row Cell
 * One list row that can be dragged sideways and tweened off screen or back
 */

#pragma once

#include <borealis.hpp>
#include "view/swipe_gesture.hpp"
#include "utils/ui_tween.hpp"

#include <cstdint>
#include <string>

namespace swipelist {

// Row kinds used by the list
constexpr int ROW_KIND_MESSAGE = 0;
constexpr int ROW_KIND_SECTION = 1;
constexpr int ROW_KIND_DECORATION = -1;  // Header and footer rows

struct SwipeListItem {
    int64_t id = -1;
    int kind = ROW_KIND_MESSAGE;
    std::string title;
    std::string subtitle;
};

class SwipeRowCell : public brls::Box, public SwipeRow {
public:
    SwipeRowCell();
    ~SwipeRowCell() override;

    void setItem(const SwipeListItem& item);
    const SwipeListItem& getItem() const { return m_item; }

    // Alpha of the press highlight, faded by the list while a swipe runs
    void setSelectorAlpha(float alpha);

    void onLayout() override;

    // SwipeRow
    float getRowWidth() const override { return m_rowWidth; }
    float getRowTranslationX() const override { return m_translationX; }
    void setRowTranslationX(float translationX) override;
    float getRowAlpha() const override { return m_alpha; }
    void setRowAlpha(float alpha) override;
    void setRowPressed(bool pressed) override;
    bool isRowAnimating() const override { return m_tween.isRunning(); }
    void animateRow(float translationX, float alpha, int durationMs, std::function<void()> onEnd) override;

private:
    void updateHighlight();

    SwipeListItem m_item;

    float m_rowWidth = 0.0f;
    float m_translationX = 0.0f;
    float m_alpha = 1.0f;
    float m_selectorAlpha = 1.0f;
    bool m_pressed = false;

    UiTween m_tween;

    brls::Rectangle* m_highlight = nullptr;
    brls::Label* m_titleLabel = nullptr;
    brls::Label* m_subtitleLabel = nullptr;
};

} // namespace swipelist
