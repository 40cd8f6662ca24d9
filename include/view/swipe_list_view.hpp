/**
 * SwipeList - Swipe List View
 * Scrolling list whose rows can be swiped away sideways.
 * Vertical drags scroll the list, horizontal drags move the touched row and
 * either dismiss it (listener is notified) or let it snap back.
 */

#pragma once

#include <borealis.hpp>
#include "view/swipe_gesture.hpp"
#include "view/swipe_row_cell.hpp"
#include "utils/ui_tween.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace swipelist {

class SwipeListView : public brls::ScrollingFrame, public SwipeListHost {
public:
    SwipeListView();
    ~SwipeListView() override;

    void setItems(const std::vector<SwipeListItem>& items);
    const std::vector<SwipeListItem>& getItems() const { return m_items; }

    // Drop one item, the rows are rebuilt on the next frame
    bool removeItem(int64_t stableId);

    // Decoration rows above and below the items, never swipeable
    void addHeader(brls::View* header);
    void addFooter(brls::View* footer);

    // Tap on a row, receives the list position (headers included).
    // Passing an empty callback keeps the current one.
    void setOnItemClicked(TapListenerSlot::Listener listener);
    void setOnItemSwiped(SwipeListener listener);

    void setIgnoredRowKind(int kind);
    void clearIgnoredRowKind();
    void setSwipeConfig(const SwipeConfig& config);

    bool isSwiping() const { return m_gesture.isSwiping(); }

    SwipeGestureController& getGestureController() { return m_gesture; }

    // Called by the gesture recognizer around every touch
    void setTouchedRowPressed(float x, float y, bool pressed);

    // SwipeListHost
    int getRowAtPoint(float x, float y) const override;
    int getRowCount() const override;
    int getHeaderCount() const override { return static_cast<int>(m_headers.size()); }
    int getFooterCount() const override { return static_cast<int>(m_footers.size()); }
    int getRowKind(int index) const override;
    int64_t getRowStableId(int index) const override;
    SwipeRow* getVisibleRow(int index) override;
    void setSelectorFaded(bool faded, int durationMs) override;
    void postDelayed(int delayMs, std::function<void()> action) override;

    static brls::View* create();

private:
    void rebuildRows();
    void applySelectorAlpha(float alpha);
    const SwipeListItem* getItemAt(int index) const;

    SwipeGestureController m_gesture;

    std::vector<SwipeListItem> m_items;
    std::vector<brls::View*> m_headers;
    std::vector<brls::View*> m_footers;

    brls::Box* m_contentBox = nullptr;
    std::vector<brls::View*> m_rows;        // Every row by list position
    std::vector<SwipeRowCell*> m_cells;     // Same positions, nullptr for decoration rows

    UiTween m_selectorTween;
    float m_selectorAlpha = 1.0f;
    SwipeRowCell* m_pressedCell = nullptr;

    bool m_rebuildPending = false;
    std::shared_ptr<bool> m_alive;
};

} // namespace swipelist
