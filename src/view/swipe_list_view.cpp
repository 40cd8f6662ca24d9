/**
 * SwipeList - Swipe List View implementation
 */

#include "view/swipe_list_view.hpp"
#include "view/swipe_gesture_recognizer.hpp"

#include <algorithm>

namespace swipelist {

SwipeListView::SwipeListView()
    : m_gesture(this)
{
    m_alive = std::make_shared<bool>(true);
    this->setScrollingBehavior(brls::ScrollingBehavior::CENTERED);

    m_contentBox = new brls::Box();
    m_contentBox->setAxis(brls::Axis::COLUMN);
    m_contentBox->setPadding(10);
    this->setContentView(m_contentBox);

    // Sits next to the frame's own scrolling pan, it claims the touch only
    // once a horizontal swipe has latched
    this->addGestureRecognizer(new SwipeGestureRecognizer(this));
}

SwipeListView::~SwipeListView() {
    *m_alive = false;
}

brls::View* SwipeListView::create() {
    return new SwipeListView();
}

void SwipeListView::setItems(const std::vector<SwipeListItem>& items) {
    brls::Logger::debug("SwipeListView: setItems with {} items", items.size());

    // Every row is about to be replaced, nothing in flight is valid anymore
    m_gesture.reset();
    m_items = items;
    rebuildRows();
}

bool SwipeListView::removeItem(int64_t stableId) {
    auto it = std::find_if(m_items.begin(), m_items.end(),
                           [stableId](const SwipeListItem& item) { return item.id == stableId; });
    if (it == m_items.end()) {
        brls::Logger::warning("SwipeListView: removeItem - no item with id {}", stableId);
        return false;
    }

    m_items.erase(it);
    brls::Logger::debug("SwipeListView: removed item {}, {} left", stableId, m_items.size());

    // Removal usually comes from inside a row's own completion callback,
    // rebuild once the current frame is done with it
    if (!m_rebuildPending) {
        m_rebuildPending = true;
        std::weak_ptr<bool> aliveWeak = m_alive;
        brls::sync([this, aliveWeak]() {
            auto alive = aliveWeak.lock();
            if (!alive || !*alive) return;
            m_rebuildPending = false;
            rebuildRows();
        });
    }
    return true;
}

void SwipeListView::addHeader(brls::View* header) {
    if (!header) return;
    m_headers.push_back(header);
    rebuildRows();
}

void SwipeListView::addFooter(brls::View* footer) {
    if (!footer) return;
    m_footers.push_back(footer);
    rebuildRows();
}

void SwipeListView::setOnItemClicked(TapListenerSlot::Listener listener) {
    m_gesture.getTapListener().registerReal(std::move(listener));
}

void SwipeListView::setOnItemSwiped(SwipeListener listener) {
    m_gesture.setOnRowSwiped(std::move(listener));
}

void SwipeListView::setIgnoredRowKind(int kind) {
    m_gesture.setIgnoredRowKind(kind);
}

void SwipeListView::clearIgnoredRowKind() {
    m_gesture.clearIgnoredRowKind();
}

void SwipeListView::setSwipeConfig(const SwipeConfig& config) {
    m_gesture.setConfig(config);
}

void SwipeListView::rebuildRows() {
    m_pressedCell = nullptr;

    // Keep the decoration views alive, free the cells
    std::vector<brls::View*> children = m_contentBox->getChildren();
    for (brls::View* child : children) {
        bool decoration = std::find(m_headers.begin(), m_headers.end(), child) != m_headers.end() ||
                          std::find(m_footers.begin(), m_footers.end(), child) != m_footers.end();
        m_contentBox->removeView(child, !decoration);
    }
    m_rows.clear();
    m_cells.clear();

    for (brls::View* header : m_headers) {
        m_contentBox->addView(header);
        m_rows.push_back(header);
        m_cells.push_back(nullptr);
    }

    for (size_t i = 0; i < m_items.size(); i++) {
        auto* cell = new SwipeRowCell();
        cell->setItem(m_items[i]);
        cell->setMarginBottom(6);
        cell->setSelectorAlpha(m_selectorAlpha);

        int position = static_cast<int>(m_rows.size());
        cell->registerClickAction([this, position](brls::View* view) {
            if (!m_gesture.getTapListener().dispatch(position)) {
                brls::Logger::debug("SwipeListView: tap on row {} dropped, listener detached", position);
            }
            return true;
        });
        cell->addGestureRecognizer(new brls::TapGestureRecognizer(cell));

        m_contentBox->addView(cell);
        m_rows.push_back(cell);
        m_cells.push_back(cell);
    }

    for (brls::View* footer : m_footers) {
        m_contentBox->addView(footer);
        m_rows.push_back(footer);
        m_cells.push_back(nullptr);
    }

    brls::Logger::debug("SwipeListView: built {} rows ({} headers, {} footers)",
                        m_rows.size(), m_headers.size(), m_footers.size());
}

const SwipeListItem* SwipeListView::getItemAt(int index) const {
    int itemIndex = index - getHeaderCount();
    if (itemIndex < 0 || itemIndex >= static_cast<int>(m_items.size())) {
        return nullptr;
    }
    return &m_items[itemIndex];
}

int SwipeListView::getRowAtPoint(float x, float y) const {
    for (size_t i = 0; i < m_rows.size(); i++) {
        brls::View* row = m_rows[i];
        if (!row || row->getVisibility() != brls::Visibility::VISIBLE) continue;

        // Hit-test the laid out slot, a row dragged sideways still owns it
        float left = row->getX() - (m_cells[i] ? m_cells[i]->getRowTranslationX() : 0.0f);
        float top = row->getY();
        if (x >= left && x < left + row->getWidth() &&
            y >= top && y < top + row->getHeight()) {
            return static_cast<int>(i);
        }
    }
    // Margins between rows and empty space below the last one
    return INVALID_POSITION;
}

int SwipeListView::getRowCount() const {
    return static_cast<int>(m_rows.size());
}

int SwipeListView::getRowKind(int index) const {
    const SwipeListItem* item = getItemAt(index);
    return item ? item->kind : ROW_KIND_DECORATION;
}

int64_t SwipeListView::getRowStableId(int index) const {
    const SwipeListItem* item = getItemAt(index);
    return item ? item->id : -1;
}

SwipeRow* SwipeListView::getVisibleRow(int index) {
    if (index < 0 || index >= static_cast<int>(m_cells.size())) {
        return nullptr;
    }
    return m_cells[index];
}

void SwipeListView::setTouchedRowPressed(float x, float y, bool pressed) {
    if (!pressed) {
        if (m_pressedCell) {
            m_pressedCell->setRowPressed(false);
            m_pressedCell = nullptr;
        }
        return;
    }

    int index = getRowAtPoint(x, y);
    if (index == INVALID_POSITION || !m_cells[index]) return;

    if (m_pressedCell && m_pressedCell != m_cells[index]) {
        m_pressedCell->setRowPressed(false);
    }
    m_pressedCell = m_cells[index];
    m_pressedCell->setRowPressed(true);
}

void SwipeListView::setSelectorFaded(bool faded, int durationMs) {
    float from = m_selectorAlpha;
    float to = faded ? 0.0f : 1.0f;

    if (durationMs <= 0) {
        m_selectorTween.stop();
        applySelectorAlpha(to);
        return;
    }

    m_selectorTween.start(durationMs,
        [this, from, to](float progress) {
            applySelectorAlpha(from + (to - from) * progress);
        },
        nullptr);
}

void SwipeListView::applySelectorAlpha(float alpha) {
    m_selectorAlpha = alpha;
    for (SwipeRowCell* cell : m_cells) {
        if (cell) {
            cell->setSelectorAlpha(alpha);
        }
    }
}

void SwipeListView::postDelayed(int delayMs, std::function<void()> action) {
    runDelayed(delayMs, std::move(action), m_alive);
}

} // namespace swipelist
