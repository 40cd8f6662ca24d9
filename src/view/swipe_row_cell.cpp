/**
 * SwipeList - Swipe Row Cell implementation
 */

#include "view/swipe_row_cell.hpp"

namespace swipelist {

SwipeRowCell::SwipeRowCell() {
    this->setAxis(brls::Axis::COLUMN);
    this->setJustifyContent(brls::JustifyContent::CENTER);
    this->setAlignItems(brls::AlignItems::STRETCH);
    this->setFocusable(true);
    this->setHeight(72);
    this->setPadding(8, 16, 8, 16);
    this->setCornerRadius(6);
    this->setBackgroundColor(nvgRGBA(40, 40, 46, 255));

    // Press highlight behind the labels
    m_highlight = new brls::Rectangle();
    m_highlight->setColor(nvgRGBA(0, 150, 200, 90));
    m_highlight->setPositionType(brls::PositionType::ABSOLUTE);
    m_highlight->setPositionTop(0);
    m_highlight->setPositionLeft(0);
    m_highlight->setPositionRight(0);
    m_highlight->setPositionBottom(0);
    m_highlight->setVisibility(brls::Visibility::INVISIBLE);
    this->addView(m_highlight);

    m_titleLabel = new brls::Label();
    m_titleLabel->setFontSize(18);
    m_titleLabel->setSingleLine(true);
    this->addView(m_titleLabel);

    m_subtitleLabel = new brls::Label();
    m_subtitleLabel->setFontSize(14);
    m_subtitleLabel->setSingleLine(true);
    m_subtitleLabel->setTextColor(nvgRGBA(170, 170, 180, 255));
    m_subtitleLabel->setMarginTop(4);
    this->addView(m_subtitleLabel);
}

SwipeRowCell::~SwipeRowCell() {
    // A row torn down mid-tween still reports the end, the controller
    // relies on it to unblock input
    UiTween::EndCallback pending = m_tween.stop();
    if (pending) {
        brls::sync(pending);
    }
}

void SwipeRowCell::setItem(const SwipeListItem& item) {
    m_item = item;
    m_titleLabel->setText(item.title);
    m_subtitleLabel->setText(item.subtitle);

    if (item.kind == ROW_KIND_SECTION) {
        this->setHeight(40);
        this->setBackgroundColor(nvgRGBA(25, 25, 30, 255));
        m_titleLabel->setFontSize(15);
        m_titleLabel->setTextColor(nvgRGBA(0, 150, 200, 255));
        m_subtitleLabel->setVisibility(brls::Visibility::GONE);
    } else {
        m_subtitleLabel->setVisibility(item.subtitle.empty() ? brls::Visibility::GONE : brls::Visibility::VISIBLE);
    }

    // Reused rows start neutral
    if (!m_tween.isRunning()) {
        setRowTranslationX(0.0f);
        setRowAlpha(1.0f);
        setRowPressed(false);
    }
}

void SwipeRowCell::onLayout() {
    brls::Box::onLayout();
    m_rowWidth = this->getWidth();
}

void SwipeRowCell::setRowTranslationX(float translationX) {
    m_translationX = translationX;
    this->setTranslationX(translationX);
}

void SwipeRowCell::setRowAlpha(float alpha) {
    m_alpha = alpha;
    this->setAlpha(alpha);
}

void SwipeRowCell::setRowPressed(bool pressed) {
    m_pressed = pressed;
    updateHighlight();
}

void SwipeRowCell::setSelectorAlpha(float alpha) {
    m_selectorAlpha = alpha;
    updateHighlight();
}

void SwipeRowCell::updateHighlight() {
    if (!m_highlight) return;

    if (m_pressed && m_selectorAlpha > 0.0f) {
        m_highlight->setAlpha(m_selectorAlpha);
        m_highlight->setVisibility(brls::Visibility::VISIBLE);
    } else {
        m_highlight->setVisibility(brls::Visibility::INVISIBLE);
    }
}

void SwipeRowCell::animateRow(float translationX, float alpha, int durationMs, std::function<void()> onEnd) {
    // Only one tween per row; a replaced tween still reports its end
    UiTween::EndCallback replaced = m_tween.stop();
    if (replaced) {
        brls::sync(replaced);
    }

    float fromX = m_translationX;
    float fromAlpha = m_alpha;

    m_tween.start(durationMs,
        [this, fromX, fromAlpha, translationX, alpha](float progress) {
            setRowTranslationX(fromX + (translationX - fromX) * progress);
            setRowAlpha(fromAlpha + (alpha - fromAlpha) * progress);
        },
        std::move(onEnd));
}

} // namespace swipelist
