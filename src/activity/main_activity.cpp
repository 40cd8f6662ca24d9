/**
 * SwipeList - Main Activity implementation
 */

#include "activity/main_activity.hpp"
#include "app/application.hpp"

namespace swipelist {

MainActivity::MainActivity() {
    brls::Logger::debug("MainActivity created");
}

std::vector<SwipeListItem> MainActivity::buildInbox() {
    std::vector<SwipeListItem> items;
    int64_t nextId = 1;

    auto section = [&items, &nextId](const std::string& title) {
        SwipeListItem item;
        item.id = nextId++;
        item.kind = ROW_KIND_SECTION;
        item.title = title;
        items.push_back(item);
    };

    auto message = [&items, &nextId](const std::string& title, const std::string& subtitle) {
        SwipeListItem item;
        item.id = nextId++;
        item.kind = ROW_KIND_MESSAGE;
        item.title = title;
        item.subtitle = subtitle;
        items.push_back(item);
    };

    section("Today");
    message("Build finished", "Nightly build passed on all targets");
    message("Review requested", "Touch input refactor is waiting for you");
    message("Meeting moved", "Design sync is now at 15:00");
    message("Disk almost full", "Less than 2 GB left on the data partition");

    section("Yesterday");
    message("Weekly report", "Crash rate down 12% since last release");
    message("New follower", "Someone started watching your repository");
    message("Invoice", "Your hosting invoice for this month is ready");

    section("Older");
    message("Welcome", "Swipe a row left or right to dismiss it");
    message("Tip", "A quick flick is enough, no need to drag all the way");

    return items;
}

brls::View* MainActivity::createContentView() {
    auto* root = new brls::Box();
    root->setAxis(brls::Axis::COLUMN);
    root->setPadding(20, 30, 10, 30);

    auto* title = new brls::Label();
    title->setText("Inbox");
    title->setFontSize(26);
    title->setMarginBottom(6);
    root->addView(title);

    m_statusLabel = new brls::Label();
    m_statusLabel->setFontSize(14);
    m_statusLabel->setTextColor(nvgRGBA(170, 170, 180, 255));
    m_statusLabel->setMarginBottom(10);
    root->addView(m_statusLabel);

    m_list = new SwipeListView();
    m_list->setGrow(1.0f);
    root->addView(m_list);

    return root;
}

void MainActivity::onContentAvailable() {
    brls::Logger::debug("MainActivity content available");

    if (!m_list) return;

    Application& app = Application::getInstance();
    const AppSettings& settings = app.getSettings();

    m_list->setSwipeConfig(app.getSwipeConfig());
    if (settings.swipe.ignoreSectionRows) {
        m_list->setIgnoredRowKind(ROW_KIND_SECTION);
    }

    auto* header = new brls::Label();
    header->setText("Swipe a message sideways to dismiss it");
    header->setFontSize(14);
    header->setMarginBottom(8);
    m_list->addHeader(header);

    auto* footer = new brls::Label();
    footer->setText("End of inbox");
    footer->setFontSize(14);
    footer->setMarginTop(8);
    m_list->addFooter(footer);

    m_list->setOnItemClicked([this](int position) {
        int64_t id = m_list->getRowStableId(position);
        brls::Logger::info("MainActivity: opened row {} (id {})", position, id);
        brls::Application::notify("Opened message " + std::to_string(id));
    });

    m_list->setOnItemSwiped([this](SwipeListHost& list, SwipeRow* row, int position, int64_t id) {
        brls::Logger::info("MainActivity: row {} (id {}) swiped away{}", position, id,
                           row ? "" : ", view already recycled");
        if (m_list->removeItem(id)) {
            Application::getInstance().recordDismissed();
        }
        updateStatus();
    });

    m_list->setItems(buildInbox());
    updateStatus();

    brls::Logger::info("MainActivity: inbox ready with {} rows", m_list->getRowCount());
}

void MainActivity::updateStatus() {
    if (!m_statusLabel || !m_list) return;

    int messages = 0;
    for (const SwipeListItem& item : m_list->getItems()) {
        if (item.kind == ROW_KIND_MESSAGE) {
            messages++;
        }
    }

    m_statusLabel->setText(std::to_string(messages) + " messages, " +
                           std::to_string(Application::getInstance().getDismissedCount()) + " dismissed");
}

} // namespace swipelist
