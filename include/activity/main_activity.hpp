/**
 * SwipeList - Main Activity
 * Demo inbox: swipe a message sideways to dismiss it, tap to open it
 */

#pragma once

#include <borealis.hpp>
#include "view/swipe_list_view.hpp"

#include <vector>

namespace swipelist {

class MainActivity : public brls::Activity {
public:
    MainActivity();

    brls::View* createContentView() override;

    void onContentAvailable() override;

private:
    void updateStatus();
    static std::vector<SwipeListItem> buildInbox();

    SwipeListView* m_list = nullptr;
    brls::Label* m_statusLabel = nullptr;
};

} // namespace swipelist
