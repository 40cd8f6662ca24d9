/**
 * SwipeList - entry point
 */

#include <borealis.hpp>
#include <cstdlib>

#include "app/application.hpp"
#include "view/swipe_list_view.hpp"

int main(int argc, char* argv[]) {
    if (!brls::Application::init()) {
        brls::Logger::error("Unable to init Borealis application");
        return EXIT_FAILURE;
    }

    brls::Application::createWindow(SWIPELIST_APP_NAME);
    brls::Application::setGlobalQuit(true);

    brls::Application::registerXMLView("SwipeListView", swipelist::SwipeListView::create);

    swipelist::Application& app = swipelist::Application::getInstance();
    if (!app.init()) {
        brls::Logger::error("SwipeList failed to initialize");
        return EXIT_FAILURE;
    }

    app.run();
    app.shutdown();

    return EXIT_SUCCESS;
}
