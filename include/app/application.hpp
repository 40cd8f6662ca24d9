/**
 * SwipeList - Swipe-to-dismiss list demo
 * Borealis-based Application
 */

#pragma once

#include "view/swipe_gesture.hpp"

#include <string>

// Application version
#define SWIPELIST_VERSION "1.0.0"
#define SWIPELIST_VERSION_NUM 100

#define SWIPELIST_APP_NAME "SwipeList"

namespace swipelist {

// Swipe tuning persisted with the app settings
struct SwipeSettings {
    float minSwipeDistance = 40.0f;
    float speedDamping = 0.75f;
    float swipeVelocityThreshold = 1200.0f;
    int commitDurationMs = 300;
    int snapBackDurationMs = 300;
    int selectorFadeMs = 500;
    int resetDelayMs = 50;
    bool ignoreSectionRows = true;  // Section titles can't be swiped away
};

// Application settings structure
struct AppSettings {
    bool debugLogging = false;

    SwipeSettings swipe;
};

/**
 * Application singleton - manages app lifecycle and global state
 */
class Application {
public:
    static Application& getInstance();

    // Initialize and run the application
    bool init();
    void run();
    void shutdown();

    // Navigation
    void pushMainActivity();

    // Settings persistence
    bool loadSettings();
    bool saveSettings();

    // Application settings access
    AppSettings& getSettings() { return m_settings; }
    const AppSettings& getSettings() const { return m_settings; }

    // Gesture configuration built from the current settings
    SwipeConfig getSwipeConfig() const;

    // Apply log level based on settings
    void applyLogLevel();

    // Running count of rows swiped away, saved with the settings
    int getDismissedCount() const { return m_dismissedCount; }
    void recordDismissed() { m_dismissedCount++; }

private:
    Application() = default;
    ~Application() = default;
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    void validateSettings();

    bool m_initialized = false;
    int m_dismissedCount = 0;
    AppSettings m_settings;
};

} // namespace swipelist
