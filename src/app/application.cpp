/**
 * SwipeList - Application implementation
 */

#include "app/application.hpp"
#include "activity/main_activity.hpp"

#include <borealis.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace swipelist {

static const char* SETTINGS_PATH = "./SwipeList_settings.json";

Application& Application::getInstance() {
    static Application instance;
    return instance;
}

bool Application::init() {
    brls::Logger::setLogLevel(brls::LogLevel::LOG_DEBUG);
    brls::Logger::info("SwipeList {} initializing...", SWIPELIST_VERSION);

    // Load saved settings
    bool loaded = loadSettings();
    brls::Logger::info("Settings load result: {}", loaded ? "success" : "failed/not found");

    applyLogLevel();

    m_initialized = true;
    return true;
}

void Application::run() {
    pushMainActivity();

    // Main loop handled by Borealis
    while (brls::Application::mainLoop()) {
        // Application keeps running
    }
}

void Application::shutdown() {
    saveSettings();
    m_initialized = false;
    brls::Logger::info("SwipeList shutting down ({} rows dismissed)", m_dismissedCount);
}

void Application::pushMainActivity() {
    brls::Application::pushActivity(new MainActivity());
}

void Application::applyLogLevel() {
    if (m_settings.debugLogging) {
        brls::Logger::setLogLevel(brls::LogLevel::LOG_DEBUG);
        brls::Logger::info("Debug logging enabled");
    } else {
        brls::Logger::setLogLevel(brls::LogLevel::LOG_INFO);
        brls::Logger::info("Debug logging disabled");
    }
}

SwipeConfig Application::getSwipeConfig() const {
    const SwipeSettings& swipe = m_settings.swipe;

    SwipeConfig config;
    config.minSwipeDistance = swipe.minSwipeDistance;
    config.speedDamping = swipe.speedDamping;
    config.swipeVelocityThreshold = swipe.swipeVelocityThreshold;
    config.commitDurationMs = swipe.commitDurationMs;
    config.snapBackDurationMs = swipe.snapBackDurationMs;
    config.selectorFadeMs = swipe.selectorFadeMs;
    config.resetDelayMs = swipe.resetDelayMs;
    return config;
}

void Application::validateSettings() {
    SwipeSettings& swipe = m_settings.swipe;
    const SwipeSettings defaults;

    if (swipe.minSwipeDistance < 1.0f || swipe.minSwipeDistance > 400.0f) {
        brls::Logger::warning("loadSettings: minSwipeDistance {} out of range, using {}",
                              swipe.minSwipeDistance, defaults.minSwipeDistance);
        swipe.minSwipeDistance = defaults.minSwipeDistance;
    }
    if (swipe.speedDamping <= 0.0f || swipe.speedDamping > 1.0f) {
        brls::Logger::warning("loadSettings: speedDamping {} out of range, using {}",
                              swipe.speedDamping, defaults.speedDamping);
        swipe.speedDamping = defaults.speedDamping;
    }
    if (swipe.swipeVelocityThreshold <= 0.0f) {
        swipe.swipeVelocityThreshold = defaults.swipeVelocityThreshold;
    }
    if (swipe.commitDurationMs < 0 || swipe.commitDurationMs > 5000) {
        swipe.commitDurationMs = defaults.commitDurationMs;
    }
    if (swipe.snapBackDurationMs < 0 || swipe.snapBackDurationMs > 5000) {
        swipe.snapBackDurationMs = defaults.snapBackDurationMs;
    }
    if (swipe.selectorFadeMs < 0 || swipe.selectorFadeMs > 5000) {
        swipe.selectorFadeMs = defaults.selectorFadeMs;
    }
    if (swipe.resetDelayMs < 0 || swipe.resetDelayMs > 1000) {
        swipe.resetDelayMs = defaults.resetDelayMs;
    }
}

bool Application::loadSettings() {
    brls::Logger::debug("loadSettings: Opening {}", SETTINGS_PATH);

    std::ifstream file(SETTINGS_PATH);
    if (!file.is_open()) {
        brls::Logger::debug("No settings file found");
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();
    file.close();

    brls::Logger::debug("loadSettings: Read {} bytes", content.length());

    if (content.empty() || content.length() > 16384) {
        brls::Logger::error("loadSettings: Invalid file size");
        return false;
    }

    // Locate the raw value text of a key, npos if absent
    auto findValue = [&content](const std::string& key) -> size_t {
        std::string search = "\"" + key + "\":";
        size_t pos = content.find(search);
        if (pos == std::string::npos) return std::string::npos;
        pos += search.length();
        while (pos < content.length() && (content[pos] == ' ' || content[pos] == '\t')) pos++;
        return pos;
    };

    // Parse integers
    auto extractInt = [&content, &findValue](const std::string& key, int defaultVal) -> int {
        size_t pos = findValue(key);
        if (pos == std::string::npos) return defaultVal;
        size_t end = content.find_first_of(",}\n", pos);
        if (end == std::string::npos) return defaultVal;
        return atoi(content.substr(pos, end - pos).c_str());
    };

    // Parse floats
    auto extractFloat = [&content, &findValue](const std::string& key, float defaultVal) -> float {
        size_t pos = findValue(key);
        if (pos == std::string::npos) return defaultVal;
        size_t end = content.find_first_of(",}\n", pos);
        if (end == std::string::npos) return defaultVal;
        return static_cast<float>(atof(content.substr(pos, end - pos).c_str()));
    };

    // Parse booleans
    auto extractBool = [&content, &findValue](const std::string& key, bool defaultVal) -> bool {
        size_t pos = findValue(key);
        if (pos == std::string::npos) return defaultVal;
        return (content.substr(pos, 4) == "true");
    };

    m_settings.debugLogging = extractBool("debugLogging", false);
    m_dismissedCount = extractInt("dismissedCount", 0);

    SwipeSettings& swipe = m_settings.swipe;
    swipe.minSwipeDistance = extractFloat("minSwipeDistance", swipe.minSwipeDistance);
    swipe.speedDamping = extractFloat("speedDamping", swipe.speedDamping);
    swipe.swipeVelocityThreshold = extractFloat("swipeVelocityThreshold", swipe.swipeVelocityThreshold);
    swipe.commitDurationMs = extractInt("commitDurationMs", swipe.commitDurationMs);
    swipe.snapBackDurationMs = extractInt("snapBackDurationMs", swipe.snapBackDurationMs);
    swipe.selectorFadeMs = extractInt("selectorFadeMs", swipe.selectorFadeMs);
    swipe.resetDelayMs = extractInt("resetDelayMs", swipe.resetDelayMs);
    swipe.ignoreSectionRows = extractBool("ignoreSectionRows", swipe.ignoreSectionRows);

    validateSettings();

    brls::Logger::info("loadSettings: minSwipeDistance={}, speedDamping={}, velocityThreshold={}",
                       swipe.minSwipeDistance, swipe.speedDamping, swipe.swipeVelocityThreshold);
    return true;
}

bool Application::saveSettings() {
    brls::Logger::info("saveSettings: Saving to {}", SETTINGS_PATH);

    const SwipeSettings& swipe = m_settings.swipe;

    // Create JSON content
    std::string json = "{\n";
    json += "  \"debugLogging\": " + std::string(m_settings.debugLogging ? "true" : "false") + ",\n";
    json += "  \"dismissedCount\": " + std::to_string(m_dismissedCount) + ",\n";

    // Swipe settings
    json += "  \"minSwipeDistance\": " + std::to_string(swipe.minSwipeDistance) + ",\n";
    json += "  \"speedDamping\": " + std::to_string(swipe.speedDamping) + ",\n";
    json += "  \"swipeVelocityThreshold\": " + std::to_string(swipe.swipeVelocityThreshold) + ",\n";
    json += "  \"commitDurationMs\": " + std::to_string(swipe.commitDurationMs) + ",\n";
    json += "  \"snapBackDurationMs\": " + std::to_string(swipe.snapBackDurationMs) + ",\n";
    json += "  \"selectorFadeMs\": " + std::to_string(swipe.selectorFadeMs) + ",\n";
    json += "  \"resetDelayMs\": " + std::to_string(swipe.resetDelayMs) + ",\n";
    json += "  \"ignoreSectionRows\": " + std::string(swipe.ignoreSectionRows ? "true" : "false") + "\n";
    json += "}\n";

    std::ofstream file(SETTINGS_PATH);
    if (!file.is_open()) {
        brls::Logger::error("saveSettings: Cannot open {} for writing", SETTINGS_PATH);
        return false;
    }
    file << json;
    file.close();

    if (file.fail()) {
        brls::Logger::error("saveSettings: Write to {} failed", SETTINGS_PATH);
        return false;
    }

    brls::Logger::debug("saveSettings: Wrote {} bytes", json.length());
    return true;
}

} // namespace swipelist
