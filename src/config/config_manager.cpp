// src/config/config_manager.cpp
#include "config/config_manager.h"
#include "logging/logger.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace terminal_health::config {

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

ConfigManager::ConfigManager()
    : values_(defaults())
{
}

std::map<std::string, std::string> ConfigManager::defaults() {
    return {
        {KEY_POLLING_INTERVAL, "30"},
        {KEY_REBOOT_GRACE, "120"},
        {KEY_REBOOT_REASON, "security_reboot"},
        {KEY_FAST_BACKOFF, "30,60,120,300"},
        {KEY_SLOW_BACKOFF, "60,120,300,600"},
        {KEY_MILESTONE_EVERY, "10"},
        {KEY_DISCOVERY_TIMEOUT, "20"},
        {KEY_CONNECT_TIMEOUT, "15"},
        {KEY_DISCOVERY_DEVICE_TYPE, "tap_to_pay"},
        {KEY_INTENT_HARD_TIMEOUT, "3600"},
        {KEY_INTENT_PROACTIVE_REFRESH, "3000"},
        {KEY_STUCK_AWAITING_INPUT, "300"},
        {KEY_INTENT_OP_TIMEOUT, "10"},
        {KEY_LAYOUT, "zero_touch"},
        {KEY_PRESET_AMOUNT, "100"},
        {KEY_PRESET_CATEGORY, "default"},
        {KEY_BLIP_SETTLE_MS, "500"},
        {KEY_LOG_LEVEL, "INFO"},
        {KEY_LOG_FILE, ""},
        {KEY_SIMULATOR_STATUS_FILE, "terminal_status.json"}
    };
}

void ConfigManager::initialize(const std::string& configPath) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (configPath.empty()) {
            // Default: current working directory / config.ini
            configFilePath_ = (std::filesystem::current_path() / "config.ini").string();
        } else {
            configFilePath_ = configPath;
        }
        values_ = defaults();
    }
    auto& log = logging::Logger::getInstance();
    log.info("Config path: " + configFilePath_);

    if (std::filesystem::exists(configFilePath_)) {
        try {
            loadFromFile(configFilePath_);
            log.info("Configuration loaded from: " + configFilePath_);
        } catch (const std::exception& e) {
            log.warn("Failed to load config file, using defaults: " + std::string(e.what()));
            resetToDefaults();
        }
    } else {
        log.info("Config file not found, writing defaults");
        try {
            saveToFile(configFilePath_);
        } catch (const std::exception& e) {
            log.warn("Failed to save default config: " + std::string(e.what()));
        }
    }
}

std::string ConfigManager::getConfigFilePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configFilePath_;
}

void ConfigManager::loadFromFile(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + configPath);
    }

    std::map<std::string, std::string> loaded = defaults();
    std::string line;
    while (std::getline(file, line)) {
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, eqPos);
        std::string value = line.substr(eqPos + 1);

        // Trim whitespace (and a trailing CR from files edited on Windows)
        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t\r") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r") + 1);

        if (loaded.find(key) == loaded.end()) {
            logging::Logger::getInstance().warn("Unknown config key ignored: " + key);
            continue;
        }
        loaded[key] = value;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    values_ = loaded;
}

void ConfigManager::saveToFile(const std::string& configPath) const {
    std::ofstream file(configPath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create config file: " + configPath);
    }

    file << "# Terminal Health Service Configuration\n";
    std::string section;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : values_) {
        std::string keySection = key.substr(0, key.find('.'));
        if (keySection != section) {
            section = keySection;
            file << "\n# " << section << "\n";
        }
        file << key << "=" << value << "\n";
    }
}

std::string ConfigManager::getString(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    return it != values_.end() ? it->second : std::string();
}

long ConfigManager::getInt(const std::string& key, long fallback) const {
    std::string text = getString(key);
    try {
        size_t consumed = 0;
        long value = std::stol(text, &consumed);
        if (consumed == text.size()) {
            return value;
        }
    } catch (const std::exception&) {
        // fall through to the warning below
    }
    logging::Logger::getInstance().warn("Config " + key + "=\"" + text + "\" is not an integer, using "
        + std::to_string(fallback));
    return fallback;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

std::map<std::string, std::string> ConfigManager::getAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_;
}

void ConfigManager::setFromMap(const std::map<std::string, std::string>& kv) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : kv) {
        values_[key] = value;
    }
}

void ConfigManager::saveIfInitialized() {
    std::string path = getConfigFilePath();
    if (path.empty()) {
        return;
    }
    try {
        saveToFile(path);
    } catch (const std::exception& e) {
        logging::Logger::getInstance().warn("Failed to save config: " + std::string(e.what()));
    }
}

void ConfigManager::reloadFromFileIfExists() {
    std::string path = getConfigFilePath();
    if (path.empty() || !std::filesystem::exists(path)) {
        return;
    }
    try {
        loadFromFile(path);
    } catch (const std::exception& e) {
        logging::Logger::getInstance().warn("Config reload failed: " + std::string(e.what()));
    }
}

void ConfigManager::resetToDefaults() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_ = defaults();
}

} // namespace terminal_health::config
