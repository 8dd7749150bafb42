// include/config/config_manager.h
#pragma once

#include <map>
#include <mutex>
#include <string>

namespace terminal_health::config {

// Configuration keys
constexpr const char* KEY_POLLING_INTERVAL = "monitor.polling_interval_seconds";
constexpr const char* KEY_REBOOT_GRACE = "monitor.security_reboot_grace_seconds";
constexpr const char* KEY_REBOOT_REASON = "monitor.reboot_disconnect_reason";
constexpr const char* KEY_FAST_BACKOFF = "recovery.fast_backoff_schedule";
constexpr const char* KEY_SLOW_BACKOFF = "recovery.slow_backoff_schedule";
constexpr const char* KEY_MILESTONE_EVERY = "recovery.milestone_every_attempts";
constexpr const char* KEY_DISCOVERY_TIMEOUT = "recovery.discovery_timeout_seconds";
constexpr const char* KEY_CONNECT_TIMEOUT = "recovery.connect_timeout_seconds";
constexpr const char* KEY_DISCOVERY_DEVICE_TYPE = "recovery.discovery_device_type";
constexpr const char* KEY_INTENT_HARD_TIMEOUT = "payment_intent.hard_timeout_seconds";
constexpr const char* KEY_INTENT_PROACTIVE_REFRESH = "payment_intent.proactive_refresh_seconds";
constexpr const char* KEY_STUCK_AWAITING_INPUT = "payment_intent.stuck_awaiting_input_seconds";
constexpr const char* KEY_INTENT_OP_TIMEOUT = "payment_intent.operation_timeout_seconds";
constexpr const char* KEY_LAYOUT = "terminal.layout";
constexpr const char* KEY_PRESET_AMOUNT = "terminal.preset_amount";
constexpr const char* KEY_PRESET_CATEGORY = "terminal.preset_category";
constexpr const char* KEY_BLIP_SETTLE_MS = "network_blip.settle_delay_ms";
constexpr const char* KEY_LOG_LEVEL = "logging.level";
constexpr const char* KEY_LOG_FILE = "logging.file";
constexpr const char* KEY_SIMULATOR_STATUS_FILE = "simulator.status_file";

// Configuration Manager (INI-style key=value file)
class ConfigManager {
public:
    static ConfigManager& getInstance();

    // Initialize configuration (load from file or write defaults)
    void initialize(const std::string& configPath = "");

    std::string getConfigFilePath() const;

    std::string getString(const std::string& key) const;
    // Falls back (with a warning) when the value is missing or not an integer.
    long getInt(const std::string& key, long fallback) const;

    void set(const std::string& key, const std::string& value);

    // Bulk get/set (key = e.g. "monitor.polling_interval_seconds")
    std::map<std::string, std::string> getAll() const;
    void setFromMap(const std::map<std::string, std::string>& kv);
    void saveIfInitialized();

    /// Re-read the file (manual edits while running)
    void reloadFromFileIfExists();

    /// Restore built-in defaults without touching the file
    void resetToDefaults();

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    static std::map<std::string, std::string> defaults();
    void loadFromFile(const std::string& configPath);
    void saveToFile(const std::string& configPath) const;

    mutable std::mutex mutex_;
    std::string configFilePath_;
    std::map<std::string, std::string> values_;
};

} // namespace terminal_health::config
