// src/core/monitor_settings.cpp
#include "core/monitor_settings.h"
#include "config/config_manager.h"
#include "logging/logger.h"

namespace terminal_health::core {

namespace {

long positiveOr(const config::ConfigManager& config, const char* key, long fallback) {
    long value = config.getInt(key, fallback);
    if (value <= 0) {
        logging::Logger::getInstance().warn(std::string("Config ") + key + " must be positive, using "
            + std::to_string(fallback));
        return fallback;
    }
    return value;
}

recovery::BackoffPolicy scheduleOr(const config::ConfigManager& config, const char* key,
                                   const recovery::BackoffPolicy& fallback) {
    std::string text = config.getString(key);
    auto parsed = recovery::BackoffPolicy::parse(text);
    if (!parsed) {
        logging::Logger::getInstance().warn(std::string("Config ") + key + "=\"" + text
            + "\" is not a valid schedule, using " + fallback.toString());
        return fallback;
    }
    return *parsed;
}

} // namespace

MonitorSettings MonitorSettings::fromConfig(const config::ConfigManager& config) {
    MonitorSettings settings;

    settings.pollingInterval = Seconds(positiveOr(config, config::KEY_POLLING_INTERVAL, 30));
    settings.rebootGrace = Seconds(positiveOr(config, config::KEY_REBOOT_GRACE, 120));
    std::string reason = config.getString(config::KEY_REBOOT_REASON);
    if (!reason.empty()) {
        settings.rebootDisconnectReason = reason;
    }

    settings.fastBackoff = scheduleOr(config, config::KEY_FAST_BACKOFF, recovery::BackoffPolicy::fastDefault());
    settings.slowBackoff = scheduleOr(config, config::KEY_SLOW_BACKOFF, recovery::BackoffPolicy::slowDefault());
    settings.milestoneEvery = static_cast<int>(positiveOr(config, config::KEY_MILESTONE_EVERY, 10));

    settings.executorTimeouts.discovery = std::chrono::seconds(positiveOr(config, config::KEY_DISCOVERY_TIMEOUT, 20));
    settings.executorTimeouts.connect = std::chrono::seconds(positiveOr(config, config::KEY_CONNECT_TIMEOUT, 15));
    std::string deviceType = config.getString(config::KEY_DISCOVERY_DEVICE_TYPE);
    if (!deviceType.empty()) {
        settings.discoveryDeviceType = deviceType;
    }

    settings.lifecycle.hardTimeout = Seconds(positiveOr(config, config::KEY_INTENT_HARD_TIMEOUT, 3600));
    settings.lifecycle.proactiveRefresh = Seconds(positiveOr(config, config::KEY_INTENT_PROACTIVE_REFRESH, 3000));
    settings.lifecycle.stuckAwaitingInput = Seconds(positiveOr(config, config::KEY_STUCK_AWAITING_INPUT, 300));
    if (settings.lifecycle.proactiveRefresh >= settings.lifecycle.hardTimeout) {
        logging::Logger::getInstance().warn("Config proactive refresh ("
            + std::to_string(settings.lifecycle.proactiveRefresh.count()) + "s) must be below hard timeout ("
            + std::to_string(settings.lifecycle.hardTimeout.count()) + "s), using 3000/3600");
        settings.lifecycle.hardTimeout = Seconds(3600);
        settings.lifecycle.proactiveRefresh = Seconds(3000);
    }
    settings.transactionOperationTimeout = std::chrono::seconds(positiveOr(config, config::KEY_INTENT_OP_TIMEOUT, 10));

    long settleMs = config.getInt(config::KEY_BLIP_SETTLE_MS, 500);
    settings.blipSettleDelay = std::chrono::milliseconds(settleMs >= 0 ? settleMs : 500);

    settings.layout = devices::stringToLayoutKind(config.getString(config::KEY_LAYOUT));
    settings.preset.amount = static_cast<uint32_t>(positiveOr(config, config::KEY_PRESET_AMOUNT, 100));
    std::string category = config.getString(config::KEY_PRESET_CATEGORY);
    if (!category.empty()) {
        settings.preset.category = category;
    }

    return settings;
}

} // namespace terminal_health::core
