// include/core/monitor_settings.h
#pragma once

#include "common/clock.h"
#include "devices/device_types.h"
#include "health/lifecycle_guard.h"
#include "recovery/backoff_policy.h"
#include "recovery/recovery_executor.h"
#include <chrono>
#include <string>

namespace terminal_health::config {
class ConfigManager;
}

namespace terminal_health::core {

// Typed monitor configuration
struct MonitorSettings {
    Seconds pollingInterval{30};
    Seconds rebootGrace{120};
    std::string rebootDisconnectReason{"security_reboot"};

    recovery::BackoffPolicy fastBackoff = recovery::BackoffPolicy::fastDefault();
    recovery::BackoffPolicy slowBackoff = recovery::BackoffPolicy::slowDefault();
    int milestoneEvery = 10;

    recovery::ExecutorTimeouts executorTimeouts;
    std::string discoveryDeviceType{"tap_to_pay"};

    health::LifecycleThresholds lifecycle;
    std::chrono::milliseconds transactionOperationTimeout{10000};

    std::chrono::milliseconds blipSettleDelay{500};

    devices::LayoutKind layout = devices::LayoutKind::ZERO_TOUCH;
    devices::ZeroTouchPreset preset{100, "default"};

    // Invalid values are logged and replaced by defaults.
    static MonitorSettings fromConfig(const config::ConfigManager& config);
};

} // namespace terminal_health::core
