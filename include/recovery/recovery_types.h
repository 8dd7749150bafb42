// include/recovery/recovery_types.h
#pragma once

#include "common/clock.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace terminal_health::recovery {

// Exactly one is active per cycle; NONE means healthy.
enum class RecoveryType {
    NONE = 0,
    READER_DISCONNECTED,
    READER_NOT_READY,
    READER_OFFLINE,
    SDK_OFFLINE,
    TAP_TO_PAY_NOT_WAITING
};

enum class BackoffClass {
    FAST,   // hardware reconnection failures
    SLOW    // network outage
};

inline std::string recoveryTypeToString(RecoveryType type) {
    switch (type) {
        case RecoveryType::NONE: return "none";
        case RecoveryType::READER_DISCONNECTED: return "reader_disconnected";
        case RecoveryType::READER_NOT_READY: return "reader_not_ready";
        case RecoveryType::READER_OFFLINE: return "reader_offline";
        case RecoveryType::SDK_OFFLINE: return "sdk_offline";
        case RecoveryType::TAP_TO_PAY_NOT_WAITING: return "tap_to_pay_not_waiting";
        default: return "unknown";
    }
}

inline BackoffClass backoffClassFor(RecoveryType type) {
    return type == RecoveryType::SDK_OFFLINE ? BackoffClass::SLOW : BackoffClass::FAST;
}

// Types remediated by the reader reconnect sequence
inline bool isReconnectionType(RecoveryType type) {
    switch (type) {
        case RecoveryType::READER_DISCONNECTED:
        case RecoveryType::READER_NOT_READY:
        case RecoveryType::READER_OFFLINE:
        case RecoveryType::TAP_TO_PAY_NOT_WAITING:
            return true;
        default:
            return false;
    }
}

// Per-type attempt bookkeeping, written only by RecoveryScheduler
struct RecoveryState {
    RecoveryType recoveryType = RecoveryType::NONE;
    int attemptCount = 0;
    std::optional<TimePoint> firstFailureTime;
    std::optional<TimePoint> lastAttemptTime;

    nlohmann::json toJson() const {
        nlohmann::json json = {
            {"recoveryType", recoveryTypeToString(recoveryType)},
            {"attemptCount", attemptCount},
            {"firstFailureTimeMs", nullptr},
            {"lastAttemptTimeMs", nullptr}
        };
        if (firstFailureTime) {
            json["firstFailureTimeMs"] = toEpochMs(*firstFailureTime);
        }
        if (lastAttemptTime) {
            json["lastAttemptTimeMs"] = toEpochMs(*lastAttemptTime);
        }
        return json;
    }
};

} // namespace terminal_health::recovery
