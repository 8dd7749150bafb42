// include/devices/device_types.h
#pragma once

#include "common/clock.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace terminal_health::devices {

// Reader link state as reported by the reader SDK
enum class ReaderConnectionState {
    NOT_CONNECTED = 0,
    DISCOVERING = 1,
    CONNECTING = 2,
    CONNECTED = 3
};

// Reader readiness sub-state
enum class ReaderReadiness {
    NOT_READY = 0,
    READY = 1,
    AWAITING_INPUT = 2,   // collecting: waiting for a card presentation
    PROCESSING = 3,
    UPDATING = 4
};

// Terminal screen layout
enum class LayoutKind {
    MANUAL,
    ZERO_TOUCH   // tap-to-pay: preset amount/category, intents created automatically
};

enum class OfflinePreference {
    REQUIRE_ONLINE,
    PREFER_ONLINE,
    FORCE_OFFLINE
};

inline std::string connectionStateToString(ReaderConnectionState state) {
    switch (state) {
        case ReaderConnectionState::NOT_CONNECTED: return "not_connected";
        case ReaderConnectionState::DISCOVERING: return "discovering";
        case ReaderConnectionState::CONNECTING: return "connecting";
        case ReaderConnectionState::CONNECTED: return "connected";
        default: return "unknown";
    }
}

inline std::optional<ReaderConnectionState> stringToConnectionState(const std::string& str) {
    if (str == "not_connected") return ReaderConnectionState::NOT_CONNECTED;
    if (str == "discovering") return ReaderConnectionState::DISCOVERING;
    if (str == "connecting") return ReaderConnectionState::CONNECTING;
    if (str == "connected") return ReaderConnectionState::CONNECTED;
    return std::nullopt;
}

inline std::string readinessToString(ReaderReadiness readiness) {
    switch (readiness) {
        case ReaderReadiness::NOT_READY: return "not_ready";
        case ReaderReadiness::READY: return "ready";
        case ReaderReadiness::AWAITING_INPUT: return "awaiting_input";
        case ReaderReadiness::PROCESSING: return "processing";
        case ReaderReadiness::UPDATING: return "updating";
        default: return "unknown";
    }
}

inline std::optional<ReaderReadiness> stringToReadiness(const std::string& str) {
    if (str == "not_ready") return ReaderReadiness::NOT_READY;
    if (str == "ready") return ReaderReadiness::READY;
    if (str == "awaiting_input") return ReaderReadiness::AWAITING_INPUT;
    if (str == "processing") return ReaderReadiness::PROCESSING;
    if (str == "updating") return ReaderReadiness::UPDATING;
    return std::nullopt;
}

inline std::string layoutKindToString(LayoutKind kind) {
    return kind == LayoutKind::ZERO_TOUCH ? "zero_touch" : "manual";
}

// Unrecognized text falls back to zero-touch, the unattended default.
inline LayoutKind stringToLayoutKind(const std::string& str) {
    if (str == "manual") return LayoutKind::MANUAL;
    return LayoutKind::ZERO_TOUCH;
}

inline std::string offlinePreferenceToString(OfflinePreference pref) {
    switch (pref) {
        case OfflinePreference::REQUIRE_ONLINE: return "require_online";
        case OfflinePreference::PREFER_ONLINE: return "prefer_online";
        case OfflinePreference::FORCE_OFFLINE: return "force_offline";
        default: return "unknown";
    }
}

struct DisconnectInfo {
    std::string reason;
    TimePoint time;
};

struct PaymentIntentRecord {
    std::string id;
    TimePoint createdAt;
    std::optional<TimePoint> awaitingInputSince;
};

struct DiscoveredReader {
    std::string deviceId;
    std::string deviceType;
    std::string label;
};

// Amount and category used for automatically created intents
struct ZeroTouchPreset {
    uint32_t amount = 0;
    std::string category;
};

struct PaymentIntentRequest {
    uint32_t amount = 0;
    std::string category;
    OfflinePreference offlinePreference = OfflinePreference::PREFER_ONLINE;
    bool autoCollect = false;
};

// --- Results of asynchronous SDK calls ---

struct OperationResult {
    bool success = false;
    std::string error;
};

struct DiscoveryResult {
    bool success = false;
    std::vector<DiscoveredReader> readers;
    std::string error;
};

struct CreateIntentResult {
    bool success = false;
    PaymentIntentRecord intent;
    std::string error;
};

} // namespace terminal_health::devices
