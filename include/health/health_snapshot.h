// include/health/health_snapshot.h
#pragma once

#include "common/clock.h"
#include "devices/device_types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace terminal_health::health {

// Point-in-time view of reader, connectivity and transaction state.
// Built once per cycle by HealthSampler and never modified afterwards.
// Empty optionals are values that could not be read.
struct HealthSnapshot {
    TimePoint takenAt;

    std::optional<devices::ReaderConnectionState> readerConnectionState;
    std::optional<devices::ReaderReadiness> readerReadiness;
    std::optional<bool> readerOnline;
    std::optional<bool> sdkNetworkOnline;
    std::optional<bool> offlineModeEnabled;
    devices::LayoutKind terminalLayoutKind = devices::LayoutKind::ZERO_TOUCH;

    std::optional<std::string> paymentIntentId;
    std::optional<TimePoint> paymentIntentCreatedAt;
    std::optional<TimePoint> awaitingInputSince;

    std::optional<std::string> lastDisconnectReason;
    std::optional<TimePoint> lastDisconnectTime;

    std::optional<bool> softwareUpdateInProgress;
    bool inPaymentSession = false;

    nlohmann::json toJson() const;
};

} // namespace terminal_health::health
