// src/health/health_snapshot.cpp
#include "health/health_snapshot.h"

namespace terminal_health::health {

namespace {

template <typename T, typename F>
nlohmann::json optionalToJson(const std::optional<T>& value, F convert) {
    if (!value) {
        return nullptr;
    }
    return convert(*value);
}

nlohmann::json optionalBool(const std::optional<bool>& value) {
    return optionalToJson(value, [](bool v) { return nlohmann::json(v); });
}

nlohmann::json optionalTime(const std::optional<TimePoint>& value) {
    return optionalToJson(value, [](TimePoint tp) { return nlohmann::json(toEpochMs(tp)); });
}

nlohmann::json optionalString(const std::optional<std::string>& value) {
    return optionalToJson(value, [](const std::string& s) { return nlohmann::json(s); });
}

} // namespace

nlohmann::json HealthSnapshot::toJson() const {
    return {
        {"takenAtMs", toEpochMs(takenAt)},
        {"readerConnectionState", optionalToJson(readerConnectionState,
            [](devices::ReaderConnectionState s) { return nlohmann::json(devices::connectionStateToString(s)); })},
        {"readerReadiness", optionalToJson(readerReadiness,
            [](devices::ReaderReadiness r) { return nlohmann::json(devices::readinessToString(r)); })},
        {"readerOnline", optionalBool(readerOnline)},
        {"sdkNetworkOnline", optionalBool(sdkNetworkOnline)},
        {"offlineModeEnabled", optionalBool(offlineModeEnabled)},
        {"layout", devices::layoutKindToString(terminalLayoutKind)},
        {"paymentIntentId", optionalString(paymentIntentId)},
        {"paymentIntentCreatedAtMs", optionalTime(paymentIntentCreatedAt)},
        {"awaitingInputSinceMs", optionalTime(awaitingInputSince)},
        {"lastDisconnectReason", optionalString(lastDisconnectReason)},
        {"lastDisconnectTimeMs", optionalTime(lastDisconnectTime)},
        {"softwareUpdateInProgress", optionalBool(softwareUpdateInProgress)},
        {"inPaymentSession", inPaymentSession}
    };
}

} // namespace terminal_health::health
