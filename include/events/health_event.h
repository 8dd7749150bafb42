// include/events/health_event.h
#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace terminal_health::events {

// Event types
constexpr const char* EVENT_HEALTH_CYCLE = "health_cycle";
constexpr const char* EVENT_RECOVERY_MILESTONE = "recovery_milestone";
constexpr const char* EVENT_RECOVERY_SUCCESSFUL = "recovery_successful";
constexpr const char* EVENT_PAYMENT_INTENT_LIFECYCLE = "payment_intent_lifecycle";
constexpr const char* EVENT_NETWORK_BLIP = "network_blip";

// Structured observability event
struct HealthEvent {
    std::string eventId;
    std::string eventType;
    int64_t timestampMs = 0;
    nlohmann::json data = nlohmann::json::object();

    nlohmann::json toJson() const {
        return {
            {"eventId", eventId},
            {"eventType", eventType},
            {"timestampMs", timestampMs},
            {"data", data}
        };
    }
};

// Destination for events (display bridge, log, test recorder)
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void publish(const HealthEvent& event) = 0;
};

// Writes each event as one JSON line through the logger
class LogEventSink : public IEventSink {
public:
    void publish(const HealthEvent& event) override;
};

} // namespace terminal_health::events
