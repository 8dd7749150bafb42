// src/events/event_publisher.cpp
#include "events/event_publisher.h"
#include "common/uuid_generator.h"
#include "logging/logger.h"
#include <utility>

namespace terminal_health::events {

void LogEventSink::publish(const HealthEvent& event) {
    auto& log = logging::Logger::getInstance();
    // Skipped cycles are routine; keep them at DEBUG so the log stays readable.
    bool routine = event.eventType == EVENT_HEALTH_CYCLE && event.data.value("suppressed", false);
    std::string line = "[EVENT] " + event.toJson().dump();
    if (routine) {
        log.debug(line);
    } else {
        log.info(line);
    }
}

EventPublisher::EventPublisher(std::shared_ptr<IClock> clock)
    : clock_(std::move(clock))
{
}

void EventPublisher::addSink(std::shared_ptr<IEventSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

HealthEvent EventPublisher::publish(const std::string& eventType, const nlohmann::json& data) {
    HealthEvent event;
    event.eventId = UUIDGenerator::generate();
    event.eventType = eventType;
    event.timestampMs = toEpochMs(clock_->now());
    event.data = data;

    std::vector<std::shared_ptr<IEventSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks = sinks_;
    }
    for (auto& sink : sinks) {
        try {
            sink->publish(event);
        } catch (const std::exception& e) {
            logging::Logger::getInstance().error("Event sink failed for " + eventType + ": " + e.what());
        }
    }
    return event;
}

} // namespace terminal_health::events
