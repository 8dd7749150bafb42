// include/events/event_publisher.h
#pragma once

#include "common/clock.h"
#include "events/health_event.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace terminal_health::events {

// EventPublisher - stamps events (id, time) and fans them out to sinks.
// A throwing sink is logged and does not stop delivery to the others.
class EventPublisher {
public:
    explicit EventPublisher(std::shared_ptr<IClock> clock);

    void addSink(std::shared_ptr<IEventSink> sink);

    HealthEvent publish(const std::string& eventType, const nlohmann::json& data);

private:
    std::shared_ptr<IClock> clock_;
    std::mutex mutex_;
    std::vector<std::shared_ptr<IEventSink>> sinks_;
};

} // namespace terminal_health::events
