// include/health/suppression_gate.h
#pragma once

#include "common/clock.h"
#include "health/health_snapshot.h"
#include <optional>
#include <string>

namespace terminal_health::health {

struct GateDecision {
    bool proceed = true;
    std::string reason;   // empty when proceeding
};

// SuppressionGate - decides whether a cycle may run recovery at all.
// Skips during a software update, inside the grace window that follows a
// reboot-class disconnect, and whenever the terminal is not in a payment session.
class SuppressionGate {
public:
    SuppressionGate(Seconds rebootGrace, std::string rebootMarker);

    GateDecision evaluate(const HealthSnapshot& snapshot);

    /// End of the currently armed grace window, if one is open.
    std::optional<TimePoint> graceWindowEnd() const { return windowEnd_; }

private:
    void armIfNewRebootDisconnect(const HealthSnapshot& snapshot);

    Seconds rebootGrace_;
    std::string rebootMarker_;

    // One-shot window state: armed once per distinct disconnect timestamp.
    std::optional<TimePoint> armedForDisconnectAt_;
    std::optional<TimePoint> windowEnd_;
};

} // namespace terminal_health::health
