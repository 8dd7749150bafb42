// src/health/suppression_gate.cpp
#include "health/suppression_gate.h"
#include "logging/logger.h"
#include <algorithm>
#include <utility>

namespace terminal_health::health {

SuppressionGate::SuppressionGate(Seconds rebootGrace, std::string rebootMarker)
    : rebootGrace_(rebootGrace)
    , rebootMarker_(std::move(rebootMarker))
{
}

void SuppressionGate::armIfNewRebootDisconnect(const HealthSnapshot& snapshot) {
    if (!snapshot.lastDisconnectReason || !snapshot.lastDisconnectTime) {
        return;
    }
    if (*snapshot.lastDisconnectReason != rebootMarker_) {
        return;
    }
    if (armedForDisconnectAt_ && *armedForDisconnectAt_ == *snapshot.lastDisconnectTime) {
        return;
    }

    armedForDisconnectAt_ = *snapshot.lastDisconnectTime;
    // A disconnect stamped in the future (clock skew) starts the window now.
    TimePoint start = std::min(*snapshot.lastDisconnectTime, snapshot.takenAt);
    windowEnd_ = start + rebootGrace_;
    logging::Logger::getInstance().info("[GATE] Reboot-class disconnect detected, suppressing recovery for "
        + std::to_string(rebootGrace_.count()) + "s");
}

GateDecision SuppressionGate::evaluate(const HealthSnapshot& snapshot) {
    GateDecision decision;

    if (snapshot.softwareUpdateInProgress.value_or(false)) {
        decision.proceed = false;
        decision.reason = "software_update_in_progress";
        return decision;
    }

    armIfNewRebootDisconnect(snapshot);
    if (windowEnd_) {
        if (snapshot.takenAt < *windowEnd_) {
            decision.proceed = false;
            decision.reason = "reboot_grace_window ("
                + std::to_string(secondsBetween(snapshot.takenAt, *windowEnd_)) + "s remaining)";
            return decision;
        }
        logging::Logger::getInstance().info("[GATE] Reboot grace window elapsed, resuming evaluation");
        windowEnd_.reset();
    }

    if (!snapshot.inPaymentSession) {
        decision.proceed = false;
        decision.reason = "not_in_payment_session";
        return decision;
    }

    return decision;
}

} // namespace terminal_health::health
