// include/health/lifecycle_guard.h
#pragma once

#include "common/clock.h"
#include "health/health_snapshot.h"
#include "recovery/transaction_coordinator.h"
#include <string>

namespace terminal_health::health {

enum class LifecycleAction {
    NONE,
    HARD_TIMEOUT,           // age >= hard timeout: force-cancel and recreate
    PROACTIVE_REFRESH,      // age >= refresh threshold: cancel and recreate
    STUCK_AWAITING_INPUT    // awaiting input too long: cancel only
};

inline std::string lifecycleActionToString(LifecycleAction action) {
    switch (action) {
        case LifecycleAction::NONE: return "none";
        case LifecycleAction::HARD_TIMEOUT: return "hard_timeout";
        case LifecycleAction::PROACTIVE_REFRESH: return "proactive_refresh";
        case LifecycleAction::STUCK_AWAITING_INPUT: return "stuck_awaiting_input";
        default: return "unknown";
    }
}

struct LifecycleThresholds {
    Seconds hardTimeout{3600};
    Seconds proactiveRefresh{3000};
    Seconds stuckAwaitingInput{300};
};

struct LifecycleDecision {
    LifecycleAction action = LifecycleAction::NONE;
    bool recreate = false;
    bool force = false;
    std::string intentId;
    Seconds intentAge{0};
    Seconds awaitingInputFor{0};
};

struct LifecycleOutcome {
    LifecycleDecision decision;
    recovery::TransactionOpResult result;
};

// PaymentIntentLifecycleGuard - age and stuck-input checks on the active
// transaction, first match wins. Holds no retry state: every cycle derives
// the decision again from the snapshot.
class PaymentIntentLifecycleGuard {
public:
    PaymentIntentLifecycleGuard(const LifecycleThresholds& thresholds,
                                recovery::TransactionCoordinator& coordinator);

    LifecycleDecision check(const HealthSnapshot& snapshot) const;

    /// check() and, when an action is due, carry it out immediately.
    LifecycleOutcome run(const HealthSnapshot& snapshot);

private:
    LifecycleThresholds thresholds_;
    recovery::TransactionCoordinator& coordinator_;
};

} // namespace terminal_health::health
