// src/health/lifecycle_guard.cpp
#include "health/lifecycle_guard.h"
#include "logging/logger.h"

namespace terminal_health::health {

PaymentIntentLifecycleGuard::PaymentIntentLifecycleGuard(const LifecycleThresholds& thresholds,
                                                         recovery::TransactionCoordinator& coordinator)
    : thresholds_(thresholds)
    , coordinator_(coordinator)
{
}

LifecycleDecision PaymentIntentLifecycleGuard::check(const HealthSnapshot& snapshot) const {
    LifecycleDecision decision;
    if (!snapshot.paymentIntentId || snapshot.paymentIntentId->empty()) {
        return decision;
    }
    decision.intentId = *snapshot.paymentIntentId;

    if (snapshot.paymentIntentCreatedAt) {
        decision.intentAge = std::chrono::duration_cast<Seconds>(snapshot.takenAt - *snapshot.paymentIntentCreatedAt);
    }
    if (snapshot.awaitingInputSince) {
        decision.awaitingInputFor = std::chrono::duration_cast<Seconds>(snapshot.takenAt - *snapshot.awaitingInputSince);
    }

    if (snapshot.paymentIntentCreatedAt && decision.intentAge >= thresholds_.hardTimeout) {
        decision.action = LifecycleAction::HARD_TIMEOUT;
        decision.recreate = true;
        decision.force = true;
    } else if (snapshot.paymentIntentCreatedAt && decision.intentAge >= thresholds_.proactiveRefresh) {
        decision.action = LifecycleAction::PROACTIVE_REFRESH;
        decision.recreate = true;
    } else if (snapshot.awaitingInputSince && decision.awaitingInputFor >= thresholds_.stuckAwaitingInput) {
        decision.action = LifecycleAction::STUCK_AWAITING_INPUT;
    }
    return decision;
}

LifecycleOutcome PaymentIntentLifecycleGuard::run(const HealthSnapshot& snapshot) {
    LifecycleOutcome outcome;
    outcome.decision = check(snapshot);
    if (outcome.decision.action == LifecycleAction::NONE) {
        outcome.result.status = recovery::TransactionOpStatus::COMPLETED;
        return outcome;
    }

    const LifecycleDecision& d = outcome.decision;
    logging::Logger::getInstance().info("[GUARD] " + lifecycleActionToString(d.action) + " for intent " + d.intentId
        + " (age " + std::to_string(d.intentAge.count()) + "s, awaiting input "
        + std::to_string(d.awaitingInputFor.count()) + "s)");

    recovery::CancelOptions options;
    options.recreate = d.recreate;
    options.force = d.force;
    outcome.result = coordinator_.cancelIntent(d.intentId, options, "lifecycle:" + lifecycleActionToString(d.action));

    if (!outcome.result.ok()) {
        // Re-derived from fresh data next cycle
        logging::Logger::getInstance().warn("[GUARD] " + lifecycleActionToString(d.action) + " not completed ("
            + recovery::transactionOpStatusToString(outcome.result.status) + "): " + outcome.result.error);
    }
    return outcome;
}

} // namespace terminal_health::health
