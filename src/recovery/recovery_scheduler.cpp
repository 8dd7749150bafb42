// src/recovery/recovery_scheduler.cpp
#include "recovery/recovery_scheduler.h"
#include "logging/logger.h"
#include <utility>

namespace terminal_health::recovery {

RecoveryScheduler::RecoveryScheduler(BackoffPolicy fastPolicy, BackoffPolicy slowPolicy, int milestoneEvery)
    : fastPolicy_(std::move(fastPolicy))
    , slowPolicy_(std::move(slowPolicy))
    , milestoneEvery_(milestoneEvery > 0 ? milestoneEvery : 10)
{
}

const BackoffPolicy& RecoveryScheduler::policyFor(BackoffClass backoffClass) const {
    return backoffClass == BackoffClass::SLOW ? slowPolicy_ : fastPolicy_;
}

void RecoveryScheduler::reset() {
    state_ = RecoveryState();
}

SchedulingDecision RecoveryScheduler::onClassification(RecoveryType type, TimePoint now) {
    SchedulingDecision decision;
    decision.type = type;
    decision.attemptCount = state_.attemptCount;
    if (state_.firstFailureTime) {
        decision.elapsedSinceFirstFailure = std::chrono::duration_cast<Seconds>(now - *state_.firstFailureTime);
    }

    if (type == RecoveryType::NONE) {
        if (state_.recoveryType != RecoveryType::NONE) {
            decision.recovered = true;
            decision.recoveredFrom = state_.recoveryType;
            logging::Logger::getInstance().info("[SCHEDULER] Recovered from " + recoveryTypeToString(state_.recoveryType)
                + " after " + std::to_string(state_.attemptCount) + " attempt(s), "
                + std::to_string(decision.elapsedSinceFirstFailure.count()) + "s");
        }
        reset();
        return decision;
    }

    if (type != state_.recoveryType) {
        if (state_.recoveryType != RecoveryType::NONE) {
            logging::Logger::getInstance().info("[SCHEDULER] Condition changed: " + recoveryTypeToString(state_.recoveryType)
                + " -> " + recoveryTypeToString(type));
        }
        state_.recoveryType = type;
        state_.attemptCount = 0;
        state_.firstFailureTime = now;
        state_.lastAttemptTime.reset();

        decision.typeChanged = true;
        decision.execute = true;
        decision.attemptCount = 0;
        decision.elapsedSinceFirstFailure = Seconds(0);
        return decision;
    }

    if (state_.attemptCount == 0 || !state_.lastAttemptTime) {
        decision.execute = true;
        return decision;
    }

    const BackoffPolicy& policy = policyFor(backoffClassFor(type));
    decision.requiredWait = policy.waitFor(static_cast<std::size_t>(state_.attemptCount - 1));
    decision.elapsedSinceLastAttempt = std::chrono::duration_cast<Seconds>(now - *state_.lastAttemptTime);
    decision.execute = decision.elapsedSinceLastAttempt >= decision.requiredWait;
    return decision;
}

AttemptRecord RecoveryScheduler::recordAttempt(bool success, TimePoint now) {
    state_.attemptCount++;
    state_.lastAttemptTime = now;
    if (!state_.firstFailureTime) {
        state_.firstFailureTime = now;
    }

    AttemptRecord record;
    record.attemptCount = state_.attemptCount;
    record.elapsedSinceFirstFailure = std::chrono::duration_cast<Seconds>(now - *state_.firstFailureTime);
    record.milestone = (state_.attemptCount % milestoneEvery_) == 0;

    if (!success) {
        const BackoffPolicy& policy = policyFor(backoffClassFor(state_.recoveryType));
        logging::Logger::getInstance().warn("[SCHEDULER] Attempt " + std::to_string(state_.attemptCount)
            + " for " + recoveryTypeToString(state_.recoveryType) + " failed, next try in "
            + std::to_string(policy.waitFor(static_cast<std::size_t>(state_.attemptCount - 1)).count()) + "s");
    }
    return record;
}

} // namespace terminal_health::recovery
