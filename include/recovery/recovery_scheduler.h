// include/recovery/recovery_scheduler.h
#pragma once

#include "common/clock.h"
#include "recovery/backoff_policy.h"
#include "recovery/recovery_types.h"

namespace terminal_health::recovery {

// Result of feeding one classification to the scheduler
struct SchedulingDecision {
    RecoveryType type = RecoveryType::NONE;
    bool execute = false;
    bool typeChanged = false;

    // Set when the classification went from a failure type to NONE.
    bool recovered = false;
    RecoveryType recoveredFrom = RecoveryType::NONE;

    int attemptCount = 0;                 // attempts made before this decision
    Seconds requiredWait{0};
    Seconds elapsedSinceLastAttempt{0};
    Seconds elapsedSinceFirstFailure{0};
};

struct AttemptRecord {
    int attemptCount = 0;                 // after counting this attempt
    bool milestone = false;
    Seconds elapsedSinceFirstFailure{0};
};

// RecoveryScheduler - per-type attempt counting and backoff.
// Sole writer of RecoveryState. Retries never stop; the wait before retry n
// is the class schedule at index min(n - 1, maxIndex).
class RecoveryScheduler {
public:
    RecoveryScheduler(BackoffPolicy fastPolicy, BackoffPolicy slowPolicy, int milestoneEvery);

    SchedulingDecision onClassification(RecoveryType type, TimePoint now);

    // Count an executed attempt, successful or not.
    AttemptRecord recordAttempt(bool success, TimePoint now);

    const RecoveryState& state() const { return state_; }
    const BackoffPolicy& policyFor(BackoffClass backoffClass) const;

private:
    void reset();

    BackoffPolicy fastPolicy_;
    BackoffPolicy slowPolicy_;
    int milestoneEvery_;
    RecoveryState state_;
};

} // namespace terminal_health::recovery
