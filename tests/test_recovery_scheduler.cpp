// tests/test_recovery_scheduler.cpp
#include "recovery/backoff_policy.h"
#include "recovery/recovery_scheduler.h"
#include "test_support.h"
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace terminal_health;
using namespace terminal_health::recovery;

namespace {

const TimePoint T0 = std::chrono::system_clock::from_time_t(1700000000);

RecoveryScheduler defaultScheduler(int milestoneEvery = 10) {
    return RecoveryScheduler(BackoffPolicy::fastDefault(), BackoffPolicy::slowDefault(), milestoneEvery);
}

void testBackoffPolicyDefaults() {
    BackoffPolicy fast = BackoffPolicy::fastDefault();
    CHECK(fast.waitFor(0) == Seconds(30));
    CHECK(fast.waitFor(1) == Seconds(60));
    CHECK(fast.waitFor(2) == Seconds(120));
    CHECK(fast.waitFor(3) == Seconds(300));
    CHECK(fast.waitFor(4) == Seconds(300));
    CHECK(fast.waitFor(1000) == Seconds(300));
    CHECK_EQ(fast.maxIndex(), 3u);

    BackoffPolicy slow = BackoffPolicy::slowDefault();
    CHECK(slow.waitFor(0) == Seconds(60));
    CHECK(slow.waitFor(3) == Seconds(600));
    CHECK(slow.waitFor(50) == Seconds(600));
    CHECK_EQ(slow.toString(), std::string("60,120,300,600"));
}

void testBackoffPolicyParse() {
    auto parsed = BackoffPolicy::parse(" 5, 10 ,20");
    CHECK(parsed.has_value());
    if (parsed) {
        CHECK_EQ(parsed->waits().size(), 3u);
        CHECK(parsed->waitFor(2) == Seconds(20));
        CHECK(parsed->waitFor(9) == Seconds(20));
    }
    CHECK(!BackoffPolicy::parse("").has_value());
    CHECK(!BackoffPolicy::parse("30,,60").has_value());
    CHECK(!BackoffPolicy::parse("30,-1").has_value());
    CHECK(!BackoffPolicy::parse("30,0").has_value());
    CHECK(!BackoffPolicy::parse("abc").has_value());
    CHECK(!BackoffPolicy::parse("30s").has_value());

    bool threw = false;
    try {
        BackoffPolicy empty(std::vector<Seconds>{});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    CHECK(threw);
}

// Fails forever and checks each gap: one tick early is skipped, on time runs.
void checkSchedule(RecoveryType type, const std::vector<int>& expectedWaits) {
    RecoveryScheduler scheduler = defaultScheduler(1000);
    TimePoint t = T0;

    SchedulingDecision first = scheduler.onClassification(type, t);
    CHECK(first.execute);
    CHECK(first.typeChanged);
    scheduler.recordAttempt(false, t);

    for (size_t i = 0; i < expectedWaits.size(); ++i) {
        Seconds wait(expectedWaits[i]);
        SchedulingDecision early = scheduler.onClassification(type, t + wait - Seconds(1));
        CHECK(!early.execute);
        CHECK(early.requiredWait == wait);

        SchedulingDecision onTime = scheduler.onClassification(type, t + wait);
        CHECK(onTime.execute);
        CHECK(!onTime.typeChanged);
        if (!onTime.execute) {
            std::cout << "  wait " << i << " expected " << expectedWaits[i] << "s" << std::endl;
            return;
        }
        t += wait;
        AttemptRecord record = scheduler.recordAttempt(false, t);
        CHECK_EQ(record.attemptCount, static_cast<int>(i) + 2);
    }
}

void testFastSchedule() {
    checkSchedule(RecoveryType::READER_DISCONNECTED, {30, 60, 120, 300, 300, 300});
    checkSchedule(RecoveryType::TAP_TO_PAY_NOT_WAITING, {30, 60, 120, 300, 300});
    checkSchedule(RecoveryType::READER_NOT_READY, {30, 60, 120, 300});
    checkSchedule(RecoveryType::READER_OFFLINE, {30, 60, 120, 300});
}

void testSlowSchedule() {
    checkSchedule(RecoveryType::SDK_OFFLINE, {60, 120, 300, 600, 600, 600});
}

void testTypeChangeResets() {
    RecoveryScheduler scheduler = defaultScheduler();
    TimePoint t = T0;
    scheduler.onClassification(RecoveryType::READER_DISCONNECTED, t);
    scheduler.recordAttempt(false, t);
    t += Seconds(30);
    scheduler.onClassification(RecoveryType::READER_DISCONNECTED, t);
    scheduler.recordAttempt(false, t);
    CHECK_EQ(scheduler.state().attemptCount, 2);

    t += Seconds(5);
    SchedulingDecision changed = scheduler.onClassification(RecoveryType::TAP_TO_PAY_NOT_WAITING, t);
    CHECK(changed.execute);
    CHECK(changed.typeChanged);
    CHECK_EQ(scheduler.state().attemptCount, 0);
    CHECK(scheduler.state().recoveryType == RecoveryType::TAP_TO_PAY_NOT_WAITING);
    CHECK(scheduler.state().firstFailureTime.has_value());
    CHECK(*scheduler.state().firstFailureTime == t);
    CHECK(!scheduler.state().lastAttemptTime.has_value());
}

void testNoneResetsAndReportsRecovery() {
    RecoveryScheduler scheduler = defaultScheduler();
    TimePoint t = T0;
    scheduler.onClassification(RecoveryType::READER_DISCONNECTED, t);
    scheduler.recordAttempt(false, t);
    t += Seconds(30);
    scheduler.onClassification(RecoveryType::READER_DISCONNECTED, t);
    scheduler.recordAttempt(true, t);

    t += Seconds(45);
    SchedulingDecision healthy = scheduler.onClassification(RecoveryType::NONE, t);
    CHECK(!healthy.execute);
    CHECK(healthy.recovered);
    CHECK(healthy.recoveredFrom == RecoveryType::READER_DISCONNECTED);
    CHECK_EQ(healthy.attemptCount, 2);
    CHECK(healthy.elapsedSinceFirstFailure == Seconds(75));

    const RecoveryState& state = scheduler.state();
    CHECK(state.recoveryType == RecoveryType::NONE);
    CHECK_EQ(state.attemptCount, 0);
    CHECK(!state.firstFailureTime.has_value());
    CHECK(!state.lastAttemptTime.has_value());

    SchedulingDecision stillHealthy = scheduler.onClassification(RecoveryType::NONE, t + Seconds(30));
    CHECK(!stillHealthy.recovered);

    // Same failure again starts from scratch
    SchedulingDecision again = scheduler.onClassification(RecoveryType::READER_DISCONNECTED, t + Seconds(31));
    CHECK(again.execute);
    CHECK(again.typeChanged);
}

void testMilestones() {
    RecoveryScheduler scheduler = defaultScheduler(3);
    TimePoint t = T0;
    scheduler.onClassification(RecoveryType::SDK_OFFLINE, t);

    std::vector<int> milestones;
    for (int i = 0; i < 7; ++i) {
        AttemptRecord record = scheduler.recordAttempt(false, t);
        if (record.milestone) {
            milestones.push_back(record.attemptCount);
        }
        t += Seconds(600);
    }
    CHECK_EQ(milestones.size(), 2u);
    if (milestones.size() == 2) {
        CHECK_EQ(milestones[0], 3);
        CHECK_EQ(milestones[1], 6);
    }
}

void testAtMostOneExecutionPerInterval() {
    // Persistent reader failure polled every 30s for an hour
    RecoveryScheduler scheduler = defaultScheduler();
    std::vector<int> executedAt;
    for (int tick = 0; tick < 3600; tick += 30) {
        TimePoint now = T0 + Seconds(tick);
        SchedulingDecision decision = scheduler.onClassification(RecoveryType::READER_DISCONNECTED, now);
        if (decision.execute) {
            executedAt.push_back(tick);
            scheduler.recordAttempt(false, now);
        }
    }

    const std::vector<int> expected = {0, 30, 90, 210, 510, 810, 1110, 1410, 1710, 2010, 2310, 2610, 2910,
                                       3210, 3510};
    CHECK(executedAt == expected);
    CHECK_EQ(scheduler.state().attemptCount, static_cast<int>(expected.size()));
}

} // namespace

int main() {
    test_support::quietLogs();
    std::cout << "=== Recovery Scheduler Test ===" << std::endl;

    test_support::runTest("backoff policy defaults", testBackoffPolicyDefaults);
    test_support::runTest("backoff policy parse", testBackoffPolicyParse);
    test_support::runTest("fast schedule", testFastSchedule);
    test_support::runTest("slow schedule", testSlowSchedule);
    test_support::runTest("type change resets attempts", testTypeChangeResets);
    test_support::runTest("none resets and reports recovery", testNoneResetsAndReportsRecovery);
    test_support::runTest("milestones", testMilestones);
    test_support::runTest("at most one execution per interval", testAtMostOneExecutionPerInterval);

    return test_support::finish("Recovery Scheduler");
}
