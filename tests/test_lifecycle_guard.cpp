// tests/test_lifecycle_guard.cpp
#include "health/health_sampler.h"
#include "health/lifecycle_guard.h"
#include "recovery/transaction_coordinator.h"
#include "test_support.h"
#include "vendor_adapters/simulated/simulated_terminal.h"
#include <iostream>
#include <memory>

using namespace terminal_health;
using namespace terminal_health::health;
using recovery::TransactionCoordinator;
using recovery::TransactionOpStatus;
using vendor::simulated::SimulatedTerminal;

namespace {

// Terminal, coordinator and guard wired together around a manual clock
struct Fixture {
    std::shared_ptr<test_support::ManualClock> clock = std::make_shared<test_support::ManualClock>();
    SimulatedTerminal terminal{clock};
    TransactionCoordinator coordinator{terminal, terminal, terminal, std::chrono::milliseconds(500)};
    PaymentIntentLifecycleGuard guard{LifecycleThresholds(), coordinator};
    HealthSampler sampler{terminal, terminal, terminal, clock};

    Fixture(devices::LayoutKind layout, Seconds intentAge, std::optional<Seconds> awaitingFor) {
        terminal.setLayoutKind(layout);
        devices::PaymentIntentRecord intent;
        intent.id = "pi_initial";
        intent.createdAt = clock->now() - intentAge;
        if (awaitingFor) {
            intent.awaitingInputSince = clock->now() - *awaitingFor;
            terminal.setReadiness(devices::ReaderReadiness::AWAITING_INPUT);
        }
        terminal.setActiveIntent(intent);
    }
};

const Seconds MINUTE(60);

void testYoungIntentIsLeftAlone() {
    Fixture f(devices::LayoutKind::ZERO_TOUCH, 49 * MINUTE, 4 * MINUTE);
    LifecycleOutcome outcome = f.guard.run(f.sampler.sample());
    CHECK(outcome.decision.action == LifecycleAction::NONE);
    CHECK(f.terminal.commandLog().empty());
}

void testProactiveRefreshAt51Minutes() {
    Fixture f(devices::LayoutKind::ZERO_TOUCH, 51 * MINUTE, 51 * MINUTE);

    LifecycleDecision decision = f.guard.check(f.sampler.sample());
    CHECK(decision.action == LifecycleAction::PROACTIVE_REFRESH);
    CHECK(decision.recreate);
    CHECK(!decision.force);
    CHECK(decision.intentAge == 51 * MINUTE);

    LifecycleOutcome outcome = f.guard.run(f.sampler.sample());
    CHECK(outcome.result.status == TransactionOpStatus::COMPLETED);
    CHECK(outcome.result.cancelled);
    CHECK(outcome.result.recreated);
    CHECK_EQ(f.terminal.commandCount("cancel_intent"), 1);
    CHECK_EQ(f.terminal.commandCount("create_intent"), 1);

    auto active = f.terminal.getActiveIntent();
    CHECK(active.has_value());
    if (active) {
        CHECK(active->id != "pi_initial");
        CHECK(active->createdAt == f.clock->now());
    }

    // Fresh intent: nothing more to do on the next cycle
    f.clock->advance(Seconds(30));
    CHECK(f.guard.run(f.sampler.sample()).decision.action == LifecycleAction::NONE);
    CHECK_EQ(f.terminal.commandCount("create_intent"), 1);
}

void testHardTimeoutAt61Minutes() {
    Fixture f(devices::LayoutKind::ZERO_TOUCH, 61 * MINUTE, 61 * MINUTE);
    LifecycleDecision decision = f.guard.check(f.sampler.sample());
    CHECK(decision.action == LifecycleAction::HARD_TIMEOUT);
    CHECK(decision.recreate);
    CHECK(decision.force);

    // Force clears the local record even when the cancel call is rejected
    f.terminal.setFailCancelIntent(true);
    LifecycleOutcome outcome = f.guard.run(f.sampler.sample());
    CHECK(outcome.result.status == TransactionOpStatus::COMPLETED);
    CHECK(outcome.result.recreated);
    CHECK_EQ(f.terminal.commandCount("clear_intent"), 1);
    CHECK_EQ(f.terminal.commandCount("create_intent"), 1);
}

void testFailedRefreshRetriesNextCycle() {
    Fixture f(devices::LayoutKind::ZERO_TOUCH, 51 * MINUTE, 51 * MINUTE);
    f.terminal.setFailCancelIntent(true);

    LifecycleOutcome outcome = f.guard.run(f.sampler.sample());
    CHECK(outcome.result.status == TransactionOpStatus::FAILED);
    CHECK(!outcome.result.recreated);
    auto active = f.terminal.getActiveIntent();
    CHECK(active.has_value() && active->id == "pi_initial");
    CHECK_EQ(f.terminal.commandCount("create_intent"), 0);

    // Derived again from the snapshot, no retry bookkeeping of its own
    f.terminal.setFailCancelIntent(false);
    f.clock->advance(Seconds(30));
    outcome = f.guard.run(f.sampler.sample());
    CHECK(outcome.decision.action == LifecycleAction::PROACTIVE_REFRESH);
    CHECK(outcome.result.ok());
    CHECK_EQ(f.terminal.commandCount("create_intent"), 1);
}

void testManualLayoutIsNotRecreated() {
    Fixture f(devices::LayoutKind::MANUAL, 51 * MINUTE, std::nullopt);
    LifecycleOutcome outcome = f.guard.run(f.sampler.sample());
    CHECK(outcome.decision.action == LifecycleAction::PROACTIVE_REFRESH);
    CHECK(outcome.result.ok());
    CHECK(outcome.result.cancelled);
    CHECK(!outcome.result.recreated);
    CHECK_EQ(f.terminal.commandCount("create_intent"), 0);
    CHECK(!f.terminal.getActiveIntent().has_value());
}

void testStuckAwaitingInputCancelsOnly() {
    Fixture f(devices::LayoutKind::MANUAL, 6 * MINUTE, 6 * MINUTE);
    LifecycleOutcome outcome = f.guard.run(f.sampler.sample());
    CHECK(outcome.decision.action == LifecycleAction::STUCK_AWAITING_INPUT);
    CHECK(!outcome.decision.recreate);
    CHECK(outcome.result.ok());
    CHECK_EQ(f.terminal.commandCount("cancel_collection"), 1);
    CHECK_EQ(f.terminal.commandCount("cancel_intent"), 1);
    CHECK_EQ(f.terminal.commandCount("create_intent"), 0);
    CHECK(!f.terminal.getActiveIntent().has_value());
}

void testZeroTouchStuckAwaitingInputCancelsOnly() {
    Fixture f(devices::LayoutKind::ZERO_TOUCH, 6 * MINUTE, 6 * MINUTE);
    LifecycleDecision decision = f.guard.check(f.sampler.sample());
    CHECK(decision.action == LifecycleAction::STUCK_AWAITING_INPUT);
    CHECK(decision.awaitingInputFor == 6 * MINUTE);

    LifecycleOutcome outcome = f.guard.run(f.sampler.sample());
    CHECK(outcome.result.ok());
    CHECK(outcome.result.cancelled);
    CHECK(!outcome.result.recreated);
    CHECK_EQ(f.terminal.commandCount("cancel_intent"), 1);
    CHECK_EQ(f.terminal.commandCount("create_intent"), 0);
}

void testJustUnderStuckThresholdIsLeftAlone() {
    Fixture f(devices::LayoutKind::ZERO_TOUCH, 20 * MINUTE, Seconds(299));
    CHECK(f.guard.check(f.sampler.sample()).action == LifecycleAction::NONE);
}

void testAgeChecksComeFirst() {
    Fixture f(devices::LayoutKind::MANUAL, 61 * MINUTE, 30 * MINUTE);
    CHECK(f.guard.check(f.sampler.sample()).action == LifecycleAction::HARD_TIMEOUT);
}

void testNoIntentNoAction() {
    Fixture f(devices::LayoutKind::ZERO_TOUCH, 0 * MINUTE, std::nullopt);
    f.terminal.setActiveIntent(std::nullopt);
    LifecycleDecision decision = f.guard.check(f.sampler.sample());
    CHECK(decision.action == LifecycleAction::NONE);
    CHECK(decision.intentId.empty());
}

} // namespace

int main() {
    test_support::quietLogs();
    std::cout << "=== Payment Intent Lifecycle Guard Test ===" << std::endl;

    test_support::runTest("young intent is left alone", testYoungIntentIsLeftAlone);
    test_support::runTest("proactive refresh at 51 minutes", testProactiveRefreshAt51Minutes);
    test_support::runTest("hard timeout at 61 minutes", testHardTimeoutAt61Minutes);
    test_support::runTest("failed refresh retries next cycle", testFailedRefreshRetriesNextCycle);
    test_support::runTest("manual layout is not recreated", testManualLayoutIsNotRecreated);
    test_support::runTest("stuck awaiting input cancels only", testStuckAwaitingInputCancelsOnly);
    test_support::runTest("zero-touch stuck awaiting input cancels only", testZeroTouchStuckAwaitingInputCancelsOnly);
    test_support::runTest("just under stuck threshold is left alone", testJustUnderStuckThresholdIsLeftAlone);
    test_support::runTest("age checks come first", testAgeChecksComeFirst);
    test_support::runTest("no intent, no action", testNoIntentNoAction);

    return test_support::finish("Payment Intent Lifecycle Guard");
}
