// src/core/health_monitor.cpp
#include "core/health_monitor.h"
#include "logging/logger.h"
#include <algorithm>
#include <utility>

namespace terminal_health::core {

nlohmann::json CycleReport::toJson() const {
    nlohmann::json json = {
        {"timestampMs", toEpochMs(at)},
        {"trigger", trigger},
        {"suppressed", suppressed},
        {"skipReason", suppressed ? nlohmann::json(skipReason) : nlohmann::json(nullptr)},
        {"classification", recovery::recoveryTypeToString(classification)},
        {"rule", rule},
        {"action", action.empty() ? nlohmann::json(nullptr) : nlohmann::json(action)},
        {"executed", executed},
        {"attemptCount", attemptCount},
        {"elapsedSinceFirstFailureSeconds", elapsedSinceFirstFailure.count()},
        {"nextRetryInSeconds", nextRetryIn.count()}
    };
    if (executed) {
        json["success"] = actionSucceeded;
        if (!error.empty()) {
            json["error"] = error;
        }
    }
    if (lifecycleAction != health::LifecycleAction::NONE) {
        json["lifecycleAction"] = health::lifecycleActionToString(lifecycleAction);
        json["lifecycleStatus"] = lifecycleStatus;
        if (!lifecycleError.empty()) {
            json["lifecycleError"] = lifecycleError;
        }
    }
    return json;
}

HealthMonitor::HealthMonitor(devices::ICardReader& reader,
                             devices::IPaymentIntentService& intents,
                             devices::ITerminalContext& context,
                             const MonitorSettings& settings,
                             std::shared_ptr<IClock> clock,
                             std::shared_ptr<events::EventPublisher> publisher)
    : reader_(reader)
    , settings_(settings)
    , clock_(std::move(clock))
    , publisher_(std::move(publisher))
    , sampler_(reader, intents, context, clock_)
    , gate_(settings.rebootGrace, settings.rebootDisconnectReason)
    , coordinator_(intents, reader, context, settings.transactionOperationTimeout)
    , guard_(settings.lifecycle, coordinator_)
    , scheduler_(settings.fastBackoff, settings.slowBackoff, settings.milestoneEvery)
    , executor_(reader, context, coordinator_, settings.executorTimeouts, settings.discoveryDeviceType)
    , blipHandler_(reader, intents, context, coordinator_, settings.blipSettleDelay)
{
    blipHandler_.setOutcomeCallback([this](const recovery::BlipOutcome& outcome) {
        nlohmann::json data = {
            {"networkOnline", outcome.networkOnline},
            {"status", recovery::transactionOpStatusToString(outcome.result.status)},
            {"cancelled", outcome.result.cancelled},
            {"recreated", outcome.result.recreated},
            {"newIntentId", nullptr}
        };
        if (outcome.result.newIntent) {
            data["newIntentId"] = outcome.result.newIntent->id;
        }
        if (!outcome.result.error.empty()) {
            data["error"] = outcome.result.error;
        }
        publisher_->publish(events::EVENT_NETWORK_BLIP, data);
    });
}

HealthMonitor::~HealthMonitor() {
    stop();
}

bool HealthMonitor::start() {
    if (running_) {
        return true;
    }

    blipHandler_.prime();
    reader_.setConnectivityChangedCallback([this](bool networkOnline) {
        try {
            blipHandler_.onConnectivityChanged(networkOnline);
        } catch (const std::exception& e) {
            logging::Logger::getInstance().error("[BLIP] Connectivity handler failed: " + std::string(e.what()));
        }
    });

    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        // First cycle runs right away
        checkRequested_ = true;
        pendingTrigger_ = "startup";
    }
    running_ = true;
    worker_ = std::thread(&HealthMonitor::workerLoop, this);

    logging::Logger::getInstance().info("[MONITOR] Started (polling every "
        + std::to_string(settings_.pollingInterval.count()) + "s, fast backoff "
        + settings_.fastBackoff.toString() + ", slow backoff " + settings_.slowBackoff.toString() + ")");
    return true;
}

void HealthMonitor::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    reader_.setConnectivityChangedCallback(nullptr);
    executor_.cancelOutstanding();
    wakeCondition_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    blipHandler_.shutdown();

    logging::Logger::getInstance().info("[MONITOR] Stopped");
}

void HealthMonitor::requestCheck(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        checkRequested_ = true;
        pendingTrigger_ = reason;
    }
    wakeCondition_.notify_all();
}

void HealthMonitor::workerLoop() {
    auto& log = logging::Logger::getInstance();
    log.info("[MONITOR] Worker thread running");

    while (running_) {
        std::string trigger;
        {
            std::unique_lock<std::mutex> lock(wakeMutex_);
            bool woken = wakeCondition_.wait_for(lock, settings_.pollingInterval, [this] {
                return checkRequested_ || !running_;
            });
            if (!running_) {
                break;
            }
            trigger = woken ? pendingTrigger_ : "poll";
            checkRequested_ = false;
            pendingTrigger_.clear();
        }

        try {
            runCycle(trigger);
        } catch (const std::exception& e) {
            // A failed cycle is re-evaluated on the next tick
            log.error("[MONITOR] Cycle failed: " + std::string(e.what()));
        }
    }

    log.info("[MONITOR] Worker thread exiting");
}

CycleReport HealthMonitor::runCycle(const std::string& trigger) {
    std::lock_guard<std::mutex> cycleLock(cycleMutex_);
    auto& log = logging::Logger::getInstance();

    health::HealthSnapshot snapshot = sampler_.sample();

    CycleReport report;
    report.at = snapshot.takenAt;
    report.trigger = trigger;

    health::GateDecision gate = gate_.evaluate(snapshot);
    if (!gate.proceed) {
        report.suppressed = true;
        report.skipReason = gate.reason;
        report.attemptCount = scheduler_.state().attemptCount;
        log.debug("[MONITOR] Cycle skipped: " + gate.reason);
        publishCycle(report);
        publishState(report);
        return report;
    }

    // Transaction housekeeping; classification still runs on the same snapshot
    health::LifecycleOutcome lifecycle = guard_.run(snapshot);
    if (lifecycle.decision.action != health::LifecycleAction::NONE) {
        const auto& d = lifecycle.decision;
        report.lifecycleAction = d.action;
        report.lifecycleStatus = recovery::transactionOpStatusToString(lifecycle.result.status);
        report.lifecycleError = lifecycle.result.error;

        nlohmann::json data = {
            {"action", health::lifecycleActionToString(d.action)},
            {"intentId", d.intentId},
            {"intentAgeSeconds", d.intentAge.count()},
            {"awaitingInputSeconds", d.awaitingInputFor.count()},
            {"status", report.lifecycleStatus},
            {"cancelled", lifecycle.result.cancelled},
            {"recreated", lifecycle.result.recreated},
            {"newIntentId", nullptr}
        };
        if (lifecycle.result.newIntent) {
            data["newIntentId"] = lifecycle.result.newIntent->id;
        }
        if (!lifecycle.result.error.empty()) {
            data["error"] = lifecycle.result.error;
        }
        publisher_->publish(events::EVENT_PAYMENT_INTENT_LIFECYCLE, data);
    }

    report.classification = health::ConditionEvaluator::classify(snapshot);
    report.rule = health::ConditionEvaluator::matchingRule(snapshot);

    recovery::SchedulingDecision decision = scheduler_.onClassification(report.classification, snapshot.takenAt);

    if (decision.recovered) {
        publisher_->publish(events::EVENT_RECOVERY_SUCCESSFUL, {
            {"recoveredFrom", recovery::recoveryTypeToString(decision.recoveredFrom)},
            {"attemptCount", decision.attemptCount},
            {"elapsedSeconds", decision.elapsedSinceFirstFailure.count()}
        });
    }

    if (decision.typeChanged) {
        log.warn("[MONITOR] Condition detected: " + recovery::recoveryTypeToString(report.classification)
            + " (rule " + report.rule + ")");
        // A new classification supersedes whatever the executor still has outstanding.
        executor_.cancelOutstanding();
    }

    if (decision.execute) {
        recovery::RecoveryAttemptResult result = executor_.execute(report.classification, snapshot);
        recovery::AttemptRecord record = scheduler_.recordAttempt(result.success, snapshot.takenAt);

        report.executed = true;
        report.action = result.action;
        report.actionSucceeded = result.success;
        report.error = result.error;
        report.attemptCount = record.attemptCount;
        report.elapsedSinceFirstFailure = record.elapsedSinceFirstFailure;
        report.nextRetryIn = scheduler_.policyFor(recovery::backoffClassFor(report.classification))
            .waitFor(static_cast<std::size_t>(record.attemptCount - 1));

        if (record.milestone) {
            nlohmann::json data = {
                {"recoveryType", recovery::recoveryTypeToString(report.classification)},
                {"attemptCount", record.attemptCount},
                {"elapsedSinceFirstFailureSeconds", record.elapsedSinceFirstFailure.count()},
                {"lastAction", result.action},
                {"lastSuccess", result.success}
            };
            if (!result.error.empty()) {
                data["lastError"] = result.error;
            }
            publisher_->publish(events::EVENT_RECOVERY_MILESTONE, data);
        }

        if (result.success && recovery::isReconnectionType(report.classification) && running_) {
            requestCheck("post_reconnect");
        }
    } else {
        report.attemptCount = decision.attemptCount;
        report.elapsedSinceFirstFailure = decision.elapsedSinceFirstFailure;
        if (report.classification != recovery::RecoveryType::NONE) {
            report.nextRetryIn = std::max(Seconds(0), decision.requiredWait - decision.elapsedSinceLastAttempt);
            log.debug("[MONITOR] " + recovery::recoveryTypeToString(report.classification) + " backing off, "
                + std::to_string(report.nextRetryIn.count()) + "s until attempt "
                + std::to_string(report.attemptCount + 1));
        }
    }

    publishCycle(report);
    publishState(report);
    return report;
}

void HealthMonitor::publishCycle(const CycleReport& report) {
    publisher_->publish(events::EVENT_HEALTH_CYCLE, report.toJson());
}

void HealthMonitor::publishState(const CycleReport& report) {
    StateObserver observer;
    recovery::RecoveryState state = scheduler_.state();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        publishedState_ = state;
        lastReport_ = report;
        graceWindowEnd_ = gate_.graceWindowEnd();
        observer = observer_;
    }
    if (observer) {
        try {
            observer(state, report);
        } catch (const std::exception& e) {
            logging::Logger::getInstance().error("[MONITOR] State observer failed: " + std::string(e.what()));
        }
    }
}

recovery::RecoveryState HealthMonitor::getRecoveryState() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return publishedState_;
}

std::optional<CycleReport> HealthMonitor::getLastReport() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastReport_;
}

void HealthMonitor::setStateObserver(StateObserver observer) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    observer_ = std::move(observer);
}

nlohmann::json HealthMonitor::getStateSnapshot() const {
    nlohmann::json snapshot;
    snapshot["running"] = running_.load();
    snapshot["pollingIntervalSeconds"] = settings_.pollingInterval.count();

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        snapshot["recovery"] = publishedState_.toJson();
        snapshot["lastCycle"] = lastReport_ ? lastReport_->toJson() : nlohmann::json(nullptr);

        snapshot["rebootGraceWindowEndMs"] = graceWindowEnd_
            ? nlohmann::json(toEpochMs(*graceWindowEnd_)) : nlohmann::json(nullptr);
    }

    snapshot["executorBusy"] = executor_.isBusy();
    snapshot["transactionBusy"] = coordinator_.isBusy();
    snapshot["networkBlipInFlight"] = blipHandler_.isHandling();
    return snapshot;
}

} // namespace terminal_health::core
