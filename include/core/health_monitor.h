// include/core/health_monitor.h
#pragma once

#include "common/clock.h"
#include "core/monitor_settings.h"
#include "devices/icard_reader.h"
#include "devices/ipayment_intents.h"
#include "events/event_publisher.h"
#include "health/condition_evaluator.h"
#include "health/health_sampler.h"
#include "health/lifecycle_guard.h"
#include "health/suppression_gate.h"
#include "recovery/network_blip_handler.h"
#include "recovery/recovery_executor.h"
#include "recovery/recovery_scheduler.h"
#include "recovery/transaction_coordinator.h"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

namespace terminal_health::core {

// What one pass of the pipeline saw and did
struct CycleReport {
    TimePoint at;
    std::string trigger;

    bool suppressed = false;
    std::string skipReason;

    health::LifecycleAction lifecycleAction = health::LifecycleAction::NONE;
    std::string lifecycleStatus;
    std::string lifecycleError;

    recovery::RecoveryType classification = recovery::RecoveryType::NONE;
    std::string rule;

    bool executed = false;
    std::string action;
    bool actionSucceeded = false;
    std::string error;

    int attemptCount = 0;
    Seconds elapsedSinceFirstFailure{0};
    Seconds nextRetryIn{0};

    nlohmann::json toJson() const;
};

// HealthMonitor - runs Sampler -> Gate -> Lifecycle Guard -> Evaluator ->
// Scheduler -> Executor on a periodic worker thread, and hosts the network
// blip fast path. The cycle is the only writer of RecoveryState; observers
// get copies.
class HealthMonitor {
public:
    using StateObserver = std::function<void(const recovery::RecoveryState&, const CycleReport&)>;

    HealthMonitor(devices::ICardReader& reader,
                  devices::IPaymentIntentService& intents,
                  devices::ITerminalContext& context,
                  const MonitorSettings& settings,
                  std::shared_ptr<IClock> clock,
                  std::shared_ptr<events::EventPublisher> publisher);
    ~HealthMonitor();

    // Start the polling thread and subscribe to connectivity changes.
    bool start();

    // Cancel outstanding recovery and join all threads.
    void stop();

    bool isRunning() const { return running_.load(); }

    /// Run a cycle as soon as the worker is free (ad-hoc trigger).
    void requestCheck(const std::string& reason);

    /// One synchronous pass of the pipeline.
    CycleReport runCycle(const std::string& trigger = "manual");

    recovery::RecoveryState getRecoveryState() const;
    std::optional<CycleReport> getLastReport() const;
    void setStateObserver(StateObserver observer);

    // State snapshot for a status display
    nlohmann::json getStateSnapshot() const;

    recovery::NetworkBlipHandler& getBlipHandler() { return blipHandler_; }

private:
    void workerLoop();
    void publishCycle(const CycleReport& report);
    void publishState(const CycleReport& report);

    devices::ICardReader& reader_;
    MonitorSettings settings_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<events::EventPublisher> publisher_;

    health::HealthSampler sampler_;
    health::SuppressionGate gate_;
    recovery::TransactionCoordinator coordinator_;
    health::PaymentIntentLifecycleGuard guard_;
    recovery::RecoveryScheduler scheduler_;
    recovery::RecoveryExecutor executor_;
    recovery::NetworkBlipHandler blipHandler_;

    // Serializes runCycle between the worker and direct callers
    std::mutex cycleMutex_;

    mutable std::mutex stateMutex_;
    recovery::RecoveryState publishedState_;
    std::optional<CycleReport> lastReport_;
    std::optional<TimePoint> graceWindowEnd_;
    StateObserver observer_;

    std::thread worker_;
    std::mutex wakeMutex_;
    std::condition_variable wakeCondition_;
    bool checkRequested_{false};
    std::string pendingTrigger_;
    std::atomic<bool> running_{false};
};

} // namespace terminal_health::core
