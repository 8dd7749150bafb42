// include/recovery/recovery_executor.h
#pragma once

#include "devices/icard_reader.h"
#include "devices/ipayment_intents.h"
#include "health/health_snapshot.h"
#include "recovery/recovery_types.h"
#include "recovery/transaction_coordinator.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace terminal_health::recovery {

struct ExecutorTimeouts {
    std::chrono::milliseconds discovery{20000};
    std::chrono::milliseconds connect{15000};
};

struct RecoveryAttemptResult {
    bool success = false;
    std::string action;          // what was done, for the cycle event
    std::string error;
    bool transactionRecreated = false;
};

// RecoveryExecutor - carries out the remediation for a RecoveryType.
// Failures come back as a result, never as an exception. At most one
// reconnect sequence runs at a time; a new request cancels the running one.
class RecoveryExecutor {
public:
    RecoveryExecutor(devices::ICardReader& reader,
                     devices::ITerminalContext& context,
                     TransactionCoordinator& coordinator,
                     const ExecutorTimeouts& timeouts,
                     std::string discoveryDeviceType);

    RecoveryAttemptResult execute(RecoveryType type, const health::HealthSnapshot& snapshot);

    /// Abort the outstanding reconnect sequence, if any. Idempotent.
    void cancelOutstanding();

    bool isBusy() const { return busy_.load(); }

private:
    RecoveryAttemptResult reconnect(RecoveryType type, const health::HealthSnapshot& snapshot);

    devices::ICardReader& reader_;
    devices::ITerminalContext& context_;
    TransactionCoordinator& coordinator_;
    ExecutorTimeouts timeouts_;
    std::string discoveryDeviceType_;

    std::mutex runMutex_;
    std::atomic<bool> busy_{false};
    std::atomic<bool> cancelRequested_{false};
};

} // namespace terminal_health::recovery
