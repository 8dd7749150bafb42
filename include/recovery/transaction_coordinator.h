// include/recovery/transaction_coordinator.h
#pragma once

#include "devices/icard_reader.h"
#include "devices/ipayment_intents.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace terminal_health::recovery {

enum class TransactionOpStatus {
    COMPLETED,
    BUSY,      // another cancel/recreate is in flight
    STALE,     // the intent is no longer the active one
    FAILED
};

inline std::string transactionOpStatusToString(TransactionOpStatus status) {
    switch (status) {
        case TransactionOpStatus::COMPLETED: return "completed";
        case TransactionOpStatus::BUSY: return "busy";
        case TransactionOpStatus::STALE: return "stale";
        case TransactionOpStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

struct TransactionOpResult {
    TransactionOpStatus status = TransactionOpStatus::FAILED;
    bool cancelled = false;
    bool recreated = false;
    std::optional<devices::PaymentIntentRecord> newIntent;
    std::string error;

    bool ok() const { return status == TransactionOpStatus::COMPLETED; }
};

struct CancelOptions {
    bool recreate = false;   // honored for zero-touch layout only
    bool force = false;      // clear the local record even if the cancel call fails
};

// TransactionCoordinator - the only path that cancels or recreates the
// terminal's payment intent. Single-flight: a request that arrives while
// another is running returns BUSY instead of waiting.
class TransactionCoordinator {
public:
    TransactionCoordinator(devices::IPaymentIntentService& intents,
                           devices::ICardReader& reader,
                           devices::ITerminalContext& context,
                           std::chrono::milliseconds operationTimeout);

    /// Cancel `intentId` if it is still the active intent, clear it, and
    /// optionally create a replacement.
    TransactionOpResult cancelIntent(const std::string& intentId,
                                     const CancelOptions& options,
                                     const std::string& reason);

    /// Cancel whatever intent is active (if any), wait `settleDelay`, then
    /// create a replacement. Zero-touch layout only. `stopFlag` aborts the settle wait.
    TransactionOpResult replaceActive(const std::string& reason,
                                      std::chrono::milliseconds settleDelay = std::chrono::milliseconds(0),
                                      const std::atomic<bool>* stopFlag = nullptr);

    bool isBusy() const { return busy_.load(); }

    /// Request for a new zero-touch intent matching current connectivity.
    devices::PaymentIntentRequest buildRecreateRequest() const;

private:
    bool cancelLocked(const std::string& intentId, bool force, std::string& error);
    bool createLocked(TransactionOpResult& result);
    bool isZeroTouch() const;

    devices::IPaymentIntentService& intents_;
    devices::ICardReader& reader_;
    devices::ITerminalContext& context_;
    std::chrono::milliseconds operationTimeout_;

    std::mutex opMutex_;
    std::atomic<bool> busy_{false};
};

} // namespace terminal_health::recovery
