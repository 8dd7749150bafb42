// include/recovery/network_blip_handler.h
#pragma once

#include "devices/icard_reader.h"
#include "devices/ipayment_intents.h"
#include "recovery/transaction_coordinator.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace terminal_health::recovery {

struct BlipOutcome {
    bool networkOnline = false;
    TransactionOpResult result;
};

// NetworkBlipHandler - zero-touch fast path for connectivity flips while the
// reader is awaiting a card. Runs off the polling cadence: each accepted flip
// cancels the intent, waits the settle delay and recreates it on a worker
// thread. Flips that arrive while one is being handled are dropped.
class NetworkBlipHandler {
public:
    using OutcomeCallback = std::function<void(const BlipOutcome&)>;

    NetworkBlipHandler(devices::ICardReader& reader,
                       devices::IPaymentIntentService& intents,
                       devices::ITerminalContext& context,
                       TransactionCoordinator& coordinator,
                       std::chrono::milliseconds settleDelay);
    ~NetworkBlipHandler();

    void setOutcomeCallback(OutcomeCallback callback);

    /// Seed the last known connectivity from the SDK so a notification that
    /// repeats the current state is not taken for a flip. Call before subscribing.
    void prime();

    /// Connectivity notification entry point. Returns true when the flip
    /// started a cancel/recreate.
    bool onConnectivityChanged(bool networkOnline);

    bool isHandling() const { return inFlight_.load(); }

    /// Block until the in-flight cancel/recreate (if any) has finished.
    void waitIdle();

    void shutdown();

private:
    bool isAwaitingInput() const;
    void handleFlip(bool networkOnline, OutcomeCallback callback);

    devices::ICardReader& reader_;
    devices::IPaymentIntentService& intents_;
    devices::ITerminalContext& context_;
    TransactionCoordinator& coordinator_;
    std::chrono::milliseconds settleDelay_;

    std::mutex mutex_;
    std::optional<bool> lastOnline_;
    std::thread worker_;
    OutcomeCallback outcomeCallback_;
    std::atomic<bool> inFlight_{false};
    std::atomic<bool> stopping_{false};
};

} // namespace terminal_health::recovery
