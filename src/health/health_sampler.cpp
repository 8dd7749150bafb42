// src/health/health_sampler.cpp
#include "health/health_sampler.h"
#include "logging/logger.h"
#include <exception>
#include <utility>

namespace terminal_health::health {

namespace {

// Reads one signal; an exception leaves the target untouched (unknown).
template <typename Target, typename Getter>
void readSignal(const char* name, Target& target, Getter getter) {
    try {
        target = getter();
    } catch (const std::exception& e) {
        logging::Logger::getInstance().warn(
            std::string("[SAMPLER] Cannot read ") + name + ": " + e.what());
    }
}

} // namespace

HealthSampler::HealthSampler(devices::ICardReader& reader,
                             devices::IPaymentIntentService& intents,
                             devices::ITerminalContext& context,
                             std::shared_ptr<IClock> clock)
    : reader_(reader)
    , intents_(intents)
    , context_(context)
    , clock_(std::move(clock))
{
}

HealthSnapshot HealthSampler::sample() const {
    HealthSnapshot snapshot;
    snapshot.takenAt = clock_->now();

    readSignal("readerConnectionState", snapshot.readerConnectionState,
        [this] { return reader_.getConnectionState(); });
    readSignal("readerReadiness", snapshot.readerReadiness,
        [this] { return reader_.getReadiness(); });
    readSignal("readerOnline", snapshot.readerOnline,
        [this] { return reader_.isReaderOnline(); });
    readSignal("sdkNetworkOnline", snapshot.sdkNetworkOnline,
        [this] { return reader_.isSdkNetworkOnline(); });
    readSignal("offlineModeEnabled", snapshot.offlineModeEnabled,
        [this] { return reader_.isOfflineModeEnabled(); });
    readSignal("softwareUpdateInProgress", snapshot.softwareUpdateInProgress,
        [this] { return reader_.isSoftwareUpdateInProgress(); });

    std::optional<devices::DisconnectInfo> disconnect;
    readSignal("lastDisconnect", disconnect, [this] { return reader_.getLastDisconnect(); });
    if (disconnect) {
        snapshot.lastDisconnectReason = disconnect->reason;
        snapshot.lastDisconnectTime = disconnect->time;
    }

    std::optional<devices::PaymentIntentRecord> intent;
    readSignal("activeIntent", intent, [this] { return intents_.getActiveIntent(); });
    if (intent) {
        snapshot.paymentIntentId = intent->id;
        snapshot.paymentIntentCreatedAt = intent->createdAt;
        snapshot.awaitingInputSince = intent->awaitingInputSince;
    }

    // Session and layout are application state; a failed read keeps the
    // defaults (not in session, zero-touch), which suppresses the cycle.
    readSignal("layout", snapshot.terminalLayoutKind, [this] { return context_.getLayoutKind(); });
    readSignal("inPaymentSession", snapshot.inPaymentSession,
        [this] { return context_.isInPaymentSession(); });

    return snapshot;
}

} // namespace terminal_health::health
