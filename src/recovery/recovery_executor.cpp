// src/recovery/recovery_executor.cpp
#include "recovery/recovery_executor.h"
#include "common/future_wait.h"
#include "logging/logger.h"
#include <algorithm>
#include <utility>

namespace terminal_health::recovery {

namespace {

struct BusyFlagReset {
    explicit BusyFlagReset(std::atomic<bool>& flag) : flag_(flag) {}
    ~BusyFlagReset() { flag_ = false; }
    std::atomic<bool>& flag_;
};

} // namespace

RecoveryExecutor::RecoveryExecutor(devices::ICardReader& reader,
                                   devices::ITerminalContext& context,
                                   TransactionCoordinator& coordinator,
                                   const ExecutorTimeouts& timeouts,
                                   std::string discoveryDeviceType)
    : reader_(reader)
    , context_(context)
    , coordinator_(coordinator)
    , timeouts_(timeouts)
    , discoveryDeviceType_(std::move(discoveryDeviceType))
{
}

RecoveryAttemptResult RecoveryExecutor::execute(RecoveryType type, const health::HealthSnapshot& snapshot) {
    RecoveryAttemptResult result;
    switch (type) {
        case RecoveryType::NONE:
            result.success = true;
            result.action = "none";
            return result;
        case RecoveryType::SDK_OFFLINE:
            // Nothing to drive; classification flips to NONE when the network returns.
            result.success = true;
            result.action = "await_network";
            logging::Logger::getInstance().info("[EXECUTOR] SDK offline, waiting for network to return");
            return result;
        default:
            break;
    }

    try {
        return reconnect(type, snapshot);
    } catch (const std::exception& e) {
        logging::Logger::getInstance().error("[EXECUTOR] Reconnect sequence threw: " + std::string(e.what()));
        result.success = false;
        result.action = "reconnect";
        result.error = e.what();
        return result;
    }
}

void RecoveryExecutor::cancelOutstanding() {
    cancelRequested_ = true;
    try {
        reader_.cancelDiscovery();
    } catch (const std::exception& e) {
        logging::Logger::getInstance().warn("[EXECUTOR] cancel-discovery failed: " + std::string(e.what()));
    }
}

RecoveryAttemptResult RecoveryExecutor::reconnect(RecoveryType type, const health::HealthSnapshot& snapshot) {
    auto& log = logging::Logger::getInstance();
    RecoveryAttemptResult result;
    result.action = "reconnect";

    if (busy_) {
        log.info("[EXECUTOR] Superseding outstanding reconnect sequence");
        cancelOutstanding();
    }

    std::lock_guard<std::mutex> runLock(runMutex_);
    busy_ = true;
    cancelRequested_ = false;
    BusyFlagReset busyReset(busy_);

    log.info("[EXECUTOR] Reconnect sequence for " + recoveryTypeToString(type)
        + " (reader " + (snapshot.readerConnectionState
            ? devices::connectionStateToString(*snapshot.readerConnectionState) : std::string("unknown")) + ")");

    reader_.cancelDiscovery();
    reader_.clearDiscoveredReaders();

    const std::string boundId = reader_.getBoundReaderId();
    if (boundId.empty()) {
        result.error = "no bound reader to reconnect to";
        log.error("[EXECUTOR] " + result.error);
        return result;
    }

    auto discovery = reader_.startDiscovery(discoveryDeviceType_);
    std::string error;
    auto discovered = waitForResult(discovery, timeouts_.discovery, error, &cancelRequested_);
    if (!discovered || !discovered->success) {
        result.error = "discovery " + (discovered ? discovered->error : error);
        reader_.cancelDiscovery();
        log.warn("[EXECUTOR] " + result.error);
        return result;
    }

    auto it = std::find_if(discovered->readers.begin(), discovered->readers.end(),
        [&boundId](const devices::DiscoveredReader& r) { return r.deviceId == boundId; });
    if (it == discovered->readers.end()) {
        result.error = "bound reader " + boundId + " not found among "
            + std::to_string(discovered->readers.size()) + " discovered";
        reader_.cancelDiscovery();
        log.warn("[EXECUTOR] " + result.error);
        return result;
    }

    log.info("[EXECUTOR] Bound reader " + boundId + " reappeared, connecting");
    auto connecting = reader_.connect(boundId);
    auto connected = waitForResult(connecting, timeouts_.connect, error, &cancelRequested_);
    if (!connected || !connected->success) {
        result.error = "connect " + (connected ? connected->error : error);
        log.warn("[EXECUTOR] " + result.error);
        return result;
    }

    result.success = true;
    result.action = "reconnected";
    log.info("[EXECUTOR] Reader " + boundId + " reconnected");

    if (context_.getLayoutKind() == devices::LayoutKind::ZERO_TOUCH) {
        TransactionOpResult txn = coordinator_.replaceActive("post_reconnect");
        result.transactionRecreated = txn.recreated;
        if (txn.recreated) {
            result.action = "reconnected+intent_recreated";
        } else if (!txn.ok()) {
            log.warn("[EXECUTOR] Intent recreate after reconnect not completed ("
                + transactionOpStatusToString(txn.status) + "): " + txn.error);
        }
    }
    return result;
}

} // namespace terminal_health::recovery
