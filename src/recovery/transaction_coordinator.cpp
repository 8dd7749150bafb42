// src/recovery/transaction_coordinator.cpp
#include "recovery/transaction_coordinator.h"
#include "common/future_wait.h"
#include "logging/logger.h"
#include <algorithm>
#include <thread>

namespace terminal_health::recovery {

namespace {

// Clears busy_ on every exit path of a locked operation
struct BusyGuard {
    explicit BusyGuard(std::atomic<bool>& flag) : flag_(flag) { flag_ = true; }
    ~BusyGuard() { flag_ = false; }
    std::atomic<bool>& flag_;
};

} // namespace

TransactionCoordinator::TransactionCoordinator(devices::IPaymentIntentService& intents,
                                               devices::ICardReader& reader,
                                               devices::ITerminalContext& context,
                                               std::chrono::milliseconds operationTimeout)
    : intents_(intents)
    , reader_(reader)
    , context_(context)
    , operationTimeout_(operationTimeout)
{
}

bool TransactionCoordinator::isZeroTouch() const {
    try {
        return context_.getLayoutKind() == devices::LayoutKind::ZERO_TOUCH;
    } catch (const std::exception& e) {
        logging::Logger::getInstance().warn("[TXN] Cannot read layout: " + std::string(e.what()));
        return false;
    }
}

devices::PaymentIntentRequest TransactionCoordinator::buildRecreateRequest() const {
    devices::PaymentIntentRequest request;
    devices::ZeroTouchPreset preset = context_.getZeroTouchPreset();
    request.amount = preset.amount;
    request.category = preset.category;
    request.autoCollect = true;

    std::optional<bool> networkOnline;
    std::optional<bool> offlineMode;
    try {
        networkOnline = reader_.isSdkNetworkOnline();
        offlineMode = reader_.isOfflineModeEnabled();
    } catch (const std::exception& e) {
        logging::Logger::getInstance().warn("[TXN] Cannot read connectivity: " + std::string(e.what()));
    }

    if (!offlineMode.value_or(false)) {
        request.offlinePreference = devices::OfflinePreference::REQUIRE_ONLINE;
    } else if (networkOnline.value_or(false)) {
        request.offlinePreference = devices::OfflinePreference::PREFER_ONLINE;
    } else {
        request.offlinePreference = devices::OfflinePreference::FORCE_OFFLINE;
    }
    return request;
}

bool TransactionCoordinator::cancelLocked(const std::string& intentId, bool force, std::string& error) {
    auto& log = logging::Logger::getInstance();

    // Collection may already be idle; a failure here does not stop the intent cancel.
    auto collection = intents_.cancelPaymentCollection(intentId);
    std::string collectionError;
    auto collectionResult = waitForResult(collection, operationTimeout_, collectionError);
    if (!collectionResult) {
        log.warn("[TXN] cancel-payment-collection(" + intentId + ") " + collectionError);
    } else if (!collectionResult->success) {
        log.debug("[TXN] cancel-payment-collection(" + intentId + ") rejected: " + collectionResult->error);
    }

    auto cancel = intents_.cancelPaymentIntent(intentId);
    auto cancelResult = waitForResult(cancel, operationTimeout_, error);
    bool cancelled = cancelResult.has_value() && cancelResult->success;
    if (cancelResult && !cancelResult->success) {
        error = cancelResult->error;
    }

    if (!cancelled) {
        log.error("[TXN] cancel-payment-intent(" + intentId + ") failed: " + error);
        if (!force) {
            return false;
        }
        log.warn("[TXN] Forcing local clear of intent " + intentId);
    }

    intents_.clearActiveIntent();
    return true;
}

bool TransactionCoordinator::createLocked(TransactionOpResult& result) {
    devices::PaymentIntentRequest request = buildRecreateRequest();
    logging::Logger::getInstance().info("[TXN] create-payment-intent(amount=" + std::to_string(request.amount)
        + ", category=" + request.category
        + ", offline=" + devices::offlinePreferenceToString(request.offlinePreference)
        + ", autoCollect=" + (request.autoCollect ? "true" : "false") + ")");

    auto create = intents_.createPaymentIntent(request);
    std::string error;
    auto created = waitForResult(create, operationTimeout_, error);
    if (created && created->success) {
        result.recreated = true;
        result.newIntent = created->intent;
        logging::Logger::getInstance().info("[TXN] Created intent " + created->intent.id);
        return true;
    }
    result.error = created ? created->error : error;
    logging::Logger::getInstance().error("[TXN] create-payment-intent failed: " + result.error);
    return false;
}

TransactionOpResult TransactionCoordinator::cancelIntent(const std::string& intentId,
                                                         const CancelOptions& options,
                                                         const std::string& reason) {
    TransactionOpResult result;
    std::unique_lock<std::mutex> lock(opMutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        result.status = TransactionOpStatus::BUSY;
        logging::Logger::getInstance().info("[TXN] " + reason + ": another transaction operation in flight, skipping");
        return result;
    }
    BusyGuard busy(busy_);

    auto active = intents_.getActiveIntent();
    if (!active || active->id != intentId) {
        result.status = TransactionOpStatus::STALE;
        logging::Logger::getInstance().info("[TXN] " + reason + ": intent " + intentId + " is no longer active");
        return result;
    }

    logging::Logger::getInstance().info("[TXN] " + reason + ": cancelling intent " + intentId);
    if (!cancelLocked(intentId, options.force, result.error)) {
        result.status = TransactionOpStatus::FAILED;
        return result;
    }
    result.cancelled = true;

    if (options.recreate) {
        if (!isZeroTouch()) {
            logging::Logger::getInstance().info("[TXN] Manual layout: intent cleared, waiting for user to start a new payment");
        } else if (!createLocked(result)) {
            result.status = TransactionOpStatus::FAILED;
            return result;
        }
    }

    result.status = TransactionOpStatus::COMPLETED;
    return result;
}

TransactionOpResult TransactionCoordinator::replaceActive(const std::string& reason,
                                                          std::chrono::milliseconds settleDelay,
                                                          const std::atomic<bool>* stopFlag) {
    TransactionOpResult result;
    if (!isZeroTouch()) {
        result.status = TransactionOpStatus::COMPLETED;
        logging::Logger::getInstance().debug("[TXN] " + reason + ": manual layout, no automatic recreate");
        return result;
    }

    std::unique_lock<std::mutex> lock(opMutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        result.status = TransactionOpStatus::BUSY;
        logging::Logger::getInstance().info("[TXN] " + reason + ": another transaction operation in flight, skipping");
        return result;
    }
    BusyGuard busy(busy_);

    auto active = intents_.getActiveIntent();
    if (active) {
        logging::Logger::getInstance().info("[TXN] " + reason + ": cancelling intent " + active->id);
        if (!cancelLocked(active->id, false, result.error)) {
            result.status = TransactionOpStatus::FAILED;
            return result;
        }
        result.cancelled = true;
    }

    const auto slice = std::chrono::milliseconds(50);
    auto waited = std::chrono::milliseconds(0);
    while (waited < settleDelay) {
        if (stopFlag && stopFlag->load()) {
            result.status = TransactionOpStatus::FAILED;
            result.error = "stopped during settle delay";
            return result;
        }
        auto step = std::min(slice, settleDelay - waited);
        std::this_thread::sleep_for(step);
        waited += step;
    }

    if (!createLocked(result)) {
        result.status = TransactionOpStatus::FAILED;
        return result;
    }
    result.status = TransactionOpStatus::COMPLETED;
    return result;
}

} // namespace terminal_health::recovery
