// src/recovery/network_blip_handler.cpp
#include "recovery/network_blip_handler.h"
#include "logging/logger.h"
#include <utility>

namespace terminal_health::recovery {

NetworkBlipHandler::NetworkBlipHandler(devices::ICardReader& reader,
                                       devices::IPaymentIntentService& intents,
                                       devices::ITerminalContext& context,
                                       TransactionCoordinator& coordinator,
                                       std::chrono::milliseconds settleDelay)
    : reader_(reader)
    , intents_(intents)
    , context_(context)
    , coordinator_(coordinator)
    , settleDelay_(settleDelay)
{
}

NetworkBlipHandler::~NetworkBlipHandler() {
    shutdown();
}

void NetworkBlipHandler::setOutcomeCallback(OutcomeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomeCallback_ = std::move(callback);
}

void NetworkBlipHandler::prime() {
    std::optional<bool> online;
    try {
        online = reader_.isSdkNetworkOnline();
    } catch (const std::exception& e) {
        logging::Logger::getInstance().warn("[BLIP] Cannot read SDK connectivity: " + std::string(e.what()));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    lastOnline_ = online;
}

bool NetworkBlipHandler::isAwaitingInput() const {
    try {
        auto readiness = reader_.getReadiness();
        if (readiness && *readiness == devices::ReaderReadiness::AWAITING_INPUT) {
            return true;
        }
        auto intent = intents_.getActiveIntent();
        return intent && intent->awaitingInputSince.has_value();
    } catch (const std::exception& e) {
        logging::Logger::getInstance().warn("[BLIP] Cannot read awaiting-input state: " + std::string(e.what()));
        return false;
    }
}

bool NetworkBlipHandler::onConnectivityChanged(bool networkOnline) {
    auto& log = logging::Logger::getInstance();
    std::lock_guard<std::mutex> lock(mutex_);

    if (lastOnline_ && *lastOnline_ == networkOnline) {
        return false;
    }
    lastOnline_ = networkOnline;

    if (stopping_) {
        return false;
    }
    if (context_.getLayoutKind() != devices::LayoutKind::ZERO_TOUCH) {
        return false;
    }
    if (!isAwaitingInput()) {
        log.debug("[BLIP] Network " + std::string(networkOnline ? "online" : "offline")
            + " outside awaiting-input, left to the polling cycle");
        return false;
    }

    bool expected = false;
    if (!inFlight_.compare_exchange_strong(expected, true)) {
        log.info("[BLIP] Flip to " + std::string(networkOnline ? "online" : "offline")
            + " ignored, previous flip still being handled");
        return false;
    }

    if (worker_.joinable()) {
        worker_.join();
    }
    log.info("[BLIP] Network went " + std::string(networkOnline ? "online" : "offline")
        + " while awaiting input, refreshing intent");
    worker_ = std::thread(&NetworkBlipHandler::handleFlip, this, networkOnline, outcomeCallback_);
    return true;
}

void NetworkBlipHandler::handleFlip(bool networkOnline, OutcomeCallback callback) {
    BlipOutcome outcome;
    outcome.networkOnline = networkOnline;
    try {
        outcome.result = coordinator_.replaceActive("network_blip", settleDelay_, &stopping_);
    } catch (const std::exception& e) {
        outcome.result.status = TransactionOpStatus::FAILED;
        outcome.result.error = e.what();
    }

    if (!outcome.result.ok()) {
        logging::Logger::getInstance().warn("[BLIP] Intent refresh not completed ("
            + transactionOpStatusToString(outcome.result.status) + "): " + outcome.result.error);
    }

    if (callback) {
        callback(outcome);
    }
    inFlight_ = false;
}

void NetworkBlipHandler::waitIdle() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

void NetworkBlipHandler::shutdown() {
    stopping_ = true;
    waitIdle();
}

} // namespace terminal_health::recovery
