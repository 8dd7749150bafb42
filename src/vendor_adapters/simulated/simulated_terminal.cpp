// src/vendor_adapters/simulated/simulated_terminal.cpp
#include "vendor_adapters/simulated/simulated_terminal.h"
#include "common/uuid_generator.h"
#include "logging/logger.h"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace terminal_health::vendor::simulated {

namespace {

template <typename T>
std::future<T> readyFuture(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

devices::OperationResult ok() {
    devices::OperationResult result;
    result.success = true;
    return result;
}

devices::OperationResult failed(const std::string& error) {
    devices::OperationResult result;
    result.success = false;
    result.error = error;
    return result;
}

// Reads `key` into `target`: absent leaves it alone, null makes it unknown.
void readOptionalBool(const nlohmann::json& status, const char* key, std::optional<bool>& target) {
    auto it = status.find(key);
    if (it == status.end()) {
        return;
    }
    if (it->is_null()) {
        target.reset();
    } else if (it->is_boolean()) {
        target = it->get<bool>();
    } else {
        logging::Logger::getInstance().warn(std::string("[SIM] Status field ") + key + " is not a boolean");
    }
}

void readFlag(const nlohmann::json& status, const char* key, bool& target) {
    auto it = status.find(key);
    if (it != status.end() && it->is_boolean()) {
        target = it->get<bool>();
    }
}

} // namespace

SimulatedTerminal::SimulatedTerminal(std::shared_ptr<IClock> clock)
    : clock_(std::move(clock))
    , connectionState_(devices::ReaderConnectionState::CONNECTED)
    , readiness_(devices::ReaderReadiness::READY)
    , readerOnline_(true)
    , sdkNetworkOnline_(true)
    , offlineModeEnabled_(false)
    , softwareUpdateInProgress_(false)
    , boundReaderId_("tmr_sim_reader")
{
    preset_.amount = 100;
    preset_.category = "default";
    discoverableReaders_.push_back({boundReaderId_, "tap_to_pay", "Simulated reader"});
}

SimulatedTerminal::~SimulatedTerminal() {
    releaseStalled();
}

void SimulatedTerminal::record(const std::string& command) {
    commands_.push_back(command);
    if (commands_.size() > MAX_COMMAND_LOG) {
        commands_.pop_front();
    }
    commandCounts_[command]++;
}

void SimulatedTerminal::throwIfUnreadable(const std::string& signal) const {
    if (unreadableSignals_.count(signal) != 0) {
        throw std::runtime_error("signal '" + signal + "' unavailable");
    }
}

// --- ICardReader ---

std::optional<devices::ReaderConnectionState> SimulatedTerminal::getConnectionState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfUnreadable("connection");
    return connectionState_;
}

std::optional<devices::ReaderReadiness> SimulatedTerminal::getReadiness() const {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfUnreadable("readiness");
    return readiness_;
}

std::optional<bool> SimulatedTerminal::isReaderOnline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfUnreadable("reader_online");
    return readerOnline_;
}

std::optional<bool> SimulatedTerminal::isSdkNetworkOnline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfUnreadable("sdk_network_online");
    return sdkNetworkOnline_;
}

std::optional<bool> SimulatedTerminal::isOfflineModeEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfUnreadable("offline_mode_enabled");
    return offlineModeEnabled_;
}

std::optional<bool> SimulatedTerminal::isSoftwareUpdateInProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfUnreadable("software_update_in_progress");
    return softwareUpdateInProgress_;
}

std::optional<devices::DisconnectInfo> SimulatedTerminal::getLastDisconnect() const {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfUnreadable("last_disconnect");
    return lastDisconnect_;
}

std::string SimulatedTerminal::getBoundReaderId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return boundReaderId_;
}

void SimulatedTerminal::cancelDiscovery() {
    std::vector<std::shared_ptr<std::promise<devices::DiscoveryResult>>> stalled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        record("cancel_discovery");
        discovering_ = false;
        stalled.swap(stalledDiscoveries_);
    }
    for (auto& promise : stalled) {
        devices::DiscoveryResult result;
        result.error = "discovery cancelled";
        promise->set_value(result);
    }
}

void SimulatedTerminal::clearDiscoveredReaders() {
    std::lock_guard<std::mutex> lock(mutex_);
    record("clear_discovered_readers");
    discoveredReaders_.clear();
}

std::future<devices::DiscoveryResult> SimulatedTerminal::startDiscovery(const std::string& deviceTypeFilter) {
    std::lock_guard<std::mutex> lock(mutex_);
    record("discover");

    if (stallDiscovery_) {
        discovering_ = true;
        auto promise = std::make_shared<std::promise<devices::DiscoveryResult>>();
        stalledDiscoveries_.push_back(promise);
        return promise->get_future();
    }

    devices::DiscoveryResult result;
    if (failDiscovery_) {
        result.error = "discovery failed";
        return readyFuture(result);
    }

    for (const auto& reader : discoverableReaders_) {
        if (deviceTypeFilter.empty() || reader.deviceType == deviceTypeFilter) {
            result.readers.push_back(reader);
        }
    }
    discoveredReaders_ = result.readers;
    result.success = true;
    return readyFuture(result);
}

std::future<devices::OperationResult> SimulatedTerminal::connect(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    record("connect");

    if (stallConnect_) {
        connectionState_ = devices::ReaderConnectionState::CONNECTING;
        auto promise = std::make_shared<std::promise<devices::OperationResult>>();
        stalledConnects_.push_back(promise);
        return promise->get_future();
    }

    auto found = std::find_if(discoveredReaders_.begin(), discoveredReaders_.end(),
        [&deviceId](const devices::DiscoveredReader& reader) { return reader.deviceId == deviceId; });
    if (found == discoveredReaders_.end()) {
        return readyFuture(failed("reader " + deviceId + " not discovered"));
    }
    if (failConnect_) {
        connectionState_ = devices::ReaderConnectionState::NOT_CONNECTED;
        return readyFuture(failed("connect failed"));
    }

    connectionState_ = devices::ReaderConnectionState::CONNECTED;
    readerOnline_ = true;
    readiness_ = readinessAfterConnect_;
    return readyFuture(ok());
}

void SimulatedTerminal::setConnectivityChangedCallback(std::function<void(bool networkOnline)> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectivityCallback_ = std::move(callback);
}

// --- IPaymentIntentService ---

std::optional<devices::PaymentIntentRecord> SimulatedTerminal::getActiveIntent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    throwIfUnreadable("payment_intent");
    return activeIntent_;
}

std::future<devices::OperationResult> SimulatedTerminal::cancelPaymentCollection(const std::string& intentId) {
    std::lock_guard<std::mutex> lock(mutex_);
    record("cancel_collection");
    if (!activeIntent_ || activeIntent_->id != intentId) {
        return readyFuture(failed("no collection in progress for " + intentId));
    }
    activeIntent_->awaitingInputSince.reset();
    if (readiness_ == devices::ReaderReadiness::AWAITING_INPUT) {
        readiness_ = devices::ReaderReadiness::READY;
    }
    return readyFuture(ok());
}

std::future<devices::OperationResult> SimulatedTerminal::cancelPaymentIntent(const std::string& intentId) {
    std::lock_guard<std::mutex> lock(mutex_);
    record("cancel_intent");
    if (failCancelIntent_) {
        return readyFuture(failed("cancel rejected"));
    }
    if (!activeIntent_ || activeIntent_->id != intentId) {
        return readyFuture(failed("intent " + intentId + " not found"));
    }
    return readyFuture(ok());
}

std::future<devices::CreateIntentResult> SimulatedTerminal::createPaymentIntent(const devices::PaymentIntentRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    record("create_intent");
    lastCreateRequest_ = request;

    devices::CreateIntentResult result;
    if (failCreateIntent_) {
        result.error = "create rejected";
        return readyFuture(result);
    }

    TimePoint now = clock_->now();
    result.intent.id = UUIDGenerator::shortId("pi_sim_");
    result.intent.createdAt = now;
    if (request.autoCollect) {
        result.intent.awaitingInputSince = now;
        readiness_ = devices::ReaderReadiness::AWAITING_INPUT;
    }
    activeIntent_ = result.intent;
    result.success = true;
    return readyFuture(result);
}

void SimulatedTerminal::clearActiveIntent() {
    std::lock_guard<std::mutex> lock(mutex_);
    record("clear_intent");
    activeIntent_.reset();
}

// --- ITerminalContext ---

bool SimulatedTerminal::isInPaymentSession() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inPaymentSession_;
}

devices::LayoutKind SimulatedTerminal::getLayoutKind() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return layoutKind_;
}

devices::ZeroTouchPreset SimulatedTerminal::getZeroTouchPreset() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return preset_;
}

// --- Scenario control ---

void SimulatedTerminal::setConnectionState(std::optional<devices::ReaderConnectionState> state) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectionState_ = state;
}

void SimulatedTerminal::setReadiness(std::optional<devices::ReaderReadiness> readiness) {
    std::lock_guard<std::mutex> lock(mutex_);
    readiness_ = readiness;
}

void SimulatedTerminal::setReaderOnline(std::optional<bool> online) {
    std::lock_guard<std::mutex> lock(mutex_);
    readerOnline_ = online;
}

void SimulatedTerminal::setOfflineModeEnabled(std::optional<bool> enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    offlineModeEnabled_ = enabled;
}

void SimulatedTerminal::setSoftwareUpdateInProgress(std::optional<bool> inProgress) {
    std::lock_guard<std::mutex> lock(mutex_);
    softwareUpdateInProgress_ = inProgress;
}

void SimulatedTerminal::setLastDisconnect(std::optional<devices::DisconnectInfo> disconnect) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastDisconnect_ = std::move(disconnect);
}

void SimulatedTerminal::setBoundReaderId(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    boundReaderId_ = deviceId;
}

void SimulatedTerminal::setDiscoverableReaders(const std::vector<devices::DiscoveredReader>& readers) {
    std::lock_guard<std::mutex> lock(mutex_);
    discoverableReaders_ = readers;
}

void SimulatedTerminal::setInPaymentSession(bool inSession) {
    std::lock_guard<std::mutex> lock(mutex_);
    inPaymentSession_ = inSession;
}

void SimulatedTerminal::setLayoutKind(devices::LayoutKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    layoutKind_ = kind;
}

void SimulatedTerminal::setZeroTouchPreset(const devices::ZeroTouchPreset& preset) {
    std::lock_guard<std::mutex> lock(mutex_);
    preset_ = preset;
}

void SimulatedTerminal::setActiveIntent(std::optional<devices::PaymentIntentRecord> intent) {
    std::lock_guard<std::mutex> lock(mutex_);
    activeIntent_ = std::move(intent);
}

void SimulatedTerminal::setSdkNetworkOnline(std::optional<bool> online) {
    std::lock_guard<std::mutex> lock(mutex_);
    sdkNetworkOnline_ = online;
}

void SimulatedTerminal::fireConnectivityChange(bool networkOnline) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sdkNetworkOnline_ = networkOnline;
    }
    notifyConnectivity(networkOnline);
}

void SimulatedTerminal::notifyConnectivity(bool networkOnline) {
    std::function<void(bool)> callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = connectivityCallback_;
    }
    logging::Logger::getInstance().info(std::string("[SIM] SDK network ") + (networkOnline ? "online" : "offline"));
    if (callback) {
        callback(networkOnline);
    }
}

void SimulatedTerminal::setReadinessAfterConnect(devices::ReaderReadiness readiness) {
    std::lock_guard<std::mutex> lock(mutex_);
    readinessAfterConnect_ = readiness;
}

void SimulatedTerminal::setSignalUnreadable(const std::string& signal, bool unreadable) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unreadable) {
        unreadableSignals_.insert(signal);
    } else {
        unreadableSignals_.erase(signal);
    }
}

void SimulatedTerminal::setFailDiscovery(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failDiscovery_ = fail;
}

void SimulatedTerminal::setFailConnect(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failConnect_ = fail;
}

void SimulatedTerminal::setFailCancelIntent(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failCancelIntent_ = fail;
}

void SimulatedTerminal::setFailCreateIntent(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failCreateIntent_ = fail;
}

void SimulatedTerminal::setStallDiscovery(bool stall) {
    std::lock_guard<std::mutex> lock(mutex_);
    stallDiscovery_ = stall;
}

void SimulatedTerminal::setStallConnect(bool stall) {
    std::lock_guard<std::mutex> lock(mutex_);
    stallConnect_ = stall;
}

void SimulatedTerminal::releaseStalled() {
    std::vector<std::shared_ptr<std::promise<devices::DiscoveryResult>>> discoveries;
    std::vector<std::shared_ptr<std::promise<devices::OperationResult>>> connects;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        discoveries.swap(stalledDiscoveries_);
        connects.swap(stalledConnects_);
        discovering_ = false;
    }
    for (auto& promise : discoveries) {
        devices::DiscoveryResult result;
        result.error = "released";
        promise->set_value(result);
    }
    for (auto& promise : connects) {
        promise->set_value(failed("released"));
    }
}

// --- Status file ---

void SimulatedTerminal::applyStatus(const nlohmann::json& status) {
    if (!status.is_object()) {
        logging::Logger::getInstance().warn("[SIM] Status document is not an object, ignored");
        return;
    }

    std::optional<bool> notifyOnline;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (auto it = status.find("connection"); it != status.end()) {
            connectionState_ = it->is_string() ? devices::stringToConnectionState(it->get<std::string>())
                                               : std::nullopt;
        }
        if (auto it = status.find("readiness"); it != status.end()) {
            readiness_ = it->is_string() ? devices::stringToReadiness(it->get<std::string>()) : std::nullopt;
        }
        readOptionalBool(status, "reader_online", readerOnline_);
        readOptionalBool(status, "offline_mode_enabled", offlineModeEnabled_);
        readOptionalBool(status, "software_update_in_progress", softwareUpdateInProgress_);

        std::optional<bool> previousOnline = sdkNetworkOnline_;
        readOptionalBool(status, "sdk_network_online", sdkNetworkOnline_);
        if (sdkNetworkOnline_ && previousOnline && *sdkNetworkOnline_ != *previousOnline) {
            notifyOnline = sdkNetworkOnline_;
        }

        readFlag(status, "in_payment_session", inPaymentSession_);
        if (auto it = status.find("layout"); it != status.end() && it->is_string()) {
            layoutKind_ = devices::stringToLayoutKind(it->get<std::string>());
        }
        if (auto it = status.find("bound_reader_id"); it != status.end() && it->is_string()) {
            boundReaderId_ = it->get<std::string>();
        }
        if (auto it = status.find("discoverable_readers"); it != status.end() && it->is_array()) {
            discoverableReaders_.clear();
            for (const auto& id : *it) {
                if (id.is_string()) {
                    discoverableReaders_.push_back({id.get<std::string>(), "tap_to_pay", id.get<std::string>()});
                }
            }
        }
        if (auto it = status.find("last_disconnect"); it != status.end()) {
            if (it->is_object()) {
                devices::DisconnectInfo info;
                info.reason = it->value("reason", std::string());
                info.time = clock_->now() - Seconds(it->value("seconds_ago", 0));
                lastDisconnect_ = info;
            } else {
                lastDisconnect_.reset();
            }
        }
        if (auto it = status.find("preset"); it != status.end() && it->is_object()) {
            auto amount = it->find("amount");
            if (amount != it->end() && amount->is_number_integer() && amount->get<long long>() > 0
                && amount->get<long long>() <= static_cast<long long>(UINT32_MAX)) {
                preset_.amount = static_cast<uint32_t>(amount->get<long long>());
            } else if (amount != it->end()) {
                logging::Logger::getInstance().warn("[SIM] Ignoring invalid preset amount " + amount->dump());
            }
            preset_.category = it->value("category", preset_.category);
        }

        readFlag(status, "fail_discovery", failDiscovery_);
        readFlag(status, "fail_connect", failConnect_);
        readFlag(status, "fail_cancel_intent", failCancelIntent_);
        readFlag(status, "fail_create_intent", failCreateIntent_);
    }

    if (notifyOnline) {
        notifyConnectivity(*notifyOnline);
    }
}

bool SimulatedTerminal::reloadStatusFile(const std::string& path) {
    std::error_code ec;
    auto writeTime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return false;
    }
    if (statusFileTime_ && *statusFileTime_ == writeTime) {
        return false;
    }
    statusFileTime_ = writeTime;

    std::ifstream file(path);
    if (!file.is_open()) {
        logging::Logger::getInstance().warn("[SIM] Cannot open status file: " + path);
        return false;
    }
    try {
        nlohmann::json status = nlohmann::json::parse(file);
        applyStatus(status);
        logging::Logger::getInstance().info("[SIM] Status applied from " + path);
        return true;
    } catch (const nlohmann::json::exception& e) {
        logging::Logger::getInstance().warn("[SIM] Invalid status file " + path + ": " + e.what());
        return false;
    }
}

// --- Recorded commands ---

std::vector<std::string> SimulatedTerminal::commandLog() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(commands_.begin(), commands_.end());
}

int SimulatedTerminal::commandCount(const std::string& command) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = commandCounts_.find(command);
    return it != commandCounts_.end() ? it->second : 0;
}

std::optional<devices::PaymentIntentRequest> SimulatedTerminal::lastCreateRequest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastCreateRequest_;
}

void SimulatedTerminal::clearCommandLog() {
    std::lock_guard<std::mutex> lock(mutex_);
    commands_.clear();
    commandCounts_.clear();
}

nlohmann::json SimulatedTerminal::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json json;
    json["connection"] = connectionState_ ? nlohmann::json(devices::connectionStateToString(*connectionState_))
                                          : nlohmann::json(nullptr);
    json["readiness"] = readiness_ ? nlohmann::json(devices::readinessToString(*readiness_)) : nlohmann::json(nullptr);
    json["sdkNetworkOnline"] = sdkNetworkOnline_ ? nlohmann::json(*sdkNetworkOnline_) : nlohmann::json(nullptr);
    json["discovering"] = discovering_;
    json["layout"] = devices::layoutKindToString(layoutKind_);
    json["activeIntentId"] = activeIntent_ ? nlohmann::json(activeIntent_->id) : nlohmann::json(nullptr);
    json["commands"] = commands_;
    return json;
}

} // namespace terminal_health::vendor::simulated
