// include/vendor_adapters/simulated/simulated_terminal.h
#pragma once

#include "common/clock.h"
#include "devices/icard_reader.h"
#include "devices/ipayment_intents.h"
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace terminal_health::vendor::simulated {

// In-process terminal used by the service host (driven by a JSON status
// file) and by the tests (driven through the setters).
// Implements the reader, payment-intent and terminal-context boundaries and
// records every command it receives.
class SimulatedTerminal : public devices::ICardReader,
                          public devices::IPaymentIntentService,
                          public devices::ITerminalContext {
public:
    explicit SimulatedTerminal(std::shared_ptr<IClock> clock);
    ~SimulatedTerminal() override;

    // ICardReader
    std::optional<devices::ReaderConnectionState> getConnectionState() const override;
    std::optional<devices::ReaderReadiness> getReadiness() const override;
    std::optional<bool> isReaderOnline() const override;
    std::optional<bool> isSdkNetworkOnline() const override;
    std::optional<bool> isOfflineModeEnabled() const override;
    std::optional<bool> isSoftwareUpdateInProgress() const override;
    std::optional<devices::DisconnectInfo> getLastDisconnect() const override;
    std::string getBoundReaderId() const override;
    void cancelDiscovery() override;
    void clearDiscoveredReaders() override;
    std::future<devices::DiscoveryResult> startDiscovery(const std::string& deviceTypeFilter) override;
    std::future<devices::OperationResult> connect(const std::string& deviceId) override;
    void setConnectivityChangedCallback(std::function<void(bool networkOnline)> callback) override;

    // IPaymentIntentService
    std::optional<devices::PaymentIntentRecord> getActiveIntent() const override;
    std::future<devices::OperationResult> cancelPaymentCollection(const std::string& intentId) override;
    std::future<devices::OperationResult> cancelPaymentIntent(const std::string& intentId) override;
    std::future<devices::CreateIntentResult> createPaymentIntent(const devices::PaymentIntentRequest& request) override;
    void clearActiveIntent() override;

    // ITerminalContext
    bool isInPaymentSession() const override;
    devices::LayoutKind getLayoutKind() const override;
    devices::ZeroTouchPreset getZeroTouchPreset() const override;

    // --- Scenario control ---

    void setConnectionState(std::optional<devices::ReaderConnectionState> state);
    void setReadiness(std::optional<devices::ReaderReadiness> readiness);
    void setReaderOnline(std::optional<bool> online);
    void setOfflineModeEnabled(std::optional<bool> enabled);
    void setSoftwareUpdateInProgress(std::optional<bool> inProgress);
    void setLastDisconnect(std::optional<devices::DisconnectInfo> disconnect);
    void setBoundReaderId(const std::string& deviceId);
    void setDiscoverableReaders(const std::vector<devices::DiscoveredReader>& readers);
    void setInPaymentSession(bool inSession);
    void setLayoutKind(devices::LayoutKind kind);
    void setZeroTouchPreset(const devices::ZeroTouchPreset& preset);
    void setActiveIntent(std::optional<devices::PaymentIntentRecord> intent);

    /// Sets the SDK network flag without notifying (see fireConnectivityChange).
    void setSdkNetworkOnline(std::optional<bool> online);

    /// Sets the SDK network flag and notifies the subscriber, as the SDK would.
    void fireConnectivityChange(bool networkOnline);

    // Readiness the reader reports after a successful connect
    void setReadinessAfterConnect(devices::ReaderReadiness readiness);

    // Getter named here throws when read ("readiness", "connection", ...)
    void setSignalUnreadable(const std::string& signal, bool unreadable);

    void setFailDiscovery(bool fail);
    void setFailConnect(bool fail);
    void setFailCancelIntent(bool fail);
    void setFailCreateIntent(bool fail);

    // Stalled calls return futures that are never fulfilled until releaseStalled().
    void setStallDiscovery(bool stall);
    void setStallConnect(bool stall);
    void releaseStalled();

    // --- Status file (service host) ---

    /// Apply a JSON status document. Unknown keys are ignored; null makes a
    /// signal unknown.
    void applyStatus(const nlohmann::json& status);

    /// Re-read `path` when it changed since the last load. Returns true when
    /// a new status was applied.
    bool reloadStatusFile(const std::string& path);

    // --- Recorded commands ---

    // The log keeps the most recent entries only; commandCount() keeps totals.
    static constexpr size_t MAX_COMMAND_LOG = 1000;

    std::vector<std::string> commandLog() const;
    int commandCount(const std::string& command) const;
    std::optional<devices::PaymentIntentRequest> lastCreateRequest() const;
    void clearCommandLog();

    nlohmann::json toJson() const;

private:
    void record(const std::string& command);
    void throwIfUnreadable(const std::string& signal) const;
    void notifyConnectivity(bool networkOnline);

    std::shared_ptr<IClock> clock_;
    mutable std::mutex mutex_;

    std::optional<devices::ReaderConnectionState> connectionState_;
    std::optional<devices::ReaderReadiness> readiness_;
    std::optional<bool> readerOnline_;
    std::optional<bool> sdkNetworkOnline_;
    std::optional<bool> offlineModeEnabled_;
    std::optional<bool> softwareUpdateInProgress_;
    std::optional<devices::DisconnectInfo> lastDisconnect_;
    std::string boundReaderId_;
    std::vector<devices::DiscoveredReader> discoverableReaders_;
    std::vector<devices::DiscoveredReader> discoveredReaders_;
    bool discovering_ = false;
    devices::ReaderReadiness readinessAfterConnect_ = devices::ReaderReadiness::READY;
    std::set<std::string> unreadableSignals_;

    bool inPaymentSession_ = true;
    devices::LayoutKind layoutKind_ = devices::LayoutKind::ZERO_TOUCH;
    devices::ZeroTouchPreset preset_;
    std::optional<devices::PaymentIntentRecord> activeIntent_;
    std::optional<devices::PaymentIntentRequest> lastCreateRequest_;

    bool failDiscovery_ = false;
    bool failConnect_ = false;
    bool failCancelIntent_ = false;
    bool failCreateIntent_ = false;
    bool stallDiscovery_ = false;
    bool stallConnect_ = false;
    std::vector<std::shared_ptr<std::promise<devices::DiscoveryResult>>> stalledDiscoveries_;
    std::vector<std::shared_ptr<std::promise<devices::OperationResult>>> stalledConnects_;

    std::deque<std::string> commands_;
    std::map<std::string, int> commandCounts_;

    std::function<void(bool)> connectivityCallback_;
    std::optional<std::filesystem::file_time_type> statusFileTime_;
};

} // namespace terminal_health::vendor::simulated
