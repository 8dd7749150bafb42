// include/devices/icard_reader.h
#pragma once

#include "devices/device_types.h"
#include <functional>
#include <future>
#include <optional>
#include <string>

namespace terminal_health::devices {

// Card reader SDK boundary.
// Getters return the SDK's cached view and must not block; an empty optional
// means the value could not be read.
class ICardReader {
public:
    virtual ~ICardReader() = default;

    // --- Status signals ---

    virtual std::optional<ReaderConnectionState> getConnectionState() const = 0;
    virtual std::optional<ReaderReadiness> getReadiness() const = 0;
    virtual std::optional<bool> isReaderOnline() const = 0;
    virtual std::optional<bool> isSdkNetworkOnline() const = 0;
    virtual std::optional<bool> isOfflineModeEnabled() const = 0;
    virtual std::optional<bool> isSoftwareUpdateInProgress() const = 0;

    /// Most recent disconnect, empty if none was recorded.
    virtual std::optional<DisconnectInfo> getLastDisconnect() const = 0;

    /// Device id of the reader this terminal was last bound to.
    virtual std::string getBoundReaderId() const = 0;

    // --- Remediation commands ---

    /// Idempotent: no-op when no discovery is running.
    virtual void cancelDiscovery() = 0;
    virtual void clearDiscoveredReaders() = 0;
    virtual std::future<DiscoveryResult> startDiscovery(const std::string& deviceTypeFilter) = 0;
    virtual std::future<OperationResult> connect(const std::string& deviceId) = 0;

    // --- Notifications ---

    /// Called from an SDK thread on every SDK network online/offline change.
    virtual void setConnectivityChangedCallback(std::function<void(bool networkOnline)> callback) = 0;
};

} // namespace terminal_health::devices
