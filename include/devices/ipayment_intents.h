// include/devices/ipayment_intents.h
#pragma once

#include "devices/device_types.h"
#include <future>
#include <optional>
#include <string>

namespace terminal_health::devices {

// Payment-intent (transaction) boundary
class IPaymentIntentService {
public:
    virtual ~IPaymentIntentService() = default;

    /// Currently active transaction, empty when there is none.
    virtual std::optional<PaymentIntentRecord> getActiveIntent() const = 0;

    virtual std::future<OperationResult> cancelPaymentCollection(const std::string& intentId) = 0;
    virtual std::future<OperationResult> cancelPaymentIntent(const std::string& intentId) = 0;
    virtual std::future<CreateIntentResult> createPaymentIntent(const PaymentIntentRequest& request) = 0;

    /// Drop the locally held transaction record.
    virtual void clearActiveIntent() = 0;
};

// Application-side terminal state
class ITerminalContext {
public:
    virtual ~ITerminalContext() = default;

    virtual bool isInPaymentSession() const = 0;
    virtual LayoutKind getLayoutKind() const = 0;
    virtual ZeroTouchPreset getZeroTouchPreset() const = 0;
};

} // namespace terminal_health::devices
