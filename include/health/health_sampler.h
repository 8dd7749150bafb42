// include/health/health_sampler.h
#pragma once

#include "common/clock.h"
#include "devices/icard_reader.h"
#include "devices/ipayment_intents.h"
#include "health/health_snapshot.h"
#include <memory>

namespace terminal_health::health {

// HealthSampler - assembles a HealthSnapshot from the collaborators.
// A getter that throws leaves its field unknown.
class HealthSampler {
public:
    HealthSampler(devices::ICardReader& reader,
                  devices::IPaymentIntentService& intents,
                  devices::ITerminalContext& context,
                  std::shared_ptr<IClock> clock);

    HealthSnapshot sample() const;

private:
    devices::ICardReader& reader_;
    devices::IPaymentIntentService& intents_;
    devices::ITerminalContext& context_;
    std::shared_ptr<IClock> clock_;
};

} // namespace terminal_health::health
