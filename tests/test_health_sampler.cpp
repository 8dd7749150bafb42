// tests/test_health_sampler.cpp
#include "health/health_sampler.h"
#include "test_support.h"
#include "vendor_adapters/simulated/simulated_terminal.h"
#include <iostream>
#include <memory>

using namespace terminal_health;
using namespace terminal_health::health;
using vendor::simulated::SimulatedTerminal;

namespace {

void testReadsAllSignals() {
    auto clock = std::make_shared<test_support::ManualClock>();
    SimulatedTerminal terminal(clock);
    HealthSampler sampler(terminal, terminal, terminal, clock);

    devices::PaymentIntentRecord intent;
    intent.id = "pi_1";
    intent.createdAt = clock->now() - Seconds(90);
    intent.awaitingInputSince = clock->now() - Seconds(60);
    terminal.setActiveIntent(intent);
    terminal.setReadiness(devices::ReaderReadiness::AWAITING_INPUT);
    terminal.setLastDisconnect(devices::DisconnectInfo{"security_reboot", clock->now() - Seconds(300)});
    terminal.setLayoutKind(devices::LayoutKind::MANUAL);

    HealthSnapshot s = sampler.sample();
    CHECK(s.takenAt == clock->now());
    CHECK(s.readerConnectionState == devices::ReaderConnectionState::CONNECTED);
    CHECK(s.readerReadiness == devices::ReaderReadiness::AWAITING_INPUT);
    CHECK(s.readerOnline == true);
    CHECK(s.sdkNetworkOnline == true);
    CHECK(s.offlineModeEnabled == false);
    CHECK(s.softwareUpdateInProgress == false);
    CHECK(s.terminalLayoutKind == devices::LayoutKind::MANUAL);
    CHECK(s.inPaymentSession);
    CHECK(s.paymentIntentId == std::string("pi_1"));
    CHECK(s.paymentIntentCreatedAt == intent.createdAt);
    CHECK(s.awaitingInputSince == intent.awaitingInputSince);
    CHECK(s.lastDisconnectReason == std::string("security_reboot"));
    CHECK(s.lastDisconnectTime == clock->now() - Seconds(300));
}

void testUnreadableSignalsAreUnknown() {
    auto clock = std::make_shared<test_support::ManualClock>();
    SimulatedTerminal terminal(clock);
    HealthSampler sampler(terminal, terminal, terminal, clock);

    terminal.setSignalUnreadable("connection", true);
    terminal.setSignalUnreadable("sdk_network_online", true);
    HealthSnapshot s = sampler.sample();
    CHECK(!s.readerConnectionState.has_value());
    CHECK(!s.sdkNetworkOnline.has_value());
    // The rest is still read
    CHECK(s.readerReadiness.has_value());
    CHECK(s.offlineModeEnabled.has_value());

    nlohmann::json json = s.toJson();
    CHECK(json["readerConnectionState"].is_null());
    CHECK(json["sdkNetworkOnline"].is_null());
    CHECK(json["readerReadiness"] == "ready");
}

void testNoIntent() {
    auto clock = std::make_shared<test_support::ManualClock>();
    SimulatedTerminal terminal(clock);
    HealthSampler sampler(terminal, terminal, terminal, clock);

    HealthSnapshot s = sampler.sample();
    CHECK(!s.paymentIntentId.has_value());
    CHECK(!s.paymentIntentCreatedAt.has_value());
    CHECK(!s.awaitingInputSince.has_value());
    CHECK(!s.lastDisconnectReason.has_value());
}

void testSamplingIssuesNoCommands() {
    auto clock = std::make_shared<test_support::ManualClock>();
    SimulatedTerminal terminal(clock);
    HealthSampler sampler(terminal, terminal, terminal, clock);
    sampler.sample();
    sampler.sample();
    CHECK(terminal.commandLog().empty());
}

} // namespace

int main() {
    test_support::quietLogs();
    std::cout << "=== Health Sampler Test ===" << std::endl;

    test_support::runTest("reads all signals", testReadsAllSignals);
    test_support::runTest("unreadable signals are unknown", testUnreadableSignalsAreUnknown);
    test_support::runTest("no intent", testNoIntent);
    test_support::runTest("sampling issues no commands", testSamplingIssuesNoCommands);

    return test_support::finish("Health Sampler");
}
