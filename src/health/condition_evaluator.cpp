// src/health/condition_evaluator.cpp
#include "health/condition_evaluator.h"

namespace terminal_health::health {

using devices::LayoutKind;
using devices::ReaderConnectionState;
using devices::ReaderReadiness;
using recovery::RecoveryType;

namespace {

// Unknown values never compare equal to a healthy value.
bool isTrue(const std::optional<bool>& value) { return value.has_value() && *value; }
bool isFalse(const std::optional<bool>& value) { return value.has_value() && !*value; }

bool readinessIs(const HealthSnapshot& s, ReaderReadiness expected) {
    return s.readerReadiness.has_value() && *s.readerReadiness == expected;
}

std::vector<ClassificationRule> buildRules() {
    std::vector<ClassificationRule> rules;

    rules.push_back({"sdk_offline_without_offline_mode",
        [](const HealthSnapshot& s) {
            return !isTrue(s.sdkNetworkOnline) && !isTrue(s.offlineModeEnabled);
        },
        RecoveryType::SDK_OFFLINE});

    rules.push_back({"sdk_offline_with_offline_mode",
        [](const HealthSnapshot& s) {
            return isFalse(s.sdkNetworkOnline) && isTrue(s.offlineModeEnabled);
        },
        RecoveryType::NONE});

    rules.push_back({"reader_not_connected",
        [](const HealthSnapshot& s) {
            return !(s.readerConnectionState.has_value()
                     && *s.readerConnectionState == ReaderConnectionState::CONNECTED);
        },
        RecoveryType::READER_DISCONNECTED});

    // Reader-only "offline" is normal for readers that reach the network
    // through the paired host; it is unhealthy only together with host offline.
    rules.push_back({"reader_and_host_offline",
        [](const HealthSnapshot& s) {
            return !isTrue(s.readerOnline) && !isTrue(s.offlineModeEnabled)
                   && !isTrue(s.sdkNetworkOnline);
        },
        RecoveryType::READER_OFFLINE});

    rules.push_back({"reader_offline_with_offline_mode",
        [](const HealthSnapshot& s) {
            return !isTrue(s.readerOnline) && isTrue(s.offlineModeEnabled);
        },
        RecoveryType::NONE});

    rules.push_back({"zero_touch_not_awaiting_input",
        [](const HealthSnapshot& s) {
            return s.terminalLayoutKind == LayoutKind::ZERO_TOUCH
                   && !readinessIs(s, ReaderReadiness::AWAITING_INPUT);
        },
        RecoveryType::TAP_TO_PAY_NOT_WAITING});

    rules.push_back({"manual_reader_not_ready",
        [](const HealthSnapshot& s) {
            return s.terminalLayoutKind == LayoutKind::MANUAL
                   && !readinessIs(s, ReaderReadiness::READY)
                   && !readinessIs(s, ReaderReadiness::AWAITING_INPUT);
        },
        RecoveryType::READER_NOT_READY});

    rules.push_back({"healthy",
        [](const HealthSnapshot&) { return true; },
        RecoveryType::NONE});

    return rules;
}

const ClassificationRule& firstMatch(const HealthSnapshot& snapshot) {
    const auto& table = ConditionEvaluator::rules();
    for (const auto& rule : table) {
        if (rule.matches(snapshot)) {
            return rule;
        }
    }
    return table.back();
}

} // namespace

const std::vector<ClassificationRule>& ConditionEvaluator::rules() {
    static const std::vector<ClassificationRule> table = buildRules();
    return table;
}

RecoveryType ConditionEvaluator::classify(const HealthSnapshot& snapshot) {
    return firstMatch(snapshot).outcome;
}

std::string ConditionEvaluator::matchingRule(const HealthSnapshot& snapshot) {
    return firstMatch(snapshot).name;
}

} // namespace terminal_health::health
