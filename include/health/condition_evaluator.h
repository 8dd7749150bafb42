// include/health/condition_evaluator.h
#pragma once

#include "health/health_snapshot.h"
#include "recovery/recovery_types.h"
#include <functional>
#include <string>
#include <vector>

namespace terminal_health::health {

// One entry of the classification table
struct ClassificationRule {
    std::string name;
    std::function<bool(const HealthSnapshot&)> matches;
    recovery::RecoveryType outcome;
};

// ConditionEvaluator - classifies a snapshot into a single RecoveryType.
// Stateless; the first matching rule of rules() wins and the last rule always
// matches, so classify() is total.
class ConditionEvaluator {
public:
    /// The ordered rule table (priority order).
    static const std::vector<ClassificationRule>& rules();

    static recovery::RecoveryType classify(const HealthSnapshot& snapshot);

    /// Name of the rule that decided the classification.
    static std::string matchingRule(const HealthSnapshot& snapshot);
};

} // namespace terminal_health::health
