// include/recovery/backoff_policy.h
#pragma once

#include "common/clock.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace terminal_health::recovery {

// Ordered retry waits; the last entry repeats as the ceiling.
class BackoffPolicy {
public:
    explicit BackoffPolicy(std::vector<Seconds> waits);

    static BackoffPolicy fastDefault();   // 30, 60, 120, 300...
    static BackoffPolicy slowDefault();   // 60, 120, 300, 600...

    /// Parse "30,60,120,300". Empty on malformed, empty or non-positive input.
    static std::optional<BackoffPolicy> parse(const std::string& text);

    /// Wait required before retry number retryIndex (0-based), clamped to the ceiling.
    Seconds waitFor(std::size_t retryIndex) const;

    std::size_t maxIndex() const { return waits_.size() - 1; }
    const std::vector<Seconds>& waits() const { return waits_; }
    std::string toString() const;

private:
    std::vector<Seconds> waits_;
};

} // namespace terminal_health::recovery
