// src/recovery/backoff_policy.cpp
#include "recovery/backoff_policy.h"
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace terminal_health::recovery {

BackoffPolicy::BackoffPolicy(std::vector<Seconds> waits)
    : waits_(std::move(waits))
{
    if (waits_.empty()) {
        throw std::invalid_argument("Backoff schedule must not be empty");
    }
}

BackoffPolicy BackoffPolicy::fastDefault() {
    return BackoffPolicy({Seconds(30), Seconds(60), Seconds(120), Seconds(300)});
}

BackoffPolicy BackoffPolicy::slowDefault() {
    return BackoffPolicy({Seconds(60), Seconds(120), Seconds(300), Seconds(600)});
}

std::optional<BackoffPolicy> BackoffPolicy::parse(const std::string& text) {
    std::vector<Seconds> waits;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (item.empty()) {
            return std::nullopt;
        }
        try {
            size_t consumed = 0;
            long value = std::stol(item, &consumed);
            if (consumed != item.size() || value <= 0) {
                return std::nullopt;
            }
            waits.emplace_back(value);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    if (waits.empty()) {
        return std::nullopt;
    }
    return BackoffPolicy(std::move(waits));
}

Seconds BackoffPolicy::waitFor(std::size_t retryIndex) const {
    return waits_[std::min(retryIndex, maxIndex())];
}

std::string BackoffPolicy::toString() const {
    std::stringstream ss;
    for (size_t i = 0; i < waits_.size(); ++i) {
        if (i > 0) ss << ",";
        ss << waits_[i].count();
    }
    return ss.str();
}

} // namespace terminal_health::recovery
