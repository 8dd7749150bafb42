// include/common/future_wait.h
#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <optional>
#include <string>

namespace terminal_health {

// Wait for an SDK future for at most `timeout`. Returns the value, or an empty
// optional with `error` set on timeout, cancellation or a stored exception.
// `cancelFlag` (optional) is polled so a superseding trigger can abort the wait.
template <typename T>
std::optional<T> waitForResult(std::future<T>& future,
                               std::chrono::milliseconds timeout,
                               std::string& error,
                               const std::atomic<bool>* cancelFlag = nullptr) {
    if (!future.valid()) {
        error = "no pending operation";
        return std::nullopt;
    }

    const auto slice = std::chrono::milliseconds(50);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (cancelFlag && cancelFlag->load()) {
            error = "cancelled";
            return std::nullopt;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining < std::chrono::milliseconds(0)) {
            remaining = std::chrono::milliseconds(0);
        }
        if (future.wait_for(remaining < slice ? remaining : slice) == std::future_status::ready) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            error = "timed out after " + std::to_string(timeout.count()) + "ms";
            return std::nullopt;
        }
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        error = e.what();
        return std::nullopt;
    }
}

} // namespace terminal_health
