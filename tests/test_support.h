// tests/test_support.h
// Minimal helpers shared by the standalone test executables.
#pragma once

#include "common/clock.h"
#include "events/health_event.h"
#include "logging/logger.h"
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace test_support {

inline int& failures() {
    static int count = 0;
    return count;
}

#define CHECK(cond)                                                                    \
    do {                                                                               \
        if (!(cond)) {                                                                 \
            std::cout << "  FAIL " << __FILE__ << ":" << __LINE__ << ": " #cond        \
                      << std::endl;                                                    \
            ++test_support::failures();                                                \
        }                                                                              \
    } while (0)

#define CHECK_EQ(actual, expected)                                                     \
    do {                                                                               \
        if (!((actual) == (expected))) {                                               \
            std::cout << "  FAIL " << __FILE__ << ":" << __LINE__ << ": " #actual      \
                      << " == " #expected << std::endl;                                \
            ++test_support::failures();                                                \
        }                                                                              \
    } while (0)

inline void runTest(const std::string& name, const std::function<void()>& test) {
    std::cout << "[RUN ] " << name << std::endl;
    int before = failures();
    try {
        test();
    } catch (const std::exception& e) {
        std::cout << "  FAIL unexpected exception: " << e.what() << std::endl;
        ++failures();
    }
    std::cout << (failures() == before ? "[ OK ] " : "[FAIL] ") << name << std::endl;
}

inline int finish(const std::string& suite) {
    std::cout << std::endl << "=== " << suite << ": "
              << (failures() == 0 ? "all tests passed" : std::to_string(failures()) + " failure(s)")
              << " ===" << std::endl;
    return failures() == 0 ? 0 : 1;
}

// Keep test output to warnings and errors
inline void quietLogs() {
    terminal_health::logging::Logger::getInstance().setMinLevel(terminal_health::logging::LogLevel::WARN);
}

// Poll `condition` for up to `timeout`
inline bool waitUntil(const std::function<bool()>& condition,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

// Test clock, moved by hand
class ManualClock : public terminal_health::IClock {
public:
    ManualClock()
        : now_(std::chrono::system_clock::from_time_t(1700000000)) {}

    terminal_health::TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(terminal_health::Seconds by) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += by;
    }

    void set(terminal_health::TimePoint to) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = to;
    }

private:
    mutable std::mutex mutex_;
    terminal_health::TimePoint now_;
};

// Keeps every published event
class RecordingEventSink : public terminal_health::events::IEventSink {
public:
    void publish(const terminal_health::events::HealthEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    int count(const std::string& type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& e : events_) {
            if (e.eventType == type) {
                ++n;
            }
        }
        return n;
    }

    // Most recent event of `type`; empty eventType when none
    terminal_health::events::HealthEvent last(const std::string& type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            if (it->eventType == type) {
                return *it;
            }
        }
        return terminal_health::events::HealthEvent();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<terminal_health::events::HealthEvent> events_;
};

} // namespace test_support
