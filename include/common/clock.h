// include/common/clock.h
#pragma once

#include <chrono>
#include <cstdint>

namespace terminal_health {

using TimePoint = std::chrono::system_clock::time_point;
using Seconds = std::chrono::seconds;

// Time source for the monitor. Wall-clock because intent creation and
// disconnect times are reported by the SDK as wall-clock values.
class IClock {
public:
    virtual ~IClock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public IClock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

inline int64_t toEpochMs(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

inline int64_t secondsBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<Seconds>(to - from).count();
}

} // namespace terminal_health
