// include/common/uuid_generator.h
#pragma once

#include <string>

namespace terminal_health {

// UUID v4 strings for event ids and simulated payment intent ids
class UUIDGenerator {
public:
    static std::string generate();

    // prefix + first 8 hex digits, e.g. "pi_sim_3f2a9c01"
    static std::string shortId(const std::string& prefix);
};

} // namespace terminal_health
