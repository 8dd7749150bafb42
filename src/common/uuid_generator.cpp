// src/common/uuid_generator.cpp
#include "common/uuid_generator.h"
#include <array>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace terminal_health {

namespace {

std::array<uint8_t, 16> randomBytes() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 8) {
        uint64_t word = engine();
        for (size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
        }
    }
    return bytes;
}

} // namespace

std::string UUIDGenerator::generate() {
    auto bytes = randomBytes();
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);   // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);   // RFC 4122 variant

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

std::string UUIDGenerator::shortId(const std::string& prefix) {
    std::string uuid = generate();
    return prefix + uuid.substr(0, 8);
}

} // namespace terminal_health
