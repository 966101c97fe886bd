#include "nexstar/codec.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>

#include "nexstar/constants.hpp"
#include "nexstar/errors.hpp"

namespace nexstar {
namespace codec {

std::string degrees_to_hex(double degrees) {
    if (!std::isfinite(degrees)) {
        throw InvalidCoordinateError("Cannot encode non-finite angle");
    }
    const auto range = static_cast<long long>(HEX_RANGE);
    // Reduce first so the scaled value always fits a long long.
    double turn = std::fmod(degrees, FULL_CIRCLE);
    long long value = std::llround(turn / FULL_CIRCLE * static_cast<double>(HEX_RANGE));
    value = ((value % range) + range) % range;

    char buf[HEX_DIGITS + 1];
    std::snprintf(buf, sizeof(buf), "%08llX", static_cast<unsigned long long>(value));
    return std::string(buf, HEX_DIGITS);
}

double hex_to_degrees(const std::string& hex) {
    if (hex.size() != HEX_DIGITS) {
        throw CommandError("Expected " + std::to_string(HEX_DIGITS) +
                           " hex digits, got '" + hex + "'");
    }
    uint64_t value = 0;
    for (char c : hex) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isxdigit(uc)) {
            throw CommandError("Invalid hex digit in '" + hex + "'");
        }
        int digit = std::isdigit(uc) ? c - '0' : std::toupper(uc) - 'A' + 10;
        value = (value << 4) | static_cast<uint64_t>(digit);
    }
    return static_cast<double>(value) / static_cast<double>(HEX_RANGE) * FULL_CIRCLE;
}

std::string encode_pair(double first, double second) {
    return degrees_to_hex(first) + "," + degrees_to_hex(second);
}

std::pair<double, double> decode_pair(const std::string& response) {
    if (response.size() != 2 * HEX_DIGITS + 1 || response[HEX_DIGITS] != ',') {
        throw CommandError("Invalid coordinate response '" + response +
                           "': expected XXXXXXXX,YYYYYYYY");
    }
    return {hex_to_degrees(response.substr(0, HEX_DIGITS)),
            hex_to_degrees(response.substr(HEX_DIGITS + 1))};
}

double to_unsigned(double angle) {
    return angle < 0.0 ? FULL_CIRCLE + angle : angle;
}

double to_signed(double angle) {
    return angle > 180.0 ? angle - FULL_CIRCLE : angle;
}

double ra_hours_to_degrees(double ra_hours) {
    return ra_hours * DEGREES_PER_HOUR;
}

double ra_degrees_to_hours(double ra_degrees) {
    return ra_degrees / DEGREES_PER_HOUR;
}

} // namespace codec
} // namespace nexstar
