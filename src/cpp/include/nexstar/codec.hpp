#pragma once

#include <string>
#include <utility>

namespace nexstar {

/// Conversions between angles and the mount's 32-bit hex representation.
///
/// 0x00000000 is 0 degrees, 0x80000000 is 180 degrees and the full
/// 32-bit range spans one turn. Quantization error is below 360 / 2^32.
namespace codec {

/// Encode an angle as 8 uppercase hex digits: round(deg/360 * 2^32) mod 2^32.
std::string degrees_to_hex(double degrees);

/// Decode 8 hex digits into degrees [0, 360). Throws CommandError.
double hex_to_degrees(const std::string& hex);

/// "XXXXXXXX,YYYYYYYY"
std::string encode_pair(double first, double second);

/// Split a "XXXXXXXX,YYYYYYYY" response. Throws CommandError.
std::pair<double, double> decode_pair(const std::string& response);

/// Map a signed angle onto [0, 360): negative values become 360 + angle.
double to_unsigned(double angle);

/// Map an angle in [0, 360) back to (-180, 180].
double to_signed(double angle);

double ra_hours_to_degrees(double ra_hours);
double ra_degrees_to_hours(double ra_degrees);

} // namespace codec
} // namespace nexstar
