#include "nexstar/protocol.hpp"

#include <cmath>

#include "nexstar/codec.hpp"
#include "nexstar/constants.hpp"
#include "nexstar/errors.hpp"

namespace nexstar {

namespace {

bool in_range(double value, double lo, double hi) {
    return std::isfinite(value) && value >= lo && value <= hi;
}

uint8_t byte_at(const std::string& s, std::size_t i) {
    return static_cast<uint8_t>(s[i]);
}

std::string fmt_value(double value) {
    return std::to_string(value);
}

} // anonymous namespace

ProtocolClient::ProtocolClient(CommandChannel* channel)
    : channel_(channel) {
}

// --- Validation ---

void ProtocolClient::validate_ra_dec(double ra_hours, double dec_degrees) {
    if (!std::isfinite(ra_hours) || ra_hours < 0.0 || ra_hours >= 24.0) {
        throw InvalidCoordinateError("RA must be in [0, 24) hours, got " + fmt_value(ra_hours));
    }
    if (!in_range(dec_degrees, -90.0, 90.0)) {
        throw InvalidCoordinateError("Dec must be in [-90, 90] degrees, got " +
                                     fmt_value(dec_degrees));
    }
}

void ProtocolClient::validate_alt_az(double azimuth, double altitude) {
    if (!std::isfinite(azimuth) || azimuth < 0.0 || azimuth >= FULL_CIRCLE) {
        throw InvalidCoordinateError("Azimuth must be in [0, 360) degrees, got " +
                                     fmt_value(azimuth));
    }
    if (!in_range(altitude, -90.0, 90.0)) {
        throw InvalidCoordinateError("Altitude must be in [-90, 90] degrees, got " +
                                     fmt_value(altitude));
    }
}

void ProtocolClient::validate_location(double latitude, double longitude) {
    if (!in_range(latitude, -90.0, 90.0)) {
        throw InvalidCoordinateError("Latitude must be in [-90, 90] degrees, got " +
                                     fmt_value(latitude));
    }
    if (!in_range(longitude, -180.0, 180.0)) {
        throw InvalidCoordinateError("Longitude must be in [-180, 180] degrees, got " +
                                     fmt_value(longitude));
    }
}

void ProtocolClient::validate_rate(int rate) {
    if (rate < MOTION_RATE_MIN || rate > MOTION_RATE_MAX) {
        throw InvalidCoordinateError("Rate must be 0-9, got " + std::to_string(rate));
    }
}

void ProtocolClient::validate_time(const TelescopeTime& t) {
    auto check = [](bool ok, const std::string& what) {
        if (!ok) {
            throw InvalidParameterError(what);
        }
    };
    check(t.hour >= 0 && t.hour <= 23, "Hour must be 0-23");
    check(t.minute >= 0 && t.minute <= 59, "Minute must be 0-59");
    check(t.second >= 0 && t.second <= 59, "Second must be 0-59");
    check(t.month >= 1 && t.month <= 12, "Month must be 1-12");
    check(t.day >= 1 && t.day <= 31, "Day must be 1-31");
    check(t.year >= YEAR_BASE && t.year <= YEAR_BASE + 255, "Year must be 2000-2255");
    check(t.timezone_offset >= -12 && t.timezone_offset <= 14,
          "Timezone offset must be -12..14 hours");
    check(t.dst_flag == 0 || t.dst_flag == 1, "DST flag must be 0 or 1");
}

// --- Helpers ---

void ProtocolClient::send_acknowledged(const std::string& command) {
    std::string response = channel_->send_command(command);
    if (!response.empty()) {
        throw CommandError("Unexpected response to '" + command.substr(0, 1) +
                           "' command: '" + response + "'");
    }
}

std::string ProtocolClient::send_raw(const std::string& command, std::size_t length) {
    std::string response = channel_->send_command(command, length);
    if (response.size() != length) {
        throw CommandError("Expected " + std::to_string(length) + " byte response to '" +
                           command + "', got " + std::to_string(response.size()));
    }
    return response;
}

// --- Commands ---

bool ProtocolClient::echo(char c) {
    std::string response = channel_->send_command(std::string("K") + c, 1);
    return response.size() == 1 && response[0] == c;
}

std::pair<int, int> ProtocolClient::get_version() {
    std::string response = send_raw("V", 2);
    return {byte_at(response, 0), byte_at(response, 1)};
}

int ProtocolClient::get_model() {
    return byte_at(send_raw("m", 1), 0);
}

std::pair<double, double> ProtocolClient::get_ra_dec() {
    return codec::decode_pair(channel_->send_command("E"));
}

std::pair<double, double> ProtocolClient::get_alt_az() {
    return codec::decode_pair(channel_->send_command("Z"));
}

void ProtocolClient::goto_ra_dec(double ra_hours, double dec_degrees) {
    validate_ra_dec(ra_hours, dec_degrees);
    send_acknowledged("R" + codec::encode_pair(codec::ra_hours_to_degrees(ra_hours),
                                               codec::to_unsigned(dec_degrees)));
}

void ProtocolClient::goto_alt_az(double azimuth, double altitude) {
    validate_alt_az(azimuth, altitude);
    send_acknowledged("B" + codec::encode_pair(azimuth, codec::to_unsigned(altitude)));
}

void ProtocolClient::sync_ra_dec(double ra_hours, double dec_degrees) {
    validate_ra_dec(ra_hours, dec_degrees);
    send_acknowledged("S" + codec::encode_pair(codec::ra_hours_to_degrees(ra_hours),
                                               codec::to_unsigned(dec_degrees)));
}

bool ProtocolClient::is_slewing() {
    std::string response = channel_->send_command("L");
    if (response == "1") {
        return true;
    }
    if (response == "0") {
        return false;
    }
    throw CommandError("Unexpected goto status '" + response + "'");
}

void ProtocolClient::cancel_goto() {
    send_acknowledged("M");
}

void ProtocolClient::variable_rate_motion(Axis axis, MotionDirection direction, int rate) {
    validate_rate(rate);

    uint8_t axis_code = 0;
    switch (axis) {
        case Axis::AZIMUTH:  axis_code = AXIS_AZIMUTH_CODE; break;
        case Axis::ALTITUDE: axis_code = AXIS_ALTITUDE_CODE; break;
    }
    uint8_t dir_code = 0;
    switch (direction) {
        case MotionDirection::POSITIVE: dir_code = DIR_POSITIVE_CODE; break;
        case MotionDirection::NEGATIVE: dir_code = DIR_NEGATIVE_CODE; break;
    }

    std::string command = "P";
    command += static_cast<char>(axis_code);
    command += static_cast<char>(dir_code);
    command += static_cast<char>(rate);
    command.append(3, '\0');
    send_acknowledged(command);
}

TrackingMode ProtocolClient::get_tracking_mode() {
    uint8_t mode = byte_at(send_raw("t", 1), 0);
    if (mode > static_cast<uint8_t>(TrackingMode::EQ_SOUTH)) {
        throw CommandError("Unknown tracking mode " + std::to_string(mode));
    }
    return static_cast<TrackingMode>(mode);
}

void ProtocolClient::set_tracking_mode(TrackingMode mode) {
    std::string command = "T";
    command += static_cast<char>(static_cast<uint8_t>(mode));
    send_acknowledged(command);
}

std::pair<double, double> ProtocolClient::get_location() {
    std::string response = channel_->send_command("w");
    if (response.size() != 2 * HEX_DIGITS) {
        throw CommandError("Invalid location response '" + response +
                           "': expected 16 hex digits");
    }
    return {codec::hex_to_degrees(response.substr(0, HEX_DIGITS)),
            codec::hex_to_degrees(response.substr(HEX_DIGITS))};
}

void ProtocolClient::set_location(double latitude, double longitude) {
    validate_location(latitude, longitude);
    send_acknowledged("W" + codec::encode_pair(codec::to_unsigned(latitude),
                                               codec::to_unsigned(longitude)));
}

TelescopeTime ProtocolClient::get_time() {
    std::string r = send_raw("h", 8);
    TelescopeTime t;
    t.hour            = byte_at(r, 0);
    t.minute          = byte_at(r, 1);
    t.second          = byte_at(r, 2);
    t.month           = byte_at(r, 3);
    t.day             = byte_at(r, 4);
    t.year            = YEAR_BASE + byte_at(r, 5);
    t.timezone_offset = static_cast<int8_t>(byte_at(r, 6));
    t.dst_flag        = byte_at(r, 7);
    return t;
}

void ProtocolClient::set_time(const TelescopeTime& t) {
    validate_time(t);
    std::string command = "H";
    command += static_cast<char>(t.hour);
    command += static_cast<char>(t.minute);
    command += static_cast<char>(t.second);
    command += static_cast<char>(t.month);
    command += static_cast<char>(t.day);
    command += static_cast<char>(t.year - YEAR_BASE);
    command += static_cast<char>(static_cast<int8_t>(t.timezone_offset));
    command += static_cast<char>(t.dst_flag);
    send_acknowledged(command);
}

} // namespace nexstar
