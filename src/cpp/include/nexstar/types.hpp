#pragma once

#include <cstdint>
#include <string>

namespace nexstar {

/// Right Ascension in hours [0, 24), Declination in degrees [-90, 90].
struct EquatorialCoordinates {
    double ra_hours    = 0.0;
    double dec_degrees = 0.0;
};

/// Azimuth in degrees [0, 360), Altitude in degrees [-90, 90].
struct HorizontalCoordinates {
    double azimuth  = 0.0;
    double altitude = 0.0;
};

/// Observer location, positive north and east.
struct GeographicLocation {
    double latitude  = 0.0;
    double longitude = 0.0;
};

/// Hardware identification reported by the hand controller.
struct TelescopeInfo {
    int model          = 0;
    int firmware_major = 0;
    int firmware_minor = 0;

    /// "Model 6, Firmware 4.21"
    std::string to_string() const;
};

enum class TrackingMode : uint8_t {
    OFF      = 0,
    ALT_AZ   = 1,
    EQ_NORTH = 2,
    EQ_SOUTH = 3,
};

/// Date and time as held by the hand controller.
struct TelescopeTime {
    int hour            = 0;
    int minute          = 0;
    int second          = 0;
    int month           = 1;
    int day             = 1;
    int year            = 2000;
    int timezone_offset = 0;   // hours from GMT
    int dst_flag        = 0;   // 0 or 1

    /// "2024-10-14 12:30:00"
    std::string to_string() const;
};

/// Mount axes addressed by the variable rate motion command.
enum class Axis {
    AZIMUTH,
    ALTITUDE,
};

enum class MotionDirection {
    POSITIVE,
    NEGATIVE,
};

/// Hand-controller style direction, mapped onto an axis and a sign.
enum class Direction {
    UP,
    DOWN,
    LEFT,
    RIGHT,
};

enum class SlewState {
    IDLE,
    SLEWING,
};

std::string to_string(TrackingMode mode);
std::string to_string(Axis axis);
std::string to_string(Direction direction);
std::string to_string(SlewState state);

/// Axis moved by a direction (UP/DOWN -> ALTITUDE, LEFT/RIGHT -> AZIMUTH).
Axis axis_of(Direction direction);

/// Sign of the motion for a direction (UP/LEFT positive).
MotionDirection sign_of(Direction direction);

} // namespace nexstar
