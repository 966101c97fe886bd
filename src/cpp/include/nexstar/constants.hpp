#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace nexstar {

// Framing
constexpr char TERMINATOR = '#';

// Transport defaults
constexpr int    DEFAULT_BAUDRATE = 9600;
constexpr double DEFAULT_TIMEOUT  = 2.0;
constexpr int    DEFAULT_TCP_PORT = 4030;
inline const std::string DEFAULT_TCP_HOST    = "192.168.4.1";
inline const std::string DEFAULT_SERIAL_PORT = "/dev/ttyUSB0";

// Coordinate encoding
constexpr double   DEGREES_PER_HOUR = 15.0;
constexpr double   FULL_CIRCLE      = 360.0;
constexpr uint64_t HEX_RANGE        = 0x100000000ULL;
constexpr std::size_t HEX_DIGITS    = 8;

// Variable rate motion ("P" command) wire codes
constexpr uint8_t AXIS_AZIMUTH_CODE  = 1;
constexpr uint8_t AXIS_ALTITUDE_CODE = 2;
constexpr uint8_t DIR_POSITIVE_CODE  = 17;
constexpr uint8_t DIR_NEGATIVE_CODE  = 18;

// Slew rates: 9 = 5 deg/s, 0 = stop
constexpr int MOTION_RATE_MIN  = 0;
constexpr int MOTION_RATE_MAX  = 9;
constexpr int DEFAULT_MOVE_RATE = 4;

// Duration of a single hand-controller style step (seconds)
constexpr double STEP_DURATION = 0.2;

// The time command carries years since 2000
constexpr int YEAR_BASE = 2000;

// Position tracker
constexpr double      DEFAULT_POLL_INTERVAL   = 2.0;
constexpr double      MIN_POLL_INTERVAL       = 0.5;
constexpr double      MAX_POLL_INTERVAL       = 30.0;
constexpr std::size_t HISTORY_CAPACITY        = 1000;
constexpr double      DEFAULT_ALERT_THRESHOLD = 5.0;
constexpr double      MIN_ALERT_THRESHOLD     = 0.1;
constexpr double      MAX_ALERT_THRESHOLD     = 20.0;
constexpr int         DEFAULT_ERROR_LIMIT     = 3;
constexpr double      DEFAULT_ALERT_COOLDOWN  = 5.0;
constexpr double      SLEW_SPEED_THRESHOLD    = 0.1;   // deg/s
constexpr double      LIVE_AGE_LIMIT          = 5.0;   // seconds

// Config file name
inline const std::string DEFAULT_CONFIG_FILENAME = ".nexstar_config";

} // namespace nexstar
