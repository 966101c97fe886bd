#include "nexstar/types.hpp"

#include <iomanip>
#include <sstream>

namespace nexstar {

std::string TelescopeInfo::to_string() const {
    std::ostringstream out;
    out << "Model " << model << ", Firmware "
        << firmware_major << "." << std::setw(2) << std::setfill('0')
        << firmware_minor;
    return out.str();
}

std::string TelescopeTime::to_string() const {
    std::ostringstream out;
    out << std::setfill('0')
        << std::setw(4) << year << "-"
        << std::setw(2) << month << "-"
        << std::setw(2) << day << " "
        << std::setw(2) << hour << ":"
        << std::setw(2) << minute << ":"
        << std::setw(2) << second;
    return out.str();
}

std::string to_string(TrackingMode mode) {
    switch (mode) {
        case TrackingMode::OFF:      return "off";
        case TrackingMode::ALT_AZ:   return "alt-az";
        case TrackingMode::EQ_NORTH: return "eq-north";
        case TrackingMode::EQ_SOUTH: return "eq-south";
    }
    return "unknown";
}

std::string to_string(Axis axis) {
    switch (axis) {
        case Axis::AZIMUTH:  return "azimuth";
        case Axis::ALTITUDE: return "altitude";
    }
    return "unknown";
}

std::string to_string(Direction direction) {
    switch (direction) {
        case Direction::UP:    return "up";
        case Direction::DOWN:  return "down";
        case Direction::LEFT:  return "left";
        case Direction::RIGHT: return "right";
    }
    return "unknown";
}

std::string to_string(SlewState state) {
    switch (state) {
        case SlewState::IDLE:    return "idle";
        case SlewState::SLEWING: return "slewing";
    }
    return "unknown";
}

Axis axis_of(Direction direction) {
    switch (direction) {
        case Direction::UP:
        case Direction::DOWN:
            return Axis::ALTITUDE;
        case Direction::LEFT:
        case Direction::RIGHT:
            return Axis::AZIMUTH;
    }
    return Axis::AZIMUTH;
}

MotionDirection sign_of(Direction direction) {
    switch (direction) {
        case Direction::UP:
        case Direction::LEFT:
            return MotionDirection::POSITIVE;
        case Direction::DOWN:
        case Direction::RIGHT:
            return MotionDirection::NEGATIVE;
    }
    return MotionDirection::POSITIVE;
}

} // namespace nexstar
