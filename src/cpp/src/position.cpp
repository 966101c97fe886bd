#include "nexstar/position.hpp"

#include <algorithm>
#include <cmath>

#include "nexstar/errors.hpp"

namespace nexstar {

namespace {

constexpr double PI = 3.14159265358979323846;

double to_radians(double degrees) {
    return degrees * PI / 180.0;
}

double to_degrees(double radians) {
    return radians * 180.0 / PI;
}

} // anonymous namespace

double angular_separation(double lon1, double lat1, double lon2, double lat2) {
    double phi1 = to_radians(lat1);
    double phi2 = to_radians(lat2);
    double dphi = phi2 - phi1;
    double dlambda = to_radians(lon2 - lon1);

    double s_phi = std::sin(dphi / 2.0);
    double s_lambda = std::sin(dlambda / 2.0);
    double a = s_phi * s_phi + std::cos(phi1) * std::cos(phi2) * s_lambda * s_lambda;
    return to_degrees(2.0 * std::asin(std::min(1.0, std::sqrt(a))));
}

double equatorial_separation(const PositionSample& a, const PositionSample& b) {
    return angular_separation(a.ra_hours * DEGREES_PER_HOUR, a.dec_degrees,
                              b.ra_hours * DEGREES_PER_HOUR, b.dec_degrees);
}

double horizontal_separation(const PositionSample& a, const PositionSample& b) {
    return angular_separation(a.azimuth, a.altitude, b.azimuth, b.altitude);
}

double wrap_delta(double delta, double period) {
    double half = period / 2.0;
    double wrapped = std::fmod(delta + half, period);
    if (wrapped < 0.0) {
        wrapped += period;
    }
    return wrapped - half;
}

VelocityVector compute_velocity(const PositionSample& prev, const PositionSample& curr) {
    double dt = std::chrono::duration<double>(curr.monotonic - prev.monotonic).count();
    if (dt <= 0.0) {
        return {};
    }
    VelocityVector v;
    v.ra_per_sec  = wrap_delta(curr.ra_hours - prev.ra_hours, 24.0) / dt;
    v.dec_per_sec = (curr.dec_degrees - prev.dec_degrees) / dt;
    v.alt_per_sec = (curr.altitude - prev.altitude) / dt;
    v.az_per_sec  = wrap_delta(curr.azimuth - prev.azimuth, FULL_CIRCLE) / dt;
    v.total_deg_per_sec = horizontal_separation(prev, curr) / dt;
    return v;
}

// --- PositionHistory ---

PositionHistory::PositionHistory(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw InvalidParameterError("History capacity must be positive");
    }
}

void PositionHistory::append(const PositionSample& sample) {
    samples_.push_back(sample);
    while (samples_.size() > capacity_) {
        samples_.pop_front();
    }
}

std::vector<PositionSample> PositionHistory::snapshot(
    std::optional<std::size_t> limit,
    std::optional<Clock::time_point> since) const {
    std::vector<PositionSample> out;
    out.reserve(samples_.size());
    for (const auto& sample : samples_) {
        if (!since || sample.timestamp >= *since) {
            out.push_back(sample);
        }
    }
    if (limit && out.size() > *limit) {
        out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(*limit));
    }
    return out;
}

} // namespace nexstar
