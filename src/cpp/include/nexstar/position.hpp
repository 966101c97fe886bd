#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

#include "constants.hpp"

namespace nexstar {

/// Wall clock for timestamps that leave the process.
using Clock = std::chrono::system_clock;

/// Interval clock for rates, ages and cooldowns.
using MonotonicClock = std::chrono::steady_clock;

/// One polled mount position. Built once per tracker cycle.
struct PositionSample {
    Clock::time_point timestamp{};
    MonotonicClock::time_point monotonic{};
    double ra_hours    = 0.0;
    double dec_degrees = 0.0;
    double altitude    = 0.0;
    double azimuth     = 0.0;
};

/// Rates of change between two consecutive samples.
struct VelocityVector {
    double ra_per_sec        = 0.0;   // hours/s
    double dec_per_sec       = 0.0;   // deg/s
    double alt_per_sec       = 0.0;   // deg/s
    double az_per_sec        = 0.0;   // deg/s
    double total_deg_per_sec = 0.0;   // angular speed on the sky, from Alt/Az
};

/// Great-circle distance in degrees between two points given as
/// (longitude-like, latitude-like) angles in degrees.
double angular_separation(double lon1, double lat1, double lon2, double lat2);

/// RA/Dec separation between two samples, in degrees.
double equatorial_separation(const PositionSample& a, const PositionSample& b);

/// Alt/Az separation between two samples, in degrees.
double horizontal_separation(const PositionSample& a, const PositionSample& b);

/// Fold a difference into [-period/2, period/2).
double wrap_delta(double delta, double period);

/// Velocity from prev to curr over their monotonic stamps. Zero when
/// those do not advance.
VelocityVector compute_velocity(const PositionSample& prev, const PositionSample& curr);

/// Fixed-capacity, oldest-first sample buffer. Not thread-safe; the
/// tracker guards it.
class PositionHistory {
public:
    explicit PositionHistory(std::size_t capacity = HISTORY_CAPACITY);

    /// Append a sample, evicting the oldest when full.
    void append(const PositionSample& sample);

    /// Copy of the samples, oldest to newest. `since` keeps samples at or
    /// after that time; `limit` then keeps the newest `limit` of those.
    std::vector<PositionSample> snapshot(
        std::optional<std::size_t> limit = std::nullopt,
        std::optional<Clock::time_point> since = std::nullopt) const;

    std::size_t size() const { return samples_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return samples_.empty(); }
    void clear() { samples_.clear(); }

private:
    std::size_t capacity_;
    std::deque<PositionSample> samples_;
};

} // namespace nexstar
