#include "nexstar/tracker.hpp"

#include <cmath>

#include <spdlog/spdlog.h>

#include "nexstar/errors.hpp"

namespace nexstar {

namespace {

std::chrono::duration<double> seconds(double value) {
    return std::chrono::duration<double>(value);
}

} // anonymous namespace

std::string to_string(TrackerPhase phase) {
    switch (phase) {
        case TrackerPhase::STOPPED: return "stopped";
        case TrackerPhase::WAITING: return "waiting";
        case TrackerPhase::RUNNING: return "running";
    }
    return "unknown";
}

PositionTracker::PositionTracker(TelescopeController& controller,
                                 const TrackerOptions& options)
    : controller_(controller)
    , options_(options)
    , history_(options.history_capacity) {
    if (!(options_.poll_interval > 0.0) || !std::isfinite(options_.poll_interval)) {
        throw InvalidParameterError("Poll interval must be positive");
    }
    if (!(options_.alert_threshold > 0.0)) {
        throw InvalidParameterError("Alert threshold must be positive");
    }
    if (options_.error_limit < 1) {
        throw InvalidParameterError("Error limit must be at least 1");
    }
    if (options_.alert_cooldown < 0.0) {
        throw InvalidParameterError("Alert cooldown must not be negative");
    }
}

PositionTracker::~PositionTracker() {
    stop();
}

// --- Control ---

void PositionTracker::start() {
    std::lock_guard<std::mutex> control(control_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.running) {
            return;
        }
    }
    // A worker that stopped itself after repeated errors is still joinable.
    if (worker_.joinable()) {
        worker_.join();
    }

    double interval = 0.0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = TrackerState{};
        state_.enabled = true;
        state_.running = true;
        state_.phase = controller_.is_connected() ? TrackerPhase::RUNNING
                                                  : TrackerPhase::WAITING;
        stop_requested_ = false;
        interval = options_.poll_interval;
    }
    worker_ = std::thread(&PositionTracker::run, this);
    spdlog::info("Position tracking started (interval {:.1f}s)", interval);
}

void PositionTracker::stop() {
    std::lock_guard<std::mutex> control(control_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        state_.enabled = false;
    }
    wake_.notify_all();
    if (!worker_.joinable()) {
        return;
    }
    worker_.join();

    std::lock_guard<std::mutex> lock(mutex_);
    state_ = TrackerState{};
    spdlog::info("Position tracking stopped");
}

void PositionTracker::set_interval(double value) {
    if (!(value >= MIN_POLL_INTERVAL && value <= MAX_POLL_INTERVAL)) {
        throw InvalidParameterError("Interval must be 0.5-30 seconds, got " +
                                    std::to_string(value));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    options_.poll_interval = value;
}

double PositionTracker::interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_.poll_interval;
}

void PositionTracker::set_alert_threshold(double deg_per_sec) {
    if (!(deg_per_sec >= MIN_ALERT_THRESHOLD && deg_per_sec <= MAX_ALERT_THRESHOLD)) {
        throw InvalidParameterError("Alert threshold must be 0.1-20.0 deg/s, got " +
                                    std::to_string(deg_per_sec));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    options_.alert_threshold = deg_per_sec;
}

double PositionTracker::alert_threshold() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_.alert_threshold;
}

void PositionTracker::set_expected_slew(bool expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    expected_slew_ = expected;
}

void PositionTracker::clear_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

// --- Worker ---

void PositionTracker::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        lock.unlock();
        bool keep_going = poll_once();
        lock.lock();
        if (!keep_going) {
            break;
        }
        wake_.wait_for(lock, seconds(options_.poll_interval),
                       [this] { return stop_requested_; });
    }
}

bool PositionTracker::poll_once() {
    if (!controller_.is_connected()) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.phase = TrackerPhase::WAITING;
        return true;
    }

    EquatorialCoordinates eq;
    HorizontalCoordinates hz;
    try {
        eq = controller_.get_position_ra_dec();
        hz = controller_.get_position_alt_az();
    } catch (const NotConnectedError&) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.phase = TrackerPhase::WAITING;
        return true;
    } catch (const NexStarError& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++state_.error_count;
        ++state_.cycle_count;
        spdlog::warn("Position poll failed ({}/{}): {}",
                     state_.error_count, options_.error_limit, e.what());
        if (state_.error_count >= options_.error_limit) {
            spdlog::error("Stopping position tracking after {} consecutive errors",
                          state_.error_count);
            state_.enabled = false;
            state_.running = false;
            state_.phase = TrackerPhase::STOPPED;
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(mutex_);
        spdlog::error("Position tracking aborted: {}", e.what());
        state_.enabled = false;
        state_.running = false;
        state_.phase = TrackerPhase::STOPPED;
        return false;
    }

    PositionSample sample;
    sample.timestamp = Clock::now();
    sample.monotonic = MonotonicClock::now();
    sample.ra_hours = eq.ra_hours;
    sample.dec_degrees = eq.dec_degrees;
    sample.altitude = hz.altitude;
    sample.azimuth = hz.azimuth;

    std::lock_guard<std::mutex> lock(mutex_);
    publish(sample);
    return true;
}

void PositionTracker::publish(const PositionSample& sample) {
    state_.error_count = 0;
    state_.phase = TrackerPhase::RUNNING;

    if (state_.last_sample) {
        state_.velocity = compute_velocity(*state_.last_sample, sample);
        double speed = state_.velocity.total_deg_per_sec;
        state_.slewing = speed > SLEW_SPEED_THRESHOLD;
        state_.alert_active = !expected_slew_ && speed > options_.alert_threshold;

        if (state_.alert_active) {
            bool cooled_down = !state_.alert_cooldown_start ||
                sample.monotonic - *state_.alert_cooldown_start >= seconds(options_.alert_cooldown);
            if (cooled_down) {
                ++state_.alert_count;
                state_.alert_last_fired = sample.timestamp;
                state_.alert_cooldown_start = sample.monotonic;
                spdlog::warn("Unexpected movement: {:.2f}°/s exceeds {:.2f}°/s "
                             "(Alt {:.2f}°, Az {:.2f}°)",
                             speed, options_.alert_threshold,
                             sample.altitude, sample.azimuth);
            }
        }
    } else {
        state_.velocity = VelocityVector{};
        state_.slewing = false;
        state_.alert_active = false;
    }

    history_.append(sample);
    state_.last_sample = sample;
    state_.last_update = sample.monotonic;
    ++state_.cycle_count;
}

// --- Reads ---

TrackerStatus PositionTracker::get_status() const {
    TrackerStatus status;
    std::optional<MonotonicClock::time_point> last_update;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status.phase = state_.phase;
        status.enabled = state_.enabled;
        status.running = state_.running;
        status.last_sample = state_.last_sample;
        status.error_count = state_.error_count;
        status.velocity = state_.velocity;
        status.slewing = state_.slewing;
        status.alert_active = state_.alert_active;
        status.alert_count = state_.alert_count;
        status.alert_last_fired = state_.alert_last_fired;
        status.cycle_count = state_.cycle_count;
        last_update = state_.last_update;
    }

    if (last_update) {
        double age = std::chrono::duration<double>(MonotonicClock::now() - *last_update).count();
        status.age_seconds = age;
        status.freshness = age < LIVE_AGE_LIMIT
            ? "live"
            : std::to_string(static_cast<long long>(age)) + "s ago";
    }
    return status;
}

std::vector<PositionSample> PositionTracker::get_history(
    std::optional<std::size_t> limit,
    std::optional<Clock::time_point> since) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.snapshot(limit, since);
}

TrackerStatistics PositionTracker::get_statistics() const {
    std::vector<PositionSample> samples = get_history();

    TrackerStatistics stats;
    stats.sample_count = samples.size();
    if (samples.empty()) {
        return stats;
    }
    const auto& first = samples.front();
    const auto& last = samples.back();
    stats.first_timestamp = first.timestamp;
    stats.last_timestamp = last.timestamp;
    if (samples.size() < 2) {
        return stats;
    }

    stats.duration_seconds =
        std::chrono::duration<double>(last.monotonic - first.monotonic).count();
    stats.drift_degrees = equatorial_separation(first, last);
    stats.ra_drift_arcsec =
        std::fabs(wrap_delta(last.ra_hours - first.ra_hours, 24.0)) * DEGREES_PER_HOUR * 3600.0;
    stats.dec_drift_arcsec = std::fabs(last.dec_degrees - first.dec_degrees) * 3600.0;
    return stats;
}

VelocityVector PositionTracker::get_velocity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.velocity;
}

std::string PositionTracker::export_history(ExportFormat format) const {
    return serialize_history(get_history(), format);
}

void PositionTracker::export_to_file(const std::string& path, ExportFormat format) const {
    std::vector<PositionSample> samples = get_history();
    write_export_file(path, serialize_history(samples, format));
    spdlog::info("Exported {} positions to {}", samples.size(), path);
}

} // namespace nexstar
