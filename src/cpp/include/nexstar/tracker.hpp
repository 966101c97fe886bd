#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "constants.hpp"
#include "controller.hpp"
#include "export.hpp"
#include "position.hpp"

namespace nexstar {

/// Tracker tuning. set_interval() and set_alert_threshold() enforce the
/// user-facing ranges; the constructor only requires positive values.
struct TrackerOptions {
    double      poll_interval    = DEFAULT_POLL_INTERVAL;    // seconds
    std::size_t history_capacity = HISTORY_CAPACITY;
    double      alert_threshold  = DEFAULT_ALERT_THRESHOLD;  // deg/s
    int         error_limit      = DEFAULT_ERROR_LIMIT;
    double      alert_cooldown   = DEFAULT_ALERT_COOLDOWN;   // seconds
};

/// STOPPED until start(); WAITING while the controller is not connected.
enum class TrackerPhase {
    STOPPED,
    WAITING,
    RUNNING,
};

std::string to_string(TrackerPhase phase);

/// Snapshot returned by PositionTracker::get_status().
struct TrackerStatus {
    TrackerPhase phase = TrackerPhase::STOPPED;
    bool enabled       = false;
    bool running       = false;
    std::optional<PositionSample> last_sample;
    std::optional<double> age_seconds;
    std::string freshness;                 // "live", "12s ago", or empty
    int error_count    = 0;
    VelocityVector velocity;
    bool slewing       = false;
    bool alert_active  = false;
    int alert_count    = 0;
    std::optional<Clock::time_point> alert_last_fired;
    uint64_t cycle_count = 0;
};

struct TrackerStatistics {
    std::size_t sample_count = 0;
    double duration_seconds  = 0.0;
    double drift_degrees     = 0.0;   // RA/Dec separation, first to last
    double ra_drift_arcsec   = 0.0;
    double dec_drift_arcsec  = 0.0;
    std::optional<Clock::time_point> first_timestamp;
    std::optional<Clock::time_point> last_timestamp;
};

/// Background position sampler for one controller.
///
/// A single worker thread polls RA/Dec and Alt/Az every poll interval and
/// is the only writer of the tracker state and history. Readers get
/// copies under a mutex that is never held across device I/O, so they do
/// not wait on the serial link. After error_limit consecutive failed
/// polls the worker stops itself; failures are reported through
/// get_status() and the log, never thrown to readers.
///
/// The tracker keeps a reference to the controller and must be destroyed
/// first.
class PositionTracker {
public:
    explicit PositionTracker(TelescopeController& controller,
                             const TrackerOptions& options = TrackerOptions{});
    ~PositionTracker();

    PositionTracker(const PositionTracker&) = delete;
    PositionTracker& operator=(const PositionTracker&) = delete;

    // --- Control ---

    /// Start the worker. No-op while it is running.
    void start();

    /// Stop the worker and wait for it to exit. Safe from any thread.
    void stop();

    /// Change the poll interval, [0.5, 30] s. Takes effect next cycle.
    void set_interval(double seconds);
    double interval() const;

    /// Change the collision alert threshold, [0.1, 20] deg/s.
    void set_alert_threshold(double deg_per_sec);
    double alert_threshold() const;

    /// Suppress collision alerts while the caller has a slew in progress.
    void set_expected_slew(bool expected);

    void clear_history();

    // --- Reads ---

    TrackerStatus get_status() const;

    /// Oldest to newest; see PositionHistory::snapshot.
    std::vector<PositionSample> get_history(
        std::optional<std::size_t> limit = std::nullopt,
        std::optional<Clock::time_point> since = std::nullopt) const;

    TrackerStatistics get_statistics() const;

    VelocityVector get_velocity() const;

    /// Serialize the current history without pausing the worker.
    std::string export_history(ExportFormat format) const;

    /// Write export_history(format) to path. Throws std::runtime_error.
    void export_to_file(const std::string& path, ExportFormat format) const;

private:
    struct TrackerState {
        bool enabled = false;
        bool running = false;
        TrackerPhase phase = TrackerPhase::STOPPED;
        std::optional<PositionSample> last_sample;
        std::optional<MonotonicClock::time_point> last_update;
        int error_count = 0;
        VelocityVector velocity;
        bool slewing = false;
        bool alert_active = false;
        int alert_count = 0;
        std::optional<Clock::time_point> alert_last_fired;
        std::optional<MonotonicClock::time_point> alert_cooldown_start;
        uint64_t cycle_count = 0;
    };

    TelescopeController& controller_;
    TrackerOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    bool expected_slew_ = false;
    TrackerState state_;
    PositionHistory history_;

    std::mutex control_mutex_;
    std::thread worker_;

    void run();

    /// One poll. Returns false when the worker should exit.
    bool poll_once();

    /// Publish a successful sample. Caller holds mutex_.
    void publish(const PositionSample& sample);
};

} // namespace nexstar
