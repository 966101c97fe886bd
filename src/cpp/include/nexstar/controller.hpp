#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>

#include "channel.hpp"
#include "constants.hpp"
#include "motion.hpp"
#include "protocol.hpp"
#include "transport.hpp"
#include "types.hpp"

namespace nexstar {

/// High-level controller for a NexStar mount.
///
/// Owns the command channel and converts between the protocol's unsigned
/// wire angles and signed domain coordinates. Errors propagate as the
/// typed exceptions in errors.hpp; nothing is retried.
///
/// Slew state follows IDLE -> SLEWING on goto or move, and back to IDLE
/// when is_slewing() reports false, on cancel_goto()/stop_motion(), or
/// when a timed move stops. It is only updated by these calls.
class TelescopeController {
public:
    /// Construct with an injected transport and connection settings.
    explicit TelescopeController(std::unique_ptr<ITransport> transport,
                                 const ConnectionConfig& config = ConnectionConfig{});

    /// Construct with the transport selected by config.
    explicit TelescopeController(const ConnectionConfig& config);

    ~TelescopeController();

    TelescopeController(const TelescopeController&) = delete;
    TelescopeController& operator=(const TelescopeController&) = delete;

    // --- Connection ---

    /// Open the link and run an echo test. Throws ConnectionError.
    void connect();

    /// Close the link. Safe to call when already disconnected.
    void disconnect();

    bool is_connected() const;

    const ConnectionConfig& config() const { return config_; }

    // --- Info ---

    bool echo_test(char c = 'x');
    TelescopeInfo get_info();

    // --- Position ---

    EquatorialCoordinates get_position_ra_dec();
    HorizontalCoordinates get_position_alt_az();

    // --- Goto / sync ---

    void goto_ra_dec(double ra_hours, double dec_degrees);
    void goto_alt_az(double azimuth, double altitude);
    void sync_ra_dec(double ra_hours, double dec_degrees);

    /// Poll the mount; a false answer returns the slew state to IDLE.
    bool is_slewing();
    void cancel_goto();

    SlewState slew_state() const { return slew_state_.load(); }

    // --- Manual motion ---

    /// Move at rate (0-9). With a duration the axis stops on its own after
    /// that many seconds; the call returns immediately. Rate 0 stops the axis.
    void move_fixed(Direction direction, int rate = DEFAULT_MOVE_RATE,
                    std::optional<double> duration = std::nullopt);

    /// One hand-controller step: move for 0.2 s then stop. Blocks.
    void move_step(Direction direction, int rate = DEFAULT_MOVE_RATE);

    void stop_motion();
    void stop_motion(Axis axis);

    /// True while a timed move is waiting to stop.
    bool has_scheduled_stop() const { return motion_.has_scheduled_stop(); }

    // --- Tracking / location / time ---

    TrackingMode get_tracking_mode();
    void set_tracking_mode(TrackingMode mode);

    GeographicLocation get_location();
    void set_location(double latitude, double longitude);

    TelescopeTime get_time();
    void set_time(const TelescopeTime& time);

private:
    ConnectionConfig config_;
    CommandChannel channel_;
    ProtocolClient protocol_;
    std::atomic<SlewState> slew_state_{SlewState::IDLE};
    MotionController motion_;
};

/// Connects on construction and disconnects on every exit path.
class ScopedConnection {
public:
    explicit ScopedConnection(TelescopeController& controller);
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    TelescopeController& operator*() const { return controller_; }
    TelescopeController* operator->() const { return &controller_; }

private:
    TelescopeController& controller_;
};

} // namespace nexstar
