#pragma once

#include <string>
#include <utility>

#include "channel.hpp"
#include "types.hpp"

namespace nexstar {

/// One method per NexStar hand-controller command.
///
/// Setters take domain values (RA in hours, signed Dec/Alt/Lat/Lon) and
/// validate them before any I/O, raising InvalidCoordinateError with no
/// channel traffic. Position getters return the raw wire angles in
/// [0, 360); TelescopeController converts them to signed domains.
/// Malformed responses raise CommandError.
class ProtocolClient {
public:
    /// Construct over a channel (non-owning pointer).
    explicit ProtocolClient(CommandChannel* channel);

    /// K<char># -> <char>#. Returns true if the character came back.
    bool echo(char c = 'x');

    /// V# -> two raw bytes (major, minor).
    std::pair<int, int> get_version();

    /// m# -> one raw byte.
    int get_model();

    /// E# -> (RA degrees, Dec degrees), both in [0, 360).
    std::pair<double, double> get_ra_dec();

    /// Z# -> (Azimuth degrees, Altitude degrees), both in [0, 360).
    std::pair<double, double> get_alt_az();

    /// R<ra>,<dec>#
    void goto_ra_dec(double ra_hours, double dec_degrees);

    /// B<az>,<alt>#
    void goto_alt_az(double azimuth, double altitude);

    /// S<ra>,<dec>#
    void sync_ra_dec(double ra_hours, double dec_degrees);

    /// L# -> 0# or 1#
    bool is_slewing();

    /// M#
    void cancel_goto();

    /// P<axis><dir><rate>\0\0\0#. Rate 0 stops the axis.
    void variable_rate_motion(Axis axis, MotionDirection direction, int rate);

    TrackingMode get_tracking_mode();
    void set_tracking_mode(TrackingMode mode);

    /// w# -> 16 hex chars -> (latitude, longitude) in [0, 360).
    std::pair<double, double> get_location();

    /// W<lat>,<lon>#
    void set_location(double latitude, double longitude);

    /// h# -> 8 raw bytes.
    TelescopeTime get_time();

    /// H<8 bytes>#
    void set_time(const TelescopeTime& time);

    // --- Validation (also used by the controller) ---

    static void validate_ra_dec(double ra_hours, double dec_degrees);
    static void validate_alt_az(double azimuth, double altitude);
    static void validate_location(double latitude, double longitude);
    static void validate_rate(int rate);
    static void validate_time(const TelescopeTime& time);

private:
    CommandChannel* channel_;

    /// Send a command whose only valid response is an empty acknowledgement.
    void send_acknowledged(const std::string& command);

    /// Send a command expecting exactly `length` raw bytes.
    std::string send_raw(const std::string& command, std::size_t length);
};

} // namespace nexstar
