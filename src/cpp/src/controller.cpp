#include "nexstar/controller.hpp"

#include <spdlog/spdlog.h>

#include "nexstar/codec.hpp"
#include "nexstar/errors.hpp"

namespace nexstar {

TelescopeController::TelescopeController(std::unique_ptr<ITransport> transport,
                                         const ConnectionConfig& config)
    : config_(config)
    , channel_(std::move(transport), config.timeout, config.verbose)
    , protocol_(&channel_)
    , motion_(&protocol_, [this](bool moving) {
        slew_state_.store(moving ? SlewState::SLEWING : SlewState::IDLE);
    })
{
}

TelescopeController::TelescopeController(const ConnectionConfig& config)
    : TelescopeController(make_transport(config), config) {
}

TelescopeController::~TelescopeController() {
    disconnect();
}

// --- Connection ---

void TelescopeController::connect() {
    channel_.open();
    bool echoed = false;
    try {
        echoed = protocol_.echo();
    } catch (const NexStarError& e) {
        spdlog::error("Echo test failed: {}", e.what());
        channel_.close();
        throw ConnectionError("Telescope on " + config_.endpoint() +
                              " did not answer: " + e.what());
    }
    if (!echoed) {
        spdlog::error("Echo test failed - telescope not responding properly");
        channel_.close();
        throw ConnectionError("Echo test failed on " + config_.endpoint());
    }
    spdlog::info("Connected to telescope on {}", config_.endpoint());
}

void TelescopeController::disconnect() {
    motion_.cancel_scheduled_stop();
    if (channel_.is_open()) {
        channel_.close();
        spdlog::info("Disconnected from telescope");
    }
    slew_state_.store(SlewState::IDLE);
}

bool TelescopeController::is_connected() const {
    return channel_.is_open();
}

// --- Info ---

bool TelescopeController::echo_test(char c) {
    return protocol_.echo(c);
}

TelescopeInfo TelescopeController::get_info() {
    auto [major, minor] = protocol_.get_version();
    TelescopeInfo info;
    info.firmware_major = major;
    info.firmware_minor = minor;
    info.model = protocol_.get_model();
    return info;
}

// --- Position ---

EquatorialCoordinates TelescopeController::get_position_ra_dec() {
    auto [ra_deg, dec_deg] = protocol_.get_ra_dec();
    EquatorialCoordinates coords;
    coords.ra_hours = codec::ra_degrees_to_hours(ra_deg);
    coords.dec_degrees = codec::to_signed(dec_deg);
    return coords;
}

HorizontalCoordinates TelescopeController::get_position_alt_az() {
    auto [az_deg, alt_deg] = protocol_.get_alt_az();
    HorizontalCoordinates coords;
    coords.azimuth = az_deg;
    coords.altitude = codec::to_signed(alt_deg);
    return coords;
}

// --- Goto / sync ---

void TelescopeController::goto_ra_dec(double ra_hours, double dec_degrees) {
    ProtocolClient::validate_ra_dec(ra_hours, dec_degrees);
    spdlog::info("Slewing to RA {:.4f}h, Dec {:.4f}°", ra_hours, dec_degrees);
    protocol_.goto_ra_dec(ra_hours, dec_degrees);
    slew_state_.store(SlewState::SLEWING);
}

void TelescopeController::goto_alt_az(double azimuth, double altitude) {
    ProtocolClient::validate_alt_az(azimuth, altitude);
    spdlog::info("Slewing to Az {:.2f}°, Alt {:.2f}°", azimuth, altitude);
    protocol_.goto_alt_az(azimuth, altitude);
    slew_state_.store(SlewState::SLEWING);
}

void TelescopeController::sync_ra_dec(double ra_hours, double dec_degrees) {
    ProtocolClient::validate_ra_dec(ra_hours, dec_degrees);
    spdlog::info("Syncing to RA {:.4f}h, Dec {:.4f}°", ra_hours, dec_degrees);
    protocol_.sync_ra_dec(ra_hours, dec_degrees);
}

bool TelescopeController::is_slewing() {
    bool slewing = protocol_.is_slewing();
    if (!slewing && !motion_.has_scheduled_stop()) {
        slew_state_.store(SlewState::IDLE);
    }
    return slewing;
}

void TelescopeController::cancel_goto() {
    spdlog::info("Canceling goto operation");
    protocol_.cancel_goto();
    slew_state_.store(SlewState::IDLE);
}

// --- Manual motion ---

void TelescopeController::move_fixed(Direction direction, int rate,
                                     std::optional<double> duration) {
    ProtocolClient::validate_rate(rate);
    if (rate == 0) {
        stop_motion(axis_of(direction));
        return;
    }
    if (duration) {
        motion_.start_for(direction, rate, *duration);
    } else {
        motion_.start(direction, rate);
    }
}

void TelescopeController::move_step(Direction direction, int rate) {
    ProtocolClient::validate_rate(rate);
    if (rate == 0) {
        stop_motion();
        return;
    }
    motion_.step(direction, rate);
}

void TelescopeController::stop_motion() {
    motion_.stop_all();
}

void TelescopeController::stop_motion(Axis axis) {
    motion_.stop(axis);
}

// --- Tracking / location / time ---

TrackingMode TelescopeController::get_tracking_mode() {
    return protocol_.get_tracking_mode();
}

void TelescopeController::set_tracking_mode(TrackingMode mode) {
    spdlog::info("Setting tracking mode to {}", to_string(mode));
    protocol_.set_tracking_mode(mode);
}

GeographicLocation TelescopeController::get_location() {
    auto [lat, lon] = protocol_.get_location();
    GeographicLocation location;
    location.latitude = codec::to_signed(lat);
    location.longitude = codec::to_signed(lon);
    return location;
}

void TelescopeController::set_location(double latitude, double longitude) {
    ProtocolClient::validate_location(latitude, longitude);
    spdlog::info("Setting location to {:.4f}°, {:.4f}°", latitude, longitude);
    protocol_.set_location(latitude, longitude);
}

TelescopeTime TelescopeController::get_time() {
    return protocol_.get_time();
}

void TelescopeController::set_time(const TelescopeTime& time) {
    ProtocolClient::validate_time(time);
    spdlog::info("Setting time to {}", time.to_string());
    protocol_.set_time(time);
}

// --- ScopedConnection ---

ScopedConnection::ScopedConnection(TelescopeController& controller)
    : controller_(controller) {
    controller_.connect();
}

ScopedConnection::~ScopedConnection() {
    controller_.disconnect();
}

} // namespace nexstar
