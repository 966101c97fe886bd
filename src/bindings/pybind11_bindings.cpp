#include <pybind11/chrono.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <memory>
#include <string>

#include "nexstar/codec.hpp"
#include "nexstar/config.hpp"
#include "nexstar/constants.hpp"
#include "nexstar/controller.hpp"
#include "nexstar/errors.hpp"
#include "nexstar/logging.hpp"
#include "nexstar/tracker.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_nexstar_native, m) {
    m.doc() = "NexStar telescope native C++ bindings";

    // Exceptions, most specific last so Python sees the hierarchy
    auto base = py::register_exception<nexstar::NexStarError>(m, "NexStarError");
    py::register_exception<nexstar::ConnectionError>(m, "ConnectionError", base);
    py::register_exception<nexstar::TimeoutError>(m, "TimeoutError", base);
    py::register_exception<nexstar::NotConnectedError>(m, "NotConnectedError", base);
    py::register_exception<nexstar::CommandError>(m, "CommandError", base);
    auto invalid = py::register_exception<nexstar::InvalidParameterError>(
        m, "InvalidParameterError", base);
    py::register_exception<nexstar::InvalidCoordinateError>(
        m, "InvalidCoordinateError", invalid);

    m.def("set_verbose_logging", &nexstar::set_verbose_logging, py::arg("verbose"));

    // Codec
    auto codec = m.def_submodule("codec", "Angle <-> 32-bit hex conversion");
    codec.def("degrees_to_hex", &nexstar::codec::degrees_to_hex, py::arg("degrees"));
    codec.def("hex_to_degrees", &nexstar::codec::hex_to_degrees, py::arg("hex"));
    codec.def("encode_pair", &nexstar::codec::encode_pair,
              py::arg("first"), py::arg("second"));
    codec.def("decode_pair", &nexstar::codec::decode_pair, py::arg("response"));
    codec.def("to_unsigned", &nexstar::codec::to_unsigned, py::arg("angle"));
    codec.def("to_signed", &nexstar::codec::to_signed, py::arg("angle"));

    // Enums
    py::enum_<nexstar::ConnectionType>(m, "ConnectionType")
        .value("SERIAL", nexstar::ConnectionType::SERIAL)
        .value("TCP", nexstar::ConnectionType::TCP);

    py::enum_<nexstar::TrackingMode>(m, "TrackingMode")
        .value("OFF", nexstar::TrackingMode::OFF)
        .value("ALT_AZ", nexstar::TrackingMode::ALT_AZ)
        .value("EQ_NORTH", nexstar::TrackingMode::EQ_NORTH)
        .value("EQ_SOUTH", nexstar::TrackingMode::EQ_SOUTH);

    py::enum_<nexstar::Axis>(m, "Axis")
        .value("AZIMUTH", nexstar::Axis::AZIMUTH)
        .value("ALTITUDE", nexstar::Axis::ALTITUDE);

    py::enum_<nexstar::Direction>(m, "Direction")
        .value("UP", nexstar::Direction::UP)
        .value("DOWN", nexstar::Direction::DOWN)
        .value("LEFT", nexstar::Direction::LEFT)
        .value("RIGHT", nexstar::Direction::RIGHT);

    py::enum_<nexstar::SlewState>(m, "SlewState")
        .value("IDLE", nexstar::SlewState::IDLE)
        .value("SLEWING", nexstar::SlewState::SLEWING);

    py::enum_<nexstar::TrackerPhase>(m, "TrackerPhase")
        .value("STOPPED", nexstar::TrackerPhase::STOPPED)
        .value("WAITING", nexstar::TrackerPhase::WAITING)
        .value("RUNNING", nexstar::TrackerPhase::RUNNING);

    py::enum_<nexstar::ExportFormat>(m, "ExportFormat")
        .value("CSV", nexstar::ExportFormat::CSV)
        .value("JSON", nexstar::ExportFormat::JSON);

    // Value types
    py::class_<nexstar::ConnectionConfig>(m, "ConnectionConfig")
        .def(py::init<>())
        .def_readwrite("type", &nexstar::ConnectionConfig::type)
        .def_readwrite("port", &nexstar::ConnectionConfig::port)
        .def_readwrite("baudrate", &nexstar::ConnectionConfig::baudrate)
        .def_readwrite("host", &nexstar::ConnectionConfig::host)
        .def_readwrite("tcp_port", &nexstar::ConnectionConfig::tcp_port)
        .def_readwrite("timeout", &nexstar::ConnectionConfig::timeout)
        .def_readwrite("verbose", &nexstar::ConnectionConfig::verbose)
        .def("endpoint", &nexstar::ConnectionConfig::endpoint);

    py::class_<nexstar::EquatorialCoordinates>(m, "EquatorialCoordinates")
        .def(py::init<>())
        .def_readwrite("ra_hours", &nexstar::EquatorialCoordinates::ra_hours)
        .def_readwrite("dec_degrees", &nexstar::EquatorialCoordinates::dec_degrees);

    py::class_<nexstar::HorizontalCoordinates>(m, "HorizontalCoordinates")
        .def(py::init<>())
        .def_readwrite("azimuth", &nexstar::HorizontalCoordinates::azimuth)
        .def_readwrite("altitude", &nexstar::HorizontalCoordinates::altitude);

    py::class_<nexstar::GeographicLocation>(m, "GeographicLocation")
        .def(py::init<>())
        .def_readwrite("latitude", &nexstar::GeographicLocation::latitude)
        .def_readwrite("longitude", &nexstar::GeographicLocation::longitude);

    py::class_<nexstar::TelescopeInfo>(m, "TelescopeInfo")
        .def_readonly("model", &nexstar::TelescopeInfo::model)
        .def_readonly("firmware_major", &nexstar::TelescopeInfo::firmware_major)
        .def_readonly("firmware_minor", &nexstar::TelescopeInfo::firmware_minor)
        .def("__str__", &nexstar::TelescopeInfo::to_string);

    py::class_<nexstar::TelescopeTime>(m, "TelescopeTime")
        .def(py::init<>())
        .def_readwrite("hour", &nexstar::TelescopeTime::hour)
        .def_readwrite("minute", &nexstar::TelescopeTime::minute)
        .def_readwrite("second", &nexstar::TelescopeTime::second)
        .def_readwrite("month", &nexstar::TelescopeTime::month)
        .def_readwrite("day", &nexstar::TelescopeTime::day)
        .def_readwrite("year", &nexstar::TelescopeTime::year)
        .def_readwrite("timezone_offset", &nexstar::TelescopeTime::timezone_offset)
        .def_readwrite("dst_flag", &nexstar::TelescopeTime::dst_flag)
        .def("__str__", &nexstar::TelescopeTime::to_string);

    py::class_<nexstar::PositionSample>(m, "PositionSample")
        .def_readonly("timestamp", &nexstar::PositionSample::timestamp)
        .def_readonly("ra_hours", &nexstar::PositionSample::ra_hours)
        .def_readonly("dec_degrees", &nexstar::PositionSample::dec_degrees)
        .def_readonly("altitude", &nexstar::PositionSample::altitude)
        .def_readonly("azimuth", &nexstar::PositionSample::azimuth);

    py::class_<nexstar::VelocityVector>(m, "VelocityVector")
        .def_readonly("ra_per_sec", &nexstar::VelocityVector::ra_per_sec)
        .def_readonly("dec_per_sec", &nexstar::VelocityVector::dec_per_sec)
        .def_readonly("alt_per_sec", &nexstar::VelocityVector::alt_per_sec)
        .def_readonly("az_per_sec", &nexstar::VelocityVector::az_per_sec)
        .def_readonly("total_deg_per_sec", &nexstar::VelocityVector::total_deg_per_sec);

    py::class_<nexstar::TrackerOptions>(m, "TrackerOptions")
        .def(py::init<>())
        .def_readwrite("poll_interval", &nexstar::TrackerOptions::poll_interval)
        .def_readwrite("history_capacity", &nexstar::TrackerOptions::history_capacity)
        .def_readwrite("alert_threshold", &nexstar::TrackerOptions::alert_threshold)
        .def_readwrite("error_limit", &nexstar::TrackerOptions::error_limit)
        .def_readwrite("alert_cooldown", &nexstar::TrackerOptions::alert_cooldown);

    py::class_<nexstar::TrackerStatus>(m, "TrackerStatus")
        .def_readonly("phase", &nexstar::TrackerStatus::phase)
        .def_readonly("enabled", &nexstar::TrackerStatus::enabled)
        .def_readonly("running", &nexstar::TrackerStatus::running)
        .def_readonly("last_sample", &nexstar::TrackerStatus::last_sample)
        .def_readonly("age_seconds", &nexstar::TrackerStatus::age_seconds)
        .def_readonly("freshness", &nexstar::TrackerStatus::freshness)
        .def_readonly("error_count", &nexstar::TrackerStatus::error_count)
        .def_readonly("velocity", &nexstar::TrackerStatus::velocity)
        .def_readonly("slewing", &nexstar::TrackerStatus::slewing)
        .def_readonly("alert_active", &nexstar::TrackerStatus::alert_active)
        .def_readonly("alert_count", &nexstar::TrackerStatus::alert_count)
        .def_readonly("alert_last_fired", &nexstar::TrackerStatus::alert_last_fired)
        .def_readonly("cycle_count", &nexstar::TrackerStatus::cycle_count);

    py::class_<nexstar::TrackerStatistics>(m, "TrackerStatistics")
        .def_readonly("sample_count", &nexstar::TrackerStatistics::sample_count)
        .def_readonly("duration_seconds", &nexstar::TrackerStatistics::duration_seconds)
        .def_readonly("drift_degrees", &nexstar::TrackerStatistics::drift_degrees)
        .def_readonly("ra_drift_arcsec", &nexstar::TrackerStatistics::ra_drift_arcsec)
        .def_readonly("dec_drift_arcsec", &nexstar::TrackerStatistics::dec_drift_arcsec)
        .def_readonly("first_timestamp", &nexstar::TrackerStatistics::first_timestamp)
        .def_readonly("last_timestamp", &nexstar::TrackerStatistics::last_timestamp);

    // Config
    py::class_<nexstar::Config>(m, "Config")
        .def(py::init<const std::string&>(), py::arg("config_path") = "")
        .def("load", &nexstar::Config::load)
        .def("save", &nexstar::Config::save)
        .def("get", &nexstar::Config::get, py::arg("key"), py::arg("default_val") = "")
        .def("set", &nexstar::Config::set, py::arg("key"), py::arg("value"))
        .def("connection_config", &nexstar::Config::connection_config)
        .def("tracker_options", &nexstar::Config::tracker_options)
        .def_property_readonly("path", &nexstar::Config::path);

    // Controller - factory function returning unique_ptr since the
    // controller owns its channel (non-copyable, non-movable in pybind11)
    m.def("create_controller", [](const nexstar::ConnectionConfig& config) {
        nexstar::set_verbose_logging(config.verbose);
        return std::make_unique<nexstar::TelescopeController>(config);
    }, py::arg("config") = nexstar::ConnectionConfig{});

    using Ctrl = nexstar::TelescopeController;
    py::class_<Ctrl>(m, "TelescopeController")
        .def("connect", &Ctrl::connect, py::call_guard<py::gil_scoped_release>())
        .def("disconnect", &Ctrl::disconnect, py::call_guard<py::gil_scoped_release>())
        .def("is_connected", &Ctrl::is_connected)
        .def("echo_test", &Ctrl::echo_test, py::arg("char") = 'x',
             py::call_guard<py::gil_scoped_release>())
        .def("get_info", &Ctrl::get_info, py::call_guard<py::gil_scoped_release>())
        .def("get_position_ra_dec", &Ctrl::get_position_ra_dec,
             py::call_guard<py::gil_scoped_release>())
        .def("get_position_alt_az", &Ctrl::get_position_alt_az,
             py::call_guard<py::gil_scoped_release>())
        .def("goto_ra_dec", &Ctrl::goto_ra_dec, py::arg("ra_hours"), py::arg("dec_degrees"),
             py::call_guard<py::gil_scoped_release>())
        .def("goto_alt_az", &Ctrl::goto_alt_az, py::arg("azimuth"), py::arg("altitude"),
             py::call_guard<py::gil_scoped_release>())
        .def("sync_ra_dec", &Ctrl::sync_ra_dec, py::arg("ra_hours"), py::arg("dec_degrees"),
             py::call_guard<py::gil_scoped_release>())
        .def("is_slewing", &Ctrl::is_slewing, py::call_guard<py::gil_scoped_release>())
        .def("cancel_goto", &Ctrl::cancel_goto, py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("slew_state", &Ctrl::slew_state)
        .def("move_fixed", &Ctrl::move_fixed, py::arg("direction"),
             py::arg("rate") = nexstar::DEFAULT_MOVE_RATE,
             py::arg("duration") = py::none(),
             py::call_guard<py::gil_scoped_release>())
        .def("move_step", &Ctrl::move_step, py::arg("direction"),
             py::arg("rate") = nexstar::DEFAULT_MOVE_RATE,
             py::call_guard<py::gil_scoped_release>())
        .def("stop_motion", static_cast<void (Ctrl::*)()>(&Ctrl::stop_motion),
             py::call_guard<py::gil_scoped_release>())
        .def("stop_motion", static_cast<void (Ctrl::*)(nexstar::Axis)>(&Ctrl::stop_motion),
             py::arg("axis"), py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("has_scheduled_stop", &Ctrl::has_scheduled_stop)
        .def("get_tracking_mode", &Ctrl::get_tracking_mode,
             py::call_guard<py::gil_scoped_release>())
        .def("set_tracking_mode", &Ctrl::set_tracking_mode, py::arg("mode"),
             py::call_guard<py::gil_scoped_release>())
        .def("get_location", &Ctrl::get_location, py::call_guard<py::gil_scoped_release>())
        .def("set_location", &Ctrl::set_location, py::arg("latitude"), py::arg("longitude"),
             py::call_guard<py::gil_scoped_release>())
        .def("get_time", &Ctrl::get_time, py::call_guard<py::gil_scoped_release>())
        .def("set_time", &Ctrl::set_time, py::arg("time"),
             py::call_guard<py::gil_scoped_release>());

    // PositionTracker keeps its controller alive
    using Tracker = nexstar::PositionTracker;
    py::class_<Tracker>(m, "PositionTracker")
        .def(py::init<Ctrl&, const nexstar::TrackerOptions&>(),
             py::arg("controller"), py::arg("options") = nexstar::TrackerOptions{},
             py::keep_alive<1, 2>())
        .def("start", &Tracker::start, py::call_guard<py::gil_scoped_release>())
        .def("stop", &Tracker::stop, py::call_guard<py::gil_scoped_release>())
        .def_property("interval", &Tracker::interval, &Tracker::set_interval)
        .def_property("alert_threshold", &Tracker::alert_threshold,
                      &Tracker::set_alert_threshold)
        .def("set_expected_slew", &Tracker::set_expected_slew, py::arg("expected"))
        .def("clear_history", &Tracker::clear_history)
        .def("get_status", &Tracker::get_status)
        .def("get_history", &Tracker::get_history,
             py::arg("limit") = py::none(), py::arg("since") = py::none())
        .def("get_statistics", &Tracker::get_statistics)
        .def("get_velocity", &Tracker::get_velocity)
        .def("export_history",
             [](const Tracker& self, const std::string& format) {
                 return self.export_history(nexstar::parse_export_format(format));
             },
             py::arg("format") = "json")
        .def("export_to_file",
             [](const Tracker& self, const std::string& path, const std::string& format) {
                 self.export_to_file(path, nexstar::parse_export_format(format));
             },
             py::arg("path"), py::arg("format") = "json");

    // Constants
    m.attr("DEFAULT_TCP_HOST") = nexstar::DEFAULT_TCP_HOST;
    m.attr("DEFAULT_TCP_PORT") = nexstar::DEFAULT_TCP_PORT;
    m.attr("DEFAULT_SERIAL_PORT") = nexstar::DEFAULT_SERIAL_PORT;
    m.attr("DEFAULT_BAUDRATE") = nexstar::DEFAULT_BAUDRATE;
}
