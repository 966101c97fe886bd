#pragma once

#include <map>
#include <string>

#include "constants.hpp"
#include "tracker.hpp"
#include "transport.hpp"

namespace nexstar {

/// Manages connection and tracker settings in ~/.nexstar_config.
///
/// Key=value file format, '#' starts a comment line.
class Config {
public:
    /// Construct with optional custom config file path.
    explicit Config(const std::string& config_path = "");

    /// Load config from file. Missing file is silently ignored.
    void load();

    /// Save current config to file. Throws std::runtime_error.
    void save() const;

    /// Get a config value by key, or a default if missing.
    std::string get(const std::string& key, const std::string& default_val = "") const;

    /// Set a config value.
    void set(const std::string& key, const std::string& value);

    // --- Typed accessors ---

    ConnectionType connection_type() const;
    void set_connection_type(ConnectionType value);

    std::string port() const;
    void set_port(const std::string& value);

    int baudrate() const;

    std::string host() const;
    void set_host(const std::string& value);

    int tcp_port() const;
    void set_tcp_port(int value);

    double timeout() const;
    void set_timeout(double value);

    bool verbose() const;
    void set_verbose(bool value);

    double poll_interval() const;
    void set_poll_interval(double value);

    double alert_threshold() const;
    void set_alert_threshold(double value);

    /// Settings for TelescopeController / make_transport().
    ConnectionConfig connection_config() const;

    /// Settings for PositionTracker.
    TrackerOptions tracker_options() const;

    /// Return the config file path.
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::map<std::string, std::string> data_;

    void set_defaults();
    int get_int(const std::string& key, int fallback) const;
    double get_double(const std::string& key, double fallback) const;
};

} // namespace nexstar
