#include "nexstar/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace nexstar {

namespace {

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home);
    }
    return ".";
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string format_double(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

} // anonymous namespace

Config::Config(const std::string& config_path)
    : path_(config_path.empty()
            ? get_home_dir() + "/" + DEFAULT_CONFIG_FILENAME
            : config_path) {
    set_defaults();
}

void Config::set_defaults() {
    data_["CONNECTION"]      = "serial";
    data_["PORT"]            = DEFAULT_SERIAL_PORT;
    data_["BAUDRATE"]        = std::to_string(DEFAULT_BAUDRATE);
    data_["HOST"]            = DEFAULT_TCP_HOST;
    data_["TCP_PORT"]        = std::to_string(DEFAULT_TCP_PORT);
    data_["TIMEOUT"]         = format_double(DEFAULT_TIMEOUT);
    data_["VERBOSE"]         = "false";
    data_["POLL_INTERVAL"]   = format_double(DEFAULT_POLL_INTERVAL);
    data_["ALERT_THRESHOLD"] = format_double(DEFAULT_ALERT_THRESHOLD);
}

void Config::load() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        return; // Missing file is silently ignored
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        std::string key   = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Only update keys we know about
        if (data_.count(key)) {
            data_[key] = value;
        } else {
            spdlog::debug("Ignoring unknown config key {} in {}", key, path_);
        }
    }
}

void Config::save() const {
    std::ofstream file(path_);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write config file: " + path_);
    }
    for (const auto& [key, value] : data_) {
        file << key << "=" << value << "\n";
    }
}

std::string Config::get(const std::string& key,
                        const std::string& default_val) const {
    auto it = data_.find(key);
    if (it != data_.end()) {
        return it->second;
    }
    return default_val;
}

void Config::set(const std::string& key, const std::string& value) {
    data_[key] = value;
}

int Config::get_int(const std::string& key, int fallback) const {
    std::string raw = get(key);
    try {
        return std::stoi(raw);
    } catch (const std::exception&) {
        spdlog::warn("Invalid {} value '{}' in {}, using {}", key, raw, path_, fallback);
        return fallback;
    }
}

double Config::get_double(const std::string& key, double fallback) const {
    std::string raw = get(key);
    try {
        return std::stod(raw);
    } catch (const std::exception&) {
        spdlog::warn("Invalid {} value '{}' in {}, using {}", key, raw, path_, fallback);
        return fallback;
    }
}

ConnectionType Config::connection_type() const {
    return lowercase(get("CONNECTION", "serial")) == "tcp" ? ConnectionType::TCP
                                                          : ConnectionType::SERIAL;
}

void Config::set_connection_type(ConnectionType value) {
    data_["CONNECTION"] = value == ConnectionType::TCP ? "tcp" : "serial";
}

std::string Config::port() const {
    return get("PORT", DEFAULT_SERIAL_PORT);
}

void Config::set_port(const std::string& value) {
    data_["PORT"] = value;
}

int Config::baudrate() const {
    return get_int("BAUDRATE", DEFAULT_BAUDRATE);
}

std::string Config::host() const {
    return get("HOST", DEFAULT_TCP_HOST);
}

void Config::set_host(const std::string& value) {
    data_["HOST"] = value;
}

int Config::tcp_port() const {
    return get_int("TCP_PORT", DEFAULT_TCP_PORT);
}

void Config::set_tcp_port(int value) {
    data_["TCP_PORT"] = std::to_string(value);
}

double Config::timeout() const {
    return get_double("TIMEOUT", DEFAULT_TIMEOUT);
}

void Config::set_timeout(double value) {
    data_["TIMEOUT"] = format_double(value);
}

bool Config::verbose() const {
    std::string value = lowercase(get("VERBOSE", "false"));
    return value == "true" || value == "1" || value == "yes";
}

void Config::set_verbose(bool value) {
    data_["VERBOSE"] = value ? "true" : "false";
}

double Config::poll_interval() const {
    return get_double("POLL_INTERVAL", DEFAULT_POLL_INTERVAL);
}

void Config::set_poll_interval(double value) {
    data_["POLL_INTERVAL"] = format_double(value);
}

double Config::alert_threshold() const {
    return get_double("ALERT_THRESHOLD", DEFAULT_ALERT_THRESHOLD);
}

void Config::set_alert_threshold(double value) {
    data_["ALERT_THRESHOLD"] = format_double(value);
}

ConnectionConfig Config::connection_config() const {
    ConnectionConfig cfg;
    cfg.type     = connection_type();
    cfg.port     = port();
    cfg.baudrate = baudrate();
    cfg.host     = host();
    cfg.tcp_port = tcp_port();
    cfg.timeout  = timeout();
    cfg.verbose  = verbose();
    return cfg;
}

TrackerOptions Config::tracker_options() const {
    TrackerOptions options;
    options.poll_interval = std::clamp(poll_interval(), MIN_POLL_INTERVAL, MAX_POLL_INTERVAL);
    options.alert_threshold = std::clamp(alert_threshold(), MIN_ALERT_THRESHOLD,
                                         MAX_ALERT_THRESHOLD);
    return options;
}

} // namespace nexstar
