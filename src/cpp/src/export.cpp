#include "nexstar/export.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "nexstar/errors.hpp"

namespace nexstar {

ExportFormat parse_export_format(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "csv") {
        return ExportFormat::CSV;
    }
    if (lower == "json") {
        return ExportFormat::JSON;
    }
    throw InvalidParameterError("Unknown format: " + name + ". Use 'csv' or 'json'");
}

std::string format_timestamp(Clock::time_point time) {
    auto since_epoch = time.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds);
    if (millis.count() < 0) {
        seconds -= std::chrono::seconds(1);
        millis += std::chrono::seconds(1);
    }

    std::time_t tt = static_cast<std::time_t>(seconds.count());
    std::tm tm{};
    ::gmtime_r(&tt, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << millis.count() << "Z";
    return out.str();
}

std::string history_to_csv(const std::vector<PositionSample>& samples) {
    std::ostringstream out;
    out << std::setprecision(10);
    out << "timestamp,ra_hours,dec_degrees,alt_degrees,az_degrees\n";
    for (const auto& s : samples) {
        out << format_timestamp(s.timestamp) << ","
            << s.ra_hours << ","
            << s.dec_degrees << ","
            << s.altitude << ","
            << s.azimuth << "\n";
    }
    return out.str();
}

std::string history_to_json(const std::vector<PositionSample>& samples,
                            Clock::time_point export_time) {
    std::ostringstream out;
    out << std::setprecision(10);
    out << "{\n";
    out << "  \"export_time\": \"" << format_timestamp(export_time) << "\",\n";
    out << "  \"count\": " << samples.size() << ",\n";
    out << "  \"positions\": [";
    bool first = true;
    for (const auto& s : samples) {
        out << (first ? "\n" : ",\n");
        first = false;
        out << "    {\n";
        out << "      \"timestamp\": \"" << format_timestamp(s.timestamp) << "\",\n";
        out << "      \"ra_hours\": " << s.ra_hours << ",\n";
        out << "      \"dec_degrees\": " << s.dec_degrees << ",\n";
        out << "      \"alt_degrees\": " << s.altitude << ",\n";
        out << "      \"az_degrees\": " << s.azimuth << "\n";
        out << "    }";
    }
    out << (samples.empty() ? "]\n" : "\n  ]\n");
    out << "}\n";
    return out.str();
}

std::string serialize_history(const std::vector<PositionSample>& samples,
                              ExportFormat format) {
    switch (format) {
        case ExportFormat::CSV:  return history_to_csv(samples);
        case ExportFormat::JSON: return history_to_json(samples, Clock::now());
    }
    return {};
}

void write_export_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write export file: " + path);
    }
    file << content;
    if (!file) {
        throw std::runtime_error("Failed writing export file: " + path);
    }
}

} // namespace nexstar
