#pragma once

#include <string>
#include <vector>

#include "position.hpp"

namespace nexstar {

enum class ExportFormat {
    CSV,
    JSON,
};

/// "csv" or "json", case-insensitive. Throws InvalidParameterError.
ExportFormat parse_export_format(const std::string& name);

/// ISO 8601 UTC with milliseconds, e.g. "2024-10-14T12:30:00.250Z".
std::string format_timestamp(Clock::time_point time);

/// Header row plus one row per sample.
std::string history_to_csv(const std::vector<PositionSample>& samples);

/// {"export_time": ..., "count": N, "positions": [...]}
std::string history_to_json(const std::vector<PositionSample>& samples,
                            Clock::time_point export_time);

/// Serialize samples in the given format, stamped with the current time.
std::string serialize_history(const std::vector<PositionSample>& samples,
                              ExportFormat format);

/// Write content to path. Throws std::runtime_error if the file cannot be written.
void write_export_file(const std::string& path, const std::string& content);

} // namespace nexstar
