#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace lumi {

/// Wall-clock time at millisecond resolution, the precision written to disk.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

Timestamp now_ms();

/// "2026-01-31T12:00:00.250Z"
std::string format_iso8601(Timestamp ts);

/// Accepts the form above, with or without fractional seconds.
std::optional<Timestamp> parse_iso8601(const std::string& text);

/// Read an "updatedAt" value: an ISO-8601 string, or a number of seconds
/// since 2001-01-01T00:00:00Z as written by the original desktop app.
std::optional<Timestamp> parse_timestamp(const nlohmann::json& value);

} // namespace lumi
