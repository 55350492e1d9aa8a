#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "core/types.hpp"

namespace kuberde {

// RFC3339 in UTC with second precision, e.g. "2025-03-01T10:00:00Z"
std::string format_rfc3339(const Timestamp& ts);

// Accepts "Z" or "+hh:mm"/"-hh:mm" offsets and optional fractional seconds
std::optional<Timestamp> parse_rfc3339(const std::string& str);

// Go-style duration strings: "90s", "1h30m", "500ms", "0". Negative durations are rejected.
std::optional<std::chrono::milliseconds> parse_duration(const std::string& str);

std::string format_duration(std::chrono::milliseconds d);

int64_t to_unix_seconds(const Timestamp& ts);

Timestamp from_unix_seconds(int64_t epoch);

}  // namespace kuberde
