#pragma once
#include <ctime>
#include <optional>
#include <string>

namespace TimeUtils {

// "2024-03-01T09:30:00Z" (UTC, one-second resolution)
std::string toIso8601(std::time_t t);

// Accepts the format produced by toIso8601; empty on any mismatch.
std::optional<std::time_t> fromIso8601(const std::string& text);

// Local time for display, e.g. "Mar 1, 2024 09:30"; withTime=false drops the clock part
std::string formatLocal(std::time_t t, bool withTime = true);

}
