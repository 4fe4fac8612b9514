#pragma once
#include "prism/config.hpp"

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace prism::timeutil {

// Minutes east of UTC (e.g., +180 = +0300). Uses the local timezone at `t`.
auto local_utc_offset_minutes(std::time_t time) -> int;

// Format ±HHMM from minutes (e.g., +180 -> "+0300", -420 -> "-0700")
auto tz_offset_string(int minutes) -> std::string;

// Build "Name <email> 1714412345 +0300"
auto make_signature(const Identity& identity, std::time_t when, int tz_minutes) -> std::string;

struct ParsedSignature {
  std::string name;
  std::optional<std::string> email;   // absent when no "<...>" part
  std::optional<std::int64_t> when;   // seconds since epoch
};

// Inverse of make_signature; tolerant of a missing email or timestamp.
auto parse_signature(std::string_view line) -> ParsedSignature;

} // namespace prism::timeutil
