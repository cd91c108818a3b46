#pragma once

#include <stencil/result.hpp>
#include <chrono>
#include <string>

namespace stencil {

using Timestamp = std::chrono::system_clock::time_point;

// UTC, millisecond precision: 2026-10-17T08:30:00.125Z
std::string format_timestamp(Timestamp t);

// Accepts YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)
Result<Timestamp> parse_timestamp(const std::string& s);

} // namespace stencil
