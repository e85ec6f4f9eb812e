#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace hostlink::core::time {

std::int64_t now_unix_ms();

// "2024-01-15T10:00:00.000Z"
std::string format_iso8601(std::chrono::system_clock::time_point time);

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an
// optional "Z" or "+HH:MM"/"-HH:MM" suffix (no suffix means UTC).
std::optional<std::chrono::system_clock::time_point> parse_iso8601(
    const std::string& text);

}  // namespace hostlink::core::time
