#pragma once

#include <optional>
#include <string>

namespace v2n {

// Compact note timestamp: "M:SS", or "H:MM:SS" once hours are non-zero
std::string format_timestamp(double seconds);

// Fixed "HH:MM:SS" form used in prompts
std::string format_clock(double seconds);

// Accepts "HH:MM:SS", "MM:SS" or "SS", each with an optional ".mmm" or ",mmm" fraction
std::optional<double> parse_timestamp(const std::string& text);

} // namespace v2n
