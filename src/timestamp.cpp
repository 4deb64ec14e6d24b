#include "timestamp.hpp"
#include <cmath>
#include <cstdio>
#include <sstream>
#include <vector>

namespace v2n {

namespace {

struct ClockParts {
    long long hours;
    long long minutes;
    long long seconds;
};

ClockParts split_seconds(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        seconds = 0.0;
    }
    long long total = static_cast<long long>(std::floor(seconds));
    return {total / 3600, (total % 3600) / 60, total % 60};
}

bool all_digits(const std::string& text) {
    if (text.empty()) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

} // namespace

std::string format_timestamp(double seconds) {
    auto parts = split_seconds(seconds);
    char buffer[32];
    if (parts.hours > 0) {
        std::snprintf(buffer, sizeof(buffer), "%lld:%02lld:%02lld", parts.hours, parts.minutes, parts.seconds);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%lld:%02lld", parts.minutes, parts.seconds);
    }
    return buffer;
}

std::string format_clock(double seconds) {
    auto parts = split_seconds(seconds);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld", parts.hours, parts.minutes, parts.seconds);
    return buffer;
}

std::optional<double> parse_timestamp(const std::string& text) {
    std::string trimmed = text;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
    trimmed.erase(trimmed.find_last_not_of(" \t\r\n") + 1);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    // Fraction belongs to the last field only
    std::string fraction;
    auto frac_pos = trimmed.find_first_of(".,");
    if (frac_pos != std::string::npos) {
        fraction = trimmed.substr(frac_pos + 1);
        trimmed = trimmed.substr(0, frac_pos);
        if (!all_digits(fraction)) {
            return std::nullopt;
        }
    }

    std::vector<std::string> fields;
    std::stringstream stream(trimmed);
    std::string field;
    while (std::getline(stream, field, ':')) {
        fields.push_back(field);
    }
    if (!trimmed.empty() && trimmed.back() == ':') {
        return std::nullopt;
    }
    if (fields.empty() || fields.size() > 3) {
        return std::nullopt;
    }

    double total = 0.0;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (!all_digits(fields[i]) || fields[i].size() > 6) {
            return std::nullopt;
        }
        long long value = std::stoll(fields[i]);
        // Minutes and seconds fields stay below 60 when a larger unit precedes them
        if (i > 0 && value >= 60) {
            return std::nullopt;
        }
        total = total * 60.0 + static_cast<double>(value);
    }

    if (!fraction.empty()) {
        total += std::stod("0." + fraction);
    }
    return total;
}

} // namespace v2n
