#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "model/signal_snapshot.hpp"

namespace neuro_guard::model {

enum class severity : std::uint8_t {
    INFO = 0,
    WARN = 1,
    RISK = 2,
};

// Hysteresis bookkeeping for one monitored axis.
// Mutated only by risk::HysteresisEvaluator; lives for the whole session.
struct axis_state {
    severity level;
    std::uint32_t consecutive_above_count;  // epochs outside the warn band
    std::uint32_t consecutive_below_count;  // epochs back inside the warn band
    std::uint32_t consecutive_outside_safe_count;
    std::uint32_t consecutive_inside_safe_count;
    float last_value;
    bool has_last_value;
};

static_assert(std::is_trivial_v<axis_state>, "axis_state must be trivial");

// Read-only (axis, severity) pairs published to risk accounting and diagnostics.
using severity_view = std::vector<std::pair<channel, severity>>;

inline constexpr const char* severity_name(const severity level) noexcept {
    switch (level) {
        case severity::INFO:
            return "INFO";
        case severity::WARN:
            return "WARN";
        case severity::RISK:
            return "RISK";
    }
    return "UNKNOWN";
}

inline std::optional<severity> parse_severity(const std::string_view name) noexcept {
    if (name == "INFO") {
        return severity::INFO;
    }
    if (name == "WARN") {
        return severity::WARN;
    }
    if (name == "RISK") {
        return severity::RISK;
    }
    return std::nullopt;
}

inline constexpr severity max_severity(const severity a, const severity b) noexcept {
    return static_cast<std::uint8_t>(a) >= static_cast<std::uint8_t>(b) ? a : b;
}

inline std::optional<severity> find_severity(const severity_view& view, const channel ch) noexcept {
    for (const auto& [axis, level] : view) {
        if (axis == ch) {
            return level;
        }
    }
    return std::nullopt;
}

} // namespace neuro_guard::model
