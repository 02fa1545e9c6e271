#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "model/asset_vector.hpp"
#include "model/axis_state.hpp"

namespace neuro_guard::model {

// Closed tag vocabulary. Adding a tag means bumping kTagSchemaVersion.
enum class nature_tag : std::uint8_t {
    ROW_HIGH = 0,
    ROW_RECOVERY = 1,
    GAMMA_OVERLOAD = 2,
    COGNITIVE_OVERLOAD = 3,
    CALM_STABLE = 4,
    RECOVERY = 5,
    OVERLOADED = 6,
};

inline constexpr std::uint32_t kTagSchemaVersion = 1;

enum class row_state : std::uint8_t {
    DEFINED = 0,
    INACTIVE = 1,      // high-activation predicate not met
    GUARD_FAILED = 2,  // concurrent risk transition not monotone or above ceiling
    NO_HISTORY = 3,
};

// Advisory record attached to a ledger entry by proposal id and epoch.
// Not convertible to any kernel input.
struct diagnostic_annotation {
    std::string proposal_id;
    std::uint64_t epoch_index{0};
    asset_vector assets{};
    severity_view envelope_states;
    std::optional<double> row;
    row_state row_status{row_state::NO_HISTORY};
    severity gamma_wave_state{severity::INFO};
    std::vector<nature_tag> tags;
    std::uint32_t tag_schema_version{kTagSchemaVersion};
};

inline constexpr const char* nature_tag_name(const nature_tag tag) noexcept {
    switch (tag) {
        case nature_tag::ROW_HIGH:
            return "ROW_HIGH";
        case nature_tag::ROW_RECOVERY:
            return "ROW_RECOVERY";
        case nature_tag::GAMMA_OVERLOAD:
            return "GAMMA_OVERLOAD";
        case nature_tag::COGNITIVE_OVERLOAD:
            return "COGNITIVE_OVERLOAD";
        case nature_tag::CALM_STABLE:
            return "CALM_STABLE";
        case nature_tag::RECOVERY:
            return "RECOVERY";
        case nature_tag::OVERLOADED:
            return "OVERLOADED";
    }
    return "UNKNOWN";
}

inline constexpr const char* row_state_name(const row_state state) noexcept {
    switch (state) {
        case row_state::DEFINED:
            return "DEFINED";
        case row_state::INACTIVE:
            return "INACTIVE";
        case row_state::GUARD_FAILED:
            return "GUARD_FAILED";
        case row_state::NO_HISTORY:
            return "NO_HISTORY";
    }
    return "UNKNOWN";
}

inline bool has_tag(const diagnostic_annotation& annotation, const nature_tag tag) noexcept {
    for (const auto candidate : annotation.tags) {
        if (candidate == tag) {
            return true;
        }
    }
    return false;
}

} // namespace neuro_guard::model
