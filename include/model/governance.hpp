#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace neuro_guard::model {

// Ordered access lattice: MODEL_ONLY < LAB_BENCH < CONTROLLED_HUMAN < GENERAL_USE.
enum class capability_tier : std::uint8_t {
    MODEL_ONLY = 0,
    LAB_BENCH = 1,
    CONTROLLED_HUMAN = 2,
    GENERAL_USE = 3,
};

inline constexpr std::size_t kTierCount = 4;

inline constexpr std::array<capability_tier, kTierCount> kAllTiers = {
    capability_tier::MODEL_ONLY,
    capability_tier::LAB_BENCH,
    capability_tier::CONTROLLED_HUMAN,
    capability_tier::GENERAL_USE,
};

enum class consent_level : std::uint8_t {
    NONE = 0,
    MINIMAL = 1,
    EXTENDED = 2,
    REVOKED = 3,
};

enum class role : std::uint8_t {
    HOST = 0,
    OWNER = 1,
    OPERATOR = 2,
    REGULATOR = 3,
    KERNEL = 4,
};

// Supplied by the consent registry; the kernel only reads it.
struct consent_state {
    std::string token;
    consent_level level{consent_level::NONE};
    std::uint64_t valid_from_ms{0};
    std::uint64_t valid_until_ms{0};
    std::vector<capability_tier> scope;
};

// Evidence bundle that accompanies a downgrade request.
struct reversal_evidence {
    bool explicit_order{false};
    bool no_safer_alternative_proof{false};
    std::vector<role> signers;
};

inline constexpr std::size_t tier_index(const capability_tier tier) noexcept {
    return static_cast<std::size_t>(tier);
}

inline constexpr int tier_distance(const capability_tier from, const capability_tier to) noexcept {
    return static_cast<int>(to) - static_cast<int>(from);
}

inline constexpr const char* tier_name(const capability_tier tier) noexcept {
    switch (tier) {
        case capability_tier::MODEL_ONLY:
            return "MODEL_ONLY";
        case capability_tier::LAB_BENCH:
            return "LAB_BENCH";
        case capability_tier::CONTROLLED_HUMAN:
            return "CONTROLLED_HUMAN";
        case capability_tier::GENERAL_USE:
            return "GENERAL_USE";
    }
    return "UNKNOWN";
}

inline constexpr const char* consent_level_name(const consent_level level) noexcept {
    switch (level) {
        case consent_level::NONE:
            return "NONE";
        case consent_level::MINIMAL:
            return "MINIMAL";
        case consent_level::EXTENDED:
            return "EXTENDED";
        case consent_level::REVOKED:
            return "REVOKED";
    }
    return "UNKNOWN";
}

inline constexpr const char* role_name(const role r) noexcept {
    switch (r) {
        case role::HOST:
            return "HOST";
        case role::OWNER:
            return "OWNER";
        case role::OPERATOR:
            return "OPERATOR";
        case role::REGULATOR:
            return "REGULATOR";
        case role::KERNEL:
            return "KERNEL";
    }
    return "UNKNOWN";
}

namespace detail {

inline std::string upper(const std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(c >= 'a' && c <= 'z' ? c - 'a' + 'A' : c);
    });
    return out;
}

}  // namespace detail

// Parsers accept either case ("lab_bench" in config files, "LAB_BENCH" in logs).
inline std::optional<capability_tier> parse_tier(const std::string_view name) {
    const std::string key = detail::upper(name);
    for (const auto tier : kAllTiers) {
        if (key == tier_name(tier)) {
            return tier;
        }
    }
    return std::nullopt;
}

inline std::optional<consent_level> parse_consent_level(const std::string_view name) {
    const std::string key = detail::upper(name);
    for (const auto level : {consent_level::NONE, consent_level::MINIMAL, consent_level::EXTENDED,
                             consent_level::REVOKED}) {
        if (key == consent_level_name(level)) {
            return level;
        }
    }
    return std::nullopt;
}

inline std::optional<role> parse_role(const std::string_view name) {
    const std::string key = detail::upper(name);
    for (const auto r : {role::HOST, role::OWNER, role::OPERATOR, role::REGULATOR, role::KERNEL}) {
        if (key == role_name(r)) {
            return r;
        }
    }
    return std::nullopt;
}

} // namespace neuro_guard::model
