#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace neuro_guard::model {

enum class asset : std::uint8_t {
    BLOOD = 0,
    OXYGEN = 1,
    WAVE = 2,
    TIME = 3,
    DECAY = 4,
    LIFEFORCE = 5,
    BRAIN = 6,
    SMART = 7,
    EVOLVE = 8,
    POWER = 9,
    TECH = 10,
    FEAR = 11,
    PAIN = 12,
    NANO = 13,
    BIOLOAD = 14,
};

inline constexpr std::size_t kAssetCount = 15;

inline constexpr std::array<asset, kAssetCount> kAllAssets = {
    asset::BLOOD, asset::OXYGEN, asset::WAVE,  asset::TIME, asset::DECAY,
    asset::LIFEFORCE, asset::BRAIN, asset::SMART, asset::EVOLVE, asset::POWER,
    asset::TECH,  asset::FEAR,   asset::PAIN,  asset::NANO, asset::BIOLOAD,
};

// Diagnostic scalars in [0,1]. Advisory only: nothing in the decision path reads this.
struct asset_vector {
    std::uint64_t epoch_index;
    std::array<float, kAssetCount> values;

    [[nodiscard]] float get(const asset a) const noexcept { return values[static_cast<std::size_t>(a)]; }
    void set(const asset a, const float value) noexcept { values[static_cast<std::size_t>(a)] = value; }
};

static_assert(std::is_trivial_v<asset_vector>, "asset_vector must be trivial");

inline constexpr const char* asset_name(const asset a) noexcept {
    switch (a) {
        case asset::BLOOD:
            return "BLOOD";
        case asset::OXYGEN:
            return "OXYGEN";
        case asset::WAVE:
            return "WAVE";
        case asset::TIME:
            return "TIME";
        case asset::DECAY:
            return "DECAY";
        case asset::LIFEFORCE:
            return "LIFEFORCE";
        case asset::BRAIN:
            return "BRAIN";
        case asset::SMART:
            return "SMART";
        case asset::EVOLVE:
            return "EVOLVE";
        case asset::POWER:
            return "POWER";
        case asset::TECH:
            return "TECH";
        case asset::FEAR:
            return "FEAR";
        case asset::PAIN:
            return "PAIN";
        case asset::NANO:
            return "NANO";
        case asset::BIOLOAD:
            return "BIOLOAD";
    }
    return "UNKNOWN";
}

} // namespace neuro_guard::model
