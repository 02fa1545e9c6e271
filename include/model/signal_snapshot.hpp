#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <type_traits>

namespace neuro_guard::model {

enum class channel : std::uint8_t {
    ALPHA_POWER = 0,
    BETA_POWER = 1,
    GAMMA_POWER = 2,
    THETA_POWER = 3,
    ALPHA_CVE = 4,
    HEART_RATE = 5,
    HRV = 6,
    EDA = 7,
    MOTION = 8,
    RESPIRATION = 9,
    GAZE = 10,
};

inline constexpr std::size_t kChannelCount = 11;

inline constexpr std::array<channel, kChannelCount> kAllChannels = {
    channel::ALPHA_POWER, channel::BETA_POWER, channel::GAMMA_POWER, channel::THETA_POWER,
    channel::ALPHA_CVE,   channel::HEART_RATE, channel::HRV,         channel::EDA,
    channel::MOTION,      channel::RESPIRATION, channel::GAZE,
};

// Per-epoch record handed over by the acquisition collaborator.
// POD layout: epoch header + one float per channel, NaN = not reported.
struct signal_snapshot {
    std::uint64_t epoch_index;
    float epoch_duration_s;
    std::array<float, kChannelCount> channels;
};

static_assert(std::is_standard_layout_v<signal_snapshot>, "signal_snapshot must be standard layout");
static_assert(std::is_trivial_v<signal_snapshot>, "signal_snapshot must be trivial");

inline constexpr std::size_t channel_index(const channel ch) noexcept {
    return static_cast<std::size_t>(ch);
}

inline float channel_value(const signal_snapshot& snapshot, const channel ch) noexcept {
    return snapshot.channels[channel_index(ch)];
}

inline void set_channel(signal_snapshot& snapshot, const channel ch, const float value) noexcept {
    snapshot.channels[channel_index(ch)] = value;
}

inline signal_snapshot empty_snapshot(const std::uint64_t epoch_index, const float epoch_duration_s) noexcept {
    signal_snapshot snapshot{};
    snapshot.epoch_index = epoch_index;
    snapshot.epoch_duration_s = epoch_duration_s;
    snapshot.channels.fill(std::numeric_limits<float>::quiet_NaN());
    return snapshot;
}

inline constexpr const char* channel_name(const channel ch) noexcept {
    switch (ch) {
        case channel::ALPHA_POWER:
            return "alpha_power";
        case channel::BETA_POWER:
            return "beta_power";
        case channel::GAMMA_POWER:
            return "gamma_power";
        case channel::THETA_POWER:
            return "theta_power";
        case channel::ALPHA_CVE:
            return "alpha_cve";
        case channel::HEART_RATE:
            return "heart_rate";
        case channel::HRV:
            return "hrv";
        case channel::EDA:
            return "eda";
        case channel::MOTION:
            return "motion";
        case channel::RESPIRATION:
            return "respiration";
        case channel::GAZE:
            return "gaze";
    }
    return "unknown";
}

inline std::optional<channel> parse_channel(const std::string_view name) noexcept {
    for (const auto ch : kAllChannels) {
        if (name == channel_name(ch)) {
            return ch;
        }
    }
    return std::nullopt;
}

} // namespace neuro_guard::model
