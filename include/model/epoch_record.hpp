#pragma once

#include <array>
#include <cstdint>
#include <type_traits>

#include "model/asset_vector.hpp"
#include "model/axis_state.hpp"
#include "model/governance.hpp"
#include "model/signal_snapshot.hpp"

namespace neuro_guard::model {

// Flat per-epoch summary handed to telemetry sinks after the kernel has committed.
struct epoch_record {
    std::uint64_t epoch_index;
    std::uint64_t timestamp_ms;
    double risk;
    capability_tier tier;
    bool accepted;
    std::array<severity, kChannelCount> severities;
    std::array<bool, kChannelCount> monitored;
    asset_vector assets;
};

static_assert(std::is_trivial_v<epoch_record>, "epoch_record must be trivial");
static_assert(std::is_standard_layout_v<epoch_record>, "epoch_record must be standard layout");

} // namespace neuro_guard::model
