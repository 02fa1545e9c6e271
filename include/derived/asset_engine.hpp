#pragma once

#include <cstdint>

#include "core/config.hpp"
#include "model/asset_vector.hpp"
#include "model/axis_state.hpp"
#include "model/governance.hpp"
#include "model/signal_snapshot.hpp"

namespace neuro_guard::derived {

// Published kernel values the engine may read. Copied in, never referenced back.
struct AssetContext {
  double risk{0.0};
  model::capability_tier tier{model::capability_tier::MODEL_ONLY};
  double ceiling{0.0};
  std::uint64_t epoch_index{0};
  model::severity_view severities{};
};

// Load contributed by one axis: INFO 0, WARN warn_load, RISK risk_load, unmonitored neutral.
float severity_load(const model::severity_view& severities, model::channel axis, const core::AssetConfig& assets) noexcept;

// Pure and stateless. Every field lands in [0,1] whatever the inputs.
model::asset_vector derive(const model::signal_snapshot& snapshot, const AssetContext& context,
                           const core::SessionConfig& config) noexcept;

}  // namespace neuro_guard::derived
