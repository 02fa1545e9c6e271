#pragma once

#include <array>

#include "core/config.hpp"
#include "model/axis_state.hpp"
#include "model/signal_snapshot.hpp"

namespace neuro_guard::risk {

model::axis_state initial_axis_state() noexcept;

// Pure per-axis step: prior state + one epoch value -> next state.
// A NaN value (channel not reported) returns the prior state unchanged.
model::axis_state evaluate_axis(const core::AxisConfig& axis, const core::HysteresisConfig& hysteresis,
                                const model::axis_state& prior, float value, float dt_s) noexcept;

class HysteresisEvaluator {
 public:
  HysteresisEvaluator() noexcept;

  void sample(const core::SessionConfig& config, const model::signal_snapshot& snapshot) noexcept;

  [[nodiscard]] const model::axis_state& state(model::channel axis) const noexcept;
  [[nodiscard]] model::severity_view severities(const core::SessionConfig& config) const;

 private:
  std::array<model::axis_state, model::kChannelCount> states_{};
};

}  // namespace neuro_guard::risk
