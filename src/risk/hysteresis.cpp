#include "risk/hysteresis.hpp"

#include <cmath>

namespace neuro_guard::risk {

namespace {

float effective_dt(const core::SessionConfig& config, const model::signal_snapshot& snapshot) noexcept {
  if (std::isfinite(snapshot.epoch_duration_s) && snapshot.epoch_duration_s > 0.0F) {
    return snapshot.epoch_duration_s;
  }
  return config.session.default_epoch_duration_s;
}

}  // namespace

model::axis_state initial_axis_state() noexcept {
  model::axis_state state{};
  state.level = model::severity::INFO;
  state.last_value = 0.0F;
  state.has_last_value = false;
  return state;
}

model::axis_state evaluate_axis(const core::AxisConfig& axis, const core::HysteresisConfig& hysteresis,
                                const model::axis_state& prior, const float value, const float dt_s) noexcept {
  if (std::isnan(value)) {
    return prior;
  }

  const bool outside_warn = value < axis.min_warn || value > axis.max_warn;
  const bool outside_safe = value < axis.min_safe || value > axis.max_safe;
  const bool fast_transient = prior.has_last_value && dt_s > 0.0F &&
                              (std::fabs(value - prior.last_value) / dt_s) > axis.max_delta_per_sec;

  model::axis_state next = prior;
  next.consecutive_above_count = outside_warn ? prior.consecutive_above_count + 1 : 0;
  next.consecutive_below_count = outside_warn ? 0 : prior.consecutive_below_count + 1;
  next.consecutive_outside_safe_count = outside_safe ? prior.consecutive_outside_safe_count + 1 : 0;
  next.consecutive_inside_safe_count = outside_safe ? 0 : prior.consecutive_inside_safe_count + 1;
  next.last_value = value;
  next.has_last_value = true;

  const auto warn_epochs = hysteresis.warn_epochs_to_flag;
  const auto risk_epochs = hysteresis.risk_epochs_to_downgrade;

  switch (prior.level) {
    case model::severity::INFO:
      if (next.consecutive_outside_safe_count >= risk_epochs) {
        next.level = model::severity::RISK;
      } else if (next.consecutive_above_count >= warn_epochs || fast_transient) {
        next.level = model::severity::WARN;
      }
      break;

    case model::severity::WARN:
      if (next.consecutive_outside_safe_count >= risk_epochs) {
        next.level = model::severity::RISK;
      } else if (next.consecutive_below_count >= warn_epochs) {
        next.level = model::severity::INFO;
      }
      break;

    case model::severity::RISK:
      if (next.consecutive_inside_safe_count >= risk_epochs) {
        next.level = next.consecutive_below_count >= warn_epochs ? model::severity::INFO : model::severity::WARN;
      }
      break;
  }

  // De-escalation streaks count only epochs after the latest escalation.
  if (next.level > prior.level) {
    next.consecutive_below_count = 0;
    if (next.level == model::severity::RISK) {
      next.consecutive_inside_safe_count = 0;
    }
  }

  return next;
}

HysteresisEvaluator::HysteresisEvaluator() noexcept {
  states_.fill(initial_axis_state());
}

void HysteresisEvaluator::sample(const core::SessionConfig& config, const model::signal_snapshot& snapshot) noexcept {
  const float dt_s = effective_dt(config, snapshot);
  for (const auto& axis : config.axes) {
    auto& state = states_[model::channel_index(axis.axis)];
    state = evaluate_axis(axis, config.hysteresis, state, model::channel_value(snapshot, axis.axis), dt_s);
  }
}

const model::axis_state& HysteresisEvaluator::state(const model::channel axis) const noexcept {
  return states_[model::channel_index(axis)];
}

model::severity_view HysteresisEvaluator::severities(const core::SessionConfig& config) const {
  model::severity_view view;
  view.reserve(config.axes.size());
  for (const auto& axis : config.axes) {
    view.emplace_back(axis.axis, states_[model::channel_index(axis.axis)].level);
  }
  return view;
}

}  // namespace neuro_guard::risk
