#include "risk/risk_accountant.hpp"

#include <algorithm>
#include <sstream>
#include <string>

namespace neuro_guard::risk {

namespace {

std::string violation_message(const double before, const double computed) {
  std::ostringstream message;
  message << "RoH monotonicity violation: computed " << computed << " below committed " << before;
  return message.str();
}

double category_weight(const model::severity level, const core::RiskWeights& weights) noexcept {
  switch (level) {
    case model::severity::INFO:
      return 0.0;
    case model::severity::WARN:
      return weights.warn_weight;
    case model::severity::RISK:
      return weights.risk_weight;
  }
  return 0.0;
}

}  // namespace

RiskMonotonicityViolation::RiskMonotonicityViolation(const double before, const double computed)
    : std::runtime_error(violation_message(before, computed)), before_(before), computed_(computed) {}

double weighted_risk(const model::severity_view& severities, const core::SessionConfig& config) noexcept {
  double weighted_sum = 0.0;
  double weight_total = 0.0;
  for (const auto& [axis, level] : severities) {
    const core::AxisConfig* axis_config = config.find_axis(axis);
    const double weight = axis_config != nullptr ? axis_config->weight : 1.0;
    weighted_sum += weight * category_weight(level, config.risk);
    weight_total += weight;
  }

  if (weight_total <= 0.0) {
    return 0.0;
  }
  return std::clamp(weighted_sum / weight_total, 0.0, config.policy.global_ceiling());
}

double compute_risk(const model::severity_view& severities, const core::SessionConfig& config, const double before) {
  const double after = weighted_risk(severities, config);
  if (after < before) {
    throw RiskMonotonicityViolation(before, after);
  }
  return after;
}

}  // namespace neuro_guard::risk
