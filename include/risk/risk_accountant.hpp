#pragma once

#include <stdexcept>

#include "core/config.hpp"
#include "model/axis_state.hpp"

namespace neuro_guard::risk {

// Raised when accounting would lower the committed RoH score. Protocol error, never floored.
class RiskMonotonicityViolation : public std::runtime_error {
 public:
  RiskMonotonicityViolation(double before, double computed);

  [[nodiscard]] double before() const noexcept { return before_; }
  [[nodiscard]] double computed() const noexcept { return computed_; }

 private:
  double before_;
  double computed_;
};

// Axis-weighted mean of category weights (INFO 0, WARN warn_weight, RISK risk_weight),
// clamped to [0, global ceiling].
double weighted_risk(const model::severity_view& severities, const core::SessionConfig& config) noexcept;

// weighted_risk with the monotone check against the committed score.
double compute_risk(const model::severity_view& severities, const core::SessionConfig& config, double before);

}  // namespace neuro_guard::risk
