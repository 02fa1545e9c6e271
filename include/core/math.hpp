#pragma once

#include <algorithm>
#include <cmath>

namespace neuro_guard::core {

inline constexpr float kNeutral = 0.5F;

inline constexpr float clamp01(const float value) noexcept {
  return std::clamp(value, 0.0F, 1.0F);
}

// clamp01 that also absorbs NaN (std::clamp passes NaN through).
inline float sanitize01(const float value, const float fallback = kNeutral) noexcept {
  if (std::isnan(value)) {
    return fallback;
  }
  return clamp01(value);
}

// Linear map of [lo, hi] onto [0, 1]. Missing input or a degenerate range yields the neutral value.
inline float normalize(const float value, const float lo, const float hi) noexcept {
  if (std::isnan(value) || !(hi > lo)) {
    return kNeutral;
  }
  return sanitize01((value - lo) / (hi - lo));
}

}  // namespace neuro_guard::core
