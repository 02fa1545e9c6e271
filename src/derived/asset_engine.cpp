#include "derived/asset_engine.hpp"

#include "core/math.hpp"

namespace neuro_guard::derived {

namespace {

using model::asset;
using model::channel;

float normalized(const model::signal_snapshot& snapshot, const channel ch, const core::AssetConfig& assets) noexcept {
  const auto& range = assets.ranges[model::channel_index(ch)];
  return core::normalize(model::channel_value(snapshot, ch), range.lo, range.hi);
}

float weighted2(const float a, const float wa, const float b, const float wb) noexcept {
  const float total = wa + wb;
  if (!(total > 0.0F)) {
    return core::kNeutral;
  }
  return ((a * wa) + (b * wb)) / total;
}

float level_load(const model::severity level, const core::AssetConfig& assets) noexcept {
  switch (level) {
    case model::severity::INFO:
      return 0.0F;
    case model::severity::WARN:
      return assets.warn_load;
    case model::severity::RISK:
      return assets.risk_load;
  }
  return 0.0F;
}

float wave(const model::signal_snapshot& snapshot, const core::AssetConfig& assets) noexcept {
  const float total = assets.wave_alpha_weight + assets.wave_beta_weight + assets.wave_gamma_weight + assets.wave_cve_weight;
  if (!(total > 0.0F)) {
    return core::kNeutral;
  }
  const float sum = (assets.wave_alpha_weight * normalized(snapshot, channel::ALPHA_POWER, assets)) +
                    (assets.wave_beta_weight * normalized(snapshot, channel::BETA_POWER, assets)) +
                    (assets.wave_gamma_weight * normalized(snapshot, channel::GAMMA_POWER, assets)) +
                    (assets.wave_cve_weight * normalized(snapshot, channel::ALPHA_CVE, assets));
  return sum / total;
}

// Axis-weighted share of monitored axes sitting in WARN or RISK.
float power(const AssetContext& context, const core::SessionConfig& config) noexcept {
  float weighted_sum = 0.0F;
  float weight_total = 0.0F;
  for (const auto& [axis, level] : context.severities) {
    const core::AxisConfig* axis_config = config.find_axis(axis);
    const float weight = axis_config != nullptr ? axis_config->weight : 1.0F;
    weighted_sum += weight * level_load(level, config.assets);
    weight_total += weight;
  }
  if (!(weight_total > 0.0F)) {
    return core::kNeutral;
  }
  return weighted_sum / weight_total;
}

}  // namespace

float severity_load(const model::severity_view& severities, const channel axis, const core::AssetConfig& assets) noexcept {
  const auto level = model::find_severity(severities, axis);
  if (!level.has_value()) {
    return core::kNeutral;
  }
  return level_load(*level, assets);
}

model::asset_vector derive(const model::signal_snapshot& snapshot, const AssetContext& context,
                           const core::SessionConfig& config) noexcept {
  const auto& assets = config.assets;

  model::asset_vector out{};
  out.epoch_index = context.epoch_index;

  const float decay = context.ceiling > 0.0 ? core::sanitize01(static_cast<float>(context.risk / context.ceiling)) : 0.0F;
  const float time = assets.time_horizon_epochs > 0
                         ? core::sanitize01(static_cast<float>(static_cast<double>(context.epoch_index) /
                                                               static_cast<double>(assets.time_horizon_epochs)))
                         : core::kNeutral;
  const float brain = core::sanitize01(static_cast<float>(model::tier_index(context.tier)) /
                                       static_cast<float>(model::kTierCount - 1));
  const float evolve = core::sanitize01((0.5F * brain) + (0.5F * time));
  const float power_value = core::sanitize01(power(context, config));
  const float fear = core::sanitize01(weighted2(severity_load(context.severities, channel::EDA, assets), assets.fear_eda_weight,
                                                severity_load(context.severities, channel::HEART_RATE, assets),
                                                assets.fear_heart_rate_weight));

  out.set(asset::BLOOD, core::sanitize01(1.0F - normalized(snapshot, channel::HEART_RATE, assets)));
  out.set(asset::OXYGEN, core::sanitize01(normalized(snapshot, channel::HRV, assets)));
  out.set(asset::WAVE, core::sanitize01(wave(snapshot, assets)));
  out.set(asset::TIME, time);
  out.set(asset::DECAY, decay);
  out.set(asset::LIFEFORCE, core::sanitize01(1.0F - decay));
  out.set(asset::BRAIN, brain);
  out.set(asset::EVOLVE, evolve);
  out.set(asset::SMART, core::sanitize01((0.5F * brain) + (0.5F * evolve)));
  out.set(asset::POWER, power_value);
  out.set(asset::TECH, core::sanitize01((0.5F * brain) + (0.5F * power_value)));
  out.set(asset::FEAR, fear);
  out.set(asset::PAIN, core::sanitize01(weighted2(fear, assets.pain_fear_weight,
                                                  severity_load(context.severities, channel::MOTION, assets),
                                                  assets.pain_motion_weight)));
  out.set(asset::NANO, core::sanitize01(normalized(snapshot, channel::RESPIRATION, assets)));
  out.set(asset::BIOLOAD, core::sanitize01((0.5F * normalized(snapshot, channel::MOTION, assets)) +
                                           (0.5F * normalized(snapshot, channel::GAZE, assets))));
  return out;
}

}  // namespace neuro_guard::derived
