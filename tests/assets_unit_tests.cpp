#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>

#include "core/config.hpp"
#include "derived/asset_engine.hpp"

using neuro_guard::core::AxisConfig;
using neuro_guard::core::SessionConfig;
using neuro_guard::derived::AssetContext;
using neuro_guard::derived::derive;
using neuro_guard::model::asset;
using neuro_guard::model::asset_vector;
using neuro_guard::model::capability_tier;
using neuro_guard::model::channel;
using neuro_guard::model::severity;

namespace {

bool almost_equal(float a, float b, float epsilon = 1e-5F) {
  return std::fabs(a - b) <= epsilon;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool in_unit_range(const asset_vector& vector) {
  for (const float value : vector.values) {
    if (!(value >= 0.0F && value <= 1.0F)) {
      return false;
    }
  }
  return true;
}

SessionConfig base_config() {
  SessionConfig config{};
  AxisConfig heart{};
  heart.axis = channel::HEART_RATE;
  heart.min_warn = 50.0F;
  heart.max_warn = 100.0F;
  heart.min_safe = 40.0F;
  heart.max_safe = 130.0F;
  config.axes.push_back(heart);
  AxisConfig eda{};
  eda.axis = channel::EDA;
  eda.min_warn = 0.5F;
  eda.max_warn = 8.0F;
  eda.min_safe = 0.1F;
  eda.max_safe = 15.0F;
  config.axes.push_back(eda);

  config.assets.time_horizon_epochs = 100;
  config.assets.ranges[neuro_guard::model::channel_index(channel::HEART_RATE)] = {40.0F, 180.0F};
  config.assets.ranges[neuro_guard::model::channel_index(channel::HRV)] = {10.0F, 110.0F};
  return config;
}

AssetContext context_at(const std::uint64_t epoch, const double risk, const capability_tier tier, const double ceiling) {
  AssetContext context{};
  context.epoch_index = epoch;
  context.risk = risk;
  context.tier = tier;
  context.ceiling = ceiling;
  context.severities = {{channel::HEART_RATE, severity::INFO}, {channel::EDA, severity::INFO}};
  return context;
}

int test_assets_bounded_for_extreme_inputs() {
  const SessionConfig config = base_config();
  const float inf = std::numeric_limits<float>::infinity();
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const float extremes[] = {-1e30F, -inf, 0.0F, 1e30F, inf, nan};

  for (const float extreme : extremes) {
    auto snapshot = neuro_guard::model::empty_snapshot(3, 5.0F);
    for (const auto ch : neuro_guard::model::kAllChannels) {
      neuro_guard::model::set_channel(snapshot, ch, extreme);
    }
    const double risks[] = {-1.0, 0.0, 0.15, 5.0, std::numeric_limits<double>::quiet_NaN(),
                            std::numeric_limits<double>::infinity()};
    for (const double risk : risks) {
      const auto out = derive(snapshot, context_at(1'000'000, risk, capability_tier::GENERAL_USE, 0.25), config);
      if (!in_unit_range(out)) {
        return fail("test_assets_bounded_for_extreme_inputs", "asset escaped [0,1]");
      }
    }
    const auto zero_ceiling = derive(snapshot, context_at(0, 0.1, capability_tier::MODEL_ONLY, 0.0), config);
    if (!in_unit_range(zero_ceiling)) {
      return fail("test_assets_bounded_for_extreme_inputs", "zero ceiling must stay bounded");
    }
  }

  return 0;
}

int test_assets_neutral_for_missing_channels() {
  const SessionConfig config = base_config();
  const auto snapshot = neuro_guard::model::empty_snapshot(1, 5.0F);
  const auto out = derive(snapshot, context_at(1, 0.0, capability_tier::MODEL_ONLY, 0.30), config);

  if (!almost_equal(out.get(asset::BLOOD), 0.5F) || !almost_equal(out.get(asset::OXYGEN), 0.5F) ||
      !almost_equal(out.get(asset::WAVE), 0.5F) || !almost_equal(out.get(asset::NANO), 0.5F) ||
      !almost_equal(out.get(asset::BIOLOAD), 0.5F)) {
    return fail("test_assets_neutral_for_missing_channels", "missing channels must map to the neutral value");
  }
  return 0;
}

int test_assets_kernel_derived_values() {
  const SessionConfig config = base_config();
  auto snapshot = neuro_guard::model::empty_snapshot(50, 5.0F);
  neuro_guard::model::set_channel(snapshot, channel::HEART_RATE, 110.0F);
  neuro_guard::model::set_channel(snapshot, channel::HRV, 60.0F);

  const auto out = derive(snapshot, context_at(50, 0.15, capability_tier::CONTROLLED_HUMAN, 0.30), config);

  if (!almost_equal(out.get(asset::DECAY), 0.5F) || !almost_equal(out.get(asset::LIFEFORCE), 0.5F)) {
    return fail("test_assets_kernel_derived_values", "DECAY should be risk over ceiling");
  }
  if (!almost_equal(out.get(asset::BRAIN), 2.0F / 3.0F)) {
    return fail("test_assets_kernel_derived_values", "BRAIN should be the tier ordinal over three");
  }
  if (!almost_equal(out.get(asset::TIME), 0.5F)) {
    return fail("test_assets_kernel_derived_values", "TIME should be epoch over horizon");
  }
  if (!almost_equal(out.get(asset::BLOOD), 0.5F) || !almost_equal(out.get(asset::OXYGEN), 0.5F)) {
    return fail("test_assets_kernel_derived_values", "normalized heart rate and hrv mismatch");
  }
  if (out.epoch_index != 50) {
    return fail("test_assets_kernel_derived_values", "epoch index must be carried through");
  }

  const auto zero_ceiling = derive(snapshot, context_at(50, 0.15, capability_tier::MODEL_ONLY, 0.0), config);
  if (!almost_equal(zero_ceiling.get(asset::DECAY), 0.0F) || !almost_equal(zero_ceiling.get(asset::LIFEFORCE), 1.0F)) {
    return fail("test_assets_kernel_derived_values", "zero ceiling should yield DECAY 0");
  }

  return 0;
}

int test_assets_envelope_load_direction() {
  const SessionConfig config = base_config();
  const auto snapshot = neuro_guard::model::empty_snapshot(1, 5.0F);

  AssetContext calm = context_at(1, 0.0, capability_tier::LAB_BENCH, 0.30);
  AssetContext warn = calm;
  warn.severities = {{channel::HEART_RATE, severity::WARN}, {channel::EDA, severity::WARN}};
  AssetContext risk = calm;
  risk.severities = {{channel::HEART_RATE, severity::RISK}, {channel::EDA, severity::RISK}};

  const auto calm_out = derive(snapshot, calm, config);
  const auto warn_out = derive(snapshot, warn, config);
  const auto risk_out = derive(snapshot, risk, config);

  if (!(calm_out.get(asset::POWER) < warn_out.get(asset::POWER) && warn_out.get(asset::POWER) < risk_out.get(asset::POWER))) {
    return fail("test_assets_envelope_load_direction", "POWER must rise with axis severity");
  }
  if (!(calm_out.get(asset::FEAR) < warn_out.get(asset::FEAR) && warn_out.get(asset::FEAR) < risk_out.get(asset::FEAR))) {
    return fail("test_assets_envelope_load_direction", "FEAR must rise with EDA and heart-rate severity");
  }
  if (!almost_equal(calm_out.get(asset::POWER), 0.0F) || !almost_equal(risk_out.get(asset::FEAR), 1.0F)) {
    return fail("test_assets_envelope_load_direction", "POWER/FEAR endpoints mismatch");
  }

  AssetContext unmonitored = calm;
  unmonitored.severities.clear();
  if (!almost_equal(derive(snapshot, unmonitored, config).get(asset::POWER), 0.5F)) {
    return fail("test_assets_envelope_load_direction", "no monitored axes should leave POWER neutral");
  }

  return 0;
}

int test_assets_deterministic() {
  const SessionConfig config = base_config();
  auto snapshot = neuro_guard::model::empty_snapshot(9, 5.0F);
  neuro_guard::model::set_channel(snapshot, channel::HEART_RATE, 92.0F);
  neuro_guard::model::set_channel(snapshot, channel::GAMMA_POWER, 0.4F);
  const AssetContext context = context_at(9, 0.075, capability_tier::LAB_BENCH, 0.30);

  const auto first = derive(snapshot, context, config);
  for (int i = 0; i < 8; ++i) {
    const auto again = derive(snapshot, context, config);
    if (std::memcmp(first.values.data(), again.values.data(), sizeof(float) * first.values.size()) != 0) {
      return fail("test_assets_deterministic", "identical inputs must produce identical assets");
    }
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_assets_bounded_for_extreme_inputs(); rc != 0) {
    return rc;
  }
  if (int rc = test_assets_neutral_for_missing_channels(); rc != 0) {
    return rc;
  }
  if (int rc = test_assets_kernel_derived_values(); rc != 0) {
    return rc;
  }
  if (int rc = test_assets_envelope_load_direction(); rc != 0) {
    return rc;
  }
  if (int rc = test_assets_deterministic(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] assets unit tests\n";
  return 0;
}
