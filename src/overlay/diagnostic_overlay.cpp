#include "overlay/diagnostic_overlay.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace neuro_guard::overlay {

namespace {

using model::asset;
using model::nature_tag;

float mean_of(const std::deque<float>& values) noexcept {
  if (values.empty()) {
    return 0.0F;
  }
  float sum = 0.0F;
  for (const float value : values) {
    sum += value;
  }
  return sum / static_cast<float>(values.size());
}

void require_finite_assets(const model::asset_vector& assets) {
  for (const auto a : model::kAllAssets) {
    const float value = assets.get(a);
    if (!std::isfinite(value) || value < 0.0F || value > 1.0F) {
      throw DiagnosticComputationError(std::string("asset ") + model::asset_name(a) + " outside [0,1]");
    }
  }
}

}  // namespace

bool row_guard_holds(const ledger::LedgerEntry& entry, const double tier_ceiling) noexcept {
  return entry.risk_after >= entry.risk_before && entry.risk_after <= tier_ceiling;
}

std::optional<double> compute_row(const double decay_prev, const double decay_cur, const double dt_s,
                                  const bool guard_ok) noexcept {
  if (!guard_ok || !(dt_s > 0.0) || !std::isfinite(decay_prev) || !std::isfinite(decay_cur)) {
    return std::nullopt;
  }
  return (decay_cur - decay_prev) / dt_s;
}

model::severity gamma_wave_state(const model::asset_vector& assets, const model::severity_view& severities,
                                 const core::OverlayConfig& config) noexcept {
  const float wave = assets.get(asset::WAVE);
  model::severity level = model::severity::INFO;
  if (wave >= config.wave_risk_threshold) {
    level = model::severity::RISK;
  } else if (wave >= config.wave_threshold) {
    level = model::severity::WARN;
  }

  const auto gamma_axis = model::find_severity(severities, model::channel::GAMMA_POWER);
  return gamma_axis.has_value() ? model::max_severity(level, *gamma_axis) : level;
}

DiagnosticOverlay::DiagnosticOverlay(core::OverlayConfig config) : config_(std::move(config)) {
  if (config_.window_epochs == 0) {
    config_.window_epochs = 1;
  }
}

model::diagnostic_annotation DiagnosticOverlay::annotate(const OverlayEpoch& epoch) {
  if (epoch.entry.proposal_id.empty()) {
    throw DiagnosticComputationError("epoch " + std::to_string(epoch.epoch_index) + " has no committed ledger entry");
  }
  if (last_epoch_.has_value() && epoch.epoch_index <= *last_epoch_) {
    throw DiagnosticComputationError("epoch " + std::to_string(epoch.epoch_index) + " arrived out of order");
  }
  require_finite_assets(epoch.assets);

  model::diagnostic_annotation annotation{};
  annotation.proposal_id = epoch.entry.proposal_id;
  annotation.epoch_index = epoch.epoch_index;
  annotation.assets = epoch.assets;
  annotation.envelope_states = epoch.severities;
  annotation.gamma_wave_state = gamma_wave_state(epoch.assets, epoch.severities, config_);

  const float decay = epoch.assets.get(asset::DECAY);
  const bool active = epoch.assets.get(asset::WAVE) >= config_.wave_threshold;
  const bool guard_ok = row_guard_holds(epoch.entry, epoch.tier_ceiling);

  if (!last_epoch_.has_value()) {
    annotation.row_status = model::row_state::NO_HISTORY;
  } else if (!active) {
    annotation.row_status = model::row_state::INACTIVE;
  } else if (!guard_ok) {
    annotation.row_status = model::row_state::GUARD_FAILED;
  } else {
    // Dropped epochs widen dt rather than being bridged.
    const double elapsed_epochs = static_cast<double>(epoch.epoch_index - *last_epoch_);
    const double dt_s = static_cast<double>(epoch.epoch_duration_s) * elapsed_epochs;
    annotation.row = compute_row(last_decay_, decay, dt_s, guard_ok);
    annotation.row_status = annotation.row.has_value() ? model::row_state::DEFINED : model::row_state::GUARD_FAILED;
  }

  last_epoch_ = epoch.epoch_index;
  last_decay_ = decay;

  window_.push_back(WindowSample{epoch.assets, annotation.gamma_wave_state, overloaded(epoch.assets)});
  while (window_.size() > config_.window_epochs) {
    window_.pop_front();
  }

  if (annotation.row.has_value()) {
    if (*annotation.row >= config_.row_high) {
      annotation.tags.push_back(nature_tag::ROW_HIGH);
    } else if (*annotation.row <= -config_.row_high) {
      annotation.tags.push_back(nature_tag::ROW_RECOVERY);
    }
  }
  append_window_tags(annotation);
  return annotation;
}

bool DiagnosticOverlay::overloaded(const model::asset_vector& assets) const noexcept {
  return assets.get(asset::DECAY) >= config_.overloaded_decay_min || assets.get(asset::FEAR) >= config_.overloaded_fear_min ||
         assets.get(asset::PAIN) >= config_.overloaded_pain_min;
}

bool DiagnosticOverlay::calm(const model::asset_vector& assets) const noexcept {
  return assets.get(asset::LIFEFORCE) > config_.calm_lifeforce_min && assets.get(asset::FEAR) < config_.calm_fear_max &&
         assets.get(asset::PAIN) < config_.calm_pain_max;
}

// Older half of the window mostly overloaded, newer half shedding DECAY and regaining LIFEFORCE.
bool DiagnosticOverlay::recovering() const noexcept {
  if (window_.size() < 2) {
    return false;
  }
  const std::size_t older_count = window_.size() / 2;
  std::size_t older_overloaded = 0;
  std::deque<float> older_decay;
  std::deque<float> newer_decay;
  std::deque<float> older_lifeforce;
  std::deque<float> newer_lifeforce;
  for (std::size_t i = 0; i < window_.size(); ++i) {
    const auto& sample = window_[i];
    if (i < older_count) {
      older_overloaded += sample.overloaded ? 1 : 0;
      older_decay.push_back(sample.assets.get(asset::DECAY));
      older_lifeforce.push_back(sample.assets.get(asset::LIFEFORCE));
    } else {
      newer_decay.push_back(sample.assets.get(asset::DECAY));
      newer_lifeforce.push_back(sample.assets.get(asset::LIFEFORCE));
    }
  }

  const float overloaded_fraction = static_cast<float>(older_overloaded) / static_cast<float>(older_count);
  return overloaded_fraction >= config_.recovery_overloaded_fraction && mean_of(newer_decay) < mean_of(older_decay) &&
         mean_of(newer_lifeforce) > mean_of(older_lifeforce);
}

void DiagnosticOverlay::append_window_tags(model::diagnostic_annotation& annotation) const {
  std::size_t gamma_risk = 0;
  std::deque<float> wave;
  std::deque<float> power;
  for (const auto& sample : window_) {
    gamma_risk += sample.gamma == model::severity::RISK ? 1 : 0;
    wave.push_back(sample.assets.get(asset::WAVE));
    power.push_back(sample.assets.get(asset::POWER));
  }

  if (gamma_risk > 0 && gamma_risk * 2 >= window_.size()) {
    annotation.tags.push_back(nature_tag::GAMMA_OVERLOAD);
  }
  if (mean_of(wave) >= config_.wave_threshold && mean_of(power) >= config_.power_overload) {
    annotation.tags.push_back(nature_tag::COGNITIVE_OVERLOAD);
  }

  // Mutually exclusive state group; the most severe label wins.
  if (window_.back().overloaded) {
    annotation.tags.push_back(nature_tag::OVERLOADED);
  } else if (recovering()) {
    annotation.tags.push_back(nature_tag::RECOVERY);
  } else if (calm(annotation.assets)) {
    annotation.tags.push_back(nature_tag::CALM_STABLE);
  }
}

nlohmann::json annotation_to_json(const model::diagnostic_annotation& annotation) {
  nlohmann::json tree = nlohmann::json::object();
  for (const auto a : model::kAllAssets) {
    tree[model::asset_name(a)] = annotation.assets.get(a);
  }

  nlohmann::json envelope = nlohmann::json::object();
  for (const auto& [axis, level] : annotation.envelope_states) {
    envelope[model::channel_name(axis)] = model::severity_name(level);
  }

  nlohmann::json tags = nlohmann::json::array();
  for (const auto tag : annotation.tags) {
    tags.push_back(model::nature_tag_name(tag));
  }

  nlohmann::json diagnostics{
      {"row", nullptr},
      {"row_state", model::row_state_name(annotation.row_status)},
      {"gamma_wave_state", model::severity_name(annotation.gamma_wave_state)},
      {"nature_tags", tags},
      {"tag_schema_version", annotation.tag_schema_version},
  };
  if (annotation.row.has_value()) {
    diagnostics["row"] = *annotation.row;
  }

  return nlohmann::json{
      {"epoch_index", annotation.epoch_index},
      {"proposal_id", annotation.proposal_id},
      {"tree_of_life_view", tree},
      {"envelope_states", envelope},
      {"diagnostics", diagnostics},
  };
}

}  // namespace neuro_guard::overlay
