#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace neuro_guard::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::vector<std::string> parse_list(const std::string& value) {
  std::vector<std::string> items;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

long long parse_integer(const std::string& key, const std::string& value, const long long min_value,
                        const long long max_value) {
  long long parsed = 0;
  std::size_t consumed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer: '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer: '" + value + "'");
  }
  if (parsed < min_value || parsed > max_value) {
    throw std::runtime_error(key + " must be in range " + std::to_string(min_value) + ".." + std::to_string(max_value));
  }
  return parsed;
}

double parse_double(const std::string& key, const std::string& value) {
  double parsed = 0.0;
  std::size_t consumed = 0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be a number: '" + value + "'");
  }
  if (consumed != value.size() || !std::isfinite(parsed)) {
    throw std::runtime_error(key + " must be a finite number: '" + value + "'");
  }
  return parsed;
}

float parse_float(const std::string& key, const std::string& value) {
  const double parsed = parse_double(key, value);
  if (std::fabs(parsed) > static_cast<double>(std::numeric_limits<float>::max())) {
    throw std::runtime_error(key + " is out of range: '" + value + "'");
  }
  return static_cast<float>(parsed);
}

std::uint32_t parse_count(const std::string& key, const std::string& value) {
  return static_cast<std::uint32_t>(parse_integer(key, value, 1, std::numeric_limits<std::uint32_t>::max()));
}

double parse_non_negative(const std::string& key, const std::string& value) {
  const double parsed = parse_double(key, value);
  if (!(parsed >= 0.0)) {
    throw std::runtime_error(key + " must be non-negative");
  }
  return parsed;
}

float parse_non_negative_float(const std::string& key, const std::string& value) {
  const float parsed = parse_float(key, value);
  if (!(parsed >= 0.0F)) {
    throw std::runtime_error(key + " must be non-negative");
  }
  return parsed;
}

std::vector<model::role> parse_roles(const std::string& key, const std::string& value) {
  std::vector<model::role> roles;
  for (const auto& item : parse_list(value)) {
    const auto parsed = model::parse_role(item);
    if (!parsed.has_value()) {
      throw std::runtime_error(key + ": unknown role '" + item + "'");
    }
    roles.push_back(*parsed);
  }
  return roles;
}

model::capability_tier require_tier(const std::string& key, const std::string& value) {
  const auto parsed = model::parse_tier(value);
  if (!parsed.has_value()) {
    throw std::runtime_error(key + ": unknown capability tier '" + value + "'");
  }
  return *parsed;
}

model::channel require_channel(const std::string& key, const std::string& name) {
  const auto parsed = model::parse_channel(name);
  if (!parsed.has_value()) {
    throw std::runtime_error(key + ": unknown signal channel '" + name + "'");
  }
  return *parsed;
}

AxisConfig& axis_entry(SessionConfig& config, const model::channel axis) {
  for (auto& entry : config.axes) {
    if (entry.axis == axis) {
      return entry;
    }
  }
  AxisConfig entry{};
  entry.axis = axis;
  config.axes.push_back(entry);
  return config.axes.back();
}

// Splits "prefix.name.field" into name and field; returns false when the shape does not match.
bool split_member(const std::string& key, const std::string& prefix, std::string& name, std::string& field) {
  if (key.rfind(prefix, 0) != 0) {
    return false;
  }
  const std::string rest = key.substr(prefix.size());
  const auto dot = rest.find('.');
  if (dot == std::string::npos) {
    return false;
  }
  name = rest.substr(0, dot);
  field = rest.substr(dot + 1);
  return true;
}

void apply_axis_key(SessionConfig& config, const std::string& key, const std::string& name,
                    const std::string& field, const std::string& value) {
  AxisConfig& axis = axis_entry(config, require_channel(key, name));
  if (field == "min_warn") {
    axis.min_warn = parse_float(key, value);
  } else if (field == "max_warn") {
    axis.max_warn = parse_float(key, value);
  } else if (field == "min_safe") {
    axis.min_safe = parse_float(key, value);
  } else if (field == "max_safe") {
    axis.max_safe = parse_float(key, value);
  } else if (field == "max_delta_per_sec") {
    axis.max_delta_per_sec = parse_non_negative_float(key, value);
  } else if (field == "weight") {
    axis.weight = parse_non_negative_float(key, value);
  } else {
    throw std::runtime_error("unknown axis field: " + key);
  }
}

void apply_tier_key(SessionConfig& config, const std::string& key, const std::string& name,
                    const std::string& field, const std::string& value) {
  TierPolicy& tier = config.policy.tiers[model::tier_index(require_tier(key, name))];
  if (field == "ceiling") {
    tier.ceiling = parse_double(key, value);
    if (!(tier.ceiling > 0.0) || tier.ceiling > 1.0) {
      throw std::runtime_error(key + " must be in range (0, 1]");
    }
  } else if (field == "roles") {
    tier.roles = parse_roles(key, value);
  } else {
    throw std::runtime_error("unknown tier field: " + key);
  }
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = parse_integer("redis.address port", value.substr(split + 1), 1, 65535);
  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(SessionConfig& config, const std::string& key, const std::string& value) {
  std::string name;
  std::string field;

  if (key == "session.id") {
    config.session.id = value;
    return;
  }
  if (key == "session.initial_tier") {
    config.session.initial_tier = require_tier(key, value);
    return;
  }
  if (key == "session.policy_refs") {
    config.session.policy_refs = parse_list(value);
    return;
  }
  if (key == "session.jurisdiction") {
    config.session.jurisdiction = value;
    return;
  }
  if (key == "session.hold_proposer") {
    const auto parsed = model::parse_role(value);
    if (!parsed.has_value()) {
      throw std::runtime_error("unknown role for " + key + ": " + value);
    }
    config.session.hold_proposer = *parsed;
    return;
  }
  if (key == "session.epoch_duration_s") {
    config.session.default_epoch_duration_s = parse_float(key, value);
    if (!(config.session.default_epoch_duration_s > 0.0F)) {
      throw std::runtime_error("session.epoch_duration_s must be greater than 0");
    }
    return;
  }

  if (key == "hysteresis.warn_epochs_to_flag") {
    config.hysteresis.warn_epochs_to_flag = parse_count(key, value);
    return;
  }
  if (key == "hysteresis.risk_epochs_to_downgrade") {
    config.hysteresis.risk_epochs_to_downgrade = parse_count(key, value);
    return;
  }

  if (split_member(key, "axes.", name, field)) {
    apply_axis_key(config, key, name, field, value);
    return;
  }

  if (key == "risk.warn_weight") {
    config.risk.warn_weight = parse_non_negative(key, value);
    return;
  }
  if (key == "risk.risk_weight") {
    config.risk.risk_weight = parse_non_negative(key, value);
    return;
  }

  if (split_member(key, "tiers.", name, field)) {
    apply_tier_key(config, key, name, field, value);
    return;
  }

  if (key == "policy.jurisdictions") {
    config.policy.jurisdictions = parse_list(value);
    return;
  }
  if (key == "policy.multi_tier_ref") {
    config.policy.multi_tier_ref = value;
    return;
  }
  if (key == "reversal.allow_in_tier") {
    config.policy.reversal.allow_in_tier = parse_bool(value);
    return;
  }
  if (key == "reversal.required_roles") {
    config.policy.reversal.required_roles = parse_roles(key, value);
    return;
  }
  if (key == "reversal.regulator_quorum") {
    const auto parsed = parse_integer(key, value, 0, std::numeric_limits<std::uint32_t>::max());
    config.policy.reversal.regulator_quorum = static_cast<std::uint32_t>(parsed);
    return;
  }

  if (key == "assets.time_horizon_epochs") {
    config.assets.time_horizon_epochs = parse_count(key, value);
    return;
  }
  if (key.rfind("assets.normalize.", 0) == 0) {
    const std::string channel_key = key.substr(std::string("assets.normalize.").size());
    const auto bounds = parse_list(value);
    if (bounds.size() != 2) {
      throw std::runtime_error(key + " must be 'lo, hi'");
    }
    NormalizeRange range{parse_float(key, bounds[0]), parse_float(key, bounds[1])};
    if (!(range.hi > range.lo)) {
      throw std::runtime_error(key + " requires hi > lo");
    }
    config.assets.ranges[model::channel_index(require_channel(key, channel_key))] = range;
    return;
  }
  if (key.rfind("assets.", 0) == 0) {
    const std::string asset_key = key.substr(std::string("assets.").size());
    AssetConfig& assets = config.assets;
    const auto weight = parse_non_negative_float(key, value);
    if (asset_key == "wave_alpha_weight") {
      assets.wave_alpha_weight = weight;
    } else if (asset_key == "wave_beta_weight") {
      assets.wave_beta_weight = weight;
    } else if (asset_key == "wave_gamma_weight") {
      assets.wave_gamma_weight = weight;
    } else if (asset_key == "wave_cve_weight") {
      assets.wave_cve_weight = weight;
    } else if (asset_key == "fear_eda_weight") {
      assets.fear_eda_weight = weight;
    } else if (asset_key == "fear_heart_rate_weight") {
      assets.fear_heart_rate_weight = weight;
    } else if (asset_key == "pain_fear_weight") {
      assets.pain_fear_weight = weight;
    } else if (asset_key == "pain_motion_weight") {
      assets.pain_motion_weight = weight;
    } else if (asset_key == "warn_load") {
      assets.warn_load = weight;
    } else if (asset_key == "risk_load") {
      assets.risk_load = weight;
    } else {
      throw std::runtime_error("unknown assets key: " + key);
    }
    return;
  }

  if (key.rfind("overlay.", 0) == 0) {
    const std::string overlay_key = key.substr(std::string("overlay.").size());
    OverlayConfig& overlay = config.overlay;
    if (overlay_key == "window_epochs") {
      overlay.window_epochs = parse_count(key, value);
    } else if (overlay_key == "max_queue") {
      overlay.max_queue = parse_count(key, value);
    } else if (overlay_key == "row_high") {
      overlay.row_high = parse_non_negative(key, value);
    } else {
      const auto threshold = parse_non_negative_float(key, value);
      if (overlay_key == "wave_threshold") {
        overlay.wave_threshold = threshold;
      } else if (overlay_key == "wave_risk_threshold") {
        overlay.wave_risk_threshold = threshold;
      } else if (overlay_key == "power_overload") {
        overlay.power_overload = threshold;
      } else if (overlay_key == "calm_lifeforce_min") {
        overlay.calm_lifeforce_min = threshold;
      } else if (overlay_key == "calm_fear_max") {
        overlay.calm_fear_max = threshold;
      } else if (overlay_key == "calm_pain_max") {
        overlay.calm_pain_max = threshold;
      } else if (overlay_key == "overloaded_decay_min") {
        overlay.overloaded_decay_min = threshold;
      } else if (overlay_key == "overloaded_fear_min") {
        overlay.overloaded_fear_min = threshold;
      } else if (overlay_key == "overloaded_pain_min") {
        overlay.overloaded_pain_min = threshold;
      } else if (overlay_key == "recovery_overloaded_fraction") {
        overlay.recovery_overloaded_fraction = threshold;
      } else {
        throw std::runtime_error("unknown overlay key: " + key);
      }
    }
    return;
  }

  if (key == "ledger.path") {
    config.ledger.path = value;
    return;
  }
  if (key == "ledger.genesis_hash") {
    if (value.empty()) {
      throw std::runtime_error("ledger.genesis_hash must not be empty");
    }
    config.ledger.genesis_hash = value;
    return;
  }
  if (key == "ledger.append_retries") {
    config.ledger.append_retries = parse_count(key, value);
    return;
  }
  if (key == "ledger.verify_every_epochs") {
    config.ledger.verify_every_epochs = parse_count(key, value);
    return;
  }

  if (key == "outputs.proposal_log") {
    config.outputs.proposal_log = value;
    return;
  }
  if (key == "outputs.annotation_log") {
    config.outputs.annotation_log = value;
    return;
  }

  if (key == "outputs.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }
  if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
    return;
  }

  std::cerr << "[config] ignoring unknown key " << key << '\n';
}

void check_relaxation(const std::string& key, const float active, const float candidate, const bool lower_is_tighter) {
  const bool relaxed = lower_is_tighter ? candidate > active : candidate < active;
  if (relaxed) {
    std::ostringstream message;
    message << key << " relaxed from " << active << " to " << candidate;
    throw BoundRelaxationError(message.str());
  }
}

}  // namespace

PolicyConfig::PolicyConfig() {
  using model::role;
  tiers[model::tier_index(model::capability_tier::MODEL_ONLY)] = {0.30, {role::OPERATOR, role::OWNER, role::REGULATOR, role::HOST, role::KERNEL}};
  tiers[model::tier_index(model::capability_tier::LAB_BENCH)] = {0.30, {role::OPERATOR, role::OWNER, role::REGULATOR, role::KERNEL}};
  tiers[model::tier_index(model::capability_tier::CONTROLLED_HUMAN)] = {0.30, {role::OWNER, role::REGULATOR, role::KERNEL}};
  tiers[model::tier_index(model::capability_tier::GENERAL_USE)] = {0.25, {role::REGULATOR, role::KERNEL}};
}

double PolicyConfig::ceiling(const model::capability_tier tier) const noexcept {
  return tiers[model::tier_index(tier)].ceiling;
}

double PolicyConfig::global_ceiling() const noexcept {
  double ceiling = 0.0;
  for (const auto& tier : tiers) {
    ceiling = std::max(ceiling, tier.ceiling);
  }
  return ceiling;
}

const AxisConfig* SessionConfig::find_axis(const model::channel axis) const noexcept {
  for (const auto& entry : axes) {
    if (entry.axis == axis) {
      return &entry;
    }
  }
  return nullptr;
}

SessionConfig parse_session_config(std::istream& input) {
  SessionConfig config{};

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate_session_config(config);
  return config;
}

SessionConfig load_session_config(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }
  return parse_session_config(input);
}

void validate_session_config(const SessionConfig& config) {
  for (const auto& axis : config.axes) {
    const std::string name = std::string("axes.") + model::channel_name(axis.axis);
    if (std::isnan(axis.min_warn) || std::isnan(axis.max_warn) || std::isnan(axis.min_safe) || std::isnan(axis.max_safe)) {
      throw std::runtime_error(name + " requires min_warn, max_warn, min_safe and max_safe");
    }
    if (!(axis.min_safe <= axis.min_warn && axis.min_warn <= axis.max_warn && axis.max_warn <= axis.max_safe)) {
      throw std::runtime_error(name + " bounds must satisfy min_safe <= min_warn <= max_warn <= max_safe");
    }
  }

  for (const auto tier : model::kAllTiers) {
    const double ceiling = config.policy.ceiling(tier);
    if (!(ceiling > 0.0) || ceiling > 1.0) {
      throw std::runtime_error(std::string("tiers.") + model::tier_name(tier) + ".ceiling must be in range (0, 1]");
    }
  }

  if (config.overlay.wave_risk_threshold < config.overlay.wave_threshold) {
    throw std::runtime_error("overlay.wave_risk_threshold must be greater than or equal to overlay.wave_threshold");
  }
}

void validate_reload(const SessionConfig& active, const SessionConfig& candidate) {
  for (const auto& current : active.axes) {
    const std::string name = std::string("axes.") + model::channel_name(current.axis);
    const AxisConfig* next = candidate.find_axis(current.axis);
    if (next == nullptr) {
      throw BoundRelaxationError(name + " removed from an active session");
    }

    check_relaxation(name + ".min_warn", current.min_warn, next->min_warn, false);
    check_relaxation(name + ".max_warn", current.max_warn, next->max_warn, true);
    check_relaxation(name + ".min_safe", current.min_safe, next->min_safe, false);
    check_relaxation(name + ".max_safe", current.max_safe, next->max_safe, true);
    check_relaxation(name + ".max_delta_per_sec", current.max_delta_per_sec, next->max_delta_per_sec, true);
  }

  for (const auto tier : model::kAllTiers) {
    check_relaxation(std::string("tiers.") + model::tier_name(tier) + ".ceiling",
                     static_cast<float>(active.policy.ceiling(tier)),
                     static_cast<float>(candidate.policy.ceiling(tier)), true);
  }
}

SessionConfig reload_session_config(const SessionConfig& active, const std::string& path) {
  SessionConfig candidate = load_session_config(path);
  validate_reload(active, candidate);
  std::cerr << "[config] reload accepted from " << path << '\n';
  return candidate;
}

}  // namespace neuro_guard::core
