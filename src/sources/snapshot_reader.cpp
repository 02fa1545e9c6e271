#include "sources/snapshot_reader.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace neuro_guard::sources {

namespace {

model::capability_tier require_tier(const std::string& value) {
  const auto parsed = model::parse_tier(value);
  if (!parsed.has_value()) {
    throw std::runtime_error("unknown capability tier: " + value);
  }
  return *parsed;
}

model::role require_role(const std::string& value) {
  const auto parsed = model::parse_role(value);
  if (!parsed.has_value()) {
    throw std::runtime_error("unknown role: " + value);
  }
  return *parsed;
}

// Narrows explicitly: magnitudes beyond float range saturate to +/-inf instead of overflowing the cast.
float to_float(const double value) noexcept {
  if (std::isnan(value)) {
    return std::numeric_limits<float>::quiet_NaN();
  }
  if (value > static_cast<double>(std::numeric_limits<float>::max())) {
    return std::numeric_limits<float>::infinity();
  }
  if (value < -static_cast<double>(std::numeric_limits<float>::max())) {
    return -std::numeric_limits<float>::infinity();
  }
  return static_cast<float>(value);
}

float channel_number(const nlohmann::json& value) {
  if (value.is_null()) {
    return std::numeric_limits<float>::quiet_NaN();
  }
  if (!value.is_number()) {
    throw std::runtime_error("channel values must be numbers or null");
  }
  return to_float(value.get<double>());
}

}  // namespace

model::consent_state parse_consent(const nlohmann::json& in) {
  model::consent_state consent{};
  consent.token = in.value("token", std::string{});

  const auto level_name = in.value("level", std::string{"NONE"});
  const auto level = model::parse_consent_level(level_name);
  if (!level.has_value()) {
    throw std::runtime_error("unknown consent level: " + level_name);
  }
  consent.level = *level;
  consent.valid_from_ms = in.value("valid_from", std::uint64_t{0});
  consent.valid_until_ms = in.value("valid_until", std::uint64_t{0});
  for (const auto& tier : in.value("scope", std::vector<std::string>{})) {
    consent.scope.push_back(require_tier(tier));
  }
  return consent;
}

model::reversal_evidence parse_reversal(const nlohmann::json& in) {
  model::reversal_evidence evidence{};
  evidence.explicit_order = in.value("explicit_order", false);
  evidence.no_safer_alternative_proof = in.value("no_safer_alternative_proof", false);
  for (const auto& signer : in.value("signers", std::vector<std::string>{})) {
    evidence.signers.push_back(require_role(signer));
  }
  return evidence;
}

model::transition_request parse_request(const nlohmann::json& in) {
  model::transition_request request{};
  request.to = require_tier(in.at("to").get<std::string>());
  request.proposer = require_role(in.value("proposer", std::string{"OPERATOR"}));
  request.proposal_id = in.value("proposal_id", std::string{});
  request.policy_refs = in.value("policy_refs", std::vector<std::string>{});
  if (in.contains("jurisdiction")) {
    request.jurisdiction = in.at("jurisdiction").get<std::string>();
  }
  if (in.contains("consent")) {
    request.consent = parse_consent(in.at("consent"));
  }
  if (in.contains("reversal")) {
    request.reversal = parse_reversal(in.at("reversal"));
  }
  return request;
}

SnapshotRecord parse_snapshot_record(const nlohmann::json& in, const float default_epoch_duration_s) {
  if (!in.is_object()) {
    throw std::runtime_error("snapshot record must be a JSON object");
  }

  SnapshotRecord record{};
  const float duration = to_float(in.value("epoch_duration_s", static_cast<double>(default_epoch_duration_s)));
  record.snapshot = model::empty_snapshot(in.at("epoch_index").get<std::uint64_t>(),
                                          std::isfinite(duration) && duration > 0.0F ? duration : default_epoch_duration_s);

  if (in.contains("channels")) {
    for (const auto& [name, value] : in.at("channels").items()) {
      const auto ch = model::parse_channel(name);
      if (!ch.has_value()) {
        throw std::runtime_error("unknown channel: " + name);
      }
      model::set_channel(record.snapshot, *ch, channel_number(value));
    }
  }

  if (in.contains("consent")) {
    record.consent = parse_consent(in.at("consent"));
  }
  if (in.contains("request") && !in.at("request").is_null()) {
    record.request = parse_request(in.at("request"));
  }
  return record;
}

SnapshotReader::SnapshotReader(std::istream& input, const float default_epoch_duration_s) noexcept
    : input_(input), default_epoch_duration_s_(default_epoch_duration_s) {}

std::optional<SnapshotRecord> SnapshotReader::next() {
  std::string line;
  while (std::getline(input_, line)) {
    ++line_number_;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }

    try {
      return parse_snapshot_record(nlohmann::json::parse(line), default_epoch_duration_s_);
    } catch (const nlohmann::json::exception& ex) {
      ++skipped_;
      std::cerr << "[source] skipping line " << line_number_ << ": " << ex.what() << '\n';
    } catch (const std::runtime_error& ex) {
      ++skipped_;
      std::cerr << "[source] skipping line " << line_number_ << ": " << ex.what() << '\n';
    }
  }
  return std::nullopt;
}

}  // namespace neuro_guard::sources
