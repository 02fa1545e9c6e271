#pragma once

#include <array>
#include <cstdint>
#include <istream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "model/governance.hpp"
#include "model/signal_snapshot.hpp"

namespace neuro_guard::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"neuro:session"};
  bool enabled{false};
};

struct SessionInfo {
  std::string id{"session"};
  model::capability_tier initial_tier{model::capability_tier::MODEL_ONLY};
  std::vector<std::string> policy_refs{};
  std::string jurisdiction{"GLOBAL_BASELINE"};
  model::role hold_proposer{model::role::KERNEL};  // role on same-tier proposals without a request
  float default_epoch_duration_s{5.0F};
};

struct HysteresisConfig {
  std::uint32_t warn_epochs_to_flag{3};
  std::uint32_t risk_epochs_to_downgrade{5};
};

// Warn band [min_warn, max_warn] sits inside safe band [min_safe, max_safe].
struct AxisConfig {
  model::channel axis{model::channel::HEART_RATE};
  float min_warn{std::numeric_limits<float>::quiet_NaN()};
  float max_warn{std::numeric_limits<float>::quiet_NaN()};
  float min_safe{std::numeric_limits<float>::quiet_NaN()};
  float max_safe{std::numeric_limits<float>::quiet_NaN()};
  float max_delta_per_sec{std::numeric_limits<float>::infinity()};
  float weight{1.0F};
};

struct RiskWeights {
  double warn_weight{0.15};
  double risk_weight{0.30};
};

struct TierPolicy {
  double ceiling{0.30};
  std::vector<model::role> roles{};
};

struct ReversalPolicy {
  bool allow_in_tier{false};
  std::vector<model::role> required_roles{model::role::HOST, model::role::OWNER, model::role::KERNEL};
  std::uint32_t regulator_quorum{1};
};

struct PolicyConfig {
  std::array<TierPolicy, model::kTierCount> tiers{};
  std::vector<std::string> jurisdictions{"GLOBAL_BASELINE", "US_FDA", "EU_MDR"};
  std::string multi_tier_ref{"MULTI_TIER_TRANSITION"};
  ReversalPolicy reversal{};

  PolicyConfig();

  [[nodiscard]] double ceiling(model::capability_tier tier) const noexcept;
  [[nodiscard]] double global_ceiling() const noexcept;
};

struct NormalizeRange {
  float lo{std::numeric_limits<float>::quiet_NaN()};
  float hi{std::numeric_limits<float>::quiet_NaN()};
};

struct AssetConfig {
  std::uint64_t time_horizon_epochs{10'000};
  std::array<NormalizeRange, model::kChannelCount> ranges{};

  float wave_alpha_weight{0.25F};
  float wave_beta_weight{0.25F};
  float wave_gamma_weight{0.35F};
  float wave_cve_weight{0.15F};
  float fear_eda_weight{0.6F};
  float fear_heart_rate_weight{0.4F};
  float pain_fear_weight{0.5F};
  float pain_motion_weight{0.5F};
  float warn_load{0.5F};
  float risk_load{1.0F};
};

struct OverlayConfig {
  float wave_threshold{0.60F};
  float wave_risk_threshold{0.85F};
  double row_high{0.02};
  float power_overload{0.50F};
  std::size_t window_epochs{6};
  std::size_t max_queue{4096};
  float calm_lifeforce_min{0.70F};
  float calm_fear_max{0.30F};
  float calm_pain_max{0.30F};
  float overloaded_decay_min{0.70F};
  float overloaded_fear_min{0.70F};
  float overloaded_pain_min{0.70F};
  float recovery_overloaded_fraction{0.50F};
};

struct LedgerConfig {
  std::string path{};
  std::string genesis_hash{std::string(64, '0')};
  std::uint32_t append_retries{3};
  std::uint64_t verify_every_epochs{100};
};

struct OutputConfig {
  std::string proposal_log{};
  std::string annotation_log{};
};

// Loaded once per session and passed by const reference; never mutated afterwards.
struct SessionConfig {
  SessionInfo session{};
  HysteresisConfig hysteresis{};
  std::vector<AxisConfig> axes{};
  RiskWeights risk{};
  PolicyConfig policy{};
  AssetConfig assets{};
  OverlayConfig overlay{};
  LedgerConfig ledger{};
  OutputConfig outputs{};
  bool stdout_debug{false};
  RedisConfig redis{};

  [[nodiscard]] const AxisConfig* find_axis(model::channel axis) const noexcept;
};

class BoundRelaxationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

SessionConfig parse_session_config(std::istream& input);
SessionConfig load_session_config(const std::string& path);

// Throws std::runtime_error on inconsistent thresholds, weights or ceilings.
void validate_session_config(const SessionConfig& config);

// Non-relaxing rule: bounds already in force may only tighten. Throws BoundRelaxationError.
void validate_reload(const SessionConfig& active, const SessionConfig& candidate);
SessionConfig reload_session_config(const SessionConfig& active, const std::string& path);

}  // namespace neuro_guard::core
