#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/governance.hpp"

namespace neuro_guard::kernel {

enum class DecisionKind : std::uint8_t {
  ACCEPT = 0,
  DENY = 1,
};

enum class DenyReason : std::uint8_t {
  NONE = 0,
  RISK_INVARIANT = 1,
  CONSENT_INVALID = 2,
  POLICY_VIOLATION = 3,
  REVERSAL_CONDITIONS_UNMET = 4,
};

struct Decision {
  DecisionKind kind{DecisionKind::DENY};
  DenyReason reason{DenyReason::NONE};
  std::string policy{};  // failing predicate for POLICY_VIOLATION

  static Decision accept();
  static Decision deny(DenyReason reason, std::string policy = {});

  [[nodiscard]] bool accepted() const noexcept { return kind == DecisionKind::ACCEPT; }

  // "ACCEPT", "DENY:RiskInvariant", "DENY:PolicyViolation:role", ...
  [[nodiscard]] std::string to_string() const;
};

// Candidate transition. Lives for one evaluate() call; the kernel never keeps it.
struct TransitionProposal {
  std::string proposal_id{};
  std::uint64_t epoch_index{0};
  model::capability_tier from{model::capability_tier::MODEL_ONLY};
  model::capability_tier to{model::capability_tier::MODEL_ONLY};
  model::consent_state consent{};
  model::role proposer{model::role::OPERATOR};
  std::string jurisdiction{};
  std::vector<std::string> policy_refs{};
  double risk_before{0.0};
  double risk_after{0.0};
  std::uint64_t timestamp_ms{0};
  std::optional<model::reversal_evidence> reversal{};
};

// Committed kernel state as handed to read-only consumers. A copy, never a handle.
struct KernelStateView {
  model::capability_tier tier{model::capability_tier::MODEL_ONLY};
  double risk{0.0};
  double ceiling{0.0};
};

const char* deny_reason_name(DenyReason reason) noexcept;

bool risk_invariant_holds(const TransitionProposal& proposal, const core::PolicyConfig& policy) noexcept;
bool consent_valid(const model::consent_state& consent, model::capability_tier to, std::uint64_t now_ms) noexcept;

// Name of the first policy-stack predicate that fails, if any.
std::optional<std::string> failing_policy(const TransitionProposal& proposal, const core::PolicyConfig& policy);

bool reversal_conditions_met(const TransitionProposal& proposal, const core::ReversalPolicy& reversal) noexcept;

// Pure decision function. Same inputs, same decision; no I/O, no retained state.
Decision evaluate(const TransitionProposal& proposal, const core::PolicyConfig& policy);

}  // namespace neuro_guard::kernel
