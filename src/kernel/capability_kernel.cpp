#include "kernel/capability_kernel.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace neuro_guard::kernel {

namespace {

using model::capability_tier;
using model::role;

template <typename T>
bool contains(const std::vector<T>& values, const T& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

bool jurisdiction_allowed(const TransitionProposal& proposal, const core::PolicyConfig& policy) {
  return contains(policy.jurisdictions, proposal.jurisdiction);
}

bool role_allowed(const TransitionProposal& proposal, const core::PolicyConfig& policy) {
  return contains(policy.tiers[model::tier_index(proposal.to)].roles, proposal.proposer);
}

bool lattice_adjacent(const TransitionProposal& proposal, const core::PolicyConfig& policy) {
  if (std::abs(model::tier_distance(proposal.from, proposal.to)) <= 1) {
    return true;
  }
  return !policy.multi_tier_ref.empty() && contains(proposal.policy_refs, policy.multi_tier_ref);
}

bool evidence_present(const TransitionProposal& proposal, const core::PolicyConfig&) {
  if (model::tier_distance(proposal.from, proposal.to) <= 0) {
    return true;
  }
  return !proposal.policy_refs.empty();
}

bool consent_depth_sufficient(const TransitionProposal& proposal, const core::PolicyConfig&) {
  if (proposal.to < capability_tier::CONTROLLED_HUMAN) {
    return true;
  }
  return proposal.consent.level == model::consent_level::EXTENDED;
}

struct PolicyPredicate {
  const char* name;
  bool (*check)(const TransitionProposal&, const core::PolicyConfig&);
};

// Conjunction, evaluated in order; the first failure names the denial.
constexpr PolicyPredicate kPolicyStack[] = {
    {"jurisdiction", jurisdiction_allowed},
    {"role", role_allowed},
    {"lattice_adjacency", lattice_adjacent},
    {"evidence", evidence_present},
    {"consent_depth", consent_depth_sufficient},
};

bool quorum_satisfied(const std::vector<role>& signers, const core::ReversalPolicy& reversal) {
  for (const auto required : reversal.required_roles) {
    if (!contains(signers, required)) {
      return false;
    }
  }
  const auto regulators = static_cast<std::uint32_t>(std::count(signers.begin(), signers.end(), role::REGULATOR));
  return regulators >= reversal.regulator_quorum;
}

}  // namespace

Decision Decision::accept() {
  return Decision{DecisionKind::ACCEPT, DenyReason::NONE, {}};
}

Decision Decision::deny(const DenyReason reason, std::string policy) {
  return Decision{DecisionKind::DENY, reason, std::move(policy)};
}

std::string Decision::to_string() const {
  if (accepted()) {
    return "ACCEPT";
  }
  std::string out = std::string("DENY:") + deny_reason_name(reason);
  if (reason == DenyReason::POLICY_VIOLATION && !policy.empty()) {
    out += ":" + policy;
  }
  return out;
}

const char* deny_reason_name(const DenyReason reason) noexcept {
  switch (reason) {
    case DenyReason::NONE:
      return "None";
    case DenyReason::RISK_INVARIANT:
      return "RiskInvariant";
    case DenyReason::CONSENT_INVALID:
      return "ConsentInvalid";
    case DenyReason::POLICY_VIOLATION:
      return "PolicyViolation";
    case DenyReason::REVERSAL_CONDITIONS_UNMET:
      return "ReversalConditionsUnmet";
  }
  return "Unknown";
}

bool risk_invariant_holds(const TransitionProposal& proposal, const core::PolicyConfig& policy) noexcept {
  // Negated comparisons so NaN fails both checks.
  if (!(proposal.risk_after >= proposal.risk_before)) {
    return false;
  }
  return proposal.risk_after <= policy.ceiling(proposal.to);
}

bool consent_valid(const model::consent_state& consent, const capability_tier to, const std::uint64_t now_ms) noexcept {
  if (consent.token.empty()) {
    return false;
  }
  if (consent.level != model::consent_level::MINIMAL && consent.level != model::consent_level::EXTENDED) {
    return false;
  }
  if (now_ms < consent.valid_from_ms || now_ms >= consent.valid_until_ms) {
    return false;
  }
  return std::find(consent.scope.begin(), consent.scope.end(), to) != consent.scope.end();
}

std::optional<std::string> failing_policy(const TransitionProposal& proposal, const core::PolicyConfig& policy) {
  for (const auto& predicate : kPolicyStack) {
    if (!predicate.check(proposal, policy)) {
      return std::string(predicate.name);
    }
  }
  return std::nullopt;
}

bool reversal_conditions_met(const TransitionProposal& proposal, const core::ReversalPolicy& reversal) noexcept {
  if (!reversal.allow_in_tier || !proposal.reversal.has_value()) {
    return false;
  }
  const auto& evidence = *proposal.reversal;
  return evidence.explicit_order && evidence.no_safer_alternative_proof && quorum_satisfied(evidence.signers, reversal);
}

Decision evaluate(const TransitionProposal& proposal, const core::PolicyConfig& policy) {
  if (!risk_invariant_holds(proposal, policy)) {
    return Decision::deny(DenyReason::RISK_INVARIANT);
  }

  if (!consent_valid(proposal.consent, proposal.to, proposal.timestamp_ms)) {
    return Decision::deny(DenyReason::CONSENT_INVALID);
  }

  if (auto failed = failing_policy(proposal, policy); failed.has_value()) {
    return Decision::deny(DenyReason::POLICY_VIOLATION, std::move(*failed));
  }

  if (proposal.to < proposal.from && !reversal_conditions_met(proposal, policy.reversal)) {
    return Decision::deny(DenyReason::REVERSAL_CONDITIONS_UNMET);
  }

  return Decision::accept();
}

}  // namespace neuro_guard::kernel
