#include <cmath>
#include <iostream>
#include <limits>
#include <string>

#include "core/config.hpp"
#include "kernel/capability_kernel.hpp"

using neuro_guard::core::PolicyConfig;
using neuro_guard::kernel::Decision;
using neuro_guard::kernel::DenyReason;
using neuro_guard::kernel::TransitionProposal;
using neuro_guard::kernel::consent_valid;
using neuro_guard::kernel::evaluate;
using neuro_guard::model::capability_tier;
using neuro_guard::model::consent_level;
using neuro_guard::model::consent_state;
using neuro_guard::model::reversal_evidence;
using neuro_guard::model::role;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

consent_state extended_consent() {
  consent_state consent{};
  consent.token = "consent-token-1";
  consent.level = consent_level::EXTENDED;
  consent.valid_from_ms = 1'000;
  consent.valid_until_ms = 10'000;
  consent.scope = {capability_tier::MODEL_ONLY, capability_tier::LAB_BENCH, capability_tier::CONTROLLED_HUMAN,
                   capability_tier::GENERAL_USE};
  return consent;
}

TransitionProposal upgrade_proposal() {
  TransitionProposal proposal{};
  proposal.proposal_id = "p-1";
  proposal.epoch_index = 7;
  proposal.from = capability_tier::MODEL_ONLY;
  proposal.to = capability_tier::LAB_BENCH;
  proposal.consent = extended_consent();
  proposal.proposer = role::OWNER;
  proposal.jurisdiction = "US_FDA";
  proposal.policy_refs = {"IRB-2024-17"};
  proposal.risk_before = 0.05;
  proposal.risk_after = 0.10;
  proposal.timestamp_ms = 5'000;
  return proposal;
}

reversal_evidence full_evidence() {
  reversal_evidence evidence{};
  evidence.explicit_order = true;
  evidence.no_safer_alternative_proof = true;
  evidence.signers = {role::HOST, role::OWNER, role::KERNEL, role::REGULATOR};
  return evidence;
}

TransitionProposal downgrade_proposal() {
  TransitionProposal proposal = upgrade_proposal();
  proposal.from = capability_tier::CONTROLLED_HUMAN;
  proposal.to = capability_tier::LAB_BENCH;
  proposal.reversal = full_evidence();
  return proposal;
}

PolicyConfig reversible_policy() {
  PolicyConfig policy{};
  policy.reversal.allow_in_tier = true;
  return policy;
}

bool denied_with(const Decision& decision, const DenyReason reason) {
  return !decision.accepted() && decision.reason == reason;
}

int test_kernel_accepts_valid_upgrade() {
  const Decision decision = evaluate(upgrade_proposal(), PolicyConfig{});
  if (!decision.accepted() || decision.to_string() != "ACCEPT") {
    return fail("test_kernel_accepts_valid_upgrade", "expected ACCEPT");
  }
  return 0;
}

int test_kernel_risk_invariant() {
  const PolicyConfig policy{};

  TransitionProposal decreasing = upgrade_proposal();
  decreasing.risk_after = 0.04;
  if (!denied_with(evaluate(decreasing, policy), DenyReason::RISK_INVARIANT)) {
    return fail("test_kernel_risk_invariant", "decreasing risk must be denied");
  }

  TransitionProposal over_ceiling = upgrade_proposal();
  over_ceiling.to = capability_tier::GENERAL_USE;
  over_ceiling.from = capability_tier::CONTROLLED_HUMAN;
  over_ceiling.proposer = role::REGULATOR;
  over_ceiling.risk_after = 0.27;  // GENERAL_USE ceiling is 0.25
  const Decision decision = evaluate(over_ceiling, policy);
  if (!denied_with(decision, DenyReason::RISK_INVARIANT) || decision.to_string() != "DENY:RiskInvariant") {
    return fail("test_kernel_risk_invariant", "risk above target-tier ceiling must be denied");
  }

  TransitionProposal not_a_number = upgrade_proposal();
  not_a_number.risk_after = std::numeric_limits<double>::quiet_NaN();
  if (!denied_with(evaluate(not_a_number, policy), DenyReason::RISK_INVARIANT)) {
    return fail("test_kernel_risk_invariant", "NaN risk must be denied");
  }

  // Monotone property over a grid of generated proposals.
  for (int before = 0; before <= 10; ++before) {
    for (int after = 0; after <= 10; ++after) {
      for (const auto target : neuro_guard::model::kAllTiers) {
        TransitionProposal generated = upgrade_proposal();
        generated.from = target;
        generated.to = target;
        generated.proposer = role::REGULATOR;
        generated.risk_before = before * 0.035;
        generated.risk_after = after * 0.035;
        const Decision result = evaluate(generated, policy);
        const bool valid = generated.risk_after >= generated.risk_before &&
                           generated.risk_after <= policy.ceiling(generated.to);
        if (result.accepted() && !valid) {
          return fail("test_kernel_risk_invariant", "accepted a proposal violating monotonicity or ceiling");
        }
      }
    }
  }

  return 0;
}

int test_kernel_consent_checks() {
  const PolicyConfig policy{};

  TransitionProposal expired = upgrade_proposal();
  expired.timestamp_ms = 10'000;
  if (!denied_with(evaluate(expired, policy), DenyReason::CONSENT_INVALID)) {
    return fail("test_kernel_consent_checks", "consent at valid_until must be expired");
  }

  TransitionProposal revoked = upgrade_proposal();
  revoked.consent.level = consent_level::REVOKED;
  if (!denied_with(evaluate(revoked, policy), DenyReason::CONSENT_INVALID)) {
    return fail("test_kernel_consent_checks", "revoked consent must be denied");
  }

  TransitionProposal out_of_scope = upgrade_proposal();
  out_of_scope.consent.scope = {capability_tier::MODEL_ONLY};
  if (!denied_with(evaluate(out_of_scope, policy), DenyReason::CONSENT_INVALID)) {
    return fail("test_kernel_consent_checks", "consent not scoped to target tier must be denied");
  }

  TransitionProposal no_token = upgrade_proposal();
  no_token.consent.token.clear();
  if (!denied_with(evaluate(no_token, policy), DenyReason::CONSENT_INVALID)) {
    return fail("test_kernel_consent_checks", "empty consent token must be denied");
  }

  if (!consent_valid(extended_consent(), capability_tier::LAB_BENCH, 1'000)) {
    return fail("test_kernel_consent_checks", "valid_from is inclusive");
  }

  return 0;
}

int test_kernel_policy_stack() {
  const PolicyConfig policy{};

  TransitionProposal jurisdiction = upgrade_proposal();
  jurisdiction.jurisdiction = "NOWHERE";
  Decision decision = evaluate(jurisdiction, policy);
  if (!denied_with(decision, DenyReason::POLICY_VIOLATION) || decision.to_string() != "DENY:PolicyViolation:jurisdiction") {
    return fail("test_kernel_policy_stack", "unknown jurisdiction must fail the jurisdiction predicate");
  }

  TransitionProposal wrong_role = upgrade_proposal();
  wrong_role.to = capability_tier::CONTROLLED_HUMAN;
  wrong_role.from = capability_tier::LAB_BENCH;
  wrong_role.proposer = role::OPERATOR;
  decision = evaluate(wrong_role, policy);
  if (decision.policy != "role") {
    return fail("test_kernel_policy_stack", "OPERATOR may not propose CONTROLLED_HUMAN");
  }

  TransitionProposal skip = upgrade_proposal();
  skip.to = capability_tier::CONTROLLED_HUMAN;
  decision = evaluate(skip, policy);
  if (decision.policy != "lattice_adjacency") {
    return fail("test_kernel_policy_stack", "two-tier jump must fail lattice adjacency");
  }
  skip.policy_refs.push_back(policy.multi_tier_ref);
  if (!evaluate(skip, policy).accepted()) {
    return fail("test_kernel_policy_stack", "explicit multi-tier policy should permit the jump");
  }

  TransitionProposal no_evidence = upgrade_proposal();
  no_evidence.policy_refs.clear();
  decision = evaluate(no_evidence, policy);
  if (decision.policy != "evidence") {
    return fail("test_kernel_policy_stack", "upgrade without policy refs must fail the evidence predicate");
  }

  TransitionProposal shallow = upgrade_proposal();
  shallow.from = capability_tier::LAB_BENCH;
  shallow.to = capability_tier::CONTROLLED_HUMAN;
  shallow.consent.level = consent_level::MINIMAL;
  decision = evaluate(shallow, policy);
  if (decision.policy != "consent_depth") {
    return fail("test_kernel_policy_stack", "MINIMAL consent cannot reach CONTROLLED_HUMAN");
  }

  return 0;
}

int test_kernel_downgrade_default_deny() {
  const PolicyConfig policy = reversible_policy();

  if (!evaluate(downgrade_proposal(), policy).accepted()) {
    return fail("test_kernel_downgrade_default_deny", "fully evidenced downgrade should be accepted");
  }

  if (!denied_with(evaluate(downgrade_proposal(), PolicyConfig{}), DenyReason::REVERSAL_CONDITIONS_UNMET)) {
    return fail("test_kernel_downgrade_default_deny", "downgrade must be denied when the tier forbids reversal");
  }

  TransitionProposal no_order = downgrade_proposal();
  no_order.reversal->explicit_order = false;
  if (!denied_with(evaluate(no_order, policy), DenyReason::REVERSAL_CONDITIONS_UNMET)) {
    return fail("test_kernel_downgrade_default_deny", "missing explicit order must be denied");
  }

  TransitionProposal no_proof = downgrade_proposal();
  no_proof.reversal->no_safer_alternative_proof = false;
  if (!denied_with(evaluate(no_proof, policy), DenyReason::REVERSAL_CONDITIONS_UNMET)) {
    return fail("test_kernel_downgrade_default_deny", "missing no-safer-alternative proof must be denied");
  }

  TransitionProposal no_quorum = downgrade_proposal();
  no_quorum.reversal->signers = {role::HOST, role::OWNER, role::KERNEL};
  if (!denied_with(evaluate(no_quorum, policy), DenyReason::REVERSAL_CONDITIONS_UNMET)) {
    return fail("test_kernel_downgrade_default_deny", "missing regulator quorum must be denied");
  }

  TransitionProposal missing_host = downgrade_proposal();
  missing_host.reversal->signers = {role::OWNER, role::KERNEL, role::REGULATOR};
  if (!denied_with(evaluate(missing_host, policy), DenyReason::REVERSAL_CONDITIONS_UNMET)) {
    return fail("test_kernel_downgrade_default_deny", "missing required HOST signer must be denied");
  }

  TransitionProposal no_evidence = downgrade_proposal();
  no_evidence.reversal.reset();
  no_evidence.risk_before = 0.0;
  no_evidence.risk_after = 0.0;
  if (!denied_with(evaluate(no_evidence, policy), DenyReason::REVERSAL_CONDITIONS_UNMET)) {
    return fail("test_kernel_downgrade_default_deny", "downgrade without evidence must be denied regardless of risk");
  }

  return 0;
}

int test_kernel_is_pure() {
  const PolicyConfig policy{};
  const TransitionProposal proposal = upgrade_proposal();
  const std::string first = evaluate(proposal, policy).to_string();
  for (int i = 0; i < 16; ++i) {
    if (evaluate(proposal, policy).to_string() != first) {
      return fail("test_kernel_is_pure", "identical inputs must yield identical decisions");
    }
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_kernel_accepts_valid_upgrade(); rc != 0) {
    return rc;
  }
  if (int rc = test_kernel_risk_invariant(); rc != 0) {
    return rc;
  }
  if (int rc = test_kernel_consent_checks(); rc != 0) {
    return rc;
  }
  if (int rc = test_kernel_policy_stack(); rc != 0) {
    return rc;
  }
  if (int rc = test_kernel_downgrade_default_deny(); rc != 0) {
    return rc;
  }
  if (int rc = test_kernel_is_pure(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] kernel unit tests\n";
  return 0;
}
