#pragma once

#include <optional>
#include <string>
#include <vector>

#include "model/governance.hpp"

namespace neuro_guard::model {

// Externally supplied ask to move the session to another tier.
// Fields left empty fall back to session defaults when the proposal is built.
struct transition_request {
    capability_tier to{capability_tier::MODEL_ONLY};
    role proposer{role::OPERATOR};
    std::string proposal_id;
    std::vector<std::string> policy_refs;
    std::optional<std::string> jurisdiction;
    std::optional<consent_state> consent;
    std::optional<reversal_evidence> reversal;
};

} // namespace neuro_guard::model
