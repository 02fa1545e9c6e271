#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "kernel/capability_kernel.hpp"

namespace neuro_guard::sinks {

// One proposal-log line: every decision, accept or deny, with its reason.
nlohmann::json proposal_log_record(const kernel::TransitionProposal& proposal, const kernel::Decision& decision);

// Epoch cursor and committed tier replayed from an existing proposal log.
struct ProposalLogState {
  std::size_t records{0};
  std::uint64_t last_epoch{0};
  std::string last_proposal_id{};
  std::optional<model::capability_tier> committed_tier{};
};

// nullopt when the log is missing or empty; throws std::runtime_error on a malformed line.
std::optional<ProposalLogState> read_proposal_log_state(const std::string& path);

}  // namespace neuro_guard::sinks
