#include "sinks/proposal_log.hpp"

#include <fstream>
#include <stdexcept>

namespace neuro_guard::sinks {

nlohmann::json proposal_log_record(const kernel::TransitionProposal& proposal, const kernel::Decision& decision) {
  nlohmann::json reason = nullptr;
  if (!decision.accepted()) {
    reason = decision.to_string().substr(5);
  }

  return nlohmann::json{
      {"epoch_index", proposal.epoch_index},
      {"proposal_id", proposal.proposal_id},
      {"from_state", model::tier_name(proposal.from)},
      {"to_state", model::tier_name(proposal.to)},
      {"risk_before", proposal.risk_before},
      {"risk_after", proposal.risk_after},
      {"decision", decision.accepted() ? "ACCEPT" : "DENY"},
      {"reason", reason},
      {"timestamp", proposal.timestamp_ms},
      {"policy_refs", proposal.policy_refs},
  };
}

std::optional<ProposalLogState> read_proposal_log_state(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    return std::nullopt;
  }

  ProposalLogState state{};
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }
    try {
      const auto record = nlohmann::json::parse(line);
      state.last_epoch = record.at("epoch_index").get<std::uint64_t>();
      state.last_proposal_id = record.at("proposal_id").get<std::string>();
      if (record.at("decision").get<std::string>() == "ACCEPT") {
        const auto to_state = record.at("to_state").get<std::string>();
        const auto tier = model::parse_tier(to_state);
        if (!tier.has_value()) {
          throw std::runtime_error("unknown to_state '" + to_state + "'");
        }
        state.committed_tier = *tier;
      }
    } catch (const nlohmann::json::exception& ex) {
      throw std::runtime_error("proposal log " + path + " line " + std::to_string(line_number) + ": " + ex.what());
    } catch (const std::runtime_error& ex) {
      throw std::runtime_error("proposal log " + path + " line " + std::to_string(line_number) + ": " + ex.what());
    }
    ++state.records;
  }

  if (state.records == 0) {
    return std::nullopt;
  }
  return state;
}

}  // namespace neuro_guard::sinks
