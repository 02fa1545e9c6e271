#include "ledger/hash_ledger.hpp"

#include <cstdio>
#include <iostream>
#include <utility>

#include "ledger/digest.hpp"

namespace neuro_guard::ledger {

namespace {

std::string format_risk(const double value) {
  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%.17g", value);
  return buffer;
}

// Netstring framing ("<len>:<bytes>,") so no field or policy ref can bleed into its neighbour.
void append_field(std::string& input, const std::string& field) {
  input += std::to_string(field.size());
  input += ':';
  input += field;
  input += ',';
}

std::string hash_input(const LedgerEntry& entry) {
  std::string input;
  input.reserve(256);
  append_field(input, entry.prev_hash);
  append_field(input, entry.proposal_id);
  append_field(input, entry.decision);
  append_field(input, format_risk(entry.risk_before));
  append_field(input, format_risk(entry.risk_after));
  append_field(input, std::to_string(entry.timestamp_ms));
  append_field(input, std::to_string(entry.policy_refs.size()));
  for (const auto& ref : entry.policy_refs) {
    append_field(input, ref);
  }
  return input;
}

}  // namespace

void to_json(nlohmann::json& out, const LedgerEntry& entry) {
  out = nlohmann::json{
      {"proposal_id", entry.proposal_id},
      {"decision", entry.decision},
      {"risk_before", entry.risk_before},
      {"risk_after", entry.risk_after},
      {"prev_hash", entry.prev_hash},
      {"entry_hash", entry.entry_hash},
      {"timestamp", entry.timestamp_ms},
      {"policy_refs", entry.policy_refs},
  };
}

void from_json(const nlohmann::json& in, LedgerEntry& entry) {
  in.at("proposal_id").get_to(entry.proposal_id);
  in.at("decision").get_to(entry.decision);
  in.at("risk_before").get_to(entry.risk_before);
  in.at("risk_after").get_to(entry.risk_after);
  in.at("prev_hash").get_to(entry.prev_hash);
  in.at("entry_hash").get_to(entry.entry_hash);
  in.at("timestamp").get_to(entry.timestamp_ms);
  entry.policy_refs = in.value("policy_refs", std::vector<std::string>{});
}

HashChainMismatch::HashChainMismatch(const std::string& expected, const std::string& actual)
    : std::runtime_error("hash chain mismatch: expected tip " + expected + " but ledger tip is " + actual),
      actual_(actual) {}

ChainCorruption::ChainCorruption(const std::size_t index, const std::string& detail)
    : std::runtime_error("chain corruption at index " + std::to_string(index) + ": " + detail), index_(index) {}

std::string compute_entry_hash(const LedgerEntry& entry) {
  return sha256_hex(hash_input(entry));
}

void verify_entries(const std::vector<LedgerEntry>& entries, const std::string& genesis_hash) {
  const std::string* expected_prev = &genesis_hash;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const auto& entry = entries[i];
    if (entry.prev_hash != *expected_prev) {
      throw ChainCorruption(i, "prev_hash does not link to predecessor");
    }
    if (compute_entry_hash(entry) != entry.entry_hash) {
      throw ChainCorruption(i, "entry_hash does not match recomputation");
    }
    expected_prev = &entry.entry_hash;
  }
}

HashLedger::HashLedger(std::string genesis_hash, std::vector<LedgerEntry> history, std::string stream_path)
    : genesis_hash_(std::move(genesis_hash)), entries_(std::move(history)), stream_path_(std::move(stream_path)) {
  verify_entries(entries_, genesis_hash_);
  if (!stream_path_.empty()) {
    stream_.open(stream_path_, std::ios::out | std::ios::app);
    if (!stream_.is_open()) {
      throw std::runtime_error("unable to open ledger stream: " + stream_path_);
    }
  }
}

std::unique_ptr<HashLedger> HashLedger::load(const std::string& path, std::string genesis_hash) {
  auto history = read_stream(path);
  std::cerr << "[ledger] loaded " << history.size() << " entries from " << path << '\n';
  return std::make_unique<HashLedger>(std::move(genesis_hash), std::move(history), path);
}

std::vector<LedgerEntry> HashLedger::read_stream(const std::string& path) {
  std::vector<LedgerEntry> history;
  std::ifstream input(path);
  if (!input.is_open()) {
    return history;
  }

  std::string line;
  while (std::getline(input, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    try {
      history.push_back(nlohmann::json::parse(line).get<LedgerEntry>());
    } catch (const nlohmann::json::exception& ex) {
      throw ChainCorruption(history.size(), std::string("malformed ledger record: ") + ex.what());
    }
  }
  return history;
}

LedgerEntry HashLedger::append(const kernel::Decision& decision, const kernel::TransitionProposal& proposal,
                               const std::string& expected_prev_hash) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto& current_tip = tip_locked();
  if (expected_prev_hash != current_tip) {
    throw HashChainMismatch(expected_prev_hash, current_tip);
  }

  LedgerEntry entry{};
  entry.proposal_id = proposal.proposal_id;
  entry.decision = decision.to_string();
  entry.risk_before = proposal.risk_before;
  entry.risk_after = proposal.risk_after;
  entry.prev_hash = current_tip;
  entry.timestamp_ms = proposal.timestamp_ms;
  entry.policy_refs = proposal.policy_refs;
  entry.entry_hash = compute_entry_hash(entry);

  // Persist first so a failed write leaves the in-memory chain untouched.
  if (!persist(entry)) {
    throw std::runtime_error("failed to persist ledger entry to " + stream_path_);
  }
  entries_.push_back(entry);
  return entry;
}

LedgerEntry HashLedger::append_latest(const kernel::Decision& decision, const kernel::TransitionProposal& proposal,
                                      const std::uint32_t retries) {
  for (std::uint32_t attempt = 0;; ++attempt) {
    try {
      return append(decision, proposal, tip());
    } catch (const HashChainMismatch&) {
      if (attempt >= retries) {
        throw;
      }
      std::cerr << "[ledger] stale tip for " << proposal.proposal_id << "; retrying against fresh tip\n";
    }
  }
}

void HashLedger::verify_chain() const {
  std::lock_guard<std::mutex> lock(mutex_);
  verify_entries(entries_, genesis_hash_);
}

std::string HashLedger::tip() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tip_locked();
}

std::size_t HashLedger::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::optional<LedgerEntry> HashLedger::entry(const std::size_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= entries_.size()) {
    return std::nullopt;
  }
  return entries_[index];
}

std::vector<LedgerEntry> HashLedger::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

const std::string& HashLedger::tip_locked() const noexcept {
  return entries_.empty() ? genesis_hash_ : entries_.back().entry_hash;
}

bool HashLedger::persist(const LedgerEntry& entry) {
  if (!stream_.is_open()) {
    return true;
  }
  stream_ << nlohmann::json(entry).dump() << '\n';
  stream_.flush();
  return static_cast<bool>(stream_);
}

}  // namespace neuro_guard::ledger
