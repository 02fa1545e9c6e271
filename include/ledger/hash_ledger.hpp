#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "kernel/capability_kernel.hpp"

namespace neuro_guard::ledger {

struct LedgerEntry {
  std::string proposal_id{};
  std::string decision{};
  double risk_before{0.0};
  double risk_after{0.0};
  std::string prev_hash{};
  std::string entry_hash{};
  std::uint64_t timestamp_ms{0};
  std::vector<std::string> policy_refs{};
};

void to_json(nlohmann::json& out, const LedgerEntry& entry);
void from_json(const nlohmann::json& in, LedgerEntry& entry);

// Caller's view of the tip is stale. Retry against the fresh tip.
class HashChainMismatch : public std::runtime_error {
 public:
  HashChainMismatch(const std::string& expected, const std::string& actual);

  [[nodiscard]] const std::string& actual_tip() const noexcept { return actual_; }

 private:
  std::string actual_;
};

// First entry whose link or hash does not recompute. Fatal for the session.
class ChainCorruption : public std::runtime_error {
 public:
  ChainCorruption(std::size_t index, const std::string& detail);

  [[nodiscard]] std::size_t index() const noexcept { return index_; }

 private:
  std::size_t index_;
};

// Hash over prev_hash, proposal_id, decision, risk_before, risk_after, timestamp, policy_refs.
std::string compute_entry_hash(const LedgerEntry& entry);

void verify_entries(const std::vector<LedgerEntry>& entries, const std::string& genesis_hash);

// Append-only hash chain. Appends are serialized; existing entries are never mutable from outside.
class HashLedger {
 public:
  explicit HashLedger(std::string genesis_hash, std::vector<LedgerEntry> history = {}, std::string stream_path = {});

  HashLedger(const HashLedger&) = delete;
  HashLedger& operator=(const HashLedger&) = delete;

  // Reads and verifies an existing ledger stream, then keeps appending to it.
  static std::unique_ptr<HashLedger> load(const std::string& path, std::string genesis_hash);
  static std::vector<LedgerEntry> read_stream(const std::string& path);

  LedgerEntry append(const kernel::Decision& decision, const kernel::TransitionProposal& proposal,
                     const std::string& expected_prev_hash);
  LedgerEntry append_latest(const kernel::Decision& decision, const kernel::TransitionProposal& proposal,
                            std::uint32_t retries);

  void verify_chain() const;

  [[nodiscard]] std::string tip() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::optional<LedgerEntry> entry(std::size_t index) const;
  [[nodiscard]] std::vector<LedgerEntry> entries() const;
  [[nodiscard]] const std::string& genesis_hash() const noexcept { return genesis_hash_; }

 private:
  [[nodiscard]] const std::string& tip_locked() const noexcept;
  bool persist(const LedgerEntry& entry);

  mutable std::mutex mutex_;
  std::string genesis_hash_;
  std::vector<LedgerEntry> entries_;
  std::string stream_path_;
  std::ofstream stream_;
};

// Const-only window onto a ledger, handed to diagnostics.
class LedgerReader {
 public:
  explicit LedgerReader(const HashLedger& ledger) noexcept : ledger_(&ledger) {}

  [[nodiscard]] std::size_t size() const { return ledger_->size(); }
  [[nodiscard]] std::string tip() const { return ledger_->tip(); }
  [[nodiscard]] std::optional<LedgerEntry> entry(std::size_t index) const { return ledger_->entry(index); }
  [[nodiscard]] std::vector<LedgerEntry> entries() const { return ledger_->entries(); }
  void verify() const { ledger_->verify_chain(); }

 private:
  const HashLedger* ledger_;
};

}  // namespace neuro_guard::ledger
