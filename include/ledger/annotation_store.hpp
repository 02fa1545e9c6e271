#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "model/annotation.hpp"

namespace neuro_guard::ledger {

// Side table for diagnostic annotations, keyed by proposal id and epoch.
// Kept apart from HashLedger so nothing here can reach entry hashes.
class AnnotationStore {
 public:
  void put(const model::diagnostic_annotation& annotation);

  [[nodiscard]] std::optional<model::diagnostic_annotation> by_proposal(const std::string& proposal_id) const;
  [[nodiscard]] std::optional<model::diagnostic_annotation> by_epoch(std::uint64_t epoch_index) const;
  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, model::diagnostic_annotation> by_proposal_;
  std::map<std::uint64_t, std::string> epoch_index_;
};

}  // namespace neuro_guard::ledger
