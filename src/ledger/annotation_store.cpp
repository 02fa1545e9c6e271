#include "ledger/annotation_store.hpp"

namespace neuro_guard::ledger {

void AnnotationStore::put(const model::diagnostic_annotation& annotation) {
  std::lock_guard<std::mutex> lock(mutex_);
  by_proposal_[annotation.proposal_id] = annotation;
  epoch_index_[annotation.epoch_index] = annotation.proposal_id;
}

std::optional<model::diagnostic_annotation> AnnotationStore::by_proposal(const std::string& proposal_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = by_proposal_.find(proposal_id);
  if (it == by_proposal_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<model::diagnostic_annotation> AnnotationStore::by_epoch(const std::uint64_t epoch_index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto key = epoch_index_.find(epoch_index);
  if (key == epoch_index_.end()) {
    return std::nullopt;
  }
  const auto it = by_proposal_.find(key->second);
  if (it == by_proposal_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t AnnotationStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return by_proposal_.size();
}

}  // namespace neuro_guard::ledger
