#pragma once

#include <cstddef>
#include <istream>
#include <optional>

#include <nlohmann/json.hpp>

#include "model/governance.hpp"
#include "model/signal_snapshot.hpp"
#include "model/transition_request.hpp"

namespace neuro_guard::sources {

struct SnapshotRecord {
  model::signal_snapshot snapshot{};
  std::optional<model::consent_state> consent{};  // replaces the session consent from this epoch on
  std::optional<model::transition_request> request{};
};

model::consent_state parse_consent(const nlohmann::json& in);
model::reversal_evidence parse_reversal(const nlohmann::json& in);
model::transition_request parse_request(const nlohmann::json& in);

// Throws std::runtime_error on a record that cannot be used.
SnapshotRecord parse_snapshot_record(const nlohmann::json& in, float default_epoch_duration_s);

// Line-oriented reader over the acquisition collaborator's JSONL stream.
class SnapshotReader {
 public:
  SnapshotReader(std::istream& input, float default_epoch_duration_s) noexcept;

  // Next usable record; malformed lines are logged, counted and skipped.
  std::optional<SnapshotRecord> next();

  [[nodiscard]] std::size_t skipped() const noexcept { return skipped_; }

 private:
  std::istream& input_;
  float default_epoch_duration_s_;
  std::size_t line_number_{0};
  std::size_t skipped_{0};
};

}  // namespace neuro_guard::sources
