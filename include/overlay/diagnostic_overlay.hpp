#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "ledger/hash_ledger.hpp"
#include "model/annotation.hpp"
#include "model/asset_vector.hpp"
#include "model/axis_state.hpp"

namespace neuro_guard::overlay {

// Per-epoch overlay failure. Caught by the worker; the epoch simply has no annotation.
class DiagnosticComputationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Everything the overlay sees for one epoch, by value.
struct OverlayEpoch {
  ledger::LedgerEntry entry{};
  std::uint64_t epoch_index{0};
  model::asset_vector assets{};
  model::severity_view severities{};
  double tier_ceiling{0.0};
  float epoch_duration_s{0.0F};
};

// Concurrent risk transition was monotone and within the tier ceiling.
bool row_guard_holds(const ledger::LedgerEntry& entry, double tier_ceiling) noexcept;

// ROW = (DECAY(t) - DECAY(t-1)) / dt. Empty when the guard fails or dt is unusable; never zero-filled.
std::optional<double> compute_row(double decay_prev, double decay_cur, double dt_s, bool guard_ok) noexcept;

model::severity gamma_wave_state(const model::asset_vector& assets, const model::severity_view& severities,
                                 const core::OverlayConfig& config) noexcept;

class DiagnosticOverlay {
 public:
  explicit DiagnosticOverlay(core::OverlayConfig config);

  model::diagnostic_annotation annotate(const OverlayEpoch& epoch);

 private:
  struct WindowSample {
    model::asset_vector assets;
    model::severity gamma;
    bool overloaded;
  };

  [[nodiscard]] bool overloaded(const model::asset_vector& assets) const noexcept;
  [[nodiscard]] bool calm(const model::asset_vector& assets) const noexcept;
  [[nodiscard]] bool recovering() const noexcept;
  void append_window_tags(model::diagnostic_annotation& annotation) const;

  core::OverlayConfig config_;
  std::deque<WindowSample> window_{};
  std::optional<std::uint64_t> last_epoch_{};
  float last_decay_{0.0F};
};

nlohmann::json annotation_to_json(const model::diagnostic_annotation& annotation);

}  // namespace neuro_guard::overlay
