#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>

#include "core/config.hpp"
#include "core/timestamp.hpp"
#include "kernel/capability_kernel.hpp"
#include "ledger/annotation_store.hpp"
#include "ledger/hash_ledger.hpp"
#include "model/asset_vector.hpp"
#include "model/axis_state.hpp"
#include "model/epoch_record.hpp"
#include "model/signal_snapshot.hpp"
#include "model/transition_request.hpp"
#include "overlay/overlay_worker.hpp"
#include "risk/hysteresis.hpp"
#include "sinks/jsonl_writer.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

namespace neuro_guard::core {

// Raised for every submission after chain corruption until an audit re-verifies the chain.
class IngestionHalted : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Raised at construction when a persisted chain exists but the epoch cursor and committed tier
// cannot be replayed from the proposal log.
class ResumeRefused : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct SessionStats {
  std::size_t epochs{0};
  std::size_t accepted{0};
  std::size_t denied{0};
  std::size_t risk_violations{0};
  std::size_t proposal_log_errors{0};
  std::size_t redis_errors{0};
};

struct EpochOutcome {
  kernel::TransitionProposal proposal{};
  kernel::Decision decision{};
  ledger::LedgerEntry entry{};
  model::severity_view severities{};
  model::asset_vector assets{};
};

// One monitored subject. Single writer: epochs are processed strictly in order on the caller's thread.
class Session {
 public:
  explicit Session(SessionConfig config, Clock clock = system_clock_ms());
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  EpochOutcome process_epoch(const model::signal_snapshot& snapshot,
                             const std::optional<model::transition_request>& request = std::nullopt);

  void update_consent(model::consent_state consent);

  // Re-verifies the in-memory chain and, when persisted, the ledger stream on disk.
  // Corruption halts ingestion and is rethrown.
  void verify_ledger();
  void resume_after_audit();

  void drain_overlay();

  [[nodiscard]] bool halted() const noexcept { return halted_; }
  [[nodiscard]] kernel::KernelStateView kernel_view() const noexcept;
  [[nodiscard]] ledger::LedgerReader ledger_reader() const noexcept { return ledger::LedgerReader(*ledger_); }
  [[nodiscard]] const ledger::AnnotationStore& annotations() const noexcept { return annotations_; }
  [[nodiscard]] overlay::OverlayStats overlay_stats() const { return overlay_->stats(); }
  [[nodiscard]] const SessionStats& stats() const noexcept { return stats_; }
  [[nodiscard]] const SessionConfig& config() const noexcept { return config_; }

 private:
  kernel::TransitionProposal build_proposal(const model::signal_snapshot& snapshot,
                                            const std::optional<model::transition_request>& request,
                                            double risk_after) const;
  void restore_committed_state();
  double account_risk(const model::severity_view& severities);
  void write_proposal_log(const kernel::TransitionProposal& proposal, const kernel::Decision& decision);
  void publish_sinks(const model::epoch_record& record);

  SessionConfig config_;
  Clock clock_;
  risk::HysteresisEvaluator hysteresis_{};
  model::capability_tier tier_;
  double risk_{0.0};
  std::optional<model::consent_state> consent_{};
  std::optional<std::uint64_t> last_epoch_{};
  std::uint64_t epochs_since_verify_{0};
  bool halted_{false};
  SessionStats stats_{};

  std::unique_ptr<ledger::HashLedger> ledger_{};
  ledger::AnnotationStore annotations_{};
  // Declared after the ledger and store it reads so it is joined before they go away.
  std::unique_ptr<overlay::OverlayWorker> overlay_{};

  std::unique_ptr<sinks::JsonlWriter> proposal_log_{};
  bool proposal_log_was_ok_{true};
  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  bool redis_was_ok_{true};
};

}  // namespace neuro_guard::core
