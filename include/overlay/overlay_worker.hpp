#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "ledger/annotation_store.hpp"
#include "ledger/hash_ledger.hpp"
#include "model/asset_vector.hpp"
#include "model/axis_state.hpp"
#include "overlay/diagnostic_overlay.hpp"
#include "sinks/jsonl_writer.hpp"

namespace neuro_guard::overlay {

// What the session hands over after a commit. Resolved against the ledger on the worker thread.
struct OverlayInput {
  std::size_t ledger_index{0};
  std::uint64_t epoch_index{0};
  model::asset_vector assets{};
  model::severity_view severities{};
  double tier_ceiling{0.0};
  float epoch_duration_s{0.0F};
};

struct OverlayStats {
  std::size_t processed{0};
  std::size_t failed{0};
  std::size_t dropped{0};
};

// Runs the overlay on its own thread. submit() never waits on computation;
// a full queue drops its oldest input.
class OverlayWorker {
 public:
  OverlayWorker(core::OverlayConfig config, ledger::LedgerReader reader, ledger::AnnotationStore& store,
                const std::string& annotation_log = {});
  ~OverlayWorker();

  OverlayWorker(const OverlayWorker&) = delete;
  OverlayWorker& operator=(const OverlayWorker&) = delete;

  void submit(OverlayInput input);

  // Blocks the caller until every queued input has been handled. Shutdown and tests only.
  void drain();
  void stop();

  [[nodiscard]] OverlayStats stats() const;

 private:
  void run();
  void process(const OverlayInput& input);

  std::size_t max_queue_;
  DiagnosticOverlay overlay_;
  ledger::LedgerReader reader_;
  ledger::AnnotationStore& store_;
  std::unique_ptr<sinks::JsonlWriter> annotation_log_{};
  bool log_was_ok_{true};

  mutable std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<OverlayInput> queue_{};
  bool busy_{false};
  bool stopping_{false};
  OverlayStats stats_{};
  std::thread thread_;
};

}  // namespace neuro_guard::overlay
