#include "overlay/overlay_worker.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace neuro_guard::overlay {

OverlayWorker::OverlayWorker(core::OverlayConfig config, const ledger::LedgerReader reader, ledger::AnnotationStore& store,
                             const std::string& annotation_log)
    : max_queue_(config.max_queue > 0 ? config.max_queue : 1),
      overlay_(std::move(config)),
      reader_(reader),
      store_(store) {
  if (!annotation_log.empty()) {
    annotation_log_ = std::make_unique<sinks::JsonlWriter>(annotation_log);
  }
  thread_ = std::thread([this] { run(); });
}

OverlayWorker::~OverlayWorker() {
  stop();
}

void OverlayWorker::submit(OverlayInput input) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }
    if (queue_.size() >= max_queue_) {
      queue_.pop_front();
      if (stats_.dropped++ == 0) {
        std::cerr << "[overlay] queue full; dropping oldest epochs\n";
      }
    }
    queue_.push_back(std::move(input));
  }
  work_cv_.notify_one();
}

void OverlayWorker::drain() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void OverlayWorker::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  work_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  idle_cv_.notify_all();
}

OverlayStats OverlayWorker::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void OverlayWorker::run() {
  while (true) {
    OverlayInput input;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      // Pending inputs are still annotated on stop.
      if (queue_.empty()) {
        break;
      }
      input = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }

    bool ok = true;
    try {
      process(input);
    } catch (const DiagnosticComputationError& ex) {
      std::cerr << "[overlay] epoch " << input.epoch_index << " annotation absent: " << ex.what() << '\n';
      ok = false;
    } catch (const std::exception& ex) {
      std::cerr << "[overlay] epoch " << input.epoch_index << " annotation failed: " << ex.what() << '\n';
      ok = false;
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++(ok ? stats_.processed : stats_.failed);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }
}

void OverlayWorker::process(const OverlayInput& input) {
  const auto entry = reader_.entry(input.ledger_index);
  if (!entry.has_value()) {
    throw DiagnosticComputationError("ledger entry " + std::to_string(input.ledger_index) + " not committed");
  }

  OverlayEpoch epoch{};
  epoch.entry = *entry;
  epoch.epoch_index = input.epoch_index;
  epoch.assets = input.assets;
  epoch.severities = input.severities;
  epoch.tier_ceiling = input.tier_ceiling;
  epoch.epoch_duration_s = input.epoch_duration_s;
  const auto annotation = overlay_.annotate(epoch);

  store_.put(annotation);
  if (annotation_log_ != nullptr) {
    const bool ok = annotation_log_->write(annotation_to_json(annotation));
    if (!ok && log_was_ok_) {
      std::cerr << "[overlay] annotation stream write failed: " << annotation_log_->path() << '\n';
      log_was_ok_ = false;
    } else if (ok && !log_was_ok_) {
      std::cerr << "[overlay] annotation stream write recovered\n";
      log_was_ok_ = true;
    }
  }
}

}  // namespace neuro_guard::overlay
