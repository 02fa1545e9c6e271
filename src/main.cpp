#include <csignal>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/config.hpp"
#include "core/session.hpp"
#include "ledger/hash_ledger.hpp"
#include "sources/snapshot_reader.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const neuro_guard::core::SessionConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[session] loaded config from " << config_path
         << " | session_id=" << config.session.id
         << " | initial_tier=" << neuro_guard::model::tier_name(config.session.initial_tier)
         << " | axes=" << config.axes.size()
         << " | warn_epochs_to_flag=" << config.hysteresis.warn_epochs_to_flag
         << " | risk_epochs_to_downgrade=" << config.hysteresis.risk_epochs_to_downgrade
         << " | global_ceiling=" << config.policy.global_ceiling()
         << " | ledger=" << (config.ledger.path.empty() ? "memory" : config.ledger.path)
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  if (argc < 3) {
    std::cerr << "usage: neuro-guard <config.yaml> <snapshots.jsonl>\n";
    return 2;
  }
  const std::string config_path = argv[1];
  const std::string input_path = argv[2];

  neuro_guard::core::SessionConfig config{};
  try {
    config = neuro_guard::core::load_session_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  std::ifstream input(input_path);
  if (!input.is_open()) {
    std::cerr << "input error: unable to open " << input_path << '\n';
    return 1;
  }

  try {
    neuro_guard::core::Session session{config};
    neuro_guard::sources::SnapshotReader reader{input, config.session.default_epoch_duration_s};

    while (g_shutdown_requested == 0) {
      auto record = reader.next();
      if (!record.has_value()) {
        break;
      }
      if (record->consent.has_value()) {
        session.update_consent(*record->consent);
      }

      try {
        session.process_epoch(record->snapshot, record->request);
      } catch (const std::invalid_argument& ex) {
        std::cerr << "[session] rejected: " << ex.what() << '\n';
      }
    }

    if (g_shutdown_requested != 0) {
      std::cerr << "[session] shutdown signal received; draining overlay\n";
    }
    session.drain_overlay();
    session.verify_ledger();

    const auto& stats = session.stats();
    const auto overlay = session.overlay_stats();
    const auto view = session.kernel_view();
    std::cerr << "[session] epochs=" << stats.epochs << " accepted=" << stats.accepted << " denied=" << stats.denied
              << " risk_violations=" << stats.risk_violations << " skipped_lines=" << reader.skipped()
              << " annotations=" << overlay.processed << " annotation_failures=" << overlay.failed
              << " annotation_drops=" << overlay.dropped << " final_tier=" << neuro_guard::model::tier_name(view.tier)
              << " final_roh=" << view.risk << '\n';
  } catch (const neuro_guard::core::IngestionHalted& ex) {
    std::cerr << ex.what() << '\n';
    return 3;
  } catch (const neuro_guard::ledger::ChainCorruption& ex) {
    std::cerr << "ledger audit required: " << ex.what() << '\n';
    return 3;
  } catch (const std::exception& ex) {
    std::cerr << "session error: " << ex.what() << '\n';
    return 1;
  }

  return 0;
}
