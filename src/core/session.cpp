#include "core/session.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "derived/asset_engine.hpp"
#include "risk/risk_accountant.hpp"
#include "sinks/proposal_log.hpp"

namespace neuro_guard::core {
namespace {

std::unique_ptr<ledger::HashLedger> open_ledger(const LedgerConfig& config) {
  if (config.path.empty()) {
    return std::make_unique<ledger::HashLedger>(config.genesis_hash);
  }
  return ledger::HashLedger::load(config.path, config.genesis_hash);
}

// Highest committed risk in a restored chain; accepted entries only.
double restored_risk(const std::vector<ledger::LedgerEntry>& entries) {
  double risk = 0.0;
  for (const auto& entry : entries) {
    if (entry.decision == "ACCEPT") {
      risk = std::max(risk, entry.risk_after);
    }
  }
  return risk;
}

std::vector<model::channel> monitored_axes(const SessionConfig& config) {
  std::vector<model::channel> axes;
  axes.reserve(config.axes.size());
  for (const auto& axis : config.axes) {
    axes.push_back(axis.axis);
  }
  return axes;
}

}  // namespace

Session::Session(SessionConfig config, Clock clock)
    : config_(std::move(config)), clock_(clock ? std::move(clock) : system_clock_ms()), tier_(config_.session.initial_tier) {
  ledger_ = open_ledger(config_.ledger);
  if (ledger_->size() > 0) {
    restore_committed_state();
  }

  overlay_ = std::make_unique<overlay::OverlayWorker>(config_.overlay, ledger::LedgerReader(*ledger_), annotations_,
                                                      config_.outputs.annotation_log);

  if (!config_.outputs.proposal_log.empty()) {
    proposal_log_ = std::make_unique<sinks::JsonlWriter>(config_.outputs.proposal_log);
  }

  if (config_.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = config_.redis.host;
    options.port = config_.redis.port;
    options.unix_socket = config_.redis.unix_socket;
    options.key_prefix = config_.redis.key_prefix + ":" + config_.session.id;
    options.axes = monitored_axes(config_);
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);

    const std::string address =
        !options.unix_socket.empty() ? "unix://" + options.unix_socket : options.host + ":" + std::to_string(options.port);
    if (redis_sink_->check_connectivity()) {
      std::cerr << "[session] redis connectivity confirmed at " << address << '\n';
    } else {
      std::cerr << "[session] redis connectivity check failed at " << address << '\n';
    }
  }
}

Session::~Session() {
  overlay_->stop();
}

EpochOutcome Session::process_epoch(const model::signal_snapshot& snapshot,
                                    const std::optional<model::transition_request>& request) {
  if (halted_) {
    throw IngestionHalted("session " + config_.session.id + " halted pending ledger audit");
  }
  if (last_epoch_.has_value() && snapshot.epoch_index <= *last_epoch_) {
    throw std::invalid_argument("epoch " + std::to_string(snapshot.epoch_index) + " is not after epoch " +
                                std::to_string(*last_epoch_));
  }

  const auto verify_every = config_.ledger.verify_every_epochs;
  if (verify_every > 0 && epochs_since_verify_ >= verify_every) {
    try {
      verify_ledger();
    } catch (const ledger::ChainCorruption& ex) {
      throw IngestionHalted(std::string("ingestion halted: ") + ex.what());
    }
  }

  EpochOutcome outcome{};
  hysteresis_.sample(config_, snapshot);
  outcome.severities = hysteresis_.severities(config_);

  const double risk_after = account_risk(outcome.severities);
  outcome.proposal = build_proposal(snapshot, request, risk_after);
  outcome.decision = kernel::evaluate(outcome.proposal, config_.policy);
  outcome.entry = ledger_->append_latest(outcome.decision, outcome.proposal, config_.ledger.append_retries);
  const std::size_t ledger_index = ledger_->size() - 1;

  // Kernel state moves only on a committed ACCEPT.
  if (outcome.decision.accepted()) {
    if (outcome.proposal.to != tier_) {
      std::cerr << "[session] tier " << model::tier_name(tier_) << " -> " << model::tier_name(outcome.proposal.to)
                << " (" << outcome.proposal.proposal_id << ")\n";
    }
    tier_ = outcome.proposal.to;
    risk_ = outcome.proposal.risk_after;
    ++stats_.accepted;
  } else {
    ++stats_.denied;
    if (request.has_value()) {
      std::cerr << "[session] " << outcome.proposal.proposal_id << " denied: " << outcome.decision.to_string() << '\n';
    }
  }
  last_epoch_ = snapshot.epoch_index;
  ++epochs_since_verify_;
  ++stats_.epochs;

  write_proposal_log(outcome.proposal, outcome.decision);

  derived::AssetContext context{};
  context.risk = risk_;
  context.tier = tier_;
  context.ceiling = config_.policy.ceiling(tier_);
  context.epoch_index = snapshot.epoch_index;
  context.severities = outcome.severities;
  outcome.assets = derived::derive(snapshot, context, config_);

  model::epoch_record record{};
  record.epoch_index = snapshot.epoch_index;
  record.timestamp_ms = outcome.proposal.timestamp_ms;
  record.risk = risk_;
  record.tier = tier_;
  record.accepted = outcome.decision.accepted();
  for (const auto& [axis, level] : outcome.severities) {
    record.severities[model::channel_index(axis)] = level;
    record.monitored[model::channel_index(axis)] = true;
  }
  record.assets = outcome.assets;
  publish_sinks(record);

  overlay::OverlayInput input{};
  input.ledger_index = ledger_index;
  input.epoch_index = snapshot.epoch_index;
  input.assets = outcome.assets;
  input.severities = outcome.severities;
  input.tier_ceiling = config_.policy.ceiling(outcome.proposal.to);
  input.epoch_duration_s = snapshot.epoch_duration_s > 0.0F ? snapshot.epoch_duration_s
                                                            : config_.session.default_epoch_duration_s;
  overlay_->submit(std::move(input));

  return outcome;
}

void Session::update_consent(model::consent_state consent) {
  consent_ = std::move(consent);
}

void Session::verify_ledger() {
  try {
    ledger_->verify_chain();
    if (!config_.ledger.path.empty()) {
      const auto persisted = ledger::HashLedger::read_stream(config_.ledger.path);
      ledger::verify_entries(persisted, config_.ledger.genesis_hash);
      if (persisted.size() != ledger_->size()) {
        throw ledger::ChainCorruption(std::min(persisted.size(), ledger_->size()),
                                      "ledger stream holds " + std::to_string(persisted.size()) + " entries, session holds " +
                                          std::to_string(ledger_->size()));
      }
    }
  } catch (const ledger::ChainCorruption& ex) {
    if (!halted_) {
      std::cerr << "[ledger] " << ex.what() << "; halting ingestion for session " << config_.session.id << '\n';
    }
    halted_ = true;
    throw;
  }
  epochs_since_verify_ = 0;
}

void Session::resume_after_audit() {
  verify_ledger();
  if (halted_) {
    std::cerr << "[ledger] chain re-verified; resuming ingestion for session " << config_.session.id << '\n';
  }
  halted_ = false;
}

void Session::drain_overlay() {
  overlay_->drain();
}

kernel::KernelStateView Session::kernel_view() const noexcept {
  return kernel::KernelStateView{tier_, risk_, config_.policy.ceiling(tier_)};
}

kernel::TransitionProposal Session::build_proposal(const model::signal_snapshot& snapshot,
                                                   const std::optional<model::transition_request>& request,
                                                   const double risk_after) const {
  kernel::TransitionProposal proposal{};
  proposal.epoch_index = snapshot.epoch_index;
  proposal.from = tier_;
  proposal.to = tier_;
  proposal.proposer = config_.session.hold_proposer;
  proposal.jurisdiction = config_.session.jurisdiction;
  proposal.policy_refs = config_.session.policy_refs;
  proposal.risk_before = risk_;
  proposal.risk_after = risk_after;
  proposal.timestamp_ms = clock_();
  if (consent_.has_value()) {
    proposal.consent = *consent_;
  }

  if (request.has_value()) {
    proposal.to = request->to;
    proposal.proposer = request->proposer;
    proposal.policy_refs.insert(proposal.policy_refs.end(), request->policy_refs.begin(), request->policy_refs.end());
    if (request->jurisdiction.has_value()) {
      proposal.jurisdiction = *request->jurisdiction;
    }
    if (request->consent.has_value()) {
      proposal.consent = *request->consent;
    }
    proposal.reversal = request->reversal;
  }

  proposal.proposal_id = request.has_value() && !request->proposal_id.empty()
                             ? request->proposal_id
                             : config_.session.id + "-" + std::to_string(snapshot.epoch_index);
  return proposal;
}

void Session::restore_committed_state() {
  const std::string& log_path = config_.outputs.proposal_log;
  if (log_path.empty()) {
    throw ResumeRefused("session " + config_.session.id + ": ledger holds " + std::to_string(ledger_->size()) +
                        " entries but outputs.proposal_log is not configured");
  }
  const auto state = sinks::read_proposal_log_state(log_path);
  if (!state.has_value()) {
    throw ResumeRefused("session " + config_.session.id + ": proposal log " + log_path + " is missing or empty");
  }

  const auto tip_entry = ledger_->entry(ledger_->size() - 1);
  if (!tip_entry.has_value() || tip_entry->proposal_id != state->last_proposal_id) {
    throw ResumeRefused("session " + config_.session.id + ": proposal log ends at '" + state->last_proposal_id +
                        "' but the ledger tip is '" + (tip_entry.has_value() ? tip_entry->proposal_id : "") + "'");
  }

  risk_ = restored_risk(ledger_->entries());
  last_epoch_ = state->last_epoch;
  if (state->committed_tier.has_value()) {
    tier_ = *state->committed_tier;
  }
  std::cerr << "[session] resuming chain with " << ledger_->size() << " verified entries; last epoch=" << *last_epoch_
            << " tier=" << model::tier_name(tier_) << " committed roh=" << risk_ << '\n';
}

double Session::account_risk(const model::severity_view& severities) {
  try {
    return risk::compute_risk(severities, config_, risk_);
  } catch (const risk::RiskMonotonicityViolation& ex) {
    // Carried into the proposal unchanged so the kernel denies it and the ledger records why.
    ++stats_.risk_violations;
    std::cerr << "[session] " << ex.what() << '\n';
    return ex.computed();
  }
}

void Session::write_proposal_log(const kernel::TransitionProposal& proposal, const kernel::Decision& decision) {
  if (proposal_log_ == nullptr) {
    return;
  }

  const bool ok = proposal_log_->write(sinks::proposal_log_record(proposal, decision));
  if (!ok) {
    ++stats_.proposal_log_errors;
    if (proposal_log_was_ok_) {
      std::cerr << "[session] proposal log write failed: " << proposal_log_->path() << '\n';
      proposal_log_was_ok_ = false;
    }
  } else if (!proposal_log_was_ok_) {
    std::cerr << "[session] proposal log write recovered\n";
    proposal_log_was_ok_ = true;
  }
}

void Session::publish_sinks(const model::epoch_record& record) {
  if (config_.stdout_debug) {
    stdout_sink_.publish(record);
  }

  if (redis_sink_ != nullptr) {
    const bool ok = redis_sink_->publish(record);
    if (!ok) {
      ++stats_.redis_errors;
      if (redis_was_ok_) {
        std::cerr << "[redis] publish failed\n";
        redis_was_ok_ = false;
      }
    } else if (!redis_was_ok_) {
      std::cerr << "[redis] publish recovered\n";
      redis_was_ok_ = true;
    }
  }
}

}  // namespace neuro_guard::core
