#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "core/config.hpp"
#include "kernel/capability_kernel.hpp"
#include "ledger/annotation_store.hpp"
#include "ledger/hash_ledger.hpp"
#include "overlay/diagnostic_overlay.hpp"
#include "overlay/overlay_worker.hpp"

using neuro_guard::core::OverlayConfig;
using neuro_guard::ledger::AnnotationStore;
using neuro_guard::ledger::HashLedger;
using neuro_guard::ledger::LedgerEntry;
using neuro_guard::ledger::LedgerReader;
using neuro_guard::model::asset;
using neuro_guard::model::asset_vector;
using neuro_guard::model::diagnostic_annotation;
using neuro_guard::model::has_tag;
using neuro_guard::model::nature_tag;
using neuro_guard::model::row_state;
using neuro_guard::model::severity;
using neuro_guard::overlay::DiagnosticComputationError;
using neuro_guard::overlay::DiagnosticOverlay;
using neuro_guard::overlay::OverlayEpoch;
using neuro_guard::overlay::OverlayInput;
using neuro_guard::overlay::OverlayWorker;
using neuro_guard::overlay::compute_row;

namespace {

bool almost_equal(double a, double b, double epsilon = 1e-6) {
  return std::fabs(a - b) <= epsilon;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

// Mid-range vector: not calm, not overloaded, below the activation threshold.
asset_vector assets_with(const float wave, const float decay) {
  asset_vector out{};
  out.values.fill(0.5F);
  out.set(asset::WAVE, wave);
  out.set(asset::DECAY, decay);
  out.set(asset::LIFEFORCE, 1.0F - decay);
  return out;
}

LedgerEntry entry_for(const std::uint64_t epoch, const double before, const double after) {
  LedgerEntry entry{};
  entry.proposal_id = "subject-7-" + std::to_string(epoch);
  entry.decision = "ACCEPT";
  entry.risk_before = before;
  entry.risk_after = after;
  return entry;
}

OverlayEpoch epoch_at(const std::uint64_t index, const asset_vector& assets, const double before = 0.1,
                      const double after = 0.1) {
  OverlayEpoch epoch{};
  epoch.entry = entry_for(index, before, after);
  epoch.epoch_index = index;
  epoch.assets = assets;
  epoch.assets.epoch_index = index;
  epoch.tier_ceiling = 0.30;
  epoch.epoch_duration_s = 5.0F;
  return epoch;
}

int test_row_worked_examples() {
  const auto rising = compute_row(0.60, 0.70, 5.0, true);
  if (!rising.has_value() || !almost_equal(*rising, 0.02)) {
    return fail("test_row_worked_examples", "DECAY 0.60 -> 0.70 over 5 s should give ROW 0.02");
  }
  const auto falling = compute_row(0.60, 0.55, 5.0, true);
  if (!falling.has_value() || !almost_equal(*falling, -0.01)) {
    return fail("test_row_worked_examples", "DECAY 0.60 -> 0.55 over 5 s should give ROW -0.01");
  }
  if (compute_row(0.60, 0.70, 5.0, false).has_value()) {
    return fail("test_row_worked_examples", "failed guard must leave ROW undefined");
  }
  if (compute_row(0.60, 0.70, 0.0, true).has_value()) {
    return fail("test_row_worked_examples", "zero dt must leave ROW undefined");
  }
  return 0;
}

int test_row_states() {
  DiagnosticOverlay overlay{OverlayConfig{}};

  const auto first = overlay.annotate(epoch_at(1, assets_with(0.70F, 0.60F)));
  if (first.row_status != row_state::NO_HISTORY || first.row.has_value()) {
    return fail("test_row_states", "first epoch has no history");
  }
  if (!neuro_guard::overlay::annotation_to_json(first)["diagnostics"]["row"].is_null()) {
    return fail("test_row_states", "undefined ROW must serialize as null");
  }

  const auto quiet = overlay.annotate(epoch_at(2, assets_with(0.30F, 0.60F)));
  if (quiet.row_status != row_state::INACTIVE || quiet.row.has_value()) {
    return fail("test_row_states", "WAVE below threshold must be INACTIVE");
  }

  const auto unguarded = overlay.annotate(epoch_at(3, assets_with(0.70F, 0.60F), 0.20, 0.10));
  if (unguarded.row_status != row_state::GUARD_FAILED || unguarded.row.has_value()) {
    return fail("test_row_states", "decreasing concurrent risk must fail the guard");
  }

  const auto over_ceiling = overlay.annotate(epoch_at(4, assets_with(0.70F, 0.60F), 0.20, 0.35));
  if (over_ceiling.row_status != row_state::GUARD_FAILED) {
    return fail("test_row_states", "risk above tier ceiling must fail the guard");
  }

  const auto defined = overlay.annotate(epoch_at(5, assets_with(0.70F, 0.80F)));
  if (defined.row_status != row_state::DEFINED || !defined.row.has_value() || !almost_equal(*defined.row, 0.04, 1e-5)) {
    return fail("test_row_states", "expected ROW 0.04 once active and guarded");
  }
  if (!has_tag(defined, nature_tag::ROW_HIGH)) {
    return fail("test_row_states", "ROW above row_high must be tagged ROW_HIGH");
  }
  const auto json = neuro_guard::overlay::annotation_to_json(defined);
  if (json["diagnostics"]["row_state"] != "DEFINED" || json["tree_of_life_view"].size() != 15 ||
      json["diagnostics"]["tag_schema_version"] != 1) {
    return fail("test_row_states", "annotation JSON shape mismatch");
  }

  // Dropped epochs widen dt instead of being bridged.
  const auto widened = overlay.annotate(epoch_at(7, assets_with(0.70F, 0.50F)));
  if (!widened.row.has_value() || !almost_equal(*widened.row, -0.03, 1e-5) || !has_tag(widened, nature_tag::ROW_RECOVERY)) {
    return fail("test_row_states", "gap of two epochs should use dt of 10 s");
  }

  bool threw = false;
  try {
    (void)overlay.annotate(epoch_at(6, assets_with(0.70F, 0.60F)));
  } catch (const DiagnosticComputationError&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_row_states", "out-of-order epoch must be rejected");
  }

  return 0;
}

int test_state_tags() {
  DiagnosticOverlay overlay{OverlayConfig{}};

  asset_vector calm = assets_with(0.30F, 0.10F);
  calm.set(asset::FEAR, 0.10F);
  calm.set(asset::PAIN, 0.10F);
  const auto calm_annotation = overlay.annotate(epoch_at(1, calm));
  if (!has_tag(calm_annotation, nature_tag::CALM_STABLE) || has_tag(calm_annotation, nature_tag::OVERLOADED)) {
    return fail("test_state_tags", "calm assets should be CALM_STABLE");
  }

  asset_vector strained = calm;
  strained.set(asset::FEAR, 0.90F);
  const auto strained_annotation = overlay.annotate(epoch_at(2, strained));
  if (!has_tag(strained_annotation, nature_tag::OVERLOADED) || has_tag(strained_annotation, nature_tag::CALM_STABLE)) {
    return fail("test_state_tags", "FEAR above threshold should be OVERLOADED only");
  }

  DiagnosticOverlay recovery{OverlayConfig{}};
  asset_vector heavy = assets_with(0.30F, 0.80F);
  heavy.set(asset::FEAR, 0.20F);
  heavy.set(asset::PAIN, 0.20F);
  asset_vector easing = assets_with(0.30F, 0.30F);
  easing.set(asset::FEAR, 0.20F);
  easing.set(asset::PAIN, 0.20F);
  (void)recovery.annotate(epoch_at(1, heavy));
  (void)recovery.annotate(epoch_at(2, heavy));
  (void)recovery.annotate(epoch_at(3, easing));
  const auto recovering = recovery.annotate(epoch_at(4, easing));
  if (!has_tag(recovering, nature_tag::RECOVERY) || has_tag(recovering, nature_tag::CALM_STABLE)) {
    return fail("test_state_tags", "overloaded history followed by easing should be RECOVERY");
  }

  return 0;
}

int test_window_tags() {
  OverlayConfig config{};
  config.window_epochs = 4;
  DiagnosticOverlay overlay{config};

  asset_vector surge = assets_with(0.90F, 0.20F);
  surge.set(asset::POWER, 0.80F);
  const auto first = overlay.annotate(epoch_at(1, surge));
  if (first.gamma_wave_state != severity::RISK || !has_tag(first, nature_tag::GAMMA_OVERLOAD) ||
      !has_tag(first, nature_tag::COGNITIVE_OVERLOAD)) {
    return fail("test_window_tags", "high WAVE and POWER should tag gamma and cognitive overload");
  }

  const asset_vector idle = assets_with(0.10F, 0.20F);
  (void)overlay.annotate(epoch_at(2, idle));
  const auto third = overlay.annotate(epoch_at(3, idle));
  if (has_tag(third, nature_tag::GAMMA_OVERLOAD)) {
    return fail("test_window_tags", "one RISK epoch in three is not a gamma overload");
  }

  OverlayEpoch gamma_axis = epoch_at(4, idle);
  gamma_axis.severities = {{neuro_guard::model::channel::GAMMA_POWER, severity::WARN}};
  if (overlay.annotate(gamma_axis).gamma_wave_state != severity::WARN) {
    return fail("test_window_tags", "gamma axis severity should raise gamma_wave_state");
  }

  return 0;
}

int test_overlay_rejects_bad_input() {
  DiagnosticOverlay overlay{OverlayConfig{}};

  OverlayEpoch orphan = epoch_at(1, assets_with(0.5F, 0.5F));
  orphan.entry.proposal_id.clear();
  bool threw = false;
  try {
    (void)overlay.annotate(orphan);
  } catch (const DiagnosticComputationError&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_overlay_rejects_bad_input", "epoch without a ledger entry must be rejected");
  }

  asset_vector broken = assets_with(0.5F, 0.5F);
  broken.set(asset::TECH, 1.5F);
  threw = false;
  try {
    (void)overlay.annotate(epoch_at(1, broken));
  } catch (const DiagnosticComputationError&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_overlay_rejects_bad_input", "asset outside [0,1] must be rejected");
  }

  return 0;
}

int test_worker_isolates_failures() {
  const auto log_path = std::filesystem::temp_directory_path() / "neuro_guard_overlay_annotations.jsonl";
  std::error_code ec;
  std::filesystem::remove(log_path, ec);

  HashLedger ledger{std::string(64, '0')};
  neuro_guard::kernel::TransitionProposal proposal{};
  for (std::uint64_t epoch = 1; epoch <= 2; ++epoch) {
    proposal.proposal_id = "subject-7-" + std::to_string(epoch);
    proposal.timestamp_ms = epoch * 5'000;
    (void)ledger.append(neuro_guard::kernel::Decision::accept(), proposal, ledger.tip());
  }
  const auto before = ledger.entries();

  AnnotationStore store;
  {
    OverlayWorker worker{OverlayConfig{}, LedgerReader{ledger}, store, log_path.string()};

    OverlayInput good{};
    good.ledger_index = 0;
    good.epoch_index = 1;
    good.assets = assets_with(0.5F, 0.5F);
    good.tier_ceiling = 0.30;
    good.epoch_duration_s = 5.0F;
    worker.submit(good);

    OverlayInput missing = good;
    missing.ledger_index = 9;
    missing.epoch_index = 2;
    worker.submit(missing);

    OverlayInput next = good;
    next.ledger_index = 1;
    next.epoch_index = 3;
    worker.submit(next);

    worker.drain();
    const auto stats = worker.stats();
    if (stats.processed != 2 || stats.failed != 1 || stats.dropped != 0) {
      std::filesystem::remove(log_path, ec);
      return fail("test_worker_isolates_failures", "one failed epoch must not stop the others");
    }
  }

  if (!store.by_epoch(1).has_value() || store.by_epoch(2).has_value() || !store.by_proposal("subject-7-2").has_value()) {
    std::filesystem::remove(log_path, ec);
    return fail("test_worker_isolates_failures", "annotations should exist only for resolvable epochs");
  }

  std::size_t lines = 0;
  {
    std::ifstream input(log_path);
    std::string line;
    while (std::getline(input, line)) {
      ++lines;
    }
  }
  std::filesystem::remove(log_path, ec);
  if (lines != 2) {
    return fail("test_worker_isolates_failures", "expected one annotation line per processed epoch");
  }

  const auto after = ledger.entries();
  if (after.size() != before.size() || after.back().entry_hash != before.back().entry_hash) {
    return fail("test_worker_isolates_failures", "overlay must not touch the ledger");
  }

  return 0;
}

int test_worker_accounts_for_every_input() {
  HashLedger ledger{std::string(64, '0')};
  neuro_guard::kernel::TransitionProposal proposal{};
  proposal.proposal_id = "subject-7-1";
  (void)ledger.append(neuro_guard::kernel::Decision::accept(), proposal, ledger.tip());

  OverlayConfig config{};
  config.max_queue = 2;
  AnnotationStore store;
  OverlayWorker worker{config, LedgerReader{ledger}, store};

  constexpr std::size_t kSubmitted = 200;
  for (std::size_t i = 0; i < kSubmitted; ++i) {
    OverlayInput input{};
    input.ledger_index = 0;
    input.epoch_index = i + 1;
    input.assets = assets_with(0.5F, 0.5F);
    input.tier_ceiling = 0.30;
    input.epoch_duration_s = 5.0F;
    worker.submit(input);
  }
  worker.drain();

  const auto stats = worker.stats();
  if (stats.processed + stats.failed + stats.dropped != kSubmitted || stats.failed != 0) {
    return fail("test_worker_accounts_for_every_input", "every input is processed or dropped");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_row_worked_examples(); rc != 0) {
    return rc;
  }
  if (int rc = test_row_states(); rc != 0) {
    return rc;
  }
  if (int rc = test_state_tags(); rc != 0) {
    return rc;
  }
  if (int rc = test_window_tags(); rc != 0) {
    return rc;
  }
  if (int rc = test_overlay_rejects_bad_input(); rc != 0) {
    return rc;
  }
  if (int rc = test_worker_isolates_failures(); rc != 0) {
    return rc;
  }
  if (int rc = test_worker_accounts_for_every_input(); rc != 0) {
    return rc;
  }

  std::cout << "[PASS] overlay unit tests\n";
  return 0;
}
