#pragma once

#include <spdlog/spdlog.h>
#include <vigil/detection/pipeline.hpp>
#include <vigil/detection/policy.hpp>
#include <vigil/detection/rules.hpp>
#include <vigil/detection/scorer.hpp>
#include <vigil/detection/validator.hpp>
#include <vigil/monitoring/clock.hpp>
#include <vigil/schema/alert.hpp>
#include <vigil/storage/storage.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace vigil::monitoring {

struct pass_report final {
  vigil::schema::pass_id_t pass_id{};
  std::size_t fetched{};
  std::size_t warnings{};
  std::size_t flagged{};
  std::size_t alerts_recorded{};
  // Alerts already present from an earlier pass whose mark step failed.
  std::size_t alerts_skipped{};
  std::size_t alert_failures{};
  bool marked{false};
};

namespace detail {

inline std::string describe(
    const std::vector<vigil::schema::alert_type_t>& alert_types) {
  auto out = std::string{};
  for (const auto type : alert_types) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += vigil::schema::alert_type_name(type);
  }
  return out;
}

}  // namespace detail

/// One detection pass over the unreviewed transactions of a store.
///
/// Ordering within a pass is fixed: fetch, validate, evaluate every rule,
/// union, score, record alerts, then mark the whole batch reviewed once.
/// A failed alert write is logged and skipped; fetch or mark failures
/// propagate as storage_unavailable and leave the batch unreviewed, so the
/// next pass retries it without duplicating alerts already written.
template <typename Library>
class monitor final {
 public:
  monitor(vigil::storage::storage<Library>& storage,
          vigil::detection::detection_policy policy,
          now_fn_t now = system_now)
      : storage_{storage},
        policy_{std::move(policy)},
        rules_{vigil::detection::make_rules(policy_)},
        now_{std::move(now)} {}

  pass_report run_pass(vigil::schema::pass_id_t pass_id);

 private:
  void record_alert(const vigil::detection::flagged_transaction& flagged,
                    pass_report& report);

  vigil::storage::storage<Library>& storage_;
  vigil::detection::detection_policy policy_;
  std::vector<vigil::detection::rule> rules_;
  now_fn_t now_;
};

template <typename Library>
pass_report monitor<Library>::run_pass(const vigil::schema::pass_id_t pass_id) {
  auto report = pass_report{.pass_id = pass_id};

  auto batch = storage_.fetch_unreviewed();
  report.fetched = batch.size();
  if (batch.empty()) {
    spdlog::info("Pass {}: no new transactions to process", pass_id);
    return report;
  }
  spdlog::info("Pass {}: reviewing {} transaction(s)", pass_id, batch.size());

  auto warnings = vigil::detection::validate(batch);
  report.warnings = warnings.size();
  for (const auto& warning : warnings) {
    if (warning.issue == vigil::schema::validation_issue_t::non_positive_amount) {
      spdlog::warn("Pass {}: transaction '{}' has a non-positive amount",
                   pass_id, warning.transaction_id);
    } else {
      spdlog::warn("Pass {}: transaction '{}' is missing {}", pass_id,
                   warning.transaction_id, warning.field);
    }
  }

  auto flagged = vigil::detection::run_rules(batch, rules_);
  report.flagged = flagged.size();
  for (const auto& entry : flagged) {
    record_alert(entry, report);
  }

  auto ids = std::vector<vigil::schema::transaction_id_t>{};
  ids.reserve(batch.size());
  for (const auto& tx : batch) {
    ids.push_back(tx.id);
  }
  storage_.mark_reviewed(ids);
  report.marked = true;

  spdlog::info(
      "Pass {}: {} flagged, {} alert(s) recorded, {} alert failure(s), {} "
      "transaction(s) marked reviewed",
      pass_id, report.flagged, report.alerts_recorded, report.alert_failures,
      ids.size());
  return report;
}

template <typename Library>
void monitor<Library>::record_alert(
    const vigil::detection::flagged_transaction& flagged,
    pass_report& report) {
  auto risk_score = vigil::detection::score(flagged.alert_types, policy_.scoring);
  auto band = vigil::detection::classify(risk_score, policy_.scoring);
  try {
    if (storage_.has_alert(flagged.id)) {
      spdlog::info(
          "Pass {}: alert for transaction '{}' already recorded; not "
          "recording [{}] score {}",
          report.pass_id, flagged.id, detail::describe(flagged.alert_types),
          risk_score);
      ++report.alerts_skipped;
      return;
    }
    auto alert = storage_.insert_alert(vigil::schema::alert_t{
        .id = 0,
        .transaction_id = flagged.id,
        .alert_types = flagged.alert_types,
        .risk_score = risk_score,
        .risk_band = band,
        .pass_id = report.pass_id,
        .created_at = now_()});
    spdlog::info("Pass {}: alert {} for transaction '{}' [{}] score {} ({})",
                 report.pass_id, alert.id, flagged.id,
                 detail::describe(flagged.alert_types), risk_score,
                 vigil::schema::risk_band_name(band));
    ++report.alerts_recorded;
  } catch (const vigil::storage::storage_unavailable& ex) {
    spdlog::error("Pass {}: failed to record alert for transaction '{}': {}",
                  report.pass_id, flagged.id, ex.what());
    ++report.alert_failures;
  }
}

}  // namespace vigil::monitoring
