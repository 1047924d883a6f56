#pragma once

#include <vigil/detection/policy.hpp>
#include <vigil/schema/alert_type.hpp>
#include <vigil/schema/transaction.hpp>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace vigil::detection {

using batch_t = std::vector<vigil::schema::transaction_t>;
using flagged_set_t = std::set<vigil::schema::transaction_id_t>;

// Rule evaluators. Each is a pure function of the batch snapshot; a row
// missing a field the rule depends on is never flagged by that rule.

/// amount > threshold.
flagged_set_t evaluate_value_threshold(const batch_t& batch,
                                       vigil::schema::amount_t threshold);

/// Source or destination listed as high risk.
flagged_set_t evaluate_risk_list(
    const batch_t& batch,
    const std::set<vigil::schema::entity_id_t>& risk_list);

/// Jurisdiction (country or chain) listed as high risk.
flagged_set_t evaluate_jurisdiction_list(
    const batch_t& batch,
    const std::set<std::string>& high_risk_jurisdictions);

/// Gap to the previous transfer from the same source is strictly below
/// minimum_gap. The earliest transfer per source is never flagged.
flagged_set_t evaluate_rapid_succession(
    const batch_t& batch,
    vigil::schema::duration_milliseconds_t minimum_gap);

/// amount is an exact multiple of unit. A unit of zero flags nothing.
flagged_set_t evaluate_round_amount(const batch_t& batch,
                                    vigil::schema::amount_t unit);

/// Every transfer of a (source, UTC day) group larger than limit.
flagged_set_t evaluate_daily_frequency(const batch_t& batch, uint64_t limit);

/// (source, destination) pair seen exactly once in the batch.
flagged_set_t evaluate_new_counterparty(const batch_t& batch);

/// Rule table entry: the tag it reports and its evaluator bound to a policy.
struct rule final {
  vigil::schema::alert_type_t type{};
  std::function<flagged_set_t(const batch_t&)> evaluate;
};

/// Build the rule table for policy.rules, in that order.
std::vector<rule> make_rules(const detection_policy& policy);

}  // namespace vigil::detection
