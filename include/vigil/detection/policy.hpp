#pragma once

#include <vigil/schema/alert_type.hpp>
#include <vigil/schema/asset_class.hpp>
#include <vigil/schema/primitives.hpp>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace vigil::detection {

/// Additive risk model. Tags without a weight contribute nothing.
struct scoring_policy final {
  std::map<vigil::schema::alert_type_t, uint32_t> weights;
  uint32_t score_cap{100};
  // Scores at or above this value are reported in the high risk band.
  uint32_t high_risk_score{70};
};

/// Everything the rule table needs for one asset-class profile.
struct detection_policy final {
  // Enabled rules, evaluated in this order.
  std::vector<vigil::schema::alert_type_t> rules;
  vigil::schema::amount_t threshold{};
  std::set<vigil::schema::entity_id_t> risk_list;
  std::set<std::string> high_risk_jurisdictions;
  vigil::schema::duration_milliseconds_t frequency_gap{};
  vigil::schema::amount_t round_amount_unit{};
  uint64_t daily_frequency_limit{};
  uint64_t graph_node_limit{};
  // Zero disables the edge bound.
  uint64_t graph_edge_limit{};
  uint64_t cluster_size_limit{};
  scoring_policy scoring;
};

scoring_policy make_default_scoring_policy();

/// Profile defaults for fiat (account/payee, country) and crypto
/// (wallet address, chain) monitoring.
detection_policy make_default_policy(vigil::schema::asset_class_t asset_class);

}  // namespace vigil::detection
