#include <vigil/detection/policy.hpp>

using vigil::schema::alert_type_t;

namespace vigil::detection {

scoring_policy make_default_scoring_policy() {
  return scoring_policy{
      .weights = {{alert_type_t::high_value, 30},
                  {alert_type_t::high_risk_counterparty, 50},
                  {alert_type_t::high_risk_jurisdiction, 50},
                  {alert_type_t::cluster_member, 20},
                  {alert_type_t::rapid_succession, 10},
                  {alert_type_t::high_frequency, 10},
                  {alert_type_t::round_amount, 5},
                  {alert_type_t::new_counterparty, 5}},
      .score_cap = 100,
      .high_risk_score = 70};
}

detection_policy make_default_policy(
    const vigil::schema::asset_class_t asset_class) {
  auto policy = detection_policy{};
  policy.threshold = vigil::schema::make_amount(10'000);
  policy.round_amount_unit = vigil::schema::make_amount(1'000);
  policy.daily_frequency_limit = 10;
  policy.graph_node_limit = 100;
  policy.cluster_size_limit = 5;
  policy.scoring = make_default_scoring_policy();

  switch (asset_class) {
    case vigil::schema::asset_class_t::fiat:
      policy.rules = {alert_type_t::high_value,
                      alert_type_t::high_risk_jurisdiction,
                      alert_type_t::rapid_succession,
                      alert_type_t::round_amount,
                      alert_type_t::high_frequency,
                      alert_type_t::new_counterparty};
      policy.high_risk_jurisdictions = {"KP", "IR", "AF", "SY", "SD",
                                        "YE", "VE", "IQ", "MM", "LY"};
      policy.frequency_gap = 60 * vigil::schema::kMillisecondsPerSecond;
      break;
    case vigil::schema::asset_class_t::crypto:
      policy.rules = {alert_type_t::high_value,
                      alert_type_t::high_risk_counterparty,
                      alert_type_t::rapid_succession,
                      alert_type_t::cluster_member};
      policy.risk_list = {"1DkqkW9i9szEdSa7ZrM4q2eA6kWE2w2DSm",
                          "1HB5XMLmzFVj8ALj6mfBsbifRoD4miY36v"};
      policy.frequency_gap = 10 * 60 * vigil::schema::kMillisecondsPerSecond;
      break;
  }
  return policy;
}

}  // namespace vigil::detection
