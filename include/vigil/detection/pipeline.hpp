#pragma once

#include <vigil/detection/rules.hpp>
#include <vigil/schema/alert_type.hpp>
#include <vector>

namespace vigil::detection {

struct flagged_transaction final {
  vigil::schema::transaction_id_t id;
  // Matched tags in rule table order, without duplicates.
  std::vector<vigil::schema::alert_type_t> alert_types;
};

/// Run every rule over the same snapshot and union their outputs by
/// transaction id. The result follows batch order.
std::vector<flagged_transaction> run_rules(const batch_t& batch,
                                           const std::vector<rule>& rules);

}  // namespace vigil::detection
