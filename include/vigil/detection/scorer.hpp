#pragma once

#include <vigil/detection/policy.hpp>
#include <vigil/schema/alert_type.hpp>
#include <vigil/schema/risk_band.hpp>
#include <cstdint>
#include <vector>

namespace vigil::detection {

/// Sum of the weights of matched tags, capped at policy.score_cap. Only tags
/// produced by the current pass are considered.
uint32_t score(const std::vector<vigil::schema::alert_type_t>& matched,
               const scoring_policy& policy);

vigil::schema::risk_band_t classify(uint32_t risk_score,
                                    const scoring_policy& policy);

}  // namespace vigil::detection
