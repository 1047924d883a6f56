#include <vigil/detection/scorer.hpp>

#include <algorithm>

namespace vigil::detection {

uint32_t score(const std::vector<vigil::schema::alert_type_t>& matched,
               const scoring_policy& policy) {
  auto total = uint64_t{};
  for (const auto type : matched) {
    if (auto weight = policy.weights.find(type);
        weight != std::end(policy.weights)) {
      total += weight->second;
    }
  }
  return static_cast<uint32_t>(
      std::min<uint64_t>(total, static_cast<uint64_t>(policy.score_cap)));
}

vigil::schema::risk_band_t classify(const uint32_t risk_score,
                                    const scoring_policy& policy) {
  return risk_score >= policy.high_risk_score
             ? vigil::schema::risk_band_t::high
             : vigil::schema::risk_band_t::moderate;
}

}  // namespace vigil::detection
