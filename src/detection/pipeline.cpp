#include <spdlog/spdlog.h>
#include <vigil/detection/pipeline.hpp>

#include <algorithm>
#include <map>

using namespace vigil::schema;

namespace vigil::detection {

std::vector<flagged_transaction> run_rules(const batch_t& batch,
                                           const std::vector<rule>& rules) {
  // All evaluators complete before anything is merged.
  auto outputs = std::vector<std::pair<alert_type_t, flagged_set_t>>{};
  outputs.reserve(rules.size());
  for (const auto& entry : rules) {
    auto flagged = entry.evaluate(batch);
    spdlog::debug("Rule {} flagged {} transaction(s)",
                  alert_type_name(entry.type), flagged.size());
    outputs.emplace_back(entry.type, std::move(flagged));
  }

  auto matches = std::map<transaction_id_t, std::vector<alert_type_t>>{};
  for (const auto& [type, flagged] : outputs) {
    for (const auto& id : flagged) {
      auto& tags = matches[id];
      if (std::ranges::find(tags, type) == std::end(tags)) {
        tags.push_back(type);
      }
    }
  }

  auto result = std::vector<flagged_transaction>{};
  result.reserve(matches.size());
  for (const auto& tx : batch) {
    auto match = matches.find(tx.id);
    if (match == std::end(matches)) {
      continue;
    }
    result.push_back(flagged_transaction{.id = tx.id,
                                         .alert_types = std::move(match->second)});
    matches.erase(match);
  }
  return result;
}

}  // namespace vigil::detection
