#include <vigil/detection/graph.hpp>
#include <vigil/detection/rules.hpp>

#include <algorithm>
#include <map>
#include <utility>

using namespace vigil::schema;

namespace vigil::detection {

namespace {

using transfer_group_t = std::vector<const transaction_t*>;

}  // namespace

flagged_set_t evaluate_value_threshold(const batch_t& batch,
                                       const amount_t threshold) {
  auto flagged = flagged_set_t{};
  for (const auto& tx : batch) {
    if (tx.amount.has_value() && *tx.amount > threshold) {
      flagged.insert(tx.id);
    }
  }
  return flagged;
}

flagged_set_t evaluate_risk_list(const batch_t& batch,
                                 const std::set<entity_id_t>& risk_list) {
  auto listed = [&](const std::optional<entity_id_t>& entity) {
    return entity.has_value() && risk_list.contains(*entity);
  };
  auto flagged = flagged_set_t{};
  for (const auto& tx : batch) {
    if (listed(tx.source) || listed(tx.destination)) {
      flagged.insert(tx.id);
    }
  }
  return flagged;
}

flagged_set_t evaluate_jurisdiction_list(
    const batch_t& batch,
    const std::set<std::string>& high_risk_jurisdictions) {
  auto flagged = flagged_set_t{};
  for (const auto& tx : batch) {
    if (high_risk_jurisdictions.contains(tx.jurisdiction)) {
      flagged.insert(tx.id);
    }
  }
  return flagged;
}

flagged_set_t evaluate_rapid_succession(
    const batch_t& batch,
    const duration_milliseconds_t minimum_gap) {
  auto by_source = std::map<entity_id_t, transfer_group_t>{};
  for (const auto& tx : batch) {
    if (tx.source.has_value() && tx.timestamp.has_value()) {
      by_source[*tx.source].push_back(&tx);
    }
  }

  auto flagged = flagged_set_t{};
  for (auto& [source, transfers] : by_source) {
    std::ranges::stable_sort(transfers, {}, [](const transaction_t* tx) {
      return *tx->timestamp;
    });
    for (std::size_t i = 1; i < transfers.size(); ++i) {
      auto gap = *transfers[i]->timestamp - *transfers[i - 1]->timestamp;
      if (gap < minimum_gap) {
        flagged.insert(transfers[i]->id);
      }
    }
  }
  return flagged;
}

flagged_set_t evaluate_round_amount(const batch_t& batch,
                                    const amount_t unit) {
  auto flagged = flagged_set_t{};
  if (unit <= 0) {
    return flagged;
  }
  for (const auto& tx : batch) {
    if (tx.amount.has_value() && (*tx.amount % unit) == 0) {
      flagged.insert(tx.id);
    }
  }
  return flagged;
}

flagged_set_t evaluate_daily_frequency(const batch_t& batch,
                                       const uint64_t limit) {
  auto groups = std::map<std::pair<entity_id_t, uint64_t>, transfer_group_t>{};
  for (const auto& tx : batch) {
    if (tx.source.has_value() && tx.timestamp.has_value()) {
      groups[{*tx.source, day_index(*tx.timestamp)}].push_back(&tx);
    }
  }

  auto flagged = flagged_set_t{};
  for (const auto& [key, transfers] : groups) {
    if (transfers.size() <= limit) {
      continue;
    }
    for (const auto* tx : transfers) {
      flagged.insert(tx->id);
    }
  }
  return flagged;
}

flagged_set_t evaluate_new_counterparty(const batch_t& batch) {
  auto pair_counts = std::map<std::pair<entity_id_t, entity_id_t>, uint64_t>{};
  for (const auto& tx : batch) {
    if (tx.source.has_value() && tx.destination.has_value()) {
      ++pair_counts[{*tx.source, *tx.destination}];
    }
  }

  auto flagged = flagged_set_t{};
  for (const auto& tx : batch) {
    if (!tx.source.has_value() || !tx.destination.has_value()) {
      continue;
    }
    if (pair_counts[{*tx.source, *tx.destination}] == 1) {
      flagged.insert(tx.id);
    }
  }
  return flagged;
}

std::vector<rule> make_rules(const detection_policy& policy) {
  auto rules = std::vector<rule>{};
  rules.reserve(policy.rules.size());

  for (const auto type : policy.rules) {
    auto entry = rule{.type = type, .evaluate = {}};
    switch (type) {
      case alert_type_t::high_value:
        entry.evaluate = [threshold = policy.threshold](const batch_t& batch) {
          return evaluate_value_threshold(batch, threshold);
        };
        break;
      case alert_type_t::high_risk_counterparty:
        entry.evaluate = [risk_list = policy.risk_list](const batch_t& batch) {
          return evaluate_risk_list(batch, risk_list);
        };
        break;
      case alert_type_t::high_risk_jurisdiction:
        entry.evaluate = [jurisdictions = policy.high_risk_jurisdictions](
                             const batch_t& batch) {
          return evaluate_jurisdiction_list(batch, jurisdictions);
        };
        break;
      case alert_type_t::rapid_succession:
        entry.evaluate = [gap = policy.frequency_gap](const batch_t& batch) {
          return evaluate_rapid_succession(batch, gap);
        };
        break;
      case alert_type_t::round_amount:
        entry.evaluate = [unit = policy.round_amount_unit](
                             const batch_t& batch) {
          return evaluate_round_amount(batch, unit);
        };
        break;
      case alert_type_t::high_frequency:
        entry.evaluate = [limit = policy.daily_frequency_limit](
                             const batch_t& batch) {
          return evaluate_daily_frequency(batch, limit);
        };
        break;
      case alert_type_t::new_counterparty:
        entry.evaluate = [](const batch_t& batch) {
          return evaluate_new_counterparty(batch);
        };
        break;
      case alert_type_t::cluster_member:
        entry.evaluate = [node_limit = policy.graph_node_limit,
                          edge_limit = policy.graph_edge_limit,
                          cluster_limit = policy.cluster_size_limit](
                             const batch_t& batch) {
          return detect_clusters(batch, node_limit, edge_limit, cluster_limit)
              .flagged;
        };
        break;
    }
    if (entry.evaluate) {
      rules.push_back(std::move(entry));
    }
  }
  return rules;
}

}  // namespace vigil::detection
