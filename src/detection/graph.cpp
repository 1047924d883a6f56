#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/connected_components.hpp>
#include <spdlog/spdlog.h>
#include <vigil/detection/graph.hpp>

#include <map>
#include <utility>
#include <vector>

using namespace vigil::schema;

namespace vigil::detection {

namespace {

using graph_t = boost::adjacency_list<boost::vecS,
                                      boost::vecS,
                                      boost::undirectedS,
                                      boost::no_property,
                                      boost::property<boost::edge_weight_t,
                                                      amount_t>>;

struct edge_entry final {
  std::size_t source{};
  std::size_t destination{};
  const transaction_t* transaction{};
};

}  // namespace

cluster_report detect_clusters(const batch_t& batch,
                               const uint64_t node_limit,
                               const uint64_t edge_limit,
                               const uint64_t cluster_size_limit) {
  auto report = cluster_report{};

  auto vertices = std::map<entity_id_t, std::size_t>{};
  auto vertex_of = [&](const entity_id_t& entity) {
    auto [it, inserted] = vertices.try_emplace(entity, vertices.size());
    return it->second;
  };

  auto edges = std::vector<edge_entry>{};
  edges.reserve(batch.size());
  for (const auto& tx : batch) {
    if (!tx.source.has_value() || !tx.destination.has_value()) {
      continue;
    }
    auto source = vertex_of(*tx.source);
    auto destination = vertex_of(*tx.destination);
    edges.push_back(edge_entry{
        .source = source, .destination = destination, .transaction = &tx});
  }
  report.nodes = vertices.size();
  report.edges = edges.size();

  if (report.nodes > node_limit ||
      (edge_limit != 0 && report.edges > edge_limit)) {
    spdlog::info(
        "Skipping cluster detection: {} entities / {} transfers exceed the "
        "graph bound ({} entities, {} transfers)",
        report.nodes, report.edges, node_limit, edge_limit);
    report.skipped = true;
    return report;
  }
  if (report.nodes == 0) {
    return report;
  }

  auto graph = graph_t{report.nodes};
  for (const auto& edge : edges) {
    boost::add_edge(edge.source, edge.destination,
                    edge.transaction->amount.value_or(0), graph);
  }

  auto component = std::vector<std::size_t>(report.nodes);
  report.components = boost::connected_components(graph, component.data());

  auto component_size = std::vector<std::size_t>(report.components);
  for (const auto id : component) {
    ++component_size[id];
  }

  auto component_weight = std::vector<amount_t>(report.components);
  auto weights = boost::get(boost::edge_weight, graph);
  for (auto [it, end] = boost::edges(graph); it != end; ++it) {
    component_weight[component[boost::source(*it, graph)]] += weights[*it];
  }

  for (std::size_t id = 0; id < report.components; ++id) {
    if (component_size[id] <= cluster_size_limit) {
      continue;
    }
    ++report.oversized_components;
    spdlog::info("Cluster of {} entities moving {} exceeds size limit {}",
                 component_size[id], format_amount(component_weight[id]),
                 cluster_size_limit);
  }

  for (const auto& edge : edges) {
    if (component_size[component[edge.source]] > cluster_size_limit) {
      report.flagged.insert(edge.transaction->id);
    }
  }

  spdlog::info("Detected {} cluster member transfers in {} cluster(s)",
               report.flagged.size(), report.oversized_components);
  return report;
}

}  // namespace vigil::detection
