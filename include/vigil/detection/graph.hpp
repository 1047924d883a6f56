#pragma once

#include <vigil/detection/rules.hpp>
#include <cstddef>
#include <cstdint>

namespace vigil::detection {

struct cluster_report final {
  flagged_set_t flagged;
  // True when the batch exceeded the graph size bound and was not analysed.
  bool skipped{false};
  std::size_t nodes{};
  std::size_t edges{};
  std::size_t components{};
  std::size_t oversized_components{};
};

/// Entity graph clustering.
///
/// Vertices are entities and edges are transactions (weighted by amount).
/// Every transaction inside a connected component with more than
/// cluster_size_limit entities is flagged. Batches with more than node_limit
/// entities, or more than edge_limit transfers when edge_limit is non-zero,
/// are skipped and yield an empty result.
cluster_report detect_clusters(const batch_t& batch,
                               uint64_t node_limit,
                               uint64_t edge_limit,
                               uint64_t cluster_size_limit);

}  // namespace vigil::detection
