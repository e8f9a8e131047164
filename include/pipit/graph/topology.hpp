#pragma once

#include <pipit/graph/graph.hpp>

#include <optional>
#include <unordered_set>
#include <vector>

namespace pipit::graph {

/// Kahn ordering with FIFO tie-breaking on declaration order.
///
/// When the graph contains a cycle the result is the declaration order of all
/// nodes, which is not a valid linearization; use `is_acyclic` to tell the
/// two cases apart.
[[nodiscard]] auto topological_order(const Graph& graph) -> std::vector<NodeId>;

[[nodiscard]] auto is_acyclic(const Graph& graph) -> bool;

/// Ids reachable from `target` by walking edges backwards, `target` included.
[[nodiscard]] auto ancestors_of(const Graph& graph, const NodeId& target)
    -> std::unordered_set<NodeId>;

/// Induced subgraph over the ancestor closure of `target`; the whole graph
/// when no target is given.
[[nodiscard]] auto subgraph_to(const Graph& graph, const std::optional<NodeId>& target) -> Graph;

}  // namespace pipit::graph
