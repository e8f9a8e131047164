#pragma once

#include <pipit/graph/graph.hpp>

#include <optional>
#include <string>
#include <vector>

namespace pipit::graph {

/// One structural rule violation. `node_id` is empty for graph-wide issues.
struct ValidationIssue {
    std::optional<NodeId> node_id;
    std::string message;
};

/// Number of inputs a node of this kind requires, if constrained.
[[nodiscard]] auto required_inputs(NodeKind kind) -> std::optional<std::size_t>;

/// Check input arity per node, loaded source payloads, and the presence of a
/// source. All violations are collected in node order; the graph-wide
/// "no source" issue comes last.
[[nodiscard]] auto validate(const Graph& graph) -> std::vector<ValidationIssue>;

}  // namespace pipit::graph
