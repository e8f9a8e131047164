#include <pipit/graph/topology.hpp>

#include <deque>
#include <unordered_map>

namespace pipit::graph {

namespace {

struct KahnResult {
    std::vector<NodeId> order;
    bool complete = false;
};

auto kahn(const Graph& graph) -> KahnResult {
    std::unordered_map<NodeId, std::size_t> in_degree;
    std::unordered_map<NodeId, std::vector<NodeId>> outgoing;
    for (const auto& node : graph.nodes()) {
        in_degree.emplace(node.id, 0);
        outgoing.emplace(node.id, std::vector<NodeId>{});
    }
    for (const auto& edge : graph.edges()) {
        if (!graph.contains(edge.source) || !graph.contains(edge.target)) {
            continue;
        }
        ++in_degree[edge.target];
        outgoing[edge.source].push_back(edge.target);
    }

    std::deque<NodeId> ready;
    for (const auto& node : graph.nodes()) {
        if (in_degree[node.id] == 0) {
            ready.push_back(node.id);
        }
    }

    KahnResult result;
    result.order.reserve(graph.nodes().size());
    while (!ready.empty()) {
        NodeId id = std::move(ready.front());
        ready.pop_front();
        for (const auto& target : outgoing[id]) {
            if (--in_degree[target] == 0) {
                ready.push_back(target);
            }
        }
        result.order.push_back(std::move(id));
    }
    result.complete = result.order.size() == graph.nodes().size();
    return result;
}

}  // namespace

auto topological_order(const Graph& graph) -> std::vector<NodeId> {
    auto result = kahn(graph);
    if (result.complete) {
        return std::move(result.order);
    }
    std::vector<NodeId> declared;
    declared.reserve(graph.nodes().size());
    for (const auto& node : graph.nodes()) {
        declared.push_back(node.id);
    }
    return declared;
}

auto is_acyclic(const Graph& graph) -> bool {
    return kahn(graph).complete;
}

auto ancestors_of(const Graph& graph, const NodeId& target) -> std::unordered_set<NodeId> {
    std::unordered_map<NodeId, std::vector<NodeId>> predecessors;
    for (const auto& edge : graph.edges()) {
        predecessors[edge.target].push_back(edge.source);
    }

    std::unordered_set<NodeId> seen;
    std::vector<NodeId> stack{target};
    while (!stack.empty()) {
        NodeId current = std::move(stack.back());
        stack.pop_back();
        if (!seen.insert(current).second) {
            continue;
        }
        if (auto it = predecessors.find(current); it != predecessors.end()) {
            for (const auto& parent : it->second) {
                if (!seen.contains(parent)) {
                    stack.push_back(parent);
                }
            }
        }
    }
    return seen;
}

auto subgraph_to(const Graph& graph, const std::optional<NodeId>& target) -> Graph {
    if (!target.has_value()) {
        return graph;
    }
    const auto keep = ancestors_of(graph, *target);
    Graph out;
    for (const auto& node : graph.nodes()) {
        if (keep.contains(node.id)) {
            out.add_node(node);
        }
    }
    for (const auto& edge : graph.edges()) {
        if (keep.contains(edge.source) && keep.contains(edge.target)) {
            out.add_edge(edge.source, edge.target);
        }
    }
    return out;
}

}  // namespace pipit::graph
