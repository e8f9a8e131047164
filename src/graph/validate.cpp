#include <pipit/graph/validate.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace pipit::graph {

auto required_inputs(NodeKind kind) -> std::optional<std::size_t> {
    switch (kind) {
        case NodeKind::Source:
            return 0;
        case NodeKind::Join:
            return 2;
        case NodeKind::Project:
        case NodeKind::Filter:
        case NodeKind::Aggregate:
        case NodeKind::Compute:
        case NodeKind::Sort:
        case NodeKind::Sample:
        case NodeKind::Inspect:
        case NodeKind::Sink:
            return 1;
        case NodeKind::Unsupported:
            break;
    }
    return std::nullopt;
}

auto validate(const Graph& graph) -> std::vector<ValidationIssue> {
    std::vector<ValidationIssue> issues;
    auto report = [&](const Node& node, std::string message) {
        issues.push_back(ValidationIssue{.node_id = node.id, .message = std::move(message)});
    };

    for (const auto& node : graph.nodes()) {
        const auto kind = node.kind();
        const auto title = kind_title(kind);
        const auto inputs = graph.parents(node.id).size();

        if (kind == NodeKind::Source) {
            if (!node.as<SourceConfig>().content.has_value()) {
                report(node, fmt::format("{} \"{}\" needs a loaded file.", title, node.label));
            }
            if (inputs != 0) {
                report(node, fmt::format("{} \"{}\" should not have inputs.", title, node.label));
            }
            continue;
        }

        auto required = required_inputs(kind);
        if (required.has_value() && inputs != *required) {
            report(node, fmt::format("{} \"{}\" must have exactly {} input{}.", title, node.label,
                                     *required, *required == 1 ? "" : "s"));
        }
    }

    const bool has_source = std::any_of(graph.nodes().begin(), graph.nodes().end(),
                                        [](const Node& n) { return n.kind() == NodeKind::Source; });
    if (!has_source) {
        issues.push_back(ValidationIssue{.node_id = std::nullopt,
                                         .message = "Add at least one Source node."});
    }
    return issues;
}

}  // namespace pipit::graph
