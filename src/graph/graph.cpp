#include <pipit/graph/graph.hpp>

#include <algorithm>
#include <cctype>

namespace pipit::graph {

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto lower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

}  // namespace

Graph::Graph(std::vector<Node> nodes, std::vector<Edge> edges) {
    nodes_.reserve(nodes.size());
    for (auto& node : nodes) {
        add_node(std::move(node));
    }
    edges_ = std::move(edges);
}

void Graph::add_node(Node node) {
    if (auto it = index_.find(node.id); it != index_.end()) {
        nodes_[it->second] = std::move(node);
        return;
    }
    index_.emplace(node.id, nodes_.size());
    nodes_.push_back(std::move(node));
}

void Graph::add_edge(NodeId source, NodeId target) {
    edges_.push_back(Edge{.source = std::move(source), .target = std::move(target)});
}

auto Graph::find(const NodeId& id) const -> const Node* {
    if (auto it = index_.find(id); it != index_.end()) {
        return &nodes_[it->second];
    }
    return nullptr;
}

auto Graph::parents(const NodeId& id) const -> std::vector<NodeId> {
    std::vector<NodeId> out;
    for (const auto& edge : edges_) {
        if (edge.target == id && contains(edge.source)) {
            out.push_back(edge.source);
        }
    }
    return out;
}

auto kind_name(NodeKind kind) -> std::string_view {
    switch (kind) {
        case NodeKind::Source:
            return "source.csv";
        case NodeKind::Project:
            return "transform.select";
        case NodeKind::Filter:
            return "transform.filter";
        case NodeKind::Aggregate:
            return "transform.summarize";
        case NodeKind::Compute:
            return "transform.formula";
        case NodeKind::Sort:
            return "transform.sort";
        case NodeKind::Sample:
            return "transform.sample";
        case NodeKind::Join:
            return "transform.join";
        case NodeKind::Inspect:
            return "inspect.deepdive";
        case NodeKind::Sink:
            return "sink.csv";
        case NodeKind::Unsupported:
            break;
    }
    return "unsupported";
}

auto kind_name(const Node& node) -> std::string {
    if (const auto* unsupported = std::get_if<UnsupportedConfig>(&node.config)) {
        return unsupported->type_name;
    }
    return std::string(kind_name(node.kind()));
}

auto kind_title(NodeKind kind) -> std::string_view {
    switch (kind) {
        case NodeKind::Source:
            return "CSV Source";
        case NodeKind::Project:
            return "Select";
        case NodeKind::Filter:
            return "Filter";
        case NodeKind::Aggregate:
            return "Summarize";
        case NodeKind::Compute:
            return "Formula";
        case NodeKind::Sort:
            return "Sort";
        case NodeKind::Sample:
            return "Sample";
        case NodeKind::Join:
            return "Join";
        case NodeKind::Inspect:
            return "Deep Dive";
        case NodeKind::Sink:
            return "CSV Sink";
        case NodeKind::Unsupported:
            break;
    }
    return "Node";
}

auto agg_func_name(AggFunc func) -> std::string_view {
    switch (func) {
        case AggFunc::Sum:
            return "sum";
        case AggFunc::Avg:
            return "avg";
        case AggFunc::Mean:
            return "mean";
        case AggFunc::Min:
            return "min";
        case AggFunc::Max:
            return "max";
        case AggFunc::Count:
            return "count";
        case AggFunc::First:
            return "first";
        case AggFunc::Last:
            return "last";
    }
    return "sum";
}

auto parse_agg_func(std::string_view name) -> std::optional<AggFunc> {
    const auto key = lower(trim(name));
    for (auto func : {AggFunc::Sum, AggFunc::Avg, AggFunc::Mean, AggFunc::Min, AggFunc::Max,
                      AggFunc::Count, AggFunc::First, AggFunc::Last}) {
        if (agg_func_name(func) == key) {
            return func;
        }
    }
    return std::nullopt;
}

auto join_kind_name(JoinKind kind) -> std::string_view {
    switch (kind) {
        case JoinKind::Inner:
            return "inner";
        case JoinKind::Left:
            return "left";
        case JoinKind::Right:
            return "right";
        case JoinKind::Outer:
            return "outer";
    }
    return "inner";
}

auto parse_join_kind(std::string_view name) -> std::optional<JoinKind> {
    const auto key = lower(trim(name));
    for (auto kind : {JoinKind::Inner, JoinKind::Left, JoinKind::Right, JoinKind::Outer}) {
        if (join_kind_name(kind) == key) {
            return kind;
        }
    }
    return std::nullopt;
}

auto cast_type_name(CastType type) -> std::string_view {
    switch (type) {
        case CastType::String:
            return "string";
        case CastType::Integer:
            return "integer";
        case CastType::Float:
            return "float";
        case CastType::Boolean:
            return "boolean";
        case CastType::Date:
            return "date";
        case CastType::Datetime:
            return "datetime";
    }
    return "string";
}

auto parse_cast_type(std::string_view name) -> CastType {
    const auto key = lower(trim(name));
    for (auto type : {CastType::Integer, CastType::Float, CastType::Boolean, CastType::Date,
                      CastType::Datetime}) {
        if (cast_type_name(type) == key) {
            return type;
        }
    }
    return CastType::String;
}

auto measure_output_name(const Measure& measure) -> std::string {
    if (!measure.alias.empty()) {
        return measure.alias;
    }
    std::string name(agg_func_name(measure.func));
    name.push_back('_');
    name.append(measure.column);
    return name;
}

auto split_list(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t comma = text.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = text.size();
        }
        auto item = trim(text.substr(pos, comma - pos));
        if (!item.empty()) {
            out.emplace_back(item);
        }
        pos = comma + 1;
    }
    return out;
}

auto parse_sort_spec(std::string_view spec) -> std::vector<SortKey> {
    std::vector<SortKey> keys;
    for (const auto& piece : split_list(spec)) {
        // First whitespace-separated token names the column; a trailing
        // `desc` token flips the direction.
        auto space = piece.find_first_of(" \t");
        SortKey key{.column = piece.substr(0, space), .ascending = true};
        if (space != std::string::npos) {
            auto last_space = piece.find_last_of(" \t");
            if (lower(piece.substr(last_space + 1)) == "desc") {
                key.ascending = false;
            }
        }
        keys.push_back(std::move(key));
    }
    return keys;
}

auto format_sort_spec(const std::vector<SortKey>& keys) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        out.append(keys[i].column);
        if (!keys[i].ascending) {
            out.append(" desc");
        }
    }
    return out;
}

}  // namespace pipit::graph
