#include <pipit/graph/exchange.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <charconv>
#include <cmath>
#include <optional>
#include <type_traits>

namespace pipit::graph {

namespace {

using nlohmann::json;

template <typename T>
using Result = std::expected<T, ExchangeError>;

// Sample sizes stay within the doubles that hold integers exactly; seeds
// within 64 bits.
constexpr double kMaxExactInteger = 9007199254740992.0;
constexpr double kSeedLimit = 18446744073709551616.0;

auto fail(std::string message) -> std::unexpected<ExchangeError> {
    return std::unexpected(ExchangeError{.message = std::move(message)});
}

auto read_string(const json& data, const char* key, std::string fallback = {})
    -> Result<std::string> {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number() || it->is_boolean()) {
        return it->dump();
    }
    return fail(fmt::format("field '{}' must be a string", key));
}

/// Lists are stored either as a comma-separated string or a JSON array.
auto read_list(const json& data, const char* key, std::string_view fallback)
    -> Result<std::vector<std::string>> {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return split_list(fallback);
    }
    if (it->is_string()) {
        return split_list(it->get<std::string>());
    }
    if (it->is_array()) {
        std::vector<std::string> out;
        for (const auto& item : *it) {
            if (!item.is_string()) {
                return fail(fmt::format("field '{}' must contain strings", key));
            }
            if (!item.get<std::string>().empty()) {
                out.push_back(item.get<std::string>());
            }
        }
        return out;
    }
    return fail(fmt::format("field '{}' must be a list", key));
}

auto read_bool(const json& data, const char* key) -> Result<bool> {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return false;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        return text == "true" || text == "1";
    }
    if (it->is_number()) {
        return it->get<double>() != 0.0;
    }
    return fail(fmt::format("field '{}' must be a boolean", key));
}

/// Numbers may arrive as JSON numbers or numeric strings; "" counts as absent.
auto read_number(const json& data, const char* key) -> Result<std::optional<double>> {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return std::optional<double>{};
    }
    if (it->is_number()) {
        return std::optional<double>{it->get<double>()};
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        auto begin = text.find_first_not_of(" \t");
        if (begin == std::string::npos) {
            return std::optional<double>{};
        }
        auto end = text.find_last_not_of(" \t") + 1;
        double value = 0.0;
        auto [ptr, ec] = std::from_chars(text.data() + begin, text.data() + end, value);
        if (ec == std::errc{} && ptr == text.data() + end && std::isfinite(value)) {
            return std::optional<double>{value};
        }
    }
    return fail(fmt::format("field '{}' must be a number", key));
}

auto read_config(NodeKind kind, const std::string& type, const json& data) -> Result<NodeConfig> {
    switch (kind) {
        case NodeKind::Source: {
            SourceConfig config;
            auto path = read_string(data, "path", config.path);
            auto file_name = read_string(data, "_fileName");
            if (!path || !file_name) {
                return std::unexpected(path ? file_name.error() : path.error());
            }
            config.path = *path;
            config.file_name = *file_name;
            if (auto it = data.find("_fileText"); it != data.end() && it->is_string()) {
                config.content = it->get<std::string>();
            }
            return config;
        }
        case NodeKind::Project: {
            ProjectConfig config;
            auto columns = read_list(data, "columns", "*");
            if (!columns) {
                return std::unexpected(columns.error());
            }
            if (!(columns->size() == 1 && columns->front() == "*")) {
                config.columns = std::move(*columns);
            }
            if (auto it = data.find("schema"); it != data.end() && it->is_array()) {
                for (const auto& entry : *it) {
                    if (!entry.is_object()) {
                        return fail("schema entries must be objects");
                    }
                    auto name = read_string(entry, "name");
                    auto dtype = read_string(entry, "dtype", "string");
                    if (!name || !dtype) {
                        return std::unexpected(name ? dtype.error() : name.error());
                    }
                    if (name->empty()) {
                        continue;
                    }
                    config.schema.push_back(
                        ColumnCast{.name = *name, .type = parse_cast_type(*dtype)});
                }
            }
            return config;
        }
        case NodeKind::Filter: {
            auto expr = read_string(data, "expr", FilterConfig{}.expr);
            if (!expr) {
                return std::unexpected(expr.error());
            }
            return FilterConfig{.expr = *expr};
        }
        case NodeKind::Aggregate: {
            AggregateConfig config;
            auto group_by = read_list(data, "groupBy", "");
            if (!group_by) {
                return std::unexpected(group_by.error());
            }
            config.group_by = std::move(*group_by);
            if (auto it = data.find("measures"); it != data.end() && it->is_array()) {
                for (const auto& entry : *it) {
                    if (!entry.is_object()) {
                        return fail("measures must be objects");
                    }
                    auto column = read_string(entry, "col");
                    auto op = read_string(entry, "op");
                    auto alias = read_string(entry, "as");
                    if (!column || !op || !alias) {
                        return fail("measure fields must be strings");
                    }
                    if (column->empty() || op->empty()) {
                        continue;
                    }
                    auto func = parse_agg_func(*op);
                    if (!func.has_value()) {
                        return fail(fmt::format("unknown aggregate op '{}'", *op));
                    }
                    config.measures.push_back(
                        Measure{.column = *column, .func = *func, .alias = *alias});
                }
            }
            return config;
        }
        case NodeKind::Compute: {
            ComputeConfig config;
            auto new_column = read_string(data, "newCol", config.new_column);
            auto expr = read_string(data, "expr", config.expr);
            if (!new_column || !expr) {
                return std::unexpected(new_column ? expr.error() : new_column.error());
            }
            if (!new_column->empty()) {
                config.new_column = *new_column;
            }
            config.expr = *expr;
            return config;
        }
        case NodeKind::Sort: {
            auto spec = read_string(data, "sortSpec");
            if (!spec) {
                return std::unexpected(spec.error());
            }
            return SortConfig{.keys = parse_sort_spec(*spec)};
        }
        case NodeKind::Sample: {
            SampleConfig config;
            auto mode = read_string(data, "mode", "rows");
            if (!mode) {
                return std::unexpected(mode.error());
            }
            if (*mode == "fraction") {
                config.mode = SampleMode::Fraction;
            } else if (*mode != "rows" && !mode->empty()) {
                return fail(fmt::format("unknown sample mode '{}'", *mode));
            }
            auto rows = read_number(data, "n");
            auto fraction = read_number(data, "frac");
            auto seed = read_number(data, "seed");
            if (!rows || !fraction || !seed) {
                return std::unexpected(!rows ? rows.error()
                                             : (!fraction ? fraction.error() : seed.error()));
            }
            if (rows->has_value()) {
                if (std::fabs(**rows) > kMaxExactInteger) {
                    return fail("field 'n' is out of range");
                }
                config.rows = static_cast<std::int64_t>(std::trunc(**rows));
            }
            if (fraction->has_value()) {
                config.fraction = **fraction;
            }
            if (seed->has_value()) {
                if (**seed < 0) {
                    return fail("field 'seed' must not be negative");
                }
                if (**seed >= kSeedLimit) {
                    return fail("field 'seed' is out of range");
                }
                config.seed = static_cast<std::uint64_t>(**seed);
            }
            return config;
        }
        case NodeKind::Join: {
            JoinConfig config;
            auto how = read_string(data, "how", "inner");
            if (!how) {
                return std::unexpected(how.error());
            }
            auto join_kind = parse_join_kind(*how);
            if (!join_kind.has_value()) {
                return fail(fmt::format("unknown join kind '{}'", *how));
            }
            config.how = *join_kind;
            auto left_on = read_list(data, "left_on", "id");
            auto right_on = read_list(data, "right_on", "id");
            auto dedupe_left = read_bool(data, "dedupeLeft");
            auto dedupe_right = read_bool(data, "dedupeRight");
            auto pick = read_string(data, "dedupePick", "first");
            auto order_column = read_string(data, "dedupeOrderCol");
            if (!left_on || !right_on) {
                return std::unexpected(left_on ? right_on.error() : left_on.error());
            }
            if (!dedupe_left || !dedupe_right) {
                return std::unexpected(dedupe_left ? dedupe_right.error() : dedupe_left.error());
            }
            if (!pick || !order_column) {
                return std::unexpected(pick ? order_column.error() : pick.error());
            }
            config.left_on = std::move(*left_on);
            config.right_on = std::move(*right_on);
            config.dedupe_left = *dedupe_left;
            config.dedupe_right = *dedupe_right;
            if (*pick == "last") {
                config.pick = DedupePick::Last;
            } else if (*pick != "first" && !pick->empty()) {
                return fail(fmt::format("unknown dedupe pick '{}'", *pick));
            }
            config.dedupe_order_column = *order_column;
            return config;
        }
        case NodeKind::Inspect:
            return InspectConfig{};
        case NodeKind::Sink: {
            auto path = read_string(data, "path", SinkConfig{}.path);
            if (!path) {
                return std::unexpected(path.error());
            }
            return SinkConfig{.path = *path};
        }
        case NodeKind::Unsupported:
            break;
    }
    return UnsupportedConfig{.type_name = type};
}

auto parse_kind(std::string_view type) -> NodeKind {
    for (auto kind : {NodeKind::Source, NodeKind::Project, NodeKind::Filter, NodeKind::Aggregate,
                      NodeKind::Compute, NodeKind::Sort, NodeKind::Sample, NodeKind::Join,
                      NodeKind::Inspect, NodeKind::Sink}) {
        if (kind_name(kind) == type) {
            return kind;
        }
    }
    return NodeKind::Unsupported;
}

auto read_node(const json& entry) -> Result<Node> {
    if (!entry.is_object()) {
        return fail("node entries must be objects");
    }
    auto id_it = entry.find("id");
    if (id_it == entry.end() || !(id_it->is_string() || id_it->is_number())) {
        return fail("node without an id");
    }
    Node node;
    node.id = id_it->is_string() ? id_it->get<std::string>() : id_it->dump();
    if (node.id.empty()) {
        return fail("node without an id");
    }

    static const json empty = json::object();
    const json* data = &empty;
    if (auto it = entry.find("data"); it != entry.end() && it->is_object()) {
        data = &*it;
    }

    auto type = read_string(*data, "type");
    if (!type) {
        return fail(fmt::format("node '{}': {}", node.id, type.error().message));
    }
    const auto kind = parse_kind(*type);
    auto label = read_string(*data, "label");
    if (!label) {
        return fail(fmt::format("node '{}': {}", node.id, label.error().message));
    }
    node.label = label->empty() ? std::string(kind_title(kind)) : *label;

    auto config = read_config(kind, *type, *data);
    if (!config) {
        return fail(fmt::format("node '{}': {}", node.id, config.error().message));
    }
    node.config = std::move(*config);
    return node;
}

auto write_config(const Node& node, json& data) -> void {
    std::visit(
        [&](const auto& config) {
            using T = std::decay_t<decltype(config)>;
            if constexpr (std::is_same_v<T, SourceConfig>) {
                data["path"] = config.path;
                if (!config.file_name.empty()) {
                    data["_fileName"] = config.file_name;
                }
                if (config.content.has_value()) {
                    data["_fileText"] = *config.content;
                }
            } else if constexpr (std::is_same_v<T, ProjectConfig>) {
                std::string columns;
                for (const auto& column : config.columns) {
                    columns += columns.empty() ? column : ", " + column;
                }
                data["columns"] = columns.empty() ? "*" : columns;
                json schema = json::array();
                for (const auto& cast : config.schema) {
                    schema.push_back({{"name", cast.name}, {"dtype", std::string(cast_type_name(cast.type))}});
                }
                data["schema"] = std::move(schema);
            } else if constexpr (std::is_same_v<T, FilterConfig>) {
                data["expr"] = config.expr;
            } else if constexpr (std::is_same_v<T, AggregateConfig>) {
                std::string group_by;
                for (const auto& column : config.group_by) {
                    group_by += group_by.empty() ? column : ", " + column;
                }
                data["groupBy"] = group_by;
                json measures = json::array();
                for (const auto& measure : config.measures) {
                    measures.push_back({{"col", measure.column},
                                        {"op", std::string(agg_func_name(measure.func))},
                                        {"as", measure.alias}});
                }
                data["measures"] = std::move(measures);
            } else if constexpr (std::is_same_v<T, ComputeConfig>) {
                data["newCol"] = config.new_column;
                data["expr"] = config.expr;
            } else if constexpr (std::is_same_v<T, SortConfig>) {
                data["sortSpec"] = format_sort_spec(config.keys);
            } else if constexpr (std::is_same_v<T, SampleConfig>) {
                data["mode"] = config.mode == SampleMode::Fraction ? "fraction" : "rows";
                data["n"] = config.rows;
                data["frac"] = config.fraction;
                if (config.seed.has_value()) {
                    data["seed"] = *config.seed;
                } else {
                    data["seed"] = "";
                }
            } else if constexpr (std::is_same_v<T, JoinConfig>) {
                std::string left_on;
                for (const auto& column : config.left_on) {
                    left_on += left_on.empty() ? column : ", " + column;
                }
                std::string right_on;
                for (const auto& column : config.right_on) {
                    right_on += right_on.empty() ? column : ", " + column;
                }
                data["how"] = std::string(join_kind_name(config.how));
                data["left_on"] = left_on;
                data["right_on"] = right_on;
                data["dedupeLeft"] = config.dedupe_left;
                data["dedupeRight"] = config.dedupe_right;
                data["dedupePick"] = config.pick == DedupePick::Last ? "last" : "first";
                data["dedupeOrderCol"] = config.dedupe_order_column;
            } else if constexpr (std::is_same_v<T, SinkConfig>) {
                data["path"] = config.path;
            }
        },
        node.config);
}

}  // namespace

auto import_document(std::string_view text) -> std::expected<Document, ExchangeError> {
    json root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        return fail("malformed JSON");
    }
    if (!root.is_object()) {
        return fail("expected a JSON object at the top level");
    }
    auto nodes_it = root.find("nodes");
    auto edges_it = root.find("edges");
    if (nodes_it == root.end() || !nodes_it->is_array()) {
        return fail("missing 'nodes' array");
    }
    if (edges_it == root.end() || !edges_it->is_array()) {
        return fail("missing 'edges' array");
    }

    Document document;
    for (const auto& entry : *nodes_it) {
        auto node = read_node(entry);
        if (!node) {
            return std::unexpected(node.error());
        }
        document.graph.add_node(std::move(*node));
    }
    for (const auto& entry : *edges_it) {
        if (!entry.is_object()) {
            return fail("edge entries must be objects");
        }
        auto source = read_string(entry, "source");
        auto target = read_string(entry, "target");
        if (!source || !target) {
            return fail("edge endpoints must be strings");
        }
        if (!document.graph.contains(*source)) {
            return fail(fmt::format("edge source '{}' is not a node", *source));
        }
        if (!document.graph.contains(*target)) {
            return fail(fmt::format("edge target '{}' is not a node", *target));
        }
        document.graph.add_edge(std::move(*source), std::move(*target));
    }

    auto lang = read_string(root, "lang", document.lang);
    auto engine = read_string(root, "execEngine", document.exec_engine);
    if (!lang || !engine) {
        return std::unexpected(lang ? engine.error() : lang.error());
    }
    document.lang = std::move(*lang);
    document.exec_engine = std::move(*engine);
    return document;
}

auto import_graph(std::string_view text) -> std::expected<Graph, ExchangeError> {
    auto document = import_document(text);
    if (!document) {
        return std::unexpected(document.error());
    }
    return std::move(document->graph);
}

auto export_document(const Document& document, int indent) -> std::string {
    json nodes = json::array();
    for (const auto& node : document.graph.nodes()) {
        json data = json::object();
        data["label"] = node.label;
        data["type"] = kind_name(node);
        write_config(node, data);
        nodes.push_back({{"id", node.id}, {"data", std::move(data)}});
    }
    json edges = json::array();
    for (const auto& edge : document.graph.edges()) {
        edges.push_back({{"id", fmt::format("e{}-{}", edge.source, edge.target)},
                         {"source", edge.source},
                         {"target", edge.target}});
    }
    json root = {{"nodes", std::move(nodes)},
                 {"edges", std::move(edges)},
                 {"lang", document.lang},
                 {"execEngine", document.exec_engine}};
    return root.dump(indent);
}

auto export_graph(const Graph& graph, int indent) -> std::string {
    return export_document(Document{.graph = graph}, indent);
}

}  // namespace pipit::graph
