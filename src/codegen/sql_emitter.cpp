#include <pipit/codegen/sql_emitter.hpp>
#include <pipit/expr/identifiers.hpp>
#include <pipit/expr/parser.hpp>
#include <pipit/graph/topology.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <string_view>

namespace pipit::codegen {

namespace {

constexpr std::string_view kMissing = "MISSING";

constexpr std::array<std::string_view, 36> kReservedWords = {
    "all",    "and",   "as",    "by",    "case",   "cross", "distinct", "else",  "end",
    "except", "from",  "full",  "group", "having", "in",    "inner",    "is",    "join",
    "left",   "like",  "limit", "not",   "null",   "on",    "or",       "order", "outer",
    "right",  "select", "table", "then", "union",  "using", "when",     "where", "with",
};

auto trimmed(std::string_view text) -> std::string {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(begin, end - begin + 1));
}

auto quoted_list(const std::vector<std::string>& columns) -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(columns.size());
    for (const auto& column : columns) {
        out.push_back(expr::quote_identifier(column));
    }
    return out;
}

auto measure_sql(const graph::Measure& measure) -> std::string {
    const auto column = expr::quote_identifier(measure.column);
    switch (measure.func) {
        case graph::AggFunc::Sum:
            return fmt::format("COALESCE(SUM(TRY_CAST({} AS DOUBLE)), 0)", column);
        case graph::AggFunc::Avg:
        case graph::AggFunc::Mean:
            return fmt::format("AVG(TRY_CAST({} AS DOUBLE))", column);
        case graph::AggFunc::Min:
            return fmt::format("MIN(TRY_CAST({} AS DOUBLE))", column);
        case graph::AggFunc::Max:
            return fmt::format("MAX(TRY_CAST({} AS DOUBLE))", column);
        case graph::AggFunc::Count:
            return "COUNT(*)";
        case graph::AggFunc::First:
            return fmt::format("FIRST({0}) FILTER (WHERE {0} IS NOT NULL)", column);
        case graph::AggFunc::Last:
            return fmt::format("LAST({0}) FILTER (WHERE {0} IS NOT NULL)", column);
    }
    return "COUNT(*)";
}

auto join_keyword(graph::JoinKind kind) -> std::string_view {
    switch (kind) {
        case graph::JoinKind::Inner:
            return "INNER JOIN";
        case graph::JoinKind::Left:
            return "LEFT JOIN";
        case graph::JoinKind::Right:
            return "RIGHT JOIN";
        case graph::JoinKind::Outer:
            return "FULL OUTER JOIN";
    }
    return "INNER JOIN";
}

}  // namespace

void SqlEmitter::emit(std::ostream& out, const graph::Graph& graph, const Config& config) {
    graph_ = &graph;
    config_ = &config;

    const auto order = graph::topological_order(graph);
    names_ = binding_names(graph, order);

    std::vector<std::string> ctes;
    ctes.reserve(order.size());
    for (const auto& id : order) {
        std::vector<std::string> inputs;
        for (const auto& parent : graph.parents(id)) {
            inputs.push_back(reference(parent));
        }
        ctes.push_back(
            fmt::format("{} AS ({})", reference(id), emit_node(*graph.find(id), inputs)));
    }

    std::string last = "final";
    if (config.target.has_value() && names_.contains(*config.target)) {
        last = reference(*config.target);
    } else if (!order.empty()) {
        last = reference(order.back());
    }

    fmt::print(out, "-- Auto-generated by pipit (SQL{})\n", config.duckdb ? ", DuckDB" : "");
    if (!ctes.empty()) {
        fmt::print(out, "WITH\n  {}\n", fmt::join(ctes, ",\n  "));
    }
    fmt::print(out, "SELECT * FROM {};\n", last);
}

auto SqlEmitter::reference(const graph::NodeId& id) const -> std::string {
    const auto& name = names_.at(id);
    if (std::find(kReservedWords.begin(), kReservedWords.end(), name) != kReservedWords.end()) {
        return fmt::format("\"{}\"", name);
    }
    return name;
}

auto SqlEmitter::emit_node(const graph::Node& node, const std::vector<std::string>& inputs)
    -> std::string {
    auto input = [&](std::size_t i) -> std::string {
        return i < inputs.size() ? inputs[i] : std::string(kMissing);
    };

    switch (node.kind()) {
        case graph::NodeKind::Source:
            return emit_source(node);
        case graph::NodeKind::Project: {
            const auto& config = node.as<graph::ProjectConfig>();
            if (config.columns.empty()) {
                return fmt::format("SELECT * FROM {}", input(0));
            }
            return fmt::format("SELECT {} FROM {}", fmt::join(quoted_list(config.columns), ", "),
                               input(0));
        }
        case graph::NodeKind::Filter:
            return emit_filter(node, input(0));
        case graph::NodeKind::Aggregate:
            return emit_aggregate(node.as<graph::AggregateConfig>(), input(0));
        case graph::NodeKind::Compute:
            return emit_compute(node, input(0));
        case graph::NodeKind::Sort: {
            const auto& keys = node.as<graph::SortConfig>().keys;
            if (keys.empty()) {
                return fmt::format("SELECT * FROM {}", input(0));
            }
            std::vector<std::string> terms;
            for (const auto& key : keys) {
                terms.push_back(fmt::format("{} {}", expr::quote_identifier(key.column),
                                            key.ascending ? "ASC NULLS FIRST" : "DESC NULLS LAST"));
            }
            return fmt::format("SELECT * FROM {} ORDER BY {}", input(0), fmt::join(terms, ", "));
        }
        case graph::NodeKind::Sample: {
            const auto& config = node.as<graph::SampleConfig>();
            if (config.mode == graph::SampleMode::Fraction) {
                const double fraction =
                    std::clamp(std::isfinite(config.fraction) ? config.fraction : 0.1, 0.0, 1.0);
                return fmt::format("SELECT * FROM {} WHERE random() < {}", input(0), fraction);
            }
            const auto rows = std::max<std::int64_t>(0, config.rows);
            if (config_->duckdb) {
                return fmt::format("SELECT * FROM {} USING SAMPLE {} ROWS", input(0), rows);
            }
            return fmt::format("SELECT * FROM {} ORDER BY random() LIMIT {}", input(0), rows);
        }
        case graph::NodeKind::Join:
            return emit_join(node.as<graph::JoinConfig>(), input(0), input(1));
        case graph::NodeKind::Inspect:
        case graph::NodeKind::Sink:
            return fmt::format("SELECT * FROM {}", input(0));
        case graph::NodeKind::Unsupported:
            break;
    }
    return fmt::format("SELECT /* TODO: {} */ * FROM {}", graph::kind_name(node), input(0));
}

auto SqlEmitter::emit_source(const graph::Node& node) -> std::string {
    if (auto it = config_->source_overrides.find(node.id); it != config_->source_overrides.end()) {
        return it->second;
    }
    const auto path = sql_string(node.as<graph::SourceConfig>().path);
    if (config_->duckdb) {
        return fmt::format("SELECT * FROM read_csv_auto({}, header=true)", path);
    }
    return fmt::format("/* TODO */ SELECT * FROM {}", path);
}

auto SqlEmitter::emit_filter(const graph::Node& node, const std::string& input) -> std::string {
    const auto text = trimmed(node.as<graph::FilterConfig>().expr);
    if (text.empty()) {
        return fmt::format("SELECT * FROM {} WHERE 1=1", input);
    }
    auto ast = expr::parse(text);
    if (!ast) {
        return fmt::format("SELECT * FROM {} WHERE {} /* TODO: filter not parsed ({}) */", input,
                           expr::soften_numeric_comparisons(text), ast.error().format());
    }
    return fmt::format("SELECT * FROM {} WHERE {}", input, lower_sql_predicate(**ast));
}

auto SqlEmitter::emit_aggregate(const graph::AggregateConfig& config, const std::string& input)
    -> std::string {
    const auto by = quoted_list(config.group_by);
    std::vector<std::string> parts = by;
    for (const auto& measure : config.measures) {
        if (measure.column.empty()) {
            continue;
        }
        parts.push_back(fmt::format("{} AS {}", measure_sql(measure),
                                    expr::quote_identifier(graph::measure_output_name(measure))));
    }
    if (parts.empty()) {
        return fmt::format("SELECT /* TODO: nothing to summarize */ * FROM {}", input);
    }
    if (by.empty()) {
        return fmt::format("SELECT {} FROM {}", fmt::join(parts, ", "), input);
    }
    return fmt::format("SELECT {} FROM {} GROUP BY {}", fmt::join(parts, ", "), input,
                       fmt::join(by, ", "));
}

auto SqlEmitter::emit_compute(const graph::Node& node, const std::string& input) -> std::string {
    const auto& config = node.as<graph::ComputeConfig>();
    const auto column = expr::quote_identifier(config.new_column);
    auto ast = expr::parse(config.expr);
    if (!ast) {
        const auto text = expr::rewrite_columns(config.expr, known_columns(*graph_, node.id),
                                                expr::RewriteTarget::QuotedIdentifier);
        return fmt::format("SELECT *, ({}) AS {} FROM {} /* TODO: formula not parsed ({}) */", text,
                           column, input, ast.error().format());
    }
    const auto style = formula_identifier_style(config.expr);
    return fmt::format("SELECT *, ({}) AS {} FROM {}", lower_sql_formula(**ast, style), column,
                       input);
}

auto SqlEmitter::emit_join(const graph::JoinConfig& config, const std::string& left,
                           const std::string& right) -> std::string {
    std::vector<std::string> right_on;
    for (std::size_t i = 0; i < config.left_on.size(); ++i) {
        if (i < config.right_on.size()) {
            right_on.push_back(config.right_on[i]);
        } else if (!config.right_on.empty()) {
            right_on.push_back(config.right_on.front());
        }
    }
    const auto left_keys = quoted_list(config.left_on);
    const auto right_keys = quoted_list(right_on);

    const auto tie_break =
        config.dedupe_order_column.empty()
            ? std::string("1")
            : fmt::format("{} {}", expr::quote_identifier(config.dedupe_order_column),
                          config.pick == graph::DedupePick::First ? "ASC" : "DESC");
    auto dedupe = [&](const std::string& input, const std::vector<std::string>& keys) {
        return fmt::format("(SELECT *{} FROM (SELECT *, ROW_NUMBER() OVER (PARTITION BY {} "
                           "ORDER BY {}) AS rn FROM {}) WHERE rn = 1)",
                           config_->duckdb ? " EXCLUDE (rn)" : "", fmt::join(keys, ", "),
                           tie_break, input);
    };

    const auto left_side =
        config.dedupe_left && !left_keys.empty() ? dedupe(left, left_keys) : left;
    const auto right_side =
        config.dedupe_right && !right_keys.empty() ? dedupe(right, right_keys) : right;

    std::vector<std::string> conditions;
    for (std::size_t i = 0; i < left_keys.size() && i < right_keys.size(); ++i) {
        conditions.push_back(fmt::format("l.{} = r.{}", left_keys[i], right_keys[i]));
    }
    const auto on = conditions.empty() ? std::string("TRUE")
                                       : fmt::format("{}", fmt::join(conditions, " AND "));
    return fmt::format("SELECT * FROM {} AS l {} {} AS r ON {}", left_side,
                       join_keyword(config.how), right_side, on);
}

}  // namespace pipit::codegen
