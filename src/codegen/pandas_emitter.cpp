#include <pipit/codegen/pandas_emitter.hpp>
#include <pipit/expr/parser.hpp>
#include <pipit/graph/topology.hpp>
#include <pipit/graph/validate.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <string_view>

namespace pipit::codegen {

namespace {

constexpr std::string_view kHelpers = R"py(def _num(s):
    t = s.astype("string").str.replace(r"[₹$£€¥₩,\s]", "", regex=True)
    return pd.to_numeric(t.str.replace(r"%$", "", regex=True), errors="coerce")

def _isnull(v):
    return v is None or (isinstance(v, float) and v != v)

def _to_bool(v):
    t = str(v).strip().lower()
    if t in ("true", "t", "1", "yes", "y"):
        return True
    if t in ("false", "f", "0", "no", "n"):
        return False
    return None

def _n(r, c):
    try:
        f = float(str(r.get(c)).replace(",", "").strip())
        return 0.0 if f != f else f
    except (TypeError, ValueError):
        return 0.0

def _s(r, c):
    v = r.get(c)
    return "" if _isnull(v) else str(v)

def _b(r, c):
    v = r.get(c)
    t = _to_bool(v)
    if t is not None:
        return t
    return False if _isnull(v) else bool(v)

def _try(f):
    try:
        return f()
    except Exception:
        return None
)py";

constexpr std::array<std::string_view, 20> kPythonKeywords = {
    "and",  "as",   "def",   "del", "elif", "else",   "for",   "from", "if",    "import",
    "in",   "is",   "not",   "or",  "pass", "return", "while", "with", "class", "lambda",
};

auto trimmed(std::string_view text) -> std::string {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(begin, end - begin + 1));
}

/// "select", "filter", ... as used in warnings.
auto short_kind(graph::NodeKind kind) -> std::string {
    const auto name = graph::kind_name(kind);
    const auto dot = name.find('.');
    if (dot == std::string_view::npos) {
        return std::string(name);
    }
    return std::string(name.starts_with("transform.") ? name.substr(dot + 1) : name.substr(0, dot));
}

auto python_bool(bool value) -> std::string_view {
    return value ? "True" : "False";
}

auto pandas_agg(const graph::Measure& measure) -> std::string {
    switch (measure.func) {
        case graph::AggFunc::Sum:
            return "lambda s: _num(s).sum()";
        case graph::AggFunc::Avg:
        case graph::AggFunc::Mean:
            return "lambda s: _num(s).mean()";
        case graph::AggFunc::Min:
            return "lambda s: _num(s).min()";
        case graph::AggFunc::Max:
            return "lambda s: _num(s).max()";
        case graph::AggFunc::Count:
            return "'size'";
        case graph::AggFunc::First:
            return "'first'";
        case graph::AggFunc::Last:
            return "'last'";
    }
    return "'size'";
}

}  // namespace

void PandasEmitter::line(const std::string& text) {
    *out_ << text << '\n';
}

void PandasEmitter::emit(std::ostream& out, const graph::Graph& graph, const Config& config) {
    out_ = &out;

    const auto order = graph::topological_order(graph);
    names_ = binding_names(graph, order);
    for (auto& [id, name] : names_) {
        if (std::find(kPythonKeywords.begin(), kPythonKeywords.end(), name) !=
            kPythonKeywords.end()) {
            name.push_back('_');
        }
    }

    emit_preamble(config.helpers);
    for (const auto& id : order) {
        const auto* node = graph.find(id);
        std::vector<std::string> inputs;
        for (const auto& parent : graph.parents(id)) {
            inputs.push_back(names_.at(parent));
        }
        emit_node(*node, inputs);
    }

    if (!order.empty()) {
        const auto& end = config.target.has_value() && names_.contains(*config.target)
                              ? *config.target
                              : order.back();
        line("# Final result");
        line(fmt::format("result = {}", names_.at(end)));
        line();
    }
}

void PandasEmitter::emit_preamble(bool helpers) {
    line("# Auto-generated by pipit (pandas)");
    line("import math");
    line("import pandas as pd");
    line();
    if (helpers) {
        *out_ << kHelpers;
        line();
    }
}

void PandasEmitter::emit_node(const graph::Node& node, const std::vector<std::string>& inputs) {
    const auto& var = names_.at(node.id);
    const auto kind = node.kind();

    if (kind == graph::NodeKind::Unsupported) {
        line(fmt::format("# TODO: {}", graph::kind_name(node)));
        line();
        return;
    }
    if (kind != graph::NodeKind::Source) {
        const auto expected = graph::required_inputs(kind).value_or(1);
        if (inputs.size() != expected) {
            line(fmt::format("# WARN: {} expects {} input{}", short_kind(kind), expected,
                             expected == 1 ? "" : "s"));
            line();
            return;
        }
    }

    switch (kind) {
        case graph::NodeKind::Source: {
            const auto& config = node.as<graph::SourceConfig>();
            line(fmt::format("# Source: {}", node.label.empty() ? "CSV" : node.label));
            line(fmt::format("{} = pd.read_csv({})", var, python_string(config.path)));
            break;
        }
        case graph::NodeKind::Project:
            line("# Select columns");
            emit_project(var, inputs[0], node.as<graph::ProjectConfig>());
            break;
        case graph::NodeKind::Filter:
            line("# Filter rows");
            emit_filter(node, var, inputs[0]);
            break;
        case graph::NodeKind::Aggregate:
            line("# Summarize / Group By");
            emit_aggregate(var, inputs[0], node.as<graph::AggregateConfig>());
            break;
        case graph::NodeKind::Compute:
            line("# Formula");
            emit_compute(node, var, inputs[0]);
            break;
        case graph::NodeKind::Sort:
            line("# Sort");
            emit_sort(var, inputs[0], node.as<graph::SortConfig>());
            break;
        case graph::NodeKind::Sample:
            line("# Sample");
            emit_sample(var, inputs[0], node.as<graph::SampleConfig>());
            break;
        case graph::NodeKind::Join:
            line("# Join dataframes");
            emit_join(var, inputs, node.as<graph::JoinConfig>());
            break;
        case graph::NodeKind::Inspect:
            line(fmt::format("# Inspect: {}", node.label));
            line(fmt::format("{} = {}", var, inputs[0]));
            break;
        case graph::NodeKind::Sink: {
            const auto& config = node.as<graph::SinkConfig>();
            line("# Write to CSV");
            line(fmt::format("{}.to_csv({}, index=False)", inputs[0], python_string(config.path)));
            line(fmt::format("# wrote: {}", config.path));
            line(fmt::format("{} = {}", var, inputs[0]));
            break;
        }
        case graph::NodeKind::Unsupported:
            break;
    }
    line();
}

void PandasEmitter::emit_project(const std::string& var, const std::string& input,
                                 const graph::ProjectConfig& config) {
    if (config.columns.empty()) {
        line(fmt::format("{} = {}.copy()", var, input));
    } else {
        line(fmt::format("{} = {}.reindex(columns={})", var, input, python_list(config.columns)));
    }

    // Later entries for the same column win.
    std::vector<graph::ColumnCast> casts;
    for (const auto& cast : config.schema) {
        auto name = trimmed(cast.name);
        if (name.empty()) {
            continue;
        }
        auto it = std::find_if(casts.begin(), casts.end(),
                               [&](const graph::ColumnCast& c) { return c.name == name; });
        if (it != casts.end()) {
            it->type = cast.type;
        } else {
            casts.push_back(graph::ColumnCast{.name = std::move(name), .type = cast.type});
        }
    }
    for (const auto& cast : casts) {
        const auto column = python_string(cast.name);
        const auto ref = fmt::format("{}[{}]", var, column);
        line(fmt::format("if {} in {}.columns:", column, var));
        line(fmt::format("    {} = {}", ref, emit_cast(ref, cast.type)));
    }
}

void PandasEmitter::emit_filter(const graph::Node& node, const std::string& var,
                                const std::string& input) {
    const auto text = trimmed(node.as<graph::FilterConfig>().expr);
    if (text.empty()) {
        line(fmt::format("{} = {}.copy()", var, input));
        return;
    }
    auto ast = expr::parse(text);
    if (!ast) {
        line(fmt::format("# TODO: filter not parsed ({}); passed to query() as written",
                         ast.error().format()));
        line(fmt::format("{} = {}.query({})", var, input, python_string(text)));
        return;
    }
    if (fits_query(**ast)) {
        line(fmt::format("{} = {}.query({})", var, input, python_string(lower_query(**ast))));
        return;
    }
    line(fmt::format(
        "{} = {}[{}.apply(lambda r: bool(_try(lambda: {})), axis=1, result_type=\"reduce\")]", var,
        input, input, lower_python(**ast, IdentifierStyle::Field)));
}

void PandasEmitter::emit_aggregate(const std::string& var, const std::string& input,
                                   const graph::AggregateConfig& config) {
    std::vector<std::string> specs;
    for (const auto& measure : config.measures) {
        if (measure.column.empty()) {
            continue;
        }
        specs.push_back(fmt::format("{}: ({}, {})",
                                    python_string(graph::measure_output_name(measure)),
                                    python_string(measure.column), pandas_agg(measure)));
    }

    if (config.group_by.empty()) {
        if (specs.empty()) {
            line(fmt::format("{} = pd.DataFrame([{{}}])", var));
            return;
        }
        line(fmt::format("{} = {}.assign(_all=0).groupby('_all', sort=False).agg(**{{{}}})"
                         ".reset_index(drop=True)",
                         var, input, fmt::join(specs, ", ")));
        return;
    }
    const auto by = python_list(config.group_by);
    if (specs.empty()) {
        line(fmt::format("{} = {}[{}].drop_duplicates()", var, input, by));
        return;
    }
    line(fmt::format("{} = {}.groupby({}, sort=False, dropna=False).agg(**{{{}}}).reset_index()",
                     var, input, by, fmt::join(specs, ", ")));
}

void PandasEmitter::emit_compute(const graph::Node& node, const std::string& var,
                                 const std::string& input) {
    const auto& config = node.as<graph::ComputeConfig>();
    const auto column = python_string(config.new_column);
    line(fmt::format("{} = {}.copy()", var, input));

    auto ast = expr::parse(config.expr);
    if (!ast) {
        line(fmt::format("# TODO: formula not parsed ({}); passed to eval() as written",
                         ast.error().format()));
        line(fmt::format("{}[{}] = {}.eval({}, engine=\"python\")", var, column, var,
                         python_string(config.expr)));
        return;
    }
    const auto style = formula_identifier_style(config.expr);
    line(fmt::format("{}[{}] = {}.apply(lambda r: _try(lambda: {}), axis=1, result_type=\"reduce\")",
                     var, column, var, lower_python(**ast, style)));
}

void PandasEmitter::emit_sort(const std::string& var, const std::string& input,
                              const graph::SortConfig& config) {
    if (config.keys.empty()) {
        line(fmt::format("{} = {}.copy()", var, input));
        return;
    }
    std::vector<std::string> columns;
    std::vector<std::string_view> ascending;
    for (const auto& key : config.keys) {
        columns.push_back(key.column);
        ascending.push_back(python_bool(key.ascending));
    }
    // pandas places nulls for all keys at once; follow the leading key.
    line(fmt::format("{} = {}.sort_values({}, ascending=[{}], kind=\"stable\", na_position=\"{}\")",
                     var, input, python_list(columns), fmt::join(ascending, ", "),
                     config.keys.front().ascending ? "first" : "last"));
}

void PandasEmitter::emit_sample(const std::string& var, const std::string& input,
                                const graph::SampleConfig& config) {
    const auto random_state =
        config.seed.has_value() ? fmt::format("{}", *config.seed) : std::string("None");
    if (config.mode == graph::SampleMode::Fraction) {
        const double fraction =
            std::clamp(std::isfinite(config.fraction) ? config.fraction : 0.1, 0.0, 1.0);
        line(fmt::format("{} = {}.sample(frac={}, random_state={})", var, input, fraction,
                         random_state));
        return;
    }
    const auto rows = std::max<std::int64_t>(0, config.rows);
    line(fmt::format("{} = {}.sample(n=min({}, len({})), random_state={})", var, input, rows, input,
                     random_state));
}

void PandasEmitter::emit_join(const std::string& var, const std::vector<std::string>& inputs,
                              const graph::JoinConfig& config) {
    std::vector<std::string> right_keys;
    for (std::size_t i = 0; i < config.left_on.size(); ++i) {
        if (i < config.right_on.size()) {
            right_keys.push_back(config.right_on[i]);
        } else if (!config.right_on.empty()) {
            right_keys.push_back(config.right_on.front());
        }
    }

    auto dedupe = [&](const std::string& side, const std::string& input,
                      const std::vector<std::string>& keys) -> std::string {
        const bool first = config.pick == graph::DedupePick::First;
        const auto name = fmt::format("{}_{}", var, side);
        if (config.dedupe_order_column.empty()) {
            line(fmt::format("{} = {}.drop_duplicates(subset={}, keep=\"{}\")", name, input,
                             python_list(keys), first ? "first" : "last"));
        } else {
            line(fmt::format("{} = {}.sort_values({}, ascending={}, kind=\"stable\")"
                             ".drop_duplicates(subset={}, keep=\"first\")",
                             name, input, python_string(config.dedupe_order_column),
                             python_bool(first), python_list(keys)));
        }
        return name;
    };

    const auto left =
        config.dedupe_left ? dedupe("left", inputs[0], config.left_on) : inputs[0];
    const auto right = config.dedupe_right ? dedupe("right", inputs[1], right_keys) : inputs[1];
    line(fmt::format("{} = {}.merge({}, how=\"{}\", left_on={}, right_on={})", var, left, right,
                     graph::join_kind_name(config.how), python_list(config.left_on),
                     python_list(right_keys)));
}

auto PandasEmitter::emit_cast(const std::string& column, graph::CastType type) -> std::string {
    switch (type) {
        case graph::CastType::String:
            return fmt::format("{}.astype(\"string\").str.strip()", column);
        case graph::CastType::Integer:
            return fmt::format(
                "_num({}).apply(lambda x: None if x != x else math.trunc(x)).astype(\"Int64\")",
                column);
        case graph::CastType::Float:
            return fmt::format("_num({})", column);
        case graph::CastType::Boolean:
            return fmt::format(
                "{}.map(lambda v: None if _isnull(v) else _to_bool(v)).astype(\"boolean\")", column);
        case graph::CastType::Date:
            return fmt::format(
                "pd.to_datetime({}, errors=\"coerce\", utc=True).dt.strftime(\"%Y-%m-%d\")", column);
        case graph::CastType::Datetime:
            return fmt::format("pd.to_datetime({}, errors=\"coerce\", utc=True)"
                               ".dt.strftime(\"%Y-%m-%dT%H:%M:%S.%fZ\")",
                               column);
    }
    return column;
}

}  // namespace pipit::codegen
