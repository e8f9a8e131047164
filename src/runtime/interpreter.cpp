#include <pipit/expr/identifiers.hpp>
#include <pipit/graph/topology.hpp>
#include <pipit/graph/validate.hpp>
#include <pipit/runtime/csv.hpp>
#include <pipit/runtime/eval.hpp>
#include <pipit/runtime/interpreter.hpp>
#include <pipit/runtime/ops.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <random>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pipit::runtime {

namespace {

using Scratch = std::unordered_map<graph::NodeId, RowSet>;

auto trimmed(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto expression_error(const graph::Node& node, const expr::ParseError& error) -> RunError {
    return RunError{.kind = RunErrorKind::Expression,
                    .message = fmt::format("{} \"{}\": invalid expression at {}",
                                           graph::kind_title(node.kind()), node.label,
                                           error.format())};
}

class Executor {
   public:
    Executor(const graph::Graph& graph, const RunOptions& options)
        : graph_(graph), options_(options) {}

    auto execute(const graph::Node& node) -> std::expected<RowSet, RunError> {
        const auto parents = graph_.parents(node.id);
        auto input = [&](std::size_t i) -> const RowSet& {
            static const RowSet empty;
            if (i >= parents.size()) {
                return empty;
            }
            auto it = scratch_.find(parents[i]);
            return it == scratch_.end() ? empty : it->second;
        };

        switch (node.kind()) {
            case graph::NodeKind::Source:
                return load_source(node);
            case graph::NodeKind::Project:
                return ops::project(input(0), node.as<graph::ProjectConfig>());
            case graph::NodeKind::Filter:
                return run_filter(node, input(0));
            case graph::NodeKind::Aggregate:
                return ops::aggregate(input(0), node.as<graph::AggregateConfig>());
            case graph::NodeKind::Compute:
                return run_compute(node, input(0));
            case graph::NodeKind::Sort:
                return ops::order(input(0), node.as<graph::SortConfig>().keys);
            case graph::NodeKind::Sample:
                return run_sample(node, input(0));
            case graph::NodeKind::Join:
                return ops::join(input(0), input(1), node.as<graph::JoinConfig>());
            case graph::NodeKind::Inspect:
                return input(0);
            case graph::NodeKind::Sink:
                return run_sink(node, input(0));
            case graph::NodeKind::Unsupported:
                break;
        }
        return std::unexpected(RunError{.kind = RunErrorKind::Unsupported,
                                        .message = fmt::format("Unsupported node type: {}",
                                                               graph::kind_name(node))});
    }

    void store(const graph::NodeId& id, RowSet rows) { scratch_[id] = std::move(rows); }

    auto take(const graph::NodeId& id) -> RowSet {
        auto it = scratch_.find(id);
        if (it == scratch_.end()) {
            return {};
        }
        return std::move(it->second);
    }

   private:
    auto load_source(const graph::Node& node) const -> std::expected<RowSet, RunError> {
        const auto& config = node.as<graph::SourceConfig>();
        if (!config.content.has_value()) {
            return std::unexpected(RunError{
                .kind = RunErrorKind::MissingPayload,
                .message = fmt::format("CSV Source \"{}\" has no loaded content", node.label)});
        }
        auto rows = decode_csv(*config.content);
        if (!rows) {
            return std::unexpected(RunError{
                .kind = RunErrorKind::Decode,
                .message = fmt::format("CSV Source \"{}\": {}", node.label, rows.error())});
        }
        return std::move(*rows);
    }

    static auto run_filter(const graph::Node& node, const RowSet& rows)
        -> std::expected<RowSet, RunError> {
        const auto text = trimmed(node.as<graph::FilterConfig>().expr);
        if (text.empty()) {
            return rows;
        }
        auto predicate = CompiledExpr::compile(text, EvalMode::Filter);
        if (!predicate) {
            return std::unexpected(expression_error(node, predicate.error()));
        }
        return ops::filter(rows, *predicate);
    }

    static auto run_compute(const graph::Node& node, const RowSet& rows)
        -> std::expected<RowSet, RunError> {
        const auto& config = node.as<graph::ComputeConfig>();
        std::vector<std::string> columns;
        if (!rows.empty()) {
            columns = rows.front().keys();
        }
        const auto text =
            expr::rewrite_columns(config.expr, columns, expr::RewriteTarget::NumberAccessor);
        auto formula = CompiledExpr::compile(text, EvalMode::Compute);
        if (!formula) {
            return std::unexpected(expression_error(node, formula.error()));
        }
        return ops::compute(rows, config.new_column, *formula);
    }

    auto run_sample(const graph::Node& node, const RowSet& rows) const -> RowSet {
        const auto& config = node.as<graph::SampleConfig>();
        std::uint64_t seed = 0;
        if (config.seed.has_value()) {
            seed = *config.seed;
        } else if (options_.seed.has_value()) {
            seed = *options_.seed;
        } else {
            std::random_device device;
            seed = (static_cast<std::uint64_t>(device()) << 32) | device();
        }
        return ops::sample(rows, config, seed);
    }

    auto run_sink(const graph::Node& node, const RowSet& rows) const -> RowSet {
        const auto& config = node.as<graph::SinkConfig>();
        if (options_.on_sink) {
            options_.on_sink(config.path, encode_csv(rows));
        } else {
            spdlog::warn("sink '{}' has no output callback; artifact for {} dropped", node.label,
                         config.path);
        }
        return rows;
    }

    const graph::Graph& graph_;
    const RunOptions& options_;
    Scratch scratch_;
};

}  // namespace

auto run(const graph::Graph& graph, const RunOptions& options) -> std::expected<RowSet, RunError> {
    if (options.target.has_value() && !graph.contains(*options.target)) {
        return std::unexpected(RunError{
            .kind = RunErrorKind::Validation,
            .message = fmt::format("Unknown target node: {}", *options.target)});
    }
    const auto slice = graph::subgraph_to(graph, options.target);

    auto issues = graph::validate(slice);
    if (!issues.empty()) {
        for (std::size_t i = 1; i < issues.size(); ++i) {
            spdlog::debug("validation: {}", issues[i].message);
        }
        return std::unexpected(
            RunError{.kind = RunErrorKind::Validation, .message = issues.front().message});
    }

    if (!graph::is_acyclic(slice)) {
        spdlog::warn("graph contains a cycle; executing nodes in declaration order");
    }
    const auto order = graph::topological_order(slice);
    spdlog::info("run: {} node(s), target {}", order.size(),
                 options.target.value_or(std::string("<last>")));

    Executor executor(slice, options);
    for (const auto& id : order) {
        const auto* node = slice.find(id);
        auto rows = executor.execute(*node);
        if (!rows) {
            spdlog::debug("node {} ({}) failed: {}", id, graph::kind_name(*node),
                          rows.error().message);
            return std::unexpected(std::move(rows.error()));
        }
        spdlog::debug("node {} ({} \"{}\"): {} row(s)", id, graph::kind_name(*node), node->label,
                      rows->size());
        executor.store(id, std::move(*rows));
    }

    if (order.empty()) {
        return RowSet{};
    }
    auto result = executor.take(options.target.value_or(order.back()));
    spdlog::info("run: finished with {} row(s)", result.size());
    return result;
}

}  // namespace pipit::runtime
