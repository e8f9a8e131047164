#pragma once

#include <pipit/codegen/lowering.hpp>
#include <pipit/graph/graph.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pipit::codegen {

/// Emits a single `WITH ... SELECT` statement: one common table expression
/// per node in dependency order, then a select from the chosen end node.
///
/// A missing upstream binding reads as `MISSING` and unknown kinds become a
/// `/* TODO */` pass-through, so emission always completes.
class SqlEmitter {
   public:
    struct Config {
        /// DuckDB flavor reads sources with read_csv_auto; otherwise a
        /// generic placeholder select is emitted.
        bool duckdb = true;
        /// Node selected by the final statement; the last node when absent.
        std::optional<graph::NodeId> target;
        /// Replacement query bodies for source nodes, by node id.
        std::unordered_map<graph::NodeId, std::string> source_overrides;
    };

    void emit(std::ostream& out, const graph::Graph& graph, const Config& config);

    void emit(std::ostream& out, const graph::Graph& graph) { emit(out, graph, Config{}); }

   private:
    const graph::Graph* graph_{nullptr};
    const Config* config_{nullptr};
    BindingNames names_;

    /// Query body for one node.
    auto emit_node(const graph::Node& node, const std::vector<std::string>& inputs)
        -> std::string;

    auto emit_source(const graph::Node& node) -> std::string;
    auto emit_filter(const graph::Node& node, const std::string& input) -> std::string;
    auto emit_aggregate(const graph::AggregateConfig& config, const std::string& input)
        -> std::string;
    auto emit_compute(const graph::Node& node, const std::string& input) -> std::string;
    auto emit_join(const graph::JoinConfig& config, const std::string& left,
                   const std::string& right) -> std::string;

    /// Binding name as it appears in SQL (reserved words quoted).
    auto reference(const graph::NodeId& id) const -> std::string;
};

}  // namespace pipit::codegen
