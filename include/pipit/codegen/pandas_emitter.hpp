#pragma once

#include <pipit/codegen/lowering.hpp>
#include <pipit/graph/graph.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace pipit::codegen {

/// Emits a pandas script from a pipeline graph.
///
/// One binding per node in dependency order; the script ends by binding
/// `result` to the target node (or the last node in order). Emission never
/// fails: nodes with the wrong number of inputs get a `# WARN:` line and
/// unknown kinds a `# TODO:` line.
class PandasEmitter {
   public:
    struct Config {
        /// Node bound to `result`; the last node in order when absent.
        std::optional<graph::NodeId> target;
        /// Emit the `_n`/`_s`/`_b` helper definitions.
        bool helpers = true;
    };

    void emit(std::ostream& out, const graph::Graph& graph, const Config& config);

    void emit(std::ostream& out, const graph::Graph& graph) { emit(out, graph, Config{}); }

   private:
    std::ostream* out_{nullptr};
    BindingNames names_;

    void line(const std::string& text = {});
    void emit_preamble(bool helpers);
    void emit_node(const graph::Node& node, const std::vector<std::string>& inputs);

    void emit_project(const std::string& var, const std::string& input,
                      const graph::ProjectConfig& config);
    void emit_filter(const graph::Node& node, const std::string& var, const std::string& input);
    void emit_aggregate(const std::string& var, const std::string& input,
                        const graph::AggregateConfig& config);
    void emit_compute(const graph::Node& node, const std::string& var, const std::string& input);
    void emit_sort(const std::string& var, const std::string& input,
                   const graph::SortConfig& config);
    void emit_sample(const std::string& var, const std::string& input,
                     const graph::SampleConfig& config);
    void emit_join(const std::string& var, const std::vector<std::string>& inputs,
                   const graph::JoinConfig& config);

    /// Right-hand side casting one column to `type`.
    static auto emit_cast(const std::string& column, graph::CastType type) -> std::string;
};

}  // namespace pipit::codegen
