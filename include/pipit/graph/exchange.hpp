#pragma once

#include <pipit/graph/graph.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace pipit::graph {

struct ExchangeError {
    std::string message;
};

/// Persisted pipeline: the graph plus the editor's dialect and engine choice.
struct Document {
    Graph graph;
    std::string lang = "python";
    std::string exec_engine = "js";
};

/// Parse the JSON exchange format.
[[nodiscard]] auto import_document(std::string_view text) -> std::expected<Document, ExchangeError>;
[[nodiscard]] auto import_graph(std::string_view text) -> std::expected<Graph, ExchangeError>;

/// Serialize to the JSON exchange format. `indent < 0` gives compact output.
[[nodiscard]] auto export_document(const Document& document, int indent = 2) -> std::string;
[[nodiscard]] auto export_graph(const Graph& graph, int indent = 2) -> std::string;

}  // namespace pipit::graph
