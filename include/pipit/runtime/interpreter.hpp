#pragma once

#include <pipit/graph/graph.hpp>
#include <pipit/runtime/row.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>

namespace pipit::runtime {

enum class RunErrorKind : std::uint8_t {
    /// A blocking validation issue; nothing was executed.
    Validation,
    /// A source node without retrieved content.
    MissingPayload,
    /// A source payload that is not well-formed tabular text.
    Decode,
    /// A node kind the interpreter does not execute.
    Unsupported,
    /// Filter or formula text that does not parse.
    Expression,
};

struct RunError {
    RunErrorKind kind;
    std::string message;
};

/// Receives each sink's artifact: the sink path and the encoded text.
using SinkCallback = std::function<void(const std::string& path, const std::string& text)>;

struct RunOptions {
    /// Run only the ancestors of this node and return its rows.
    std::optional<graph::NodeId> target;
    /// Seed for sample nodes that carry no seed of their own.
    std::optional<std::uint64_t> seed;
    SinkCallback on_sink;
};

/// Execute the graph (or its slice up to `options.target`) in dependency
/// order. Returns the rows of the target, or of the last node in order.
[[nodiscard]] auto run(const graph::Graph& graph, const RunOptions& options = {})
    -> std::expected<RowSet, RunError>;

}  // namespace pipit::runtime
