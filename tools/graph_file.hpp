#pragma once

#include <pipit/graph/exchange.hpp>

#include <expected>
#include <filesystem>
#include <string>

namespace pipit::tools {

/// Whole file contents, or a message naming the path.
[[nodiscard]] auto read_text(const std::filesystem::path& path)
    -> std::expected<std::string, std::string>;

/// Read and import a graph exchange file.
[[nodiscard]] auto load_document(const std::filesystem::path& path)
    -> std::expected<graph::Document, std::string>;

/// Fill in the content of source nodes that have none by reading their path,
/// relative to `data_dir` unless absolute. Unreadable files are logged and
/// left unloaded. Returns the number of sources loaded.
auto resolve_sources(graph::Graph& graph, const std::filesystem::path& data_dir) -> std::size_t;

}  // namespace pipit::tools
