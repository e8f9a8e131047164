#include "graph_file.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <vector>

namespace pipit::tools {

auto read_text(const std::filesystem::path& path) -> std::expected<std::string, std::string> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(fmt::format("cannot open '{}'", path.string()));
    }
    return std::string(std::istreambuf_iterator<char>{in}, {});
}

auto load_document(const std::filesystem::path& path)
    -> std::expected<graph::Document, std::string> {
    auto text = read_text(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto document = graph::import_document(*text);
    if (!document) {
        return std::unexpected(fmt::format("{}: {}", path.string(), document.error().message));
    }
    return std::move(*document);
}

auto resolve_sources(graph::Graph& graph, const std::filesystem::path& data_dir) -> std::size_t {
    std::vector<graph::Node> loaded;
    for (const auto& node : graph.nodes()) {
        if (node.kind() != graph::NodeKind::Source) {
            continue;
        }
        const auto& config = node.as<graph::SourceConfig>();
        if (config.content.has_value()) {
            continue;
        }
        std::filesystem::path path = config.path;
        if (path.is_relative()) {
            path = data_dir / path;
        }
        auto text = read_text(path);
        if (!text) {
            spdlog::warn("source '{}': {}", node.label, text.error());
            continue;
        }
        spdlog::debug("source '{}': loaded {} byte(s) from {}", node.label, text->size(),
                      path.string());
        auto updated = node;
        auto& updated_config = std::get<graph::SourceConfig>(updated.config);
        updated_config.content = std::move(*text);
        if (updated_config.file_name.empty()) {
            updated_config.file_name = path.filename().string();
        }
        loaded.push_back(std::move(updated));
    }
    for (auto& node : loaded) {
        graph.add_node(std::move(node));
    }
    return loaded.size();
}

}  // namespace pipit::tools
