#include "graph_file.hpp"

#include <pipit/runtime/coerce.hpp>
#include <pipit/runtime/interpreter.hpp>
#include <pipit/runtime/ops.hpp>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

namespace {

auto error_kind_name(pipit::runtime::RunErrorKind kind) -> const char* {
    switch (kind) {
        case pipit::runtime::RunErrorKind::Validation:
            return "validation";
        case pipit::runtime::RunErrorKind::MissingPayload:
            return "missing payload";
        case pipit::runtime::RunErrorKind::Decode:
            return "decode";
        case pipit::runtime::RunErrorKind::Unsupported:
            return "unsupported";
        case pipit::runtime::RunErrorKind::Expression:
            return "expression";
    }
    return "error";
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"pipit runner: execute a pipeline graph and print the result"};
    app.set_version_flag("--version", "pipit_run 0.1.0");

    std::string input_path;
    std::string target;
    std::string out_dir = ".";
    std::string data_dir;
    std::uint64_t seed = 0;
    std::size_t limit = 200;
    bool show_schema = false;
    bool verbose = false;

    app.add_option("input", input_path, "Pipeline graph (.json)")->required();
    app.add_option("--target", target, "Run only up to this node and print its rows");
    auto* seed_option = app.add_option("--seed", seed, "Seed for sample nodes without one");
    app.add_option("--out-dir", out_dir, "Directory for sink outputs (default: .)");
    app.add_option("--data-dir", data_dir,
                   "Directory for relative source paths. "
                   "Defaults to the PIPIT_DATA_DIR environment variable.");
    app.add_option("--limit", limit, "Rows to print (default: 200)");
    app.add_flag("--schema", show_schema, "Print the inferred schema of the result");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    // --data-dir takes precedence, then PIPIT_DATA_DIR, then the graph's directory.
    if (data_dir.empty()) {
        const char* env = std::getenv("PIPIT_DATA_DIR");
        if (env != nullptr) {
            data_dir = env;
        }
    }
    if (data_dir.empty()) {
        data_dir = std::filesystem::path(input_path).parent_path().string();
    }

    auto document = pipit::tools::load_document(input_path);
    if (!document) {
        std::cerr << "pipit_run: " << document.error() << "\n";
        return 1;
    }
    const auto loaded = pipit::tools::resolve_sources(document->graph, data_dir);
    spdlog::debug("loaded {} source file(s) from '{}'", loaded, data_dir);

    pipit::runtime::RunOptions options;
    if (!target.empty()) {
        options.target = target;
    }
    if (*seed_option) {
        options.seed = seed;
    }
    int sink_failures = 0;
    options.on_sink = [&](const std::string& path, const std::string& text) {
        std::filesystem::path destination = path;
        if (destination.is_relative()) {
            destination = std::filesystem::path(out_dir) / destination;
        }
        std::error_code ec;
        if (destination.has_parent_path()) {
            std::filesystem::create_directories(destination.parent_path(), ec);
        }
        std::ofstream out(destination, std::ios::binary);
        if (!out) {
            spdlog::error("cannot write '{}'", destination.string());
            ++sink_failures;
            return;
        }
        out << text;
        spdlog::info("wrote {} byte(s) to {}", text.size(), destination.string());
    };

    auto rows = pipit::runtime::run(document->graph, options);
    if (!rows) {
        std::cerr << fmt::format("pipit_run: {} error: {}\n", error_kind_name(rows.error().kind),
                                 rows.error().message);
        return 1;
    }

    pipit::ops::print(*rows, std::cout, limit);
    if (show_schema) {
        for (const auto& column : pipit::runtime::infer_schema(*rows)) {
            std::cout << fmt::format("{}: {}\n", column.name, column.type);
        }
    }
    return sink_failures == 0 ? 0 : 1;
}
