#include "graph_file.hpp"

#include <pipit/codegen/pandas_emitter.hpp>
#include <pipit/codegen/sql_emitter.hpp>

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <string>

namespace {

enum class Dialect { Pandas, Sql };

auto dialect_for(const std::string& lang) -> Dialect {
    return lang == "sql" ? Dialect::Sql : Dialect::Pandas;
}

void emit(std::ostream& out, Dialect dialect, const pipit::graph::Graph& graph,
          const std::string& target, bool duckdb) {
    if (dialect == Dialect::Sql) {
        pipit::codegen::SqlEmitter::Config config;
        config.duckdb = duckdb;
        if (!target.empty()) {
            config.target = target;
        }
        pipit::codegen::SqlEmitter{}.emit(out, graph, config);
        return;
    }
    pipit::codegen::PandasEmitter::Config config;
    if (!target.empty()) {
        config.target = target;
    }
    pipit::codegen::PandasEmitter{}.emit(out, graph, config);
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"pipit compiler: turn a pipeline graph into a pandas or SQL script"};
    app.set_version_flag("--version", "pipit_compile 0.1.0");

    std::string input_path;
    std::string output_path;
    std::string lang;
    std::string target;
    bool no_duckdb = false;

    app.add_option("input", input_path, "Pipeline graph (.json)")->required();
    app.add_option("-o,--output", output_path, "Output script (default: stdout)");
    app.add_option("--lang", lang, "Target dialect (default: the graph's own choice)")
        ->check(CLI::IsMember({"pandas", "python", "sql"}));
    app.add_option("--target", target, "Emit only what this node depends on and end there");
    app.add_flag("--no-duckdb", no_duckdb, "Emit generic SQL source reads");

    CLI11_PARSE(app, argc, argv);

    auto document = pipit::tools::load_document(input_path);
    if (!document) {
        std::cerr << "pipit_compile: " << document.error() << "\n";
        return 1;
    }
    if (!target.empty() && !document->graph.contains(target)) {
        std::cerr << "pipit_compile: unknown node '" << target << "'\n";
        return 1;
    }

    const auto dialect = dialect_for(lang.empty() ? document->lang : lang);
    if (output_path.empty()) {
        emit(std::cout, dialect, document->graph, target, !no_duckdb);
        return 0;
    }
    std::ofstream out_file(output_path);
    if (!out_file) {
        std::cerr << "pipit_compile: cannot write to '" << output_path << "'\n";
        return 1;
    }
    emit(out_file, dialect, document->graph, target, !no_duckdb);
    return 0;
}
