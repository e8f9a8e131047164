#include <pipit/pipit.hpp>

#include <fmt/core.h>

#include <iostream>

auto main() -> int {
    using namespace pipit;

    // Build a small pipeline: load -> filter -> summarize -> sort
    graph::Graph pipeline;
    pipeline.add_node(graph::Node{
        .id = "src",
        .label = "Sales",
        .config = graph::SourceConfig{.path = "sales.csv",
                                      .file_name = "sales.csv",
                                      .content = "region,product,amount\n"
                                                 "north,widget,120\n"
                                                 "south,widget,80\n"
                                                 "north,gadget,\"$1,200\"\n"
                                                 "south,gadget,15%\n"
                                                 "north,widget,40\n"},
    });
    pipeline.add_node(graph::Node{
        .id = "big",
        .label = "Big orders",
        .config = graph::FilterConfig{.expr = "amount >= 50"},
    });
    pipeline.add_node(graph::Node{
        .id = "by_region",
        .label = "By region",
        .config = graph::AggregateConfig{.group_by = {"region"},
                                         .measures = {graph::Measure{.column = "amount",
                                                                     .func = graph::AggFunc::Sum,
                                                                     .alias = "total"}}},
    });
    pipeline.add_node(graph::Node{
        .id = "ranked",
        .label = "Ranked",
        .config = graph::SortConfig{.keys = graph::parse_sort_spec("total desc")},
    });
    pipeline.add_edge("src", "big");
    pipeline.add_edge("big", "by_region");
    pipeline.add_edge("by_region", "ranked");

    fmt::print("=== Interpreter ===\n");
    auto rows = runtime::run(pipeline);
    if (!rows) {
        fmt::print("run failed: {}\n", rows.error().message);
        return 1;
    }
    ops::print(*rows);

    fmt::print("\n=== pandas ===\n");
    codegen::PandasEmitter{}.emit(std::cout, pipeline, {.helpers = false});

    fmt::print("\n=== SQL ===\n");
    codegen::SqlEmitter{}.emit(std::cout, pipeline);

    return 0;
}
