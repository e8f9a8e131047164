#include <pipit/graph/exchange.hpp>
#include <pipit/graph/topology.hpp>

#include <catch2/catch_test_macros.hpp>

#include <fstream>
#include <sstream>
#include <string>

namespace {

using namespace pipit::graph;

auto fixture(const std::string& name) -> std::string {
    std::ifstream in(std::string(PIPIT_SOURCE_DIR) + "/tests/data/" + name);
    std::ostringstream text;
    text << in.rdbuf();
    return text.str();
}

auto import_error(std::string_view text) -> std::string {
    auto result = import_document(text);
    return result ? std::string("<ok>") : result.error().message;
}

}  // namespace

TEST_CASE("exchange: import the fixture pipeline", "[exchange]") {
    auto document = import_document(fixture("pipeline.json"));
    REQUIRE(document.has_value());
    REQUIRE(document->lang == "sql");
    REQUIRE(document->exec_engine == "js");

    const auto& graph = document->graph;
    REQUIRE(graph.nodes().size() == 7);
    REQUIRE(graph.edges().size() == 6);
    REQUIRE(is_acyclic(graph));

    const auto* src = graph.find("src");
    REQUIRE(src != nullptr);
    REQUIRE(src->kind() == NodeKind::Source);
    REQUIRE(src->label == "Sales");
    REQUIRE(src->as<SourceConfig>().path == "sales.csv");
    REQUIRE(src->as<SourceConfig>().file_name == "sales.csv");
    REQUIRE_FALSE(src->as<SourceConfig>().content.has_value());

    const auto& join = graph.find("joined")->as<JoinConfig>();
    REQUIRE(join.how == JoinKind::Left);
    REQUIRE(join.left_on == std::vector<std::string>{"region"});
    REQUIRE(join.right_on == std::vector<std::string>{"region"});
    REQUIRE(graph.parents("joined") == std::vector<NodeId>{"big", "regions"});

    const auto& totals = graph.find("totals")->as<AggregateConfig>();
    REQUIRE(totals.group_by == std::vector<std::string>{"manager"});
    REQUIRE(totals.measures.size() == 2);
    REQUIRE(measure_output_name(totals.measures[0]) == "total");
    REQUIRE(totals.measures[1].func == AggFunc::Count);
    REQUIRE(measure_output_name(totals.measures[1]) == "count_id");

    const auto& sort = graph.find("ordered")->as<SortConfig>();
    REQUIRE(sort.keys.size() == 1);
    REQUIRE_FALSE(sort.keys[0].ascending);
}

TEST_CASE("exchange: export then import preserves the graph", "[exchange]") {
    Graph graph;
    graph.add_node(Node{.id = "s",
                        .label = "Input",
                        .config = SourceConfig{.path = "in.csv", .content = "a,b\n1,x\n"}});
    graph.add_node(Node{.id = "p",
                        .label = "Pick",
                        .config = ProjectConfig{.columns = {"a", "b"},
                                                .schema = {{.name = "a", .type = CastType::Integer}}}});
    graph.add_node(Node{.id = "m",
                        .label = "Sample",
                        .config = SampleConfig{.mode = SampleMode::Fraction,
                                               .rows = 10,
                                               .fraction = 0.25,
                                               .seed = 7}});
    graph.add_node(Node{.id = "j",
                        .label = "Join",
                        .config = JoinConfig{.how = JoinKind::Outer,
                                             .left_on = {"a", "b"},
                                             .right_on = {"a"},
                                             .dedupe_right = true,
                                             .pick = DedupePick::Last,
                                             .dedupe_order_column = "b"}});
    graph.add_node(Node{.id = "u", .label = "Pivot", .config = UnsupportedConfig{"transform.pivot"}});
    graph.add_edge("s", "p");
    graph.add_edge("p", "m");
    graph.add_edge("m", "j");
    graph.add_edge("s", "j");
    graph.add_edge("j", "u");

    auto text = export_document(Document{.graph = graph, .lang = "python", .exec_engine = "js"});
    auto back = import_document(text);
    REQUIRE(back.has_value());
    const auto& copy = back->graph;

    REQUIRE(copy.edges() == graph.edges());
    REQUIRE(copy.nodes().size() == graph.nodes().size());
    for (std::size_t i = 0; i < graph.nodes().size(); ++i) {
        REQUIRE(copy.nodes()[i].id == graph.nodes()[i].id);
        REQUIRE(copy.nodes()[i].label == graph.nodes()[i].label);
        REQUIRE(copy.nodes()[i].kind() == graph.nodes()[i].kind());
    }

    REQUIRE(copy.find("s")->as<SourceConfig>().content == std::optional<std::string>("a,b\n1,x\n"));
    const auto& project = copy.find("p")->as<ProjectConfig>();
    REQUIRE(project.columns == std::vector<std::string>{"a", "b"});
    REQUIRE(project.schema.size() == 1);
    REQUIRE(project.schema[0].type == CastType::Integer);

    const auto& sample = copy.find("m")->as<SampleConfig>();
    REQUIRE(sample.mode == SampleMode::Fraction);
    REQUIRE(sample.fraction == 0.25);
    REQUIRE(sample.seed == std::optional<std::uint64_t>(7));

    const auto& join = copy.find("j")->as<JoinConfig>();
    REQUIRE(join.how == JoinKind::Outer);
    REQUIRE(join.left_on == std::vector<std::string>{"a", "b"});
    REQUIRE_FALSE(join.dedupe_left);
    REQUIRE(join.dedupe_right);
    REQUIRE(join.pick == DedupePick::Last);
    REQUIRE(join.dedupe_order_column == "b");

    REQUIRE(kind_name(*copy.find("u")) == "transform.pivot");
    REQUIRE(copy.find("u")->kind() == NodeKind::Unsupported);
}

TEST_CASE("exchange: defaults for missing fields", "[exchange]") {
    auto graph = import_graph(R"({
        "nodes": [
            {"id": "a", "data": {"type": "transform.select", "columns": "*"}},
            {"id": "b", "data": {"type": "transform.sample", "seed": ""}},
            {"id": 3, "data": {"type": "transform.join"}}
        ],
        "edges": []
    })");
    REQUIRE(graph.has_value());

    const auto* select = graph->find("a");
    REQUIRE(select->label == "Select");
    REQUIRE(select->as<ProjectConfig>().columns.empty());

    const auto& sample = graph->find("b")->as<SampleConfig>();
    REQUIRE(sample.mode == SampleMode::Rows);
    REQUIRE(sample.rows == 100);
    REQUIRE_FALSE(sample.seed.has_value());

    const auto* join = graph->find("3");
    REQUIRE(join != nullptr);
    REQUIRE(join->as<JoinConfig>().how == JoinKind::Inner);
    REQUIRE(join->as<JoinConfig>().left_on == std::vector<std::string>{"id"});
}

TEST_CASE("exchange: numeric strings are accepted for sample sizes", "[exchange]") {
    auto graph = import_graph(R"({
        "nodes": [{"id": "s", "data": {"type": "transform.sample", "n": "25", "seed": "42"}}],
        "edges": []
    })");
    REQUIRE(graph.has_value());
    const auto& sample = graph->find("s")->as<SampleConfig>();
    REQUIRE(sample.rows == 25);
    REQUIRE(sample.seed == std::optional<std::uint64_t>(42));
}

TEST_CASE("exchange: structural import errors", "[exchange]") {
    REQUIRE(import_error("{not json") == "malformed JSON");
    REQUIRE(import_error(R"({"edges": []})") == "missing 'nodes' array");
    REQUIRE(import_error(R"({"nodes": []})") == "missing 'edges' array");
    REQUIRE(import_error(R"({"nodes": [{"data": {}}], "edges": []})") == "node without an id");
    REQUIRE(import_error(R"({
        "nodes": [{"id": "a", "data": {"type": "inspect.deepdive"}}],
        "edges": [{"source": "ghost", "target": "a"}]
    })") == "edge source 'ghost' is not a node");
    REQUIRE(import_error(R"({
        "nodes": [{"id": "a", "data": {"type": "inspect.deepdive"}}],
        "edges": [{"source": "a", "target": "b"}]
    })") == "edge target 'b' is not a node");
}

TEST_CASE("exchange: configuration errors name the node", "[exchange]") {
    REQUIRE(import_error(R"({
        "nodes": [{"id": "agg", "data": {"type": "transform.summarize",
                   "measures": [{"col": "x", "op": "median"}]}}],
        "edges": []
    })") == "node 'agg': unknown aggregate op 'median'");
    REQUIRE(import_error(R"({
        "nodes": [{"id": "j", "data": {"type": "transform.join", "how": "cross"}}],
        "edges": []
    })") == "node 'j': unknown join kind 'cross'");
    REQUIRE(import_error(R"({
        "nodes": [{"id": "s", "data": {"type": "transform.sample", "mode": "percent"}}],
        "edges": []
    })") == "node 's': unknown sample mode 'percent'");
}

TEST_CASE("exchange: sample sizes and seeds must fit", "[exchange]") {
    REQUIRE(import_error(R"({
        "nodes": [{"id": "s", "data": {"type": "transform.sample", "n": 1e20}}],
        "edges": []
    })") == "node 's': field 'n' is out of range");
    REQUIRE(import_error(R"({
        "nodes": [{"id": "s", "data": {"type": "transform.sample", "seed": 1e30}}],
        "edges": []
    })") == "node 's': field 'seed' is out of range");
    REQUIRE(import_error(R"({
        "nodes": [{"id": "s", "data": {"type": "transform.sample", "n": "1e6", "seed": 4294967296}}],
        "edges": []
    })") == "<ok>");
}

TEST_CASE("exchange: compact export", "[exchange]") {
    Graph graph;
    graph.add_node(Node{.id = "i", .label = "Look", .config = InspectConfig{}});
    auto text = export_graph(graph, -1);
    REQUIRE(text.find('\n') == std::string::npos);
    REQUIRE(text.find("\"inspect.deepdive\"") != std::string::npos);
}
