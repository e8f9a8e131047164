#include <pipit/graph/graph.hpp>
#include <pipit/graph/validate.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace {

using namespace pipit::graph;

auto source(const std::string& id, const char* content = "a,b\n1,2\n") -> Node {
    SourceConfig config;
    if (content != nullptr) {
        config.content = std::string(content);
    }
    return Node{.id = id, .label = id, .config = config};
}

auto filter(const std::string& id) -> Node {
    return Node{.id = id, .label = id, .config = FilterConfig{.expr = "a > 1"}};
}

auto sink(const std::string& id) -> Node {
    return Node{.id = id, .label = id, .config = SinkConfig{}};
}

}  // namespace

TEST_CASE("validate: source, filter and sink chain is valid", "[validate]") {
    Graph graph;
    graph.add_node(source("src"));
    graph.add_node(filter("keep"));
    graph.add_node(sink("out"));
    graph.add_edge("src", "keep");
    graph.add_edge("keep", "out");

    REQUIRE(validate(graph).empty());
}

TEST_CASE("validate: join with one input is reported against the join", "[validate]") {
    Graph graph;
    graph.add_node(source("left"));
    graph.add_node(Node{.id = "j", .label = "match", .config = JoinConfig{}});
    graph.add_edge("left", "j");

    auto issues = validate(graph);
    REQUIRE(issues.size() == 1);
    REQUIRE(issues[0].node_id == std::optional<NodeId>("j"));
    REQUIRE(issues[0].message == "Join \"match\" must have exactly 2 inputs.");
}

TEST_CASE("validate: graph without a source", "[validate]") {
    Graph graph;
    graph.add_node(Node{.id = "f", .label = "Filter", .config = FilterConfig{}});

    auto issues = validate(graph);
    REQUIRE(issues.size() == 2);
    REQUIRE(issues[0].message == "Filter \"Filter\" must have exactly 1 input.");
    REQUIRE_FALSE(issues[1].node_id.has_value());
    REQUIRE(issues[1].message == "Add at least one Source node.");

    REQUIRE(validate(Graph{}).size() == 1);
}

TEST_CASE("validate: source without content or with inputs", "[validate]") {
    Graph graph;
    graph.add_node(source("a"));
    graph.add_node(source("b", nullptr));
    graph.add_edge("a", "b");

    auto issues = validate(graph);
    REQUIRE(issues.size() == 2);
    REQUIRE(issues[0].message == "CSV Source \"b\" needs a loaded file.");
    REQUIRE(issues[1].message == "CSV Source \"b\" should not have inputs.");
    REQUIRE(issues[0].node_id == issues[1].node_id);
}

TEST_CASE("validate: empty content counts as loaded", "[validate]") {
    Graph graph;
    graph.add_node(source("a", ""));
    REQUIRE(validate(graph).empty());
}

TEST_CASE("validate: unsupported kinds have no arity rule", "[validate]") {
    Graph graph;
    graph.add_node(source("a"));
    graph.add_node(Node{.id = "x", .label = "x", .config = UnsupportedConfig{"transform.pivot"}});

    REQUIRE(validate(graph).empty());
    REQUIRE_FALSE(required_inputs(NodeKind::Unsupported).has_value());
    REQUIRE(required_inputs(NodeKind::Join) == std::optional<std::size_t>(2));
    REQUIRE(required_inputs(NodeKind::Source) == std::optional<std::size_t>(0));
}

TEST_CASE("validate: sink with two inputs", "[validate]") {
    Graph graph;
    graph.add_node(source("a"));
    graph.add_node(source("b"));
    graph.add_node(sink("out"));
    graph.add_edge("a", "out");
    graph.add_edge("b", "out");

    auto issues = validate(graph);
    REQUIRE(issues.size() == 1);
    REQUIRE(issues[0].message == "CSV Sink \"out\" must have exactly 1 input.");
}
