#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace pipit::graph {

/// Unique identifier of a node inside a graph (opaque, editor-assigned).
using NodeId = std::string;

/// Operation kinds, in the order of the NodeConfig alternatives.
enum class NodeKind : std::uint8_t {
    Source,
    Project,
    Filter,
    Aggregate,
    Compute,
    Sort,
    Sample,
    Join,
    Inspect,
    Sink,
    Unsupported,
};

/// Target type of a per-column coercion in a project node.
enum class CastType : std::uint8_t {
    String,
    Integer,
    Float,
    Boolean,
    Date,
    Datetime,
};

/// Supported aggregation functions. Avg and Mean compute the same value
/// and differ only in the default output name.
enum class AggFunc : std::uint8_t {
    Sum,
    Avg,
    Mean,
    Min,
    Max,
    Count,
    First,
    Last,
};

enum class JoinKind : std::uint8_t {
    Inner,
    Left,
    Right,
    Outer,
};

enum class SampleMode : std::uint8_t {
    Rows,
    Fraction,
};

/// Which row survives pre-join de-duplication of a key.
enum class DedupePick : std::uint8_t {
    First,
    Last,
};

struct ColumnCast {
    std::string name;
    CastType type = CastType::String;
};

struct Measure {
    std::string column;
    AggFunc func = AggFunc::Sum;
    /// Empty means the default `<op>_<column>`.
    std::string alias;
};

struct SortKey {
    std::string column;
    bool ascending = true;
};

/// Load a delimiter-structured payload. `content` holds the already
/// retrieved text; it is absent until the host has loaded the file.
struct SourceConfig {
    std::string path = "data.csv";
    std::string file_name;
    std::optional<std::string> content;
};

/// Restrict to an ordered column list (empty = wildcard) and coerce types.
struct ProjectConfig {
    std::vector<std::string> columns;
    std::vector<ColumnCast> schema;
};

struct FilterConfig {
    std::string expr = "sales > 0";
};

struct AggregateConfig {
    std::vector<std::string> group_by;
    std::vector<Measure> measures;
};

struct ComputeConfig {
    std::string new_column = "new_column";
    std::string expr = "0";
};

struct SortConfig {
    std::vector<SortKey> keys;
};

struct SampleConfig {
    SampleMode mode = SampleMode::Rows;
    std::int64_t rows = 100;
    double fraction = 0.1;
    std::optional<std::uint64_t> seed;
};

struct JoinConfig {
    JoinKind how = JoinKind::Inner;
    std::vector<std::string> left_on{"id"};
    std::vector<std::string> right_on{"id"};
    bool dedupe_left = false;
    bool dedupe_right = false;
    DedupePick pick = DedupePick::First;
    /// Tie-break column for de-duplication; empty means original row order.
    std::string dedupe_order_column;
};

struct InspectConfig {};

struct SinkConfig {
    std::string path = "out.csv";
};

/// A node whose kind is not recognized; keeps the kind name it was given.
struct UnsupportedConfig {
    std::string type_name;
};

/// Operation payload. The active alternative determines the node kind.
using NodeConfig = std::variant<SourceConfig, ProjectConfig, FilterConfig, AggregateConfig,
                                ComputeConfig, SortConfig, SampleConfig, JoinConfig,
                                InspectConfig, SinkConfig, UnsupportedConfig>;

struct Node {
    NodeId id;
    std::string label;
    NodeConfig config;

    [[nodiscard]] auto kind() const noexcept -> NodeKind {
        return static_cast<NodeKind>(config.index());
    }

    template <typename Config>
    [[nodiscard]] auto as() const -> const Config& {
        return std::get<Config>(config);
    }
};

/// Directed dependency: `source` feeds `target`.
struct Edge {
    NodeId source;
    NodeId target;

    auto operator==(const Edge&) const -> bool = default;
};

/// Nodes in declaration order plus edges, with an id index into `nodes`.
///
/// Nodes and edges are kept as flat collections; traversal code walks them
/// with explicit queues and stacks.
class Graph {
   public:
    Graph() = default;
    Graph(std::vector<Node> nodes, std::vector<Edge> edges);

    /// Append a node. A node with an existing id replaces the old one in place.
    void add_node(Node node);
    void add_edge(NodeId source, NodeId target);

    [[nodiscard]] auto nodes() const noexcept -> const std::vector<Node>& { return nodes_; }
    [[nodiscard]] auto edges() const noexcept -> const std::vector<Edge>& { return edges_; }
    [[nodiscard]] auto find(const NodeId& id) const -> const Node*;
    [[nodiscard]] auto contains(const NodeId& id) const -> bool { return index_.contains(id); }
    [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }

    /// Upstream node ids of `id`, in edge order. Edges naming an unknown
    /// endpoint are ignored.
    [[nodiscard]] auto parents(const NodeId& id) const -> std::vector<NodeId>;

   private:
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::unordered_map<NodeId, std::size_t> index_;
};

/// Canonical exchange-format name of a kind ("transform.filter", ...).
[[nodiscard]] auto kind_name(NodeKind kind) -> std::string_view;
/// Kind name of a node; unsupported nodes report the name they were given.
[[nodiscard]] auto kind_name(const Node& node) -> std::string;
/// Human-readable kind used in messages ("Filter", "CSV Source", ...).
[[nodiscard]] auto kind_title(NodeKind kind) -> std::string_view;

[[nodiscard]] auto agg_func_name(AggFunc func) -> std::string_view;
[[nodiscard]] auto parse_agg_func(std::string_view name) -> std::optional<AggFunc>;
[[nodiscard]] auto join_kind_name(JoinKind kind) -> std::string_view;
[[nodiscard]] auto parse_join_kind(std::string_view name) -> std::optional<JoinKind>;
[[nodiscard]] auto cast_type_name(CastType type) -> std::string_view;
/// Unknown names fall back to String.
[[nodiscard]] auto parse_cast_type(std::string_view name) -> CastType;

/// Output column name of a measure (`alias`, or `<op>_<column>`).
[[nodiscard]] auto measure_output_name(const Measure& measure) -> std::string;

/// Split a comma-separated list, trimming entries and dropping empty ones.
[[nodiscard]] auto split_list(std::string_view text) -> std::vector<std::string>;
/// Parse a sort spec such as "region, units desc".
[[nodiscard]] auto parse_sort_spec(std::string_view spec) -> std::vector<SortKey>;
[[nodiscard]] auto format_sort_spec(const std::vector<SortKey>& keys) -> std::string;

}  // namespace pipit::graph
