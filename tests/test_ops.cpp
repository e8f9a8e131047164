#include <pipit/runtime/ops.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

namespace {

using namespace pipit;
using runtime::Row;
using runtime::RowSet;
using runtime::Value;
using namespace std::string_literals;

auto column(const RowSet& rows, const char* name) -> std::vector<Value> {
    std::vector<Value> out;
    for (const auto& row : rows) {
        out.push_back(row.get(name));
    }
    return out;
}

auto compiled(std::string_view text, runtime::EvalMode mode) -> runtime::CompiledExpr {
    auto result = runtime::CompiledExpr::compile(text, mode);
    REQUIRE(result.has_value());
    return std::move(*result);
}

auto numbered(std::size_t count) -> RowSet {
    RowSet rows;
    for (std::size_t i = 0; i < count; ++i) {
        rows.push_back(Row{{"i", static_cast<double>(i)}});
    }
    return rows;
}

}  // namespace

TEST_CASE("ops: project selects columns in the given order", "[ops]") {
    RowSet rows{Row{{"a", 1.0}, {"b", 2.0}, {"c", 3.0}}};
    auto out = ops::project(rows, graph::ProjectConfig{.columns = {"c", "a", "zz"}});
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].keys() == std::vector<std::string>{"c", "a", "zz"});
    REQUIRE(runtime::is_null(out[0].get("zz")));
}

TEST_CASE("ops: wildcard project is idempotent", "[ops]") {
    RowSet rows{Row{{"a", "1"s}, {"b", "x"s}}, Row{{"a", "2"s}, {"b", Value{}}}};
    graph::ProjectConfig wildcard;
    auto once = ops::project(rows, wildcard);
    REQUIRE(once == rows);
    REQUIRE(ops::project(once, wildcard) == once);
}

TEST_CASE("ops: project casts by schema", "[ops]") {
    RowSet rows{
        Row{{"price ", "$1,200"s}, {"qty", "3.9"s}, {"ok", "yes"s}},
        Row{{"price ", "n/a"s}, {"qty", ""s}, {"ok", "?"s}},
    };
    graph::ProjectConfig config{
        .columns = {},
        .schema = {{.name = "price", .type = graph::CastType::Float},
                   {.name = "qty", .type = graph::CastType::Float},
                   {.name = "qty", .type = graph::CastType::Integer},
                   {.name = "ok", .type = graph::CastType::Boolean},
                   {.name = "absent", .type = graph::CastType::Integer}},
    };
    auto out = ops::project(rows, config);
    REQUIRE(out[0].get("price ") == Value{1200.0});
    REQUIRE(out[0].get("qty") == Value{3.0});
    REQUIRE(out[0].get("ok") == Value{true});
    REQUIRE(runtime::is_null(out[1].get("price ")));
    REQUIRE(out[1].get("qty") == Value{""s});
    REQUIRE(runtime::is_null(out[1].get("ok")));
    REQUIRE_FALSE(out[0].contains("absent"));
}

TEST_CASE("ops: filter coerces numeric text", "[ops]") {
    RowSet rows{
        Row{{"amount", "120"s}, {"id", "a"s}},
        Row{{"amount", "$40"s}, {"id", "b"s}},
        Row{{"amount", "abc"s}, {"id", "c"s}},
        Row{{"amount", "1,000"s}, {"id", "d"s}},
    };
    auto out = ops::filter(rows, compiled("amount >= 50", runtime::EvalMode::Filter));
    REQUIRE(column(out, "id") == std::vector<Value>{"a"s, "d"s});
    // Kept rows are the originals, not the coerced copies.
    REQUIRE(out[0].get("amount") == Value{"120"s});
}

TEST_CASE("ops: filter drops rows whose predicate fails", "[ops]") {
    RowSet rows{Row{{"x", 1.0}}, Row{{"y", 2.0}}, Row{{"x", 3.0}}};
    auto out = ops::filter(rows, compiled("x > 0", runtime::EvalMode::Filter));
    REQUIRE(out.size() == 2);
}

TEST_CASE("ops: aggregate sums per group in first-seen order", "[ops]") {
    RowSet rows{
        Row{{"g", "a"s}, {"v", 1.0}},
        Row{{"g", "a"s}, {"v", 3.0}},
        Row{{"g", "b"s}, {"v", 5.0}},
    };
    graph::AggregateConfig config{
        .group_by = {"g"},
        .measures = {{.column = "v", .func = graph::AggFunc::Sum}},
    };
    auto out = ops::aggregate(rows, config);
    REQUIRE(out.size() == 2);
    REQUIRE(out[0] == Row{{"g", "a"s}, {"sum_v", 4.0}});
    REQUIRE(out[1] == Row{{"g", "b"s}, {"sum_v", 5.0}});
}

TEST_CASE("ops: aggregate functions skip nulls", "[ops]") {
    RowSet rows{
        Row{{"v", "2"s}},
        Row{{"v", Value{}}},
        Row{{"v", "x"s}},
        Row{{"v", 6.0}},
    };
    graph::AggregateConfig config{
        .group_by = {},
        .measures = {{.column = "v", .func = graph::AggFunc::Sum},
                     {.column = "v", .func = graph::AggFunc::Avg},
                     {.column = "v", .func = graph::AggFunc::Mean, .alias = "avg2"},
                     {.column = "v", .func = graph::AggFunc::Min},
                     {.column = "v", .func = graph::AggFunc::Max},
                     {.column = "v", .func = graph::AggFunc::Count},
                     {.column = "v", .func = graph::AggFunc::First},
                     {.column = "v", .func = graph::AggFunc::Last}},
    };
    auto out = ops::aggregate(rows, config);
    REQUIRE(out.size() == 1);
    const auto& row = out[0];
    REQUIRE(row.get("sum_v") == Value{8.0});
    REQUIRE(std::get<double>(row.get("avg_v")) == Catch::Approx(4.0));
    REQUIRE(std::get<double>(row.get("avg2")) == Catch::Approx(4.0));
    REQUIRE(row.get("min_v") == Value{2.0});
    REQUIRE(row.get("max_v") == Value{6.0});
    REQUIRE(row.get("count_v") == Value{4.0});
    REQUIRE(row.get("first_v") == Value{"2"s});
    REQUIRE(row.get("last_v") == Value{6.0});
}

TEST_CASE("ops: aggregate of an all-null column", "[ops]") {
    RowSet rows{Row{{"v", Value{}}}};
    graph::AggregateConfig config{
        .group_by = {},
        .measures = {{.column = "v", .func = graph::AggFunc::Sum},
                     {.column = "v", .func = graph::AggFunc::Avg},
                     {.column = "v", .func = graph::AggFunc::First}},
    };
    auto out = ops::aggregate(rows, config);
    REQUIRE(out[0].get("sum_v") == Value{0.0});
    REQUIRE(runtime::is_null(out[0].get("avg_v")));
    REQUIRE(runtime::is_null(out[0].get("first_v")));
}

TEST_CASE("ops: aggregate groups by exact value", "[ops]") {
    RowSet rows{Row{{"g", "1"s}}, Row{{"g", 1.0}}, Row{{"g", "1"s}}};
    graph::AggregateConfig config{
        .group_by = {"g"},
        .measures = {{.column = "g", .func = graph::AggFunc::Count, .alias = "n"}},
    };
    auto out = ops::aggregate(rows, config);
    REQUIRE(out.size() == 2);
    REQUIRE(out[0].get("n") == Value{2.0});
    REQUIRE(out[1].get("n") == Value{1.0});
}

TEST_CASE("ops: compute appends or overwrites a column", "[ops]") {
    RowSet rows{Row{{"price", "10"s}, {"qty", "3"s}}, Row{{"price", "x"s}, {"qty", "2"s}}};
    auto out = ops::compute(rows, "total", compiled("n('price') * n('qty')", runtime::EvalMode::Compute));
    REQUIRE(column(out, "total") == std::vector<Value>{30.0, 0.0});

    auto replaced = ops::compute(rows, "qty", compiled("1", runtime::EvalMode::Compute));
    REQUIRE(replaced[0].keys() == std::vector<std::string>{"price", "qty"});
    REQUIRE(replaced[0].get("qty") == Value{1.0});
}

TEST_CASE("ops: compute stores null where evaluation fails", "[ops]") {
    RowSet rows{Row{{"a", 1.0}}};
    auto out = ops::compute(rows, "b", compiled("a + 1", runtime::EvalMode::Compute));
    REQUIRE(out[0].contains("b"));
    REQUIRE(runtime::is_null(out[0].get("b")));
}

TEST_CASE("ops: sort is stable with nulls first ascending", "[ops]") {
    RowSet rows{
        Row{{"k", 2.0}, {"tag", "a"s}},
        Row{{"k", Value{}}, {"tag", "b"s}},
        Row{{"k", 1.0}, {"tag", "c"s}},
        Row{{"k", 2.0}, {"tag", "d"s}},
        Row{{"k", "10"s}, {"tag", "e"s}},
    };
    auto asc = ops::order(rows, {{.column = "k", .ascending = true}});
    REQUIRE(column(asc, "tag") == std::vector<Value>{"b"s, "c"s, "a"s, "d"s, "e"s});

    auto desc = ops::order(rows, {{.column = "k", .ascending = false}});
    REQUIRE(column(desc, "tag") == std::vector<Value>{"e"s, "a"s, "d"s, "c"s, "b"s});
}

TEST_CASE("ops: sort puts numbers before text whatever the input order", "[ops]") {
    RowSet rows{Row{{"k", "1x"s}}, Row{{"k", 10.0}}, Row{{"k", "b"s}}, Row{{"k", 2.0}}};
    auto forward = ops::order(rows, {{.column = "k", .ascending = true}});
    REQUIRE(column(forward, "k") == std::vector<Value>{2.0, 10.0, "1x"s, "b"s});

    std::reverse(rows.begin(), rows.end());
    auto backward = ops::order(rows, {{.column = "k", .ascending = true}});
    REQUIRE(column(backward, "k") == column(forward, "k"));
}

TEST_CASE("ops: aggregate puts NaN keys in one group", "[ops]") {
    RowSet rows{Row{{"g", std::nan("")}}, Row{{"g", 1.0}}, Row{{"g", std::nan("")}}};
    graph::AggregateConfig config{
        .group_by = {"g"},
        .measures = {{.column = "g", .func = graph::AggFunc::Count, .alias = "n"}},
    };
    auto out = ops::aggregate(rows, config);
    REQUIRE(out.size() == 2);
    REQUIRE(out[0].get("n") == Value{2.0});
    REQUIRE(out[1].get("n") == Value{1.0});
}

TEST_CASE("ops: sort by several keys", "[ops]") {
    RowSet rows{
        Row{{"region", "north"s}, {"amount", 5.0}},
        Row{{"region", "east"s}, {"amount", 7.0}},
        Row{{"region", "north"s}, {"amount", 9.0}},
    };
    auto out = ops::order(rows, graph::parse_sort_spec("region, amount desc"));
    REQUIRE(column(out, "amount") == std::vector<Value>{7.0, 9.0, 5.0});
    REQUIRE(ops::order(rows, {}) == rows);
}

TEST_CASE("ops: row sample is deterministic for a seed", "[ops]") {
    auto rows = numbered(20);
    graph::SampleConfig config{.mode = graph::SampleMode::Rows, .rows = 5};
    auto first = ops::sample(rows, config, 42);
    auto second = ops::sample(rows, config, 42);
    REQUIRE(first.size() == 5);
    REQUIRE(first == second);

    // Drawn without replacement.
    auto values = column(first, "i");
    std::sort(values.begin(), values.end());
    REQUIRE(std::adjacent_find(values.begin(), values.end()) == values.end());
}

TEST_CASE("ops: row sample clamps its size", "[ops]") {
    auto rows = numbered(3);
    REQUIRE(ops::sample(rows, {.mode = graph::SampleMode::Rows, .rows = 10}, 1).size() == 3);
    REQUIRE(ops::sample(rows, {.mode = graph::SampleMode::Rows, .rows = -4}, 1).empty());
}

TEST_CASE("ops: fraction sample keeps rows independently", "[ops]") {
    auto rows = numbered(200);
    auto none = ops::sample(rows, {.mode = graph::SampleMode::Fraction, .fraction = -0.5}, 3);
    REQUIRE(none.empty());
    auto all = ops::sample(rows, {.mode = graph::SampleMode::Fraction, .fraction = 2.0}, 3);
    REQUIRE(all == rows);

    graph::SampleConfig half{.mode = graph::SampleMode::Fraction, .fraction = 0.5};
    auto some = ops::sample(rows, half, 7);
    REQUIRE(some == ops::sample(rows, half, 7));
    REQUIRE(some.size() > 50);
    REQUIRE(some.size() < 150);
    // Input order is preserved.
    REQUIRE(std::is_sorted(some.begin(), some.end(), [](const Row& a, const Row& b) {
        return std::get<double>(a.get("i")) < std::get<double>(b.get("i"));
    }));
}

TEST_CASE("ops: dedupe keeps first or last occurrence", "[ops]") {
    RowSet rows{
        Row{{"k", "a"s}, {"v", 1.0}},
        Row{{"k", "b"s}, {"v", 2.0}},
        Row{{"k", "a"s}, {"v", 3.0}},
    };
    auto first = ops::dedupe(rows, {"k"}, graph::DedupePick::First, "");
    REQUIRE(column(first, "v") == std::vector<Value>{1.0, 2.0});

    auto last = ops::dedupe(rows, {"k"}, graph::DedupePick::Last, "");
    REQUIRE(column(last, "v") == std::vector<Value>{2.0, 3.0});
}

TEST_CASE("ops: dedupe with a tie-break column", "[ops]") {
    RowSet rows{
        Row{{"k", "a"s}, {"ts", 5.0}},
        Row{{"k", "a"s}, {"ts", 9.0}},
        Row{{"k", "a"s}, {"ts", 1.0}},
    };
    auto first = ops::dedupe(rows, {"k"}, graph::DedupePick::First, "ts");
    REQUIRE(column(first, "ts") == std::vector<Value>{1.0});
    auto last = ops::dedupe(rows, {"k"}, graph::DedupePick::Last, "ts");
    REQUIRE(column(last, "ts") == std::vector<Value>{9.0});
}

TEST_CASE("ops: print renders a bounded table", "[ops]") {
    RowSet rows{Row{{"id", 1.0}, {"name", "ada"s}}, Row{{"id", 2.0}}, Row{{"id", 3.0}}};
    std::ostringstream out;
    ops::print(rows, out, 2);
    REQUIRE(out.str() ==
            "rows: 3\n"
            "+----+------+\n"
            "| id | name |\n"
            "+----+------+\n"
            "| 1  | ada  |\n"
            "| 2  | null |\n"
            "+----+------+\n"
            "... (1 more rows)\n");

    std::ostringstream empty;
    ops::print({}, empty);
    REQUIRE(empty.str() == "<empty>\n");
}
