#include <pipit/runtime/coerce.hpp>
#include <pipit/runtime/eval.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <string>

namespace {

using namespace pipit::runtime;
using namespace std::string_literals;

auto eval(std::string_view text, const Row& row, EvalMode mode = EvalMode::Filter) -> EvalResult {
    auto compiled = CompiledExpr::compile(text, mode);
    REQUIRE(compiled.has_value());
    return compiled->evaluate(row);
}

auto number(const EvalResult& result) -> double {
    REQUIRE(result.has_value());
    REQUIRE(std::holds_alternative<double>(*result));
    return std::get<double>(*result);
}

auto boolean(const EvalResult& result) -> bool {
    REQUIRE(result.has_value());
    REQUIRE(std::holds_alternative<bool>(*result));
    return std::get<bool>(*result);
}

}  // namespace

TEST_CASE("eval: filter mode reads row fields", "[eval]") {
    Row row{{"amount", 120.0}, {"region", "north"s}, {"note", Value{}}};
    REQUIRE(boolean(eval("amount >= 80 && region == 'north'", row)));
    REQUIRE_FALSE(boolean(eval("amount < 80", row)));
    REQUIRE(boolean(eval("note is null", row)));
    REQUIRE(number(eval("amount * 2 - 40", row)) == Catch::Approx(200.0));
}

TEST_CASE("eval: unknown fields are evaluation errors", "[eval]") {
    Row row{{"a", 1.0}};
    auto result = eval("missing > 1", row);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().message == "missing is not defined");

    auto compiled = CompiledExpr::compile("missing > 1", EvalMode::Filter);
    REQUIRE_FALSE(compiled->test(row).has_value());
}

TEST_CASE("eval: null never orders against a value", "[eval]") {
    Row row{{"x", Value{}}};
    REQUIRE_FALSE(boolean(eval("x > 0", row)));
    REQUIRE_FALSE(boolean(eval("x <= 0", row)));
    REQUIRE(boolean(eval("x == null", row)));
    REQUIRE_FALSE(boolean(eval("x == 0", row)));
}

TEST_CASE("eval: loose equality across types", "[eval]") {
    Row row{{"code", "7"s}, {"flag", true}};
    REQUIRE(boolean(eval("code == 7", row)));
    REQUIRE(boolean(eval("flag == 1", row)));
    REQUIRE(boolean(eval("code != 'x'", row)));
    REQUIRE_FALSE(boolean(eval("'abc' == 0", row)));
}

TEST_CASE("eval: text concatenation and comparison", "[eval]") {
    Row row{{"name", "ada"s}, {"n", 3.0}};
    auto joined = eval("name + '-' + n", row);
    REQUIRE(joined.has_value());
    REQUIRE(std::get<std::string>(*joined) == "ada-3");
    REQUIRE(boolean(eval("'abc' < 'abd'", row)));
}

TEST_CASE("eval: non-numeric text in arithmetic is NaN", "[eval]") {
    Row row{{"word", "abc"s}};
    REQUIRE(std::isnan(number(eval("word * 2", row))));
    REQUIRE_FALSE(boolean(eval("word * 2 > 0", row)));
    REQUIRE(std::isinf(number(eval("1 / 0", row))));
}

TEST_CASE("eval: logical operators yield the deciding operand", "[eval]") {
    Row row;
    auto either = eval("0 || 'fallback'", row);
    REQUIRE(std::get<std::string>(*either) == "fallback");
    REQUIRE(number(eval("2 && 5", row)) == 5.0);
    REQUIRE_FALSE(boolean(eval("!1", row)));
    REQUIRE(number(eval("1 > 2 ? 10 : 20", row)) == 20.0);
}

TEST_CASE("eval: math functions", "[eval]") {
    Row row{{"x", -2.5}};
    REQUIRE(number(eval("Math.round(2.5)", row)) == 3.0);
    REQUIRE(number(eval("round(x)", row)) == -2.0);
    REQUIRE(number(eval("abs(x)", row)) == 2.5);
    REQUIRE(number(eval("max(1, x, 4)", row)) == 4.0);
    REQUIRE(number(eval("Math.min(3, 2)", row)) == 2.0);
    REQUIRE(number(eval("pow(2, 10)", row)) == 1024.0);
    REQUIRE(number(eval("sqrt(16) + floor(1.9) + ceil(1.1)", row)) == 7.0);
    REQUIRE(number(eval("7 % 4", row)) == 3.0);
}

TEST_CASE("eval: compute mode reads fields through accessors", "[eval]") {
    Row row{{"price", "1,200"s}, {"region", Value{}}, {"active", "Yes"s}, {"raw", "x"s}};
    REQUIRE(number(eval("n('price') * 2", row, EvalMode::Compute)) == 2400.0);
    REQUIRE(number(eval("n('missing') + 1", row, EvalMode::Compute)) == 1.0);
    auto text = eval("s('region') + '!'", row, EvalMode::Compute);
    REQUIRE(std::get<std::string>(*text) == "!");
    REQUIRE(boolean(eval("b('active')", row, EvalMode::Compute)));
    auto raw = eval("col('raw')", row, EvalMode::Compute);
    REQUIRE(std::get<std::string>(*raw) == "x");
}

TEST_CASE("eval: bare identifiers are undefined in compute mode", "[eval]") {
    Row row{{"price", 10.0}};
    auto result = eval("price * 2", row, EvalMode::Compute);
    REQUIRE_FALSE(result.has_value());
}

TEST_CASE("coerce: lenient numbers", "[coerce]") {
    REQUIRE(to_number_loose("$1,200"s) == std::optional<double>(1200.0));
    REQUIRE(to_number_loose(" 15% "s) == std::optional<double>(15.0));
    REQUIRE(to_number_loose("\xE2\x82\xAC 3.5"s) == std::optional<double>(3.5));
    REQUIRE(to_number_loose("1 000"s) == std::optional<double>(1000.0));
    REQUIRE_FALSE(to_number_loose("abc"s).has_value());
    REQUIRE_FALSE(to_number_loose(""s).has_value());
    REQUIRE_FALSE(to_number_loose(true).has_value());

    REQUIRE(parse_number(" 42 ") == std::optional<double>(42.0));
    REQUIRE_FALSE(parse_number("4 2").has_value());
}

TEST_CASE("coerce: casts follow the type table", "[coerce]") {
    using pipit::graph::CastType;
    REQUIRE(cast_value("3.7"s, CastType::Integer) == Value{3.0});
    REQUIRE(cast_value("$2,500.25"s, CastType::Float) == Value{2500.25});
    REQUIRE(cast_value("n/a"s, CastType::Float) == Value{});
    REQUIRE(cast_value("Yes"s, CastType::Boolean) == Value{true});
    REQUIRE(cast_value("0"s, CastType::Boolean) == Value{false});
    REQUIRE(cast_value("maybe"s, CastType::Boolean) == Value{});
    REQUIRE(cast_value("  padded  "s, CastType::String) == Value{"padded"s});
    REQUIRE(cast_value(4.0, CastType::String) == Value{"4"s});

    // Null and empty text pass through untouched.
    REQUIRE(cast_value(Value{}, CastType::Integer) == Value{});
    REQUIRE(cast_value(""s, CastType::Integer) == Value{""s});
}

TEST_CASE("coerce: dates and date-times", "[coerce]") {
    using pipit::graph::CastType;
    REQUIRE(cast_value("2024-03-05T22:10:00Z"s, CastType::Date) == Value{"2024-03-05"s});
    REQUIRE(cast_value("2024/03/05"s, CastType::Date) == Value{"2024-03-05"s});
    REQUIRE(cast_value("2024-03-05 10:20"s, CastType::Datetime) ==
            Value{"2024-03-05T10:20:00.000Z"s});
    REQUIRE(cast_value("2024-03-05T10:00:00.5+02:00"s, CastType::Datetime) ==
            Value{"2024-03-05T08:00:00.500Z"s});
    REQUIRE(cast_value(0.0, CastType::Datetime) == Value{"1970-01-01T00:00:00.000Z"s});
    REQUIRE(cast_value("2024-02-30"s, CastType::Date) == Value{});
    REQUIRE(cast_value("yesterday"s, CastType::Date) == Value{});
    REQUIRE(cast_value(1e20, CastType::Datetime) == Value{});
    REQUIRE(cast_value(-1e20, CastType::Date) == Value{});
    REQUIRE(cast_value(86400000.0, CastType::Date) == Value{"1970-01-02"s});
}

TEST_CASE("coerce: numbers order before text", "[coerce]") {
    REQUIRE(compare_values(2.0, 10.0) < 0);
    REQUIRE(compare_values("10"s, 2.0) > 0);
    REQUIRE(compare_values(10.0, "1x"s) < 0);
    REQUIRE(compare_values("1x"s, 2.0) > 0);
    REQUIRE(compare_values("1x"s, "abc"s) < 0);
    REQUIRE(compare_values(std::nan(""), 5.0) > 0);
    REQUIRE(compare_values("a"s, "a"s) == 0);
}

TEST_CASE("coerce: truthiness and display", "[coerce]") {
    REQUIRE_FALSE(truthy(Value{}));
    REQUIRE_FALSE(truthy(0.0));
    REQUIRE_FALSE(truthy(std::nan("")));
    REQUIRE_FALSE(truthy(""s));
    REQUIRE(truthy("0"s));
    REQUIRE(truthy(-1.0));

    REQUIRE(to_display(Value{}) == "null");
    REQUIRE(to_display(4.0) == "4");
    REQUIRE(to_display(1.5) == "1.5");
    REQUIRE(to_display(false) == "false");
}

TEST_CASE("coerce: schema inference", "[coerce]") {
    RowSet rows{
        Row{{"id", "1"s}, {"name", ""s}, {"score", Value{}}},
        Row{{"id", "2"s}, {"name", "ada"s}, {"score", "7.5"s}},
    };
    auto schema = infer_schema(rows);
    REQUIRE(schema.size() == 3);
    REQUIRE(schema[0].type == "number");
    REQUIRE(schema[1].type == "string");
    REQUIRE(schema[2].name == "score");
    REQUIRE(schema[2].type == "number");
    REQUIRE(infer_schema({}).empty());
}
