#include <pipit/expr/lexer.hpp>
#include <pipit/expr/parser.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <variant>

namespace {

using namespace pipit::expr;

auto parse_ok(std::string_view text) -> ExprPtr {
    auto result = parse(text);
    REQUIRE(result.has_value());
    return std::move(*result);
}

auto parse_error(std::string_view text) -> ParseError {
    auto result = parse(text);
    REQUIRE_FALSE(result.has_value());
    return result.error();
}

}  // namespace

TEST_CASE("lexer: operators and keywords", "[lexer]") {
    auto tokens = tokenize("a === 1 AND b <> 'x' || !c");
    REQUIRE(tokens.size() == 11);
    REQUIRE(tokens[0].kind == TokenKind::Identifier);
    REQUIRE(tokens[1].kind == TokenKind::EqEq);
    REQUIRE(tokens[1].lexeme == "===");
    REQUIRE(tokens[2].kind == TokenKind::NumberLiteral);
    REQUIRE(tokens[3].kind == TokenKind::KeywordAnd);
    REQUIRE(tokens[5].kind == TokenKind::LtGt);
    REQUIRE(tokens[6].kind == TokenKind::StringLiteral);
    REQUIRE(tokens[7].kind == TokenKind::PipePipe);
    REQUIRE(tokens[8].kind == TokenKind::Bang);
    REQUIRE(tokens[9].kind == TokenKind::Identifier);
    REQUIRE(tokens[10].kind == TokenKind::Eof);
    REQUIRE(tokens[3].column == 9);
}

TEST_CASE("lexer: quoted identifiers and bad input", "[lexer]") {
    auto tokens = tokenize("`unit price` * 2 $");
    REQUIRE(tokens[0].kind == TokenKind::QuotedIdentifier);
    REQUIRE(tokens[0].lexeme == "`unit price`");
    REQUIRE(tokens[3].kind == TokenKind::Error);
    REQUIRE(tokens.back().kind == TokenKind::Eof);

    auto unterminated = tokenize("'abc");
    REQUIRE(unterminated[0].kind == TokenKind::Error);
}

TEST_CASE("parser: precedence of arithmetic and comparison", "[parser]") {
    auto expr = parse_ok("a + b * 2 > 10");
    const auto& cmp = std::get<BinaryExpr>(expr->node);
    REQUIRE(cmp.op == BinaryOp::Gt);
    const auto& sum = std::get<BinaryExpr>(cmp.left->node);
    REQUIRE(sum.op == BinaryOp::Add);
    const auto& product = std::get<BinaryExpr>(sum.right->node);
    REQUIRE(product.op == BinaryOp::Mul);
    REQUIRE(std::get<LiteralExpr>(cmp.right->node).value == LiteralExpr{10.0}.value);
}

TEST_CASE("parser: logical operators in both spellings", "[parser]") {
    auto expr = parse_ok("a > 1 and b < 2 || not c");
    const auto& disjunction = std::get<BinaryExpr>(expr->node);
    REQUIRE(disjunction.op == BinaryOp::Or);
    REQUIRE(std::get<BinaryExpr>(disjunction.left->node).op == BinaryOp::And);
    REQUIRE(std::get<UnaryExpr>(disjunction.right->node).op == UnaryOp::Not);
}

TEST_CASE("parser: single equals is equality", "[parser]") {
    auto expr = parse_ok("region = 'north'");
    const auto& eq = std::get<BinaryExpr>(expr->node);
    REQUIRE(eq.op == BinaryOp::Eq);
    REQUIRE(std::get<IdentifierExpr>(eq.left->node).name == "region");
    REQUIRE(std::get<std::string>(std::get<LiteralExpr>(eq.right->node).value) == "north");
}

TEST_CASE("parser: conditional and null tests", "[parser]") {
    auto expr = parse_ok("x is not null ? x : 0");
    const auto& cond = std::get<ConditionalExpr>(expr->node);
    const auto& test = std::get<IsNullExpr>(cond.condition->node);
    REQUIRE(test.negated);
    REQUIRE(std::get<IdentifierExpr>(cond.then_branch->node).name == "x");

    auto plain = parse_ok("x IS NULL");
    REQUIRE_FALSE(std::get<IsNullExpr>(plain->node).negated);
}

TEST_CASE("parser: helper and math calls", "[parser]") {
    auto expr = parse_ok("n('unit price') * Math.max(qty, 1, 2)");
    const auto& product = std::get<BinaryExpr>(expr->node);
    const auto& accessor = std::get<CallExpr>(product.left->node);
    REQUIRE(accessor.function == Function::Number);
    REQUIRE(is_accessor(accessor.function));
    const auto& max = std::get<CallExpr>(product.right->node);
    REQUIRE(max.function == Function::Max);
    REQUIRE(max.args.size() == 3);

    REQUIRE(uses_accessors(*expr));
    REQUIRE_FALSE(uses_accessors(*parse_ok("round(a / 3)")));
}

TEST_CASE("parser: backtick identifiers and referenced columns", "[parser]") {
    auto expr = parse_ok("`unit price` * qty + qty - `unit price`");
    auto columns = referenced_columns(*expr);
    REQUIRE(columns == std::vector<std::string>{"unit price", "qty"});
}

TEST_CASE("parser: literal keywords are case-insensitive", "[parser]") {
    auto expr = parse_ok("TRUE OR Null");
    const auto& disjunction = std::get<BinaryExpr>(expr->node);
    REQUIRE(std::get<bool>(std::get<LiteralExpr>(disjunction.left->node).value));
    REQUIRE(std::holds_alternative<std::monostate>(
        std::get<LiteralExpr>(disjunction.right->node).value));
}

TEST_CASE("parser: error messages carry a column", "[parser]") {
    auto empty = parse_error("   ");
    REQUIRE(empty.message == "empty expression");

    auto trailing = parse_error("a b");
    REQUIRE(trailing.message == "unexpected 'b'");
    REQUIRE(trailing.column == 3);
    REQUIRE(trailing.format() == "column 3: unexpected 'b'");

    REQUIRE(parse_error("median(x)").message == "unknown function 'median'");
    REQUIRE(parse_error("Math.hypot(x, y)").message == "unknown function 'Math.hypot'");
    REQUIRE(parse_error("pow(2)").message == "wrong number of arguments to 'pow'");
    REQUIRE(parse_error("n(a, b)").message == "wrong number of arguments to 'n'");
    REQUIRE(parse_error("a >").message == "expected expression, found '<eof>'");
    REQUIRE(parse_error("price > 10abc").message == "invalid token '10abc'");
    REQUIRE(parse_error("(a + 1").message == "expected ')' after expression");
    REQUIRE(parse_error("a ? b").message == "expected ':' in conditional expression");
}
