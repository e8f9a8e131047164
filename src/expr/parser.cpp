#include <pipit/expr/lexer.hpp>
#include <pipit/expr/parser.hpp>

#include <fmt/format.h>

#include <cstdlib>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>

namespace pipit::expr {

namespace {

struct FunctionInfo {
    Function function;
    std::size_t min_args;
    std::size_t max_args;
};

auto accessor_table() -> const std::unordered_map<std::string_view, FunctionInfo>& {
    static const std::unordered_map<std::string_view, FunctionInfo> table = {
        {"n", {Function::Number, 1, 1}},
        {"s", {Function::String, 1, 1}},
        {"b", {Function::Boolean, 1, 1}},
        {"col", {Function::Raw, 1, 1}},
    };
    return table;
}

auto math_table() -> const std::unordered_map<std::string_view, FunctionInfo>& {
    static const std::unordered_map<std::string_view, FunctionInfo> table = {
        {"abs", {Function::Abs, 1, 1}},     {"round", {Function::Round, 1, 1}},
        {"floor", {Function::Floor, 1, 1}}, {"ceil", {Function::Ceil, 1, 1}},
        {"min", {Function::Min, 1, 64}},    {"max", {Function::Max, 1, 64}},
        {"sqrt", {Function::Sqrt, 1, 1}},   {"pow", {Function::Pow, 2, 2}},
        {"log", {Function::Log, 1, 1}},     {"exp", {Function::Exp, 1, 1}},
    };
    return table;
}

class Parser {
   public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    auto parse_root() -> ParseResult {
        if (is_at_end()) {
            return std::unexpected(make_error(peek(), "empty expression"));
        }
        auto expr = parse_expression();
        if (!expr) {
            return std::unexpected(error_);
        }
        if (!is_at_end()) {
            return std::unexpected(
                make_error(peek(), fmt::format("unexpected {}", format_token(peek()))));
        }
        return expr;
    }

   private:
    auto parse_expression() -> ExprPtr { return parse_conditional(); }

    auto parse_conditional() -> ExprPtr {
        auto condition = parse_or();
        if (!condition) {
            return nullptr;
        }
        if (!match(TokenKind::Question)) {
            return condition;
        }
        auto then_branch = parse_conditional();
        if (!then_branch) {
            return nullptr;
        }
        if (!consume(TokenKind::Colon, "expected ':' in conditional expression")) {
            return nullptr;
        }
        auto else_branch = parse_conditional();
        if (!else_branch) {
            return nullptr;
        }
        auto expr = std::make_unique<Expr>();
        expr->node = ConditionalExpr{
            .condition = std::move(condition),
            .then_branch = std::move(then_branch),
            .else_branch = std::move(else_branch),
        };
        return expr;
    }

    auto parse_or() -> ExprPtr {
        auto expr = parse_and();
        while (expr && (match(TokenKind::PipePipe) || match(TokenKind::KeywordOr))) {
            auto right = parse_and();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(BinaryOp::Or, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_and() -> ExprPtr {
        auto expr = parse_equality();
        while (expr && (match(TokenKind::AmpAmp) || match(TokenKind::KeywordAnd))) {
            auto right = parse_equality();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(BinaryOp::And, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_equality() -> ExprPtr {
        auto expr = parse_comparison();
        while (expr) {
            BinaryOp op;
            if (match(TokenKind::EqEq) || match(TokenKind::Eq)) {
                op = BinaryOp::Eq;
            } else if (match(TokenKind::BangEq) || match(TokenKind::LtGt)) {
                op = BinaryOp::Ne;
            } else {
                break;
            }
            auto right = parse_comparison();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(op, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_comparison() -> ExprPtr {
        auto expr = parse_term();
        while (expr) {
            // Postfix: expr is null / expr is not null
            if (match(TokenKind::KeywordIs)) {
                const bool negated = match(TokenKind::KeywordNot);
                if (!consume(TokenKind::KeywordNull,
                             negated ? "expected 'null' after 'is not'" : "expected 'null' after 'is'")) {
                    return nullptr;
                }
                auto wrapped = std::make_unique<Expr>();
                wrapped->node = IsNullExpr{.expr = std::move(expr), .negated = negated};
                expr = std::move(wrapped);
                continue;
            }
            BinaryOp op;
            if (match(TokenKind::Lt)) {
                op = BinaryOp::Lt;
            } else if (match(TokenKind::Le)) {
                op = BinaryOp::Le;
            } else if (match(TokenKind::Gt)) {
                op = BinaryOp::Gt;
            } else if (match(TokenKind::Ge)) {
                op = BinaryOp::Ge;
            } else {
                break;
            }
            auto right = parse_term();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(op, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_term() -> ExprPtr {
        auto expr = parse_factor();
        while (expr) {
            BinaryOp op;
            if (match(TokenKind::Plus)) {
                op = BinaryOp::Add;
            } else if (match(TokenKind::Minus)) {
                op = BinaryOp::Sub;
            } else {
                break;
            }
            auto right = parse_factor();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(op, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_factor() -> ExprPtr {
        auto expr = parse_unary();
        while (expr) {
            BinaryOp op;
            if (match(TokenKind::Star)) {
                op = BinaryOp::Mul;
            } else if (match(TokenKind::Slash)) {
                op = BinaryOp::Div;
            } else if (match(TokenKind::Percent)) {
                op = BinaryOp::Mod;
            } else {
                break;
            }
            auto right = parse_unary();
            if (!right) {
                return nullptr;
            }
            expr = make_binary(op, std::move(expr), std::move(right));
        }
        return expr;
    }

    auto parse_unary() -> ExprPtr {
        if (match(TokenKind::Minus)) {
            auto expr = parse_unary();
            if (!expr) {
                return nullptr;
            }
            return make_unary(UnaryOp::Negate, std::move(expr));
        }
        if (match(TokenKind::Bang) || match(TokenKind::KeywordNot)) {
            auto expr = parse_unary();
            if (!expr) {
                return nullptr;
            }
            return make_unary(UnaryOp::Not, std::move(expr));
        }
        if (match(TokenKind::Plus)) {
            return parse_unary();
        }
        return parse_primary();
    }

    auto parse_primary() -> ExprPtr {
        if (match(TokenKind::NumberLiteral)) {
            auto value = parse_double(previous().lexeme);
            if (!value.has_value()) {
                return fail_expr(previous(), "invalid number literal");
            }
            return make_literal(*value);
        }
        if (match(TokenKind::StringLiteral)) {
            return make_literal(unescape_string(previous().lexeme));
        }
        if (match(TokenKind::KeywordTrue)) {
            return make_literal(true);
        }
        if (match(TokenKind::KeywordFalse)) {
            return make_literal(false);
        }
        if (match(TokenKind::KeywordNull)) {
            return make_literal(std::monostate{});
        }
        if (match(TokenKind::QuotedIdentifier)) {
            auto expr = std::make_unique<Expr>();
            expr->node = IdentifierExpr{.name = unescape_string(previous().lexeme)};
            return expr;
        }
        if (match(TokenKind::Identifier)) {
            const Token& name_token = previous();
            std::string_view name = name_token.lexeme;
            if (name == "Math" && match(TokenKind::Dot)) {
                if (!consume(TokenKind::Identifier, "expected function name after 'Math.'")) {
                    return nullptr;
                }
                const Token& fn_token = previous();
                auto it = math_table().find(fn_token.lexeme);
                if (it == math_table().end()) {
                    return fail_expr(fn_token, fmt::format("unknown function 'Math.{}'",
                                                           std::string(fn_token.lexeme)));
                }
                if (!consume(TokenKind::LParen, "expected '(' after function name")) {
                    return nullptr;
                }
                return parse_call(fn_token, it->second);
            }
            if (match(TokenKind::LParen)) {
                auto it = accessor_table().find(name);
                if (it == accessor_table().end()) {
                    it = math_table().find(name);
                    if (it == math_table().end()) {
                        return fail_expr(name_token,
                                         fmt::format("unknown function '{}'", std::string(name)));
                    }
                }
                return parse_call(name_token, it->second);
            }
            auto expr = std::make_unique<Expr>();
            expr->node = IdentifierExpr{.name = std::string(name)};
            return expr;
        }
        if (match(TokenKind::LParen)) {
            auto expr = parse_expression();
            if (!expr) {
                return nullptr;
            }
            if (!consume(TokenKind::RParen, "expected ')' after expression")) {
                return nullptr;
            }
            return expr;
        }
        if (check(TokenKind::Error)) {
            return fail_expr(peek(), fmt::format("invalid token {}", format_token(peek())));
        }
        return fail_expr(peek(), fmt::format("expected expression, found {}", format_token(peek())));
    }

    /// Arguments after the opening parenthesis, checked against the arity.
    auto parse_call(const Token& name_token, const FunctionInfo& info) -> ExprPtr {
        std::vector<ExprPtr> args;
        if (!check(TokenKind::RParen)) {
            do {
                auto arg = parse_expression();
                if (!arg) {
                    return nullptr;
                }
                args.push_back(std::move(arg));
            } while (match(TokenKind::Comma));
        }
        if (!consume(TokenKind::RParen, "expected ')' after argument list")) {
            return nullptr;
        }
        if (args.size() < info.min_args || args.size() > info.max_args) {
            return fail_expr(name_token,
                             fmt::format("wrong number of arguments to '{}'",
                                         std::string(name_token.lexeme)));
        }
        auto expr = std::make_unique<Expr>();
        expr->node = CallExpr{.function = info.function, .args = std::move(args)};
        return expr;
    }

    static auto make_binary(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr {
        auto expr = std::make_unique<Expr>();
        expr->node = BinaryExpr{.op = op, .left = std::move(left), .right = std::move(right)};
        return expr;
    }

    static auto make_unary(UnaryOp op, ExprPtr operand) -> ExprPtr {
        auto expr = std::make_unique<Expr>();
        expr->node = UnaryExpr{.op = op, .expr = std::move(operand)};
        return expr;
    }

    template <typename T>
    static auto make_literal(T value) -> ExprPtr {
        auto expr = std::make_unique<Expr>();
        expr->node = LiteralExpr{.value = std::move(value)};
        return expr;
    }

    auto consume(TokenKind kind, std::string_view message) -> bool {
        if (check(kind)) {
            advance();
            return true;
        }
        error_ = make_error(peek(), message);
        return false;
    }

    auto check(TokenKind kind) const -> bool { return peek().kind == kind; }

    auto match(TokenKind kind) -> bool {
        if (!check(kind)) {
            return false;
        }
        advance();
        return true;
    }

    auto advance() -> const Token& {
        if (!is_at_end()) {
            current_ += 1;
        }
        return previous();
    }

    auto is_at_end() const -> bool { return peek().kind == TokenKind::Eof; }

    auto peek() const -> const Token& { return tokens_[current_]; }

    auto previous() const -> const Token& { return tokens_[current_ - 1]; }

    static auto make_error(const Token& token, std::string_view message) -> ParseError {
        return ParseError{
            .message = std::string(message),
            .column = token.column,
        };
    }

    static auto format_token(const Token& token) -> std::string {
        if (token.kind == TokenKind::Eof || token.lexeme.empty()) {
            return "'<eof>'";
        }
        return fmt::format("'{}'", std::string(token.lexeme));
    }

    auto fail_expr(const Token& token, std::string_view message) -> ExprPtr {
        error_ = make_error(token, message);
        return nullptr;
    }

    static auto parse_double(std::string_view text) -> std::optional<double> {
        std::string tmp(text);
        char* end = nullptr;
        double value = std::strtod(tmp.c_str(), &end);
        if (end != tmp.c_str() + tmp.size()) {
            return std::nullopt;
        }
        return value;
    }

    /// Strip the surrounding quote characters and resolve backslash escapes.
    static auto unescape_string(std::string_view text) -> std::string {
        if (text.size() < 2) {
            return std::string(text);
        }
        std::string result;
        result.reserve(text.size() - 2);
        for (std::size_t idx = 1; idx + 1 < text.size(); ++idx) {
            char ch = text[idx];
            if (ch == '\\' && idx + 1 < text.size() - 1) {
                char next = text[idx + 1];
                switch (next) {
                    case 'n':
                        result.push_back('\n');
                        break;
                    case 'r':
                        result.push_back('\r');
                        break;
                    case 't':
                        result.push_back('\t');
                        break;
                    default:
                        result.push_back(next);
                        break;
                }
                idx += 1;
                continue;
            }
            result.push_back(ch);
        }
        return result;
    }

    std::vector<Token> tokens_;
    std::size_t current_ = 0;
    ParseError error_;
};

auto collect_columns(const Expr& expr, std::vector<std::string>& out,
                     std::unordered_set<std::string>& seen) -> void {
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, IdentifierExpr>) {
                if (seen.insert(node.name).second) {
                    out.push_back(node.name);
                }
            } else if constexpr (std::is_same_v<T, CallExpr>) {
                for (const auto& arg : node.args) {
                    collect_columns(*arg, out, seen);
                }
            } else if constexpr (std::is_same_v<T, UnaryExpr> || std::is_same_v<T, IsNullExpr>) {
                collect_columns(*node.expr, out, seen);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                collect_columns(*node.left, out, seen);
                collect_columns(*node.right, out, seen);
            } else if constexpr (std::is_same_v<T, ConditionalExpr>) {
                collect_columns(*node.condition, out, seen);
                collect_columns(*node.then_branch, out, seen);
                collect_columns(*node.else_branch, out, seen);
            }
        },
        expr.node);
}

}  // namespace

auto ParseError::format() const -> std::string {
    return fmt::format("column {}: {}", column, message);
}

auto parse(std::string_view source) -> ParseResult {
    Parser parser(tokenize(source));
    return parser.parse_root();
}

auto function_name(Function function) -> const char* {
    switch (function) {
        case Function::Number:
            return "n";
        case Function::String:
            return "s";
        case Function::Boolean:
            return "b";
        case Function::Raw:
            return "col";
        case Function::Abs:
            return "abs";
        case Function::Round:
            return "round";
        case Function::Floor:
            return "floor";
        case Function::Ceil:
            return "ceil";
        case Function::Min:
            return "min";
        case Function::Max:
            return "max";
        case Function::Sqrt:
            return "sqrt";
        case Function::Pow:
            return "pow";
        case Function::Log:
            return "log";
        case Function::Exp:
            return "exp";
    }
    return "?";
}

auto is_accessor(Function function) -> bool {
    return function == Function::Number || function == Function::String ||
           function == Function::Boolean || function == Function::Raw;
}

auto uses_accessors(const Expr& expr) -> bool {
    return std::visit(
        [](const auto& node) -> bool {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, CallExpr>) {
                if (is_accessor(node.function)) {
                    return true;
                }
                for (const auto& arg : node.args) {
                    if (uses_accessors(*arg)) {
                        return true;
                    }
                }
                return false;
            } else if constexpr (std::is_same_v<T, UnaryExpr> || std::is_same_v<T, IsNullExpr>) {
                return uses_accessors(*node.expr);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                return uses_accessors(*node.left) || uses_accessors(*node.right);
            } else if constexpr (std::is_same_v<T, ConditionalExpr>) {
                return uses_accessors(*node.condition) || uses_accessors(*node.then_branch) ||
                       uses_accessors(*node.else_branch);
            } else {
                return false;
            }
        },
        expr.node);
}

auto referenced_columns(const Expr& expr) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    collect_columns(expr, out, seen);
    return out;
}

}  // namespace pipit::expr
