#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace pipit::expr {

struct IdentifierExpr {
    std::string name;
};

/// null, boolean, number or string.
struct LiteralExpr {
    std::variant<std::monostate, bool, double, std::string> value;
};

enum class UnaryOp : std::uint8_t {
    Negate,
    Not,
};

enum class BinaryOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    And,
    Or,
};

/// Accessor helpers and math functions known to the language.
enum class Function : std::uint8_t {
    Number,   // n(name)
    String,   // s(name)
    Boolean,  // b(name)
    Raw,      // col(name)
    Abs,
    Round,
    Floor,
    Ceil,
    Min,
    Max,
    Sqrt,
    Pow,
    Log,
    Exp,
};

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct CallExpr {
    Function function = Function::Abs;
    std::vector<ExprPtr> args;
};

struct UnaryExpr {
    UnaryOp op = UnaryOp::Negate;
    ExprPtr expr;
};

struct BinaryExpr {
    BinaryOp op = BinaryOp::Add;
    ExprPtr left;
    ExprPtr right;
};

/// `expr is null` / `expr is not null`.
struct IsNullExpr {
    ExprPtr expr;
    bool negated = false;
};

/// `condition ? then_branch : else_branch`.
struct ConditionalExpr {
    ExprPtr condition;
    ExprPtr then_branch;
    ExprPtr else_branch;
};

struct Expr {
    std::variant<IdentifierExpr, LiteralExpr, CallExpr, UnaryExpr, BinaryExpr, IsNullExpr,
                 ConditionalExpr>
        node;
};

[[nodiscard]] auto function_name(Function function) -> const char*;
[[nodiscard]] auto is_accessor(Function function) -> bool;

/// True when the expression calls n/s/b/col anywhere.
[[nodiscard]] auto uses_accessors(const Expr& expr) -> bool;

/// Distinct bare column references, in first-seen order.
[[nodiscard]] auto referenced_columns(const Expr& expr) -> std::vector<std::string>;

}  // namespace pipit::expr
