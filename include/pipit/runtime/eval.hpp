#pragma once

#include <pipit/expr/ast.hpp>
#include <pipit/expr/parser.hpp>
#include <pipit/runtime/row.hpp>

#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace pipit::runtime {

/// How bare identifiers resolve.
enum class EvalMode {
    /// Identifiers read row fields; an unknown field is an evaluation error.
    Filter,
    /// Identifiers are undefined; fields are read through n/s/b/col.
    Compute,
};

/// A per-row evaluation failure.
struct EvalError {
    std::string message;
};

using EvalResult = std::expected<Value, EvalError>;

/// An expression compiled into a closure over a row.
class CompiledExpr {
   public:
    using Fn = std::function<EvalResult(const Row&)>;

    /// Compile an already parsed expression.
    [[nodiscard]] static auto compile(const expr::Expr& ast, EvalMode mode) -> CompiledExpr;
    /// Parse and compile expression text.
    [[nodiscard]] static auto compile(std::string_view text, EvalMode mode)
        -> std::expected<CompiledExpr, expr::ParseError>;

    [[nodiscard]] auto evaluate(const Row& row) const -> EvalResult { return fn_(row); }
    /// Evaluate and apply truthiness; errors propagate.
    [[nodiscard]] auto test(const Row& row) const -> std::expected<bool, EvalError>;

   private:
    explicit CompiledExpr(Fn fn) : fn_(std::move(fn)) {}

    Fn fn_;
};

}  // namespace pipit::runtime
