#pragma once

#include <pipit/expr/ast.hpp>

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace pipit::expr {

/// Parse error with the 1-based column it was detected at.
struct ParseError {
    std::string message;
    std::size_t column = 0;

    [[nodiscard]] auto format() const -> std::string;
};

using ParseResult = std::expected<ExprPtr, ParseError>;

/// Parse one filter or formula expression. Trailing input is an error.
[[nodiscard]] auto parse(std::string_view source) -> ParseResult;

}  // namespace pipit::expr
