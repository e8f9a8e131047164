#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace pipit::expr {

/// Token types of the filter/formula expression language.
enum class TokenKind : std::uint8_t {
    // Literals
    NumberLiteral,
    StringLiteral,

    // Identifiers
    Identifier,
    QuotedIdentifier,  // `unit price`

    // Keywords (matched case-insensitively)
    KeywordTrue,
    KeywordFalse,
    KeywordNull,
    KeywordAnd,
    KeywordOr,
    KeywordNot,
    KeywordIs,

    // Comparison operators
    EqEq,    // == or ===
    Eq,      // =
    BangEq,  // != or !==
    LtGt,    // <>
    Lt,      // <
    Le,      // <=
    Gt,      // >
    Ge,      // >=

    // Arithmetic operators
    Plus,     // +
    Minus,    // -
    Star,     // *
    Slash,    // /
    Percent,  // %

    // Logical operators
    AmpAmp,    // &&
    PipePipe,  // ||
    Bang,      // !

    // Conditional
    Question,  // ?
    Colon,     // :

    // Delimiters
    LParen,  // (
    RParen,  // )
    Comma,   // ,
    Dot,     // .

    // Special
    Eof,
    Error,
};

/// A single token; `column` is 1-based.
struct Token {
    TokenKind kind = TokenKind::Error;
    std::string_view lexeme;
    std::size_t column = 0;
};

/// Tokenize an expression. Always ends with an Eof token; unrecognized input
/// produces Error tokens rather than failing.
[[nodiscard]] auto tokenize(std::string_view source) -> std::vector<Token>;

}  // namespace pipit::expr
