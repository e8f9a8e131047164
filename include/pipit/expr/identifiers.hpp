#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pipit::expr {

/// `[A-Za-z_][A-Za-z0-9_]*`
[[nodiscard]] auto is_bare_identifier(std::string_view name) -> bool;

/// Bare identifiers pass through; anything else is double-quoted with
/// embedded quotes doubled.
[[nodiscard]] auto quote_identifier(std::string_view name) -> std::string;

/// Rewrite direct `column <op> number` comparisons (op one of < <= = <> > >=)
/// into `TRY_CAST(column AS DOUBLE) <op> number`. Backtick-quoted names are
/// turned into quoted identifiers first. Text inside single-quoted string
/// literals is left alone.
[[nodiscard]] auto soften_numeric_comparisons(std::string_view text) -> std::string;

/// True when the text calls one of the n/s/b accessor helpers.
[[nodiscard]] auto has_helper_calls(std::string_view text) -> bool;

enum class RewriteTarget {
    QuotedIdentifier,  // unit price -> "unit price"
    NumberAccessor,    // price -> n("price")
};

/// Replace whole-word occurrences of known column names. Longer names win
/// over shorter names they contain. With NumberAccessor, text that already
/// calls a helper is returned unchanged. Quoted string literals are skipped.
[[nodiscard]] auto rewrite_columns(std::string_view text, const std::vector<std::string>& columns,
                                   RewriteTarget target) -> std::string;

/// Lowercase slug of a display label: non-alphanumeric runs collapse to `_`,
/// edges are trimmed, at most 24 characters, "node" when nothing is left.
[[nodiscard]] auto slugify_label(std::string_view label) -> std::string;

}  // namespace pipit::expr
