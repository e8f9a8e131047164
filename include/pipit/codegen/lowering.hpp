#pragma once

#include <pipit/expr/ast.hpp>
#include <pipit/graph/graph.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pipit::codegen {

using BindingNames = std::unordered_map<graph::NodeId, std::string>;

/// One readable, collision-free name per node in `order`: the slug of the
/// label, with `_2`, `_3`, ... appended to repeats in first-seen order.
[[nodiscard]] auto binding_names(const graph::Graph& graph,
                                 const std::vector<graph::NodeId>& order) -> BindingNames;

/// Columns named in the header rows of inline source payloads upstream of
/// `id` (inclusive), in first-seen order.
[[nodiscard]] auto known_columns(const graph::Graph& graph, const graph::NodeId& id)
    -> std::vector<std::string>;

/// How a bare identifier reads in a formula: as a numeric accessor call when
/// the formula text calls no n/s/b helper itself, otherwise as a plain field
/// reference.
enum class IdentifierStyle : std::uint8_t {
    Field,
    NumberAccessor,
};

[[nodiscard]] auto formula_identifier_style(std::string_view formula) -> IdentifierStyle;

// ─── SQL ──────────────────────────────────────────────────────────────────────

/// SQL predicate text. Direct column-vs-number comparisons cast the column
/// with TRY_CAST first.
[[nodiscard]] auto lower_sql_predicate(const expr::Expr& predicate) -> std::string;

/// SQL scalar expression for a formula.
[[nodiscard]] auto lower_sql_formula(const expr::Expr& formula, IdentifierStyle style)
    -> std::string;

/// `'text'` with embedded single quotes doubled.
[[nodiscard]] auto sql_string(std::string_view text) -> std::string;

// ─── pandas ───────────────────────────────────────────────────────────────────

/// True when the predicate fits `DataFrame.query` (no calls, conditionals or
/// null tests); otherwise it must run row by row.
[[nodiscard]] auto fits_query(const expr::Expr& predicate) -> bool;

/// Text for `DataFrame.query`. Requires `fits_query(predicate)`.
[[nodiscard]] auto lower_query(const expr::Expr& predicate) -> std::string;

/// Python expression over a row named `r`.
[[nodiscard]] auto lower_python(const expr::Expr& expr, IdentifierStyle style) -> std::string;

/// Python string literal.
[[nodiscard]] auto python_string(std::string_view text) -> std::string;

/// Python list literal of strings.
[[nodiscard]] auto python_list(const std::vector<std::string>& items) -> std::string;

}  // namespace pipit::codegen
