#pragma once

#include <pipit/graph/graph.hpp>
#include <pipit/runtime/row.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pipit::runtime {

/// Strict numeric reading of text: surrounding whitespace allowed, an empty
/// string is not a number.
[[nodiscard]] auto parse_number(std::string_view text) -> std::optional<double>;

/// Numeric value of a cell for aggregation: finite numbers, numeric text,
/// and booleans as 0/1. Null and non-numeric text give nullopt.
[[nodiscard]] auto numeric_value(const Value& value) -> std::optional<double>;

/// Lenient numeric reading used by casts and filter coercion. Strips
/// currency symbols, thousands separators, all whitespace and a trailing
/// percent sign before parsing.
[[nodiscard]] auto to_number_loose(const Value& value) -> std::optional<double>;

/// Arithmetic operand conversion: null is 0, booleans are 0/1, text that is
/// not a number is NaN.
[[nodiscard]] auto to_arithmetic(const Value& value) -> double;

/// JavaScript-style truthiness: null, false, 0, NaN and "" are false.
[[nodiscard]] auto truthy(const Value& value) -> bool;

/// Accessor helpers exposed to formula expressions.
[[nodiscard]] auto accessor_number(const Value& value) -> double;
[[nodiscard]] auto accessor_string(const Value& value) -> std::string;
[[nodiscard]] auto accessor_boolean(const Value& value) -> bool;

/// Recognized boolean spellings (true/t/1/yes/y, false/f/0/no/n), any case.
[[nodiscard]] auto parse_boolean(std::string_view text) -> std::optional<bool>;

/// Coerce one cell to a target type. Null and "" pass through unchanged;
/// values that cannot be converted become null.
[[nodiscard]] auto cast_value(const Value& value, graph::CastType type) -> Value;

/// Three-way ordering of two non-null values. Numbers and numeric text
/// compare numerically and order before everything else, which compares
/// by display text.
[[nodiscard]] auto compare_values(const Value& left, const Value& right) -> int;

struct ColumnSchema {
    std::string name;
    /// "number" or "string".
    std::string type;
};

/// Per column of the first row, the first non-empty value among the first
/// 50 rows decides between "number" and "string".
[[nodiscard]] auto infer_schema(const RowSet& rows) -> std::vector<ColumnSchema>;

}  // namespace pipit::runtime
