#pragma once

#include <pipit/runtime/row.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace pipit::runtime {

/// Decode comma-separated text with a header row. Quoted fields may contain
/// commas, quotes and line breaks; empty lines are skipped. Every cell is
/// kept as text. A row whose field count differs from the header is an error.
[[nodiscard]] auto decode_csv(std::string_view text) -> std::expected<RowSet, std::string>;

/// Column names from the header row; empty when the text has no header or
/// does not decode.
[[nodiscard]] auto csv_header(std::string_view text) -> std::vector<std::string>;

/// Encode rows with the first row's columns as header. Null cells are empty;
/// fields containing a comma, a quote or a line break are quoted. An empty
/// row-set encodes to an empty string.
[[nodiscard]] auto encode_csv(const RowSet& rows) -> std::string;

}  // namespace pipit::runtime
