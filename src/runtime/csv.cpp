#include <pipit/runtime/csv.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <rapidcsv.h>

#include <exception>
#include <sstream>
#include <vector>

namespace pipit::runtime {

namespace {

auto make_document(std::istream& stream) -> rapidcsv::Document {
    return rapidcsv::Document(stream,
                              rapidcsv::LabelParams(0, -1),  // row 0 = header, no row-index column
                              rapidcsv::SeparatorParams(',', false, rapidcsv::sPlatformHasCR, true),
                              rapidcsv::ConverterParams(),
                              rapidcsv::LineReaderParams(false, '#', true));
}

auto encode_field(const Value& value) -> std::string {
    if (is_null(value)) {
        return {};
    }
    std::string text = to_display(value);
    if (text.find_first_of(",\"\n\r") == std::string::npos) {
        return text;
    }
    std::string out = "\"";
    for (char ch : text) {
        if (ch == '"') {
            out.push_back('"');
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

}  // namespace

auto decode_csv(std::string_view text) -> std::expected<RowSet, std::string> {
    RowSet rows;
    if (text.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return rows;
    }
    try {
        std::istringstream stream{std::string(text)};
        auto doc = make_document(stream);

        const auto names = doc.GetColumnNames();
        const std::size_t row_count = doc.GetRowCount();
        rows.reserve(row_count);
        for (std::size_t r = 0; r < row_count; ++r) {
            auto cells = doc.GetRow<std::string>(r);
            if (cells.size() != names.size()) {
                return std::unexpected(fmt::format("CSV parse error: row {} has {} fields, expected {}",
                                                   r + 1, cells.size(), names.size()));
            }
            Row row;
            for (std::size_t c = 0; c < names.size(); ++c) {
                row.set(names[c], std::move(cells[c]));
            }
            rows.push_back(std::move(row));
        }
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("CSV parse error: {}", e.what()));
    }
    return rows;
}

auto csv_header(std::string_view text) -> std::vector<std::string> {
    if (text.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return {};
    }
    try {
        std::istringstream stream{std::string(text)};
        return make_document(stream).GetColumnNames();
    } catch (const std::exception&) {
        return {};
    }
}

auto encode_csv(const RowSet& rows) -> std::string {
    if (rows.empty()) {
        return {};
    }
    const auto headers = rows.front().keys();
    std::vector<std::string> lines;
    lines.reserve(rows.size() + 1);

    std::vector<std::string> cells;
    for (const auto& name : headers) {
        cells.push_back(encode_field(Value{name}));
    }
    lines.push_back(fmt::format("{}", fmt::join(cells, ",")));

    for (const auto& row : rows) {
        cells.clear();
        for (const auto& name : headers) {
            cells.push_back(encode_field(row.get(name)));
        }
        lines.push_back(fmt::format("{}", fmt::join(cells, ",")));
    }
    return fmt::format("{}", fmt::join(lines, "\n"));
}

}  // namespace pipit::runtime
