#include <pipit/expr/identifiers.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace pipit::expr {

namespace {

auto is_word_char(char ch) -> bool {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

auto is_ident_start(char ch) -> bool {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

auto is_digit(char ch) -> bool {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

/// Index one past the closing quote of the literal starting at `start`.
/// A doubled quote character or a backslash escape stays inside the literal.
auto skip_quoted(std::string_view text, std::size_t start) -> std::size_t {
    const char quote = text[start];
    std::size_t i = start + 1;
    while (i < text.size()) {
        if (text[i] == '\\' && i + 1 < text.size()) {
            i += 2;
            continue;
        }
        if (text[i] == quote) {
            if (i + 1 < text.size() && text[i + 1] == quote) {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return text.size();
}

auto replace_backticks(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '\'') {
            auto end = skip_quoted(text, i);
            out.append(text.substr(i, end - i));
            i = end;
            continue;
        }
        if (text[i] == '`') {
            auto close = text.find('`', i + 1);
            if (close != std::string_view::npos && close > i + 1) {
                out.append(quote_identifier(text.substr(i + 1, close - i - 1)));
                i = close + 1;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

/// Length of a comparison operator at `pos`, or 0.
auto comparison_length(std::string_view text, std::size_t pos) -> std::size_t {
    if (pos >= text.size()) {
        return 0;
    }
    auto rest = text.substr(pos);
    if (rest.starts_with("<=") || rest.starts_with(">=") || rest.starts_with("<>")) {
        return 2;
    }
    if (rest[0] == '=' || rest[0] == '<' || rest[0] == '>') {
        return 1;
    }
    return 0;
}

auto skip_spaces(std::string_view text, std::size_t pos) -> std::size_t {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
        ++pos;
    }
    return pos;
}

/// End of an unsigned `digits[.digits]` literal at `pos` that is followed by
/// a word boundary, or npos.
auto number_end(std::string_view text, std::size_t pos) -> std::size_t {
    std::size_t i = pos;
    while (i < text.size() && is_digit(text[i])) {
        ++i;
    }
    if (i == pos) {
        return std::string_view::npos;
    }
    if (i + 1 < text.size() && text[i] == '.' && is_digit(text[i + 1])) {
        ++i;
        while (i < text.size() && is_digit(text[i])) {
            ++i;
        }
    }
    if (i < text.size() && (is_word_char(text[i]) || text[i] == '.')) {
        return std::string_view::npos;
    }
    return i;
}

}  // namespace

auto is_bare_identifier(std::string_view name) -> bool {
    if (name.empty() || !is_ident_start(name.front())) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), is_word_char);
}

auto quote_identifier(std::string_view name) -> std::string {
    if (is_bare_identifier(name)) {
        return std::string(name);
    }
    std::string out = "\"";
    for (char ch : name) {
        if (ch == '"') {
            out.push_back('"');
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

auto soften_numeric_comparisons(std::string_view text) -> std::string {
    const std::string source = replace_backticks(text);
    const std::string_view view = source;

    std::string out;
    out.reserve(source.size() + 32);
    std::size_t i = 0;
    while (i < view.size()) {
        const char ch = view[i];
        if (ch == '\'') {
            auto end = skip_quoted(view, i);
            out.append(view.substr(i, end - i));
            i = end;
            continue;
        }

        std::size_t operand_end = std::string_view::npos;
        if (ch == '"') {
            operand_end = skip_quoted(view, i);
        } else if (is_ident_start(ch) && (i == 0 || !is_word_char(view[i - 1]))) {
            operand_end = i + 1;
            while (operand_end < view.size() && is_word_char(view[operand_end])) {
                ++operand_end;
            }
        }
        if (operand_end == std::string_view::npos) {
            out.push_back(ch);
            ++i;
            continue;
        }

        auto operand = view.substr(i, operand_end - i);
        auto op_start = skip_spaces(view, operand_end);
        auto op_len = comparison_length(view, op_start);
        if (op_len > 0) {
            auto num_start = skip_spaces(view, op_start + op_len);
            auto num_end = number_end(view, num_start);
            if (num_end != std::string_view::npos) {
                out.append(fmt::format("TRY_CAST({} AS DOUBLE) {} {}", operand,
                                       view.substr(op_start, op_len),
                                       view.substr(num_start, num_end - num_start)));
                i = num_end;
                continue;
            }
        }
        out.append(operand);
        i = operand_end;
    }
    return out;
}

auto has_helper_calls(std::string_view text) -> bool {
    std::size_t i = 0;
    while (i < text.size()) {
        const char ch = text[i];
        if (ch == '\'' || ch == '"') {
            i = skip_quoted(text, i);
            continue;
        }
        if ((ch == 'n' || ch == 's' || ch == 'b') && (i == 0 || !is_word_char(text[i - 1])) &&
            (i + 1 >= text.size() || !is_word_char(text[i + 1]))) {
            auto next = skip_spaces(text, i + 1);
            if (next < text.size() && text[next] == '(') {
                return true;
            }
        }
        ++i;
    }
    return false;
}

auto rewrite_columns(std::string_view text, const std::vector<std::string>& columns,
                     RewriteTarget target) -> std::string {
    if (text.empty() || columns.empty()) {
        return std::string(text);
    }
    if (target == RewriteTarget::NumberAccessor && has_helper_calls(text)) {
        return std::string(text);
    }

    std::vector<std::string> keys;
    for (const auto& column : columns) {
        if (!column.empty()) {
            keys.push_back(column);
        }
    }
    std::stable_sort(keys.begin(), keys.end(), [](const std::string& a, const std::string& b) {
        return a.size() > b.size();
    });

    std::string out;
    out.reserve(text.size() + 16);
    std::size_t i = 0;
    while (i < text.size()) {
        const char ch = text[i];
        if (ch == '\'' || ch == '"') {
            auto end = skip_quoted(text, i);
            out.append(text.substr(i, end - i));
            i = end;
            continue;
        }
        const bool boundary_before = i == 0 || !is_word_char(text[i - 1]);
        const std::string* hit = nullptr;
        if (boundary_before) {
            for (const auto& key : keys) {
                if (text.substr(i, key.size()) != key) {
                    continue;
                }
                auto after = i + key.size();
                if (after < text.size() && is_word_char(text[after])) {
                    continue;
                }
                hit = &key;
                break;
            }
        }
        if (hit == nullptr) {
            out.push_back(ch);
            ++i;
            continue;
        }
        if (target == RewriteTarget::QuotedIdentifier) {
            out.append(quote_identifier(*hit));
        } else {
            std::string escaped;
            for (char c : *hit) {
                if (c == '"' || c == '\\') {
                    escaped.push_back('\\');
                }
                escaped.push_back(c);
            }
            out.append(fmt::format("n(\"{}\")", escaped));
        }
        i += hit->size();
    }
    return out;
}

auto slugify_label(std::string_view label) -> std::string {
    std::string slug;
    bool pending_sep = false;
    for (char raw : label) {
        const char ch = static_cast<char>(std::tolower(static_cast<unsigned char>(raw)));
        if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')) {
            if (pending_sep && !slug.empty()) {
                slug.push_back('_');
            }
            pending_sep = false;
            slug.push_back(ch);
        } else {
            pending_sep = true;
        }
    }
    if (slug.size() > 24) {
        slug.resize(24);
    }
    if (slug.empty()) {
        return "node";
    }
    return slug;
}

}  // namespace pipit::expr
