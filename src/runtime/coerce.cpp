#include <pipit/runtime/coerce.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <limits>
#include <type_traits>

namespace pipit::runtime {

namespace {

using Millis = std::chrono::sys_time<std::chrono::milliseconds>;

auto trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto lower(std::string_view text) -> std::string {
    std::string out(text);
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

auto parse_fixed(std::string_view text, std::size_t pos, std::size_t width) -> std::optional<int> {
    if (pos + width > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    auto part = text.substr(pos, width);
    auto result = std::from_chars(part.data(), part.data() + part.size(), value);
    if (result.ec != std::errc() || result.ptr != part.data() + part.size()) {
        return std::nullopt;
    }
    return value;
}

/// Calendar dates and ISO-like date-times. Times without an explicit zone
/// are read as UTC.
auto parse_datetime(std::string_view text) -> std::optional<Millis> {
    text = trim(text);
    if (text.size() < 10 || (text[4] != '-' && text[4] != '/') || text[7] != text[4]) {
        return std::nullopt;
    }
    auto year = parse_fixed(text, 0, 4);
    auto month = parse_fixed(text, 5, 2);
    auto day = parse_fixed(text, 8, 2);
    if (!year || !month || !day) {
        return std::nullopt;
    }
    std::chrono::year_month_day ymd{std::chrono::year{*year},
                                    std::chrono::month{static_cast<unsigned>(*month)},
                                    std::chrono::day{static_cast<unsigned>(*day)}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    Millis stamp = std::chrono::sys_days{ymd};

    std::size_t pos = 10;
    if (pos == text.size()) {
        return stamp;
    }
    if (text[pos] != 'T' && text[pos] != ' ') {
        return std::nullopt;
    }
    pos += 1;
    auto hour = parse_fixed(text, pos, 2);
    if (!hour || pos + 2 >= text.size() || text[pos + 2] != ':') {
        return std::nullopt;
    }
    auto minute = parse_fixed(text, pos + 3, 2);
    if (!minute) {
        return std::nullopt;
    }
    pos += 5;
    int second = 0;
    if (pos < text.size() && text[pos] == ':') {
        auto parsed = parse_fixed(text, pos + 1, 2);
        if (!parsed) {
            return std::nullopt;
        }
        second = *parsed;
        pos += 3;
    }
    if (*hour > 23 || *minute > 59 || second > 59) {
        return std::nullopt;
    }
    int millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        pos += 1;
        std::size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (std::size_t i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }
    stamp += std::chrono::hours{*hour} + std::chrono::minutes{*minute} +
             std::chrono::seconds{second} + std::chrono::milliseconds{millis};

    if (pos == text.size()) {
        return stamp;
    }
    if (text[pos] == 'Z' && pos + 1 == text.size()) {
        return stamp;
    }
    if (text[pos] == '+' || text[pos] == '-') {
        const int sign = text[pos] == '+' ? 1 : -1;
        auto off_hour = parse_fixed(text, pos + 1, 2);
        std::size_t minute_pos = pos + 3;
        if (minute_pos < text.size() && text[minute_pos] == ':') {
            minute_pos += 1;
        }
        auto off_minute = parse_fixed(text, minute_pos, 2);
        if (!off_hour || !off_minute || minute_pos + 2 != text.size()) {
            return std::nullopt;
        }
        stamp -= sign * (std::chrono::hours{*off_hour} + std::chrono::minutes{*off_minute});
        return stamp;
    }
    return std::nullopt;
}

// Largest representable instant, 100,000,000 days either side of the epoch.
constexpr double kMaxEpochMillis = 8.64e15;

auto to_timestamp(const Value& value) -> std::optional<Millis> {
    if (const auto* number = std::get_if<double>(&value)) {
        if (!std::isfinite(*number) || std::fabs(*number) > kMaxEpochMillis) {
            return std::nullopt;
        }
        return Millis{std::chrono::milliseconds{static_cast<std::int64_t>(*number)}};
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return parse_datetime(*text);
    }
    return std::nullopt;
}

auto format_date(Millis stamp) -> std::string {
    auto days = std::chrono::floor<std::chrono::days>(stamp);
    std::chrono::year_month_day ymd{days};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto format_datetime(Millis stamp) -> std::string {
    auto days = std::chrono::floor<std::chrono::days>(stamp);
    std::chrono::hh_mm_ss time{stamp - days};
    return fmt::format("{}T{:02}:{:02}:{:02}.{:03}Z", format_date(stamp), time.hours().count(),
                       time.minutes().count(), time.seconds().count(),
                       time.subseconds().count());
}

}  // namespace

auto parse_number(std::string_view text) -> std::optional<double> {
    text = trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc() || result.ptr != text.data() + text.size() ||
        !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

auto numeric_value(const Value& value) -> std::optional<double> {
    if (const auto* number = std::get_if<double>(&value)) {
        return std::isfinite(*number) ? std::optional<double>{*number} : std::nullopt;
    }
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag ? 1.0 : 0.0;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return parse_number(*text);
    }
    return std::nullopt;
}

auto to_number_loose(const Value& value) -> std::optional<double> {
    if (const auto* number = std::get_if<double>(&value)) {
        return std::isfinite(*number) ? std::optional<double>{*number} : std::nullopt;
    }
    const auto* text = std::get_if<std::string>(&value);
    if (text == nullptr) {
        return std::nullopt;
    }

    static constexpr std::array<std::string_view, 6> currency = {"\xE2\x82\xB9", "$", "\xC2\xA3",
                                                                 "\xE2\x82\xAC", "\xC2\xA5",
                                                                 "\xE2\x82\xA9"};
    std::string cleaned;
    cleaned.reserve(text->size());
    std::string_view rest = trim(*text);
    while (!rest.empty()) {
        bool skipped = false;
        for (auto symbol : currency) {
            if (rest.starts_with(symbol)) {
                rest.remove_prefix(symbol.size());
                skipped = true;
                break;
            }
        }
        if (skipped) {
            continue;
        }
        const char ch = rest.front();
        rest.remove_prefix(1);
        if (ch == ',' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
            continue;
        }
        cleaned.push_back(ch);
    }
    if (!cleaned.empty() && cleaned.back() == '%') {
        cleaned.pop_back();
    }
    return parse_number(cleaned);
}

auto to_arithmetic(const Value& value) -> double {
    return std::visit(
        [](const auto& v) -> double {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return 0.0;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? 1.0 : 0.0;
            } else if constexpr (std::is_same_v<T, double>) {
                return v;
            } else {
                return parse_number(v).value_or(std::numeric_limits<double>::quiet_NaN());
            }
        },
        value);
}

auto truthy(const Value& value) -> bool {
    return std::visit(
        [](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return false;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v;
            } else if constexpr (std::is_same_v<T, double>) {
                return v != 0.0 && !std::isnan(v);
            } else {
                return !v.empty();
            }
        },
        value);
}

auto accessor_number(const Value& value) -> double {
    if (const auto* number = std::get_if<double>(&value)) {
        return std::isfinite(*number) ? *number : 0.0;
    }
    std::string text = to_display(value);
    std::erase_if(text, [](char ch) { return ch == ',' || ch == ' '; });
    return parse_number(text).value_or(0.0);
}

auto accessor_string(const Value& value) -> std::string {
    if (is_null(value)) {
        return {};
    }
    return to_display(value);
}

auto parse_boolean(std::string_view text) -> std::optional<bool> {
    const auto key = lower(trim(text));
    if (key == "true" || key == "t" || key == "1" || key == "yes" || key == "y") {
        return true;
    }
    if (key == "false" || key == "f" || key == "0" || key == "no" || key == "n") {
        return false;
    }
    return std::nullopt;
}

auto accessor_boolean(const Value& value) -> bool {
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag;
    }
    if (auto parsed = parse_boolean(to_display(value))) {
        return *parsed;
    }
    return truthy(value);
}

auto cast_value(const Value& value, graph::CastType type) -> Value {
    if (is_null(value)) {
        return value;
    }
    if (const auto* text = std::get_if<std::string>(&value); text != nullptr && text->empty()) {
        return value;
    }
    switch (type) {
        case graph::CastType::Integer: {
            auto number = to_number_loose(value);
            if (!number.has_value()) {
                return std::monostate{};
            }
            return std::trunc(*number);
        }
        case graph::CastType::Float: {
            auto number = to_number_loose(value);
            if (!number.has_value()) {
                return std::monostate{};
            }
            return *number;
        }
        case graph::CastType::Boolean: {
            if (std::holds_alternative<bool>(value)) {
                return value;
            }
            auto parsed = parse_boolean(to_display(value));
            if (!parsed.has_value()) {
                return std::monostate{};
            }
            return *parsed;
        }
        case graph::CastType::Date: {
            auto stamp = to_timestamp(value);
            if (!stamp.has_value()) {
                return std::monostate{};
            }
            return format_date(*stamp);
        }
        case graph::CastType::Datetime: {
            auto stamp = to_timestamp(value);
            if (!stamp.has_value()) {
                return std::monostate{};
            }
            return format_datetime(*stamp);
        }
        case graph::CastType::String:
            break;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return std::string(trim(*text));
    }
    return to_display(value);
}

auto compare_values(const Value& left, const Value& right) -> int {
    auto left_number = numeric_value(left);
    auto right_number = numeric_value(right);
    if (left_number.has_value() && right_number.has_value()) {
        if (*left_number < *right_number) {
            return -1;
        }
        return *left_number > *right_number ? 1 : 0;
    }
    if (left_number.has_value() != right_number.has_value()) {
        return left_number.has_value() ? -1 : 1;
    }
    const auto left_text = to_display(left);
    const auto right_text = to_display(right);
    if (left_text < right_text) {
        return -1;
    }
    return left_text > right_text ? 1 : 0;
}

auto infer_schema(const RowSet& rows) -> std::vector<ColumnSchema> {
    std::vector<ColumnSchema> schema;
    if (rows.empty()) {
        return schema;
    }
    const std::size_t sample = std::min<std::size_t>(rows.size(), 50);
    for (const auto& name : rows.front().keys()) {
        ColumnSchema column{.name = name, .type = "string"};
        for (std::size_t i = 0; i < sample; ++i) {
            const auto* value = rows[i].find(name);
            if (value == nullptr || is_null(*value)) {
                continue;
            }
            if (const auto* text = std::get_if<std::string>(value); text != nullptr && text->empty()) {
                continue;
            }
            if (numeric_value(*value).has_value() && !std::holds_alternative<bool>(*value)) {
                column.type = "number";
            }
            break;
        }
        schema.push_back(std::move(column));
    }
    return schema;
}

}  // namespace pipit::runtime
