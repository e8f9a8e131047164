#include <pipit/runtime/coerce.hpp>
#include <pipit/runtime/ops.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <robin_hood.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <type_traits>
#include <unordered_set>

namespace pipit::ops {

using runtime::Row;
using runtime::RowSet;
using runtime::Value;

namespace {

struct Key {
    std::vector<Value> values;
};

// Key components compare by value, with every NaN equal to every other NaN
// so NaN keys land in one group.
struct KeyHash {
    auto operator()(const Key& key) const -> std::size_t {
        std::size_t seed = 0;
        auto hash_combine = [&](std::size_t value) {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        for (const auto& value : key.values) {
            std::size_t h = std::visit(
                [](const auto& v) -> std::size_t {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, double>) {
                        if (std::isnan(v)) {
                            return 0x7ff8U;
                        }
                        return v == 0.0 ? 0 : std::hash<double>{}(v);
                    } else {
                        return std::hash<T>{}(v);
                    }
                },
                value);
            hash_combine(h);
            hash_combine(value.index());
        }
        return seed;
    }
};

struct KeyEq {
    auto operator()(const Key& a, const Key& b) const -> bool {
        if (a.values.size() != b.values.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.values.size(); ++i) {
            const auto* x = std::get_if<double>(&a.values[i]);
            const auto* y = std::get_if<double>(&b.values[i]);
            if (x != nullptr && y != nullptr && std::isnan(*x) && std::isnan(*y)) {
                continue;
            }
            if (a.values[i] != b.values[i]) {
                return false;
            }
        }
        return true;
    }
};

auto exact_key(const Row& row, const std::vector<std::string>& columns) -> Key {
    Key key;
    key.values.reserve(columns.size());
    for (const auto& column : columns) {
        key.values.push_back(row.get(column));
    }
    return key;
}

/// Join keys ignore surrounding whitespace in text values.
auto join_key(const Row& row, const std::vector<std::string>& columns) -> Key {
    Key key = exact_key(row, columns);
    for (auto& value : key.values) {
        if (auto* text = std::get_if<std::string>(&value)) {
            auto begin = text->find_first_not_of(" \t\r\n");
            auto end = text->find_last_not_of(" \t\r\n");
            *text = begin == std::string::npos ? std::string{} : text->substr(begin, end - begin + 1);
        }
    }
    return key;
}

/// Null-aware key comparison: nulls order first when ascending and last when
/// descending.
auto compare_for_sort(const Value& a, const Value& b, bool ascending) -> int {
    const bool a_null = runtime::is_null(a);
    const bool b_null = runtime::is_null(b);
    if (a_null && b_null) {
        return 0;
    }
    if (a_null) {
        return ascending ? -1 : 1;
    }
    if (b_null) {
        return ascending ? 1 : -1;
    }
    const int cmp = runtime::compare_values(a, b);
    return ascending ? cmp : -cmp;
}

auto measure_value(graph::AggFunc func, const std::vector<const Row*>& group,
                   const std::string& column) -> Value {
    std::vector<Value> present;
    for (const auto* row : group) {
        const auto* value = row->find(column);
        if (value != nullptr && !runtime::is_null(*value)) {
            present.push_back(*value);
        }
    }
    std::vector<double> numbers;
    for (const auto& value : present) {
        if (auto number = runtime::numeric_value(value)) {
            numbers.push_back(*number);
        }
    }

    switch (func) {
        case graph::AggFunc::Sum:
            return std::accumulate(numbers.begin(), numbers.end(), 0.0);
        case graph::AggFunc::Avg:
        case graph::AggFunc::Mean:
            if (numbers.empty()) {
                return std::monostate{};
            }
            return std::accumulate(numbers.begin(), numbers.end(), 0.0) /
                   static_cast<double>(numbers.size());
        case graph::AggFunc::Min:
            if (numbers.empty()) {
                return std::monostate{};
            }
            return *std::min_element(numbers.begin(), numbers.end());
        case graph::AggFunc::Max:
            if (numbers.empty()) {
                return std::monostate{};
            }
            return *std::max_element(numbers.begin(), numbers.end());
        case graph::AggFunc::Count:
            return static_cast<double>(group.size());
        case graph::AggFunc::First:
            return present.empty() ? Value{} : present.front();
        case graph::AggFunc::Last:
            return present.empty() ? Value{} : present.back();
    }
    return std::monostate{};
}

}  // namespace

auto project(const RowSet& rows, const graph::ProjectConfig& config) -> RowSet {
    RowSet out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        if (config.columns.empty()) {
            out.push_back(row);
            continue;
        }
        Row projected;
        for (const auto& column : config.columns) {
            projected.set(column, row.get(column));
        }
        out.push_back(std::move(projected));
    }
    if (config.schema.empty()) {
        return out;
    }

    // Later entries for the same column win.
    std::vector<graph::ColumnCast> casts;
    for (const auto& cast : config.schema) {
        auto name = cast.name;
        auto begin = name.find_first_not_of(" \t");
        auto end = name.find_last_not_of(" \t");
        name = begin == std::string::npos ? std::string{} : name.substr(begin, end - begin + 1);
        if (name.empty()) {
            continue;
        }
        auto it = std::find_if(casts.begin(), casts.end(),
                               [&](const graph::ColumnCast& c) { return c.name == name; });
        if (it != casts.end()) {
            it->type = cast.type;
        } else {
            casts.push_back(graph::ColumnCast{.name = std::move(name), .type = cast.type});
        }
    }

    for (auto& row : out) {
        for (const auto& cast : casts) {
            std::string key = cast.name;
            if (!row.contains(key)) {
                // Header names often carry stray whitespace.
                for (const auto& field : row.fields()) {
                    auto begin = field.first.find_first_not_of(" \t");
                    auto end = field.first.find_last_not_of(" \t");
                    if (begin != std::string::npos &&
                        field.first.substr(begin, end - begin + 1) == cast.name) {
                        key = field.first;
                        break;
                    }
                }
                if (!row.contains(key)) {
                    continue;
                }
            }
            row.set(key, runtime::cast_value(row.get(key), cast.type));
        }
    }
    return out;
}

auto filter(const RowSet& rows, const runtime::CompiledExpr& predicate) -> RowSet {
    RowSet out;
    for (const auto& row : rows) {
        Row coerced;
        for (const auto& [name, value] : row.fields()) {
            if (std::holds_alternative<std::string>(value)) {
                if (auto number = runtime::to_number_loose(value)) {
                    coerced.set(name, *number);
                    continue;
                }
            }
            coerced.set(name, value);
        }
        auto keep = predicate.test(coerced);
        if (keep.has_value() && *keep) {
            out.push_back(row);
        }
    }
    return out;
}

auto aggregate(const RowSet& rows, const graph::AggregateConfig& config) -> RowSet {
    robin_hood::unordered_flat_map<Key, std::size_t, KeyHash, KeyEq> index;
    index.reserve(rows.size());
    std::vector<Key> keys;
    std::vector<std::vector<const Row*>> groups;

    for (const auto& row : rows) {
        Key key = exact_key(row, config.group_by);
        auto it = index.find(key);
        if (it == index.end()) {
            index.emplace(key, groups.size());
            keys.push_back(std::move(key));
            groups.emplace_back().push_back(&row);
        } else {
            groups[it->second].push_back(&row);
        }
    }

    RowSet out;
    out.reserve(groups.size());
    for (std::size_t g = 0; g < groups.size(); ++g) {
        Row result;
        for (std::size_t c = 0; c < config.group_by.size(); ++c) {
            result.set(config.group_by[c], keys[g].values[c]);
        }
        for (const auto& measure : config.measures) {
            result.set(graph::measure_output_name(measure),
                       measure_value(measure.func, groups[g], measure.column));
        }
        out.push_back(std::move(result));
    }
    return out;
}

auto compute(const RowSet& rows, const std::string& column, const runtime::CompiledExpr& formula)
    -> RowSet {
    RowSet out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        Row next = row;
        auto value = formula.evaluate(row);
        next.set(column, value.has_value() ? std::move(*value) : Value{});
        out.push_back(std::move(next));
    }
    return out;
}

auto order(const RowSet& rows, const std::vector<graph::SortKey>& keys) -> RowSet {
    RowSet out = rows;
    if (keys.empty()) {
        return out;
    }
    std::stable_sort(out.begin(), out.end(), [&](const Row& a, const Row& b) {
        for (const auto& key : keys) {
            const int cmp = compare_for_sort(a.get(key.column), b.get(key.column), key.ascending);
            if (cmp != 0) {
                return cmp < 0;
            }
        }
        return false;
    });
    return out;
}

auto sample(const RowSet& rows, const graph::SampleConfig& config, std::uint64_t seed) -> RowSet {
    std::mt19937_64 rng(seed);
    if (config.mode == graph::SampleMode::Fraction) {
        double p = std::isfinite(config.fraction) ? config.fraction : 0.1;
        p = std::clamp(p, 0.0, 1.0);
        std::bernoulli_distribution keep(p);
        RowSet out;
        for (const auto& row : rows) {
            if (keep(rng)) {
                out.push_back(row);
            }
        }
        return out;
    }
    RowSet out = rows;
    std::shuffle(out.begin(), out.end(), rng);
    const auto limit = static_cast<std::size_t>(std::max<std::int64_t>(0, config.rows));
    if (out.size() > limit) {
        out.resize(limit);
    }
    return out;
}

auto dedupe(const RowSet& rows, const std::vector<std::string>& keys, graph::DedupePick pick,
            const std::string& order_column) -> RowSet {
    if (rows.empty() || keys.empty()) {
        return rows;
    }
    RowSet ordered = rows;
    if (!order_column.empty()) {
        ordered = order(rows, {graph::SortKey{.column = order_column,
                                              .ascending = pick == graph::DedupePick::First}});
    } else if (pick == graph::DedupePick::Last) {
        std::reverse(ordered.begin(), ordered.end());
    }

    robin_hood::unordered_flat_set<Key, KeyHash, KeyEq> seen;
    seen.reserve(ordered.size());
    RowSet out;
    for (auto& row : ordered) {
        if (seen.insert(join_key(row, keys)).second) {
            out.push_back(std::move(row));
        }
    }
    if (order_column.empty() && pick == graph::DedupePick::Last) {
        std::reverse(out.begin(), out.end());
    }
    return out;
}

auto join(const RowSet& left, const RowSet& right, const graph::JoinConfig& config) -> RowSet {
    // Right keys pair positionally with left keys; a short right list reuses
    // its first entry.
    std::vector<std::string> right_keys;
    for (std::size_t i = 0; i < config.left_on.size(); ++i) {
        if (i < config.right_on.size()) {
            right_keys.push_back(config.right_on[i]);
        } else if (!config.right_on.empty()) {
            right_keys.push_back(config.right_on.front());
        }
    }
    const auto& left_keys = config.left_on;

    const RowSet left_rows =
        config.dedupe_left ? dedupe(left, left_keys, config.pick, config.dedupe_order_column) : left;
    const RowSet right_rows = config.dedupe_right
                                  ? dedupe(right, right_keys, config.pick, config.dedupe_order_column)
                                  : right;

    robin_hood::unordered_flat_map<Key, std::vector<std::size_t>, KeyHash, KeyEq> index;
    index.reserve(right_rows.size());
    // Distinct right keys in encounter order, with their first row.
    std::vector<std::pair<Key, std::size_t>> right_order;
    for (std::size_t r = 0; r < right_rows.size(); ++r) {
        Key key = join_key(right_rows[r], right_keys);
        auto it = index.find(key);
        if (it == index.end()) {
            right_order.emplace_back(key, r);
            index.emplace(std::move(key), std::vector<std::size_t>{r});
        } else {
            it->second.push_back(r);
        }
    }

    const bool keep_left = config.how == graph::JoinKind::Left || config.how == graph::JoinKind::Outer;
    const bool keep_right =
        config.how == graph::JoinKind::Right || config.how == graph::JoinKind::Outer;

    RowSet out;
    robin_hood::unordered_flat_set<Key, KeyHash, KeyEq> left_seen;
    for (const auto& row : left_rows) {
        Key key = join_key(row, left_keys);
        auto it = index.find(key);
        left_seen.insert(std::move(key));
        if (it != index.end()) {
            for (auto r : it->second) {
                Row merged = row;
                merged.merge(right_rows[r]);
                out.push_back(std::move(merged));
            }
        } else if (keep_left) {
            out.push_back(row);
        }
    }

    if (keep_right) {
        // One representative row per unmatched right key.
        for (const auto& [key, first] : right_order) {
            if (!left_seen.contains(key)) {
                out.push_back(right_rows[first]);
            }
        }
    }
    return out;
}

void print(const RowSet& rows, std::ostream& out, std::size_t max_rows) {
    if (rows.empty()) {
        fmt::print(out, "<empty>\n");
        return;
    }
    fmt::print(out, "rows: {}\n", rows.size());

    const std::size_t shown_rows = std::min(rows.size(), max_rows);
    std::vector<std::string> names;
    std::unordered_set<std::string> known;
    for (std::size_t r = 0; r < shown_rows; ++r) {
        for (const auto& field : rows[r].fields()) {
            if (known.insert(field.first).second) {
                names.push_back(field.first);
            }
        }
    }

    const std::size_t col_count = names.size();
    std::vector<std::size_t> widths(col_count);
    std::vector<std::vector<std::string>> cells(col_count);
    for (std::size_t c = 0; c < col_count; ++c) {
        widths[c] = names[c].size();
        cells[c].reserve(shown_rows);
        for (std::size_t r = 0; r < shown_rows; ++r) {
            auto cell = runtime::to_display(rows[r].get(names[c]));
            widths[c] = std::max(widths[c], cell.size());
            cells[c].push_back(std::move(cell));
        }
    }

    auto print_sep = [&]() {
        fmt::print(out, "+");
        for (std::size_t c = 0; c < col_count; ++c) {
            fmt::print(out, "{:-<{}}+", "", widths[c] + 2);
        }
        fmt::print(out, "\n");
    };

    print_sep();
    fmt::print(out, "|");
    for (std::size_t c = 0; c < col_count; ++c) {
        fmt::print(out, " {:<{}} |", names[c], widths[c]);
    }
    fmt::print(out, "\n");
    print_sep();

    for (std::size_t r = 0; r < shown_rows; ++r) {
        fmt::print(out, "|");
        for (std::size_t c = 0; c < col_count; ++c) {
            fmt::print(out, " {:<{}} |", cells[c][r], widths[c]);
        }
        fmt::print(out, "\n");
    }
    print_sep();

    if (rows.size() > shown_rows) {
        fmt::print(out, "... ({} more rows)\n", rows.size() - shown_rows);
    }
}

}  // namespace pipit::ops
