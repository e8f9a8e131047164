#pragma once

#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pipit::runtime {

/// A scalar cell: null, boolean, number or text.
using Value = std::variant<std::monostate, bool, double, std::string>;

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<std::monostate>(value);
}

/// Textual form of a value ("null" for null, shortest round-trip numbers,
/// "NaN"/"Infinity" for non-finite numbers).
[[nodiscard]] auto to_display(const Value& value) -> std::string;

/// An ordered mapping from column name to value. Field order is the order
/// in which names were first set; setting an existing name overwrites it in
/// place. A missing field reads as null.
class Row {
   public:
    using Field = std::pair<std::string, Value>;

    Row() = default;
    Row(std::initializer_list<Field> fields);

    [[nodiscard]] auto find(std::string_view name) const -> const Value*;
    [[nodiscard]] auto get(std::string_view name) const -> Value;
    [[nodiscard]] auto contains(std::string_view name) const -> bool {
        return find(name) != nullptr;
    }

    void set(std::string name, Value value);
    /// Copy every field of `other` into this row, overwriting on collision.
    void merge(const Row& other);

    [[nodiscard]] auto fields() const noexcept -> const std::vector<Field>& { return fields_; }
    [[nodiscard]] auto keys() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return fields_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return fields_.empty(); }

    auto operator==(const Row&) const -> bool = default;

   private:
    std::vector<Field> fields_;
};

using RowSet = std::vector<Row>;

}  // namespace pipit::runtime
