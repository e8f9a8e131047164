#include <pipit/runtime/row.hpp>

#include <fmt/format.h>

#include <cmath>
#include <type_traits>

namespace pipit::runtime {

auto to_display(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v)) {
                    return "NaN";
                }
                if (std::isinf(v)) {
                    return v > 0 ? "Infinity" : "-Infinity";
                }
                if (v == 0.0) {
                    return "0";
                }
                return fmt::format("{}", v);
            } else {
                return v;
            }
        },
        value);
}

Row::Row(std::initializer_list<Field> fields) {
    for (const auto& [name, value] : fields) {
        set(name, value);
    }
}

auto Row::find(std::string_view name) const -> const Value* {
    for (const auto& field : fields_) {
        if (field.first == name) {
            return &field.second;
        }
    }
    return nullptr;
}

auto Row::get(std::string_view name) const -> Value {
    if (const auto* value = find(name)) {
        return *value;
    }
    return std::monostate{};
}

void Row::set(std::string name, Value value) {
    for (auto& field : fields_) {
        if (field.first == name) {
            field.second = std::move(value);
            return;
        }
    }
    fields_.emplace_back(std::move(name), std::move(value));
}

void Row::merge(const Row& other) {
    for (const auto& [name, value] : other.fields_) {
        set(name, value);
    }
}

auto Row::keys() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(fields_.size());
    for (const auto& field : fields_) {
        out.push_back(field.first);
    }
    return out;
}

}  // namespace pipit::runtime
