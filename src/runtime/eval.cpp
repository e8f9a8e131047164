#include <pipit/runtime/coerce.hpp>
#include <pipit/runtime/eval.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>
#include <vector>

namespace pipit::runtime {

namespace {

using Fn = CompiledExpr::Fn;

auto loose_equals(const Value& left, const Value& right) -> bool {
    const bool left_null = is_null(left);
    const bool right_null = is_null(right);
    if (left_null || right_null) {
        return left_null && right_null;
    }
    if (left.index() == right.index()) {
        if (const auto* a = std::get_if<double>(&left)) {
            return *a == std::get<double>(right);
        }
        return left == right;
    }
    // Mixed types compare as numbers; non-numeric text never equals a number.
    return to_arithmetic(left) == to_arithmetic(right);
}

auto ordered(expr::BinaryOp op, const Value& left, const Value& right) -> bool {
    if (is_null(left) || is_null(right)) {
        return false;
    }
    const auto* left_text = std::get_if<std::string>(&left);
    const auto* right_text = std::get_if<std::string>(&right);
    int cmp = 0;
    if (left_text != nullptr && right_text != nullptr) {
        cmp = left_text->compare(*right_text);
    } else {
        const double a = to_arithmetic(left);
        const double b = to_arithmetic(right);
        if (std::isnan(a) || std::isnan(b)) {
            return false;
        }
        cmp = a < b ? -1 : (a > b ? 1 : 0);
    }
    switch (op) {
        case expr::BinaryOp::Lt:
            return cmp < 0;
        case expr::BinaryOp::Le:
            return cmp <= 0;
        case expr::BinaryOp::Gt:
            return cmp > 0;
        case expr::BinaryOp::Ge:
            return cmp >= 0;
        default:
            break;
    }
    return false;
}

auto arithmetic(expr::BinaryOp op, const Value& left, const Value& right) -> Value {
    if (op == expr::BinaryOp::Add &&
        (std::holds_alternative<std::string>(left) || std::holds_alternative<std::string>(right))) {
        return to_display(left) + to_display(right);
    }
    const double a = to_arithmetic(left);
    const double b = to_arithmetic(right);
    switch (op) {
        case expr::BinaryOp::Add:
            return a + b;
        case expr::BinaryOp::Sub:
            return a - b;
        case expr::BinaryOp::Mul:
            return a * b;
        case expr::BinaryOp::Div:
            return a / b;
        case expr::BinaryOp::Mod:
            return std::fmod(a, b);
        default:
            break;
    }
    return std::numeric_limits<double>::quiet_NaN();
}

auto apply_math(expr::Function function, const std::vector<Value>& args) -> Value {
    const double x = to_arithmetic(args.front());
    switch (function) {
        case expr::Function::Abs:
            return std::fabs(x);
        case expr::Function::Round:
            return std::floor(x + 0.5);
        case expr::Function::Floor:
            return std::floor(x);
        case expr::Function::Ceil:
            return std::ceil(x);
        case expr::Function::Sqrt:
            return std::sqrt(x);
        case expr::Function::Log:
            return std::log(x);
        case expr::Function::Exp:
            return std::exp(x);
        case expr::Function::Pow:
            return std::pow(x, to_arithmetic(args[1]));
        case expr::Function::Min:
        case expr::Function::Max: {
            double best = x;
            for (std::size_t i = 1; i < args.size(); ++i) {
                const double candidate = to_arithmetic(args[i]);
                if (std::isnan(candidate) || std::isnan(best)) {
                    best = std::numeric_limits<double>::quiet_NaN();
                    continue;
                }
                best = function == expr::Function::Min ? std::min(best, candidate)
                                                       : std::max(best, candidate);
            }
            return best;
        }
        default:
            break;
    }
    return std::numeric_limits<double>::quiet_NaN();
}

auto compile_node(const expr::Expr& node, EvalMode mode) -> Fn;

auto compile_call(const expr::CallExpr& call, EvalMode mode) -> Fn {
    std::vector<Fn> args;
    args.reserve(call.args.size());
    for (const auto& arg : call.args) {
        args.push_back(compile_node(*arg, mode));
    }
    const auto function = call.function;

    if (expr::is_accessor(function)) {
        return [function, key_fn = std::move(args.front())](const Row& row) -> EvalResult {
            auto key = key_fn(row);
            if (!key) {
                return key;
            }
            const Value cell = row.get(to_display(*key));
            switch (function) {
                case expr::Function::Number:
                    return accessor_number(cell);
                case expr::Function::String:
                    return accessor_string(cell);
                case expr::Function::Boolean:
                    return accessor_boolean(cell);
                default:
                    return cell;
            }
        };
    }

    return [function, args = std::move(args)](const Row& row) -> EvalResult {
        std::vector<Value> values;
        values.reserve(args.size());
        for (const auto& arg : args) {
            auto value = arg(row);
            if (!value) {
                return value;
            }
            values.push_back(std::move(*value));
        }
        return apply_math(function, values);
    };
}

auto compile_binary(const expr::BinaryExpr& binary, EvalMode mode) -> Fn {
    auto left = compile_node(*binary.left, mode);
    auto right = compile_node(*binary.right, mode);
    const auto op = binary.op;

    switch (op) {
        case expr::BinaryOp::And:
        case expr::BinaryOp::Or:
            // Short-circuit and yield the deciding operand.
            return [op, left = std::move(left), right = std::move(right)](const Row& row) -> EvalResult {
                auto lhs = left(row);
                if (!lhs) {
                    return lhs;
                }
                const bool decided = op == expr::BinaryOp::And ? !truthy(*lhs) : truthy(*lhs);
                if (decided) {
                    return lhs;
                }
                return right(row);
            };
        default:
            break;
    }

    return [op, left = std::move(left), right = std::move(right)](const Row& row) -> EvalResult {
        auto lhs = left(row);
        if (!lhs) {
            return lhs;
        }
        auto rhs = right(row);
        if (!rhs) {
            return rhs;
        }
        switch (op) {
            case expr::BinaryOp::Eq:
                return loose_equals(*lhs, *rhs);
            case expr::BinaryOp::Ne:
                return !loose_equals(*lhs, *rhs);
            case expr::BinaryOp::Lt:
            case expr::BinaryOp::Le:
            case expr::BinaryOp::Gt:
            case expr::BinaryOp::Ge:
                return ordered(op, *lhs, *rhs);
            default:
                return arithmetic(op, *lhs, *rhs);
        }
    };
}

auto compile_node(const expr::Expr& node, EvalMode mode) -> Fn {
    return std::visit(
        [mode](const auto& n) -> Fn {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, expr::LiteralExpr>) {
                Value value = std::visit([](const auto& v) -> Value { return v; }, n.value);
                return [value = std::move(value)](const Row&) -> EvalResult { return value; };
            } else if constexpr (std::is_same_v<T, expr::IdentifierExpr>) {
                if (mode == EvalMode::Compute) {
                    return [name = n.name](const Row&) -> EvalResult {
                        return std::unexpected(EvalError{fmt::format("{} is not defined", name)});
                    };
                }
                return [name = n.name](const Row& row) -> EvalResult {
                    if (const auto* value = row.find(name)) {
                        return *value;
                    }
                    return std::unexpected(EvalError{fmt::format("{} is not defined", name)});
                };
            } else if constexpr (std::is_same_v<T, expr::CallExpr>) {
                return compile_call(n, mode);
            } else if constexpr (std::is_same_v<T, expr::UnaryExpr>) {
                auto operand = compile_node(*n.expr, mode);
                if (n.op == expr::UnaryOp::Not) {
                    return [operand = std::move(operand)](const Row& row) -> EvalResult {
                        auto value = operand(row);
                        if (!value) {
                            return value;
                        }
                        return !truthy(*value);
                    };
                }
                return [operand = std::move(operand)](const Row& row) -> EvalResult {
                    auto value = operand(row);
                    if (!value) {
                        return value;
                    }
                    return -to_arithmetic(*value);
                };
            } else if constexpr (std::is_same_v<T, expr::BinaryExpr>) {
                return compile_binary(n, mode);
            } else if constexpr (std::is_same_v<T, expr::IsNullExpr>) {
                auto operand = compile_node(*n.expr, mode);
                return [operand = std::move(operand), negated = n.negated](const Row& row) -> EvalResult {
                    auto value = operand(row);
                    if (!value) {
                        return value;
                    }
                    return is_null(*value) != negated;
                };
            } else {
                auto condition = compile_node(*n.condition, mode);
                auto then_branch = compile_node(*n.then_branch, mode);
                auto else_branch = compile_node(*n.else_branch, mode);
                return [condition = std::move(condition), then_branch = std::move(then_branch),
                        else_branch = std::move(else_branch)](const Row& row) -> EvalResult {
                    auto value = condition(row);
                    if (!value) {
                        return value;
                    }
                    return truthy(*value) ? then_branch(row) : else_branch(row);
                };
            }
        },
        node.node);
}

}  // namespace

auto CompiledExpr::compile(const expr::Expr& ast, EvalMode mode) -> CompiledExpr {
    return CompiledExpr(compile_node(ast, mode));
}

auto CompiledExpr::compile(std::string_view text, EvalMode mode)
    -> std::expected<CompiledExpr, expr::ParseError> {
    auto ast = expr::parse(text);
    if (!ast) {
        return std::unexpected(ast.error());
    }
    return compile(**ast, mode);
}

auto CompiledExpr::test(const Row& row) const -> std::expected<bool, EvalError> {
    auto value = fn_(row);
    if (!value) {
        return std::unexpected(value.error());
    }
    return truthy(*value);
}

}  // namespace pipit::runtime
