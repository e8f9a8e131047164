#include <pipit/codegen/lowering.hpp>
#include <pipit/expr/identifiers.hpp>
#include <pipit/graph/topology.hpp>
#include <pipit/runtime/csv.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <type_traits>
#include <unordered_set>

namespace pipit::codegen {

namespace {

auto number_text(double value) -> std::string {
    return fmt::format("{}", value);
}

auto is_comparison(expr::BinaryOp op) -> bool {
    switch (op) {
        case expr::BinaryOp::Eq:
        case expr::BinaryOp::Ne:
        case expr::BinaryOp::Lt:
        case expr::BinaryOp::Le:
        case expr::BinaryOp::Gt:
        case expr::BinaryOp::Ge:
            return true;
        default:
            return false;
    }
}

auto string_literal(const expr::Expr& node) -> const std::string* {
    if (const auto* literal = std::get_if<expr::LiteralExpr>(&node.node)) {
        return std::get_if<std::string>(&literal->value);
    }
    return nullptr;
}

auto number_literal(const expr::Expr& node) -> const double* {
    if (const auto* literal = std::get_if<expr::LiteralExpr>(&node.node)) {
        return std::get_if<double>(&literal->value);
    }
    return nullptr;
}

/// The operand compared against a `null` literal by `==` or `!=`, if any.
/// Such comparisons test for null in every backend.
auto null_comparison(const expr::BinaryExpr& node) -> const expr::Expr* {
    if (node.op != expr::BinaryOp::Eq && node.op != expr::BinaryOp::Ne) {
        return nullptr;
    }
    auto is_null_literal = [](const expr::Expr& side) {
        const auto* literal = std::get_if<expr::LiteralExpr>(&side.node);
        return literal != nullptr && std::holds_alternative<std::monostate>(literal->value);
    };
    if (is_null_literal(*node.right)) {
        return node.left.get();
    }
    if (is_null_literal(*node.left)) {
        return node.right.get();
    }
    return nullptr;
}

/// True when `+` over this operand concatenates.
auto is_textual(const expr::Expr& node) -> bool {
    if (string_literal(node) != nullptr) {
        return true;
    }
    if (const auto* call = std::get_if<expr::CallExpr>(&node.node)) {
        return call->function == expr::Function::String;
    }
    if (const auto* binary = std::get_if<expr::BinaryExpr>(&node.node)) {
        return binary->op == expr::BinaryOp::Add &&
               (is_textual(*binary->left) || is_textual(*binary->right));
    }
    return false;
}

auto is_compound(const expr::Expr& node) -> bool {
    return std::holds_alternative<expr::BinaryExpr>(node.node) ||
           std::holds_alternative<expr::UnaryExpr>(node.node) ||
           std::holds_alternative<expr::IsNullExpr>(node.node) ||
           std::holds_alternative<expr::ConditionalExpr>(node.node);
}

// ─── SQL lowering ─────────────────────────────────────────────────────────────

class SqlLowerer {
   public:
    SqlLowerer(bool predicate, IdentifierStyle style) : predicate_(predicate), style_(style) {}

    auto lower(const expr::Expr& node) -> std::string {
        return std::visit([this](const auto& n) { return lower_node(n); }, node.node);
    }

   private:
    auto nested(const expr::Expr& node) -> std::string {
        auto text = lower(node);
        return is_compound(node) ? fmt::format("({})", text) : text;
    }

    auto lower_node(const expr::IdentifierExpr& node) -> std::string {
        auto column = expr::quote_identifier(node.name);
        if (!predicate_ && style_ == IdentifierStyle::NumberAccessor) {
            return fmt::format("COALESCE(TRY_CAST({} AS DOUBLE), 0)", column);
        }
        return column;
    }

    auto lower_node(const expr::LiteralExpr& node) -> std::string {
        return std::visit(
            [](const auto& v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return "NULL";
                } else if constexpr (std::is_same_v<T, bool>) {
                    return v ? "TRUE" : "FALSE";
                } else if constexpr (std::is_same_v<T, double>) {
                    return number_text(v);
                } else {
                    return sql_string(v);
                }
            },
            node.value);
    }

    auto accessor_target(const expr::Expr& arg) -> std::string {
        if (const auto* name = string_literal(arg)) {
            return expr::quote_identifier(*name);
        }
        return nested(arg);
    }

    auto lower_node(const expr::CallExpr& node) -> std::string {
        switch (node.function) {
            case expr::Function::Number:
                return fmt::format("COALESCE(TRY_CAST({} AS DOUBLE), 0)",
                                   accessor_target(*node.args.front()));
            case expr::Function::String:
                return fmt::format("COALESCE(CAST({} AS VARCHAR), '')",
                                   accessor_target(*node.args.front()));
            case expr::Function::Boolean:
                return fmt::format("TRY_CAST({} AS BOOLEAN)", accessor_target(*node.args.front()));
            case expr::Function::Raw:
                return accessor_target(*node.args.front());
            case expr::Function::Round:
                return fmt::format("FLOOR({} + 0.5)", nested(*node.args.front()));
            default:
                break;
        }
        std::vector<std::string> args;
        for (const auto& arg : node.args) {
            args.push_back(lower(*arg));
        }
        const char* name = "ABS";
        switch (node.function) {
            case expr::Function::Floor:
                name = "FLOOR";
                break;
            case expr::Function::Ceil:
                name = "CEIL";
                break;
            case expr::Function::Min:
                name = "LEAST";
                break;
            case expr::Function::Max:
                name = "GREATEST";
                break;
            case expr::Function::Sqrt:
                name = "SQRT";
                break;
            case expr::Function::Pow:
                name = "POWER";
                break;
            case expr::Function::Log:
                name = "LN";
                break;
            case expr::Function::Exp:
                name = "EXP";
                break;
            default:
                break;
        }
        return fmt::format("{}({})", name, fmt::join(args, ", "));
    }

    auto lower_node(const expr::UnaryExpr& node) -> std::string {
        if (node.op == expr::UnaryOp::Not) {
            return fmt::format("NOT {}", nested(*node.expr));
        }
        return fmt::format("-{}", nested(*node.expr));
    }

    auto lower_node(const expr::BinaryExpr& node) -> std::string {
        if (const auto* operand = null_comparison(node)) {
            return fmt::format("{} IS {}NULL", nested(*operand),
                               node.op == expr::BinaryOp::Ne ? "NOT " : "");
        }
        const char* op = "+";
        switch (node.op) {
            case expr::BinaryOp::Add:
                op = is_textual(*node.left) || is_textual(*node.right) ? "||" : "+";
                break;
            case expr::BinaryOp::Sub:
                op = "-";
                break;
            case expr::BinaryOp::Mul:
                op = "*";
                break;
            case expr::BinaryOp::Div:
                op = "/";
                break;
            case expr::BinaryOp::Mod:
                op = "%";
                break;
            case expr::BinaryOp::Eq:
                op = "=";
                break;
            case expr::BinaryOp::Ne:
                op = "<>";
                break;
            case expr::BinaryOp::Lt:
                op = "<";
                break;
            case expr::BinaryOp::Le:
                op = "<=";
                break;
            case expr::BinaryOp::Gt:
                op = ">";
                break;
            case expr::BinaryOp::Ge:
                op = ">=";
                break;
            case expr::BinaryOp::And:
                op = "AND";
                break;
            case expr::BinaryOp::Or:
                op = "OR";
                break;
        }

        if (predicate_ && is_comparison(node.op)) {
            // Columns loaded from text compare as numbers against numeric literals.
            const auto* left_column = std::get_if<expr::IdentifierExpr>(&node.left->node);
            const auto* right_column = std::get_if<expr::IdentifierExpr>(&node.right->node);
            if (left_column != nullptr && number_literal(*node.right) != nullptr) {
                return fmt::format("TRY_CAST({} AS DOUBLE) {} {}",
                                   expr::quote_identifier(left_column->name), op,
                                   number_text(*number_literal(*node.right)));
            }
            if (right_column != nullptr && number_literal(*node.left) != nullptr) {
                return fmt::format("{} {} TRY_CAST({} AS DOUBLE)",
                                   number_text(*number_literal(*node.left)), op,
                                   expr::quote_identifier(right_column->name));
            }
        }
        return fmt::format("{} {} {}", nested(*node.left), op, nested(*node.right));
    }

    auto lower_node(const expr::IsNullExpr& node) -> std::string {
        return fmt::format("{} IS {}NULL", nested(*node.expr), node.negated ? "NOT " : "");
    }

    auto lower_node(const expr::ConditionalExpr& node) -> std::string {
        return fmt::format("CASE WHEN {} THEN {} ELSE {} END", lower(*node.condition),
                           lower(*node.then_branch), lower(*node.else_branch));
    }

    bool predicate_;
    IdentifierStyle style_;
};

// ─── Python lowering ──────────────────────────────────────────────────────────

enum class PythonContext : std::uint8_t {
    Query,
    Row,
};

class PythonLowerer {
   public:
    PythonLowerer(PythonContext context, IdentifierStyle style) : context_(context), style_(style) {}

    auto lower(const expr::Expr& node) -> std::string {
        return std::visit([this](const auto& n) { return lower_node(n); }, node.node);
    }

   private:
    auto nested(const expr::Expr& node) -> std::string {
        auto text = lower(node);
        return is_compound(node) ? fmt::format("({})", text) : text;
    }

    auto lower_node(const expr::IdentifierExpr& node) -> std::string {
        if (context_ == PythonContext::Query) {
            return expr::is_bare_identifier(node.name) ? node.name
                                                       : fmt::format("`{}`", node.name);
        }
        if (style_ == IdentifierStyle::NumberAccessor) {
            return fmt::format("_n(r, {})", python_string(node.name));
        }
        return fmt::format("r[{}]", python_string(node.name));
    }

    auto lower_node(const expr::LiteralExpr& node) -> std::string {
        return std::visit(
            [](const auto& v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return "None";
                } else if constexpr (std::is_same_v<T, bool>) {
                    return v ? "True" : "False";
                } else if constexpr (std::is_same_v<T, double>) {
                    return number_text(v);
                } else {
                    return python_string(v);
                }
            },
            node.value);
    }

    auto lower_node(const expr::CallExpr& node) -> std::string {
        std::vector<std::string> args;
        for (const auto& arg : node.args) {
            args.push_back(lower(*arg));
        }
        switch (node.function) {
            case expr::Function::Number:
                return fmt::format("_n(r, {})", args.front());
            case expr::Function::String:
                return fmt::format("_s(r, {})", args.front());
            case expr::Function::Boolean:
                return fmt::format("_b(r, {})", args.front());
            case expr::Function::Raw:
                return fmt::format("r.get({})", args.front());
            case expr::Function::Round:
                return fmt::format("math.floor({} + 0.5)", nested(*node.args.front()));
            case expr::Function::Abs:
                return fmt::format("abs({})", args.front());
            case expr::Function::Min:
                return fmt::format("min({})", fmt::join(args, ", "));
            case expr::Function::Max:
                return fmt::format("max({})", fmt::join(args, ", "));
            default:
                break;
        }
        return fmt::format("math.{}({})", expr::function_name(node.function),
                           fmt::join(args, ", "));
    }

    auto lower_node(const expr::UnaryExpr& node) -> std::string {
        if (node.op == expr::UnaryOp::Not) {
            return fmt::format("not {}", nested(*node.expr));
        }
        return fmt::format("-{}", nested(*node.expr));
    }

    auto lower_node(const expr::BinaryExpr& node) -> std::string {
        if (const auto* operand = null_comparison(node)) {
            return fmt::format("{}_isnull({})", node.op == expr::BinaryOp::Ne ? "not " : "",
                               lower(*operand));
        }
        if (node.op == expr::BinaryOp::Add &&
            (is_textual(*node.left) || is_textual(*node.right))) {
            return fmt::format("str({}) + str({})", lower(*node.left), lower(*node.right));
        }
        const char* op = "+";
        switch (node.op) {
            case expr::BinaryOp::Add:
                op = "+";
                break;
            case expr::BinaryOp::Sub:
                op = "-";
                break;
            case expr::BinaryOp::Mul:
                op = "*";
                break;
            case expr::BinaryOp::Div:
                op = "/";
                break;
            case expr::BinaryOp::Mod:
                op = "%";
                break;
            case expr::BinaryOp::Eq:
                op = "==";
                break;
            case expr::BinaryOp::Ne:
                op = "!=";
                break;
            case expr::BinaryOp::Lt:
                op = "<";
                break;
            case expr::BinaryOp::Le:
                op = "<=";
                break;
            case expr::BinaryOp::Gt:
                op = ">";
                break;
            case expr::BinaryOp::Ge:
                op = ">=";
                break;
            case expr::BinaryOp::And:
                op = "and";
                break;
            case expr::BinaryOp::Or:
                op = "or";
                break;
        }
        return fmt::format("{} {} {}", nested(*node.left), op, nested(*node.right));
    }

    auto lower_node(const expr::IsNullExpr& node) -> std::string {
        return fmt::format("{}_isnull({})", node.negated ? "not " : "", lower(*node.expr));
    }

    auto lower_node(const expr::ConditionalExpr& node) -> std::string {
        return fmt::format("{} if {} else {}", nested(*node.then_branch), nested(*node.condition),
                           nested(*node.else_branch));
    }

    PythonContext context_;
    IdentifierStyle style_;
};

}  // namespace

auto binding_names(const graph::Graph& graph, const std::vector<graph::NodeId>& order)
    -> BindingNames {
    BindingNames names;
    std::unordered_map<std::string, std::size_t> counts;
    std::unordered_set<std::string> taken;
    for (const auto& id : order) {
        const auto* node = graph.find(id);
        auto base = expr::slugify_label(node != nullptr ? node->label : std::string{});
        if (base.front() >= '0' && base.front() <= '9') {
            base = "node_" + base;
        }
        std::string name;
        do {
            const auto count = ++counts[base];
            name = count == 1 ? base : fmt::format("{}_{}", base, count);
        } while (taken.contains(name));
        taken.insert(name);
        names.emplace(id, std::move(name));
    }
    return names;
}

auto known_columns(const graph::Graph& graph, const graph::NodeId& id) -> std::vector<std::string> {
    const auto upstream = graph::ancestors_of(graph, id);
    std::vector<std::string> columns;
    std::unordered_set<std::string> seen;
    for (const auto& node : graph.nodes()) {
        if (node.kind() != graph::NodeKind::Source || !upstream.contains(node.id)) {
            continue;
        }
        const auto& content = node.as<graph::SourceConfig>().content;
        if (!content.has_value()) {
            continue;
        }
        for (auto& column : runtime::csv_header(*content)) {
            if (seen.insert(column).second) {
                columns.push_back(std::move(column));
            }
        }
    }
    return columns;
}

auto formula_identifier_style(std::string_view formula) -> IdentifierStyle {
    return expr::has_helper_calls(formula) ? IdentifierStyle::Field
                                           : IdentifierStyle::NumberAccessor;
}

auto lower_sql_predicate(const expr::Expr& predicate) -> std::string {
    return SqlLowerer(true, IdentifierStyle::Field).lower(predicate);
}

auto lower_sql_formula(const expr::Expr& formula, IdentifierStyle style) -> std::string {
    return SqlLowerer(false, style).lower(formula);
}

auto sql_string(std::string_view text) -> std::string {
    std::string out = "'";
    for (char ch : text) {
        if (ch == '\'') {
            out.push_back('\'');
        }
        out.push_back(ch);
    }
    out.push_back('\'');
    return out;
}

auto fits_query(const expr::Expr& predicate) -> bool {
    return std::visit(
        [](const auto& node) -> bool {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, expr::IdentifierExpr> ||
                          std::is_same_v<T, expr::LiteralExpr>) {
                return true;
            } else if constexpr (std::is_same_v<T, expr::UnaryExpr>) {
                return fits_query(*node.expr);
            } else if constexpr (std::is_same_v<T, expr::BinaryExpr>) {
                if (null_comparison(node) != nullptr) {
                    return false;
                }
                if (node.op == expr::BinaryOp::Add &&
                    (is_textual(*node.left) || is_textual(*node.right))) {
                    return false;
                }
                return fits_query(*node.left) && fits_query(*node.right);
            } else {
                return false;
            }
        },
        predicate.node);
}

auto lower_query(const expr::Expr& predicate) -> std::string {
    return PythonLowerer(PythonContext::Query, IdentifierStyle::Field).lower(predicate);
}

auto lower_python(const expr::Expr& expr, IdentifierStyle style) -> std::string {
    return PythonLowerer(PythonContext::Row, style).lower(expr);
}

auto python_string(std::string_view text) -> std::string {
    std::string out = "'";
    for (char ch : text) {
        switch (ch) {
            case '\\':
                out.append("\\\\");
                break;
            case '\'':
                out.append("\\'");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            default:
                out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

auto python_list(const std::vector<std::string>& items) -> std::string {
    std::vector<std::string> quoted;
    quoted.reserve(items.size());
    for (const auto& item : items) {
        quoted.push_back(python_string(item));
    }
    return fmt::format("[{}]", fmt::join(quoted, ", "));
}

}  // namespace pipit::codegen
