#include <lumata/ast_factory.hh>

namespace lumata::ast {

namespace {
    std::unique_ptr<expr> boxed(expr e) {
        return std::make_unique<expr>(std::move(e));
    }

    std::unique_ptr<pattern> boxed(pattern p) {
        return std::make_unique<pattern>(std::move(p));
    }
}

// ============================================================================
// Expressions
// ============================================================================

expr make_int(int64_t value) {
    return expr{int_literal{value}};
}

expr make_string(std::string value) {
    return expr{string_literal{std::move(value)}};
}

expr make_bool(bool value) {
    return expr{bool_literal{value}};
}

expr make_list(std::vector<expr> elements) {
    return expr{list_literal{std::move(elements)}};
}

expr make_record(std::vector<field_value> fields) {
    return expr{record_literal{std::move(fields)}};
}

field_value make_field(std::string name, expr value) {
    return field_value{std::move(name), boxed(std::move(value))};
}

expr make_var(std::string name) {
    return expr{variable{std::move(name)}};
}

expr make_qualified(std::optional<std::string> ns, std::string name) {
    return expr{qualified_identifier{std::move(ns), std::move(name)}};
}

expr make_binary(binary_operator op, expr left, expr right) {
    return expr{binary_op{op, boxed(std::move(left)), boxed(std::move(right))}};
}

expr make_unary(unary_operator op, expr operand) {
    return expr{unary_op{op, boxed(std::move(operand))}};
}

expr make_call(expr function, std::vector<expr> arguments) {
    return expr{function_call{boxed(std::move(function)), std::move(arguments)}};
}

expr make_constructor_call(std::string constructor, std::vector<expr> arguments) {
    return expr{constructor_call{std::move(constructor), std::move(arguments)}};
}

expr make_record_creation(std::string record_type, std::vector<field_value> fields) {
    return expr{record_creation{std::move(record_type), std::move(fields)}};
}

expr make_record_update(expr target, std::vector<field_value> updates) {
    return expr{record_update{boxed(std::move(target)), std::move(updates)}};
}

expr make_field_access(expr target, std::string field) {
    return expr{field_access{boxed(std::move(target)), std::move(field)}};
}

expr make_list_access(expr target, expr index) {
    return expr{list_access{boxed(std::move(target)), boxed(std::move(index))}};
}

expr make_if(expr condition, expr then_branch, expr else_branch) {
    return expr{if_expr{boxed(std::move(condition)),
                        boxed(std::move(then_branch)),
                        boxed(std::move(else_branch))}};
}

let_binding make_let_binding(std::string name, expr value) {
    return let_binding{std::move(name), boxed(std::move(value))};
}

expr make_let(std::vector<let_binding> bindings, expr body) {
    return expr{let_expr{std::move(bindings), boxed(std::move(body))}};
}

case_arm make_arm(pattern pat, expr result) {
    return case_arm{std::move(pat), nullptr, boxed(std::move(result))};
}

case_arm make_guarded_arm(pattern pat, expr guard, expr result) {
    return case_arm{std::move(pat), boxed(std::move(guard)), boxed(std::move(result))};
}

expr make_case(expr scrutinee, std::vector<case_arm> arms) {
    return expr{case_expr{boxed(std::move(scrutinee)), std::move(arms)}};
}

expr make_lambda(std::vector<lambda_param> params, expr body) {
    return expr{lambda{std::move(params), boxed(std::move(body))}};
}

catch_arm make_catch(pattern pat, expr handler) {
    return catch_arm{std::move(pat), boxed(std::move(handler))};
}

expr make_try(expr body, std::vector<catch_arm> handlers) {
    return expr{try_expr{boxed(std::move(body)), std::move(handlers)}};
}

do_statement make_bind(std::string name, expr value) {
    return bind_statement{std::move(name), boxed(std::move(value))};
}

do_statement make_effect(expr value) {
    return expression_statement{boxed(std::move(value))};
}

expr make_do(std::vector<do_statement> statements, expr result) {
    return expr{do_block{std::move(statements), boxed(std::move(result))}};
}

expr make_map(expr collection, std::string iterator, expr transform) {
    return expr{map_expr{boxed(std::move(collection)), std::move(iterator),
                         boxed(std::move(transform))}};
}

expr make_filter(expr collection, std::string iterator, expr predicate) {
    return expr{filter_expr{boxed(std::move(collection)), std::move(iterator),
                            boxed(std::move(predicate))}};
}

expr make_fold(expr collection, expr initial, std::string acc_name,
               std::string iterator, expr transform) {
    return expr{fold_expr{boxed(std::move(collection)), boxed(std::move(initial)),
                          std::move(acc_name), std::move(iterator),
                          boxed(std::move(transform))}};
}

expr make_annotation(expr value, std::string type_name) {
    return expr{type_annotation{boxed(std::move(value)), std::move(type_name)}};
}

// ============================================================================
// Patterns
// ============================================================================

pattern make_wildcard_pattern() {
    return pattern{wildcard_pattern{}};
}

pattern make_variable_pattern(std::string name) {
    return pattern{variable_pattern{std::move(name)}};
}

pattern make_literal_pattern(expr value) {
    return pattern{literal_pattern{boxed(std::move(value))}};
}

pattern make_constructor_pattern(std::string constructor, std::vector<pattern> args) {
    return pattern{constructor_pattern{std::move(constructor), std::move(args)}};
}

field_pattern make_field_pattern(std::string name, pattern value) {
    return field_pattern{std::move(name), boxed(std::move(value))};
}

pattern make_record_pattern(std::vector<field_pattern> fields) {
    return pattern{record_pattern{std::move(fields)}};
}

pattern make_list_pattern(std::vector<pattern> elements) {
    return pattern{list_pattern{std::move(elements), nullptr}};
}

pattern make_list_pattern(std::vector<pattern> elements, pattern tail) {
    return pattern{list_pattern{std::move(elements), boxed(std::move(tail))}};
}

pattern make_as_pattern(std::string name, pattern inner) {
    return pattern{as_pattern{std::move(name), boxed(std::move(inner))}};
}

pattern make_or_pattern(std::vector<pattern> alternatives) {
    return pattern{or_pattern{std::move(alternatives)}};
}

}  // namespace lumata::ast
