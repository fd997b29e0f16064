//
// Expression tree construction helpers
//
// Free functions that build well-formed nodes. Used by the tree loader and by
// hand-built fixtures; every helper takes ownership of its children.
//

#pragma once

#include <lumata/ast.hh>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lumata::ast {

/// Build a vector of move-only nodes: list_of<expr>(make_int(1), make_int(2))
template<typename T, typename... Ts>
std::vector<T> list_of(Ts&&... items) {
    std::vector<T> result;
    result.reserve(sizeof...(items));
    (result.push_back(std::forward<Ts>(items)), ...);
    return result;
}

// ============================================================================
// Expressions
// ============================================================================

expr make_int(int64_t value);
expr make_string(std::string value);
expr make_bool(bool value);
expr make_list(std::vector<expr> elements);
expr make_record(std::vector<field_value> fields);

field_value make_field(std::string name, expr value);

expr make_var(std::string name);
expr make_qualified(std::optional<std::string> ns, std::string name);

expr make_binary(binary_operator op, expr left, expr right);
expr make_unary(unary_operator op, expr operand);

expr make_call(expr function, std::vector<expr> arguments);
expr make_constructor_call(std::string constructor, std::vector<expr> arguments);

expr make_record_creation(std::string record_type, std::vector<field_value> fields);
expr make_record_update(expr target, std::vector<field_value> updates);
expr make_field_access(expr target, std::string field);
expr make_list_access(expr target, expr index);

expr make_if(expr condition, expr then_branch, expr else_branch);

let_binding make_let_binding(std::string name, expr value);
expr make_let(std::vector<let_binding> bindings, expr body);

case_arm make_arm(pattern pat, expr result);
case_arm make_guarded_arm(pattern pat, expr guard, expr result);
expr make_case(expr scrutinee, std::vector<case_arm> arms);

expr make_lambda(std::vector<lambda_param> params, expr body);

catch_arm make_catch(pattern pat, expr handler);
expr make_try(expr body, std::vector<catch_arm> handlers);

do_statement make_bind(std::string name, expr value);
do_statement make_effect(expr value);
expr make_do(std::vector<do_statement> statements, expr result);

expr make_map(expr collection, std::string iterator, expr transform);
expr make_filter(expr collection, std::string iterator, expr predicate);
expr make_fold(expr collection, expr initial, std::string acc_name,
               std::string iterator, expr transform);

expr make_annotation(expr value, std::string type_name);

// ============================================================================
// Patterns
// ============================================================================

pattern make_wildcard_pattern();
pattern make_variable_pattern(std::string name);
pattern make_literal_pattern(expr value);
pattern make_constructor_pattern(std::string constructor, std::vector<pattern> args);

field_pattern make_field_pattern(std::string name, pattern value);
pattern make_record_pattern(std::vector<field_pattern> fields);

pattern make_list_pattern(std::vector<pattern> elements);
pattern make_list_pattern(std::vector<pattern> elements, pattern tail);

pattern make_as_pattern(std::string name, pattern inner);
pattern make_or_pattern(std::vector<pattern> alternatives);

}  // namespace lumata::ast
