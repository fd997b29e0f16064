//
// Lumata expression tree
//
// Closed sum types for expressions, patterns and do-statements. Each node
// exclusively owns its children, so trees are move-only and acyclic.
//

#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lumata::ast {
    struct expr;
    struct pattern;

    // -----------------------------
    // Operators
    // -----------------------------
    enum class binary_operator {
        // Arithmetic
        add, subtract, multiply, divide, modulo, power,
        // Comparison
        equal, not_equal, less_than, less_equal, greater_than, greater_equal,
        // Logical
        logical_and, logical_or,
        // Lists
        cons, append,
        // Functions
        compose, pipe
    };

    enum class unary_operator {
        negate,
        logical_not,
        length,
        head,
        tail,
        reverse
    };

    /// Tag name used in serialized trees ("Add", "Negate", ...).
    /// Returns nullopt for a value outside the enumeration.
    std::optional<std::string_view> operator_name(binary_operator op);
    std::optional<std::string_view> operator_name(unary_operator op);

    std::optional<binary_operator> parse_binary_operator(std::string_view name);
    std::optional<unary_operator> parse_unary_operator(std::string_view name);

    // -----------------------------
    // Pattern node definitions
    // -----------------------------
    struct wildcard_pattern {
    };

    struct variable_pattern {
        std::string name;
    };

    // value must be a literal expression
    struct literal_pattern {
        std::unique_ptr<expr> value;
    };

    struct constructor_pattern {
        std::string constructor;
        std::vector<pattern> args;
    };

    struct field_pattern {
        std::string name;
        std::unique_ptr<pattern> value;
    };

    struct record_pattern {
        std::vector<field_pattern> fields;
    };

    struct list_pattern {
        std::vector<pattern> elements;
        std::unique_ptr<pattern> tail; // null when absent
    };

    struct as_pattern {
        std::string name;
        std::unique_ptr<pattern> inner;
    };

    struct or_pattern {
        std::vector<pattern> alternatives;
    };

    using pattern_node = std::variant <
        wildcard_pattern,
        variable_pattern,
        literal_pattern,
        constructor_pattern,
        record_pattern,
        list_pattern,
        as_pattern,
        or_pattern
    >;

    struct pattern {
        pattern_node node;
    };

    // -----------------------------
    // Expression node definitions
    // -----------------------------

    // Literals
    struct int_literal {
        int64_t value;
    };

    struct string_literal {
        std::string value;
    };

    struct bool_literal {
        bool value;
    };

    struct list_literal {
        std::vector<expr> elements;
    };

    // Named field inside record literals, creations and updates
    struct field_value {
        std::string name;
        std::unique_ptr<expr> value;
    };

    struct record_literal {
        std::vector<field_value> fields;
    };

    // Identifiers
    struct variable {
        std::string name;
    };

    struct qualified_identifier {
        std::optional<std::string> ns;
        std::string name;
    };

    // Operators
    struct binary_op {
        binary_operator op;
        std::unique_ptr<expr> left;
        std::unique_ptr<expr> right;
    };

    struct unary_op {
        unary_operator op;
        std::unique_ptr<expr> operand;
    };

    // Calls
    struct function_call {
        std::unique_ptr<expr> function;
        std::vector<expr> arguments;
    };

    struct constructor_call {
        std::string constructor;
        std::vector<expr> arguments;
    };

    // Record operations
    struct record_creation {
        std::string record_type;
        std::vector<field_value> fields;
    };

    struct record_update {
        std::unique_ptr<expr> target;
        std::vector<field_value> updates;
    };

    struct field_access {
        std::unique_ptr<expr> target;
        std::string field;
    };

    struct list_access {
        std::unique_ptr<expr> target;
        std::unique_ptr<expr> index;
    };

    // Control forms
    struct if_expr {
        std::unique_ptr<expr> condition;
        std::unique_ptr<expr> then_branch;
        std::unique_ptr<expr> else_branch;
    };

    struct let_binding {
        std::string name;
        std::unique_ptr<expr> value;
    };

    struct let_expr {
        std::vector<let_binding> bindings;
        std::unique_ptr<expr> body;
    };

    struct case_arm {
        pattern pat;
        std::unique_ptr<expr> guard; // null when unguarded
        std::unique_ptr<expr> result;
    };

    struct case_expr {
        std::unique_ptr<expr> scrutinee;
        std::vector<case_arm> arms;
    };

    struct lambda_param {
        std::string name;
        std::string type_name; // empty when untyped
    };

    struct lambda {
        std::vector<lambda_param> params;
        std::unique_ptr<expr> body;
    };

    struct catch_arm {
        pattern pat;
        std::unique_ptr<expr> handler;
    };

    struct try_expr {
        std::unique_ptr<expr> body;
        std::vector<catch_arm> handlers;
    };

    struct bind_statement {
        std::string name;
        std::unique_ptr<expr> value;
    };

    struct expression_statement {
        std::unique_ptr<expr> value;
    };

    using do_statement = std::variant <
        bind_statement,
        expression_statement
    >;

    struct do_block {
        std::vector<do_statement> statements;
        std::unique_ptr<expr> result;
    };

    // Collection operators
    struct map_expr {
        std::unique_ptr<expr> collection;
        std::string iterator;
        std::unique_ptr<expr> transform;
    };

    struct filter_expr {
        std::unique_ptr<expr> collection;
        std::string iterator;
        std::unique_ptr<expr> predicate;
    };

    struct fold_expr {
        std::unique_ptr<expr> collection;
        std::unique_ptr<expr> initial;
        std::string acc_name;
        std::string iterator;
        std::unique_ptr<expr> transform;
    };

    struct type_annotation {
        std::unique_ptr<expr> value;
        std::string type_name;
    };

    using expr_node = std::variant <
        int_literal,
        string_literal,
        bool_literal,
        list_literal,
        record_literal,
        variable,
        qualified_identifier,
        binary_op,
        unary_op,
        function_call,
        constructor_call,
        record_creation,
        record_update,
        field_access,
        list_access,
        if_expr,
        let_expr,
        case_expr,
        lambda,
        try_expr,
        do_block,
        map_expr,
        filter_expr,
        fold_expr,
        type_annotation
    >;

    struct expr {
        expr_node node;
    };

    // -----------------------------
    // Compilation units
    // -----------------------------
    struct function_def {
        std::string name;
        std::vector<lambda_param> params;
        std::string result_type; // empty when not annotated
        expr body;
    };

    struct module_def {
        std::string name;
        std::vector<function_def> functions;
    };
}
