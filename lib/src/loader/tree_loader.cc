#include <lumata/loader/tree_loader.hh>
#include <lumata/ast_factory.hh>
#include <lumata/codegen.hh>
#include <fstream>
#include <sstream>

namespace lumata::loader {

namespace {
    using fkyaml::node;

    fkyaml::node parse_document(const std::string& text, const std::string& origin) {
        try {
            return fkyaml::node::deserialize(text);
        } catch (const std::exception& e) {
            throw tree_load_error("", "Failed to parse YAML (" + origin + "): " + std::string(e.what()));
        }
    }

    std::string read_file(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw tree_load_error("", "Failed to open file: " + path);
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::string kind_of(const node& n, const char* what) {
        if (!n.is_mapping()) {
            throw tree_load_error("", std::string(what) + " must be a mapping with a 'kind' field");
        }
        if (!n.contains("kind") || !n["kind"].is_string()) {
            throw tree_load_error("", std::string(what) + " is missing a string 'kind' field");
        }
        return n["kind"].get_value<std::string>();
    }

    // Absent and explicit null are treated alike
    bool has(const node& n, const char* key) {
        return n.contains(key) && !n[key].is_null();
    }

    const node& require(const node& n, const std::string& kind, const char* key) {
        if (!has(n, key)) {
            throw tree_load_error(kind, std::string("missing field '") + key + "'");
        }
        return n[key];
    }

    std::string require_string(const node& n, const std::string& kind, const char* key) {
        const node& value = require(n, kind, key);
        if (!value.is_string()) {
            throw tree_load_error(kind, std::string("field '") + key + "' must be a string");
        }
        return value.get_value<std::string>();
    }

    std::string mapping_key(const node& key, const std::string& kind) {
        if (!key.is_string()) {
            throw tree_load_error(kind, "record field names must be strings");
        }
        return key.get_value<std::string>();
    }

    std::string optional_string(const node& n, const std::string& kind, const char* key) {
        if (!has(n, key)) {
            return {};
        }
        return require_string(n, kind, key);
    }

    const node& require_sequence(const node& n, const std::string& kind, const char* key) {
        const node& value = require(n, kind, key);
        if (!value.is_sequence()) {
            throw tree_load_error(kind, std::string("field '") + key + "' must be a sequence");
        }
        return value;
    }

    ast::binary_operator binary_operator_of(const node& n, const std::string& kind) {
        std::string name = require_string(n, kind, "operator");
        auto op = ast::parse_binary_operator(name);
        if (!op) {
            throw codegen::unknown_operator_error("binary", name);
        }
        return *op;
    }

    ast::unary_operator unary_operator_of(const node& n, const std::string& kind) {
        std::string name = require_string(n, kind, "operator");
        auto op = ast::parse_unary_operator(name);
        if (!op) {
            throw codegen::unknown_operator_error("unary", name);
        }
        return *op;
    }
}

// ============================================================================
// Public API
// ============================================================================

ast::expr TreeLoader::load_expression_file(const std::string& path) const {
    return build_expression(parse_document(read_file(path), path));
}

ast::expr TreeLoader::load_expression(const std::string& text) const {
    return build_expression(parse_document(text, "<string>"));
}

ast::module_def TreeLoader::load_module_file(const std::string& path) const {
    return build_module(parse_document(read_file(path), path));
}

ast::module_def TreeLoader::load_module(const std::string& text) const {
    return build_module(parse_document(text, "<string>"));
}

ast::expr TreeLoader::build_expression(const fkyaml::node& root) const {
    if (root.is_mapping() && root.contains("expression") && !root.contains("kind")) {
        return read_expr(root["expression"]);
    }
    return read_expr(root);
}

ast::module_def TreeLoader::build_module(const fkyaml::node& root) const {
    if (!root.is_mapping()) {
        throw tree_load_error("", "module document must be a mapping");
    }

    ast::module_def module;
    module.name = require_string(root, "module", "module");

    if (has(root, "functions")) {
        const node& functions = require_sequence(root, "module", "functions");
        for (size_t i = 0; i < functions.size(); ++i) {
            module.functions.push_back(read_function(functions[i]));
        }
    }

    return module;
}

// ============================================================================
// Private: Nodes
// ============================================================================

ast::function_def TreeLoader::read_function(const fkyaml::node& n) const {
    if (!n.is_mapping()) {
        throw tree_load_error("function", "function entry must be a mapping");
    }

    ast::function_def fn;
    fn.name = require_string(n, "function", "name");
    if (has(n, "params")) {
        fn.params = read_params(n, "function " + fn.name, "params");
    }
    fn.result_type = optional_string(n, "function " + fn.name, "result");
    fn.body = read_expr(require(n, "function " + fn.name, "body"));
    return fn;
}

ast::expr TreeLoader::read_expr(const fkyaml::node& n) const {
    using namespace ast;
    const std::string kind = kind_of(n, "expression node");

    // Literals
    if (kind == "IntLiteral") {
        const node& value = require(n, kind, "value");
        if (!value.is_integer()) {
            throw tree_load_error(kind, "field 'value' must be an integer");
        }
        return make_int(value.get_value<std::int64_t>());
    }
    if (kind == "StringLiteral") {
        return make_string(require_string(n, kind, "value"));
    }
    if (kind == "BoolLiteral") {
        const node& value = require(n, kind, "value");
        if (!value.is_boolean()) {
            throw tree_load_error(kind, "field 'value' must be a boolean");
        }
        return make_bool(value.get_value<bool>());
    }
    if (kind == "ListLiteral") {
        return make_list(has(n, "elements") ? read_expr_list(n, kind, "elements") : std::vector<expr>{});
    }
    if (kind == "RecordLiteral") {
        return make_record(has(n, "fields") ? read_fields(n, kind, "fields") : std::vector<field_value>{});
    }

    // Identifiers
    if (kind == "Variable") {
        return make_var(require_string(n, kind, "name"));
    }
    if (kind == "QualifiedIdentifier") {
        std::optional<std::string> ns;
        if (has(n, "namespace")) {
            ns = require_string(n, kind, "namespace");
        }
        return make_qualified(std::move(ns), require_string(n, kind, "name"));
    }

    // Operators
    if (kind == "BinaryOp") {
        auto op = binary_operator_of(n, kind);
        return make_binary(op, read_expr(require(n, kind, "left")), read_expr(require(n, kind, "right")));
    }
    if (kind == "UnaryOp") {
        auto op = unary_operator_of(n, kind);
        return make_unary(op, read_expr(require(n, kind, "operand")));
    }

    // Calls and record operations
    if (kind == "FunctionCall") {
        return make_call(read_expr(require(n, kind, "function")),
                         has(n, "arguments") ? read_expr_list(n, kind, "arguments") : std::vector<expr>{});
    }
    if (kind == "ConstructorCall") {
        return make_constructor_call(require_string(n, kind, "constructor"),
                                     has(n, "arguments") ? read_expr_list(n, kind, "arguments")
                                                         : std::vector<expr>{});
    }
    if (kind == "RecordCreation") {
        return make_record_creation(require_string(n, kind, "record_type"),
                                    has(n, "fields") ? read_fields(n, kind, "fields")
                                                     : std::vector<field_value>{});
    }
    if (kind == "RecordUpdate") {
        return make_record_update(read_expr(require(n, kind, "target")), read_fields(n, kind, "updates"));
    }
    if (kind == "FieldAccess") {
        return make_field_access(read_expr(require(n, kind, "target")), require_string(n, kind, "field"));
    }
    if (kind == "ListAccess") {
        return make_list_access(read_expr(require(n, kind, "target")), read_expr(require(n, kind, "index")));
    }

    // Control forms
    if (kind == "If") {
        return make_if(read_expr(require(n, kind, "condition")),
                       read_expr(require(n, kind, "then_expr")),
                       read_expr(require(n, kind, "else_expr")));
    }
    if (kind == "Let") {
        std::vector<let_binding> bindings;
        const node& items = require_sequence(n, kind, "bindings");
        for (size_t i = 0; i < items.size(); ++i) {
            bindings.push_back(make_let_binding(require_string(items[i], kind, "name"),
                                                read_expr(require(items[i], kind, "value"))));
        }
        return make_let(std::move(bindings), read_expr(require(n, kind, "body")));
    }
    if (kind == "Case") {
        std::vector<case_arm> arms;
        const node& items = require_sequence(n, kind, "patterns");
        for (size_t i = 0; i < items.size(); ++i) {
            const node& item = items[i];
            pattern pat = read_pattern(require(item, kind, "pattern"));
            expr result = read_expr(require(item, kind, "expression"));
            if (has(item, "guard")) {
                arms.push_back(make_guarded_arm(std::move(pat), read_expr(item["guard"]), std::move(result)));
            } else {
                arms.push_back(make_arm(std::move(pat), std::move(result)));
            }
        }
        return make_case(read_expr(require(n, kind, "scrutinee")), std::move(arms));
    }
    if (kind == "Lambda") {
        return make_lambda(has(n, "parameters") ? read_params(n, kind, "parameters")
                                                : std::vector<lambda_param>{},
                           read_expr(require(n, kind, "body")));
    }
    if (kind == "Try") {
        std::vector<catch_arm> handlers;
        const node& items = require_sequence(n, kind, "catch_patterns");
        for (size_t i = 0; i < items.size(); ++i) {
            handlers.push_back(make_catch(read_pattern(require(items[i], kind, "pattern")),
                                          read_expr(require(items[i], kind, "handler"))));
        }
        return make_try(read_expr(require(n, kind, "body")), std::move(handlers));
    }
    if (kind == "Do") {
        std::vector<do_statement> statements;
        if (has(n, "statements")) {
            const node& items = require_sequence(n, kind, "statements");
            for (size_t i = 0; i < items.size(); ++i) {
                statements.push_back(read_statement(items[i]));
            }
        }
        return make_do(std::move(statements), read_expr(require(n, kind, "return")));
    }

    // Collection operators
    if (kind == "Map") {
        return make_map(read_expr(require(n, kind, "collection")),
                        require_string(n, kind, "iterator"),
                        read_expr(require(n, kind, "transform")));
    }
    if (kind == "Filter") {
        return make_filter(read_expr(require(n, kind, "collection")),
                           require_string(n, kind, "iterator"),
                           read_expr(require(n, kind, "predicate")));
    }
    if (kind == "Fold") {
        return make_fold(read_expr(require(n, kind, "collection")),
                         read_expr(require(n, kind, "accumulator")),
                         require_string(n, kind, "acc_name"),
                         require_string(n, kind, "iterator"),
                         read_expr(require(n, kind, "transform")));
    }
    if (kind == "TypeAnnotation") {
        return make_annotation(read_expr(require(n, kind, "expr")), require_string(n, kind, "annotation"));
    }

    throw tree_load_error(kind, "unknown expression kind");
}

ast::pattern TreeLoader::read_pattern(const fkyaml::node& n) const {
    using namespace ast;
    const std::string kind = kind_of(n, "pattern node");

    if (kind == "WildcardPattern") {
        return make_wildcard_pattern();
    }
    if (kind == "VariablePattern") {
        return make_variable_pattern(require_string(n, kind, "name"));
    }
    if (kind == "LiteralPattern") {
        return make_literal_pattern(read_expr(require(n, kind, "value")));
    }
    if (kind == "ConstructorPattern") {
        return make_constructor_pattern(require_string(n, kind, "constructor"),
                                        has(n, "args") ? read_pattern_list(n, kind, "args")
                                                       : std::vector<pattern>{});
    }
    if (kind == "RecordPattern") {
        std::vector<field_pattern> fields;
        const node& items = require(n, kind, "fields");
        if (items.is_sequence()) {
            for (size_t i = 0; i < items.size(); ++i) {
                fields.push_back(make_field_pattern(require_string(items[i], kind, "name"),
                                                    read_pattern(require(items[i], kind, "pattern"))));
            }
        } else if (items.is_mapping()) {
            for (auto it = items.begin(); it != items.end(); ++it) {
                fields.push_back(make_field_pattern(mapping_key(it.key(), kind), read_pattern(*it)));
            }
        } else {
            throw tree_load_error(kind, "field 'fields' must be a sequence or a mapping");
        }
        return make_record_pattern(std::move(fields));
    }
    if (kind == "ListPattern") {
        std::vector<pattern> elements = has(n, "elements") ? read_pattern_list(n, kind, "elements")
                                                           : std::vector<pattern>{};
        if (has(n, "tail")) {
            return make_list_pattern(std::move(elements), read_pattern(n["tail"]));
        }
        return make_list_pattern(std::move(elements));
    }
    if (kind == "AsPattern") {
        return make_as_pattern(require_string(n, kind, "name"), read_pattern(require(n, kind, "pattern")));
    }
    if (kind == "OrPattern") {
        return make_or_pattern(read_pattern_list(n, kind, "patterns"));
    }

    throw tree_load_error(kind, "unknown pattern kind");
}

ast::do_statement TreeLoader::read_statement(const fkyaml::node& n) const {
    const std::string kind = kind_of(n, "do statement");

    if (kind == "Bind") {
        return ast::make_bind(require_string(n, kind, "name"), read_expr(require(n, kind, "value")));
    }
    if (kind == "ExpressionStatement") {
        return ast::make_effect(read_expr(require(n, kind, "expr")));
    }

    throw tree_load_error(kind, "unknown do statement kind");
}

// ============================================================================
// Private: Collections
// ============================================================================

std::vector<ast::expr> TreeLoader::read_expr_list(const fkyaml::node& n, const std::string& kind,
                                                  const char* key) const {
    const node& items = require_sequence(n, kind, key);
    std::vector<ast::expr> result;
    result.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        result.push_back(read_expr(items[i]));
    }
    return result;
}

std::vector<ast::pattern> TreeLoader::read_pattern_list(const fkyaml::node& n, const std::string& kind,
                                                        const char* key) const {
    const node& items = require_sequence(n, kind, key);
    std::vector<ast::pattern> result;
    result.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        result.push_back(read_pattern(items[i]));
    }
    return result;
}

std::vector<ast::field_value> TreeLoader::read_fields(const fkyaml::node& n, const std::string& kind,
                                                      const char* key) const {
    const node& items = require(n, kind, key);
    std::vector<ast::field_value> result;

    if (items.is_sequence()) {
        for (size_t i = 0; i < items.size(); ++i) {
            result.push_back(ast::make_field(require_string(items[i], kind, "name"),
                                             read_expr(require(items[i], kind, "value"))));
        }
    } else if (items.is_mapping()) {
        // fkYAML iteration over mappings using iterators
        for (auto it = items.begin(); it != items.end(); ++it) {
            result.push_back(ast::make_field(mapping_key(it.key(), kind), read_expr(*it)));
        }
    } else {
        throw tree_load_error(kind, std::string("field '") + key + "' must be a sequence or a mapping");
    }

    return result;
}

std::vector<ast::lambda_param> TreeLoader::read_params(const fkyaml::node& n, const std::string& kind,
                                                       const char* key) const {
    const node& items = require_sequence(n, kind, key);
    std::vector<ast::lambda_param> result;
    result.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        const node& item = items[i];
        if (item.is_string()) {
            result.push_back(ast::lambda_param{item.get_value<std::string>(), {}});
            continue;
        }
        result.push_back(ast::lambda_param{require_string(item, kind, "name"),
                                           optional_string(item, kind, "type")});
    }
    return result;
}

}  // namespace lumata::loader
