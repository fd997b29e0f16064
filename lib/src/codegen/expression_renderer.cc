//
// Expression Renderer Implementation
//

#include <lumata/codegen/expression_renderer.hh>
#include <lumata/codegen/string_utils.hh>
#include <variant>

namespace lumata::codegen {

// One overload per expression variant: a new variant without a rule fails to compile
struct ExpressionRenderer::visitor {
    const ExpressionRenderer& self;

    std::string operator()(const ast::int_literal& n) const { return self.render_int(n); }
    std::string operator()(const ast::string_literal& n) const { return self.render_string(n); }
    std::string operator()(const ast::bool_literal& n) const { return self.render_bool(n); }
    std::string operator()(const ast::list_literal& n) const { return self.render_list_literal(n); }
    std::string operator()(const ast::record_literal& n) const { return self.render_record_literal(n); }
    std::string operator()(const ast::variable& n) const { return self.render_variable(n); }
    std::string operator()(const ast::qualified_identifier& n) const { return self.render_qualified(n); }
    std::string operator()(const ast::binary_op& n) const { return self.render_binary(n); }
    std::string operator()(const ast::unary_op& n) const { return self.render_unary(n); }
    std::string operator()(const ast::function_call& n) const { return self.render_call(n); }
    std::string operator()(const ast::constructor_call& n) const { return self.render_constructor_call(n); }
    std::string operator()(const ast::record_creation& n) const { return self.render_record_creation(n); }
    std::string operator()(const ast::record_update& n) const { return self.render_record_update(n); }
    std::string operator()(const ast::field_access& n) const { return self.render_field_access(n); }
    std::string operator()(const ast::list_access& n) const { return self.render_list_access(n); }
    std::string operator()(const ast::if_expr& n) const { return self.closures_.assemble_if(n); }
    std::string operator()(const ast::let_expr& n) const { return self.closures_.assemble_let(n); }
    std::string operator()(const ast::case_expr& n) const { return self.closures_.assemble_case(n); }
    std::string operator()(const ast::lambda& n) const { return self.closures_.assemble_lambda(n); }
    std::string operator()(const ast::try_expr& n) const { return self.closures_.assemble_try(n); }
    std::string operator()(const ast::do_block& n) const { return self.closures_.assemble_do(n); }
    std::string operator()(const ast::map_expr& n) const { return self.render_map(n); }
    std::string operator()(const ast::filter_expr& n) const { return self.render_filter(n); }
    std::string operator()(const ast::fold_expr& n) const { return self.render_fold(n); }
    std::string operator()(const ast::type_annotation& n) const { return self.render_annotation(n); }
};

// ============================================================================
// Construction
// ============================================================================

ExpressionRenderer::ExpressionRenderer(const dialect& target, render_options options)
    : target_(target),
      options_(std::move(options)),
      patterns_(target_, *this),
      closures_(target_, options_, patterns_, *this)
{
}

// ============================================================================
// Public API
// ============================================================================

std::string ExpressionRenderer::render(const ast::expr& expr) const {
    if (expr.node.valueless_by_exception()) {
        throw unhandled_node_error("valueless expression node");
    }
    return std::visit(visitor{*this}, expr.node);
}

std::string ExpressionRenderer::render_list(const std::vector<ast::expr>& items) const {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += ", ";
        result += render(items[i]);
    }
    return result;
}

std::string ExpressionRenderer::render_required(const std::unique_ptr<ast::expr>& child,
                                                const char* what) const {
    if (!child) {
        throw unhandled_node_error(std::string("missing ") + what);
    }
    return render(*child);
}

// ============================================================================
// Literals
// ============================================================================

std::string ExpressionRenderer::render_int(const ast::int_literal& node) const {
    // A leading minus would fuse with a preceding negate into "--"
    if (node.value < 0) {
        return "(" + std::to_string(node.value) + ")";
    }
    return std::to_string(node.value);
}

std::string ExpressionRenderer::render_string(const ast::string_literal& node) const {
    return "\"" + escape_string_literal(node.value) + "\"";
}

std::string ExpressionRenderer::render_bool(const ast::bool_literal& node) const {
    return node.value ? "true" : "false";
}

std::string ExpressionRenderer::render_list_literal(const ast::list_literal& node) const {
    return "[" + render_list(node.elements) + "]";
}

std::string ExpressionRenderer::render_record_literal(const ast::record_literal& node) const {
    if (node.fields.empty()) {
        return target_.empty_record;
    }
    return fill_template(target_.record_expression, {render_fields(node.fields)});
}

// ============================================================================
// Identifiers
// ============================================================================

std::string ExpressionRenderer::render_variable(const ast::variable& node) const {
    return node.name;
}

std::string ExpressionRenderer::render_qualified(const ast::qualified_identifier& node) const {
    if (node.ns && !node.ns->empty()) {
        return *node.ns + "." + node.name;
    }
    return node.name;
}

// ============================================================================
// Operators
// ============================================================================

std::string ExpressionRenderer::render_binary(const ast::binary_op& node) const {
    auto it = target_.binary_templates.find(node.op);
    if (it == target_.binary_templates.end()) {
        auto name = ast::operator_name(node.op);
        throw unknown_operator_error("binary", name ? std::string(*name)
                                                    : std::to_string(static_cast<int>(node.op)));
    }
    std::string left = render_required(node.left, "binary operator left operand");
    std::string right = render_required(node.right, "binary operator right operand");
    return fill_template(it->second, {left, right});
}

std::string ExpressionRenderer::render_unary(const ast::unary_op& node) const {
    auto it = target_.unary_templates.find(node.op);
    if (it == target_.unary_templates.end()) {
        auto name = ast::operator_name(node.op);
        throw unknown_operator_error("unary", name ? std::string(*name)
                                                   : std::to_string(static_cast<int>(node.op)));
    }
    return fill_template(it->second, {render_required(node.operand, "unary operand")});
}

// ============================================================================
// Calls and Record Operations
// ============================================================================

std::string ExpressionRenderer::render_call(const ast::function_call& node) const {
    std::string callee = render_required(node.function, "call target");
    return callee + "(" + render_list(node.arguments) + ")";
}

std::string ExpressionRenderer::render_constructor_call(const ast::constructor_call& node) const {
    return fill_template(target_.new_instance, {node.constructor, render_list(node.arguments)});
}

std::string ExpressionRenderer::render_record_creation(const ast::record_creation& node) const {
    std::string fields = node.fields.empty()
        ? std::string("{}")
        : fill_template(target_.record_literal, {render_fields(node.fields)});
    return fill_template(target_.new_instance, {node.record_type, fields});
}

std::string ExpressionRenderer::render_record_update(const ast::record_update& node) const {
    std::string target = render_required(node.target, "record update target");
    if (node.updates.empty()) {
        // Still a fresh copy
        return "({ ..." + target + " })";
    }
    return fill_template(target_.record_spread, {target, render_fields(node.updates)});
}

std::string ExpressionRenderer::render_field_access(const ast::field_access& node) const {
    return fill_template(target_.field_of, {render_required(node.target, "field access target"), node.field});
}

std::string ExpressionRenderer::render_list_access(const ast::list_access& node) const {
    std::string target = render_required(node.target, "index access target");
    std::string index = render_required(node.index, "index access index");
    return fill_template(target_.element_at, {target, index});
}

// ============================================================================
// Collection Operators
// ============================================================================

std::string ExpressionRenderer::render_map(const ast::map_expr& node) const {
    std::string collection = render_required(node.collection, "map collection");
    std::string body = render_required(node.transform, "map transform");
    return fill_template(target_.map_call, {collection, node.iterator, body});
}

std::string ExpressionRenderer::render_filter(const ast::filter_expr& node) const {
    std::string collection = render_required(node.collection, "filter collection");
    std::string body = render_required(node.predicate, "filter predicate");
    return fill_template(target_.filter_call, {collection, node.iterator, body});
}

std::string ExpressionRenderer::render_fold(const ast::fold_expr& node) const {
    std::string collection = render_required(node.collection, "fold collection");
    std::string initial = render_required(node.initial, "fold initial value");
    std::string body = render_required(node.transform, "fold transform");
    return fill_template(target_.reduce_call, {collection, node.acc_name, node.iterator, body, initial});
}

std::string ExpressionRenderer::render_annotation(const ast::type_annotation& node) const {
    return fill_template(target_.type_cast, {render_required(node.value, "annotated expression"), node.type_name});
}

// ============================================================================
// Private: Helpers
// ============================================================================

std::string ExpressionRenderer::render_fields(const std::vector<ast::field_value>& fields) const {
    std::string result;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) result += ", ";
        result += fill_template(target_.record_field,
                                {escape_string_literal(fields[i].name),
                                 render_required(fields[i].value, "record field value")});
    }
    return result;
}

}  // namespace lumata::codegen
