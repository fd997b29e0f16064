//
// Expression Renderer
//
// Converts Lumata expression trees to target-language expression strings.
//

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <lumata/ast.hh>
#include <lumata/codegen.hh>
#include <lumata/codegen/closure_assembler.hh>
#include <lumata/codegen/dialect.hh>
#include <lumata/codegen/pattern_compiler.hh>

namespace lumata::codegen {

/**
 * Renders Lumata expressions to target-language code.
 *
 * The renderer is a pure function of its input tree: it never mutates the
 * tree, keeps no state between calls and performs no I/O, so one instance
 * may render independent trees from several threads. It handles:
 * - Literals (int, string, bool, list, record) and identifiers
 * - Binary and unary operators through the dialect's operator tables
 * - Function and constructor calls
 * - Record creation, pure update, field and index access
 * - Control forms (if, let, case, lambda, try, do), delegated to the
 *   ClosureAssembler which wraps them in invoked closures
 * - Collection operators (map, filter, fold) and type annotations
 *
 * A child node's rendering is substituted verbatim into its parent's
 * template, so rendering is compositional.
 */
class ExpressionRenderer {
public:
    /**
     * Constructor.
     *
     * @param target Dialect tables (must outlive the renderer)
     * @param options Temporary names and indentation
     */
    explicit ExpressionRenderer(const dialect& target, render_options options = {});

    // Members hold references to this instance
    ExpressionRenderer(const ExpressionRenderer&) = delete;
    ExpressionRenderer& operator=(const ExpressionRenderer&) = delete;

    /**
     * Render an expression tree.
     *
     * @param expr Root of the tree to render
     * @return Target-language expression text
     * @throws unhandled_node_error, unknown_operator_error, unsupported_pattern_error
     */
    std::string render(const ast::expr& expr) const;

    /// Render a comma-separated argument list
    std::string render_list(const std::vector<ast::expr>& items) const;

    /// Render a required child, raising unhandled_node_error naming `what`
    /// when the producer left it null
    std::string render_required(const std::unique_ptr<ast::expr>& child, const char* what) const;

    const PatternCompiler& patterns() const { return patterns_; }
    const dialect& target() const { return target_; }
    const render_options& options() const { return options_; }

private:
    const dialect& target_;
    render_options options_;
    PatternCompiler patterns_;
    ClosureAssembler closures_;

    struct visitor;

    // Literal rendering
    std::string render_int(const ast::int_literal& node) const;
    std::string render_string(const ast::string_literal& node) const;
    std::string render_bool(const ast::bool_literal& node) const;
    std::string render_list_literal(const ast::list_literal& node) const;
    std::string render_record_literal(const ast::record_literal& node) const;

    // Identifier rendering
    std::string render_variable(const ast::variable& node) const;
    std::string render_qualified(const ast::qualified_identifier& node) const;

    // Operators
    std::string render_binary(const ast::binary_op& node) const;
    std::string render_unary(const ast::unary_op& node) const;

    // Calls and record operations
    std::string render_call(const ast::function_call& node) const;
    std::string render_constructor_call(const ast::constructor_call& node) const;
    std::string render_record_creation(const ast::record_creation& node) const;
    std::string render_record_update(const ast::record_update& node) const;
    std::string render_field_access(const ast::field_access& node) const;
    std::string render_list_access(const ast::list_access& node) const;

    // Collection operators
    std::string render_map(const ast::map_expr& node) const;
    std::string render_filter(const ast::filter_expr& node) const;
    std::string render_fold(const ast::fold_expr& node) const;

    std::string render_annotation(const ast::type_annotation& node) const;

    // "name: value, ..." for record literals, creations and updates
    std::string render_fields(const std::vector<ast::field_value>& fields) const;
};

}  // namespace lumata::codegen
