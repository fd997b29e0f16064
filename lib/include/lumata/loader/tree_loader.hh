//
// Tree Loader
//
// Builds Lumata expression trees and modules from YAML/JSON documents in the
// serialized node form: every node is a mapping tagged by a `kind` field.
//

#pragma once

#include <lumata/ast.hh>
#include <stdexcept>
#include <string>

// fkYAML uses versioned namespaces, so we need to include the header
#include <fkYAML/node.hpp>

namespace lumata::loader {

/**
 * Exception thrown for documents that do not describe a well-formed tree:
 * unreadable files, YAML syntax errors, unknown kinds, missing or mistyped
 * fields.
 */
class tree_load_error : public std::runtime_error {
public:
    tree_load_error(const std::string& kind, const std::string& message)
        : std::runtime_error(format_error(kind, message))
        , kind_(kind) {}

    /// Node kind being read when the error occurred (empty at document level)
    const std::string& kind() const { return kind_; }

private:
    std::string kind_;

    static std::string format_error(const std::string& kind, const std::string& message) {
        if (kind.empty()) {
            return message;
        }
        return kind + ": " + message;
    }
};

/**
 * Reads serialized trees.
 *
 * Example document:
 *   module: Demo
 *   functions:
 *     - name: inc
 *       params: [{name: x, type: i32}]
 *       result: i32
 *       body: {kind: BinaryOp, operator: Add,
 *              left: {kind: Variable, name: x}, right: {kind: IntLiteral, value: 1}}
 *
 * Record-like `fields` / `updates` are written either as a sequence of
 * {name, value} entries (order preserved) or as a mapping (order is the
 * YAML library's key order).
 */
class TreeLoader {
public:
    /**
     * Load a single expression. The document is either a node mapping or a
     * mapping holding one under `expression:`.
     *
     * @throws tree_load_error for I/O, syntax or structure errors
     * @throws codegen::unknown_operator_error for an unknown operator name
     */
    ast::expr load_expression_file(const std::string& path) const;
    ast::expr load_expression(const std::string& text) const;

    /**
     * Load a module (`module:` name and `functions:` sequence).
     *
     * @throws tree_load_error for I/O, syntax or structure errors
     */
    ast::module_def load_module_file(const std::string& path) const;
    ast::module_def load_module(const std::string& text) const;

    /// Build from an already parsed document (for testing)
    ast::expr build_expression(const fkyaml::node& root) const;
    ast::module_def build_module(const fkyaml::node& root) const;

private:
    ast::expr read_expr(const fkyaml::node& node) const;
    ast::pattern read_pattern(const fkyaml::node& node) const;
    ast::do_statement read_statement(const fkyaml::node& node) const;
    ast::function_def read_function(const fkyaml::node& node) const;

    std::vector<ast::expr> read_expr_list(const fkyaml::node& node, const std::string& kind,
                                          const char* key) const;
    std::vector<ast::pattern> read_pattern_list(const fkyaml::node& node, const std::string& kind,
                                                const char* key) const;
    std::vector<ast::field_value> read_fields(const fkyaml::node& node, const std::string& kind,
                                              const char* key) const;
    std::vector<ast::lambda_param> read_params(const fkyaml::node& node, const std::string& kind,
                                               const char* key) const;
};

}  // namespace lumata::loader
