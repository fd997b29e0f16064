//
// Code Generation API
//
// Render Lumata expression trees and modules to target-language source
//

#pragma once

#include "ast.hh"
#include <string>
#include <stdexcept>

namespace lumata::codegen {

// ============================================================================
// Code Generation Exceptions
// ============================================================================

/**
 * Base exception for code generation errors.
 *
 * All code generation errors are terminal: the tree cannot be compiled and
 * no partially rendered text is meaningful.
 */
class codegen_error : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * Exception thrown when the renderer meets a node outside the closed
 * variant set, or a node missing a required child.
 *
 * This indicates a bug in the producer of the tree.
 */
class unhandled_node_error : public codegen_error {
public:
    explicit unhandled_node_error(const std::string& what_arg)
        : codegen_error("Unhandled AST node: " + what_arg) {}
};

/**
 * Exception thrown when a binary or unary operator tag has no template in
 * the active dialect.
 */
class unknown_operator_error : public codegen_error {
public:
    unknown_operator_error(const std::string& kind, const std::string& tag)
        : codegen_error("Unknown " + kind + " operator: " + tag)
        , tag_(tag) {}

    [[nodiscard]] const std::string& tag() const { return tag_; }

private:
    std::string tag_;
};

/**
 * Exception thrown for patterns the compiler cannot translate, including
 * or-patterns whose alternatives bind variables.
 */
class unsupported_pattern_error : public codegen_error {
public:
    explicit unsupported_pattern_error(const std::string& what_arg)
        : codegen_error("Unsupported pattern: " + what_arg) {}
};

/**
 * Exception thrown when a target dialect name is not registered.
 */
class unknown_target_error : public std::runtime_error {
public:
    explicit unknown_target_error(const std::string& name)
        : std::runtime_error("Unknown target dialect: " + name) {}
};

// ============================================================================
// Rendering Options
// ============================================================================

struct render_options {
    std::string target = "assemblyscript";        ///< Dialect name from DialectRegistry
    int indent_size = 4;                          ///< Spaces per indent level
    std::string scrutinee_name = "valueToMatch";  ///< Case closure parameter
    std::string catch_name = "e";                 ///< Caught value in try closures
};

// ============================================================================
// Rendering Entry Points
// ============================================================================

/// Render a single expression tree
/// @throws codegen_error if the tree cannot be compiled
/// @throws unknown_target_error if opts.target is not registered
std::string render_expression(const ast::expr& root, const render_options& opts = {});

/// Render a module of function definitions as one compilation unit
std::string render_module(const ast::module_def& module, const render_options& opts = {});

} // namespace lumata::codegen
