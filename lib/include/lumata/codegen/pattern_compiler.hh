//
// Pattern Compiler
//
// Flattens a structural pattern into a single boolean test over a value
// reference plus the ordered bindings the pattern introduces.
//

#pragma once

#include <lumata/ast.hh>
#include <lumata/codegen/dialect.hh>
#include <string>
#include <vector>

namespace lumata::codegen {

class ExpressionRenderer;

/// One name introduced by a successful match: const name = value;
struct binding {
    std::string name;
    std::string value;

    bool operator==(const binding& other) const {
        return name == other.name && value == other.value;
    }
};

/// Result of compiling one pattern against one value reference
struct pattern_match {
    std::string condition;           ///< Boolean expression in target syntax
    std::vector<binding> bindings;   ///< Emit only inside the guarded branch
    bool irrefutable = false;        ///< Matches every value
};

/**
 * Compiles patterns used by case arms and catch arms.
 *
 * value_ref is already target-language text (a temporary name or a derived
 * projection such as `x.field`). Sub-patterns are compiled against derived
 * references:
 * - constructor argument: `v.value` (single argument) or `v.arg<i>`
 * - record field:         `v.<field>`
 * - list element:         `v[i]`, tail `v.slice(n)`
 *
 * Literal patterns are rendered through the owning ExpressionRenderer.
 */
class PatternCompiler {
public:
    PatternCompiler(const dialect& target, const ExpressionRenderer& literals);

    /**
     * Compile a pattern against a value reference.
     *
     * @throws unsupported_pattern_error for a malformed pattern or an
     *         or-pattern whose alternatives bind variables
     */
    pattern_match compile(const ast::pattern& pat, const std::string& value_ref) const;

private:
    const dialect& target_;
    const ExpressionRenderer& literals_;

    struct visitor;

    pattern_match compile_wildcard(const ast::wildcard_pattern& pat, const std::string& ref) const;
    pattern_match compile_variable(const ast::variable_pattern& pat, const std::string& ref) const;
    pattern_match compile_literal(const ast::literal_pattern& pat, const std::string& ref) const;
    pattern_match compile_constructor(const ast::constructor_pattern& pat, const std::string& ref) const;
    pattern_match compile_record(const ast::record_pattern& pat, const std::string& ref) const;
    pattern_match compile_list(const ast::list_pattern& pat, const std::string& ref) const;
    pattern_match compile_as(const ast::as_pattern& pat, const std::string& ref) const;
    pattern_match compile_or(const ast::or_pattern& pat, const std::string& ref) const;

    // Append a sub-match: condition becomes a conjunct, bindings keep order
    static void absorb(std::vector<std::string>& conditions,
                       std::vector<binding>& bindings,
                       pattern_match sub);

    std::string conjoin(const std::vector<std::string>& conditions) const;
};

}  // namespace lumata::codegen
