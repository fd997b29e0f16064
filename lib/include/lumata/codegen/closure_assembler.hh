//
// Closure Assembler
//
// Emits the value-producing control forms. The target language treats if,
// try and blocks as statements, so every control expression becomes an
// invoked closure whose body returns the form's value.
//

#pragma once

#include <lumata/ast.hh>
#include <lumata/codegen.hh>
#include <lumata/codegen/dialect.hh>
#include <lumata/codegen/pattern_compiler.hh>
#include <memory>
#include <string>
#include <vector>

namespace lumata::codegen {

class ExpressionRenderer;
class ScriptCodeWriter;

class ClosureAssembler {
public:
    ClosureAssembler(const dialect& target,
                     const render_options& options,
                     const PatternCompiler& patterns,
                     const ExpressionRenderer& renderer);

    std::string assemble_if(const ast::if_expr& node) const;
    std::string assemble_let(const ast::let_expr& node) const;
    std::string assemble_do(const ast::do_block& node) const;
    std::string assemble_lambda(const ast::lambda& node) const;

    /**
     * Case: the scrutinee is evaluated once, as the argument of a closure
     * whose parameter is the scrutinee temporary. Arms are tested in source
     * order; the first arm whose pattern and guard hold wins. Without an
     * unconditional arm the chain ends in a throw carrying the value.
     */
    std::string assemble_case(const ast::case_expr& node) const;

    /**
     * Try: the body returns from inside a target try; one generic catch
     * replays the arm chain over the caught value and re-throws it unchanged
     * when no arm matches.
     */
    std::string assemble_try(const ast::try_expr& node) const;

private:
    const dialect& target_;
    const render_options& options_;
    const PatternCompiler& patterns_;
    const ExpressionRenderer& renderer_;

    // One case or catch arm, fully rendered before anything is written
    struct compiled_arm {
        std::string condition;
        std::vector<binding> bindings;
        std::string result;
        bool unconditional;
    };

    compiled_arm compile_arm(const ast::pattern& pat,
                             const ast::expr* guard,
                             const std::unique_ptr<ast::expr>& result,
                             const std::string& value_ref) const;

    // if / else if / ... / else over the arms; fallback is the final else
    // statement, omitted when an unconditional arm closes the chain
    void write_arm_chain(ScriptCodeWriter& writer,
                         const std::vector<compiled_arm>& arms,
                         const std::string& fallback) const;

    void write_arm_body(ScriptCodeWriter& writer, const compiled_arm& arm) const;

    std::string parameter_list(const std::vector<ast::lambda_param>& params) const;
};

}  // namespace lumata::codegen
