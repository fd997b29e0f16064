//
// Closure Assembler Implementation
//

#include <lumata/codegen/closure_assembler.hh>
#include <lumata/codegen/expression_renderer.hh>
#include <lumata/codegen/script_code_writer.hh>
#include <lumata/codegen/string_utils.hh>
#include <optional>
#include <sstream>
#include <variant>

namespace lumata::codegen {

namespace {
    // The closing line is the end of the expression: no trailing newline
    std::string take_text(const std::ostringstream& out) {
        std::string text = out.str();
        if (!text.empty() && text.back() == '\n') {
            text.pop_back();
        }
        return text;
    }
}

// ============================================================================
// Construction
// ============================================================================

ClosureAssembler::ClosureAssembler(const dialect& target,
                                   const render_options& options,
                                   const PatternCompiler& patterns,
                                   const ExpressionRenderer& renderer)
    : target_(target),
      options_(options),
      patterns_(patterns),
      renderer_(renderer)
{
}

// ============================================================================
// Simple Control Forms
// ============================================================================

std::string ClosureAssembler::assemble_if(const ast::if_expr& node) const {
    std::string condition = renderer_.render_required(node.condition, "if condition");
    std::string then_value = renderer_.render_required(node.then_branch, "if then-branch");
    std::string else_value = renderer_.render_required(node.else_branch, "if else-branch");

    std::ostringstream out;
    {
        ScriptCodeWriter writer(out, target_, options_.indent_size);

        auto closure = writer.write_invoked_closure();
        auto then_block = writer.write_if(condition);
        writer.write_return(then_value);
        auto else_block = then_block.write_else();
        writer.write_return(else_value);
    }
    return take_text(out);
}

std::string ClosureAssembler::assemble_let(const ast::let_expr& node) const {
    std::ostringstream out;
    {
        ScriptCodeWriter writer(out, target_, options_.indent_size);

        auto closure = writer.write_invoked_closure();
        for (const auto& b : node.bindings) {
            writer.write_const(b.name, renderer_.render_required(b.value, "let binding value"));
        }
        writer.write_return(renderer_.render_required(node.body, "let body"));
    }
    return take_text(out);
}

std::string ClosureAssembler::assemble_do(const ast::do_block& node) const {
    struct statement_writer {
        ScriptCodeWriter& writer;
        const ExpressionRenderer& renderer;

        void operator()(const ast::bind_statement& s) const {
            writer.write_const(s.name, renderer.render_required(s.value, "do bind value"));
        }
        void operator()(const ast::expression_statement& s) const {
            writer.write_expression_statement(renderer.render_required(s.value, "do statement"));
        }
    };

    std::ostringstream out;
    {
        ScriptCodeWriter writer(out, target_, options_.indent_size);

        auto closure = writer.write_invoked_closure();
        for (const auto& statement : node.statements) {
            if (statement.valueless_by_exception()) {
                throw unhandled_node_error("valueless do statement");
            }
            std::visit(statement_writer{writer, renderer_}, statement);
        }
        writer.write_return(renderer_.render_required(node.result, "do result"));
    }
    return take_text(out);
}

std::string ClosureAssembler::assemble_lambda(const ast::lambda& node) const {
    std::ostringstream out;
    {
        ScriptCodeWriter writer(out, target_, options_.indent_size);

        auto body = writer.write_lambda(parameter_list(node.params));
        writer.write_return(renderer_.render_required(node.body, "lambda body"));
    }
    return take_text(out);
}

// ============================================================================
// Case / Try
// ============================================================================

std::string ClosureAssembler::assemble_case(const ast::case_expr& node) const {
    if (node.arms.empty()) {
        throw unhandled_node_error("case expression without arms");
    }

    const std::string& temporary = options_.scrutinee_name;
    std::string scrutinee = renderer_.render_required(node.scrutinee, "case scrutinee");

    std::vector<compiled_arm> arms;
    arms.reserve(node.arms.size());
    for (const auto& arm : node.arms) {
        arms.push_back(compile_arm(arm.pat, arm.guard.get(), arm.result, temporary));
    }

    std::ostringstream out;
    {
        ScriptCodeWriter writer(out, target_, options_.indent_size);

        auto closure = writer.write_scrutinee_closure(temporary, scrutinee);
        write_arm_chain(writer, arms, fill_template(target_.unmatched_throw, {temporary}));
    }
    return take_text(out);
}

std::string ClosureAssembler::assemble_try(const ast::try_expr& node) const {
    if (node.handlers.empty()) {
        throw unhandled_node_error("try expression without catch arms");
    }

    const std::string& caught = options_.catch_name;
    std::string body = renderer_.render_required(node.body, "try body");

    std::vector<compiled_arm> arms;
    arms.reserve(node.handlers.size());
    for (const auto& handler : node.handlers) {
        arms.push_back(compile_arm(handler.pat, nullptr, handler.handler, caught));
    }

    std::ostringstream out;
    {
        ScriptCodeWriter writer(out, target_, options_.indent_size);

        auto closure = writer.write_invoked_closure();
        auto try_block = writer.write_try();
        writer.write_return(body);
        auto catch_block = try_block.write_catch(fill_template(target_.catch_clause, {caught}));
        write_arm_chain(writer, arms, fill_template(target_.rethrow, {caught}));
    }
    return take_text(out);
}

// ============================================================================
// Private: Arm Chains
// ============================================================================

ClosureAssembler::compiled_arm ClosureAssembler::compile_arm(const ast::pattern& pat,
                                                             const ast::expr* guard,
                                                             const std::unique_ptr<ast::expr>& result,
                                                             const std::string& value_ref) const {
    pattern_match match = patterns_.compile(pat, value_ref);

    std::string condition = std::move(match.condition);
    if (guard) {
        std::string test = renderer_.render(*guard);
        if (!match.bindings.empty()) {
            // The guard may name pattern variables: declare them first
            std::string scoped = target_.closure_open;
            for (const auto& b : match.bindings) {
                scoped += " " + fill_template(target_.const_declaration, {b.name, b.value});
            }
            scoped += " " + fill_template(target_.return_statement, {test}) + " " + target_.closure_close;
            test = std::move(scoped);
        }
        condition += target_.conjunction + "(" + test + ")";
    }

    return compiled_arm{
        std::move(condition),
        std::move(match.bindings),
        renderer_.render_required(result, "arm result"),
        match.irrefutable && guard == nullptr
    };
}

void ClosureAssembler::write_arm_chain(ScriptCodeWriter& writer,
                                       const std::vector<compiled_arm>& arms,
                                       const std::string& fallback) const {
    std::optional<IfBlock> chain;

    for (const auto& arm : arms) {
        if (arm.unconditional) {
            // Closes the chain: later arms are unreachable
            if (!chain) {
                write_arm_body(writer, arm);
                return;
            }
            ElseBlock otherwise = chain->write_else();
            write_arm_body(writer, arm);
            return;
        }

        if (!chain) {
            chain.emplace(writer.write_if(arm.condition));
        } else {
            chain = chain->write_else_if(arm.condition);
        }
        write_arm_body(writer, arm);
    }

    ElseBlock otherwise = chain->write_else();
    writer.write_line(fallback);
}

void ClosureAssembler::write_arm_body(ScriptCodeWriter& writer, const compiled_arm& arm) const {
    for (const auto& b : arm.bindings) {
        writer.write_const(b.name, b.value);
    }
    writer.write_return(arm.result);
}

std::string ClosureAssembler::parameter_list(const std::vector<ast::lambda_param>& params) const {
    std::string result;
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0) result += ", ";
        if (params[i].type_name.empty()) {
            result += params[i].name;
        } else {
            result += fill_template(target_.typed_param, {params[i].name, params[i].type_name});
        }
    }
    return result;
}

}  // namespace lumata::codegen
