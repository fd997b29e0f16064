//
// Module Renderer Implementation
//

#include <lumata/codegen/module_renderer.hh>
#include <lumata/codegen/script_code_writer.hh>
#include <lumata/codegen/string_utils.hh>
#include <algorithm>
#include <vector>

namespace lumata::codegen {

namespace {
    // Continuation lines of a multi-line body move in by one function level
    std::string indent_continuation(const std::string& text, const std::string& indent) {
        std::string result;
        result.reserve(text.size());
        for (char c : text) {
            result += c;
            if (c == '\n') {
                result += indent;
            }
        }
        return result;
    }
}

ModuleRenderer::ModuleRenderer(const ExpressionRenderer& expressions)
    : expressions_(expressions)
{
}

void ModuleRenderer::render(const ast::module_def& module, std::ostream& output) const {
    const dialect& target = expressions_.target();
    const render_options& options = expressions_.options();
    const std::string indent(static_cast<size_t>(std::max(options.indent_size, 0)), ' ');

    std::vector<std::string> bodies;
    bodies.reserve(module.functions.size());
    for (const auto& fn : module.functions) {
        bodies.push_back(indent_continuation(expressions_.render(fn.body), indent));
    }

    ScriptCodeWriter writer(output, target, options.indent_size);

    writer.write_comment("Module: " + module.name);
    writer.write_comment("Generated by lumatac. Do not edit.");

    for (size_t i = 0; i < module.functions.size(); ++i) {
        const auto& fn = module.functions[i];
        writer.write_blank_line();

        auto body = writer.write_function(fn.name, parameter_list(fn), fn.result_type);
        writer.write_return(bodies[i]);
    }
}

std::string ModuleRenderer::parameter_list(const ast::function_def& fn) const {
    const dialect& target = expressions_.target();

    std::string result;
    for (size_t i = 0; i < fn.params.size(); ++i) {
        if (i > 0) result += ", ";
        if (fn.params[i].type_name.empty()) {
            result += fn.params[i].name;
        } else {
            result += fill_template(target.typed_param, {fn.params[i].name, fn.params[i].type_name});
        }
    }
    return result;
}

}  // namespace lumata::codegen
