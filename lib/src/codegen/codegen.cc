//
// Code Generation Entry Points
//

#include <lumata/codegen.hh>
#include <lumata/codegen/expression_renderer.hh>
#include <lumata/codegen/module_renderer.hh>
#include <lumata/dialect_registry.hh>
#include <sstream>

namespace lumata::codegen {

std::string render_expression(const ast::expr& root, const render_options& opts) {
    const dialect& target = DialectRegistry::instance().require_dialect(opts.target);
    ExpressionRenderer renderer(target, opts);
    return renderer.render(root);
}

std::string render_module(const ast::module_def& module, const render_options& opts) {
    const dialect& target = DialectRegistry::instance().require_dialect(opts.target);
    ExpressionRenderer renderer(target, opts);

    std::ostringstream out;
    ModuleRenderer(renderer).render(module, out);
    return out.str();
}

}  // namespace lumata::codegen
