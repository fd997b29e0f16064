//
// Module Renderer
//
// Emits a module of Lumata function definitions as one target-language
// compilation unit: a header comment followed by one exported function per
// definition, each returning its rendered body expression.
//

#pragma once

#include <lumata/ast.hh>
#include <lumata/codegen/expression_renderer.hh>
#include <ostream>
#include <string>

namespace lumata::codegen {

class ModuleRenderer {
public:
    explicit ModuleRenderer(const ExpressionRenderer& expressions);

    /**
     * Write the whole module to output.
     *
     * Every function body is rendered before anything is written, so a
     * failing body leaves output untouched.
     *
     * @throws codegen_error if any body cannot be rendered
     */
    void render(const ast::module_def& module, std::ostream& output) const;

private:
    const ExpressionRenderer& expressions_;

    std::string parameter_list(const ast::function_def& fn) const;
};

}  // namespace lumata::codegen
