//
// Script Code Writer - Dialect-Aware Statement Emission
//
// Extends the generic CodeWriter with the statements and closure shapes the
// expression compiler needs, spelled through the active dialect:
// - const declarations and return statements
// - invoked closures (zero-argument and scrutinee-parameterized)
// - lambda bodies and exported function definitions
//

#pragma once

#include <lumata/codegen/code_writer.hh>
#include <lumata/codegen/dialect.hh>
#include <string>

namespace lumata::codegen {

class ScriptCodeWriter : public CodeWriter {
public:
    ScriptCodeWriter(std::ostream& output, const dialect& target, int indent_size = 4);

    const dialect& target() const { return target_; }

    // ========================================================================
    // Statements
    // ========================================================================

    void write_const(const std::string& name, const std::string& value);
    void write_return(const std::string& value);
    void write_expression_statement(const std::string& value);
    void write_comment(const std::string& text);

    // ========================================================================
    // Blocks
    // ========================================================================

    // (() => { ... })()
    BracedBlock write_invoked_closure();

    // ((param: any) => { ... })(argument)
    BracedBlock write_scrutinee_closure(const std::string& param,
                                        const std::string& argument);

    // ((params) => { ... })
    BracedBlock write_lambda(const std::string& params);

    // export function name(params): result { ... }
    BracedBlock write_function(const std::string& name,
                               const std::string& params,
                               const std::string& result_type);

private:
    const dialect& target_;
};

}  // namespace lumata::codegen
