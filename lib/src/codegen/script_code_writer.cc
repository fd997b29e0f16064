//
// Script Code Writer Implementation
//

#include <lumata/codegen/script_code_writer.hh>
#include <lumata/codegen/string_utils.hh>
#include <algorithm>

namespace lumata::codegen {

ScriptCodeWriter::ScriptCodeWriter(std::ostream& output, const dialect& target, int indent_size)
    : CodeWriter(output),
      target_(target)
{
    set_indent_string(std::string(static_cast<size_t>(std::max(indent_size, 0)), ' '));
}

// ============================================================================
// Statements
// ============================================================================

void ScriptCodeWriter::write_const(const std::string& name, const std::string& value) {
    write_line(fill_template(target_.const_declaration, {name, value}));
}

void ScriptCodeWriter::write_return(const std::string& value) {
    write_line(fill_template(target_.return_statement, {value}));
}

void ScriptCodeWriter::write_expression_statement(const std::string& value) {
    write_line(value + ";");
}

void ScriptCodeWriter::write_comment(const std::string& text) {
    write_line(fill_template(target_.line_comment, {text}));
}

// ============================================================================
// Blocks
// ============================================================================

BracedBlock ScriptCodeWriter::write_invoked_closure() {
    return write_braced(target_.closure_open, target_.closure_close);
}

BracedBlock ScriptCodeWriter::write_scrutinee_closure(const std::string& param,
                                                      const std::string& argument) {
    return write_braced(fill_template(target_.scrutinee_open, {param, target_.dynamic_type}),
                        fill_template(target_.scrutinee_close, {argument}));
}

BracedBlock ScriptCodeWriter::write_lambda(const std::string& params) {
    return write_braced(fill_template(target_.lambda_open, {params}), target_.lambda_close);
}

BracedBlock ScriptCodeWriter::write_function(const std::string& name,
                                             const std::string& params,
                                             const std::string& result_type) {
    std::string suffix;
    if (!result_type.empty()) {
        suffix = fill_template(target_.result_suffix, {result_type});
    }
    return write_braced(fill_template(target_.function_header, {name, params, suffix}) + " {",
                        "}");
}

}  // namespace lumata::codegen
