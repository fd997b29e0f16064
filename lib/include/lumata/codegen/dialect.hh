//
// Target Dialect Tables
//
// Every piece of fixed target-language spelling used by the renderer and the
// pattern compiler lives here as constant data. Switching the target dialect
// means selecting another table; the traversal never changes.
//
// Templates use positional placeholders {0}, {1}, ... (see fill_template).
//

#pragma once

#include <lumata/ast.hh>
#include <map>
#include <string>

namespace lumata::codegen {

struct dialect {
    std::string name;                 ///< Registry key (e.g. "assemblyscript")
    std::string description;          ///< One-line description for --list-targets
    std::string file_extension;       ///< Output extension (e.g. ".ts")

    // ------------------------------------------------------------------------
    // Operator tables: {0} = left/operand, {1} = right
    // ------------------------------------------------------------------------
    std::map<ast::binary_operator, std::string> binary_templates;
    std::map<ast::unary_operator, std::string> unary_templates;

    // ------------------------------------------------------------------------
    // Expressions
    // ------------------------------------------------------------------------
    std::string new_instance;         ///< {0} = class, {1} = arguments
    std::string record_literal;       ///< {0} = fields, braces only (constructor argument)
    std::string record_expression;    ///< {0} = fields, parenthesized object literal
    std::string empty_record;
    std::string record_spread;        ///< {0} = target, {1} = replaced fields
    std::string record_field;         ///< {0} = name, {1} = value
    std::string map_call;             ///< {0} = collection, {1} = iterator, {2} = body
    std::string filter_call;          ///< {0} = collection, {1} = iterator, {2} = body
    std::string reduce_call;          ///< {0} = collection, {1} = acc, {2} = iterator, {3} = body, {4} = init
    std::string type_cast;            ///< {0} = value, {1} = type
    std::string typed_param;          ///< {0} = name, {1} = type
    std::string dynamic_type;         ///< Type of closure parameters holding arbitrary values

    // ------------------------------------------------------------------------
    // Statements and closures
    // ------------------------------------------------------------------------
    std::string const_declaration;    ///< {0} = name, {1} = value
    std::string return_statement;     ///< {0} = value
    std::string closure_open;         ///< Zero-argument invoked closure header
    std::string closure_close;
    std::string scrutinee_open;       ///< {0} = parameter, {1} = type
    std::string scrutinee_close;      ///< {0} = argument
    std::string lambda_open;          ///< {0} = parameter list
    std::string lambda_close;
    std::string catch_clause;         ///< {0} = caught value name
    std::string unmatched_throw;      ///< {0} = unmatched value
    std::string rethrow;              ///< {0} = caught value name
    std::string function_header;      ///< {0} = name, {1} = parameters, {2} = result suffix
    std::string result_suffix;        ///< {0} = result type
    std::string line_comment;         ///< {0} = text

    // ------------------------------------------------------------------------
    // Pattern tests
    // ------------------------------------------------------------------------
    std::string equality_test;        ///< {0} = value, {1} = literal
    std::string instance_test;        ///< {0} = value, {1} = constructor
    std::string not_null_test;        ///< {0} = value
    std::string array_test;           ///< {0} = value
    std::string length_exact;         ///< {0} = value, {1} = count
    std::string length_at_least;      ///< {0} = value, {1} = count
    std::string slice_from;           ///< {0} = value, {1} = start
    std::string element_at;           ///< {0} = value, {1} = index
    std::string field_of;             ///< {0} = value, {1} = field
    std::string payload_single;       ///< {0} = value
    std::string payload_indexed;      ///< {0} = value, {1} = argument index
    std::string true_literal;
    std::string conjunction;          ///< Separator between conjuncts
    std::string disjunction;          ///< Separator between alternatives
};

/// AssemblyScript (default target)
const dialect& assemblyscript_dialect();

/// TypeScript
const dialect& typescript_dialect();

}  // namespace lumata::codegen
