//
// Target Dialect Tables
//

#include <lumata/codegen/dialect.hh>

namespace lumata::codegen {

namespace {
    using ast::binary_operator;
    using ast::unary_operator;

    // Spellings shared by every ECMAScript-family dialect
    dialect make_ecmascript_base() {
        dialect d;

        d.binary_templates = {
            {binary_operator::add,           "({0} + {1})"},
            {binary_operator::subtract,      "({0} - {1})"},
            {binary_operator::multiply,      "({0} * {1})"},
            {binary_operator::divide,        "({0} / {1})"},
            {binary_operator::modulo,        "({0} % {1})"},
            {binary_operator::equal,         "({0} === {1})"},
            {binary_operator::not_equal,     "({0} !== {1})"},
            {binary_operator::less_than,     "({0} < {1})"},
            {binary_operator::less_equal,    "({0} <= {1})"},
            {binary_operator::greater_than,  "({0} > {1})"},
            {binary_operator::greater_equal, "({0} >= {1})"},
            {binary_operator::logical_and,   "({0} && {1})"},
            {binary_operator::logical_or,    "({0} || {1})"},
            // Immutable prepend / concatenation
            {binary_operator::cons,          "[{0}].concat({1})"},
            {binary_operator::append,        "({0}).concat({1})"},
            // (f . g)(x) = f(g(x)), (f |> g)(x) = g(f(x))
            {binary_operator::compose,       "((__x: any) => {0}({1}(__x)))"},
            {binary_operator::pipe,          "((__x: any) => {1}({0}(__x)))"},
        };

        d.unary_templates = {
            {unary_operator::negate,      "(-{0})"},
            {unary_operator::logical_not, "(!{0})"},
            {unary_operator::length,      "({0}.length)"},
            {unary_operator::head,        "({0}[0])"},
            {unary_operator::tail,        "({0}.slice(1))"},
        };

        d.new_instance = "new {0}({1})";
        d.record_literal = "{ {0} }";
        // Parenthesized so an arrow body or statement is not read as a block
        d.record_expression = "({ {0} })";
        d.empty_record = "({})";
        d.record_spread = "({ ...{0}, {1} })";
        d.record_field = "\"{0}\": {1}";
        d.map_call = "{0}.map(({1}) => {2})";
        d.filter_call = "{0}.filter(({1}) => {2})";
        d.reduce_call = "{0}.reduce(({1}, {2}) => {3}, {4})";
        d.type_cast = "({0} as {1})";
        d.typed_param = "{0}: {1}";
        d.dynamic_type = "any";

        d.const_declaration = "const {0} = {1};";
        d.return_statement = "return {0};";
        d.closure_open = "(() => {";
        d.closure_close = "})()";
        d.scrutinee_open = "(({0}: {1}) => {";
        d.scrutinee_close = "})({0})";
        d.lambda_open = "(({0}) => {";
        d.lambda_close = "})";
        d.catch_clause = "catch ({0})";
        d.unmatched_throw = "throw new Error(\"No match found for value: \" + String({0}));";
        d.rethrow = "throw {0};";
        d.function_header = "export function {0}({1}){2}";
        d.result_suffix = ": {0}";
        d.line_comment = "// {0}";

        d.equality_test = "{0} === {1}";
        d.instance_test = "{0} instanceof {1}";
        d.not_null_test = "{0} !== null";
        d.array_test = "Array.isArray({0})";
        d.length_exact = "{0}.length === {1}";
        d.length_at_least = "{0}.length >= {1}";
        d.slice_from = "{0}.slice({1})";
        d.element_at = "{0}[{1}]";
        d.field_of = "{0}.{1}";
        d.payload_single = "{0}.value";
        d.payload_indexed = "{0}.arg{1}";
        d.true_literal = "true";
        d.conjunction = " && ";
        d.disjunction = " || ";

        return d;
    }

    dialect make_assemblyscript() {
        dialect d = make_ecmascript_base();
        d.name = "assemblyscript";
        d.description = "AssemblyScript (closures, Math.pow, typed catch)";
        d.file_extension = ".ts";

        d.binary_templates[binary_operator::power] = "Math.pow({0}, {1})";
        // Copy before reversing; reverse() mutates in place
        d.unary_templates[unary_operator::reverse] = "(Array.from({0}).reverse())";
        d.catch_clause = "catch ({0}: any)";
        return d;
    }

    dialect make_typescript() {
        dialect d = make_ecmascript_base();
        d.name = "typescript";
        d.description = "TypeScript (exponent operator, spread copies)";
        d.file_extension = ".ts";

        d.binary_templates[binary_operator::power] = "({0} ** {1})";
        d.unary_templates[unary_operator::reverse] = "([...{0}].reverse())";
        return d;
    }
}

const dialect& assemblyscript_dialect() {
    static const dialect instance = make_assemblyscript();
    return instance;
}

const dialect& typescript_dialect() {
    static const dialect instance = make_typescript();
    return instance;
}

}  // namespace lumata::codegen
