//
// Tests for TreeLoader
//

#include <doctest/doctest.h>
#include <lumata/codegen.hh>
#include <lumata/loader/tree_loader.hh>
#include <cstdio>
#include <fstream>
#include <string>
#include <variant>

using namespace lumata;
using namespace lumata::loader;

TEST_SUITE("Loader - Tree Loader") {

    TEST_CASE("Binary operation document") {
        TreeLoader loader;
        auto e = loader.load_expression(R"(
kind: BinaryOp
operator: Add
left:
  kind: IntLiteral
  value: 1
right:
  kind: IntLiteral
  value: 2
)");

        REQUIRE(std::holds_alternative<ast::binary_op>(e.node));
        CHECK(std::get<ast::binary_op>(e.node).op == ast::binary_operator::add);
        CHECK(codegen::render_expression(e) == "(1 + 2)");
    }

    TEST_CASE("Expression wrapped under 'expression:'") {
        TreeLoader loader;
        auto e = loader.load_expression(R"(
expression:
  kind: UnaryOp
  operator: Not
  operand:
    kind: BoolLiteral
    value: true
)");
        CHECK(codegen::render_expression(e) == "(!true)");
    }

    TEST_CASE("JSON documents are accepted") {
        TreeLoader loader;
        auto e = loader.load_expression(
            R"({"kind": "FunctionCall", "function": {"kind": "Variable", "name": "f"},)"
            R"( "arguments": [{"kind": "StringLiteral", "value": "a"}, {"kind": "IntLiteral", "value": 3}]})");
        CHECK(codegen::render_expression(e) == "f(\"a\", 3)");
    }

    TEST_CASE("Case with patterns, guard and wildcard") {
        TreeLoader loader;
        auto e = loader.load_expression(R"(
kind: Case
scrutinee:
  kind: Variable
  name: opt
patterns:
  - pattern:
      kind: ConstructorPattern
      constructor: Some
      args:
        - kind: VariablePattern
          name: v
    expression:
      kind: Variable
      name: v
  - pattern:
      kind: WildcardPattern
    expression:
      kind: IntLiteral
      value: 0
)");

        std::string expected =
            "((valueToMatch: any) => {\n"
            "    if (valueToMatch instanceof Some && true) {\n"
            "        const v = valueToMatch.value;\n"
            "        return v;\n"
            "    } else {\n"
            "        return 0;\n"
            "    }\n"
            "})(opt)";
        CHECK(codegen::render_expression(e) == expected);
    }

    TEST_CASE("Ordered record fields and list patterns") {
        TreeLoader loader;
        auto e = loader.load_expression(R"(
kind: Case
scrutinee:
  kind: RecordCreation
  record_type: Point
  fields:
    - name: y
      value: {kind: IntLiteral, value: 2}
    - name: x
      value: {kind: IntLiteral, value: 1}
patterns:
  - pattern:
      kind: ListPattern
      elements:
        - kind: VariablePattern
          name: h
      tail:
        kind: VariablePattern
        name: t
    expression:
      kind: Variable
      name: t
)");

        std::string rendered = codegen::render_expression(e);
        CHECK(rendered.find("})(new Point({ \"y\": 2, \"x\": 1 }))") != std::string::npos);
        CHECK(rendered.find("const t = valueToMatch.slice(1);") != std::string::npos);
    }

    TEST_CASE("Try, let, do and collection operators") {
        TreeLoader loader;

        auto try_expr = loader.load_expression(R"(
kind: Try
body: {kind: FunctionCall, function: {kind: Variable, name: risky}, arguments: []}
catch_patterns:
  - pattern: {kind: WildcardPattern}
    handler: {kind: IntLiteral, value: 0}
)");
        CHECK(std::holds_alternative<ast::try_expr>(try_expr.node));

        auto let_expr = loader.load_expression(R"(
kind: Let
bindings:
  - name: a
    value: {kind: IntLiteral, value: 1}
body: {kind: Variable, name: a}
)");
        CHECK(codegen::render_expression(let_expr) == "(() => {\n    const a = 1;\n    return a;\n})()");

        auto do_expr = loader.load_expression(R"(
kind: Do
statements:
  - kind: Bind
    name: x
    value: {kind: IntLiteral, value: 1}
  - kind: ExpressionStatement
    expr: {kind: FunctionCall, function: {kind: Variable, name: log}, arguments: [{kind: Variable, name: x}]}
return: {kind: Variable, name: x}
)");
        CHECK(codegen::render_expression(do_expr) == "(() => {\n    const x = 1;\n    log(x);\n    return x;\n})()");

        auto fold = loader.load_expression(R"(
kind: Fold
collection: {kind: Variable, name: xs}
accumulator: {kind: IntLiteral, value: 0}
acc_name: acc
iterator: x
transform:
  kind: BinaryOp
  operator: Add
  left: {kind: Variable, name: acc}
  right: {kind: Variable, name: x}
)");
        CHECK(codegen::render_expression(fold) == "xs.reduce((acc, x) => (acc + x), 0)");

        auto annotated = loader.load_expression(R"(
kind: TypeAnnotation
expr: {kind: Variable, name: n}
annotation: i64
)");
        CHECK(codegen::render_expression(annotated) == "(n as i64)");
    }

    TEST_CASE("Module document") {
        TreeLoader loader;
        auto module = loader.load_module(R"(
module: Demo
functions:
  - name: inc
    params:
      - name: x
        type: i32
    result: i32
    body:
      kind: BinaryOp
      operator: Add
      left: {kind: Variable, name: x}
      right: {kind: IntLiteral, value: 1}
  - name: greet
    body: {kind: StringLiteral, value: hi}
)");

        CHECK(module.name == "Demo");
        REQUIRE(module.functions.size() == 2);
        CHECK(module.functions[0].params.size() == 1);
        CHECK(module.functions[0].params[0].type_name == "i32");
        CHECK(module.functions[0].result_type == "i32");
        CHECK(module.functions[1].result_type.empty());

        std::string rendered = codegen::render_module(module);
        CHECK(rendered.find("export function inc(x: i32): i32 {\n    return (x + 1);\n}") != std::string::npos);
        CHECK(rendered.find("export function greet() {\n    return \"hi\";\n}") != std::string::npos);
    }

    TEST_CASE("Loading from a file") {
        const std::string path = "lumata_loader_test.yaml";
        {
            std::ofstream out(path);
            out << "kind: Variable\nname: answer\n";
        }

        TreeLoader loader;
        auto e = loader.load_expression_file(path);
        CHECK(codegen::render_expression(e) == "answer");

        std::remove(path.c_str());
    }

    TEST_CASE("Structural errors") {
        TreeLoader loader;

        SUBCASE("Unknown kind") {
            CHECK_THROWS_WITH_AS(loader.load_expression("kind: Frobnicate\n"),
                                 doctest::Contains("unknown expression kind"), tree_load_error);
        }

        SUBCASE("Missing kind") {
            CHECK_THROWS_AS(loader.load_expression("name: x\n"), tree_load_error);
        }

        SUBCASE("Missing required field names the kind and field") {
            try {
                (void)loader.load_expression("kind: FieldAccess\nfield: x\n");
                FAIL("expected tree_load_error");
            } catch (const tree_load_error& e) {
                CHECK(e.kind() == "FieldAccess");
                CHECK(std::string(e.what()).find("'target'") != std::string::npos);
            }
        }

        SUBCASE("Mistyped field") {
            CHECK_THROWS_AS(loader.load_expression("kind: IntLiteral\nvalue: one\n"), tree_load_error);
        }

        SUBCASE("Non-string record field name") {
            CHECK_THROWS_WITH_AS(loader.load_expression(R"(
kind: RecordLiteral
fields:
  1: {kind: IntLiteral, value: 1}
)"),
                                 doctest::Contains("field names must be strings"), tree_load_error);

            CHECK_THROWS_AS(loader.load_expression(R"(
kind: Case
scrutinee: {kind: Variable, name: r}
patterns:
  - pattern:
      kind: RecordPattern
      fields:
        true: {kind: WildcardPattern}
    expression: {kind: IntLiteral, value: 0}
)"),
                            tree_load_error);
        }

        SUBCASE("Unknown pattern kind") {
            CHECK_THROWS_WITH_AS(loader.load_expression(R"(
kind: Case
scrutinee: {kind: Variable, name: x}
patterns:
  - pattern: {kind: RegexPattern}
    expression: {kind: IntLiteral, value: 0}
)"),
                                 doctest::Contains("unknown pattern kind"), tree_load_error);
        }

        SUBCASE("Unknown operator name") {
            CHECK_THROWS_AS(loader.load_expression(R"(
kind: BinaryOp
operator: Xor
left: {kind: IntLiteral, value: 1}
right: {kind: IntLiteral, value: 2}
)"),
                            codegen::unknown_operator_error);
        }

        SUBCASE("Missing file") {
            CHECK_THROWS_AS(loader.load_module_file("does/not/exist.yaml"), tree_load_error);
        }

        SUBCASE("Module without a name") {
            CHECK_THROWS_AS(loader.load_module("functions: []\n"), tree_load_error);
        }
    }
}
