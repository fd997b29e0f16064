//
// Tests for ModuleRenderer
//

#include <doctest/doctest.h>
#include <lumata/ast_factory.hh>
#include <lumata/codegen.hh>
#include <lumata/codegen/expression_renderer.hh>
#include <lumata/codegen/module_renderer.hh>
#include <sstream>
#include <string>

using namespace lumata;
using namespace lumata::ast;
using namespace lumata::codegen;

namespace {
    function_def make_function(std::string name, std::vector<lambda_param> params,
                               std::string result_type, expr body) {
        function_def fn;
        fn.name = std::move(name);
        fn.params = std::move(params);
        fn.result_type = std::move(result_type);
        fn.body = std::move(body);
        return fn;
    }
}

TEST_SUITE("Codegen - Module Renderer") {

    TEST_CASE("Header and exported functions") {
        module_def module;
        module.name = "Demo";
        module.functions.push_back(make_function("inc", {lambda_param{"x", "i32"}}, "i32",
                                                 make_binary(binary_operator::add, make_var("x"), make_int(1))));
        module.functions.push_back(make_function("zero", {}, "", make_int(0)));

        std::string expected =
            "// Module: Demo\n"
            "// Generated by lumatac. Do not edit.\n"
            "\n"
            "export function inc(x: i32): i32 {\n"
            "    return (x + 1);\n"
            "}\n"
            "\n"
            "export function zero() {\n"
            "    return 0;\n"
            "}\n";
        CHECK(render_module(module) == expected);
    }

    TEST_CASE("Multi-line bodies move in by one level") {
        module_def module;
        module.name = "Demo";
        module.functions.push_back(make_function("pick", {lambda_param{"c", "bool"}}, "i32",
                                                 make_if(make_var("c"), make_int(1), make_int(2))));

        std::string expected =
            "// Module: Demo\n"
            "// Generated by lumatac. Do not edit.\n"
            "\n"
            "export function pick(c: bool): i32 {\n"
            "    return (() => {\n"
            "        if (c) {\n"
            "            return 1;\n"
            "        } else {\n"
            "            return 2;\n"
            "        }\n"
            "    })();\n"
            "}\n";
        CHECK(render_module(module) == expected);
    }

    TEST_CASE("Empty module is only the header") {
        module_def module;
        module.name = "Empty";
        CHECK(render_module(module) == "// Module: Empty\n// Generated by lumatac. Do not edit.\n");
    }

    TEST_CASE("A failing body leaves the stream untouched") {
        module_def module;
        module.name = "Broken";
        module.functions.push_back(make_function("ok", {}, "", make_int(1)));
        module.functions.push_back(make_function("bad", {}, "",
                                                 make_binary(static_cast<binary_operator>(99),
                                                             make_int(1), make_int(2))));

        ExpressionRenderer renderer(assemblyscript_dialect());
        std::ostringstream out;
        CHECK_THROWS_AS(ModuleRenderer(renderer).render(module, out), unknown_operator_error);
        CHECK(out.str().empty());
    }
}
