//
// Tests for case and try assembly
//

#include <doctest/doctest.h>
#include <lumata/ast_factory.hh>
#include <lumata/codegen.hh>
#include <string>

using namespace lumata;
using namespace lumata::ast;
using namespace lumata::codegen;

TEST_SUITE("Codegen - Case") {

    TEST_CASE("Constructor arm with a wildcard fallback") {
        // case opt of Some(v) -> v | _ -> 0
        auto e = make_case(make_var("opt"), list_of<case_arm>(
            make_arm(make_constructor_pattern("Some", list_of<pattern>(make_variable_pattern("v"))), make_var("v")),
            make_arm(make_wildcard_pattern(), make_int(0))));

        std::string expected =
            "((valueToMatch: any) => {\n"
            "    if (valueToMatch instanceof Some && true) {\n"
            "        const v = valueToMatch.value;\n"
            "        return v;\n"
            "    } else {\n"
            "        return 0;\n"
            "    }\n"
            "})(opt)";
        CHECK(render_expression(e) == expected);
        CHECK(render_expression(e).find("No match found") == std::string::npos);
    }

    TEST_CASE("First matching arm wins") {
        // case n of 1 -> "a" | x -> "b"
        auto e = make_case(make_var("n"), list_of<case_arm>(
            make_arm(make_literal_pattern(make_int(1)), make_string("a")),
            make_arm(make_variable_pattern("x"), make_string("b"))));

        std::string expected =
            "((valueToMatch: any) => {\n"
            "    if (valueToMatch === 1) {\n"
            "        return \"a\";\n"
            "    } else {\n"
            "        const x = valueToMatch;\n"
            "        return \"b\";\n"
            "    }\n"
            "})(n)";
        CHECK(render_expression(e) == expected);
    }

    TEST_CASE("Refutable arms end in the unmatched throw") {
        auto e = make_case(make_var("xs"), list_of<case_arm>(
            make_arm(make_list_pattern({}), make_int(0)),
            make_arm(make_list_pattern(list_of<pattern>(make_variable_pattern("h")), make_variable_pattern("t")),
                     make_var("h"))));

        std::string expected =
            "((valueToMatch: any) => {\n"
            "    if (Array.isArray(valueToMatch) && valueToMatch.length === 0) {\n"
            "        return 0;\n"
            "    } else if (Array.isArray(valueToMatch) && valueToMatch.length >= 1 && true && true) {\n"
            "        const h = valueToMatch[0];\n"
            "        const t = valueToMatch.slice(1);\n"
            "        return h;\n"
            "    } else {\n"
            "        throw new Error(\"No match found for value: \" + String(valueToMatch));\n"
            "    }\n"
            "})(xs)";
        CHECK(render_expression(e) == expected);
    }

    TEST_CASE("A leading irrefutable arm becomes the whole body") {
        auto e = make_case(make_var("x"), list_of<case_arm>(
            make_arm(make_variable_pattern("y"), make_var("y")),
            make_arm(make_literal_pattern(make_int(1)), make_int(1))));

        std::string expected =
            "((valueToMatch: any) => {\n"
            "    const y = valueToMatch;\n"
            "    return y;\n"
            "})(x)";
        CHECK(render_expression(e) == expected);
    }

    TEST_CASE("Guards are conjoined with the structural test") {
        SUBCASE("Guard without pattern variables") {
            auto e = make_case(make_var("n"), list_of<case_arm>(
                make_guarded_arm(make_wildcard_pattern(), make_var("flag"), make_int(1)),
                make_arm(make_wildcard_pattern(), make_int(2))));

            std::string expected =
                "((valueToMatch: any) => {\n"
                "    if (true && (flag)) {\n"
                "        return 1;\n"
                "    } else {\n"
                "        return 2;\n"
                "    }\n"
                "})(n)";
            CHECK(render_expression(e) == expected);
        }

        SUBCASE("Guard sees the arm's bindings") {
            auto e = make_case(make_var("opt"), list_of<case_arm>(
                make_guarded_arm(make_constructor_pattern("Some", list_of<pattern>(make_variable_pattern("v"))),
                                 make_binary(binary_operator::greater_than, make_var("v"), make_int(0)),
                                 make_var("v")),
                make_arm(make_wildcard_pattern(), make_int(0))));

            std::string rendered = render_expression(e);
            CHECK(rendered.find("if (valueToMatch instanceof Some && true && "
                                "((() => { const v = valueToMatch.value; return (v > 0); })())) {")
                  != std::string::npos);
            CHECK(rendered.find("        const v = valueToMatch.value;\n        return v;") != std::string::npos);
        }

        SUBCASE("A guarded irrefutable arm does not end the chain") {
            auto e = make_case(make_var("n"), list_of<case_arm>(
                make_guarded_arm(make_variable_pattern("x"), make_var("ok"), make_int(1))));

            std::string rendered = render_expression(e);
            CHECK(rendered.find("No match found for value") != std::string::npos);
        }
    }

    TEST_CASE("Scrutinee is rendered once as the closure argument") {
        auto e = make_case(make_call(make_var("next"), {}), list_of<case_arm>(
            make_arm(make_wildcard_pattern(), make_int(0))));

        std::string rendered = render_expression(e);
        CHECK(rendered == "((valueToMatch: any) => {\n    return 0;\n})(next())");
    }

    TEST_CASE("Options rename the temporary and change the indent") {
        render_options opts;
        opts.scrutinee_name = "subject";
        opts.indent_size = 2;

        auto e = make_case(make_var("n"), list_of<case_arm>(
            make_arm(make_literal_pattern(make_int(0)), make_bool(true))));

        std::string expected =
            "((subject: any) => {\n"
            "  if (subject === 0) {\n"
            "    return true;\n"
            "  } else {\n"
            "    throw new Error(\"No match found for value: \" + String(subject));\n"
            "  }\n"
            "})(n)";
        CHECK(render_expression(e, opts) == expected);
    }

    TEST_CASE("Case without arms is malformed") {
        auto e = make_case(make_var("n"), {});
        CHECK_THROWS_AS(render_expression(e), unhandled_node_error);
    }

    TEST_CASE("Binding or-pattern aborts the whole render") {
        auto e = make_case(make_var("n"), list_of<case_arm>(
            make_arm(make_or_pattern(list_of<pattern>(make_variable_pattern("a"), make_wildcard_pattern())),
                     make_int(0))));
        CHECK_THROWS_AS(render_expression(e), unsupported_pattern_error);
    }
}

TEST_SUITE("Codegen - Try") {

    TEST_CASE("Catch arms replay the arm chain over the caught value") {
        auto e = make_try(make_call(make_var("risky"), {}), list_of<catch_arm>(
            make_catch(make_constructor_pattern("ParseError", list_of<pattern>(make_variable_pattern("msg"))),
                       make_var("msg"))));

        std::string expected =
            "(() => {\n"
            "    try {\n"
            "        return risky();\n"
            "    } catch (e: any) {\n"
            "        if (e instanceof ParseError && true) {\n"
            "            const msg = e.value;\n"
            "            return msg;\n"
            "        } else {\n"
            "            throw e;\n"
            "        }\n"
            "    }\n"
            "})()";
        CHECK(render_expression(e) == expected);
    }

    TEST_CASE("An irrefutable catch arm swallows every error") {
        auto e = make_try(make_call(make_var("risky"), {}), list_of<catch_arm>(
            make_catch(make_wildcard_pattern(), make_int(-1))));

        std::string expected =
            "(() => {\n"
            "    try {\n"
            "        return risky();\n"
            "    } catch (e: any) {\n"
            "        return (-1);\n"
            "    }\n"
            "})()";
        CHECK(render_expression(e) == expected);
    }

    TEST_CASE("TypeScript catch clause is untyped") {
        render_options opts;
        opts.target = "typescript";
        opts.catch_name = "err";

        auto e = make_try(make_var("x"), list_of<catch_arm>(
            make_catch(make_literal_pattern(make_string("eof")), make_int(0))));

        std::string rendered = render_expression(e, opts);
        CHECK(rendered.find("} catch (err) {") != std::string::npos);
        CHECK(rendered.find("if (err === \"eof\") {") != std::string::npos);
        CHECK(rendered.find("throw err;") != std::string::npos);
    }

    TEST_CASE("Try without catch arms is malformed") {
        auto e = make_try(make_var("x"), {});
        CHECK_THROWS_AS(render_expression(e), unhandled_node_error);
    }
}
