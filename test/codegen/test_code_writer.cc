//
// Unit tests for CodeWriter, ScriptCodeWriter and RAII block classes
//

#include <doctest/doctest.h>
#include <lumata/codegen/code_writer.hh>
#include <lumata/codegen/dialect.hh>
#include <lumata/codegen/script_code_writer.hh>
#include <sstream>
#include <string>

using namespace lumata::codegen;

// ============================================================================
// CodeWriter Basic Tests
// ============================================================================

TEST_CASE("CodeWriter: Basic output") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    SUBCASE("Write single line") {
        writer.write_line("hello");
        CHECK(oss.str() == "hello\n");
    }

    SUBCASE("Write raw text") {
        writer.write_raw("raw");
        CHECK(oss.str() == "raw");
    }

    SUBCASE("Blank lines carry no indentation") {
        writer.indent();
        writer.write_blank_line();
        writer.write_line("");
        CHECK(oss.str() == "\n\n");
    }

    SUBCASE("Embedded newlines are written verbatim") {
        writer.indent();
        writer.write_line("first\nsecond");
        CHECK(oss.str() == "    first\nsecond\n");
    }
}

TEST_CASE("CodeWriter: Indentation") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    SUBCASE("Multiple indent levels") {
        writer.indent();
        writer.indent();
        writer.write_line("double indented");
        CHECK(oss.str() == "        double indented\n");
        CHECK(writer.current_indent_level() == 2);
    }

    SUBCASE("Unindent at level 0 is safe") {
        writer.unindent();
        writer.write_line("no indent");
        CHECK(oss.str() == "no indent\n");
    }

    SUBCASE("Custom indent string") {
        writer.set_indent_string("  ");
        writer.indent();
        writer.write_line("two spaces");
        CHECK(oss.str() == "  two spaces\n");
    }
}

TEST_CASE("CodeWriter: Streaming") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    writer.indent();
    writer << "const n = " << 42 << ";" << endl << blank;
    CHECK(oss.str() == "    const n = 42;\n\n");
}

// ============================================================================
// Block Tests
// ============================================================================

TEST_CASE("IfBlock: chains") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    SUBCASE("If-else-if-else") {
        {
            auto if_block = writer.write_if("x > 0");
            writer.write_line("return 1;");

            auto else_if_block = if_block.write_else_if("x < 0");
            writer.write_line("return -1;");

            auto else_block = else_if_block.write_else();
            writer.write_line("return 0;");
        }

        std::string expected = "if (x > 0) {\n"
                               "    return 1;\n"
                               "} else if (x < 0) {\n"
                               "    return -1;\n"
                               "} else {\n"
                               "    return 0;\n"
                               "}\n";
        CHECK(oss.str() == expected);
    }

    SUBCASE("Move assignment continues the chain") {
        {
            IfBlock chain = writer.write_if("a");
            writer.write_line("return 1;");
            chain = chain.write_else_if("b");
            writer.write_line("return 2;");
        }

        std::string expected = "if (a) {\n"
                               "    return 1;\n"
                               "} else if (b) {\n"
                               "    return 2;\n"
                               "}\n";
        CHECK(oss.str() == expected);
    }
}

TEST_CASE("TryBlock: catch clause") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    {
        auto try_block = writer.write_try();
        writer.write_line("return risky();");

        auto catch_block = try_block.write_catch("catch (e: any)");
        writer.write_line("throw e;");
    }

    std::string expected = "try {\n"
                           "    return risky();\n"
                           "} catch (e: any) {\n"
                           "    throw e;\n"
                           "}\n";
    CHECK(oss.str() == expected);
}

TEST_CASE("BracedBlock: custom footer") {
    std::ostringstream oss;
    CodeWriter writer(oss);

    {
        auto block = writer.write_braced("(() => {", "})()");
        writer.write_line("return 1;");
    }

    CHECK(oss.str() == "(() => {\n    return 1;\n})()\n");
}

// ============================================================================
// ScriptCodeWriter Tests
// ============================================================================

TEST_CASE("ScriptCodeWriter: statements") {
    std::ostringstream oss;
    ScriptCodeWriter writer(oss, assemblyscript_dialect());

    writer.write_const("x", "1");
    writer.write_expression_statement("log(x)");
    writer.write_return("x");
    writer.write_comment("done");

    CHECK(oss.str() == "const x = 1;\nlog(x);\nreturn x;\n// done\n");
}

TEST_CASE("ScriptCodeWriter: closures") {
    std::ostringstream oss;
    ScriptCodeWriter writer(oss, assemblyscript_dialect(), 2);

    SUBCASE("Scrutinee closure") {
        {
            auto closure = writer.write_scrutinee_closure("valueToMatch", "xs");
            writer.write_return("valueToMatch");
        }
        CHECK(oss.str() == "((valueToMatch: any) => {\n  return valueToMatch;\n})(xs)\n");
    }

    SUBCASE("Lambda") {
        {
            auto lambda = writer.write_lambda("x: i32");
            writer.write_return("x");
        }
        CHECK(oss.str() == "((x: i32) => {\n  return x;\n})\n");
    }

    SUBCASE("Function with and without result type") {
        {
            auto fn = writer.write_function("id", "x: i32", "i32");
            writer.write_return("x");
        }
        {
            auto fn = writer.write_function("unit", "", "");
            writer.write_return("0");
        }
        CHECK(oss.str() == "export function id(x: i32): i32 {\n  return x;\n}\n"
                           "export function unit() {\n  return 0;\n}\n");
    }
}

TEST_CASE("ScriptCodeWriter: negative indent width is treated as zero") {
    std::ostringstream oss;
    ScriptCodeWriter writer(oss, typescript_dialect(), -3);

    {
        auto closure = writer.write_invoked_closure();
        writer.write_return("1");
    }

    CHECK(oss.str() == "(() => {\nreturn 1;\n})()\n");
}
