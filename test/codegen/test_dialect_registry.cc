//
// Tests for Dialect Registry
//

#include <doctest/doctest.h>
#include <lumata/codegen.hh>
#include <lumata/dialect_registry.hh>
#include <algorithm>

using namespace lumata;
using namespace lumata::codegen;

TEST_SUITE("Codegen - Dialect Registry") {

    TEST_CASE("Singleton instance access") {
        auto& registry1 = DialectRegistry::instance();
        auto& registry2 = DialectRegistry::instance();

        CHECK(&registry1 == &registry2);
    }

    TEST_CASE("Built-in dialects registered") {
        auto& registry = DialectRegistry::instance();

        CHECK(registry.has_dialect("assemblyscript"));
        CHECK(registry.has_dialect("typescript"));
        CHECK(registry.has_dialect("TypeScript"));  // Case-insensitive
        CHECK(registry.has_dialect("ASSEMBLYSCRIPT"));
        CHECK_FALSE(registry.has_dialect("cpp"));
    }

    TEST_CASE("Case-insensitive lookup returns the same table") {
        auto& registry = DialectRegistry::instance();

        const dialect* as1 = registry.get_dialect("assemblyscript");
        const dialect* as2 = registry.get_dialect("AssemblyScript");

        REQUIRE(as1 != nullptr);
        CHECK(as1 == as2);
        CHECK(as1 == &assemblyscript_dialect());
    }

    TEST_CASE("Available dialects are sorted lowercase names") {
        auto names = DialectRegistry::instance().get_available_dialects();

        REQUIRE(names.size() >= 2);
        CHECK(std::is_sorted(names.begin(), names.end()));
        CHECK(std::find(names.begin(), names.end(), "assemblyscript") != names.end());
        CHECK(std::find(names.begin(), names.end(), "typescript") != names.end());
    }

    TEST_CASE("Unknown dialect") {
        auto& registry = DialectRegistry::instance();

        CHECK(registry.get_dialect("cobol") == nullptr);
        CHECK_THROWS_AS(registry.require_dialect("cobol"), unknown_target_error);
    }

    TEST_CASE("Every dialect covers all operators") {
        auto& registry = DialectRegistry::instance();

        for (const auto& name : registry.get_available_dialects()) {
            const dialect& d = registry.require_dialect(name);
            CAPTURE(name);
            CHECK(d.binary_templates.size() == 18);
            CHECK(d.unary_templates.size() == 6);
            CHECK_FALSE(d.description.empty());
        }
    }

    TEST_CASE("Dialects differ only where the targets differ") {
        const dialect& as = assemblyscript_dialect();
        const dialect& ts = typescript_dialect();

        CHECK(as.binary_templates.at(ast::binary_operator::power) == "Math.pow({0}, {1})");
        CHECK(ts.binary_templates.at(ast::binary_operator::power) == "({0} ** {1})");
        CHECK(as.catch_clause == "catch ({0}: any)");
        CHECK(ts.catch_clause == "catch ({0})");
        CHECK(as.binary_templates.at(ast::binary_operator::add) ==
              ts.binary_templates.at(ast::binary_operator::add));
    }
}
