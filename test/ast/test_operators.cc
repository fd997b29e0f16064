//
// Tests for operator tag names
//

#include <doctest/doctest.h>
#include <lumata/ast.hh>
#include <set>
#include <string>

using namespace lumata::ast;

TEST_SUITE("AST - Operators") {

    TEST_CASE("Binary operator names round-trip through the parser") {
        const binary_operator all[] = {
            binary_operator::add, binary_operator::subtract, binary_operator::multiply,
            binary_operator::divide, binary_operator::modulo, binary_operator::power,
            binary_operator::equal, binary_operator::not_equal, binary_operator::less_than,
            binary_operator::less_equal, binary_operator::greater_than, binary_operator::greater_equal,
            binary_operator::logical_and, binary_operator::logical_or, binary_operator::cons,
            binary_operator::append, binary_operator::compose, binary_operator::pipe,
        };

        std::set<std::string> names;
        for (auto op : all) {
            auto name = operator_name(op);
            REQUIRE(name.has_value());
            names.insert(std::string(*name));
            CHECK(parse_binary_operator(*name) == op);
        }
        CHECK(names.size() == 18);
    }

    TEST_CASE("Unary operator names") {
        CHECK(operator_name(unary_operator::negate) == "Negate");
        CHECK(operator_name(unary_operator::logical_not) == "Not");
        CHECK(parse_unary_operator("Reverse") == unary_operator::reverse);
        CHECK(parse_unary_operator("Head") == unary_operator::head);
    }

    TEST_CASE("Comparison tag spellings") {
        CHECK(parse_binary_operator("LessThanOrEqual") == binary_operator::less_equal);
        CHECK(parse_binary_operator("GreaterThanOrEqual") == binary_operator::greater_equal);
        CHECK(parse_binary_operator("And") == binary_operator::logical_and);
    }

    TEST_CASE("Unknown names and values") {
        CHECK_FALSE(parse_binary_operator("Xor").has_value());
        CHECK_FALSE(parse_binary_operator("add").has_value());  // Tags are case-sensitive
        CHECK_FALSE(parse_unary_operator("").has_value());
        CHECK_FALSE(operator_name(static_cast<binary_operator>(99)).has_value());
        CHECK_FALSE(operator_name(static_cast<unary_operator>(42)).has_value());
    }
}
