//
// Operator tag names
//

#include <lumata/ast.hh>
#include <array>
#include <utility>

namespace lumata::ast {

namespace {
    constexpr std::array<std::pair<binary_operator, std::string_view>, 18> binary_names = {{
        {binary_operator::add,           "Add"},
        {binary_operator::subtract,      "Subtract"},
        {binary_operator::multiply,      "Multiply"},
        {binary_operator::divide,        "Divide"},
        {binary_operator::modulo,        "Modulo"},
        {binary_operator::power,         "Power"},
        {binary_operator::equal,         "Equal"},
        {binary_operator::not_equal,     "NotEqual"},
        {binary_operator::less_than,     "LessThan"},
        {binary_operator::less_equal,    "LessThanOrEqual"},
        {binary_operator::greater_than,  "GreaterThan"},
        {binary_operator::greater_equal, "GreaterThanOrEqual"},
        {binary_operator::logical_and,   "And"},
        {binary_operator::logical_or,    "Or"},
        {binary_operator::cons,          "Cons"},
        {binary_operator::append,        "Append"},
        {binary_operator::compose,       "Compose"},
        {binary_operator::pipe,          "Pipe"},
    }};

    constexpr std::array<std::pair<unary_operator, std::string_view>, 6> unary_names = {{
        {unary_operator::negate,      "Negate"},
        {unary_operator::logical_not, "Not"},
        {unary_operator::length,      "Length"},
        {unary_operator::head,        "Head"},
        {unary_operator::tail,        "Tail"},
        {unary_operator::reverse,     "Reverse"},
    }};
}

std::optional<std::string_view> operator_name(binary_operator op) {
    for (const auto& [tag, name] : binary_names) {
        if (tag == op) {
            return name;
        }
    }
    return std::nullopt;
}

std::optional<std::string_view> operator_name(unary_operator op) {
    for (const auto& [tag, name] : unary_names) {
        if (tag == op) {
            return name;
        }
    }
    return std::nullopt;
}

std::optional<binary_operator> parse_binary_operator(std::string_view name) {
    for (const auto& [tag, tag_name] : binary_names) {
        if (tag_name == name) {
            return tag;
        }
    }
    return std::nullopt;
}

std::optional<unary_operator> parse_unary_operator(std::string_view name) {
    for (const auto& [tag, tag_name] : unary_names) {
        if (tag_name == name) {
            return tag;
        }
    }
    return std::nullopt;
}

}  // namespace lumata::ast
