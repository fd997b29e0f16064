//
// String Utilities for Code Generation
//
// - String literal escaping
// - Positional template substitution for dialect tables
//

#pragma once

#include <initializer_list>
#include <string>
#include <string_view>

namespace lumata::codegen {

/**
 * Escape special characters in a string for use in a double-quoted
 * target-language string literal.
 *
 * Handles: newlines (\n), carriage returns (\r), tabs (\t), NUL (\0),
 * backslashes (\\), and double quotes (\").
 */
inline std::string escape_string_literal(std::string_view str) {
    std::string result;
    result.reserve(str.size() + str.size() / 4);

    for (char c : str) {
        switch (c) {
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\0': result += "\\0"; break;
            case '\\': result += "\\\\"; break;
            case '"':  result += "\\\""; break;
            default:   result += c; break;
        }
    }

    return result;
}

/**
 * Substitute positional placeholders {0}..{9} in a template.
 *
 * Placeholders referring to a missing argument are left untouched, as is any
 * brace not followed by a digit and a closing brace (so object-literal braces
 * in templates survive).
 */
inline std::string fill_template(std::string_view tmpl,
                                 std::initializer_list<std::string_view> args) {
    std::string result;
    result.reserve(tmpl.size() + 32);

    for (size_t i = 0; i < tmpl.size(); ++i) {
        if (tmpl[i] == '{' && i + 2 < tmpl.size() &&
            tmpl[i + 1] >= '0' && tmpl[i + 1] <= '9' && tmpl[i + 2] == '}') {
            auto index = static_cast<size_t>(tmpl[i + 1] - '0');
            if (index < args.size()) {
                result += *(args.begin() + index);
                i += 2;
                continue;
            }
        }
        result += tmpl[i];
    }

    return result;
}

}  // namespace lumata::codegen
