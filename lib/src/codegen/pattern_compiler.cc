//
// Pattern Compiler Implementation
//

#include <lumata/codegen/pattern_compiler.hh>
#include <lumata/codegen/expression_renderer.hh>
#include <lumata/codegen/string_utils.hh>
#include <lumata/codegen.hh>
#include <iterator>
#include <variant>

namespace lumata::codegen {

// One overload per pattern variant: a new variant without a rule fails to compile
struct PatternCompiler::visitor {
    const PatternCompiler& self;
    const std::string& ref;

    pattern_match operator()(const ast::wildcard_pattern& p) const { return self.compile_wildcard(p, ref); }
    pattern_match operator()(const ast::variable_pattern& p) const { return self.compile_variable(p, ref); }
    pattern_match operator()(const ast::literal_pattern& p) const { return self.compile_literal(p, ref); }
    pattern_match operator()(const ast::constructor_pattern& p) const { return self.compile_constructor(p, ref); }
    pattern_match operator()(const ast::record_pattern& p) const { return self.compile_record(p, ref); }
    pattern_match operator()(const ast::list_pattern& p) const { return self.compile_list(p, ref); }
    pattern_match operator()(const ast::as_pattern& p) const { return self.compile_as(p, ref); }
    pattern_match operator()(const ast::or_pattern& p) const { return self.compile_or(p, ref); }
};

// ============================================================================
// Construction
// ============================================================================

PatternCompiler::PatternCompiler(const dialect& target, const ExpressionRenderer& literals)
    : target_(target), literals_(literals)
{
}

// ============================================================================
// Public API
// ============================================================================

pattern_match PatternCompiler::compile(const ast::pattern& pat, const std::string& value_ref) const {
    if (pat.node.valueless_by_exception()) {
        throw unsupported_pattern_error("valueless pattern node");
    }
    return std::visit(visitor{*this, value_ref}, pat.node);
}

// ============================================================================
// Private: Per-Variant Compilation
// ============================================================================

pattern_match PatternCompiler::compile_wildcard(const ast::wildcard_pattern&, const std::string&) const {
    return pattern_match{target_.true_literal, {}, true};
}

pattern_match PatternCompiler::compile_variable(const ast::variable_pattern& pat, const std::string& ref) const {
    // Always matches; the bind is the only effect
    return pattern_match{target_.true_literal, {binding{pat.name, ref}}, true};
}

pattern_match PatternCompiler::compile_literal(const ast::literal_pattern& pat, const std::string& ref) const {
    if (!pat.value) {
        throw unsupported_pattern_error("literal pattern without a value");
    }
    // === on a list or record compares references and would never match
    if (!std::holds_alternative<ast::int_literal>(pat.value->node) &&
        !std::holds_alternative<ast::string_literal>(pat.value->node) &&
        !std::holds_alternative<ast::bool_literal>(pat.value->node)) {
        throw unsupported_pattern_error("literal pattern must be an integer, string or boolean literal");
    }
    return pattern_match{fill_template(target_.equality_test, {ref, literals_.render(*pat.value)}), {}, false};
}

pattern_match PatternCompiler::compile_constructor(const ast::constructor_pattern& pat, const std::string& ref) const {
    std::vector<std::string> conditions{fill_template(target_.instance_test, {ref, pat.constructor})};
    std::vector<binding> bindings;

    for (size_t i = 0; i < pat.args.size(); ++i) {
        std::string payload = (pat.args.size() == 1)
            ? fill_template(target_.payload_single, {ref})
            : fill_template(target_.payload_indexed, {ref, std::to_string(i)});
        absorb(conditions, bindings, compile(pat.args[i], payload));
    }

    return pattern_match{conjoin(conditions), std::move(bindings), false};
}

pattern_match PatternCompiler::compile_record(const ast::record_pattern& pat, const std::string& ref) const {
    std::vector<std::string> conditions{fill_template(target_.not_null_test, {ref})};
    std::vector<binding> bindings;

    for (const auto& field : pat.fields) {
        if (!field.value) {
            throw unsupported_pattern_error("record pattern field '" + field.name + "' without a pattern");
        }
        absorb(conditions, bindings, compile(*field.value, fill_template(target_.field_of, {ref, field.name})));
    }

    return pattern_match{conjoin(conditions), std::move(bindings), false};
}

pattern_match PatternCompiler::compile_list(const ast::list_pattern& pat, const std::string& ref) const {
    const std::string count = std::to_string(pat.elements.size());

    // Exact length unless a non-wildcard tail absorbs the rest
    bool exact = !pat.tail || std::holds_alternative<ast::wildcard_pattern>(pat.tail->node);
    std::string length_check = fill_template(exact ? target_.length_exact : target_.length_at_least,
                                             {ref, count});

    // Length is tested before any element is indexed
    std::vector<std::string> conditions{fill_template(target_.array_test, {ref}), length_check};
    std::vector<binding> bindings;

    for (size_t i = 0; i < pat.elements.size(); ++i) {
        absorb(conditions, bindings,
               compile(pat.elements[i], fill_template(target_.element_at, {ref, std::to_string(i)})));
    }

    if (pat.tail) {
        absorb(conditions, bindings, compile(*pat.tail, fill_template(target_.slice_from, {ref, count})));
    }

    return pattern_match{conjoin(conditions), std::move(bindings), false};
}

pattern_match PatternCompiler::compile_as(const ast::as_pattern& pat, const std::string& ref) const {
    if (!pat.inner) {
        throw unsupported_pattern_error("as-pattern '" + pat.name + "' without an inner pattern");
    }

    pattern_match inner = compile(*pat.inner, ref);

    // Whole-value binding precedes the inner bindings
    std::vector<binding> bindings{binding{pat.name, ref}};
    bindings.insert(bindings.end(),
                    std::make_move_iterator(inner.bindings.begin()),
                    std::make_move_iterator(inner.bindings.end()));

    return pattern_match{std::move(inner.condition), std::move(bindings), inner.irrefutable};
}

pattern_match PatternCompiler::compile_or(const ast::or_pattern& pat, const std::string& ref) const {
    if (pat.alternatives.empty()) {
        throw unsupported_pattern_error("or-pattern without alternatives");
    }

    std::string condition = "(";
    bool irrefutable = false;

    for (size_t i = 0; i < pat.alternatives.size(); ++i) {
        pattern_match alt = compile(pat.alternatives[i], ref);

        // Which alternative matched is unknown at run time, so its bindings
        // cannot be emitted
        if (!alt.bindings.empty()) {
            std::string names;
            for (const auto& b : alt.bindings) {
                if (!names.empty()) names += ", ";
                names += b.name;
            }
            throw unsupported_pattern_error("or-pattern alternative " + std::to_string(i) +
                                            " binds variables (" + names + ")");
        }

        if (i > 0) condition += target_.disjunction;
        condition += "(" + alt.condition + ")";
        irrefutable = irrefutable || alt.irrefutable;
    }

    condition += ")";
    return pattern_match{std::move(condition), {}, irrefutable};
}

// ============================================================================
// Private: Helpers
// ============================================================================

void PatternCompiler::absorb(std::vector<std::string>& conditions,
                             std::vector<binding>& bindings,
                             pattern_match sub) {
    conditions.push_back(std::move(sub.condition));
    bindings.insert(bindings.end(),
                    std::make_move_iterator(sub.bindings.begin()),
                    std::make_move_iterator(sub.bindings.end()));
}

std::string PatternCompiler::conjoin(const std::vector<std::string>& conditions) const {
    std::string result;
    for (size_t i = 0; i < conditions.size(); ++i) {
        if (i > 0) result += target_.conjunction;
        result += conditions[i];
    }
    return result;
}

}  // namespace lumata::codegen
