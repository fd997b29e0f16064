//
// Dialect Registry Implementation
//

#include <lumata/dialect_registry.hh>
#include <lumata/codegen.hh>
#include <algorithm>
#include <cctype>

namespace lumata::codegen {
    // ============================================================================
    // Singleton Access
    // ============================================================================

    DialectRegistry& DialectRegistry::instance() {
        static DialectRegistry registry;
        return registry;
    }

    DialectRegistry::DialectRegistry() {
        register_dialect(assemblyscript_dialect());
        register_dialect(typescript_dialect());
    }

    // ============================================================================
    // Registration & Lookup
    // ============================================================================

    void DialectRegistry::register_dialect(const dialect& d) {
        dialects_[normalize_name(d.name)] = &d;
    }

    const dialect* DialectRegistry::get_dialect(const std::string& name) const {
        auto it = dialects_.find(normalize_name(name));
        return (it != dialects_.end()) ? it->second : nullptr;
    }

    const dialect& DialectRegistry::require_dialect(const std::string& name) const {
        const dialect* d = get_dialect(name);
        if (!d) {
            throw unknown_target_error(name);
        }
        return *d;
    }

    bool DialectRegistry::has_dialect(const std::string& name) const {
        return dialects_.find(normalize_name(name)) != dialects_.end();
    }

    std::vector<std::string> DialectRegistry::get_available_dialects() const {
        std::vector<std::string> names;
        names.reserve(dialects_.size());
        for (const auto& [name, _] : dialects_) {
            names.push_back(name);
        }
        return names;
    }

    std::string DialectRegistry::normalize_name(const std::string& name) {
        std::string result = name;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }
} // namespace lumata::codegen
