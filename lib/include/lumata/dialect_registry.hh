#pragma once

#include <lumata/codegen/dialect.hh>
#include <map>
#include <string>
#include <vector>

namespace lumata::codegen {

// ============================================================================
// Dialect Registry
// ============================================================================

/**
 * Singleton registry of target dialects.
 *
 * Built-in dialects are registered by the constructor. Lookup is
 * case-insensitive ("TypeScript" == "typescript").
 *
 * **Usage Example:**
 * \code
 *   auto& registry = DialectRegistry::instance();
 *   const dialect* target = registry.get_dialect("assemblyscript");
 *   if (target) {
 *       ExpressionRenderer renderer(*target, options);
 *   }
 * \endcode
 *
 * **Thread Safety:** The registry is populated on first access and read-only
 * afterwards.
 */
class DialectRegistry {
public:
    static DialectRegistry& instance();

    DialectRegistry(const DialectRegistry&) = delete;
    DialectRegistry(DialectRegistry&&) = delete;
    DialectRegistry& operator=(const DialectRegistry&) = delete;
    DialectRegistry& operator=(DialectRegistry&&) = delete;

    /**
     * Look up a dialect by name.
     *
     * @param name Dialect identifier (case-insensitive)
     * @return Pointer to dialect, or nullptr if not found
     */
    const dialect* get_dialect(const std::string& name) const;

    /**
     * Look up a dialect by name.
     *
     * @throws unknown_target_error if not found
     */
    const dialect& require_dialect(const std::string& name) const;

    bool has_dialect(const std::string& name) const;

    /// Registered dialect names (lowercase, sorted)
    std::vector<std::string> get_available_dialects() const;

private:
    DialectRegistry();

    void register_dialect(const dialect& d);

    static std::string normalize_name(const std::string& name);

    /// Dialect name (lowercase) -> table with static storage duration
    std::map<std::string, const dialect*> dialects_;
};

} // namespace lumata::codegen
