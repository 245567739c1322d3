/**
 * @file language_registry.hpp
 * @brief Static mapping from language identifiers to container runtimes
 * 
 * Each supported language resolves to an image, a source file extension and
 * a launch command (staged filename → argv). Several aliases may share one
 * LanguageSpec ("js" and "javascript"). Lookups are pure and case-insensitive
 * after whitespace trimming.
 * 
 * @date 2025
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace runcage {
namespace core {

/// Builds the in-container argv for a staged source file
using LaunchCommand = std::function<std::vector<std::string>(const std::string& filename)>;

/**
 * @struct LanguageSpec
 * @brief Immutable description of one language runtime
 */
struct LanguageSpec {
    std::string id;               ///< Canonical id ("python")
    std::string image;            ///< Runtime image reference
    std::string file_extension;   ///< Extension of the staged source (".py")
    LaunchCommand launch_command; ///< Filename → argv
    std::string display_name;     ///< Human-readable runtime ("Python 3.11")
    std::string description;      ///< Short runtime description
};

/**
 * @struct LanguageInfo
 * @brief Introspection record returned by ListLanguages()
 */
struct LanguageInfo {
    std::string id;              ///< Registered identifier (alias or canonical)
    std::string display_name;    ///< Runtime display name
    std::string file_extension;  ///< Source extension
    std::string image;           ///< Runtime image
    std::string description;     ///< Runtime description
};

/**
 * @class LanguageRegistry
 * @brief Language id → LanguageSpec lookup table
 * 
 * Built once (usually via Default()) and read-only afterwards, so a single
 * instance can be shared by concurrent executions without locking.
 * 
 * **Usage Example**:
 * @code
 * auto registry = LanguageRegistry::Default();
 * if (auto spec = registry.Resolve(" Python ")) {
 *     auto argv = spec->launch_command("code.py");  // {"python", "code.py"}
 * }
 * @endcode
 */
class LanguageRegistry {
public:
    LanguageRegistry() = default;

    /**
     * @brief Registry with the built-in languages
     * 
     * python/python3/py, javascript/js/node, bash/sh, ruby/rb, go/golang.
     */
    static LanguageRegistry Default();

    /**
     * @brief Register a language under one or more identifiers
     * @param spec Language description; spec.id is the canonical id
     * @param aliases Additional identifiers resolving to the same spec
     * 
     * @throws std::invalid_argument if an identifier is already registered
     *         or the LanguageSpec has no launch command
     */
    void Register(LanguageSpec spec, const std::vector<std::string>& aliases = {});

    /**
     * @brief Look up a language
     * @param language_id Identifier, matched case-insensitively after trimming
     * @return Spec if registered
     */
    std::optional<LanguageSpec> Resolve(const std::string& language_id) const;

    /**
     * @brief Look up a language or fail
     * @param language_id Identifier
     * @return Registered spec
     * 
     * @throws UnsupportedLanguageError listing all known ids, sorted
     */
    const LanguageSpec& Require(const std::string& language_id) const;

    /// Every registered identifier, sorted
    std::vector<std::string> KnownIds() const;

    /// One record per registered identifier, sorted by id
    std::vector<LanguageInfo> ListLanguages() const;

    bool Empty() const { return entries_.empty(); }

private:
    // Aliases share one LanguageSpec; ordered so listings come out sorted
    std::map<std::string, std::shared_ptr<const LanguageSpec>> entries_;

    static std::string NormalizeId(const std::string& language_id);
};

} // namespace core
} // namespace runcage
