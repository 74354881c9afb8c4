#ifndef JMODGEN_MODULE_MODULE_DESCRIPTOR_H
# define JMODGEN_MODULE_MODULE_DESCRIPTOR_H

# include <modules/jmodgen/filesystem/filesystem.h>

# include <map>
# include <optional>
# include <set>
# include <string>
# include <vector>

namespace jmodgen {

class distribution_t;

class module_descriptor_t;

/**
 * Package name to the set of modules it is exported to. An empty set is an unqualified export.
 */
using module_exports_t = std::map<std::string, std::set<std::string>>;

/**
 * Module name to its requires modifiers, e.g. "static" or "transitive".
 */
using module_requires_t = std::map<std::string, std::set<std::string>>;

/**
 * Module name to the set of its concealed packages that are imported anyway.
 */
using module_concealed_requires_t = std::map<std::string, std::set<std::string>>;

/**
 * Service type to the set of provider classes.
 */
using module_provides_t = std::map<std::string, std::set<std::string>>;

using modulepath_t = std::vector<const module_descriptor_t*>;

struct module_descriptor_args_t {
    std::string name;
    module_exports_t exports;
    module_requires_t requires_modules;
    module_concealed_requires_t concealed_requires;
    std::set<std::string> uses;
    module_provides_t provides;

    // defaults to the exported packages
    std::optional<std::set<std::string>> packages;

    std::optional<filesystem::path_t> archive_path;
    const distribution_t* origin = nullptr;
    modulepath_t modulepath;
    bool is_platform_module = false;
};

/**
 * module_descriptor_t
 *
 * Describes a Java module: the content of its `module-info.java` plus where it lives.
 *
 * Invariants:
 * - The name is never empty
 * - Every exported package is one of `packages()`
 *
 * Semantics:
 * - Immutable after construction
 * - Members of `modulepath()` and `origin()` are not owned
 */
class module_descriptor_t {
public:
    /**
     * Throws if `args.name` is empty or if an exported package is not in `args.packages`.
     */
    explicit module_descriptor_t(module_descriptor_args_t args);

    module_descriptor_t(const module_descriptor_t&) = delete;
    module_descriptor_t& operator=(const module_descriptor_t&) = delete;

    const std::string& name() const;
    const module_exports_t& exports() const;
    const module_requires_t& requires_modules() const;
    const module_concealed_requires_t& concealed_requires() const;
    const std::set<std::string>& uses() const;
    const module_provides_t& provides() const;
    const std::set<std::string>& packages() const;

    /**
     * Packages defined by but not exported from this module.
     */
    const std::set<std::string>& conceals() const;

    /**
     * Location of the module jar, if the module is packaged.
     */
    const std::optional<filesystem::path_t>& archive_path() const;

    /**
     * The distribution this module was synthesized from, nullptr for platform modules.
     */
    const distribution_t* origin() const;

    /**
     * The module path this module was resolved against, in resolution order.
     */
    const modulepath_t& modulepath() const;

    bool is_platform_module() const;

    /**
     * Renders the descriptor as the content of a `module-info.java` file.
     * Requires, exports, uses, provides and conceals are sorted, so equal descriptors render identically.
     * Jar path, distribution, module path and concealed requires are appended as comments.
     */
    std::string as_module_info() const;

private:
    std::string m_name;
    module_exports_t m_exports;
    module_requires_t m_requires;
    module_concealed_requires_t m_concealed_requires;
    std::set<std::string> m_uses;
    module_provides_t m_provides;
    std::set<std::string> m_packages;
    std::set<std::string> m_conceals;
    std::optional<filesystem::path_t> m_archive_path;
    const distribution_t* m_origin;
    modulepath_t m_modulepath;
    bool m_is_platform_module;
};

} // namespace jmodgen

#endif // JMODGEN_MODULE_MODULE_DESCRIPTOR_H
