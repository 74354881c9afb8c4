#ifndef JMODGEN_MODULE_MODULE_DEPS_H
# define JMODGEN_MODULE_MODULE_DEPS_H

# include <modules/jmodgen/filesystem/filesystem.h>
# include <modules/jmodgen/suite/suite.h>

# include <optional>
# include <string>
# include <unordered_map>
# include <unordered_set>
# include <vector>

namespace jmodgen {

/**
 * Where the module derived from a distribution is named, staged and packaged.
 */
struct module_info_t {
    std::string name;
    // <output_root>/modules/<name>
    filesystem::path_t staging_dir;
    // <output_root>/modules/<name>.jar
    filesystem::path_t jar;
};

/**
 * Derives a module name from a distribution name, e.g. "GRAAL_SDK" -> "graal.sdk".
 */
std::string module_name_of(const std::string& dist_name);

/**
 * module_deps_t
 *
 * Collects the distributions and java projects whose content makes up the module of a distribution.
 * Results are memoized per distribution until invalidated.
 */
class module_deps_t {
public:
    explicit module_deps_t(const suite_t& suite);

    /**
     * With `module_deps_equal_dist_deps` the result is `dist.archived_deps()`.
     *
     * Otherwise the `moduledeps` roots of `dist` are walked transitively, dependencies before dependents:
     * - roots must be distributions
     * - jdk libraries are neither included nor walked
     * - other distributions defining a module are neither included nor walked
     * - `dist` itself is walked but not included
     * - any kind other than distribution and java project is a configuration error
     */
    const std::vector<dependency_t*>& collect(const distribution_t& dist);

    /**
     * Distributions defining a module of their own that the content of `dist` depends on without
     * including them, in the order they are reached. Their modules belong on the module path of `dist`.
     *
     * In moduledeps mode these are the distributions pruned by `collect`. With `module_deps_equal_dist_deps`
     * they are the distributions the members of `collect(dist)` depend on directly.
     */
    const std::vector<const distribution_t*>& referenced_modules(const distribution_t& dist);

    /**
     * Returns std::nullopt if `dist` does not define a module, or throws if `fatal_if_not_module` is set.
     */
    std::optional<module_info_t> module_info(const distribution_t& dist, bool fatal_if_not_module);

    bool defines_module(const distribution_t& dist);

    void invalidate(const distribution_t& dist);

private:
    std::vector<dependency_t*> walk_moduledeps(const distribution_t& dist, std::vector<const distribution_t*>& referenced_modules);

private:
    const suite_t& m_suite;
    std::unordered_map<const distribution_t*, std::vector<dependency_t*>> m_module_deps;
    std::unordered_map<const distribution_t*, std::vector<const distribution_t*>> m_referenced_modules;
    std::unordered_set<const distribution_t*> m_collecting;
};

} // namespace jmodgen

#endif // JMODGEN_MODULE_MODULE_DEPS_H
