#ifndef JMODGEN_MODULE_SESSION_H
# define JMODGEN_MODULE_SESSION_H

# include <modules/jmodgen/jdk/jdk.h>
# include <modules/jmodgen/suite/suite.h>
# include "module_deps.h"
# include "module_descriptor.h"

# include <memory>
# include <unordered_map>
# include <unordered_set>

namespace jmodgen {

/**
 * session_t
 *
 * Owns a suite, the jdk it is compiled against and every module descriptor derived from its distributions.
 *
 * Descriptors returned by the session stay valid until the distribution they derive from
 * (or one on their module path) is invalidated, or the session is destroyed.
 *
 * Not thread safe, use one session per thread.
 */
class session_t {
public:
    session_t(suite_t suite, jdk_t jdk);

    session_t(const session_t&) = delete;
    session_t& operator=(const session_t&) = delete;

    const suite_t& suite() const;
    const jdk_t& jdk() const;
    module_deps_t& module_deps();

    /**
     * Returns the module created from `dist` by this session or by an earlier run.
     * If it was never created, returns nullptr or throws cache_miss_error_t if `fatal_if_not_created` is set.
     */
    const module_descriptor_t* as_java_module(const distribution_t& dist, bool fatal_if_not_created);

    /**
     * Synthesizes the module of `dist`, packages it and persists its descriptor.
     * Returns nullptr if `dist` does not define a module.
     */
    const module_descriptor_t* make_java_module(const distribution_t& dist);

    /**
     * The module of `dist` created by this session, then an earlier run, then made from scratch.
     */
    const module_descriptor_t* java_module(const distribution_t& dist);

    /**
     * Forgets the module deps and module of `dist` together with every module resolved against it.
     * Persisted descriptors are kept.
     */
    void invalidate(const distribution_t& dist);

private:
    const module_descriptor_t* memoize(const distribution_t& dist, std::unique_ptr<module_descriptor_t> descriptor);

private:
    suite_t m_suite;
    jdk_t m_jdk;
    module_deps_t m_module_deps;
    std::unordered_map<const distribution_t*, std::unique_ptr<module_descriptor_t>> m_java_modules;
    std::unordered_set<const distribution_t*> m_in_progress;
};

} // namespace jmodgen

#endif // JMODGEN_MODULE_SESSION_H
