#ifndef JMODGEN_MODULE_SYNTHESIZER_H
# define JMODGEN_MODULE_SYNTHESIZER_H

# include "module_deps.h"
# include "module_descriptor.h"

# include <memory>
# include <set>
# include <string>

namespace jmodgen {

class session_t;

/**
 * Expands the `<package-info>` marker in `packages` to the packages of `project` that carry a `package-info.java`.
 */
std::set<std::string> expand_package_info(const java_project_t& project, const std::vector<std::string>& packages);

/**
 * Derives the module descriptor of `dist`.
 *
 * The module path consists of the modules of the distributions `dist` depends on directly, then the modules
 * its content reaches through `module_deps_t::referenced_modules`, followed by the platform modules. The modules
 * of those distributions are obtained through `session` and may be synthesized first.
 *
 * Throws configuration_error_t if a project exports a package the module does not define. Service providers are read from `META-INF/services` entries of the jars of `dist` and of its module deps.
 *
 * Nothing is packaged or persisted for `dist` itself.
 */
std::unique_ptr<module_descriptor_t> synthesize(session_t& session, const distribution_t& dist, const module_info_t& module_info);

} // namespace jmodgen

#endif // JMODGEN_MODULE_SYNTHESIZER_H
