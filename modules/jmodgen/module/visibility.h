#ifndef JMODGEN_MODULE_VISIBILITY_H
# define JMODGEN_MODULE_VISIBILITY_H

# include "module_descriptor.h"

# include <cstdint>
# include <optional>
# include <string>

namespace jmodgen {

static const constexpr char* UNNAMED_MODULE = "<unnamed>";

enum class package_visibility_t : uint8_t {
    EXPORTED,
    CONCEALED
};

std::string to_string(package_visibility_t visibility);

struct package_lookup_t {
    const module_descriptor_t* module;
    package_visibility_t visibility;
};

/**
 * Searches `modulepath` in order for the module defining `package`.
 *
 * The first module that either exports or conceals `package` wins. An export is visible to `importer`
 * if it is unqualified or `importer` is one of its targets, otherwise the package is concealed.
 * Duplicate package ownership across modules is not detected.
 *
 * Returns std::nullopt if no module on the path defines `package`.
 */
std::optional<package_lookup_t> lookup_package(const modulepath_t& modulepath, const std::string& package, const std::string& importer);

} // namespace jmodgen

#endif // JMODGEN_MODULE_VISIBILITY_H
