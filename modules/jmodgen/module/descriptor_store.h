#ifndef JMODGEN_MODULE_DESCRIPTOR_STORE_H
# define JMODGEN_MODULE_DESCRIPTOR_STORE_H

# include <modules/jmodgen/filesystem/filesystem.h>
# include "module_descriptor.h"

# include <cstdint>
# include <memory>
# include <optional>
# include <string>
# include <vector>

namespace jmodgen {

class distribution_t;
class session_t;

/**
 * Persisted form of a distribution's module descriptor.
 * References to other descriptors are replaced by names: platform modules by their module name,
 * distribution modules by `dist:<distribution name>`.
 */
struct module_descriptor_snapshot_t {
    static const constexpr char* DIST_PREFIX = "dist:";

    std::string name;
    module_exports_t exports;
    module_requires_t requires_modules;
    module_concealed_requires_t concealed_requires;
    std::set<std::string> uses;
    module_provides_t provides;
    std::set<std::string> packages;
    std::optional<std::string> jarpath;
    std::string dist;
    std::vector<std::string> modulepath;
};

/**
 * Returns the persisted form of `descriptor`, which must be derived from a distribution.
 */
module_descriptor_snapshot_t snapshot(const module_descriptor_t& descriptor);

/**
 * CBOR encoding of a snapshot.
 */
std::vector<std::uint8_t> to_cbor(const module_descriptor_snapshot_t& snapshot);
module_descriptor_snapshot_t from_cbor(const std::vector<std::uint8_t>& cbor, const std::string& source);

/**
 * The file a distribution module's descriptor is persisted to, a sibling of the module jar.
 */
filesystem::path_t descriptor_path(const filesystem::path_t& module_jar);

/**
 * Persists `descriptor` next to its module jar and returns the path written.
 * Platform modules are not persisted, std::nullopt is returned for them.
 */
std::optional<filesystem::path_t> save(const module_descriptor_t& descriptor);

/**
 * Reads the descriptor persisted for `dist`, resolving its module path through `session`.
 * If nothing was persisted, returns nullptr or throws cache_miss_error_t if `fatal_if_missing` is set.
 */
std::unique_ptr<module_descriptor_t> load(session_t& session, const distribution_t& dist, bool fatal_if_missing);

} // namespace jmodgen

#endif // JMODGEN_MODULE_DESCRIPTOR_STORE_H
