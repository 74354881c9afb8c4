#include "visibility.h"

#include <format>
#include <stdexcept>

namespace jmodgen {

std::string to_string(package_visibility_t visibility) {
    switch (visibility) {
        case package_visibility_t::EXPORTED: return "exported";
        case package_visibility_t::CONCEALED: return "concealed";
        default: throw std::runtime_error(std::format("to_string: unknown package visibility {}", static_cast<int>(visibility)));
    }
}

std::optional<package_lookup_t> lookup_package(const modulepath_t& modulepath, const std::string& package, const std::string& importer) {
    for (const auto* module : modulepath) {
        const auto it = module->exports().find(package);
        if (it != module->exports().end()) {
            const auto& targets = it->second;
            if (targets.empty() || targets.contains(importer)) {
                return package_lookup_t { .module = module, .visibility = package_visibility_t::EXPORTED };
            }
            return package_lookup_t { .module = module, .visibility = package_visibility_t::CONCEALED };
        }

        if (module->conceals().contains(package)) {
            return package_lookup_t { .module = module, .visibility = package_visibility_t::CONCEALED };
        }
    }

    return std::nullopt;
}

} // namespace jmodgen
