#include "module_deps.h"

#include <modules/jmodgen/error/error.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <functional>

namespace jmodgen {

std::string module_name_of(const std::string& dist_name) {
    std::string result;
    for (const char c : dist_name) {
        if (c == '_' || c == '-') {
            result += '.';
        } else {
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

module_deps_t::module_deps_t(const suite_t& suite):
    m_suite(suite)
{
}

const std::vector<dependency_t*>& module_deps_t::collect(const distribution_t& dist) {
    auto it = m_module_deps.find(&dist);
    if (it != m_module_deps.end()) {
        return it->second;
    }

    if (m_suite.module_deps_equal_dist_deps()) {
        const auto& archived_deps = dist.archived_deps();

        std::vector<const distribution_t*> referenced_modules;
        for (const auto* member : archived_deps) {
            for (const auto* dependency : member->dependencies()) {
                if (!dependency->is_distribution() || dependency == &dist) {
                    continue ;
                }
                const auto* dist_dependency = static_cast<const distribution_t*>(dependency);
                if (defines_module(*dist_dependency) && std::find(referenced_modules.begin(), referenced_modules.end(), dist_dependency) == referenced_modules.end()) {
                    referenced_modules.push_back(dist_dependency);
                }
            }
        }

        m_referenced_modules[&dist] = std::move(referenced_modules);
        return m_module_deps.emplace(&dist, archived_deps).first->second;
    }

    if (!m_collecting.insert(&dist).second) {
        throw configuration_error_t(dist.name(), std::format("module_deps_t::collect: moduledeps of distribution '{}' form a cycle", dist.name()));
    }

    std::vector<dependency_t*> module_deps;
    std::vector<const distribution_t*> referenced_modules;
    try {
        module_deps = walk_moduledeps(dist, referenced_modules);
    } catch (...) {
        m_collecting.erase(&dist);
        throw ;
    }
    m_collecting.erase(&dist);

    m_referenced_modules[&dist] = std::move(referenced_modules);
    return m_module_deps.emplace(&dist, std::move(module_deps)).first->second;
}

const std::vector<const distribution_t*>& module_deps_t::referenced_modules(const distribution_t& dist) {
    collect(dist);
    return m_referenced_modules.at(&dist);
}

std::vector<dependency_t*> module_deps_t::walk_moduledeps(const distribution_t& dist, std::vector<const distribution_t*>& referenced_modules) {
    std::vector<dependency_t*> result;

    const auto& roots = dist.moduledeps();
    for (const auto* root : roots) {
        if (!root->is_distribution()) {
            throw configuration_error_t(root->name(), std::format("module_deps_t::collect: moduledeps of distribution '{}' can only include distributions, '{}' is a {}", dist.name(), root->name(), to_string(root->kind())));
        }
    }

    std::unordered_set<const dependency_t*> visited;
    std::function<void(dependency_t*)> visit;
    visit = [&](dependency_t* dependency) {
        if (dependency->is_jdk_library()) {
            return ;
        }
        if (!visited.insert(dependency).second) {
            return ;
        }

        const bool is_self = dependency == &dist;
        if (!is_self && dependency->is_distribution() && defines_module(static_cast<const distribution_t&>(*dependency))) {
            // referenced through the module path
            referenced_modules.push_back(static_cast<const distribution_t*>(dependency));
            return ;
        }

        for (auto* transitive_dependency : dependency->dependencies()) {
            visit(transitive_dependency);
        }

        if (is_self) {
            return ;
        }
        if (!dependency->is_java_project() && !dependency->is_distribution()) {
            throw configuration_error_t(dependency->name(), std::format("module_deps_t::collect: module of distribution '{}' can only include distributions and java projects, '{}' is a {}", dist.name(), dependency->name(), to_string(dependency->kind())));
        }
        result.push_back(dependency);
    };

    for (auto* root : roots) {
        visit(root);
    }

    return result;
}

bool module_deps_t::defines_module(const distribution_t& dist) {
    if (m_suite.module_deps_equal_dist_deps()) {
        return dist.module_name().has_value();
    }
    return !collect(dist).empty();
}

std::optional<module_info_t> module_deps_t::module_info(const distribution_t& dist, bool fatal_if_not_module) {
    if (!defines_module(dist)) {
        if (fatal_if_not_module) {
            if (m_suite.module_deps_equal_dist_deps()) {
                throw configuration_error_t(dist.name(), std::format("module_deps_t::module_info: distribution '{}' does not define a module", dist.name()));
            }
            throw configuration_error_t(dist.name(), std::format("module_deps_t::module_info: module for distribution '{}' would be empty", dist.name()));
        }
        return std::nullopt;
    }

    const auto& module_name = dist.module_name();
    if (module_name && module_name->empty()) {
        throw configuration_error_t(dist.name(), std::format("module_deps_t::module_info: 'module_name' of distribution '{}' must not be empty", dist.name()));
    }

    const auto name = module_name ? *module_name : module_name_of(dist.name());
    const auto modules_dir = m_suite.output_root() / filesystem::relative_path_t("modules");
    return module_info_t {
        .name = name,
        .staging_dir = modules_dir / filesystem::relative_path_t(name),
        .jar = modules_dir / filesystem::relative_path_t(name + ".jar")
    };
}

void module_deps_t::invalidate(const distribution_t& dist) {
    m_module_deps.erase(&dist);
    m_referenced_modules.erase(&dist);
}

} // namespace jmodgen
