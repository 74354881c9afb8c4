#include "synthesizer.h"

#include <modules/jmodgen/error/error.h>
#include <modules/jmodgen/log/log.h>
#include <modules/jmodgen/zip/zip.h>
#include "session.h"
#include "visibility.h"

#include <algorithm>
#include <format>

namespace jmodgen {

static const constexpr std::string_view SERVICES_DIR = "META-INF/services/";

static std::string trim(std::string_view str) {
    const auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f';
    };
    while (!str.empty() && is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && is_space(str.back())) {
        str.remove_suffix(1);
    }
    return std::string(str);
}

/**
 * Provider class names of a service configuration file, one per line, `#` starts a comment.
 */
static std::vector<std::string> parse_providers(std::string_view content) {
    std::vector<std::string> result;

    while (!content.empty()) {
        const auto eol = content.find('\n');
        auto line = content.substr(0, eol);
        content = eol == std::string_view::npos ? std::string_view{} : content.substr(eol + 1);

        const auto comment = line.find('#');
        if (comment != std::string_view::npos) {
            line = line.substr(0, comment);
        }

        auto provider = trim(line);
        if (!provider.empty()) {
            result.push_back(std::move(provider));
        }
    }

    return result;
}

/**
 * Adds the providers registered in `jar` to `provides` and returns the names of the services registered.
 * All entries of `jar` are added to `entries`.
 */
static std::set<std::string> read_services(const distribution_t& dist, const filesystem::path_t& jar, module_provides_t& provides, std::set<std::string>& entries) {
    zip::reader_t reader(jar);

    std::set<std::string> services;
    for (const auto& entry : reader.entries()) {
        entries.insert(entry);
        if (!entry.starts_with(SERVICES_DIR) || entry.size() == SERVICES_DIR.size()) {
            continue ;
        }

        const auto service = entry.substr(SERVICES_DIR.size());
        if (service.find('/') != std::string::npos) {
            throw configuration_error_t(dist.name(), std::format("synthesize: jar '{}' of distribution '{}' has invalid service configuration entry '{}'", jar, dist.name(), entry));
        }

        auto& providers = provides[service];
        for (auto& provider : parse_providers(reader.read(entry))) {
            providers.insert(std::move(provider));
        }
        services.insert(service);
    }

    return services;
}

std::set<std::string> expand_package_info(const java_project_t& project, const std::vector<std::string>& packages) {
    std::set<std::string> result;
    for (const auto& package : packages) {
        if (package == java_project_t::PACKAGE_INFO_MARKER) {
            const auto& package_info_packages = project.package_info_packages();
            result.insert(package_info_packages.begin(), package_info_packages.end());
        } else {
            result.insert(package);
        }
    }
    return result;
}

std::unique_ptr<module_descriptor_t> synthesize(session_t& session, const distribution_t& dist, const module_info_t& module_info) {
    const auto& suite = session.suite();
    const auto& jdk = session.jdk();
    const auto& module_name = module_info.name;

    log(std::format("Building Java module {} from {}", module_name, dist.name()));

    module_descriptor_args_t args;
    args.name = module_name;
    args.archive_path = module_info.jar;
    args.origin = &dist;

    const auto& module_deps = session.module_deps().collect(dist);
    const auto is_module_dep = [&module_deps](const dependency_t* dependency) {
        return std::find(module_deps.begin(), module_deps.end(), dependency) != module_deps.end();
    };

    const bool exhaustive = suite.module_deps_equal_dist_deps();
    for (const auto* dependency : dist.dependencies()) {
        if (is_module_dep(dependency)) {
            continue ;
        }

        if (dependency->is_distribution()) {
            const auto& dist_dependency = static_cast<const distribution_t&>(*dependency);
            const auto* java_module = session.java_module(dist_dependency);
            if (!java_module) {
                if (exhaustive) {
                    throw configuration_error_t(dependency->name(), std::format("synthesize: {} cannot depend on {} as it does not define a module", dist.name(), dependency->name()));
                }
                continue ;
            }

            args.modulepath.push_back(java_module);
            if (exhaustive) {
                args.requires_modules[java_module->name()] = { jdk.transitive_requires_keyword() };
            }
        } else if (exhaustive) {
            if (dependency->is_jdk_library() && jdk.provides(static_cast<const library_t&>(*dependency))) {
                continue ;
            }
            throw configuration_error_t(dependency->name(), std::format("synthesize: {} cannot depend on {} as it does not define a module", dist.name(), dependency->name()));
        }
    }

    // modules the content depends on through a project or a distribution folded into this module
    for (const auto* referenced_dist : session.module_deps().referenced_modules(dist)) {
        const auto* java_module = session.java_module(*referenced_dist);
        if (!java_module) {
            throw configuration_error_t(referenced_dist->name(), std::format("synthesize: {} depends on {} which does not define a module", dist.name(), referenced_dist->name()));
        }
        if (std::find(args.modulepath.begin(), args.modulepath.end(), java_module) != args.modulepath.end()) {
            continue ;
        }

        args.modulepath.push_back(java_module);
        if (exhaustive) {
            args.requires_modules[java_module->name()] = { jdk.transitive_requires_keyword() };
        }
    }

    for (const auto* platform_module : jdk.modules()) {
        args.modulepath.push_back(platform_module);
    }

    std::vector<const java_project_t*> java_projects;
    for (const auto* dependency : module_deps) {
        if (dependency->is_java_project()) {
            java_projects.push_back(static_cast<const java_project_t*>(dependency));
        }
    }

    std::set<std::string> packages;
    for (const auto* java_project : java_projects) {
        const auto& defined_packages = java_project->defined_packages();
        packages.insert(defined_packages.begin(), defined_packages.end());
    }

    for (const auto* java_project : java_projects) {
        for (auto& use : java_project->uses()) {
            args.uses.insert(std::move(use));
        }
        for (const auto& runtime_dep : java_project->runtime_deps()) {
            args.requires_modules.try_emplace(runtime_dep, std::set<std::string>{ "static" });
        }

        std::set<std::string> imported_packages = java_project->imported_packages();
        for (auto& import : java_project->imports()) {
            imported_packages.insert(std::move(import));
        }

        for (const auto& package : imported_packages) {
            // a module upgrading a platform module imports packages it defines itself
            if (packages.contains(package)) {
                continue ;
            }

            const auto lookup = lookup_package(args.modulepath, package, module_name);
            if (!lookup || lookup->module->name() == module_name) {
                continue ;
            }

            const auto& dependency_name = lookup->module->name();
            args.requires_modules.try_emplace(dependency_name);
            if (lookup->visibility == package_visibility_t::CONCEALED) {
                args.concealed_requires[dependency_name].insert(package);
            }
        }

        const auto declared_exports = java_project->declared_exports();
        const auto exports = declared_exports ? expand_package_info(*java_project, *declared_exports) : java_project->defined_packages();
        for (const auto& package : exports) {
            if (!packages.contains(package)) {
                throw configuration_error_t(java_project->name(), std::format("synthesize: project '{}' exports package '{}' which is not defined by module {}", java_project->name(), package, module_name));
            }
            args.exports.try_emplace(package);
        }
    }

    std::set<std::string> entries;
    std::set<std::string> services = read_services(dist, dist.path(), args.provides, entries);
    for (const auto* dependency : module_deps) {
        if (dependency->is_distribution()) {
            services.merge(read_services(dist, static_cast<const distribution_t*>(dependency)->path(), args.provides, entries));
        }
    }

    // service types defined in the module are assumed to be used by it
    for (const auto& service : services) {
        auto service_class = service;
        std::replace(service_class.begin(), service_class.end(), '.', '/');
        if (entries.contains(service_class + ".class")) {
            args.uses.insert(service);
        }
    }

    args.packages = std::move(packages);

    return std::make_unique<module_descriptor_t>(std::move(args));
}

} // namespace jmodgen
