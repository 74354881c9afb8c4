#include "module_descriptor.h"

#include <modules/jmodgen/suite/suite.h>

#include <format>
#include <stdexcept>

namespace jmodgen {

static std::string join(const std::set<std::string>& strs, std::string_view separator) {
    std::string result;
    for (const auto& str : strs) {
        if (!result.empty()) {
            result += separator;
        }
        result += str;
    }
    return result;
}

module_descriptor_t::module_descriptor_t(module_descriptor_args_t args):
    m_name(std::move(args.name)),
    m_exports(std::move(args.exports)),
    m_requires(std::move(args.requires_modules)),
    m_concealed_requires(std::move(args.concealed_requires)),
    m_uses(std::move(args.uses)),
    m_provides(std::move(args.provides)),
    m_archive_path(std::move(args.archive_path)),
    m_origin(args.origin),
    m_modulepath(std::move(args.modulepath)),
    m_is_platform_module(args.is_platform_module)
{
    if (m_name.empty()) {
        throw std::runtime_error("module_descriptor_t: module name must not be empty");
    }

    if (args.packages) {
        m_packages = std::move(*args.packages);
        for (const auto& [package, targets] : m_exports) {
            if (!m_packages.contains(package)) {
                throw std::runtime_error(std::format("module_descriptor_t: module '{}' exports package '{}' which is not one of its packages", m_name, package));
            }
        }
    } else {
        for (const auto& [package, targets] : m_exports) {
            m_packages.insert(package);
        }
    }

    for (const auto& package : m_packages) {
        if (!m_exports.contains(package)) {
            m_conceals.insert(package);
        }
    }
}

const std::string& module_descriptor_t::name() const {
    return m_name;
}

const module_exports_t& module_descriptor_t::exports() const {
    return m_exports;
}

const module_requires_t& module_descriptor_t::requires_modules() const {
    return m_requires;
}

const module_concealed_requires_t& module_descriptor_t::concealed_requires() const {
    return m_concealed_requires;
}

const std::set<std::string>& module_descriptor_t::uses() const {
    return m_uses;
}

const module_provides_t& module_descriptor_t::provides() const {
    return m_provides;
}

const std::set<std::string>& module_descriptor_t::packages() const {
    return m_packages;
}

const std::set<std::string>& module_descriptor_t::conceals() const {
    return m_conceals;
}

const std::optional<filesystem::path_t>& module_descriptor_t::archive_path() const {
    return m_archive_path;
}

const distribution_t* module_descriptor_t::origin() const {
    return m_origin;
}

const modulepath_t& module_descriptor_t::modulepath() const {
    return m_modulepath;
}

bool module_descriptor_t::is_platform_module() const {
    return m_is_platform_module;
}

std::string module_descriptor_t::as_module_info() const {
    std::string result = std::format("module {} {{\n", m_name);

    for (const auto& [dependency, modifiers] : m_requires) {
        const std::string modifiers_str = modifiers.empty() ? "" : join(modifiers, " ") + " ";
        result += std::format("    requires {}{};\n", modifiers_str, dependency);
    }
    for (const auto& [package, targets] : m_exports) {
        const std::string targets_str = targets.empty() ? "" : " to " + join(targets, ", ");
        result += std::format("    exports {}{};\n", package, targets_str);
    }
    for (const auto& use : m_uses) {
        result += std::format("    uses {};\n", use);
    }
    for (const auto& [service, providers] : m_provides) {
        result += std::format("    provides {} with {};\n", service, join(providers, ", "));
    }
    for (const auto& package : m_conceals) {
        result += std::format("    // conceals: {}\n", package);
    }
    if (m_archive_path) {
        result += std::format("    // jarpath: {}\n", *m_archive_path);
    }
    if (m_origin) {
        result += std::format("    // dist: {}\n", m_origin->name());
    }
    if (!m_modulepath.empty()) {
        std::string modulepath_str;
        for (const auto* module : m_modulepath) {
            if (!modulepath_str.empty()) {
                modulepath_str += ", ";
            }
            modulepath_str += module->name();
        }
        result += std::format("    // modulepath: {}\n", modulepath_str);
    }
    for (const auto& [dependency, packages] : m_concealed_requires) {
        for (const auto& package : packages) {
            result += std::format("    // concealed-requires: {}/{}\n", dependency, package);
        }
    }

    result += "}\n";
    return result;
}

} // namespace jmodgen
