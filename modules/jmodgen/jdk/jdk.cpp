#include "jdk.h"

#include <modules/jmodgen/error/error.h>
#include <modules/jmodgen/suite/suite.h>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <fstream>

namespace jmodgen {

namespace {

filesystem::path_t resolve_path(const filesystem::path_t& base, const std::string& path) {
    const std::filesystem::path native_path(path);
    if (native_path.is_absolute()) {
        return filesystem::path_t(native_path);
    }
    return filesystem::path_t(base.to_native_path() / native_path);
}

std::set<std::string> strings(const nlohmann::json& json, const std::string& entity, const std::string& key) {
    if (!json.is_array()) {
        throw configuration_error_t(entity, std::format("jdk_t::load: module '{}': '{}' is not an array", entity, key));
    }

    std::set<std::string> result;
    for (const auto& element : json) {
        if (!element.is_string() || element.get_ref<const std::string&>().empty()) {
            throw configuration_error_t(entity, std::format("jdk_t::load: module '{}': '{}' must contain only non-empty strings", entity, key));
        }
        result.insert(element.get<std::string>());
    }
    return result;
}

std::map<std::string, std::set<std::string>> string_to_strings(const nlohmann::json& json, const std::string& entity, const std::string& key) {
    if (!json.is_object()) {
        throw configuration_error_t(entity, std::format("jdk_t::load: module '{}': '{}' is not an object", entity, key));
    }

    std::map<std::string, std::set<std::string>> result;
    for (const auto& [name, values] : json.items()) {
        result.emplace(name, strings(values, entity, std::format("{}.{}", key, name)));
    }
    return result;
}

std::unique_ptr<module_descriptor_t> parse_module(const nlohmann::json& module_json, const filesystem::path_t& dir) {
    if (!module_json.is_object()) {
        throw configuration_error_t(jdk_t::MODULES_KEY, std::format("jdk_t::load: '{}' array must contain only objects", jdk_t::MODULES_KEY));
    }

    const auto name_it = module_json.find("name");
    if (name_it == module_json.end() || !name_it->is_string() || name_it->get_ref<const std::string&>().empty()) {
        throw configuration_error_t(jdk_t::MODULES_KEY, "jdk_t::load: every module must have a non-empty 'name' string");
    }

    module_descriptor_args_t args;
    args.name = name_it->get<std::string>();
    args.is_platform_module = true;
    for (const auto& [key, value] : module_json.items()) {
        if (key == "name") {
            continue ;
        } else if (key == "exports") {
            args.exports = string_to_strings(value, args.name, key);
        } else if (key == "requires") {
            args.requires_modules = string_to_strings(value, args.name, key);
        } else if (key == "provides") {
            args.provides = string_to_strings(value, args.name, key);
        } else if (key == "packages") {
            args.packages = strings(value, args.name, key);
        } else if (key == "uses") {
            args.uses = strings(value, args.name, key);
        } else if (key == "jarpath") {
            if (!value.is_string()) {
                throw configuration_error_t(args.name, std::format("jdk_t::load: module '{}': 'jarpath' is not a string", args.name));
            }
            args.archive_path = resolve_path(dir, value.get<std::string>());
        } else {
            throw configuration_error_t(args.name, std::format("jdk_t::load: module '{}': unknown key '{}'", args.name, key));
        }
    }

    if (args.packages) {
        // exported packages are implied
        for (const auto& [package, targets] : args.exports) {
            args.packages->insert(package);
        }
    }

    return std::make_unique<module_descriptor_t>(std::move(args));
}

} // namespace

jdk_t::jdk_t(const filesystem::path_t& home, const filesystem::path_t& javac, const std::string& transitive_requires_keyword):
    m_home(home),
    m_javac(javac),
    m_transitive_requires_keyword(transitive_requires_keyword)
{
}

jdk_t jdk_t::load(const filesystem::path_t& jdk_json_path) {
    nlohmann::json jdk_json;
    {
        std::ifstream ifs(jdk_json_path.to_native_path());
        if (!ifs) {
            throw configuration_error_t(jdk_json_path.string(), std::format("jdk_t::load: failed to open file '{}'", jdk_json_path));
        }

        try {
            jdk_json = nlohmann::json::parse(ifs);
        } catch (const nlohmann::json::parse_error& e) {
            throw configuration_error_t(jdk_json_path.string(), std::format("jdk_t::load: failed to parse json file '{}': {}", jdk_json_path, e.what()));
        }
    }

    if (!jdk_json.is_object()) {
        throw configuration_error_t(jdk_json_path.string(), std::format("jdk_t::load: invalid jdk file '{}': not an object", jdk_json_path));
    }

    const auto dir = jdk_json_path.parent();
    const auto string_member = [&](const char* key) -> std::optional<std::string> {
        const auto it = jdk_json.find(key);
        if (it == jdk_json.end()) {
            return std::nullopt;
        }
        if (!it->is_string()) {
            throw configuration_error_t(jdk_json_path.string(), std::format("jdk_t::load: invalid jdk file '{}': '{}' is not a string", jdk_json_path, key));
        }
        return it->get<std::string>();
    };

    auto home_str = string_member(HOME_KEY);
    if (!home_str) {
        const char* java_home = std::getenv("JAVA_HOME");
        if (!java_home || *java_home == '\0') {
            throw configuration_error_t(jdk_json_path.string(), std::format("jdk_t::load: '{}' does not specify '{}' and JAVA_HOME is not set", jdk_json_path, HOME_KEY));
        }
        home_str = java_home;
    }
    const auto home = resolve_path(dir, *home_str);

    const auto javac_str = string_member(JAVAC_KEY);
    const auto javac = javac_str ? resolve_path(dir, *javac_str) : home / filesystem::relative_path_t("bin/javac");

    jdk_t result(home, javac, string_member(TRANSITIVE_REQUIRES_KEYWORD_KEY).value_or("transitive"));

    const auto modules_it = jdk_json.find(MODULES_KEY);
    if (modules_it == jdk_json.end()) {
        throw configuration_error_t(jdk_json_path.string(), std::format("jdk_t::load: invalid jdk file '{}': missing '{}' array", jdk_json_path, MODULES_KEY));
    }
    if (!modules_it->is_array()) {
        throw configuration_error_t(jdk_json_path.string(), std::format("jdk_t::load: invalid jdk file '{}': '{}' is not an array", jdk_json_path, MODULES_KEY));
    }
    for (const auto& module_json : modules_it->get_ref<const nlohmann::json::array_t&>()) {
        result.add(parse_module(module_json, dir));
    }

    return result;
}

const filesystem::path_t& jdk_t::home() const {
    return m_home;
}

const filesystem::path_t& jdk_t::javac() const {
    return m_javac;
}

const std::string& jdk_t::transitive_requires_keyword() const {
    return m_transitive_requires_keyword;
}

const modulepath_t& jdk_t::modules() const {
    return m_modules;
}

const module_descriptor_t* jdk_t::module(const std::string& name) const {
    const auto it = m_module_by_name.find(name);
    if (it == m_module_by_name.end()) {
        return nullptr;
    }
    return it->second;
}

bool jdk_t::provides(const library_t& library) const {
    if (!library.is_jdk_library()) {
        return false;
    }

    const auto& jdk_module = library.jdk_module();
    return !jdk_module || module(*jdk_module) != nullptr;
}

void jdk_t::add(std::unique_ptr<module_descriptor_t> module) {
    const auto& name = module->name();
    if (!m_module_by_name.emplace(name, module.get()).second) {
        throw configuration_error_t(name, std::format("jdk_t::load: duplicate platform module '{}'", name));
    }
    m_modules.push_back(module.get());
    m_owned_modules.push_back(std::move(module));
}

} // namespace jmodgen
