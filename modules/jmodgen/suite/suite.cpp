#include "suite.h"

#include <modules/jmodgen/error/error.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <functional>
#include <unordered_set>

namespace jmodgen {

std::string to_string(dependency_kind_t kind) {
    switch (kind) {
        case dependency_kind_t::DISTRIBUTION: return "distribution";
        case dependency_kind_t::JAVA_PROJECT: return "java project";
        case dependency_kind_t::NATIVE_PROJECT: return "native project";
        case dependency_kind_t::LIBRARY: return "library";
        case dependency_kind_t::JDK_LIBRARY: return "jdk library";
        default: throw std::runtime_error(std::format("to_string: unknown dependency kind {}", static_cast<int>(kind)));
    }
}

dependency_t::dependency_t(const std::string& name, dependency_kind_t kind):
    m_name(name),
    m_kind(kind)
{
    if (m_name.empty()) {
        throw configuration_error_t(m_name, std::format("dependency_t: {} name must not be empty", to_string(m_kind)));
    }
}

const std::string& dependency_t::name() const {
    return m_name;
}

dependency_kind_t dependency_t::kind() const {
    return m_kind;
}

bool dependency_t::is_distribution() const {
    return m_kind == dependency_kind_t::DISTRIBUTION;
}

bool dependency_t::is_java_project() const {
    return m_kind == dependency_kind_t::JAVA_PROJECT;
}

bool dependency_t::is_jdk_library() const {
    return m_kind == dependency_kind_t::JDK_LIBRARY;
}

const std::vector<dependency_t*>& dependency_t::dependencies() const {
    return m_dependencies;
}

std::optional<std::vector<std::string>> dependency_t::declared_exports() const {
    return std::nullopt;
}

std::vector<std::string> dependency_t::uses() const {
    return {};
}

std::vector<std::string> dependency_t::runtime_deps() const {
    return {};
}

std::vector<std::string> dependency_t::imports() const {
    return {};
}

java_project_t::java_project_t(const std::string& name, const filesystem::path_t& dir, std::vector<filesystem::path_t> source_dirs):
    dependency_t(name, dependency_kind_t::JAVA_PROJECT),
    m_dir(dir),
    m_source_dirs(std::move(source_dirs))
{
}

const filesystem::path_t& java_project_t::dir() const {
    return m_dir;
}

const std::vector<filesystem::path_t>& java_project_t::source_dirs() const {
    return m_source_dirs;
}

const std::set<std::string>& java_project_t::defined_packages() const {
    return source_scan().defined_packages;
}

const std::set<std::string>& java_project_t::imported_packages() const {
    return source_scan().imported_packages;
}

const std::set<std::string>& java_project_t::package_info_packages() const {
    return source_scan().package_info_packages;
}

std::optional<std::vector<std::string>> java_project_t::declared_exports() const {
    return m_exports;
}

std::vector<std::string> java_project_t::uses() const {
    return m_uses;
}

std::vector<std::string> java_project_t::runtime_deps() const {
    return m_runtime_deps;
}

std::vector<std::string> java_project_t::imports() const {
    return m_imports;
}

const java::source_scan_t& java_project_t::source_scan() const {
    if (!m_source_scan) {
        m_source_scan = java::scan_sources(m_source_dirs);
    }
    return *m_source_scan;
}

native_project_t::native_project_t(const std::string& name):
    dependency_t(name, dependency_kind_t::NATIVE_PROJECT)
{
}

library_t::library_t(const std::string& name, dependency_kind_t kind, std::optional<filesystem::path_t> path, std::optional<std::string> jdk_module):
    dependency_t(name, kind),
    m_path(std::move(path)),
    m_jdk_module(std::move(jdk_module))
{
    if (kind != dependency_kind_t::LIBRARY && kind != dependency_kind_t::JDK_LIBRARY) {
        throw std::runtime_error(std::format("library_t: '{}' is a {}, not a library", name, to_string(kind)));
    }
}

const std::optional<filesystem::path_t>& library_t::path() const {
    return m_path;
}

const std::optional<std::string>& library_t::jdk_module() const {
    return m_jdk_module;
}

distribution_t::distribution_t(const std::string& name, const filesystem::path_t& path, std::optional<std::string> module_name):
    dependency_t(name, dependency_kind_t::DISTRIBUTION),
    m_path(path),
    m_module_name(std::move(module_name))
{
}

const filesystem::path_t& distribution_t::path() const {
    return m_path;
}

const std::optional<std::string>& distribution_t::module_name() const {
    return m_module_name;
}

const std::vector<dependency_t*>& distribution_t::moduledeps() const {
    return m_moduledeps;
}

const std::vector<distribution_t*>& distribution_t::dist_dependencies() const {
    return m_dist_dependencies;
}

const std::vector<dependency_t*>& distribution_t::archived_deps() const {
    if (m_archived_deps) {
        return *m_archived_deps;
    }

    std::unordered_set<const dependency_t*> excluded;
    for (const auto* dist_dependency : m_dist_dependencies) {
        const auto& dist_archived_deps = dist_dependency->archived_deps();
        excluded.insert(dist_archived_deps.begin(), dist_archived_deps.end());
    }

    std::vector<dependency_t*> result;
    std::unordered_set<const dependency_t*> visited;
    std::function<void(dependency_t*)> visit;
    visit = [&](dependency_t* dependency) {
        if (dependency->is_distribution() || dependency->is_jdk_library()) {
            return ;
        }
        if (!visited.insert(dependency).second) {
            return ;
        }
        for (auto* transitive_dependency : dependency->dependencies()) {
            visit(transitive_dependency);
        }
        if (!excluded.contains(dependency)) {
            result.push_back(dependency);
        }
    };

    for (auto* dependency : m_dependencies) {
        visit(dependency);
    }

    m_archived_deps = std::move(result);
    return *m_archived_deps;
}

namespace {

const nlohmann::json& optional_member(const nlohmann::json& object, const char* key) {
    static const nlohmann::json null_json;
    const auto it = object.find(key);
    if (it == object.end()) {
        return null_json;
    }
    return *it;
}

std::optional<std::string> optional_string_member(const nlohmann::json& object, const std::string& entity, const char* key) {
    const auto& member = optional_member(object, key);
    if (member.is_null()) {
        return std::nullopt;
    }
    if (!member.is_string()) {
        throw configuration_error_t(entity, std::format("suite_t::load: '{}': '{}' is not a string", entity, key));
    }
    return member.get<std::string>();
}

std::optional<std::vector<std::string>> optional_strings_member(const nlohmann::json& object, const std::string& entity, const char* key) {
    const auto& member = optional_member(object, key);
    if (member.is_null()) {
        return std::nullopt;
    }
    if (!member.is_array()) {
        throw configuration_error_t(entity, std::format("suite_t::load: '{}': '{}' is not an array", entity, key));
    }

    std::vector<std::string> result;
    for (const auto& element : member.get_ref<const nlohmann::json::array_t&>()) {
        if (!element.is_string()) {
            throw configuration_error_t(entity, std::format("suite_t::load: '{}': '{}' array must contain only strings", entity, key));
        }
        auto str = element.get<std::string>();
        if (str.empty()) {
            throw configuration_error_t(entity, std::format("suite_t::load: '{}': '{}' array must not contain empty strings", entity, key));
        }
        result.push_back(std::move(str));
    }
    return result;
}

std::vector<std::string> strings_member(const nlohmann::json& object, const std::string& entity, const char* key) {
    return optional_strings_member(object, entity, key).value_or(std::vector<std::string>{});
}

const nlohmann::json::object_t& table(const nlohmann::json& suite_json, const filesystem::path_t& suite_json_path, const char* key) {
    static const nlohmann::json::object_t empty_table;
    const auto it = suite_json.find(key);
    if (it == suite_json.end()) {
        return empty_table;
    }
    if (!it->is_object()) {
        throw configuration_error_t(key, std::format("suite_t::load: invalid suite file '{}': '{}' is not an object", suite_json_path, key));
    }
    return it->get_ref<const nlohmann::json::object_t&>();
}

filesystem::path_t resolve_path(const filesystem::path_t& base, const std::string& path) {
    const std::filesystem::path native_path(path);
    if (native_path.is_absolute()) {
        return filesystem::path_t(native_path);
    }
    return filesystem::path_t(base.to_native_path() / native_path);
}

std::string dist_jar_name(const std::string& dist_name) {
    std::string result;
    for (const char c : dist_name) {
        result += c == '_' ? '-' : static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result + ".jar";
}

} // namespace

suite_t::suite_t(const filesystem::path_t& dir, const filesystem::path_t& output_root, bool module_deps_equal_dist_deps):
    m_dir(dir),
    m_output_root(output_root),
    m_module_deps_equal_dist_deps(module_deps_equal_dist_deps)
{
}

suite_t suite_t::load(const filesystem::path_t& suite_json_path) {
    nlohmann::json suite_json;
    {
        std::ifstream ifs(suite_json_path.to_native_path());
        if (!ifs) {
            throw configuration_error_t(suite_json_path.string(), std::format("suite_t::load: failed to open file '{}'", suite_json_path));
        }

        try {
            suite_json = nlohmann::json::parse(ifs);
        } catch (const nlohmann::json::parse_error& e) {
            throw configuration_error_t(suite_json_path.string(), std::format("suite_t::load: failed to parse json file '{}': {}", suite_json_path, e.what()));
        }
    }

    if (!suite_json.is_object()) {
        throw configuration_error_t(suite_json_path.string(), std::format("suite_t::load: invalid suite file '{}': not an object", suite_json_path));
    }

    const auto dir = suite_json_path.parent();
    const auto output_root = resolve_path(dir, optional_string_member(suite_json, suite_json_path.string(), OUTPUT_ROOT_KEY).value_or("build"));

    bool module_deps_equal_dist_deps = false;
    {
        const auto& member = optional_member(suite_json, MODULE_DEPS_EQUAL_DIST_DEPS_KEY);
        if (!member.is_null()) {
            if (!member.is_boolean()) {
                throw configuration_error_t(suite_json_path.string(), std::format("suite_t::load: invalid suite file '{}': '{}' is not a boolean", suite_json_path, MODULE_DEPS_EQUAL_DIST_DEPS_KEY));
            }
            module_deps_equal_dist_deps = member.get<bool>();
        }
    }

    suite_t result(dir, output_root, module_deps_equal_dist_deps);

    // first pass creates every dependency, the second one links them by name
    const auto& libraries = table(suite_json, suite_json_path, LIBRARIES_KEY);
    const auto& projects = table(suite_json, suite_json_path, PROJECTS_KEY);
    const auto& distributions = table(suite_json, suite_json_path, DISTRIBUTIONS_KEY);

    for (const auto& [name, library_json] : libraries) {
        const auto kind = optional_string_member(library_json, name, "kind").value_or("jar");
        std::optional<filesystem::path_t> path;
        if (const auto path_str = optional_string_member(library_json, name, "path")) {
            path = resolve_path(dir, *path_str);
        }

        if (kind == "jar") {
            if (!path) {
                throw configuration_error_t(name, std::format("suite_t::load: library '{}' is missing required 'path' string", name));
            }
            result.add(std::make_unique<library_t>(name, dependency_kind_t::LIBRARY, path, std::nullopt));
        } else if (kind == "jdk") {
            result.add(std::make_unique<library_t>(name, dependency_kind_t::JDK_LIBRARY, path, optional_string_member(library_json, name, "jdk_module")));
        } else {
            throw configuration_error_t(name, std::format("suite_t::load: library '{}' has unknown kind '{}'", name, kind));
        }
    }

    for (const auto& [name, project_json] : projects) {
        const auto kind = optional_string_member(project_json, name, "kind").value_or("java");
        if (kind == "native") {
            result.add(std::make_unique<native_project_t>(name));
            continue ;
        }
        if (kind != "java") {
            throw configuration_error_t(name, std::format("suite_t::load: project '{}' has unknown kind '{}'", name, kind));
        }

        const auto project_dir = resolve_path(dir, optional_string_member(project_json, name, "dir").value_or(name));
        std::vector<filesystem::path_t> source_dirs;
        for (const auto& source_dir : optional_strings_member(project_json, name, "source_dirs").value_or(std::vector<std::string>{ "src" })) {
            source_dirs.push_back(resolve_path(project_dir, source_dir));
        }

        auto project = std::make_unique<java_project_t>(name, project_dir, std::move(source_dirs));
        project->m_exports = optional_strings_member(project_json, name, "exports");
        project->m_uses = strings_member(project_json, name, "uses");
        project->m_runtime_deps = strings_member(project_json, name, "runtime_deps");
        project->m_imports = strings_member(project_json, name, "imports");
        result.add(std::move(project));
    }

    for (const auto& [name, distribution_json] : distributions) {
        const auto path = optional_string_member(distribution_json, name, "path");
        result.add(std::make_unique<distribution_t>(
            name,
            path ? resolve_path(dir, *path) : result.m_output_root / filesystem::relative_path_t("dists") / filesystem::relative_path_t(dist_jar_name(name)),
            optional_string_member(distribution_json, name, "module_name")
        ));
    }

    const auto lookup = [&result](const std::string& owner, const std::string& name) {
        auto* dependency = result.dependency(name);
        if (!dependency) {
            throw configuration_error_t(name, std::format("suite_t::load: '{}' depends on unknown dependency '{}'", owner, name));
        }
        return dependency;
    };

    for (const auto& [name, project_json] : projects) {
        auto* project = result.dependency(name);
        for (const auto& dependency_name : strings_member(project_json, name, "dependencies")) {
            project->m_dependencies.push_back(lookup(name, dependency_name));
        }
    }

    for (const auto& [name, distribution_json] : distributions) {
        auto* distribution = result.distribution(name);
        for (const auto& dependency_name : strings_member(distribution_json, name, "dependencies")) {
            auto* dependency = lookup(name, dependency_name);
            if (dependency->is_distribution()) {
                throw configuration_error_t(dependency_name, std::format("suite_t::load: distribution '{}' lists distribution '{}' in 'dependencies', use 'dist_dependencies'", name, dependency_name));
            }
            distribution->m_dependencies.push_back(dependency);
        }
        for (const auto& dependency_name : strings_member(distribution_json, name, "dist_dependencies")) {
            auto* dependency = lookup(name, dependency_name);
            if (!dependency->is_distribution()) {
                throw configuration_error_t(dependency_name, std::format("suite_t::load: distribution '{}' lists {} '{}' in 'dist_dependencies'", name, to_string(dependency->kind()), dependency_name));
            }
            distribution->m_dependencies.push_back(dependency);
            distribution->m_dist_dependencies.push_back(static_cast<distribution_t*>(dependency));
        }
        for (const auto& dependency_name : strings_member(distribution_json, name, "moduledeps")) {
            distribution->m_moduledeps.push_back(lookup(name, dependency_name));
        }
    }

    result.check_acyclic();

    return result;
}

const filesystem::path_t& suite_t::dir() const {
    return m_dir;
}

const filesystem::path_t& suite_t::output_root() const {
    return m_output_root;
}

bool suite_t::module_deps_equal_dist_deps() const {
    return m_module_deps_equal_dist_deps;
}

dependency_t* suite_t::dependency(const std::string& name) const {
    const auto it = m_dependency_by_name.find(name);
    if (it == m_dependency_by_name.end()) {
        return nullptr;
    }
    return it->second;
}

distribution_t* suite_t::distribution(const std::string& name) const {
    auto* dependency = this->dependency(name);
    if (!dependency || !dependency->is_distribution()) {
        return nullptr;
    }
    return static_cast<distribution_t*>(dependency);
}

void suite_t::add(std::unique_ptr<dependency_t> dependency) {
    const auto& name = dependency->name();
    if (!m_dependency_by_name.emplace(name, dependency.get()).second) {
        throw configuration_error_t(name, std::format("suite_t::load: duplicate dependency name '{}'", name));
    }
    m_dependencies.push_back(std::move(dependency));
}

void suite_t::check_acyclic() const {
    enum class visit_state_t {
        VISITING,
        VISITED
    };

    std::unordered_map<const dependency_t*, visit_state_t> states;
    std::vector<const dependency_t*> stack;
    std::function<void(const dependency_t*)> visit;
    visit = [&](const dependency_t* dependency) {
        const auto it = states.find(dependency);
        if (it != states.end()) {
            if (it->second == visit_state_t::VISITED) {
                return ;
            }

            std::string cycle;
            for (auto stack_it = std::find(stack.begin(), stack.end(), dependency); stack_it != stack.end(); ++stack_it) {
                cycle += std::format("{} -> ", (*stack_it)->name());
            }
            cycle += dependency->name();
            throw configuration_error_t(dependency->name(), std::format("suite_t::load: circular dependency detected: {}", cycle));
        }

        states.emplace(dependency, visit_state_t::VISITING);
        stack.push_back(dependency);
        for (const auto* transitive_dependency : dependency->dependencies()) {
            visit(transitive_dependency);
        }
        stack.pop_back();
        states[dependency] = visit_state_t::VISITED;
    };

    for (const auto& dependency : m_dependencies) {
        visit(dependency.get());
    }
}

} // namespace jmodgen
