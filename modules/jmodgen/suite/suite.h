#ifndef JMODGEN_SUITE_SUITE_H
# define JMODGEN_SUITE_SUITE_H

# include <modules/jmodgen/filesystem/filesystem.h>
# include <modules/jmodgen/java/java_source.h>

# include <cstdint>
# include <memory>
# include <optional>
# include <set>
# include <string>
# include <unordered_map>
# include <vector>

namespace jmodgen {

enum class dependency_kind_t : uint8_t {
    DISTRIBUTION,
    JAVA_PROJECT,
    NATIVE_PROJECT,
    LIBRARY,
    JDK_LIBRARY
};

std::string to_string(dependency_kind_t kind);

/**
 * dependency_t
 *
 * A node of the suite's static dependency graph.
 *
 * The optional attributes a suite may declare on a dependency are exposed through virtual
 * accessors that default to "not declared". Only java projects override them.
 */
class dependency_t {
public:
    friend class suite_t;

public:
    dependency_t(const std::string& name, dependency_kind_t kind);
    virtual ~dependency_t() = default;

    dependency_t(const dependency_t&) = delete;
    dependency_t& operator=(const dependency_t&) = delete;

    const std::string& name() const;
    dependency_kind_t kind() const;

    bool is_distribution() const;
    bool is_java_project() const;
    bool is_jdk_library() const;

    /**
     * Direct dependencies in declaration order.
     */
    const std::vector<dependency_t*>& dependencies() const;

    /**
     * Packages exported by this dependency, std::nullopt if every defined package is exported.
     * May contain the `<package-info>` marker.
     */
    virtual std::optional<std::vector<std::string>> declared_exports() const;

    /**
     * Service types used by this dependency.
     */
    virtual std::vector<std::string> uses() const;

    /**
     * Modules only required at run time.
     */
    virtual std::vector<std::string> runtime_deps() const;

    /**
     * Packages imported in addition to those found in sources, e.g. by reflection.
     */
    virtual std::vector<std::string> imports() const;

protected:
    std::string m_name;
    dependency_kind_t m_kind;
    std::vector<dependency_t*> m_dependencies;
};

/**
 * java_project_t
 *
 * A group of compiled units built from java sources. Package facts are derived from the
 * sources the first time they are requested.
 */
class java_project_t : public dependency_t {
public:
    friend class suite_t;

    static const constexpr char* PACKAGE_INFO_MARKER = "<package-info>";

public:
    java_project_t(const std::string& name, const filesystem::path_t& dir, std::vector<filesystem::path_t> source_dirs);

    const filesystem::path_t& dir() const;
    const std::vector<filesystem::path_t>& source_dirs() const;

    const std::set<std::string>& defined_packages() const;
    const std::set<std::string>& imported_packages() const;

    /**
     * Defined packages that carry a `package-info.java`.
     */
    const std::set<std::string>& package_info_packages() const;

    std::optional<std::vector<std::string>> declared_exports() const override;
    std::vector<std::string> uses() const override;
    std::vector<std::string> runtime_deps() const override;
    std::vector<std::string> imports() const override;

private:
    const java::source_scan_t& source_scan() const;

private:
    filesystem::path_t m_dir;
    std::vector<filesystem::path_t> m_source_dirs;
    std::optional<std::vector<std::string>> m_exports;
    std::vector<std::string> m_uses;
    std::vector<std::string> m_runtime_deps;
    std::vector<std::string> m_imports;
    mutable std::optional<java::source_scan_t> m_source_scan;
};

class native_project_t : public dependency_t {
public:
    explicit native_project_t(const std::string& name);
};

/**
 * library_t
 *
 * A prebuilt jar, or a JDK/JRE library when `kind() == JDK_LIBRARY`.
 * A JDK library is provided by a JDK that defines `jdk_module()`, or by any JDK if it names no module.
 */
class library_t : public dependency_t {
public:
    library_t(const std::string& name, dependency_kind_t kind, std::optional<filesystem::path_t> path, std::optional<std::string> jdk_module);

    const std::optional<filesystem::path_t>& path() const;
    const std::optional<std::string>& jdk_module() const;

private:
    std::optional<filesystem::path_t> m_path;
    std::optional<std::string> m_jdk_module;
};

/**
 * distribution_t
 *
 * A jar built from java projects. `dependencies()` holds its constituent projects and libraries
 * followed by `dist_dependencies()`.
 */
class distribution_t : public dependency_t {
public:
    friend class suite_t;

public:
    distribution_t(const std::string& name, const filesystem::path_t& path, std::optional<std::string> module_name);

    const filesystem::path_t& path() const;

    /**
     * Explicit module name annotation.
     */
    const std::optional<std::string>& module_name() const;

    /**
     * Roots of the module dependency walk.
     */
    const std::vector<dependency_t*>& moduledeps() const;

    const std::vector<distribution_t*>& dist_dependencies() const;

    /**
     * Projects and non-JDK libraries whose content is archived in this distribution's jar, in
     * post-order. Content archived by a distribution dependency is excluded.
     */
    const std::vector<dependency_t*>& archived_deps() const;

private:
    filesystem::path_t m_path;
    std::optional<std::string> m_module_name;
    std::vector<dependency_t*> m_moduledeps;
    std::vector<distribution_t*> m_dist_dependencies;
    mutable std::optional<std::vector<dependency_t*>> m_archived_deps;
};

/**
 * suite_t
 *
 * The dependency graph of a suite, loaded from a `suite.json` file:
 *
 * {
 *     "output_root": "build",
 *     "module_deps_equal_dist_deps": false,
 *     "libraries": { "<name>": { "kind": "jar" | "jdk", "path": "<jar>", "jdk_module": "<module>" } },
 *     "projects": { "<name>": { "kind": "java" | "native", "dir": "<dir>", "source_dirs": [ "src" ], "dependencies": [],
 *                               "exports": [], "uses": [], "runtime_deps": [], "imports": [] } },
 *     "distributions": { "<name>": { "path": "<jar>", "dependencies": [], "dist_dependencies": [],
 *                                    "module_name": "<module>", "moduledeps": [] } }
 * }
 *
 * Relative paths are relative to the directory of the suite file.
 */
class suite_t {
public:
    static const constexpr char* OUTPUT_ROOT_KEY = "output_root";
    static const constexpr char* MODULE_DEPS_EQUAL_DIST_DEPS_KEY = "module_deps_equal_dist_deps";
    static const constexpr char* LIBRARIES_KEY = "libraries";
    static const constexpr char* PROJECTS_KEY = "projects";
    static const constexpr char* DISTRIBUTIONS_KEY = "distributions";

public:
    static suite_t load(const filesystem::path_t& suite_json);

    suite_t(suite_t&&) = default;

    const filesystem::path_t& dir() const;
    const filesystem::path_t& output_root() const;

    /**
     * Selects the exhaustive module deps mode where a module consists of everything its distribution archives.
     */
    bool module_deps_equal_dist_deps() const;

    dependency_t* dependency(const std::string& name) const;
    distribution_t* distribution(const std::string& name) const;

private:
    suite_t(const filesystem::path_t& dir, const filesystem::path_t& output_root, bool module_deps_equal_dist_deps);

    void add(std::unique_ptr<dependency_t> dependency);
    void check_acyclic() const;

private:
    filesystem::path_t m_dir;
    filesystem::path_t m_output_root;
    bool m_module_deps_equal_dist_deps;
    std::vector<std::unique_ptr<dependency_t>> m_dependencies;
    std::unordered_map<std::string, dependency_t*> m_dependency_by_name;
};

} // namespace jmodgen

#endif // JMODGEN_SUITE_SUITE_H
