#ifndef JMODGEN_JDK_JDK_H
# define JMODGEN_JDK_JDK_H

# include <modules/jmodgen/filesystem/filesystem.h>
# include <modules/jmodgen/module/module_descriptor.h>

# include <memory>
# include <string>
# include <unordered_map>
# include <vector>

namespace jmodgen {

class library_t;

/**
 * jdk_t
 *
 * The platform a module is compiled against, loaded from a `jdk.json` file:
 *
 * {
 *     "home": "/usr/lib/jvm/java-11",
 *     "javac": "/usr/lib/jvm/java-11/bin/javac",
 *     "transitive_requires_keyword": "transitive",
 *     "modules": [
 *         { "name": "java.base", "exports": { "java.lang": [], "jdk.internal.misc": [ "jdk.unsupported" ] },
 *           "packages": [], "requires": { "<module>": [ "<modifier>" ] }, "uses": [], "provides": { "<service>": [] },
 *           "jarpath": "<upgradeable module jar>" }
 *     ]
 * }
 *
 * `home` defaults to the JAVA_HOME environment variable and `javac` to `<home>/bin/javac`.
 * Relative paths are relative to the directory of the jdk file.
 *
 * Platform module descriptors are owned by the jdk and never regenerated.
 */
class jdk_t {
public:
    static const constexpr char* HOME_KEY = "home";
    static const constexpr char* JAVAC_KEY = "javac";
    static const constexpr char* TRANSITIVE_REQUIRES_KEYWORD_KEY = "transitive_requires_keyword";
    static const constexpr char* MODULES_KEY = "modules";

public:
    static jdk_t load(const filesystem::path_t& jdk_json);

    jdk_t(jdk_t&&) = default;

    const filesystem::path_t& home() const;
    const filesystem::path_t& javac() const;

    /**
     * The requires modifier that re-exports a dependency to the dependents of a module.
     */
    const std::string& transitive_requires_keyword() const;

    /**
     * Platform modules in declaration order.
     */
    const modulepath_t& modules() const;

    /**
     * Returns nullptr if the jdk has no module named `name`.
     */
    const module_descriptor_t* module(const std::string& name) const;

    /**
     * Checks whether a jdk library is part of this jdk.
     * A library naming no jdk module is provided by every jdk.
     */
    bool provides(const library_t& library) const;

private:
    jdk_t(const filesystem::path_t& home, const filesystem::path_t& javac, const std::string& transitive_requires_keyword);

    void add(std::unique_ptr<module_descriptor_t> module);

private:
    filesystem::path_t m_home;
    filesystem::path_t m_javac;
    std::string m_transitive_requires_keyword;
    std::vector<std::unique_ptr<module_descriptor_t>> m_owned_modules;
    modulepath_t m_modules;
    std::unordered_map<std::string, const module_descriptor_t*> m_module_by_name;
};

} // namespace jmodgen

#endif // JMODGEN_JDK_JDK_H
