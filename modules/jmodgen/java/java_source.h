#ifndef JMODGEN_JAVA_JAVA_SOURCE_H
# define JMODGEN_JAVA_JAVA_SOURCE_H

# include <modules/jmodgen/filesystem/filesystem.h>

# include <optional>
# include <set>
# include <string>
# include <string_view>
# include <vector>

namespace jmodgen::java {

static const constexpr char* PACKAGE_INFO_JAVA = "package-info.java";

/**
 * Package level facts of a single `.java` compilation unit.
 */
struct compilation_unit_t {
    // std::nullopt for the unnamed package
    std::optional<std::string> package;
    std::set<std::string> imported_packages;
};

/**
 * Package level facts of all compilation units found under a set of source directories.
 */
struct source_scan_t {
    std::set<std::string> defined_packages;
    std::set<std::string> imported_packages;
    std::set<std::string> package_info_packages;
};

/**
 * Extracts the `package` declaration and the packages of all `import` declarations.
 * Comments, string and character literals are ignored.
 */
compilation_unit_t parse_compilation_unit(std::string_view source);

/**
 * Returns the package part of an import declaration's name, e.g.
 *   "a.b.C"         -> "a.b"
 *   "a.b.C.Inner"   -> "a.b"
 *   "a.b.*"         -> "a.b"
 *   static "a.b.C.m" -> "a.b"
 * The package consists of the components preceding the first one that starts with an upper-case letter.
 * Returns an empty string for a name without a package.
 */
std::string package_of_import(std::string_view name, bool is_static);

/**
 * Recursively scans `.java` files under each of `source_dirs` in order.
 * Missing source directories are skipped.
 */
source_scan_t scan_sources(const std::vector<filesystem::path_t>& source_dirs);

} // namespace jmodgen::java

#endif // JMODGEN_JAVA_JAVA_SOURCE_H
