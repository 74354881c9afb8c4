#ifndef JMODGEN_FILESYSTEM_FILESYSTEM_H
# define JMODGEN_FILESYSTEM_FILESYSTEM_H

# include <filesystem>
# include <functional>
# include <format>
# include <string>
# include <string_view>
# include <vector>

/**
 * filesystem
 *
 * Controlled interface to the native filesystem.
 *
 * Design goals:
 * - Centralize all std::filesystem interaction
 * - Enforce path invariants via path_t
 * - Provide explicit, pruneable traversal
 *
 * All functions throw std::runtime_error on failure.
 */
namespace jmodgen::filesystem {

/**
 * relative_path_t
 *
 * Invariants:
 * - Always relative
 *
 * Semantics:
 * - Represents a relative filesystem location, e.g. a jar entry name
 */
class relative_path_t {
public:
    friend class path_t;

public:
    relative_path_t(const std::filesystem::path& relative_path);

    const char* c_str() const;
    std::string string() const;

    /**
     * Returns the path with '/' separators regardless of the native separator.
    */
    std::string generic_string() const;

    const std::filesystem::path& to_native_path() const;

private:
    std::filesystem::path m_relative_path;
};

/**
 * path_t
 *
 * Invariants:
 * - Always absolute
 * - Always lexically normalized
 *
 * Semantics:
 * - Represents a concrete filesystem location
 * - All path composition enforces containment
 */
class path_t {
public:
    /**
     * Constructs a normalized absolute path.
     */
    path_t(const std::filesystem::path& path);

    /**
     * Returns the parent directory.
     *
     * Throws if the path has no parent, i.e., path is root.
     */
    path_t parent() const;

    /**
     * Checks whether `other` is a strict lexical descendant of this path.
    */
    bool is_child(const path_t& other) const;

    /**
     * Returns the relative path from this path to `other`.
    */
    relative_path_t relative(const path_t& other) const;

    /**
     * Checks whether `sibling` shares the same parent directory as this path.
    */
    bool is_sibling(const path_t& sibling) const;

    std::string filename() const;
    const char* c_str() const;
    std::string string() const;

    /**
     * Returns the file extension, including the leading dot.
     */
    std::string extension() const;

    void extension(std::string_view new_extension);

    bool operator==(const path_t& other) const;

    /**
     * Joins a relative path component.
     *
     * Invariant:
     * - The resulting path must be a strict lexical child of the base path
     *
     * Throws if:
     * - The component is absolute
     * - The result escapes the base path
     * - The result is identical to the base path
     */
    path_t operator/(const relative_path_t& relative_path) const;

    /**
     * Appends a postfix to the filename.
     * The resulting path must be a sibling of the base path.
    */
    path_t operator+(std::string_view postfix) const;

    const std::filesystem::path& to_native_path() const;

private:
    std::filesystem::path m_path;
};

struct find_include_predicate_t {
    find_include_predicate_t(std::function<bool(const path_t& path)>&& predicate);

    static find_include_predicate_t include_all;
    static find_include_predicate_t is_regular;

    /**
     * Matches regular files by extension, including the leading dot.
     */
    static find_include_predicate_t extension(const std::string& extension);

    std::function<bool(const path_t& path)> predicate;
    bool operator()(const path_t& path) const;
};

struct find_descend_predicate_t {
    find_descend_predicate_t(std::function<bool(const path_t& dir, size_t depth)>&& predicate);

    static find_descend_predicate_t descend_all;
    static find_descend_predicate_t descend_none;

    std::function<bool(const path_t& dir, size_t depth)> predicate;
    bool operator()(const path_t& dir, size_t depth) const;
};

/**
 * For each encountered entry `e` in `dir`, visited in lexicographical order:
 *   - if `include_predicate(e)` is true, include `e` in the result
 *   - if `e` is a directory and `descend_predicate(e, depth)` is true, recurse into `e`
 *
 * The filesystem structure must not be modified during traversal.
 */
std::vector<path_t> find(const path_t& dir, const find_include_predicate_t& include_predicate, const find_descend_predicate_t& descend_predicate);

/**
 * Creates all missing parent directories.
 */
void create_directories(const path_t& path);

/**
 * Checks whether a path exists.
 */
bool exists(const path_t& path);

/**
 * Removes a single file or empty directory.
 */
bool remove(const path_t& path);

/**
 * Recursively removes a directory tree.
 *
 * Returns the number of removed filesystem objects.
 */
std::uintmax_t remove_all(const path_t& path);

/**
 * Atomically renames `from` to `to`, replacing `to` if it exists.
 * Throws if `from` does not exist.
 */
void rename_replace(const path_t& from, const path_t& to);

/**
 * Checks whether the path refers to a regular file.
 */
bool is_regular_file(const path_t& path);

/**
 * Checks whether the path refers to a directory.
 */
bool is_directory(const path_t& path);

/**
 * Reads the whole content of a regular file.
 */
std::string read_file(const path_t& path);

/**
 * Writes `content` to `path`, truncating it first.
 */
void write_file(const path_t& path, std::string_view content);

/**
 * Writes `content` to a temporary sibling of `path` and renames it onto `path`,
 * so that readers never observe a partially written file.
 * The temporary file is removed if anything fails.
 */
void write_file_atomic(const path_t& path, std::string_view content);

} // namespace jmodgen::filesystem

namespace std {

template <>
struct formatter<::jmodgen::filesystem::path_t> : formatter<std::string> {
    auto format(const ::jmodgen::filesystem::path_t& path, auto& ctx) const {
        return formatter<std::string>::format(path.string(), ctx);
    }
};

template <>
struct formatter<::jmodgen::filesystem::relative_path_t> : formatter<std::string> {
    auto format(const ::jmodgen::filesystem::relative_path_t& relative_path, auto& ctx) const {
        return formatter<std::string>::format(relative_path.string(), ctx);
    }
};

} // namespace std

#endif // JMODGEN_FILESYSTEM_FILESYSTEM_H
