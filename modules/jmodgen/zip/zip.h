#ifndef JMODGEN_ZIP_ZIP_H
# define JMODGEN_ZIP_ZIP_H

# include <modules/jmodgen/filesystem/filesystem.h>

# include <memory>
# include <string>
# include <vector>

/**
 * zip
 *
 * Minimal ZIP (and therefore jar) archive support.
 *
 * Intended use:
 * - Reading jar entries such as service registrations in place
 * - Extracting jars into a module staging directory
 * - Packaging a staging directory into a module jar
 *
 * Behavior:
 * - Operates on regular files only
 * - Stores paths relative to the input root with '/' separators, in lexicographical order
 * - Creates new archives; does not overwrite
 *
 * Limitations:
 * - Symlinks, special files, permissions, ownership are ignored
 *
 * Errors:
 * - All validation, I/O, and ZIP failures are reported via std::runtime_error
 */
namespace jmodgen::zip {

/**
 * Recursively archive regular files under `dir` into `install_zip_path` (.zip or .jar).
 */
filesystem::path_t zip(const filesystem::path_t& dir, const filesystem::path_t& install_zip_path);

/**
 * Extract all entries from `zip_path` (.zip or .jar) into `install_dir`.
 * Existing files are overwritten. Entries escaping `install_dir` are rejected.
 */
filesystem::path_t unzip(const filesystem::path_t& zip_path, const filesystem::path_t& install_dir);

/**
 * reader_t
 *
 * RAII read-only view of an archive.
 *
 * Invariants:
 * - The archive stays open for the lifetime of the object
 */
class reader_t {
public:
    explicit reader_t(const filesystem::path_t& zip_path);
    ~reader_t();

    reader_t(const reader_t&) = delete;
    reader_t& operator=(const reader_t&) = delete;

    /**
     * Entry names in archive order, directories included (with a trailing '/').
     */
    const std::vector<std::string>& entries() const;

    bool contains(const std::string& entry) const;

    /**
     * Returns the uncompressed content of `entry`.
     */
    std::string read(const std::string& entry) const;

private:
    struct impl_t;

    filesystem::path_t m_zip_path;
    std::unique_ptr<impl_t> m_impl;
    std::vector<std::string> m_entries;
};

} // namespace jmodgen::zip

#endif // JMODGEN_ZIP_ZIP_H
