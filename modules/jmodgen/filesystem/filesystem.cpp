#include "filesystem.h"

#include <algorithm>
#include <fstream>
#include <format>

#include <unistd.h>

namespace jmodgen::filesystem {

static std::filesystem::path append_postfix(const std::filesystem::path& path, std::string_view postfix) {
    if (postfix.find_first_of("/\\") != std::string_view::npos) {
        throw std::runtime_error(std::format("filesystem::append_postfix: postfix '{}' contains path separator", postfix));
    }

    std::filesystem::path new_path = path;
    new_path.replace_filename(new_path.filename().string() + std::string(postfix));
    return new_path;
}

relative_path_t::relative_path_t(const std::filesystem::path& relative_path):
    m_relative_path(relative_path.lexically_normal())
{
    if (m_relative_path.is_absolute()) {
        throw std::runtime_error(std::format("filesystem::relative_path_t: path '{}' is absolute", m_relative_path.string()));
    }
}

const char* relative_path_t::c_str() const {
    return m_relative_path.c_str();
}

std::string relative_path_t::string() const {
    return m_relative_path.string();
}

std::string relative_path_t::generic_string() const {
    return m_relative_path.generic_string();
}

const std::filesystem::path& relative_path_t::to_native_path() const {
    return m_relative_path;
}

path_t::path_t(const std::filesystem::path& path):
    m_path(std::filesystem::absolute(path).lexically_normal())
{
}

path_t path_t::parent() const {
    const auto parent_path = m_path.parent_path();
    if (parent_path.empty() || parent_path == m_path) {
        throw std::runtime_error(std::format("filesystem::path_t::parent: path '{}' has no parent", m_path.string()));
    }

    return path_t(parent_path);
}

bool path_t::is_child(const path_t& other) const {
    const auto rel = other.m_path.lexically_relative(m_path);
    return !rel.empty() && rel != "." && !rel.native().starts_with("..");
}

relative_path_t path_t::relative(const path_t& other) const {
    if (!is_child(other)) {
        throw std::runtime_error(std::format("filesystem::path_t::relative: path '{}' is not a child of base path '{}'", other.m_path.string(), m_path.string()));
    }

    return relative_path_t(other.m_path.lexically_relative(m_path));
}

bool path_t::is_sibling(const path_t& sibling) const {
    return m_path.parent_path() == sibling.m_path.parent_path();
}

std::string path_t::filename() const {
    return m_path.filename().string();
}

const char* path_t::c_str() const {
    return m_path.c_str();
}

std::string path_t::string() const {
    return m_path.string();
}

std::string path_t::extension() const {
    return m_path.extension().string();
}

void path_t::extension(std::string_view new_extension) {
    m_path.replace_extension(new_extension);
}

bool path_t::operator==(const path_t& other) const {
    return m_path == other.m_path;
}

path_t path_t::operator/(const relative_path_t& relative_path) const {
    path_t result(m_path / relative_path.to_native_path());

    const auto rel = result.m_path.lexically_relative(m_path);
    if (rel.empty() || rel == "." || rel.native().starts_with("..")) {
        throw std::runtime_error(std::format("filesystem::path_t::operator/: path '{}' must not escape the base path '{}'", result.m_path.string(), m_path.string()));
    }

    return result;
}

path_t path_t::operator+(std::string_view postfix) const {
    path_t result(append_postfix(m_path, postfix));

    if (!result.is_sibling(*this) || result == *this) {
        throw std::runtime_error(std::format("filesystem::path_t::operator+: path '{}' must be a strict sibling of base path '{}'", result.m_path.string(), m_path.string()));
    }

    return result;
}

const std::filesystem::path& path_t::to_native_path() const {
    return m_path;
}

find_include_predicate_t::find_include_predicate_t(std::function<bool(const path_t& path)>&& predicate):
    predicate(std::move(predicate))
{
}

bool find_include_predicate_t::operator()(const path_t& path) const {
    return predicate(path);
}

find_include_predicate_t find_include_predicate_t::include_all = {
    [](const path_t&) {
        return true;
    }
};

find_include_predicate_t find_include_predicate_t::is_regular = {
    [](const path_t& path) {
        return is_regular_file(path);
    }
};

find_include_predicate_t find_include_predicate_t::extension(const std::string& extension) {
    return {
        [=](const path_t& path) {
            return path.extension() == extension && is_regular_file(path);
        }
    };
}

find_descend_predicate_t::find_descend_predicate_t(std::function<bool(const path_t& dir, size_t depth)>&& predicate):
    predicate(std::move(predicate))
{
}

bool find_descend_predicate_t::operator()(const path_t& dir, size_t depth) const {
    return predicate(dir, depth);
}

find_descend_predicate_t find_descend_predicate_t::descend_all = {
    [](const path_t&, size_t) {
        return true;
    }
};

find_descend_predicate_t find_descend_predicate_t::descend_none = {
    [](const path_t&, size_t) {
        return false;
    }
};

static std::vector<path_t> find(const path_t& dir, const find_include_predicate_t& include_predicate, const find_descend_predicate_t& descend_predicate, size_t depth) {
    std::vector<path_t> entries;

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir.to_native_path(), ec)) {
        entries.emplace_back(dir.to_native_path() / entry.path().filename());
    }
    if (ec) {
        throw std::runtime_error(std::format("filesystem::find: failed to iterate directory '{}': {}", dir, ec.message()));
    }

    std::sort(entries.begin(), entries.end());

    std::vector<path_t> result;
    for (const auto& path : entries) {
        if (include_predicate(path)) {
            result.push_back(path);
        }

        if (is_directory(path) && descend_predicate(path, depth)) {
            auto subresult = find(path, include_predicate, descend_predicate, depth + 1);
            result.insert(result.end(), std::make_move_iterator(subresult.begin()), std::make_move_iterator(subresult.end()));
        }
    }

    return result;
}

std::vector<path_t> find(const path_t& dir, const find_include_predicate_t& include_predicate, const find_descend_predicate_t& descend_predicate) {
    return find(dir, include_predicate, descend_predicate, 0);
}

void create_directories(const path_t& path) {
    std::error_code ec;
    std::filesystem::create_directories(path.to_native_path(), ec);
    if (ec) {
        throw std::runtime_error(std::format("filesystem::create_directories: failed to create directories for path '{}': {}", path, ec.message()));
    }
}

bool exists(const path_t& path) {
    std::error_code ec;
    const bool result = std::filesystem::exists(path.to_native_path(), ec);
    if (ec) {
        throw std::runtime_error(std::format("filesystem::exists: failed to check existence of path '{}': {}", path, ec.message()));
    }
    return result;
}

bool remove(const path_t& path) {
    std::error_code ec;
    const bool result = std::filesystem::remove(path.to_native_path(), ec);
    if (ec) {
        throw std::runtime_error(std::format("filesystem::remove: failed to remove path '{}': {}", path, ec.message()));
    }
    return result;
}

std::uintmax_t remove_all(const path_t& path) {
    std::error_code ec;
    const std::uintmax_t result = std::filesystem::remove_all(path.to_native_path(), ec);
    if (ec) {
        throw std::runtime_error(std::format("filesystem::remove_all: failed to remove all at path '{}': {}", path, ec.message()));
    }
    return result;
}

void rename_replace(const path_t& from, const path_t& to) {
    if (!exists(from)) {
        throw std::runtime_error(std::format("filesystem::rename_replace: source path '{}' does not exist", from));
    }

    std::error_code ec;
    std::filesystem::rename(from.to_native_path(), to.to_native_path(), ec);
    if (ec) {
        throw std::runtime_error(std::format("filesystem::rename_replace: failed to rename '{}' to '{}': {}", from, to, ec.message()));
    }
}

bool is_regular_file(const path_t& path) {
    std::error_code ec;
    const bool result = std::filesystem::is_regular_file(path.to_native_path(), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw std::runtime_error(std::format("filesystem::is_regular_file: failed to check if path '{}' is a regular file: {}", path, ec.message()));
    }
    return result;
}

bool is_directory(const path_t& path) {
    std::error_code ec;
    const bool result = std::filesystem::is_directory(path.to_native_path(), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw std::runtime_error(std::format("filesystem::is_directory: failed to check if path '{}' is a directory: {}", path, ec.message()));
    }
    return result;
}

std::string read_file(const path_t& path) {
    std::ifstream ifs(path.to_native_path(), std::ios::binary);
    if (!ifs) {
        throw std::runtime_error(std::format("filesystem::read_file: failed to open file '{}'", path));
    }

    std::string content{ std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>() };
    if (ifs.bad()) {
        throw std::runtime_error(std::format("filesystem::read_file: failed to read file '{}'", path));
    }

    return content;
}

void write_file(const path_t& path, std::string_view content) {
    std::ofstream ofs(path.to_native_path(), std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw std::runtime_error(std::format("filesystem::write_file: failed to open file '{}' for writing", path));
    }

    ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
    ofs.close();
    if (!ofs) {
        throw std::runtime_error(std::format("filesystem::write_file: failed to write file '{}'", path));
    }
}

void write_file_atomic(const path_t& path, std::string_view content) {
    const auto tmp_path = path + std::format(".{}.tmp", getpid());

    try {
        write_file(tmp_path, content);
        rename_replace(tmp_path, path);
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove(tmp_path.to_native_path(), ec);
        throw ;
    }
}

} // namespace jmodgen::filesystem
