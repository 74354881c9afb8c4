#include "zip.h"

#include <miniz.h>

#include <format>
#include <iostream>

namespace jmodgen::zip {

static bool is_archive_extension(const std::string& extension) {
    return extension == ".zip" || extension == ".jar";
}

filesystem::path_t zip(const filesystem::path_t& dir, const filesystem::path_t& install_zip_path) {
    if (!is_archive_extension(install_zip_path.extension())) {
        throw std::runtime_error(std::format("zip::zip: install path '{}' must have .zip or .jar extension", install_zip_path));
    }

    if (filesystem::exists(install_zip_path)) {
        throw std::runtime_error(std::format("zip::zip: install path '{}' already exists", install_zip_path));
    }

    if (!filesystem::is_directory(dir)) {
        throw std::runtime_error(std::format("zip::zip: input '{}' is not a directory", dir));
    }

    const auto regular_files = filesystem::find(dir, filesystem::find_include_predicate_t::is_regular, filesystem::find_descend_predicate_t::descend_all);

    std::cout << std::format("zip -r {} {}", install_zip_path, dir) << std::endl;

    mz_zip_archive zip;
    mz_zip_zero_struct(&zip);

    if (!mz_zip_writer_init_file(&zip, install_zip_path.c_str(), 0)) {
        throw std::runtime_error(std::format("zip::zip: failed to create zip file at '{}'", install_zip_path));
    }

    for (const auto& regular_file : regular_files) {
        if (regular_file == install_zip_path) {
            continue ;
        }

        const auto rel = dir.relative(regular_file).generic_string();
        if (!mz_zip_writer_add_file(&zip, rel.c_str(), regular_file.c_str(), nullptr, 0, MZ_DEFAULT_COMPRESSION)) {
            mz_zip_writer_end(&zip);
            filesystem::remove(install_zip_path);
            throw std::runtime_error(std::format("zip::zip: failed to add file '{}' to zip archive '{}'", regular_file, install_zip_path));
        }
    }

    if (!mz_zip_writer_finalize_archive(&zip)) {
        mz_zip_writer_end(&zip);
        filesystem::remove(install_zip_path);
        throw std::runtime_error(std::format("zip::zip: failed to finalize zip archive at '{}'", install_zip_path));
    }

    if (!mz_zip_writer_end(&zip)) {
        throw std::runtime_error(std::format("zip::zip: failed to close zip archive at '{}'", install_zip_path));
    }

    return install_zip_path;
}

filesystem::path_t unzip(const filesystem::path_t& zip_path, const filesystem::path_t& install_dir) {
    if (!is_archive_extension(zip_path.extension())) {
        throw std::runtime_error(std::format("zip::unzip: zip file '{}' must have .zip or .jar extension", zip_path));
    }

    if (filesystem::exists(install_dir) && !filesystem::is_directory(install_dir)) {
        throw std::runtime_error(std::format("zip::unzip: install path '{}' exists and is not a directory", install_dir));
    }

    if (!filesystem::is_regular_file(zip_path)) {
        throw std::runtime_error(std::format("zip::unzip: zip file '{}' does not exist or is not a regular file", zip_path));
    }

    std::cout << std::format("unzip -o -d {} {}", install_dir, zip_path) << std::endl;

    mz_zip_archive zip;
    mz_zip_zero_struct(&zip);

    if (!mz_zip_reader_init_file(&zip, zip_path.c_str(), 0)) {
        throw std::runtime_error(std::format("zip::unzip: failed to open zip file at '{}'", zip_path));
    }

    try {
        const mz_uint num_files = mz_zip_reader_get_num_files(&zip);
        for (mz_uint i = 0; i < num_files; ++i) {
            mz_zip_archive_file_stat st;
            if (!mz_zip_reader_file_stat(&zip, i, &st)) {
                throw std::runtime_error(std::format("zip::unzip: failed to read entry {} of zip file '{}'", i, zip_path));
            }

            const auto out_path = install_dir / filesystem::relative_path_t(st.m_filename);

            if (mz_zip_reader_is_file_a_directory(&zip, i)) {
                filesystem::create_directories(out_path);
                continue ;
            }

            filesystem::create_directories(out_path.parent());

            if (!mz_zip_reader_extract_to_file(&zip, i, out_path.c_str(), 0)) {
                throw std::runtime_error(std::format("zip::unzip: failed to extract file '{}' to '{}'", st.m_filename, out_path));
            }
        }
    } catch (...) {
        mz_zip_reader_end(&zip);
        throw ;
    }

    mz_zip_reader_end(&zip);

    return install_dir;
}

struct reader_t::impl_t {
    mz_zip_archive zip;
};

reader_t::reader_t(const filesystem::path_t& zip_path):
    m_zip_path(zip_path),
    m_impl(std::make_unique<impl_t>())
{
    mz_zip_zero_struct(&m_impl->zip);

    if (!mz_zip_reader_init_file(&m_impl->zip, m_zip_path.c_str(), 0)) {
        throw std::runtime_error(std::format("zip::reader_t: failed to open zip file at '{}'", m_zip_path));
    }

    const mz_uint num_files = mz_zip_reader_get_num_files(&m_impl->zip);
    m_entries.reserve(num_files);
    for (mz_uint i = 0; i < num_files; ++i) {
        mz_zip_archive_file_stat st;
        if (!mz_zip_reader_file_stat(&m_impl->zip, i, &st)) {
            mz_zip_reader_end(&m_impl->zip);
            throw std::runtime_error(std::format("zip::reader_t: failed to read entry {} of zip file '{}'", i, m_zip_path));
        }
        m_entries.emplace_back(st.m_filename);
    }
}

reader_t::~reader_t() {
    mz_zip_reader_end(&m_impl->zip);
}

const std::vector<std::string>& reader_t::entries() const {
    return m_entries;
}

bool reader_t::contains(const std::string& entry) const {
    return 0 <= mz_zip_reader_locate_file(&m_impl->zip, entry.c_str(), nullptr, 0);
}

std::string reader_t::read(const std::string& entry) const {
    size_t size = 0;
    void* data = mz_zip_reader_extract_file_to_heap(&m_impl->zip, entry.c_str(), &size, 0);
    if (!data) {
        throw std::runtime_error(std::format("zip::reader_t::read: failed to read entry '{}' of zip file '{}'", entry, m_zip_path));
    }

    std::string result(static_cast<const char*>(data), size);
    mz_free(data);

    return result;
}

} // namespace jmodgen::zip
