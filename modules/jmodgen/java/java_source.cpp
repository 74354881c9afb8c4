#include "java_source.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace jmodgen::java {

static std::string strip_comments_and_literals(std::string_view source) {
    std::string result;
    result.reserve(source.size());

    size_t i = 0;
    while (i < source.size()) {
        const char c = source[i];
        const char next = i + 1 < source.size() ? source[i + 1] : '\0';

        if (c == '/' && next == '/') {
            while (i < source.size() && source[i] != '\n') {
                ++i;
            }
            result += ' ';
        } else if (c == '/' && next == '*') {
            i += 2;
            while (i < source.size() && !(source[i] == '*' && i + 1 < source.size() && source[i + 1] == '/')) {
                ++i;
            }
            i = std::min(i + 2, source.size());
            result += ' ';
        } else if (c == '"' || c == '\'') {
            ++i;
            while (i < source.size() && source[i] != c) {
                if (source[i] == '\\') {
                    ++i;
                }
                ++i;
            }
            ++i;
            result += "\"\"";
        } else {
            result += c;
            ++i;
        }
    }

    return result;
}

std::string package_of_import(std::string_view name, bool is_static) {
    std::vector<std::string> components;
    std::string component;
    for (const char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue ;
        }
        if (c == '.') {
            components.push_back(component);
            component.clear();
        } else {
            component += c;
        }
    }
    components.push_back(component);

    const bool is_wildcard = components.back() == "*";
    if (is_wildcard || is_static) {
        // static member or on-demand marker
        components.pop_back();
    }

    size_t package_length = components.size();
    bool has_type_component = false;
    for (size_t i = 0; i < components.size(); ++i) {
        if (!components[i].empty() && std::isupper(static_cast<unsigned char>(components[i][0]))) {
            package_length = i;
            has_type_component = true;
            break ;
        }
    }

    if (!has_type_component && !is_wildcard && 0 < package_length) {
        // all lower-case, the last component names the type
        --package_length;
    }

    std::string result;
    for (size_t i = 0; i < package_length; ++i) {
        if (!result.empty()) {
            result += '.';
        }
        result += components[i];
    }
    return result;
}

compilation_unit_t parse_compilation_unit(std::string_view source) {
    static const std::regex package_regex(R"(\bpackage\s+([A-Za-z_$][\w$]*(?:\s*\.\s*[A-Za-z_$][\w$]*)*)\s*;)");
    static const std::regex import_regex(R"(\bimport\s+(static\s+)?([A-Za-z_$][\w$]*(?:\s*\.\s*(?:[A-Za-z_$][\w$]*|\*))*)\s*;)");

    const auto code = strip_comments_and_literals(source);

    compilation_unit_t result;

    std::smatch package_match;
    if (std::regex_search(code, package_match, package_regex)) {
        std::string package;
        for (const char c : package_match[1].str()) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                package += c;
            }
        }
        result.package = package;
    }

    for (auto it = std::sregex_iterator(code.begin(), code.end(), import_regex); it != std::sregex_iterator(); ++it) {
        const auto& match = *it;
        const auto package = package_of_import(match[2].str(), match[1].matched);
        if (!package.empty()) {
            result.imported_packages.insert(package);
        }
    }

    return result;
}

source_scan_t scan_sources(const std::vector<filesystem::path_t>& source_dirs) {
    source_scan_t result;

    for (const auto& source_dir : source_dirs) {
        if (!filesystem::is_directory(source_dir)) {
            continue ;
        }

        const auto java_files = filesystem::find(source_dir, filesystem::find_include_predicate_t::extension(".java"), filesystem::find_descend_predicate_t::descend_all);
        for (const auto& java_file : java_files) {
            const auto compilation_unit = parse_compilation_unit(filesystem::read_file(java_file));
            result.imported_packages.insert(compilation_unit.imported_packages.begin(), compilation_unit.imported_packages.end());
            if (!compilation_unit.package) {
                continue ;
            }

            result.defined_packages.insert(*compilation_unit.package);
            if (java_file.filename() == PACKAGE_INFO_JAVA) {
                result.package_info_packages.insert(*compilation_unit.package);
            }
        }
    }

    return result;
}

} // namespace jmodgen::java
