#include "descriptor_store.h"

#include <modules/jmodgen/error/error.h>
#include "session.h"

#include <nlohmann/json.hpp>

#include <format>

namespace jmodgen {

module_descriptor_snapshot_t snapshot(const module_descriptor_t& descriptor) {
    if (!descriptor.origin()) {
        throw std::runtime_error(std::format("snapshot: module '{}' is not derived from a distribution", descriptor.name()));
    }

    module_descriptor_snapshot_t result {
        .name = descriptor.name(),
        .exports = descriptor.exports(),
        .requires_modules = descriptor.requires_modules(),
        .concealed_requires = descriptor.concealed_requires(),
        .uses = descriptor.uses(),
        .provides = descriptor.provides(),
        .packages = descriptor.packages(),
        .jarpath = std::nullopt,
        .dist = descriptor.origin()->name(),
        .modulepath = {}
    };
    if (descriptor.archive_path()) {
        result.jarpath = descriptor.archive_path()->string();
    }
    for (const auto* module : descriptor.modulepath()) {
        if (module->origin()) {
            result.modulepath.push_back(module_descriptor_snapshot_t::DIST_PREFIX + module->origin()->name());
        } else {
            result.modulepath.push_back(module->name());
        }
    }

    return result;
}

std::vector<std::uint8_t> to_cbor(const module_descriptor_snapshot_t& snapshot) {
    nlohmann::json json = {
        { "name", snapshot.name },
        { "exports", snapshot.exports },
        { "requires", snapshot.requires_modules },
        { "concealed_requires", snapshot.concealed_requires },
        { "uses", snapshot.uses },
        { "provides", snapshot.provides },
        { "packages", snapshot.packages },
        { "jarpath", nullptr },
        { "dist", snapshot.dist },
        { "modulepath", snapshot.modulepath }
    };
    if (snapshot.jarpath) {
        json["jarpath"] = *snapshot.jarpath;
    }
    return nlohmann::json::to_cbor(json);
}

module_descriptor_snapshot_t from_cbor(const std::vector<std::uint8_t>& cbor, const std::string& source) {
    nlohmann::json json;
    try {
        json = nlohmann::json::from_cbor(cbor);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::format("from_cbor: failed to parse module descriptor '{}': {}", source, e.what()));
    }

    try {
        module_descriptor_snapshot_t result {
            .name = json.at("name").get<std::string>(),
            .exports = json.at("exports").get<module_exports_t>(),
            .requires_modules = json.at("requires").get<module_requires_t>(),
            .concealed_requires = json.at("concealed_requires").get<module_concealed_requires_t>(),
            .uses = json.at("uses").get<std::set<std::string>>(),
            .provides = json.at("provides").get<module_provides_t>(),
            .packages = json.at("packages").get<std::set<std::string>>(),
            .jarpath = std::nullopt,
            .dist = json.at("dist").get<std::string>(),
            .modulepath = json.at("modulepath").get<std::vector<std::string>>()
        };
        const auto& jarpath = json.at("jarpath");
        if (!jarpath.is_null()) {
            result.jarpath = jarpath.get<std::string>();
        }
        return result;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::format("from_cbor: invalid module descriptor '{}': {}", source, e.what()));
    }
}

filesystem::path_t descriptor_path(const filesystem::path_t& module_jar) {
    auto result = module_jar;
    result.extension(".descriptor");
    return result;
}

std::optional<filesystem::path_t> save(const module_descriptor_t& descriptor) {
    if (descriptor.is_platform_module() || !descriptor.origin()) {
        return std::nullopt;
    }
    if (!descriptor.archive_path()) {
        throw std::runtime_error(std::format("save: module '{}' has no jar", descriptor.name()));
    }

    const auto path = descriptor_path(*descriptor.archive_path());
    const auto cbor = to_cbor(snapshot(descriptor));
    filesystem::create_directories(path.parent());
    filesystem::write_file_atomic(path, std::string_view(reinterpret_cast<const char*>(cbor.data()), cbor.size()));
    return path;
}

std::unique_ptr<module_descriptor_t> load(session_t& session, const distribution_t& dist, bool fatal_if_missing) {
    const auto module_info = session.module_deps().module_info(dist, true);
    const auto path = descriptor_path(module_info->jar);
    if (!filesystem::exists(path)) {
        if (fatal_if_missing) {
            throw cache_miss_error_t(path.string(), std::format("load: '{}' does not exist", path));
        }
        return nullptr;
    }

    const auto content = filesystem::read_file(path);
    auto snapshot = from_cbor(std::vector<std::uint8_t>(content.begin(), content.end()), path.string());

    if (snapshot.dist != dist.name()) {
        throw configuration_error_t(snapshot.dist, std::format("load: module descriptor '{}' belongs to distribution '{}', not '{}'", path, snapshot.dist, dist.name()));
    }

    modulepath_t modulepath;
    for (const auto& name : snapshot.modulepath) {
        if (name.starts_with(module_descriptor_snapshot_t::DIST_PREFIX)) {
            const auto dist_name = name.substr(std::string_view(module_descriptor_snapshot_t::DIST_PREFIX).size());
            const auto* dist_dependency = session.suite().distribution(dist_name);
            if (!dist_dependency) {
                throw configuration_error_t(dist_name, std::format("load: module descriptor '{}' refers to unknown distribution '{}'", path, dist_name));
            }
            modulepath.push_back(session.java_module(*dist_dependency));
            if (!modulepath.back()) {
                throw configuration_error_t(dist_name, std::format("load: module descriptor '{}' refers to distribution '{}' which does not define a module", path, dist_name));
            }
        } else {
            const auto* platform_module = session.jdk().module(name);
            if (!platform_module) {
                throw configuration_error_t(name, std::format("load: module descriptor '{}' refers to unknown platform module '{}'", path, name));
            }
            modulepath.push_back(platform_module);
        }
    }

    std::optional<filesystem::path_t> archive_path;
    if (snapshot.jarpath) {
        archive_path = filesystem::path_t(*snapshot.jarpath);
    }

    return std::make_unique<module_descriptor_t>(module_descriptor_args_t {
        .name = std::move(snapshot.name),
        .exports = std::move(snapshot.exports),
        .requires_modules = std::move(snapshot.requires_modules),
        .concealed_requires = std::move(snapshot.concealed_requires),
        .uses = std::move(snapshot.uses),
        .provides = std::move(snapshot.provides),
        .packages = std::move(snapshot.packages),
        .archive_path = std::move(archive_path),
        .origin = &dist,
        .modulepath = std::move(modulepath),
        .is_platform_module = false
    });
}

} // namespace jmodgen
