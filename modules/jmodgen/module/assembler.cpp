#include "assembler.h"

#include <modules/jmodgen/error/error.h>
#include <modules/jmodgen/log/log.h>
#include <modules/jmodgen/zip/zip.h>
#include "descriptor_store.h"

#include <format>
#include <unistd.h>

namespace jmodgen {

static std::string join_paths(const std::vector<filesystem::path_t>& paths) {
    std::string result;
    for (const auto& path : paths) {
        if (!result.empty()) {
            result += ':';
        }
        result += path.string();
    }
    return result;
}

std::vector<process::process_arg_t> javac_command(const jdk_t& jdk, const module_descriptor_t& descriptor, const filesystem::path_t& staging_dir, const filesystem::path_t& module_info_java) {
    std::vector<filesystem::path_t> modulepath_jars;
    std::vector<filesystem::path_t> upgrade_modulepath_jars;
    for (const auto* module : descriptor.modulepath()) {
        if (!module->archive_path()) {
            continue ;
        }
        if (module->is_platform_module() || jdk.module(module->name())) {
            upgrade_modulepath_jars.push_back(*module->archive_path());
        } else {
            modulepath_jars.push_back(*module->archive_path());
        }
    }

    std::vector<process::process_arg_t> result = { jdk.javac(), "-d", staging_dir };
    if (!modulepath_jars.empty()) {
        result.push_back("--module-path");
        result.push_back(join_paths(modulepath_jars));
    }
    if (!upgrade_modulepath_jars.empty()) {
        result.push_back("--upgrade-module-path");
        result.push_back(join_paths(upgrade_modulepath_jars));
    }
    result.push_back(module_info_java);

    return result;
}

void assemble(const jdk_t& jdk, const module_descriptor_t& descriptor, const module_info_t& module_info, const std::vector<dependency_t*>& module_deps) {
    const auto* dist = descriptor.origin();
    if (!dist) {
        throw std::runtime_error(std::format("assemble: module '{}' is not derived from a distribution", descriptor.name()));
    }

    const auto& staging_dir = module_info.staging_dir;
    if (filesystem::exists(staging_dir)) {
        filesystem::remove_all(staging_dir);
    }
    filesystem::create_directories(staging_dir);

    zip::unzip(dist->path(), staging_dir);
    for (const auto* dependency : module_deps) {
        if (dependency->is_distribution()) {
            zip::unzip(static_cast<const distribution_t*>(dependency)->path(), staging_dir);
        }
    }

    const auto module_info_java = staging_dir / filesystem::relative_path_t(MODULE_INFO_JAVA);
    filesystem::write_file(module_info_java, descriptor.as_module_info());

    const auto javac = javac_command(jdk, descriptor, staging_dir, module_info_java);
    const int exit_code = process::create_and_wait(javac);
    if (exit_code != 0) {
        const auto command = process::command_line(javac);
        throw external_tool_error_t(command, exit_code, std::format("assemble: javac failed with exit code {}: {}", exit_code, command));
    }

    const auto tmp_jar = module_info.jar + std::format(".{}.tmp.jar", getpid());
    if (filesystem::exists(tmp_jar)) {
        filesystem::remove(tmp_jar);
    }
    try {
        zip::zip(staging_dir, tmp_jar);
        filesystem::rename_replace(tmp_jar, module_info.jar);
    } catch (...) {
        if (filesystem::exists(tmp_jar)) {
            filesystem::remove(tmp_jar);
        }
        throw ;
    }

    const auto path = save(descriptor);
    if (path) {
        log(std::format("Wrote module descriptor {}", *path));
    }
}

} // namespace jmodgen
