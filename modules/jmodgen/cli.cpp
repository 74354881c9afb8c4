#include <modules/jmodgen/error/error.h>
#include <modules/jmodgen/jdk/jdk.h>
#include <modules/jmodgen/log/log.h>
#include <modules/jmodgen/module/session.h>
#include <modules/jmodgen/suite/suite.h>

#include <filesystem>
#include <format>
#include <iostream>
#include <string>

int main(int argc, char **argv) {
    try {
        if (argc < 4 || 5 < argc) {
            throw std::runtime_error(std::format("usage: {} <suite.json> <jdk.json> <distribution> [--load]", argv[0]));
        }

        const auto suite_json = jmodgen::filesystem::path_t(std::filesystem::absolute(argv[1]));
        const auto jdk_json = jmodgen::filesystem::path_t(std::filesystem::absolute(argv[2]));
        const auto dist_name = std::string(argv[3]);
        bool load_only = false;
        if (argc == 5) {
            if (std::string(argv[4]) != "--load") {
                throw std::runtime_error(std::format("unknown option '{}'", argv[4]));
            }
            load_only = true;
        }

        jmodgen::session_t session(jmodgen::suite_t::load(suite_json), jmodgen::jdk_t::load(jdk_json));

        const auto* dist = session.suite().distribution(dist_name);
        if (!dist) {
            throw jmodgen::configuration_error_t(dist_name, std::format("unknown distribution '{}'", dist_name));
        }

        const jmodgen::module_descriptor_t* descriptor = nullptr;
        if (load_only) {
            descriptor = session.as_java_module(*dist, true);
        } else {
            descriptor = session.make_java_module(*dist);
            if (!descriptor) {
                jmodgen::log(std::format("distribution '{}' does not define a module", dist_name));
                return 0;
            }
        }

        std::cout << descriptor->as_module_info();
    } catch (const std::exception& e) {
        std::cerr << std::format("{}: {}", argv[0], e.what()) << std::endl;
        return 1;
    }

    return 0;
}
