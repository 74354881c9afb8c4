#include "test_util.h"

#include <modules/jmodgen/zip/zip.h>

#include <cstdlib>
#include <format>
#include <stdexcept>

namespace jmodgen::test {

static filesystem::path_t make_temp_dir() {
    auto pattern = (std::filesystem::temp_directory_path() / "jmodgen_test.XXXXXX").string();
    if (!mkdtemp(pattern.data())) {
        throw std::runtime_error(std::format("make_temp_dir: mkdtemp failed for '{}'", pattern));
    }
    return filesystem::path_t(pattern);
}

temp_dir_t::temp_dir_t():
    m_path(make_temp_dir())
{
}

temp_dir_t::~temp_dir_t() {
    std::error_code ec;
    std::filesystem::remove_all(m_path.to_native_path(), ec);
}

const filesystem::path_t& temp_dir_t::path() const {
    return m_path;
}

filesystem::path_t temp_dir_t::operator/(const std::string& relative_path) const {
    return m_path / filesystem::relative_path_t(relative_path);
}

void write(const filesystem::path_t& path, std::string_view content) {
    filesystem::create_directories(path.parent());
    filesystem::write_file(path, content);
}

void write_json(const filesystem::path_t& path, const nlohmann::json& json) {
    write(path, json.dump(4));
}

void make_jar(const filesystem::path_t& jar, const std::map<std::string, std::string>& entries) {
    const auto content_dir = jar + ".content";
    for (const auto& [entry, content] : entries) {
        write(content_dir / filesystem::relative_path_t(entry), content);
    }
    filesystem::create_directories(jar.parent());
    filesystem::create_directories(content_dir);
    zip::zip(content_dir, jar);
    filesystem::remove_all(content_dir);
}

void write_fake_javac(const filesystem::path_t& path, int exit_code) {
    write(path, std::format(
        "#!/bin/sh\n"
        "printf '%s\\n' \"$@\" > '{}.args'\n"
        "if [ \"$1\" = \"-d\" ]; then touch \"$2/module-info.class\"; fi\n"
        "exit {}\n",
        path,
        exit_code
    ));
    std::filesystem::permissions(path.to_native_path(), std::filesystem::perms::owner_all, std::filesystem::perm_options::add);
}

} // namespace jmodgen::test

namespace jmodgen::test {

app_lib_suite_t::app_lib_suite_t(const temp_dir_t& dir, bool module_deps_equal_dist_deps, int javac_exit_code):
    suite_json(dir / "suite/suite.json"),
    jdk_json(dir / "jdk/jdk.json"),
    javac(dir / "jdk/bin/javac"),
    output_root(dir / "suite/build"),
    compiler_jar(dir / "jdk/upgrade/jdk.internal.vm.compiler.jar")
{
    const auto suite_dir = suite_json.parent();

    write(suite_dir / filesystem::relative_path_t("lib/src/com/lib/Thing.java"),
        "package com.lib;\n"
        "\n"
        "public class Thing {}\n"
    );
    write(suite_dir / filesystem::relative_path_t("lib/src/com/lib/internal/Hidden.java"),
        "package com.lib.internal;\n"
        "\n"
        "import java.util.List;\n"
        "\n"
        "public class Hidden {}\n"
    );
    write(suite_dir / filesystem::relative_path_t("app/src/com/app/Main.java"),
        "package com.app;\n"
        "\n"
        "import com.lib.Thing;\n"
        "import com.lib.internal.Hidden;\n"
        "import java.util.List;\n"
        "import jdk.vm.ci.code.Architecture;\n"
        "import jdk.vm.ci.hotspot.HotSpotJVMCIRuntime;\n"
        "\n"
        "public class Main {}\n"
    );

    make_jar(suite_dir / filesystem::relative_path_t("dists/lib.jar"), {
        { "com/lib/Thing.class", "Thing" },
        { "com/lib/Service.class", "Service" },
        { "com/lib/internal/Hidden.class", "Hidden" },
        { "META-INF/services/com.lib.Service", "# providers\ncom.lib.internal.ServiceImpl\n\n" }
    });
    make_jar(suite_dir / filesystem::relative_path_t("dists/app.jar"), {
        { "com/app/Main.class", "Main" }
    });

    nlohmann::json lib_dist = {
        { "path", "dists/lib.jar" },
        { "dependencies", { "lib" } },
        { "moduledeps", { "LIB" } }
    };
    nlohmann::json app_dist = {
        { "path", "dists/app.jar" },
        { "dependencies", { "app" } },
        { "dist_dependencies", { "LIB" } },
        { "moduledeps", { "APP" } }
    };
    if (module_deps_equal_dist_deps) {
        lib_dist["module_name"] = "lib";
        app_dist["module_name"] = "app";
    }

    write_json(suite_json, {
        { "output_root", "build" },
        { "module_deps_equal_dist_deps", module_deps_equal_dist_deps },
        { "libraries", {
            { "JVMCI", { { "kind", "jdk" }, { "jdk_module", "jdk.internal.vm.ci" } } }
        } },
        { "projects", {
            { "lib", { { "dir", "lib" }, { "source_dirs", { "src" } }, { "exports", { "com.lib" } } } },
            { "app", { { "dir", "app" }, { "source_dirs", { "src" } }, { "dependencies", { "LIB", "JVMCI" } } } }
        } },
        { "distributions", {
            { "LIB", lib_dist },
            { "APP", app_dist }
        } }
    });

    write_fake_javac(javac, javac_exit_code);
    write_json(jdk_json, {
        { "home", "." },
        { "javac", "bin/javac" },
        { "transitive_requires_keyword", "transitive" },
        { "modules", {
            { { "name", "java.base" }, { "exports", { { "java.lang", nlohmann::json::array() }, { "java.util", nlohmann::json::array() } } } },
            { { "name", "jdk.internal.vm.ci" }, { "exports", { { "jdk.vm.ci.code", { "jdk.internal.vm.compiler" } } } }, { "packages", { "jdk.vm.ci.hotspot" } } },
            { { "name", "jdk.internal.vm.compiler" }, { "exports", nlohmann::json::object() }, { "jarpath", "upgrade/jdk.internal.vm.compiler.jar" } }
        } }
    });
}

std::unique_ptr<session_t> app_lib_suite_t::session() const {
    return std::make_unique<session_t>(suite_t::load(suite_json), jdk_t::load(jdk_json));
}

} // namespace jmodgen::test

namespace jmodgen::test {

void write_indirect_lib_suite(const temp_dir_t& dir) {
    write(dir / "lib/src/com/lib/Thing.java", "package com.lib;\n\npublic class Thing {}\n");
    write(dir / "app/src/com/app/Main.java",
        "package com.app;\n"
        "\n"
        "import com.lib.Thing;\n"
        "\n"
        "public class Main {}\n"
    );
    write(dir / "mid/src/org/mid/Mid.java", "package org.mid;\n\npublic class Mid {}\n");
    write(dir / "tool/src/org/tool/Tool.java",
        "package org.tool;\n"
        "\n"
        "import com.lib.Thing;\n"
        "import org.mid.Mid;\n"
        "\n"
        "public class Tool {}\n"
    );

    make_jar(dir / "dists/lib.jar", { { "com/lib/Thing.class", "Thing" } });
    make_jar(dir / "dists/app.jar", { { "com/app/Main.class", "Main" } });
    make_jar(dir / "dists/mid.jar", { { "org/mid/Mid.class", "Mid" } });
    make_jar(dir / "dists/tool.jar", { { "org/tool/Tool.class", "Tool" } });

    write_json(dir / "suite.json", {
        { "projects", {
            { "lib", { { "exports", { "com.lib" } } } },
            { "app", { { "dependencies", { "LIB" } } } },
            { "mid", nlohmann::json::object() },
            { "tool", nlohmann::json::object() }
        } },
        { "distributions", {
            { "LIB", { { "path", "dists/lib.jar" }, { "dependencies", { "lib" } }, { "moduledeps", { "LIB" } } } },
            { "APP", { { "path", "dists/app.jar" }, { "dependencies", { "app" } }, { "moduledeps", { "APP" } } } },
            { "MID", { { "path", "dists/mid.jar" }, { "dependencies", { "mid" } }, { "dist_dependencies", { "LIB" } } } },
            { "TOOL", { { "path", "dists/tool.jar" }, { "dependencies", { "tool" } }, { "dist_dependencies", { "MID" } }, { "moduledeps", { "TOOL" } } } }
        } }
    });

    write_fake_javac(dir / "bin/javac", 0);
    write_json(dir / "jdk.json", {
        { "home", "." },
        { "modules", { { { "name", "java.base" }, { "exports", { { "java.lang", nlohmann::json::array() } } } } } }
    });
}

} // namespace jmodgen::test
