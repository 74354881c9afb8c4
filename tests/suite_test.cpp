#include "test_util.h"

#include <modules/jmodgen/error/error.h>
#include <modules/jmodgen/suite/suite.h>

#include <gtest/gtest.h>

using namespace jmodgen;

namespace {

std::vector<std::string> names(const std::vector<dependency_t*>& dependencies) {
    std::vector<std::string> result;
    for (const auto* dependency : dependencies) {
        result.push_back(dependency->name());
    }
    return result;
}

} // namespace

TEST(suite_test, load_resolves_dependencies) {
    test::temp_dir_t dir;
    test::write(dir / "p/src/com/p/P.java", "package com.p;\nimport com.q.Q;\n");
    test::write_json(dir / "suite.json", {
        { "libraries", {
            { "GUAVA", { { "path", "lib/guava.jar" } } },
            { "JVMCI", { { "kind", "jdk" }, { "jdk_module", "jdk.internal.vm.ci" } } }
        } },
        { "projects", {
            { "p", { { "dependencies", { "q", "GUAVA", "JVMCI" } }, { "uses", { "com.p.Service" } }, { "runtime_deps", { "java.logging" } } } },
            { "q", nlohmann::json::object() },
            { "n", { { "kind", "native" } } }
        } },
        { "distributions", {
            { "P_DIST", { { "dependencies", { "p" } }, { "moduledeps", { "P_DIST" } } } }
        } }
    });

    const auto suite = suite_t::load(dir / "suite.json");
    EXPECT_EQ(suite.output_root(), dir / "build");
    EXPECT_FALSE(suite.module_deps_equal_dist_deps());

    const auto* p = suite.dependency("p");
    ASSERT_NE(p, nullptr);
    ASSERT_TRUE(p->is_java_project());
    EXPECT_EQ(names(p->dependencies()), (std::vector<std::string> { "q", "GUAVA", "JVMCI" }));
    EXPECT_EQ(p->uses(), std::vector<std::string> { "com.p.Service" });
    EXPECT_EQ(p->runtime_deps(), std::vector<std::string> { "java.logging" });
    EXPECT_FALSE(p->declared_exports().has_value());

    const auto& project = static_cast<const java_project_t&>(*p);
    EXPECT_EQ(project.dir(), dir / "p");
    EXPECT_EQ(project.defined_packages(), std::set<std::string> { "com.p" });
    EXPECT_EQ(project.imported_packages(), std::set<std::string> { "com.q" });

    EXPECT_EQ(suite.dependency("n")->kind(), dependency_kind_t::NATIVE_PROJECT);
    EXPECT_TRUE(suite.dependency("JVMCI")->is_jdk_library());
    EXPECT_EQ(suite.dependency("GUAVA")->kind(), dependency_kind_t::LIBRARY);

    const auto* dist = suite.distribution("P_DIST");
    ASSERT_NE(dist, nullptr);
    EXPECT_EQ(dist->path(), dir / "build/dists/p-dist.jar");
    EXPECT_EQ(names(dist->moduledeps()), std::vector<std::string> { "P_DIST" });
    EXPECT_EQ(suite.distribution("p"), nullptr);
    EXPECT_EQ(suite.dependency("missing"), nullptr);
}

TEST(suite_test, archived_deps_exclude_distributions_and_jdk_libraries) {
    test::temp_dir_t dir;
    test::write_json(dir / "suite.json", {
        { "libraries", {
            { "LIB", { { "path", "lib.jar" } } },
            { "JDK_LIB", { { "kind", "jdk" } } }
        } },
        { "projects", {
            { "base", nlohmann::json::object() },
            { "core", { { "dependencies", { "base", "JDK_LIB" } } } },
            { "tool", { { "dependencies", { "core", "LIB", "BASE_DIST" } } } }
        } },
        { "distributions", {
            { "BASE_DIST", { { "dependencies", { "base" } } } },
            { "TOOL_DIST", { { "dependencies", { "tool" } }, { "dist_dependencies", { "BASE_DIST" } } } }
        } }
    });

    const auto suite = suite_t::load(dir / "suite.json");
    const auto* tool_dist = suite.distribution("TOOL_DIST");
    EXPECT_EQ(names(tool_dist->archived_deps()), (std::vector<std::string> { "core", "LIB", "tool" }));
    ASSERT_EQ(tool_dist->dist_dependencies().size(), 1u);
    EXPECT_EQ(tool_dist->dist_dependencies()[0]->name(), "BASE_DIST");
}

TEST(suite_test, unknown_dependency_is_a_configuration_error) {
    test::temp_dir_t dir;
    test::write_json(dir / "suite.json", {
        { "projects", {
            { "p", { { "dependencies", { "missing" } } } }
        } }
    });

    try {
        suite_t::load(dir / "suite.json");
        FAIL() << "expected configuration_error_t";
    } catch (const configuration_error_t& e) {
        EXPECT_EQ(e.entity(), "missing");
    }
}

TEST(suite_test, dependency_cycle_is_a_configuration_error) {
    test::temp_dir_t dir;
    test::write_json(dir / "suite.json", {
        { "projects", {
            { "a", { { "dependencies", { "b" } } } },
            { "b", { { "dependencies", { "c" } } } },
            { "c", { { "dependencies", { "a" } } } }
        } }
    });

    EXPECT_THROW(suite_t::load(dir / "suite.json"), configuration_error_t);
}

TEST(suite_test, duplicate_name_is_a_configuration_error) {
    test::temp_dir_t dir;
    test::write_json(dir / "suite.json", {
        { "libraries", { { "x", { { "path", "x.jar" } } } } },
        { "projects", { { "x", nlohmann::json::object() } } }
    });

    EXPECT_THROW(suite_t::load(dir / "suite.json"), configuration_error_t);
}

TEST(suite_test, malformed_json_is_a_configuration_error) {
    test::temp_dir_t dir;
    test::write(dir / "suite.json", "{ \"projects\": ");
    EXPECT_THROW(suite_t::load(dir / "suite.json"), configuration_error_t);

    test::write_json(dir / "suite.json", { { "projects", { { "p", { { "dependencies", "q" } } } } } });
    EXPECT_THROW(suite_t::load(dir / "suite.json"), configuration_error_t);

    EXPECT_THROW(suite_t::load(dir / "missing.json"), configuration_error_t);
}
