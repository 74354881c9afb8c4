#include "test_util.h"

#include <modules/jmodgen/error/error.h>
#include <modules/jmodgen/jdk/jdk.h>
#include <modules/jmodgen/suite/suite.h>

#include <gtest/gtest.h>

#include <cstdlib>

using namespace jmodgen;

TEST(jdk_test, load_platform_modules) {
    test::temp_dir_t dir;
    test::write_json(dir / "jdk.json", {
        { "home", "/opt/jdk" },
        { "modules", {
            { { "name", "java.base" }, { "exports", { { "java.lang", nlohmann::json::array() }, { "jdk.internal.misc", { "jdk.unsupported" } } } }, { "packages", { "sun.nio" } } },
            { { "name", "java.logging" }, { "exports", { { "java.util.logging", nlohmann::json::array() } } }, { "requires", { { "java.base", { "mandated" } } } } }
        } }
    });

    const auto jdk = jdk_t::load(dir / "jdk.json");
    EXPECT_EQ(jdk.home(), filesystem::path_t("/opt/jdk"));
    EXPECT_EQ(jdk.javac(), filesystem::path_t("/opt/jdk/bin/javac"));
    EXPECT_EQ(jdk.transitive_requires_keyword(), "transitive");

    ASSERT_EQ(jdk.modules().size(), 2u);
    EXPECT_EQ(jdk.modules()[0]->name(), "java.base");
    EXPECT_EQ(jdk.modules()[1]->name(), "java.logging");

    const auto* java_base = jdk.module("java.base");
    ASSERT_NE(java_base, nullptr);
    EXPECT_TRUE(java_base->is_platform_module());
    EXPECT_EQ(java_base->origin(), nullptr);
    EXPECT_EQ(java_base->packages(), (std::set<std::string> { "java.lang", "jdk.internal.misc", "sun.nio" }));
    EXPECT_EQ(java_base->conceals(), std::set<std::string> { "sun.nio" });
    EXPECT_EQ(java_base->exports().at("jdk.internal.misc"), std::set<std::string> { "jdk.unsupported" });
    EXPECT_EQ(jdk.module("java.logging")->requires_modules().at("java.base"), std::set<std::string> { "mandated" });
    EXPECT_EQ(jdk.module("java.desktop"), nullptr);
}

TEST(jdk_test, home_defaults_to_java_home) {
    test::temp_dir_t dir;
    test::write_json(dir / "jdk.json", { { "modules", nlohmann::json::array() } });

    setenv("JAVA_HOME", "/usr/lib/jvm/test", 1);
    const auto jdk = jdk_t::load(dir / "jdk.json");
    unsetenv("JAVA_HOME");

    EXPECT_EQ(jdk.home(), filesystem::path_t("/usr/lib/jvm/test"));
    EXPECT_EQ(jdk.javac(), filesystem::path_t("/usr/lib/jvm/test/bin/javac"));

    EXPECT_THROW(jdk_t::load(dir / "jdk.json"), configuration_error_t);
}

TEST(jdk_test, provides_jdk_libraries_naming_its_modules) {
    test::temp_dir_t dir;
    test::write_json(dir / "jdk.json", {
        { "home", "." },
        { "modules", { { { "name", "jdk.internal.vm.ci" }, { "exports", { { "jdk.vm.ci.code", nlohmann::json::array() } } } } } }
    });
    test::write_json(dir / "suite.json", {
        { "libraries", {
            { "JVMCI", { { "kind", "jdk" }, { "jdk_module", "jdk.internal.vm.ci" } } },
            { "JFR", { { "kind", "jdk" }, { "jdk_module", "jdk.jfr" } } },
            { "TOOLS", { { "kind", "jdk" } } },
            { "JAR", { { "path", "x.jar" } } }
        } }
    });

    const auto jdk = jdk_t::load(dir / "jdk.json");
    const auto suite = suite_t::load(dir / "suite.json");
    const auto library = [&suite](const char* name) -> const library_t& {
        return static_cast<const library_t&>(*suite.dependency(name));
    };

    EXPECT_TRUE(jdk.provides(library("JVMCI")));
    EXPECT_FALSE(jdk.provides(library("JFR")));
    EXPECT_TRUE(jdk.provides(library("TOOLS")));
    EXPECT_FALSE(jdk.provides(library("JAR")));
}

TEST(jdk_test, invalid_modules_are_configuration_errors) {
    test::temp_dir_t dir;

    test::write_json(dir / "jdk.json", { { "home", "." }, { "modules", { { { "name", "" } } } } });
    EXPECT_THROW(jdk_t::load(dir / "jdk.json"), configuration_error_t);

    test::write_json(dir / "jdk.json", { { "home", "." }, { "modules", {
        { { "name", "java.base" }, { "exports", nlohmann::json::object() } },
        { { "name", "java.base" }, { "exports", nlohmann::json::object() } }
    } } });
    EXPECT_THROW(jdk_t::load(dir / "jdk.json"), configuration_error_t);

    test::write_json(dir / "jdk.json", { { "home", "." } });
    EXPECT_THROW(jdk_t::load(dir / "jdk.json"), configuration_error_t);
}
