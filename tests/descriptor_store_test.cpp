#include "test_util.h"

#include <modules/jmodgen/error/error.h>
#include <modules/jmodgen/module/descriptor_store.h>

#include <gtest/gtest.h>

using namespace jmodgen;

namespace {

std::vector<std::string> names(const modulepath_t& modulepath) {
    std::vector<std::string> result;
    for (const auto* module : modulepath) {
        result.push_back(module->name());
    }
    return result;
}

} // namespace

TEST(descriptor_store_test, descriptor_path_is_sibling_of_jar) {
    EXPECT_EQ(descriptor_path(filesystem::path_t("/out/modules/app.jar")), filesystem::path_t("/out/modules/app.descriptor"));
}

TEST(descriptor_store_test, snapshot_names_distribution_and_platform_modules) {
    test::temp_dir_t dir;
    const test::app_lib_suite_t app_lib(dir, false, 0);
    const auto session = app_lib.session();

    const auto* app = session->make_java_module(*session->suite().distribution("APP"));
    ASSERT_NE(app, nullptr);

    const auto app_snapshot = snapshot(*app);
    EXPECT_EQ(app_snapshot.name, "app");
    EXPECT_EQ(app_snapshot.dist, "APP");
    EXPECT_EQ(app_snapshot.jarpath, app->archive_path()->string());
    EXPECT_EQ(app_snapshot.modulepath, (std::vector<std::string> { "dist:LIB", "java.base", "jdk.internal.vm.ci", "jdk.internal.vm.compiler" }));

    const auto decoded = from_cbor(to_cbor(app_snapshot), "app");
    EXPECT_EQ(decoded.requires_modules, app_snapshot.requires_modules);
    EXPECT_EQ(decoded.concealed_requires, app_snapshot.concealed_requires);
    EXPECT_EQ(decoded.modulepath, app_snapshot.modulepath);
    EXPECT_EQ(decoded.jarpath, app_snapshot.jarpath);

    EXPECT_THROW(snapshot(*session->jdk().module("java.base")), std::runtime_error);
}

TEST(descriptor_store_test, platform_modules_are_not_saved) {
    test::temp_dir_t dir;
    const test::app_lib_suite_t app_lib(dir, false, 0);
    const auto session = app_lib.session();

    EXPECT_FALSE(save(*session->jdk().module("jdk.internal.vm.compiler")).has_value());
}

TEST(descriptor_store_test, fresh_session_loads_persisted_descriptors) {
    test::temp_dir_t dir;
    const test::app_lib_suite_t app_lib(dir, false, 0);

    {
        const auto session = app_lib.session();
        ASSERT_NE(session->make_java_module(*session->suite().distribution("APP")), nullptr);
    }

    const auto session = app_lib.session();
    const auto& app_dist = *session->suite().distribution("APP");
    const auto* app = session->as_java_module(app_dist, true);
    ASSERT_NE(app, nullptr);

    EXPECT_EQ(app->name(), "app");
    EXPECT_EQ(app->origin(), &app_dist);
    EXPECT_EQ(app->exports(), (module_exports_t { { "com.app", {} } }));
    EXPECT_EQ(app->requires_modules(), (module_requires_t {
        { "java.base", {} },
        { "jdk.internal.vm.ci", {} },
        { "lib", {} }
    }));
    EXPECT_EQ(app->concealed_requires().at("lib"), std::set<std::string> { "com.lib.internal" });
    EXPECT_EQ(names(app->modulepath()), (std::vector<std::string> { "lib", "java.base", "jdk.internal.vm.ci", "jdk.internal.vm.compiler" }));
    EXPECT_EQ(app->modulepath().front()->origin(), session->suite().distribution("LIB"));
    EXPECT_EQ(app->modulepath()[1], session->jdk().module("java.base"));

    const auto* lib = session->as_java_module(*session->suite().distribution("LIB"), true);
    EXPECT_EQ(lib, app->modulepath().front());
    EXPECT_EQ(lib->provides(), (module_provides_t { { "com.lib.Service", { "com.lib.internal.ServiceImpl" } } }));
    EXPECT_EQ(lib->uses(), std::set<std::string> { "com.lib.Service" });

    EXPECT_EQ(session->as_java_module(app_dist, true), app);
}

TEST(descriptor_store_test, missing_descriptor) {
    test::temp_dir_t dir;
    const test::app_lib_suite_t app_lib(dir, false, 0);
    const auto session = app_lib.session();
    const auto& lib_dist = *session->suite().distribution("LIB");

    EXPECT_FALSE(load(*session, lib_dist, false));
    EXPECT_EQ(session->as_java_module(lib_dist, false), nullptr);

    try {
        session->as_java_module(lib_dist, true);
        FAIL() << "expected cache_miss_error_t";
    } catch (const cache_miss_error_t& e) {
        EXPECT_EQ(e.path(), (app_lib.output_root / filesystem::relative_path_t("modules/lib.descriptor")).string());
    }
}

TEST(descriptor_store_test, unknown_platform_module_on_persisted_module_path) {
    test::temp_dir_t dir;
    const test::app_lib_suite_t app_lib(dir, false, 0);

    {
        const auto session = app_lib.session();
        const auto* lib = session->make_java_module(*session->suite().distribution("LIB"));
        ASSERT_NE(lib, nullptr);

        auto lib_snapshot = snapshot(*lib);
        lib_snapshot.modulepath.push_back("jdk.unknown");
        const auto cbor = to_cbor(lib_snapshot);
        filesystem::write_file(descriptor_path(*lib->archive_path()), std::string_view(reinterpret_cast<const char*>(cbor.data()), cbor.size()));
    }

    const auto session = app_lib.session();
    try {
        session->as_java_module(*session->suite().distribution("LIB"), true);
        FAIL() << "expected configuration_error_t";
    } catch (const configuration_error_t& e) {
        EXPECT_EQ(e.entity(), "jdk.unknown");
    }
}

TEST(descriptor_store_test, descriptor_of_other_distribution) {
    test::temp_dir_t dir;
    const test::app_lib_suite_t app_lib(dir, false, 0);

    {
        const auto session = app_lib.session();
        const auto* lib = session->make_java_module(*session->suite().distribution("LIB"));
        ASSERT_NE(lib, nullptr);

        auto lib_snapshot = snapshot(*lib);
        lib_snapshot.dist = "APP";
        const auto cbor = to_cbor(lib_snapshot);
        filesystem::write_file(descriptor_path(*lib->archive_path()), std::string_view(reinterpret_cast<const char*>(cbor.data()), cbor.size()));
    }

    const auto session = app_lib.session();
    EXPECT_THROW(session->as_java_module(*session->suite().distribution("LIB"), true), configuration_error_t);
}

TEST(descriptor_store_test, corrupt_descriptor) {
    test::temp_dir_t dir;
    const test::app_lib_suite_t app_lib(dir, false, 0);
    const auto session = app_lib.session();

    test::write(app_lib.output_root / filesystem::relative_path_t("modules/lib.descriptor"), "not cbor");
    EXPECT_THROW(session->as_java_module(*session->suite().distribution("LIB"), true), std::runtime_error);
}
