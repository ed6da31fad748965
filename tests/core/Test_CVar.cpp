#include <doctest/doctest.h>
#include "minir/core/cvar.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace minir::core;

namespace {

std::filesystem::path tempIni(const char* name) {
    return std::filesystem::temp_directory_path() / name;
}

}

TEST_CASE("CVar registration") {
    CVar<int> count("test_cvar_count", "Test counter", 3);
    CVar<bool> flag("test_cvar_flag", "Test flag", false, CVarFlags::save);

    CHECK(CVarSystem::find("test_cvar_count") == &count);
    CHECK(CVarSystem::find("test_cvar_flag") == &flag);
    CHECK(CVarSystem::find("test_cvar_missing") == nullptr);

    SUBCASE("Duplicate names keep the first registration") {
        CVar<int> dup("test_cvar_count", "Duplicate", 9);
        CHECK(CVarSystem::find("test_cvar_count") == &count);
    }

    SUBCASE("Destruction unregisters") {
        {
            CVar<float> scoped("test_cvar_scoped", "Scoped", 1.0f);
            CHECK(CVarSystem::find("test_cvar_scoped") != nullptr);
        }
        CHECK(CVarSystem::find("test_cvar_scoped") == nullptr);
    }
}

TEST_CASE("CVar string conversion") {
    CVar<bool> flag("test_cvar_bool", "Bool", true);
    CVar<float> scale("test_cvar_float", "Float", 1.5f);
    CVar<std::string> label("test_cvar_string", "String", "default");

    CHECK(flag.toString() == "true");
    flag.setFromString("0");
    CHECK_FALSE(flag.get());
    flag.setFromString("True");
    CHECK(flag.get());
    CHECK_THROWS_AS(flag.setFromString("maybe"), std::invalid_argument);

    scale.setFromString("2.25");
    CHECK(scale.get() == doctest::Approx(2.25f));
    CHECK_THROWS_AS(scale.setFromString("abc"), std::invalid_argument);
    scale.reset();
    CHECK(scale.get() == doctest::Approx(scale.defaultValue()));

    label.setFromString("custom");
    CHECK(label.get() == "custom");
}

TEST_CASE("CVar change callback") {
    float observed = 0.0f;
    CVar<float> watched("test_cvar_watched", "Watched", 0.0f, CVarFlags::none,
                        [&observed](float v) { observed = v; });
    watched.set(4.0f);
    CHECK(observed == doctest::Approx(4.0f));
}

TEST_CASE("CVar ini persistence") {
    CVar<float> distance("test_cvar_distance", "Distance", 50.0f, CVarFlags::save);
    CVar<bool> culling("test_cvar_culling", "Culling", true, CVarFlags::save);
    CVar<int> locked("test_cvar_locked", "Locked", 7, CVarFlags::read_only);

    const auto path = tempIni("minir_test_cvars.ini");

    SUBCASE("Save then load restores saved values") {
        distance.set(75.0f);
        culling.set(false);
        CVarSystem::saveToIni(path);

        distance.reset();
        culling.reset();
        CHECK(CVarSystem::loadFromIni(path) >= 2);
        CHECK(distance.get() == doctest::Approx(75.0f));
        CHECK_FALSE(culling.get());
    }

    SUBCASE("Comments, unknown keys, bad values and read-only cvars are skipped") {
        {
            std::ofstream f(path, std::ios::trunc);
            f << "; comment\n"
              << "# another comment\n"
              << "test_cvar_unknown = 1\n"
              << "  test_cvar_distance =  12.5  \n"
              << "test_cvar_culling=perhaps\n"
              << "test_cvar_locked=99\n"
              << "not a pair\n";
        }

        CHECK(CVarSystem::loadFromIni(path) == 1);
        CHECK(distance.get() == doctest::Approx(12.5f));
        CHECK(culling.get());
        CHECK(locked.get() == 7);
    }

    SUBCASE("Missing file loads nothing") {
        std::filesystem::remove(path);
        CHECK(CVarSystem::loadFromIni(path) == 0);
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
}
