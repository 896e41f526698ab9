#include <catch2/catch.hpp>
#include <moo/settings.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace moo;
namespace fs = std::filesystem;

TEST_CASE("parse settings with log section", "[settings]") {
    auto r = UserSettings::parse(R"(
[log]
level = "debug"
color = "never"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().color == log::ColorMode::Never);
}

TEST_CASE("parse empty settings leaves everything unset", "[settings]") {
    auto r = UserSettings::parse("");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().log_level.has_value());
    REQUIRE_FALSE(r.value().color.has_value());
}

TEST_CASE("parse settings ignores unrelated tables", "[settings]") {
    auto r = UserSettings::parse(R"(
[ui]
theme = "dark"

[log]
level = "warn"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Warn);
    REQUIRE_FALSE(r.value().color.has_value());
}

TEST_CASE("parse invalid TOML settings", "[settings]") {
    auto r = UserSettings::parse("[log\nlevel = ");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == MooError::Parse);
}

TEST_CASE("unknown level or color is a Config error", "[settings]") {
    auto level = UserSettings::parse("[log]\nlevel = \"chatty\"\n");
    REQUIRE(level.is_err());
    REQUIRE(level.error().code == MooError::Config);

    auto color = UserSettings::parse("[log]\ncolor = \"rainbow\"\n");
    REQUIRE(color.is_err());
    REQUIRE(color.error().code == MooError::Config);
}

TEST_CASE("apply pushes values into the logger", "[settings]") {
    UserSettings settings;
    settings.log_level = log::Error;
    settings.color = log::ColorMode::Always;
    settings.apply();
    REQUIRE(log::get_level() == log::Error);
    REQUIRE(log::get_color_mode() == log::ColorMode::Always);

    // Unset fields leave the logger alone
    UserSettings{}.apply();
    REQUIRE(log::get_level() == log::Error);

    log::set_level(log::Info);
    log::set_color_mode(log::ColorMode::Auto);
}

TEST_CASE("load missing settings file is NotFound", "[settings]") {
    auto r = UserSettings::load("/nonexistent/moo/config.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == MooError::NotFound);
}

TEST_CASE("load reports the file of a bad settings file", "[settings]") {
    fs::path path = fs::temp_directory_path() / ("moo_settings_test_" + std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count()) + ".toml");
    {
        std::ofstream f(path);
        f << "[log]\nlevel = \"nope\"\n";
    }

    auto r = UserSettings::load(path.string());
    std::error_code ec;
    fs::remove(path, ec);

    REQUIRE(r.is_err());
    REQUIRE(r.error().file == path.string());
}

#ifndef _WIN32
TEST_CASE("user_settings_path lives under HOME", "[settings]") {
    const char* home = std::getenv("HOME");
    if (home) {
        REQUIRE(user_settings_path() == std::string(home) + "/.moo/config.toml");
    }
}
#endif
