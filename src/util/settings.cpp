#include <moo/settings.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace moo {

Result<UserSettings> UserSettings::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return MooError{MooError::Parse,
            std::string("settings TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    UserSettings settings;

    if (auto log_tbl = doc["log"].as_table()) {
        if (auto level = (*log_tbl)["level"].value<std::string>()) {
            settings.log_level = log::parse_level(*level);
            if (!settings.log_level) {
                return MooError{MooError::Config,
                    "unknown log level '" + *level + "'",
                    "expected one of: trace, debug, info, warn, error, off"};
            }
        }
        if (auto color = (*log_tbl)["color"].value<std::string>()) {
            settings.color = log::parse_color_mode(*color);
            if (!settings.color) {
                return MooError{MooError::Config,
                    "unknown color mode '" + *color + "'",
                    "expected one of: auto, always, never"};
            }
        }
    }

    return Result<UserSettings>::ok(std::move(settings));
}

Result<UserSettings> UserSettings::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return MooError{MooError::NotFound,
            "cannot open settings file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto settings = UserSettings::parse(ss.str());
    if (settings.is_err() && settings.error().file.empty()) {
        settings.error().file = path;
    }
    return settings;
}

void UserSettings::apply() const {
    if (log_level) log::set_level(*log_level);
    if (color) log::set_color_mode(*color);
}

std::string user_settings_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.moo/config.toml";
}

} // namespace moo
