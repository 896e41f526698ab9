#pragma once

#include <moo/log.hpp>
#include <moo/result.hpp>
#include <optional>
#include <string>

namespace moo {

// The tool's own preferences, independent of any project:
//
//   [log]
//   level = "debug"
//   color = "never"
//
// Unset fields stay nullopt so command-line flags and defaults can layer
// on top.
struct UserSettings {
    std::optional<log::Level> log_level;
    std::optional<log::ColorMode> color;

    static Result<UserSettings> parse(const std::string& toml_str);
    static Result<UserSettings> load(const std::string& path);

    // Push the configured values into moo::log
    void apply() const;
};

// ~/.moo/config.toml, or "" when no home directory is known
std::string user_settings_path();

} // namespace moo
