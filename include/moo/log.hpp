#pragma once

#include <optional>
#include <string>

namespace moo::log {

// Off silences everything, including errors (--quiet)
enum Level { Trace, Debug, Info, Warn, Error, Off };

// Auto colors only when stderr is a terminal (--ansi / --no-ansi force it)
enum class ColorMode { Auto, Always, Never };

void set_level(Level lvl);
Level get_level();

void set_color_mode(ColorMode mode);
ColorMode get_color_mode();
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// "trace" .. "error", "off"; case-insensitive
std::optional<Level> parse_level(const std::string& name);
std::optional<ColorMode> parse_color_mode(const std::string& name);

} // namespace moo::log
