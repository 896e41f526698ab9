#include <moo/log.hpp>
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace moo::log {

static Level s_level = Info;
static ColorMode s_color_mode = ColorMode::Auto;
static bool s_tty_checked = false;
static bool s_is_tty = false;

static bool stderr_is_tty() {
    if (!s_tty_checked) {
        s_is_tty = isatty(fileno(stderr));
        s_tty_checked = true;
    }
    return s_is_tty;
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

void set_color_mode(ColorMode mode) {
    s_color_mode = mode;
}

ColorMode get_color_mode() {
    return s_color_mode;
}

bool is_color_enabled() {
    switch (s_color_mode) {
        case ColorMode::Always: return true;
        case ColorMode::Never:  return false;
        case ColorMode::Auto:   break;
    }
    return stderr_is_tty();
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
        case Off:   return "off";
    }
    return "unknown";
}

static std::string lowered(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<Level> parse_level(const std::string& name) {
    std::string n = lowered(name);
    if (n == "trace") return Trace;
    if (n == "debug") return Debug;
    if (n == "info") return Info;
    if (n == "warn" || n == "warning") return Warn;
    if (n == "error") return Error;
    if (n == "off" || n == "quiet") return Off;
    return std::nullopt;
}

std::optional<ColorMode> parse_color_mode(const std::string& name) {
    std::string n = lowered(name);
    if (n == "auto") return ColorMode::Auto;
    if (n == "always") return ColorMode::Always;
    if (n == "never") return ColorMode::Never;
    return std::nullopt;
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
        case Off:   break;
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level || s_level == Off) return;

    if (is_color_enabled()) {
        std::fprintf(stderr, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }

    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace moo::log
