#include <stencil/log.hpp>
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mutex>

#include <unistd.h>

namespace stencil::log {

static Level s_level = Info;
static bool s_color_initialized = false;
static bool s_color_enabled = false;
static std::FILE* s_output = nullptr;
static std::mutex s_write_mutex;

static std::FILE* output() {
    return s_output ? s_output : stderr;
}

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(output()));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

bool enabled(Level lvl) {
    return lvl >= s_level;
}

bool parse_level(const std::string& name, Level& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") { out = Trace; return true; }
    if (lower == "debug") { out = Debug; return true; }
    if (lower == "info")  { out = Info;  return true; }
    if (lower == "warn" || lower == "warning") { out = Warn; return true; }
    if (lower == "error") { out = Error; return true; }
    return false;
}

void init_from_env() {
    const char* env = std::getenv("STENCIL_LOG");
    if (!env) return;
    Level lvl;
    if (parse_level(env, lvl)) {
        s_level = lvl;
    }
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_output(std::FILE* out) {
    s_output = out;
    s_color_initialized = false;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;

    // Cache operations may log from several threads at once
    std::lock_guard<std::mutex> lock(s_write_mutex);
    init_color();
    std::FILE* out = output();

    if (s_color_enabled) {
        std::fprintf(out, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out, "%s: ", level_name(lvl));
    }

    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
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

} // namespace stencil::log
