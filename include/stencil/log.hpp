#pragma once

#include <string>
#include <cstdio>

namespace stencil::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

// "trace", "debug", "info", "warn"/"warning", "error" (case-insensitive)
bool parse_level(const std::string& name, Level& out);

// Apply STENCIL_LOG (a level name) if it is set; unknown values are ignored.
void init_from_env();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination stream, stderr by default. Passing nullptr restores stderr.
void set_output(std::FILE* out);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace stencil::log
