#pragma once

#include <string>
#include <cstdio>

namespace depwatch::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Accepts "trace", "debug", "info", "warn"/"warning", "error".
// Leaves `out` untouched and returns false for anything else.
bool parse_level(const std::string& name, Level& out);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output (tests, embedding hosts). nullptr restores stderr.
void set_sink(std::FILE* sink);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace depwatch::log
