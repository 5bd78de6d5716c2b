#pragma once

#include <kiln/result.hpp>
#include <string>

// Leveled logging to stderr. Each call writes one whole line, so output
// from concurrent pipeline runs never interleaves mid-line.
namespace kiln::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// "trace", "debug", "info", "warn" or "error"
Result<Level> parse_level(const std::string& name);
const char* level_name(Level lvl);

// Color defaults to on when stderr is a terminal
void set_color_enabled(bool enabled);
bool is_color_enabled();

// printf-style
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

} // namespace kiln::log
