#pragma once

#include <kiln/result.hpp>
#include <string>
#include <cstdio>

namespace kiln::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Case-insensitive inverse of level_name(); "warning" is accepted for Warn.
Result<Level> parse_level(const std::string& name);

// Apply KILN_LOG (e.g. KILN_LOG=debug) if set. Returns the error for an
// unrecognized value and leaves the current level untouched.
Status init_from_env();

} // namespace kiln::log
