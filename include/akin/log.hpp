#pragma once

#include <akin/result.hpp>
#include <string>
#include <cstdio>

namespace akin::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output (stderr by default). Passing nullptr restores stderr.
// Color auto-detection follows the new stream.
void set_stream(std::FILE* stream);
std::FILE* get_stream();

bool enabled(Level lvl);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parse "trace", "debug", "info", "warn"/"warning" or "error" (case-insensitive)
Result<Level> parse_level(const std::string& name);

} // namespace akin::log
