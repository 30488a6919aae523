#pragma once

#include <cstdio>
#include <optional>
#include <string>

namespace ferry::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();

// "trace", "debug", "info", "warn", "error", "off" (case-insensitive)
std::optional<Level> parse_level(const std::string& name);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output (default stderr). Passing nullptr restores stderr.
// Colour detection follows the new sink.
void set_sink(std::FILE* sink);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace ferry::log
