#pragma once

#include <string>
#include <cstdio>

namespace ruleguard::log {

// Silent suppresses everything, including errors
enum Level { Trace, Debug, Info, Warn, Error, Silent };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Redirect output (defaults to stderr). Passing nullptr restores stderr.
void set_stream(std::FILE* stream);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Maps "trace", "debug", "info", "warn", "error", "silent"; Info otherwise
Level parse_level(const std::string& name);

} // namespace ruleguard::log
