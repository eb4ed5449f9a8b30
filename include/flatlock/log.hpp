#pragma once

#include <string>
#include <optional>
#include <cstdio>

namespace flatlock::log {

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

// "trace" | "debug" | "info" | "warn" | "warning" | "error", case-insensitive
std::optional<Level> parse_level(const std::string& name);

// Apply FLATLOCK_LOG=<level> from the environment, if set and valid.
// Returns true when the level was changed.
bool init_from_env();

} // namespace flatlock::log
