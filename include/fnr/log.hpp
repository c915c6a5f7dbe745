#pragma once

#include <fnr/result.hpp>
#include <string>
#include <cstdio>

namespace fnr::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();

// Parse "trace", "debug", "info", "warn"/"warning", "error" or "off"
Result<Level> parse_level(const std::string& name);

// Apply FNR_LOG from the environment, if set and valid
void init_from_env();

// Color defaults to on when stderr is a terminal and NO_COLOR is unset
void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace fnr::log
