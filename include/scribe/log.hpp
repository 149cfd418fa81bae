#pragma once

#include <cstdio>

namespace scribe::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Records go to stderr unless redirected. Passing nullptr restores stderr.
void set_sink(std::FILE* sink);
std::FILE* get_sink();

// Color defaults to whether the sink is a terminal. Once set explicitly it
// sticks across set_sink calls.
void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace scribe::log
