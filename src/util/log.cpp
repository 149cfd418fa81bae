#include <scribe/log.hpp>
#include <cstdarg>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace scribe::log {

static Level s_level = Info;
static std::FILE* s_sink = nullptr;
static bool s_color_initialized = false;
static bool s_color_forced = false;
static bool s_color_enabled = false;

static std::FILE* sink() {
    return s_sink ? s_sink : stderr;
}

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(sink()));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

void set_sink(std::FILE* f) {
    s_sink = f;
    // Re-detect on the next record unless the caller forced color
    if (!s_color_forced) s_color_initialized = false;
}

std::FILE* get_sink() {
    return sink();
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
    s_color_forced = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

static void write_record(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    init_color();

    std::FILE* out = sink();
    if (s_color_enabled) {
        std::fprintf(out, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out, "%s: ", level_name(lvl));
    }

    std::vfprintf(out, fmt, args);
    std::fputc('\n', out);
    std::fflush(out);
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_record(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_record(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_record(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_record(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_record(Error, fmt, args);
    va_end(args);
}

} // namespace scribe::log
