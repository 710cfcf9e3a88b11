#include <ruleguard/log.hpp>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace ruleguard::log {

static Level s_level = Info;
static std::FILE* s_stream = nullptr;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static std::FILE* out() {
    return s_stream ? s_stream : stderr;
}

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(out()));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

bool enabled(Level lvl) {
    return lvl != Silent && lvl >= s_level;
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_stream(std::FILE* stream) {
    s_stream = stream;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace:  return "trace";
        case Debug:  return "debug";
        case Info:   return "info";
        case Warn:   return "warn";
        case Error:  return "error";
        case Silent: return "silent";
    }
    return "unknown";
}

Level parse_level(const std::string& name) {
    if (name == "trace")  return Trace;
    if (name == "debug")  return Debug;
    if (name == "warn")   return Warn;
    if (name == "error")  return Error;
    if (name == "silent") return Silent;
    return Info;
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
        default:    return "";
    }
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;
    init_color();

    std::FILE* f = out();
    if (s_color_enabled) {
        std::fprintf(f, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(f, "%s: ", level_name(lvl));
    }

    std::vfprintf(f, fmt, args);
    std::fprintf(f, "\n");
}

#define RULEGUARD_LOG_FN(name, lvl)      \
    void name(const char* fmt, ...) {    \
        va_list args;                    \
        va_start(args, fmt);             \
        log_message(lvl, fmt, args);     \
        va_end(args);                    \
    }

RULEGUARD_LOG_FN(trace, Trace)
RULEGUARD_LOG_FN(debug, Debug)
RULEGUARD_LOG_FN(info, Info)
RULEGUARD_LOG_FN(warn, Warn)
RULEGUARD_LOG_FN(error, Error)

#undef RULEGUARD_LOG_FN

} // namespace ruleguard::log
