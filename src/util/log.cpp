#include <depwatch/log.hpp>
#include <cstdarg>
#include <cstdio>

#include <unistd.h>

namespace depwatch::log {

static Level s_level = Info;
static std::FILE* s_sink = nullptr;
static bool s_color_initialized = false;
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

bool parse_level(const std::string& name, Level& out) {
    if (name == "trace")                        { out = Trace; return true; }
    if (name == "debug")                        { out = Debug; return true; }
    if (name == "info")                         { out = Info;  return true; }
    if (name == "warn" || name == "warning")    { out = Warn;  return true; }
    if (name == "error")                        { out = Error; return true; }
    return false;
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_sink(std::FILE* f) {
    s_sink = f;
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

static void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    init_color();

    std::FILE* out = sink();
    if (s_color_enabled) {
        std::fprintf(out, "%sdepwatch %s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out, "depwatch %s: ", level_name(lvl));
    }

    std::vfprintf(out, fmt, args);
    std::fputc('\n', out);
    std::fflush(out);
}

#define DEPWATCH_LOG_FN(name, lvl)      \
    void name(const char* fmt, ...) {   \
        va_list args;                   \
        va_start(args, fmt);            \
        emit(lvl, fmt, args);           \
        va_end(args);                   \
    }

DEPWATCH_LOG_FN(trace, Trace)
DEPWATCH_LOG_FN(debug, Debug)
DEPWATCH_LOG_FN(info, Info)
DEPWATCH_LOG_FN(warn, Warn)
DEPWATCH_LOG_FN(error, Error)

#undef DEPWATCH_LOG_FN

} // namespace depwatch::log
