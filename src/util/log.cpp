#include <fnr/log.hpp>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cctype>

#include <unistd.h>

namespace fnr::log {

static Level s_level = Warn;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static void init_color() {
    if (!s_color_initialized) {
        const char* no_color = std::getenv("NO_COLOR");
        bool suppressed = no_color && no_color[0] != '\0';
        s_color_enabled = !suppressed && isatty(fileno(stderr));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

Result<Level> parse_level(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return Result<Level>::ok(Trace);
    if (lower == "debug") return Result<Level>::ok(Debug);
    if (lower == "info") return Result<Level>::ok(Info);
    if (lower == "warn" || lower == "warning") return Result<Level>::ok(Warn);
    if (lower == "error") return Result<Level>::ok(Error);
    if (lower == "off") return Result<Level>::ok(Off);

    return FnrError{FnrError::InvalidArg,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error, off"};
}

void init_from_env() {
    const char* env = std::getenv("FNR_LOG");
    if (!env || env[0] == '\0') return;
    auto lvl = parse_level(env);
    if (lvl.is_ok()) {
        s_level = lvl.value();
    } else {
        warn("ignoring FNR_LOG: %s", lvl.error().message.c_str());
    }
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
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
        case Off:   return "off";
    }
    return "unknown";
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[31m";
        case Off:   return "";
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    init_color();

    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }

    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace fnr::log
