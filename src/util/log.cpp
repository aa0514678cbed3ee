#include <ulidkit/log.hpp>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <initializer_list>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace ulidkit::log {

// Sequencers log from whichever thread calls them, so the settings are atomic.
static std::atomic<int> s_level{Info};
static std::atomic<bool> s_color_initialized{false};
static std::atomic<bool> s_color_enabled{false};

static void init_color() {
    if (!s_color_initialized.load()) {
        s_color_enabled = isatty(fileno(stderr)) != 0;
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return static_cast<Level>(s_level.load());
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
    }
    return "unknown";
}

std::optional<Level> parse_level(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (lower == level_name(lvl)) return lvl;
    }
    if (lower == "warning") return Warn;
    return std::nullopt;
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

static const char* reset_color() {
    return "\033[0m";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level.load()) return;
    init_color();

    // Format into one buffer so concurrent callers don't interleave mid-line.
    char body[1024];
    std::vsnprintf(body, sizeof(body), fmt, args);

    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s%s: %s\n", level_color(lvl), level_name(lvl),
                     reset_color(), body);
    } else {
        std::fprintf(stderr, "%s: %s\n", level_name(lvl), body);
    }
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

} // namespace ulidkit::log
