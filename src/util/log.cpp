#include <ferry/log.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <mutex>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace ferry::log {

namespace {

std::atomic<Level> s_level{Info};
bool s_color_initialized = false;
bool s_color_enabled = false;
std::FILE* s_sink = nullptr;

// Fetch workers log concurrently; one line must never interleave with another
std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

std::FILE* sink() {
    return s_sink ? s_sink : stderr;
}

void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(sink()));
        s_color_initialized = true;
    }
}

const char* level_color(Level lvl) {
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

void log_message(Level lvl, const char* fmt, va_list args) {
    Level current = s_level.load();
    if (current == Off || lvl < current) return;

    std::lock_guard<std::mutex> lock(sink_mutex());
    init_color();
    std::FILE* out = sink();

    if (s_color_enabled) {
        std::fprintf(out, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out, "%s: ", level_name(lvl));
    }

    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
    std::fflush(out);
}

} // namespace

void set_level(Level lvl) {
    s_level.store(lvl);
}

Level get_level() {
    return s_level.load();
}

std::optional<Level> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return Trace;
    if (lower == "debug") return Debug;
    if (lower == "info") return Info;
    if (lower == "warn" || lower == "warning") return Warn;
    if (lower == "error") return Error;
    if (lower == "off" || lower == "quiet") return Off;
    return std::nullopt;
}

void set_color_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    std::lock_guard<std::mutex> lock(sink_mutex());
    init_color();
    return s_color_enabled;
}

void set_sink(std::FILE* sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    s_sink = sink;
    s_color_initialized = false;
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

} // namespace ferry::log
