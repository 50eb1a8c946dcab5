#include "logging.hpp"
#include <atomic>
#include <cstddef>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace {
std::atomic<LogLevel> g_level{LogLevel::Info};
std::atomic<LogSink> g_sink{nullptr};
std::mutex g_write_mutex;

constexpr std::size_t kMaxLogLine = 256;
} // namespace

void init_logging() {
    g_level.store(LogLevel::Info);
    g_sink.store(nullptr);
}

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel log_level() {
    return g_level.load();
}

void set_log_sink(LogSink sink) {
    g_sink.store(sink);
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::None: return "NONE";
    }
    return "?";
}

void log_message(LogLevel level, const char* tag, const char* fmt, ...) {
    if (level == LogLevel::None || level < g_level.load()) {
        return;
    }

    char line[kMaxLogLine]{};
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(line, sizeof(line), fmt, args);
    va_end(args);

    const LogSink sink = g_sink.load();
    if (sink) {
        sink(level, tag, line);
    }

    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::fprintf(stderr, "[%s][%s] %s\n", log_level_name(level), tag, line);
}

void log_info(const char* msg) {
    log_message(LogLevel::Info, "MAIN", "%s", msg);
}
