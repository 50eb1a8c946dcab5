#pragma once

#include <cstdint>

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error,
    None,
};

// Optional capture hook; receives the formatted line without the trailing newline.
using LogSink = void(*)(LogLevel level, const char* tag, const char* line);

void init_logging();
void set_log_level(LogLevel level);
LogLevel log_level();
void set_log_sink(LogSink sink);
const char* log_level_name(LogLevel level);

#if defined(__GNUC__)
void log_message(LogLevel level, const char* tag, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
#else
void log_message(LogLevel level, const char* tag, const char* fmt, ...);
#endif

void log_info(const char* msg);

