#pragma once

#include <cstdarg>

// Log levels, lowest to highest. Messages below the active level are dropped.
enum class LogLevel : int { Debug = 0, Info = 1, Error = 2, None = 3 };

// Receives one fully formatted line, without the trailing newline.
using LogSink = void (*)(LogLevel level, const char* line);

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Replace the output sink. Passing nullptr restores the default stderr sink.
void setLogSink(LogSink sink);

// "debug", "info", "error", "none"
const char* logLevelName(LogLevel level);
bool parseLogLevel(const char* name, LogLevel* out);

void logPrintf(LogLevel level, const char* origin, const char* format, ...) __attribute__((format(printf, 3, 4)));
void logVPrintf(LogLevel level, const char* origin, const char* format, va_list args);

#define LOG_DBG(origin, format, ...) logPrintf(LogLevel::Debug, origin, format, ##__VA_ARGS__)
#define LOG_INF(origin, format, ...) logPrintf(LogLevel::Info, origin, format, ##__VA_ARGS__)
#define LOG_ERR(origin, format, ...) logPrintf(LogLevel::Error, origin, format, ##__VA_ARGS__)
