#include "Logging.h"

#include <cstdio>
#include <cstring>

namespace {
LogLevel activeLevel = LogLevel::Info;
LogSink activeSink = nullptr;

void stderrSink(LogLevel, const char* line) { std::fprintf(stderr, "%s\n", line); }

const char* levelTag(const LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "DBG";
    case LogLevel::Info:
      return "INF";
    default:
      return "ERR";
  }
}
}  // namespace

void setLogLevel(const LogLevel level) { activeLevel = level; }

LogLevel getLogLevel() { return activeLevel; }

void setLogSink(const LogSink sink) { activeSink = sink; }

const char* logLevelName(const LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Error:
      return "error";
    case LogLevel::None:
      return "none";
  }
  return "?";
}

bool parseLogLevel(const char* name, LogLevel* out) {
  if (name == nullptr) return false;
  if (strcmp(name, "debug") == 0) {
    *out = LogLevel::Debug;
  } else if (strcmp(name, "info") == 0) {
    *out = LogLevel::Info;
  } else if (strcmp(name, "error") == 0) {
    *out = LogLevel::Error;
  } else if (strcmp(name, "none") == 0) {
    *out = LogLevel::None;
  } else {
    return false;
  }
  return true;
}

void logVPrintf(const LogLevel level, const char* origin, const char* format, va_list args) {
  if (level == LogLevel::None || static_cast<int>(level) < static_cast<int>(activeLevel)) {
    return;
  }

  char message[256];
  vsnprintf(message, sizeof(message), format, args);

  char line[300];
  snprintf(line, sizeof(line), "[%s] [%s] %s", levelTag(level), origin, message);

  (activeSink ? activeSink : stderrSink)(level, line);
}

void logPrintf(const LogLevel level, const char* origin, const char* format, ...) {
  va_list args;
  va_start(args, format);
  logVPrintf(level, origin, format, args);
  va_end(args);
}
