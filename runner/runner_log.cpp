#include "runner/runner_log.hpp"

#include <stdio.h>
#include <time.h>

namespace runner {

namespace {

LogLevel threshold = LogLevel::ERROR;

const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::CRITICAL:
      return "CRITICAL";
  }
  return "ERROR";
}

}  // namespace

bool ParseLogLevel(const std::string& name, LogLevel* level) {
  for (LogLevel candidate : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARNING,
                             LogLevel::ERROR, LogLevel::CRITICAL}) {
    if (name == LevelName(candidate)) {
      *level = candidate;
      return true;
    }
  }
  return false;
}

void SetLogLevel(LogLevel level) { threshold = level; }

void Log(LogLevel level, const std::string& message) {
  if (static_cast<int>(level) < static_cast<int>(threshold)) return;
  char stamp[32] = {};
  time_t now = time(nullptr);
  struct tm tm {};
  gmtime_r(&now, &tm);
  strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
  fprintf(stderr, "%s %s %s\n", stamp, LevelName(level), message.c_str());
}

}  // namespace runner
