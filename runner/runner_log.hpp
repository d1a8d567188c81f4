#ifndef RUNNER_RUNNER_LOG_HPP
#define RUNNER_RUNNER_LOG_HPP

#include <string>

namespace runner {

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

// Parses DEBUG, INFO, WARNING, ERROR or CRITICAL. Returns false otherwise.
bool ParseLogLevel(const std::string& name, LogLevel* level);

void SetLogLevel(LogLevel level);

// Writes a timestamped line to stderr if level is at or above the current
// threshold.
void Log(LogLevel level, const std::string& message);

}  // namespace runner

#endif
