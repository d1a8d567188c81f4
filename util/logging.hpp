#ifndef UTIL_LOGGING_HPP
#define UTIL_LOGGING_HPP
#include <string>

namespace util {

// Applies a textual log level (DEBUG, INFO, WARNING, ERROR, CRITICAL) to the
// stderr threshold and the verbosity of glog. Returns false on unknown
// levels.
bool SetLogLevel(const std::string& level);

// Sends the log of the current evaluation to <directory>/evaluation.debug.log
// (every message) and <directory>/evaluation.error.log (errors only).
void LogToEvaluationDirectory(const std::string& directory);

}  // namespace util

#endif
