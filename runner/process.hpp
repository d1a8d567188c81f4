#ifndef RUNNER_PROCESS_HPP
#define RUNNER_PROCESS_HPP

#include <string>
#include <vector>

namespace runner {

struct ProcessResult {
  int status_code = 0;
  int signal = 0;
  std::string stdout_contents;
  std::string stderr_contents;
};

// Runs args in directory with stdin from /dev/null and both output streams
// captured. Returns false and sets error_msg if the command cannot be
// started.
bool RunCaptured(const std::vector<std::string>& args,
                 const std::string& directory, ProcessResult* result,
                 std::string* error_msg);

}  // namespace runner

#endif
