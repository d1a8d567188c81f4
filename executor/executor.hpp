#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP
#include <cstdint>
#include <string>
#include <vector>

namespace executor {

struct Request {
  std::vector<std::string> args;
  // Directory the command is started in. Empty to keep the current one.
  std::string working_directory;
  // The whole process group is killed when this is exceeded. Zero disables
  // the limit.
  int64_t wall_limit_millis = 0;
};

struct Response {
  int32_t status_code = 0;
  int32_t signal = 0;
  // True if the command was killed for exceeding the wall limit.
  bool wall_limit_exceeded = false;
  int64_t wall_time_millis = 0;
  std::string stdout_contents;
  std::string stderr_contents;
};

class Executor {
 public:
  // A string that identifies this executor.
  virtual std::string Id() const = 0;

  // Runs the request to completion. Returns true if the command was started,
  // and fills response. Otherwise, returns false and sets error_msg.
  virtual bool Execute(const Request& request, Response* response,
                       std::string* error_msg) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
