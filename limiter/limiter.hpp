#ifndef LIMITER_LIMITER_HPP
#define LIMITER_LIMITER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "limiter/statistics.hpp"

namespace limiter {

struct LimiterOptions {
  // Command to run; args[0] is looked up in $PATH.
  std::vector<std::string> args;
  // When the command is still running after time_limit_millis its process
  // group receives stop_signal, and SIGKILL after kill_after_millis.
  int64_t time_limit_millis = 0;
  int64_t kill_after_millis = 0;
  int stop_signal = 15;
};

struct LimiterOutcome {
  Trailer trailer;
  // True if the command was still running at the time limit.
  bool timed_out = false;
};

// Runs a command under a wall clock limit and measures its resource usage.
// The command inherits the standard streams of the caller.
class Limiter {
 public:
  // Returns true if the command was started, and fills outcome. Otherwise,
  // returns false and sets error_msg.
  bool Run(const LimiterOptions& options, LimiterOutcome* outcome,
           std::string* error_msg);

  Limiter() = default;
  Limiter(const Limiter&) = delete;
  Limiter(Limiter&&) = delete;
  Limiter& operator=(const Limiter&) = delete;
  Limiter& operator=(Limiter&&) = delete;

 private:
  bool Setup(std::string* error_msg);
  bool DoFork(std::string* error_msg);
  [[noreturn]] void Child();
  bool Wait(LimiterOutcome* outcome, std::string* error_msg);

  int pipe_fds_[2] = {};
  int child_pid_ = 0;
  const LimiterOptions* options_ = nullptr;
};

// Parses a signal given as a name ("TERM", "SIGTERM") or a number. Returns
// -1 if it is not recognized.
int ParseSignal(const std::string& name);

}  // namespace limiter

#endif
