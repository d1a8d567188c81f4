#include "limiter/flags.hpp"

#include <cstdint>

DEFINE_int32(time_limit, -1,
             "Seconds before the command is stopped, 0 for no limit; if "
             "negative, --limiter_default_time_limit is used");
DEFINE_int32(kill_after, 1,
             "Seconds after the time limit before the command is killed");
DEFINE_string(signal, "TERM", "Signal used to stop the command");
DEFINE_int32(limiter_default_time_limit, 60,
             "Time limit in seconds when --time_limit is not given");

namespace limiter {

bool OptionsFromFlags(const std::vector<std::string>& command,
                      LimiterOptions* options, std::string* error_msg) {
  if (command.empty()) {
    *error_msg = "no command given";
    return false;
  }
  int32_t time_limit = FLAGS_time_limit;
  if (time_limit < 0) time_limit = FLAGS_limiter_default_time_limit;
  if (time_limit < 0) {
    *error_msg = "invalid time limit " + std::to_string(time_limit);
    return false;
  }
  if (FLAGS_kill_after < 0) {
    *error_msg = "invalid --kill_after " + std::to_string(FLAGS_kill_after);
    return false;
  }
  const int signal = ParseSignal(FLAGS_signal);
  if (signal < 0) {
    *error_msg = "unknown signal " + FLAGS_signal;
    return false;
  }
  options->args = command;
  options->time_limit_millis = int64_t{time_limit} * 1000;
  options->kill_after_millis = int64_t{FLAGS_kill_after} * 1000;
  options->stop_signal = signal;
  return true;
}

}  // namespace limiter
