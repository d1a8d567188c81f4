#include <stdio.h>

#include <string>
#include <vector>

#include "limiter/flags.hpp"
#include "limiter/limiter.hpp"
#include "runner/runner_interface.hpp"

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "stagejudge-limiter [--time_limit=T] [--kill_after=K] [--signal=S] -- "
      "command [args...]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  limiter::LimiterOptions options;
  std::string error_msg;
  const std::vector<std::string> command(argv + 1, argv + argc);
  if (!limiter::OptionsFromFlags(command, &options, &error_msg)) {
    fprintf(stderr, "stagejudge-limiter: %s\n", error_msg.c_str());
    gflags::ShowUsageWithFlagsRestrict(argv[0], "limiter/flags");
    return runner::kExitLimiterFailed;
  }

  limiter::Limiter limiter;
  limiter::LimiterOutcome outcome;
  if (!limiter.Run(options, &outcome, &error_msg)) {
    fprintf(stderr, "stagejudge-limiter: %s\n", error_msg.c_str());
    return runner::kExitLimiterFailed;
  }
  fprintf(stderr, "\n%s", limiter::FormatTrailer(outcome.trailer).c_str());
  fflush(stderr);
  if (outcome.timed_out) return runner::kLimiterTimedOutCode;
  return outcome.trailer.detection.exit_status;
}
