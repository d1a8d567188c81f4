#ifndef MANAGER_COMMAND_HPP
#define MANAGER_COMMAND_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "manager/evaluation_options.hpp"
#include "manager/preparation.hpp"
#include "sandbox/sandbox.hpp"
#include "schema/setting.hpp"

namespace manager {

struct ComposedCommand {
  std::vector<std::string> args;
  std::string working_directory;
  int64_t wall_limit_millis = 0;
};

// Runner invocation:
// <runner> <exercise_dir> <state> <evaluation_dir> <evaluation_filename>
//          <result>__<state> <options> -l <log_level> -s <test_script>
std::vector<std::string> RunnerCommand(const schema::ExerciseConcrete& exercise,
                                       const EvaluationOptions& options,
                                       const ExecutionContext& context);

// Wraps a command in the limiter with a limit of time_limit_seconds.
std::vector<std::string> LimiterCommand(const std::vector<std::string>& command,
                                        int64_t time_limit_seconds);

// Host paths shared with the sandbox for this evaluation.
sandbox::SharedPaths SharedPathsFor(const schema::ExerciseConcrete& exercise,
                                    const EvaluationOptions& options);

// Full command of a state, outermost layer first: environment activation,
// sandbox, limiter, runner. Pure; nothing is executed or checked.
ComposedCommand ComposeCommand(const schema::ExerciseConcrete& exercise,
                               const sandbox::Sandbox& sandbox,
                               const EvaluationOptions& options,
                               const ExecutionContext& context);

}  // namespace manager

#endif
