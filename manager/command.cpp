#include "manager/command.hpp"

#include "absl/strings/str_cat.h"
#include "sandbox/environment.hpp"
#include "schema/units.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace manager {

std::vector<std::string> RunnerCommand(const schema::ExerciseConcrete& exercise,
                                       const EvaluationOptions& options,
                                       const ExecutionContext& context) {
  return {context.runner_path,
          exercise.directory,
          context.state_name,
          options.evaluation_dir,
          context.evaluation_filename,
          options.result_filename + "__" + context.state_name,
          context.runner_options,
          "-l",
          options.log_level,
          "-s",
          context.test_script};
}

std::vector<std::string> LimiterCommand(const std::vector<std::string>& command,
                                        int64_t time_limit_seconds) {
  std::vector<std::string> args = {
      FLAGS_limiter_command, "--signal=TERM",
      absl::StrCat("--kill_after=", FLAGS_kill_grace_seconds),
      absl::StrCat("--time_limit=", time_limit_seconds), "--"};
  args.insert(args.end(), command.begin(), command.end());
  return args;
}

sandbox::SharedPaths SharedPathsFor(const schema::ExerciseConcrete& exercise,
                                    const EvaluationOptions& options) {
  sandbox::SharedPaths paths;
  paths.environment_root = FLAGS_environment_root;
  if (!FLAGS_limiter_command.empty() && FLAGS_limiter_command[0] == '/')
    paths.limiter = util::File::BaseDir(FLAGS_limiter_command);
  paths.runner_dir = FLAGS_runner_dir;
  paths.exercise_dir = exercise.directory;
  paths.evaluation_dir = options.evaluation_dir;
  return paths;
}

ComposedCommand ComposeCommand(const schema::ExerciseConcrete& exercise,
                               const sandbox::Sandbox& sandbox,
                               const EvaluationOptions& options,
                               const ExecutionContext& context) {
  const int64_t time_limit_seconds =
      schema::CeilSeconds(context.time_limit_micros);
  const sandbox::SharedPaths paths = SharedPathsFor(exercise, options);

  ComposedCommand composed;
  composed.args = sandbox::WrapInEnvironment(
      FLAGS_environment_root, exercise.setting.environment.name,
      sandbox.WrapCommand(
          LimiterCommand(RunnerCommand(exercise, options, context),
                         time_limit_seconds),
          paths));
  composed.working_directory = sandbox.WorkingDirectory(paths);
  composed.wall_limit_millis =
      (time_limit_seconds + FLAGS_wall_clock_margin_seconds) * 1000;
  return composed;
}

}  // namespace manager
