#include <iostream>

#include "executor/local_executor.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "manager/command.hpp"
#include "manager/evaluation.hpp"
#include "manager/preparation.hpp"
#include "schema/loader.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/logging.hpp"
#include "util/misc.hpp"

namespace {

static const constexpr char* kUsage =
    "stagejudge [flags] <exercise_concrete_dir> <submission_dir> "
    "<submission_filename> <evaluation_dir> <evaluation_result_filename>\n"
    "stagejudge --dry_run [flags] <exercise_concrete_dir>";

int DryRun(const schema::ExerciseConcrete& exercise,
           const manager::EvaluationOptions& options) {
  std::unique_ptr<sandbox::Sandbox> sandbox =
      sandbox::Sandbox::Create(exercise.setting.sandbox);
  if (!sandbox->Available())
    LOG(WARNING) << sandbox->Name() << " is not available on this machine";
  for (const auto& state : exercise.setting.states) {
    manager::ExecutionContext context =
        manager::PlanState(exercise, options, state.first);
    manager::ComposedCommand command =
        manager::ComposeCommand(exercise, *sandbox, options, context);
    std::cout << state.first << " (in " << command.working_directory
              << ", " << command.wall_limit_millis << "ms):\n  "
              << util::ShellJoin(command.args) << std::endl;
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(kUsage);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  if (!util::SetLogLevel(FLAGS_log_level)) {
    std::cerr << "Unknown log level " << FLAGS_log_level << std::endl;
    return 2;
  }
  if (FLAGS_dry_run ? argc < 2 : argc != 6) {
    std::cerr << kUsage << std::endl;
    return 2;
  }

  manager::EvaluationOptions options;
  options.log_level = FLAGS_log_level;
  options.submission_key = FLAGS_submission_key;
  options.evaluation_key = FLAGS_evaluation_key;
  if (argc == 6) {
    options.submission_dir = argv[2];
    options.submission_filename = argv[3];
    options.evaluation_dir = argv[4];
    options.result_filename = argv[5];
  } else {
    options.submission_filename = "<submission>";
    options.evaluation_dir = "<evaluation_dir>";
  }

  schema::ExerciseConcrete exercise;
  try {
    exercise = schema::LoadExerciseConcrete(argv[1]);
  } catch (const schema::SchemaValidationError& e) {
    LOG(ERROR) << "Invalid exercise: " << e.what();
    std::cerr << "Invalid exercise: " << e.what() << std::endl;
    return 1;
  }

  if (FLAGS_dry_run) return DryRun(exercise, options);

  try {
    util::LogToEvaluationDirectory(options.evaluation_dir);
  } catch (const std::system_error& e) {
    std::cerr << "Cannot use " << options.evaluation_dir << ": " << e.what()
              << std::endl;
    return 1;
  }

  executor::LocalExecutor executor;
  manager::Evaluation evaluation(exercise, &executor);
  core::EvaluationResponse response = evaluation.Evaluate(options);

  const std::string result_path = util::File::JoinPath(
      options.evaluation_dir, options.result_filename + ".json");
  try {
    manager::PublishResponse(response, result_path, &std::cout);
  } catch (const std::system_error& e) {
    LOG(ERROR) << "Cannot write " << result_path << ": " << e.what();
    return 1;
  }
  return 0;
}
