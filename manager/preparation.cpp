#include "manager/preparation.hpp"

#include <algorithm>

#include "glog/logging.h"
#include "runner/runner_interface.hpp"
#include "sandbox/environment.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace manager {

namespace {

void CheckEnvironment(const schema::EnvironmentSpec& environment) {
  const auto available = sandbox::ListEnvironments(FLAGS_environment_root);
  if (std::find(available.begin(), available.end(), environment.name) ==
      available.end()) {
    throw MissConfigurationError("Environment '" + environment.name +
                                 "' is not installed");
  }
  if (!environment.version.empty()) {
    throw MissConfigurationError("Environment '" + environment.name +
                                 "' has no version '" + environment.version +
                                 "'");
  }
}

void CopyInto(const std::string& from, const std::string& to,
              const std::string& what) {
  if (!util::File::IsRegularFile(from))
    throw MissConfigurationError(what + " not found: " + from);
  try {
    util::File::Copy(from, to, true);
  } catch (const std::system_error& e) {
    throw MissConfigurationError("Cannot copy " + what + ": " + e.what());
  }
}

void Stage(const schema::ExerciseConcrete& exercise,
           const EvaluationOptions& options, const schema::StateSpec& state,
           const ExecutionContext& context) {
  CopyInto(util::File::JoinPath(options.submission_dir,
                                options.submission_filename),
           util::File::JoinPath(context.state_dir, context.evaluation_filename),
           "Submission file");
  CopyInto(util::File::JoinPath(exercise.directory, state.test_script),
           util::File::JoinPath(context.state_dir, state.test_script),
           "State test script");
  for (const std::string& file : state.required_files) {
    CopyInto(util::File::JoinPath(exercise.directory, file),
             util::File::JoinPath(context.state_dir, file), "Required file");
  }
}

}  // namespace

ExecutionContext PlanState(const schema::ExerciseConcrete& exercise,
                           const EvaluationOptions& options,
                           const std::string& state_name) {
  const schema::Setting& setting = exercise.setting;
  auto state_it = setting.states.find(state_name);
  if (state_it == setting.states.end())
    throw MissConfigurationError("Unknown state '" + state_name + "'");
  const schema::StateSpec& state = state_it->second;

  ExecutionContext context;
  context.state_name = state_name;
  context.state_dir = util::File::JoinPath(options.evaluation_dir, state_name);
  context.evaluation_filename =
      setting.rename ? *setting.rename : options.submission_filename;
  context.test_script = state.test_script;
  context.time_limit_micros = state.time_limit_micros;
  context.runner_path =
      util::File::JoinPath(FLAGS_runner_dir, state.runner.name);
  context.runner_options = runner::EncodeOptions(state.runner.options.dump());
  return context;
}

ExecutionContext PrepareState(const schema::ExerciseConcrete& exercise,
                              const EvaluationOptions& options,
                              const std::string& state_name) {
  ExecutionContext context = PlanState(exercise, options, state_name);
  const schema::StateSpec& state = exercise.setting.states.at(state_name);

  CheckEnvironment(exercise.setting.environment);
  if (!util::File::IsRegularFile(context.runner_path))
    throw MissConfigurationError("Runner not found: " + context.runner_path);

  try {
    if (util::File::Exists(context.state_dir))
      util::File::RemoveTree(context.state_dir);
    util::File::MakeDirs(context.state_dir);
  } catch (const std::system_error& e) {
    throw MissConfigurationError("Cannot create state directory: " +
                                 std::string(e.what()));
  }

  try {
    Stage(exercise, options, state, context);
  } catch (const MissConfigurationError&) {
    try {
      util::File::RemoveTree(context.state_dir);
    } catch (const std::system_error& e) {
      LOG(WARNING) << "Cannot clean up " << context.state_dir << ": "
                   << e.what();
    }
    throw;
  }
  VLOG(1) << "Staged state " << state_name << " in " << context.state_dir;
  return context;
}

}  // namespace manager
