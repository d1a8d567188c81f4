#include "manager/evaluation.hpp"

#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "glog/logging.h"
#include "manager/command.hpp"
#include "manager/extraction.hpp"
#include "manager/preparation.hpp"
#include "util/file.hpp"
#include "util/version.hpp"

namespace manager {

Evaluation::Evaluation(const schema::ExerciseConcrete& exercise,
                       executor::Executor* executor)
    : exercise_(exercise),
      executor_(executor),
      sandbox_(sandbox::Sandbox::Create(exercise.setting.sandbox)) {}

Evaluation::StateOutcome Evaluation::RunState(
    const std::string& state_name, const EvaluationOptions& options) {
  const schema::StateSpec& state = exercise_.setting.states.at(state_name);
  StateOutcome outcome;
  outcome.result.runner.name = state.runner.name;
  outcome.result.runner.version = state.runner.version;

  ExecutionContext context;
  try {
    context = PrepareState(exercise_, options, state_name);
  } catch (const MissConfigurationError& e) {
    LOG(ERROR) << "Cannot stage state " << state_name << ": " << e.what();
    outcome.result.cases = {FatalCase(core::kSetupCaseName,
                                      {core::EvaluationSystemError()},
                                      e.what(), "")};
    outcome.halt = true;
    return outcome;
  }

  const ComposedCommand command =
      ComposeCommand(exercise_, *sandbox_, options, context);
  executor::Request request;
  request.args = command.args;
  request.working_directory = command.working_directory;
  request.wall_limit_millis = command.wall_limit_millis;

  executor::Response response;
  std::string error_msg;
  if (!executor_->Execute(request, &response, &error_msg)) {
    LOG(ERROR) << "Cannot execute state " << state_name << ": " << error_msg;
    outcome.result.cases = {
        FatalCase(core::kEntireStageCaseName, {core::BackendSystemError()}, "",
                  "Cannot execute the state command: " + error_msg)};
    outcome.halt = true;
    return outcome;
  }

  StateLimits limits;
  limits.time_limit_micros = context.time_limit_micros;
  limits.memory_limit_bytes =
      exercise_.setting.sandbox.options.memory_limit_bytes;
  limits.sandbox_failure_code = sandbox_->FailureExitCode();
  StateExtraction extraction = ExtractState(response, limits);
  outcome.result.cases = std::move(extraction.cases);
  outcome.result.result.time = extraction.time;
  outcome.result.result.memory = extraction.memory;
  outcome.halt = extraction.halt;
  return outcome;
}

core::EvaluationResponse Evaluation::Evaluate(
    const EvaluationOptions& options) {
  const schema::Setting& setting = exercise_.setting;
  core::EvaluationResponse response;
  response.metadata.submission_key = options.submission_key;
  response.metadata.evaluation_key = options.evaluation_key;
  response.metadata.evaluated_at = EvaluationTimestamp();
  response.metadata.exercise_name = setting.exercise_name;
  response.metadata.exercise_version = setting.exercise_version;
  response.metadata.evaluator_name = util::kEvaluatorName;
  response.metadata.evaluator_version = util::kEvaluatorVersion;

  LOG(INFO) << "Evaluating " << options.submission_filename << " on "
            << setting.exercise_name << " " << setting.exercise_version;

  std::string state_name = setting.initial_state;
  while (true) {
    LOG(INFO) << "Entering state " << state_name;
    response.state_history.push_back(state_name);

    StateOutcome outcome;
    try {
      outcome = RunState(state_name, options);
    } catch (const std::exception& e) {
      LOG(ERROR) << "State " << state_name << " failed: " << e.what();
      const schema::StateSpec& state = setting.states.at(state_name);
      outcome = StateOutcome();
      outcome.result.runner.name = state.runner.name;
      outcome.result.runner.version = state.runner.version;
      outcome.result.cases = {FatalCase(core::kEntireStageCaseName,
                                        {core::BackendSystemError()}, "",
                                        e.what())};
      outcome.halt = true;
    }

    absl::optional<schema::TransitionTarget> target;
    if (!outcome.halt) {
      core::StatusSet observed;
      for (const core::CaseResult& result : outcome.result.cases)
        observed.insert(result.status);
      target = setting.transitions.Lookup(state_name, observed);
      if (!target) {
        LOG(ERROR) << "No transition from state " << state_name;
        outcome.result.cases = {FatalCase(
            core::kEntireStageCaseName, {core::EvaluationSystemError()},
            "No transition matches the outcome of state " + state_name, "")};
        outcome.halt = true;
      }
    }
    outcome.result.result =
        core::Summarize(outcome.result.cases, outcome.result.result.time,
                        outcome.result.result.memory);

    core::Accumulate(outcome.result.result, &response.overall_result);
    response.state_results[state_name] = std::move(outcome.result);
    if (outcome.halt) break;

    response.overall_result.grade = target->grade;
    if (target->IsTerminal()) break;
    state_name = target->next_state;
  }

  LOG(INFO) << "Evaluation finished after " << response.state_history.size()
            << " states";
  return response;
}

std::string EvaluationTimestamp() {
  return absl::FormatTime("%Y-%m-%dT%H:%M:%E6SZ", absl::Now(),
                          absl::UTCTimeZone());
}

void PublishResponse(const core::EvaluationResponse& response,
                     const std::string& result_path, std::ostream* out) {
  const nlohmann::json json = response;
  util::File::Write(result_path, json.dump(2), true);
  LOG(INFO) << "Result written to " << result_path;
  *out << json.dump() << std::endl;
}

}  // namespace manager
