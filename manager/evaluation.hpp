#ifndef MANAGER_EVALUATION_HPP
#define MANAGER_EVALUATION_HPP

#include <memory>
#include <ostream>
#include <string>

#include "core/result.hpp"
#include "executor/executor.hpp"
#include "manager/evaluation_options.hpp"
#include "sandbox/sandbox.hpp"
#include "schema/setting.hpp"

namespace manager {

// Runs the state machine of an exercise over one submission: starting from
// the initial state, each state is staged, executed in the sandbox and
// summarized, and the transition table picks the next state and the grade,
// until the terminal state or an unrecoverable failure.
class Evaluation {
 public:
  Evaluation(const schema::ExerciseConcrete& exercise,
             executor::Executor* executor);

  // Never throws: every failure is reported as a case of the state in which
  // it happened.
  core::EvaluationResponse Evaluate(const EvaluationOptions& options);

  Evaluation(const Evaluation&) = delete;
  Evaluation& operator=(const Evaluation&) = delete;
  Evaluation(Evaluation&&) = delete;
  Evaluation& operator=(Evaluation&&) = delete;
  ~Evaluation() = default;

 private:
  struct StateOutcome {
    core::StateResult result;
    bool halt = false;
  };

  StateOutcome RunState(const std::string& state_name,
                        const EvaluationOptions& options);

  const schema::ExerciseConcrete& exercise_;
  executor::Executor* executor_;
  std::unique_ptr<sandbox::Sandbox> sandbox_;
};

// Current time as an ISO 8601 UTC timestamp.
std::string EvaluationTimestamp();

// Writes the response to result_path and prints it on out as one line of
// JSON. Throws std::system_error if the file cannot be written.
void PublishResponse(const core::EvaluationResponse& response,
                     const std::string& result_path, std::ostream* out);

}  // namespace manager

#endif
