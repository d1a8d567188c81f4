#ifndef MANAGER_PREPARATION_HPP
#define MANAGER_PREPARATION_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include "manager/evaluation_options.hpp"
#include "schema/setting.hpp"

namespace manager {

// The exercise cannot be staged as configured: a declared file is missing,
// the environment is not installed, or the runner does not exist.
class MissConfigurationError : public std::runtime_error {
 public:
  explicit MissConfigurationError(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Everything needed to compose the command of one state.
struct ExecutionContext {
  std::string state_name;
  std::string state_dir;
  // Name of the submission inside the state directory.
  std::string evaluation_filename;
  std::string test_script;
  std::string runner_path;
  std::string runner_options;  // encoded
  int64_t time_limit_micros = 0;
};

// Computes the context of a state without touching the filesystem.
// Throws MissConfigurationError if the state is not declared.
ExecutionContext PlanState(const schema::ExerciseConcrete& exercise,
                           const EvaluationOptions& options,
                           const std::string& state_name);

// Stages a state: recreates <evaluation_dir>/<state> and copies the
// submission (renamed if the setting asks to), the state test script and the
// required files into it. Throws MissConfigurationError; on failure the state
// directory is removed again.
ExecutionContext PrepareState(const schema::ExerciseConcrete& exercise,
                              const EvaluationOptions& options,
                              const std::string& state_name);

}  // namespace manager

#endif
