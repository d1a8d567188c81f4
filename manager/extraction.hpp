#ifndef MANAGER_EXTRACTION_HPP
#define MANAGER_EXTRACTION_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "core/case_result.hpp"
#include "executor/executor.hpp"

namespace manager {

// How the composed command of a state terminated.
enum class ExitClass {
  OK,
  // Sandbox or limiter failure codes: the limiter trailer decides.
  DEFERRED,
  HARD_KILLED,
  RUNNER_ERROR,
  UNEXPECTED_ABORT,
  WALL_LIMIT,
};

ExitClass ClassifyExit(const executor::Response& response,
                       int sandbox_failure_code);

// Tags of the synthetic case produced for an irregular exit. Empty for OK
// and DEFERRED.
std::vector<core::EvaluationTag> IrregularTags(ExitClass exit_class);

struct StateExtraction {
  std::vector<core::CaseResult> cases;
  absl::optional<int64_t> time;    // nanoseconds
  absl::optional<int64_t> memory;  // KiB
  // The evaluation cannot continue after this state.
  bool halt = false;
};

struct StateLimits {
  int64_t time_limit_micros = 0;
  int64_t memory_limit_bytes = 0;
  int sandbox_failure_code = 255;
};

// Turns the output of a finished state into case results. Never throws.
StateExtraction ExtractState(const executor::Response& response,
                             const StateLimits& limits);

// One FATAL case covering the whole state.
core::CaseResult FatalCase(const std::string& name,
                           const std::vector<core::EvaluationTag>& tags,
                           const std::string& reviewer_message,
                           const std::string& system_message);

}  // namespace manager

#endif
