#ifndef RUNNER_HARNESS_HPP
#define RUNNER_HARNESS_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "core/case_result.hpp"

namespace runner {

// Handle through which a test case reports its outcome. A case that returns
// without calling any of these passes.
class CaseContext {
 public:
  explicit CaseContext(std::string name);

  void Fail(const std::string& student_message,
            const std::string& reviewer_message = "");
  void Error(const std::string& student_message,
             const std::string& reviewer_message = "");
  void AddTag(const core::EvaluationTag& tag);
  void SetStudentMessage(const std::string& message);
  void SetSystemMessage(const std::string& message);

  const core::CaseResult& Result() const { return result_; }

 private:
  core::CaseResult result_;
};

// Runs test cases of a state for C++ test programs. Each case runs in its own
// child process, so a crash, an uncaught exception or a timeout only affects
// that case.
class Harness {
 public:
  using CaseFunction = std::function<void(CaseContext*)>;

  // Throws std::invalid_argument if a case with the same name exists.
  void AddCase(const std::string& name, CaseFunction function);

  // Wall clock limit of each case. Zero disables it.
  void SetCaseTimeLimit(int64_t millis) { case_time_limit_millis_ = millis; }

  std::vector<core::CaseResult> RunAll();

  // Runs every case and prints the results as the last line of stdout.
  // Returns the exit code of the test program.
  int Main();

 private:
  core::CaseResult RunCase(const std::string& name,
                           const CaseFunction& function);

  std::vector<std::pair<std::string, CaseFunction>> cases_;
  int64_t case_time_limit_millis_ = 0;
};

}  // namespace runner

#endif
