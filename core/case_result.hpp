#ifndef CORE_CASE_RESULT_HPP
#define CORE_CASE_RESULT_HPP

#include <string>
#include <vector>

#include "core/evaluation_tag.hpp"
#include "core/status.hpp"

namespace core {

// Name used for synthetic cases that describe a whole state.
static const constexpr char* kEntireStageCaseName = "(Entire stage)";
// Name used for synthetic cases produced when a state cannot be staged.
static const constexpr char* kSetupCaseName = "__setup__";

struct CaseResult {
  std::string name;
  Status status = Status::FATAL;
  std::vector<EvaluationTag> tags;
  std::string student_message;
  std::string reviewer_message;
  std::string system_message;
};

}  // namespace core

#endif
