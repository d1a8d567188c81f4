#ifndef MANAGER_EVALUATION_OPTIONS_HPP
#define MANAGER_EVALUATION_OPTIONS_HPP

#include <string>

namespace manager {

// Per-submission inputs of an evaluation.
struct EvaluationOptions {
  std::string submission_dir;
  std::string submission_filename;
  // Scratch root of this evaluation; every state gets its own subdirectory.
  std::string evaluation_dir;
  // Base name of the result files, without extension.
  std::string result_filename = "result";
  std::string log_level = "ERROR";
  std::string submission_key;
  std::string evaluation_key;
};

}  // namespace manager

#endif
