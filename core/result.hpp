#ifndef CORE_RESULT_HPP
#define CORE_RESULT_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "core/case_result.hpp"
#include "nlohmann/json.hpp"

namespace core {

// Aggregate of the cases of one state.
struct StateSummary {
  StatusSet status_set;
  absl::optional<int64_t> time;    // nanoseconds
  absl::optional<int64_t> memory;  // KiB, as reported by the limiter
  TagSet tag_set;
};

struct RunnerIdentity {
  std::string name;
  std::string version;
};

struct StateResult {
  RunnerIdentity runner;
  std::vector<CaseResult> cases;
  StateSummary result;
};

struct OverallResult {
  StatusSet status_set;
  absl::optional<int64_t> grade;
  // Sums over the states that reported them.
  int64_t time = 0;
  int64_t memory = 0;
  TagSet tag_set;
};

struct Metadata {
  std::string submission_key;
  std::string evaluation_key;
  std::string evaluated_at;
  std::string exercise_name;
  std::string exercise_version;
  std::string evaluator_name;
  std::string evaluator_version;
};

struct EvaluationResponse {
  Metadata metadata;
  std::vector<std::string> state_history;
  std::map<std::string, StateResult> state_results;
  OverallResult overall_result;
};

// Builds the aggregate of a state from its cases and measured usage.
StateSummary Summarize(const std::vector<CaseResult>& cases,
                       absl::optional<int64_t> time,
                       absl::optional<int64_t> memory);

// Folds a state into the overall result: union of statuses and tags, sum of
// the known times and memories.
void Accumulate(const StateSummary& state, OverallResult* overall);

void to_json(nlohmann::json& j, const EvaluationTag& tag);
void to_json(nlohmann::json& j, const CaseResult& result);
void to_json(nlohmann::json& j, const StateSummary& summary);
void to_json(nlohmann::json& j, const StateResult& result);
void to_json(nlohmann::json& j, const OverallResult& result);
void to_json(nlohmann::json& j, const Metadata& metadata);
void to_json(nlohmann::json& j, const EvaluationResponse& response);

}  // namespace core

#endif
