#include "core/result.hpp"

namespace core {

namespace {

template <typename T>
nlohmann::json OptionalToJson(const absl::optional<T>& value) {
  if (!value) return nullptr;
  return *value;
}

nlohmann::json StatusSetToJson(const StatusSet& statuses) {
  nlohmann::json j = nlohmann::json::array();
  for (Status status : statuses) j.push_back(StatusName(status));
  return j;
}

nlohmann::json TagSetToJson(const TagSet& tags) {
  nlohmann::json j = nlohmann::json::array();
  for (const EvaluationTag& tag : tags) j.push_back(tag);
  return j;
}

}  // namespace

StateSummary Summarize(const std::vector<CaseResult>& cases,
                       absl::optional<int64_t> time,
                       absl::optional<int64_t> memory) {
  StateSummary summary;
  for (const CaseResult& result : cases) {
    summary.status_set.insert(result.status);
    summary.tag_set.insert(result.tags.begin(), result.tags.end());
  }
  summary.time = time;
  summary.memory = memory;
  return summary;
}

void Accumulate(const StateSummary& state, OverallResult* overall) {
  overall->status_set.insert(state.status_set.begin(), state.status_set.end());
  overall->tag_set.insert(state.tag_set.begin(), state.tag_set.end());
  overall->time += state.time.value_or(0);
  overall->memory += state.memory.value_or(0);
}

void to_json(nlohmann::json& j, const EvaluationTag& tag) {
  j = nlohmann::json{{"name", tag.name},
                     {"description", tag.description},
                     {"background_color", tag.background_color},
                     {"font_color", tag.font_color},
                     {"visible", tag.visible}};
}

void to_json(nlohmann::json& j, const CaseResult& result) {
  j = nlohmann::json{{"name", result.name},
                     {"status", StatusName(result.status)},
                     {"tags", result.tags},
                     {"student_message", result.student_message},
                     {"reviewer_message", result.reviewer_message},
                     {"system_message", result.system_message}};
}

void to_json(nlohmann::json& j, const StateSummary& summary) {
  j = nlohmann::json{{"status_set", StatusSetToJson(summary.status_set)},
                     {"time", OptionalToJson(summary.time)},
                     {"memory", OptionalToJson(summary.memory)},
                     {"tag_set", TagSetToJson(summary.tag_set)}};
}

void to_json(nlohmann::json& j, const StateResult& result) {
  j = nlohmann::json{
      {"runner",
       {{"name", result.runner.name}, {"version", result.runner.version}}},
      {"cases", result.cases},
      {"result", result.result}};
}

void to_json(nlohmann::json& j, const OverallResult& result) {
  j = nlohmann::json{{"status_set", StatusSetToJson(result.status_set)},
                     {"grade", OptionalToJson(result.grade)},
                     {"time", result.time},
                     {"memory", result.memory},
                     {"tag_set", TagSetToJson(result.tag_set)}};
}

void to_json(nlohmann::json& j, const Metadata& metadata) {
  j = nlohmann::json{
      {"submission_key", metadata.submission_key},
      {"evaluation_key", metadata.evaluation_key},
      {"evaluated_at", metadata.evaluated_at},
      {"exercise_concrete",
       {{"name", metadata.exercise_name},
        {"version", metadata.exercise_version}}},
      {"evaluator",
       {{"name", metadata.evaluator_name},
        {"version", metadata.evaluator_version}}}};
}

void to_json(nlohmann::json& j, const EvaluationResponse& response) {
  nlohmann::json states = nlohmann::json::object();
  for (const auto& state : response.state_results) {
    states[state.first] = state.second;
  }
  j = nlohmann::json{{"metadata", response.metadata},
                     {"state_history", response.state_history},
                     {"state_results", states},
                     {"overall_result", response.overall_result}};
}

}  // namespace core
