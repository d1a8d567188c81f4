#include "manager/extraction.hpp"

#include <signal.h>

#include "glog/logging.h"
#include "limiter/statistics.hpp"
#include "runner/runner_interface.hpp"
#include "util/misc.hpp"

namespace manager {

namespace {

std::string DescribeExit(const executor::Response& response) {
  if (response.wall_limit_exceeded)
    return "killed after " + std::to_string(response.wall_time_millis) +
           "ms of wall clock time";
  if (response.signal)
    return "killed by signal " + std::to_string(response.signal);
  return "exited with status " + std::to_string(response.status_code);
}

void LogOutput(const executor::Response& response) {
  LOG(INFO) << "==== <returncode=" << response.status_code
            << ", signal=" << response.signal << "> ====\n"
            << response.stdout_contents << "\n<^ stdout ^>\n"
            << response.stderr_contents << "\n<^ stderr ^>";
}

// Appends text to message on a line of its own.
void AppendLine(const std::string& text, std::string* message) {
  if (text.empty()) return;
  if (!message->empty()) *message += "\n";
  *message += text;
}

}  // namespace

ExitClass ClassifyExit(const executor::Response& response,
                       int sandbox_failure_code) {
  if (response.wall_limit_exceeded) return ExitClass::WALL_LIMIT;
  if (response.signal == SIGKILL) return ExitClass::HARD_KILLED;
  if (response.signal) return ExitClass::UNEXPECTED_ABORT;
  const int code = response.status_code;
  if (code == 0) return ExitClass::OK;
  if (code == sandbox_failure_code || code == runner::kLimiterTimedOutCode)
    return ExitClass::DEFERRED;
  if (code >= runner::kStatusCodeOffset) return ExitClass::RUNNER_ERROR;
  return ExitClass::UNEXPECTED_ABORT;
}

std::vector<core::EvaluationTag> IrregularTags(ExitClass exit_class) {
  switch (exit_class) {
    case ExitClass::OK:
    case ExitClass::DEFERRED:
      return {};
    case ExitClass::HARD_KILLED:
      return {core::BackendSystemError()};
    case ExitClass::RUNNER_ERROR:
      return {core::EvaluationSystemError()};
    case ExitClass::UNEXPECTED_ABORT:
      return {core::UnexpectedAbortion()};
    case ExitClass::WALL_LIMIT:
      return {core::TimeLimitExceeded()};
  }
  return {core::BackendSystemError()};
}

core::CaseResult FatalCase(const std::string& name,
                           const std::vector<core::EvaluationTag>& tags,
                           const std::string& reviewer_message,
                           const std::string& system_message) {
  core::CaseResult result;
  result.name = name;
  result.status = core::Status::FATAL;
  result.tags = tags;
  result.reviewer_message = reviewer_message;
  result.system_message = system_message;
  return result;
}

StateExtraction ExtractState(const executor::Response& response,
                             const StateLimits& limits) {
  StateExtraction extraction;

  const ExitClass exit_class =
      ClassifyExit(response, limits.sandbox_failure_code);
  const std::vector<core::EvaluationTag> irregular = IrregularTags(exit_class);
  if (!irregular.empty()) {
    LOG(ERROR) << "State command " << DescribeExit(response);
    LogOutput(response);
    extraction.cases.push_back(
        FatalCase(core::kEntireStageCaseName, irregular, "",
                  "Command " + DescribeExit(response)));
    extraction.halt = true;
    return extraction;
  }

  std::string before;
  limiter::Trailer trailer;
  try {
    trailer = limiter::SplitTrailer(response.stderr_contents, &before);
  } catch (const std::invalid_argument& e) {
    LOG(ERROR) << "Invalid limiter output: " << e.what();
    LogOutput(response);
    extraction.cases.push_back(
        FatalCase(core::kEntireStageCaseName, {core::BackendSystemError()}, "",
                  std::string("Invalid limiter output: ") + e.what()));
    extraction.halt = true;
    return extraction;
  }
  extraction.time = trailer.usage.elapsed_nsec;
  extraction.memory = trailer.usage.maxrss_kb;
  VLOG(1) << "Elapsed " << trailer.usage.elapsed_nsec << "ns, max rss "
          << trailer.usage.maxrss_kb << "KiB, exit status "
          << trailer.detection.exit_status;

  before = util::RStrip(before);
  if (trailer.usage.elapsed_nsec >= limits.time_limit_micros * 1000) {
    core::CaseResult result;
    result.name = core::kEntireStageCaseName;
    result.status = core::Status::ERROR;
    result.tags = {core::TimeLimitExceeded()};
    result.system_message = before;
    extraction.cases.push_back(result);
  }
  if (limits.memory_limit_bytes > 0 &&
      trailer.usage.maxrss_kb * 1024 >= limits.memory_limit_bytes) {
    core::CaseResult result;
    result.name = core::kEntireStageCaseName;
    result.status = core::Status::ERROR;
    result.tags = {core::UnexpectedAbortion()};
    result.reviewer_message = "MLE";
    result.system_message = "MLE; " + std::to_string(trailer.usage.maxrss_kb) +
                            "KiB >= " +
                            std::to_string(limits.memory_limit_bytes) + "B";
    AppendLine(before, &result.system_message);
    extraction.cases.push_back(result);
  }
  if (!extraction.cases.empty()) return extraction;

  const size_t newline = before.rfind('\n');
  const std::string payload =
      newline == std::string::npos ? before : before.substr(newline + 1);
  const std::string diagnostics =
      newline == std::string::npos ? "" : before.substr(0, newline);
  try {
    extraction.cases = runner::ParseCaseResults(payload);
  } catch (const runner::malformed_payload& e) {
    LOG(ERROR) << "Invalid runner output: " << e.what();
    LogOutput(response);
    extraction.cases = {FatalCase(core::kEntireStageCaseName,
                                  {core::BackendSystemError()},
                                  std::string("Invalid runner output: ") +
                                      e.what(),
                                  diagnostics)};
    return extraction;
  }
  if (!diagnostics.empty()) {
    VLOG(1) << "Runner diagnostics:\n" << diagnostics;
    for (core::CaseResult& result : extraction.cases)
      AppendLine(diagnostics, &result.system_message);
  }
  return extraction;
}

}  // namespace manager
