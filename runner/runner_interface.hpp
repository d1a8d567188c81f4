#ifndef RUNNER_RUNNER_INTERFACE_HPP
#define RUNNER_RUNNER_INTERFACE_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "core/case_result.hpp"
#include "nlohmann/json.hpp"

// Contract between the judge and the programs it runs inside the sandbox.
// Everything here depends only on the standard library and the header-only
// JSON library, so that in-sandbox programs can link it statically.
namespace runner {

// Exit codes at or above this offset are reserved for the runner reporting
// its own failures.
static const constexpr int kStatusCodeOffset = 192;

static const constexpr int kExitInvalidArguments = kStatusCodeOffset + 4;
static const constexpr int kExitNoExerciseDirectory = kStatusCodeOffset + 8;
static const constexpr int kExitInvalidSetting = kStatusCodeOffset + 10;
static const constexpr int kExitPrepareSubmission = kStatusCodeOffset + 12;
static const constexpr int kExitDumpResults = kStatusCodeOffset + 40;
static const constexpr int kExitWriteResults = kStatusCodeOffset + 44;
static const constexpr int kExitRunnerFailed = kStatusCodeOffset + 60;
static const constexpr int kExitLimiterFailed = kStatusCodeOffset + 61;

// Exit code of the sandbox when it fails to set up or run its command.
static const constexpr int kSandboxFailureCode = 255;
// Exit code of the limiter when it had to stop the command.
static const constexpr int kLimiterTimedOutCode = 124;

// Separator written between the submission and the state test in the
// "append" evaluation style.
static const constexpr char* kAppendSeparator =
    "\n\n## submission above, state test cases below\n\n";

class malformed_payload : public std::runtime_error {
 public:
  explicit malformed_payload(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Base64 with '_' and '+' in place of '+' and '/', so that the encoded text
// survives every shell and sandbox layer unquoted.
std::string EncodeOptions(const std::string& data);
// Throws malformed_payload on invalid input.
std::string DecodeOptions(const std::string& encoded);

// Wire form of a case: {name, status, tags, msg, err, system_message}.
nlohmann::json CaseToWire(const core::CaseResult& result);
nlohmann::json CasesToWire(const std::vector<core::CaseResult>& results);

// Parses a JSON array of wire cases. Throws malformed_payload if the text is
// not valid JSON, a field is missing or mistyped, a status or a tag color is
// invalid, or two cases share a name.
std::vector<core::CaseResult> ParseCaseResults(const std::string& line);

}  // namespace runner

#endif
