#ifndef SCHEMA_SETTING_HPP
#define SCHEMA_SETTING_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "core/evaluation_tag.hpp"
#include "nlohmann/json.hpp"
#include "schema/transition_table.hpp"

namespace schema {

static const constexpr char* kSchemaVersion = "v1.0";
static const constexpr char* kSettingFilename = "setting.json";
static const constexpr char* kNetworkDisabled = "disable";

enum class SandboxKind { FIREJAIL, NSJAIL };

const char* SandboxKindName(SandboxKind kind);

struct SandboxOptions {
  int32_t cpu_limit = 1;
  int64_t memory_limit_bytes = int64_t{256} << 20;
};

struct SandboxSpec {
  SandboxKind kind = SandboxKind::FIREJAIL;
  SandboxOptions options;
};

struct EnvironmentSpec {
  std::string name;
  std::string version;
};

struct RunnerSpec {
  std::string name;
  std::string version;
  // Opaque to the judge, handed to the runner.
  nlohmann::json options = nlohmann::json::object();
};

struct StateSpec {
  std::string name;
  RunnerSpec runner;
  int64_t time_limit_micros = 0;
  std::vector<std::string> required_files;
  std::string test_script;
};

struct Setting {
  std::string exercise_name;
  std::string exercise_version;
  absl::optional<std::string> rename;
  EnvironmentSpec environment;
  SandboxSpec sandbox;
  std::vector<core::EvaluationTag> evaluation_tags;
  std::string initial_state;
  std::map<std::string, StateSpec> states;
  TransitionTable transitions;
};

// A setting together with the directory holding the exercise files.
struct ExerciseConcrete {
  std::string directory;
  Setting setting;
};

}  // namespace schema

#endif
