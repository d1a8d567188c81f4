#include "schema/loader.hpp"

#include <cctype>
#include <set>

#include "glog/logging.h"
#include "schema/units.hpp"
#include "util/file.hpp"

namespace schema {

namespace {

// A JSON value together with its dotted location in the document, used to
// report where validation failed.
class Node {
 public:
  Node(const nlohmann::json& value, std::string path)
      : value_(&value), path_(std::move(path)) {}

  [[noreturn]] void Fail(const std::string& msg) const {
    throw SchemaValidationError(path_.empty() ? "<root>" : path_, msg);
  }

  const nlohmann::json& Json() const { return *value_; }
  const std::string& Path() const { return path_; }
  bool IsNull() const { return value_->is_null(); }

  const Node& ExpectObject() const {
    if (!value_->is_object()) Fail("expected an object");
    return *this;
  }

  bool Has(const std::string& key) const {
    ExpectObject();
    auto it = value_->find(key);
    return it != value_->end() && !it->is_null();
  }

  Node Get(const std::string& key) const {
    ExpectObject();
    auto it = value_->find(key);
    if (it == value_->end()) Fail("missing field '" + key + "'");
    return Node(*it, Child(key));
  }

  std::vector<Node> Items() const {
    if (!value_->is_array()) Fail("expected a list");
    std::vector<Node> items;
    for (size_t i = 0; i < value_->size(); i++) {
      items.emplace_back((*value_)[i], path_ + "[" + std::to_string(i) + "]");
    }
    return items;
  }

  std::vector<std::pair<std::string, Node>> Members() const {
    ExpectObject();
    std::vector<std::pair<std::string, Node>> members;
    for (auto it = value_->begin(); it != value_->end(); ++it) {
      members.emplace_back(it.key(), Node(it.value(), Child(it.key())));
    }
    return members;
  }

  std::string String() const {
    if (!value_->is_string()) Fail("expected a string");
    return value_->get<std::string>();
  }

  int64_t Integer() const {
    if (!value_->is_number_integer()) Fail("expected an integer");
    return value_->get<int64_t>();
  }

  bool Boolean() const {
    if (!value_->is_boolean()) Fail("expected a boolean");
    return value_->get<bool>();
  }

 private:
  std::string Child(const std::string& key) const {
    return path_.empty() ? key : path_ + "." + key;
  }

  const nlohmann::json* value_;
  std::string path_;
};

bool IsUrlName(const std::string& name) {
  if (name.empty() || name.size() > 64) return false;
  for (char c : name) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-')
      return false;
  }
  return true;
}

// Relative path that stays inside the directory it is resolved against.
bool IsContainedPath(const std::string& path) {
  if (path.empty() || path[0] == '/') return false;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string::npos) end = path.size();
    if (path.compare(start, end - start, "..") == 0 && end - start == 2)
      return false;
    start = end + 1;
  }
  return true;
}

bool IsPlainFilename(const std::string& name) {
  return !name.empty() && name.find('/') == std::string::npos &&
         name != "." && name != "..";
}

std::string BoundedString(const Node& node, size_t max_length) {
  std::string value = node.String();
  if (value.size() > max_length)
    node.Fail("longer than " + std::to_string(max_length) + " characters");
  return value;
}

SandboxSpec LoadSandbox(const Node& node) {
  SandboxSpec sandbox;
  const std::string name = node.Get("name").String();
  if (name == "Firejail") {
    sandbox.kind = SandboxKind::FIREJAIL;
  } else if (name == "NsJail") {
    sandbox.kind = SandboxKind::NSJAIL;
  } else {
    node.Get("name").Fail("unknown sandbox '" + name + "'");
  }
  if (!node.Has("options")) return sandbox;
  Node options = node.Get("options");
  options.ExpectObject();
  if (options.Has("cpu_limit")) {
    Node cpu = options.Get("cpu_limit");
    int64_t value = cpu.Integer();
    if (value < 0 || value > 4096) cpu.Fail("invalid cpu limit");
    sandbox.options.cpu_limit = static_cast<int32_t>(value);
  }
  if (options.Has("memory_limit")) {
    Node memory = options.Get("memory_limit");
    sandbox.options.memory_limit_bytes =
        ParseMemoryLimit(memory.Json(), memory.Path());
  }
  // Sandboxed states never have network access.
  if (options.Has("network_limit")) {
    Node network = options.Get("network_limit");
    if (network.String() != kNetworkDisabled)
      network.Fail("only '" + std::string(kNetworkDisabled) +
                   "' is supported");
  }
  return sandbox;
}

core::EvaluationTag LoadTag(const Node& node) {
  core::EvaluationTag tag;
  tag.name = BoundedString(node.Get("name"), 64);
  if (tag.name.empty()) node.Get("name").Fail("empty tag name");
  if (core::IsBuiltinTagName(tag.name))
    node.Get("name").Fail("tag name '" + tag.name + "' is reserved");
  tag.description = BoundedString(node.Get("description"), 1024);
  tag.background_color = node.Get("background_color").String();
  if (!core::IsHtmlColor(tag.background_color))
    node.Get("background_color").Fail("invalid color");
  tag.font_color = node.Get("font_color").String();
  if (!core::IsHtmlColor(tag.font_color))
    node.Get("font_color").Fail("invalid color");
  if (node.Has("visible")) tag.visible = node.Get("visible").Boolean();
  return tag;
}

StateSpec LoadState(const std::string& name, const Node& node) {
  StateSpec state;
  state.name = name;
  Node runner = node.Get("runner");
  state.runner.name = runner.Get("name").String();
  if (!IsPlainFilename(state.runner.name))
    runner.Get("name").Fail("invalid runner name");
  if (runner.Has("version"))
    state.runner.version = runner.Get("version").String();
  if (runner.Has("options")) {
    Node options = runner.Get("options");
    options.ExpectObject();
    state.runner.options = options.Json();
  }

  Node time_limit = node.Get("time_limit");
  state.time_limit_micros =
      ParseTimeLimit(time_limit.Json(), time_limit.Path());
  if (state.time_limit_micros <= 0)
    time_limit.Fail("time limit must be positive");

  if (node.Has("required_files")) {
    for (const Node& file : node.Get("required_files").Items()) {
      std::string path = file.String();
      if (!IsContainedPath(path))
        file.Fail("'" + path + "' is not a relative path inside the exercise");
      state.required_files.push_back(path);
    }
  }

  state.test_script = name + ".py";
  if (node.Has("test_script")) {
    Node script = node.Get("test_script");
    state.test_script = script.String();
    if (!IsPlainFilename(state.test_script)) script.Fail("invalid file name");
  }
  return state;
}

TransitionTarget LoadTarget(const Node& node) {
  std::vector<Node> parts = node.Items();
  if (parts.size() != 2) node.Fail("expected [next_state, grade]");
  TransitionTarget target;
  target.next_state = parts[0].String();
  if (!parts[1].IsNull()) target.grade = parts[1].Integer();
  return target;
}

void LoadTransitions(const Node& node, Setting* setting) {
  for (const Node& row : node.Items()) {
    std::vector<Node> sides = row.Items();
    if (sides.size() != 2)
      row.Fail("expected [[state, outcome], [next_state, grade]]");
    std::vector<Node> condition = sides[0].Items();
    if (condition.size() != 2) sides[0].Fail("expected [state, outcome]");

    const std::string state = condition[0].String();
    if (!setting->states.count(state))
      condition[0].Fail("unknown state '" + state + "'");

    TransitionTarget target = LoadTarget(sides[1]);
    if (!target.IsTerminal() && !setting->states.count(target.next_state))
      sides[1].Fail("unknown state '" + target.next_state + "'");

    if (condition[1].Json().is_string()) {
      if (condition[1].String() != "otherwise")
        condition[1].Fail("expected a list of statuses or 'otherwise'");
      try {
        setting->transitions.AddOtherwise(state, std::move(target));
      } catch (const SchemaValidationError& e) {
        row.Fail(e.what());
      }
      continue;
    }
    core::StatusSet outcome;
    for (const Node& status_node : condition[1].Items()) {
      core::Status status;
      const std::string status_name = status_node.String();
      if (!core::ParseStatus(status_name, &status))
        status_node.Fail("unknown status '" + status_name + "'");
      outcome.insert(status);
    }
    if (outcome.empty()) condition[1].Fail("empty status list");
    try {
      setting->transitions.AddRule(state, outcome, std::move(target));
    } catch (const SchemaValidationError& e) {
      row.Fail(e.what());
    }
  }
}

}  // namespace

const char* SandboxKindName(SandboxKind kind) {
  switch (kind) {
    case SandboxKind::FIREJAIL:
      return "Firejail";
    case SandboxKind::NSJAIL:
      return "NsJail";
  }
  return "Firejail";
}

Setting LoadSetting(const nlohmann::json& document) {
  Node root(document, "");
  Setting setting;

  Node version = root.Get("schema_version");
  if (version.String() != kSchemaVersion)
    version.Fail("unsupported schema version '" + version.String() + "'");

  Node exercise = root.Get("exercise");
  setting.exercise_name = exercise.Get("name").String();
  if (!IsUrlName(setting.exercise_name))
    exercise.Get("name").Fail("invalid exercise name");
  setting.exercise_version = BoundedString(exercise.Get("version"), 64);

  Node judge = root.Get("judge");
  if (judge.Has("preprocess")) {
    Node preprocess = judge.Get("preprocess");
    if (preprocess.Has("rename")) {
      Node rename = preprocess.Get("rename");
      setting.rename = rename.String();
      if (!IsPlainFilename(*setting.rename)) rename.Fail("invalid file name");
    }
  }

  Node environment = judge.Get("environment");
  setting.environment.name = environment.Get("name").String();
  if (!IsPlainFilename(setting.environment.name))
    environment.Get("name").Fail("invalid environment name");
  if (environment.Has("version"))
    setting.environment.version = environment.Get("version").String();

  setting.sandbox = LoadSandbox(judge.Get("sandbox"));

  if (judge.Has("evaluation_tags")) {
    std::set<std::string> names;
    for (const Node& tag_node : judge.Get("evaluation_tags").Items()) {
      core::EvaluationTag tag = LoadTag(tag_node);
      if (!names.insert(tag.name).second)
        tag_node.Fail("duplicate tag '" + tag.name + "'");
      setting.evaluation_tags.push_back(std::move(tag));
    }
  }

  Node evaluation = judge.Get("evaluation");
  for (const auto& member : evaluation.Get("states").Members()) {
    if (member.first == kTerminalState)
      member.second.Fail("'$' is reserved for the terminal state");
    if (!IsPlainFilename(member.first))
      member.second.Fail("invalid state name '" + member.first + "'");
    setting.states.emplace(member.first,
                           LoadState(member.first, member.second));
  }
  if (setting.states.empty()) evaluation.Get("states").Fail("no states");

  Node initial = evaluation.Get("initial_state");
  setting.initial_state = initial.String();
  if (!setting.states.count(setting.initial_state))
    initial.Fail("unknown state '" + setting.initial_state + "'");

  Node transitions = evaluation.Get("transition_function");
  LoadTransitions(transitions, &setting);
  std::string cycle = setting.transitions.FindCycle();
  if (!cycle.empty())
    transitions.Fail("state '" + cycle + "' can be reached from itself");

  return setting;
}

Setting LoadSettingFile(const std::string& path) {
  std::string contents;
  try {
    contents = util::File::Read(path);
  } catch (const std::system_error& e) {
    throw SchemaValidationError(path, e.what());
  }
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(contents);
  } catch (const nlohmann::json::parse_error& e) {
    throw SchemaValidationError(path, e.what());
  }
  VLOG(1) << "Loaded setting " << path;
  return LoadSetting(document);
}

ExerciseConcrete LoadExerciseConcrete(const std::string& directory) {
  if (!util::File::IsDirectory(directory))
    throw SchemaValidationError(directory, "exercise directory not found");
  ExerciseConcrete exercise;
  exercise.directory = directory;
  exercise.setting =
      LoadSettingFile(util::File::JoinPath(directory, kSettingFilename));
  return exercise;
}

}  // namespace schema
