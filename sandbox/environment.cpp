#include "sandbox/environment.hpp"

#include <algorithm>

#include "util/file.hpp"
#include "util/misc.hpp"

namespace sandbox {

std::vector<std::string> ListEnvironments(const std::string& root) {
  std::vector<std::string> environments;
  if (!util::File::IsDirectory(root)) return environments;
  for (const std::string& name : util::File::ListDir(root)) {
    if (name.empty() || name[0] == '.' || name[0] == '_' || name[0] == '-')
      continue;
    const std::string path = util::File::JoinPath(root, name);
    if (!util::File::IsDirectory(path)) continue;
    if (!util::File::Exists(util::File::JoinPath(path, kEnvironmentReadyFile)))
      continue;
    environments.push_back(name);
  }
  std::sort(environments.begin(), environments.end());
  return environments;
}

std::string ActivationScript(const std::string& root,
                             const std::string& name) {
  return util::File::JoinPath(util::File::JoinPath(root, name),
                              "venv/bin/activate");
}

std::vector<std::string> WrapInEnvironment(
    const std::string& root, const std::string& name,
    const std::vector<std::string>& command) {
  return {"bash", "-c",
          "source " + util::ShellQuote(ActivationScript(root, name)) +
              " && " + util::ShellJoin(command)};
}

}  // namespace sandbox
