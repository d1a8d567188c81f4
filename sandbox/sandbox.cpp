#include "sandbox/sandbox.hpp"

#include "absl/memory/memory.h"
#include "runner/runner_interface.hpp"
#include "sandbox/firejail.hpp"
#include "sandbox/nsjail.hpp"

namespace sandbox {

std::vector<std::string> SharedPaths::All() const {
  std::vector<std::string> paths;
  for (const std::string* path : {&environment_root, &limiter, &runner_dir,
                                  &exercise_dir, &evaluation_dir}) {
    if (!path->empty()) paths.push_back(*path);
  }
  return paths;
}

std::unique_ptr<Sandbox> Sandbox::Create(const schema::SandboxSpec& spec) {
  switch (spec.kind) {
    case schema::SandboxKind::FIREJAIL:
      return absl::make_unique<Firejail>(spec.options);
    case schema::SandboxKind::NSJAIL:
      return absl::make_unique<NsJail>(spec.options);
  }
  return absl::make_unique<Firejail>(spec.options);
}

int Sandbox::FailureExitCode() const { return runner::kSandboxFailureCode; }

}  // namespace sandbox
