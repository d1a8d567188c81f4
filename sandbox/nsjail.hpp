#ifndef SANDBOX_NSJAIL_HPP
#define SANDBOX_NSJAIL_HPP

#include "sandbox/sandbox.hpp"

namespace sandbox {

// NsJail in one-shot mode. The host root is mounted read-only; new network,
// user and mount namespaces and the empty capability set are NsJail
// defaults.
class NsJail : public Sandbox {
 public:
  explicit NsJail(schema::SandboxOptions options)
      : Sandbox(std::move(options)) {}

  std::string Name() const override { return "NsJail"; }
  std::vector<std::string> WrapCommand(
      const std::vector<std::string>& command,
      const SharedPaths& paths) const override;
  std::string WorkingDirectory(const SharedPaths& paths) const override {
    return paths.evaluation_dir;
  }
  bool Available() const override;
};

}  // namespace sandbox

#endif
