#ifndef SANDBOX_FIREJAIL_HPP
#define SANDBOX_FIREJAIL_HPP

#include "sandbox/sandbox.hpp"

namespace sandbox {

class Firejail : public Sandbox {
 public:
  explicit Firejail(schema::SandboxOptions options)
      : Sandbox(std::move(options)) {}

  std::string Name() const override { return "Firejail"; }
  std::vector<std::string> WrapCommand(
      const std::vector<std::string>& command,
      const SharedPaths& paths) const override;
  std::string WorkingDirectory(const SharedPaths& paths) const override {
    return "/srv";
  }
  bool Available() const override;
};

}  // namespace sandbox

#endif
