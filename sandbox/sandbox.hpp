#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <memory>
#include <string>
#include <vector>

#include "schema/setting.hpp"

namespace sandbox {

// Host paths that the sandboxed command needs to see. Everything is
// read-only except the evaluation directory.
struct SharedPaths {
  std::string environment_root;
  std::string limiter;
  std::string runner_dir;
  std::string exercise_dir;
  std::string evaluation_dir;

  std::vector<std::string> All() const;
};

// Isolation layer wrapped around the limiter. Implementations only compose
// command lines; they never execute anything.
class Sandbox {
 public:
  static std::unique_ptr<Sandbox> Create(const schema::SandboxSpec& spec);

  virtual std::string Name() const = 0;

  // Returns the command that runs the given command inside the sandbox.
  virtual std::vector<std::string> WrapCommand(
      const std::vector<std::string>& command,
      const SharedPaths& paths) const = 0;

  // Directory the wrapped command has to be started from.
  virtual std::string WorkingDirectory(const SharedPaths& paths) const = 0;

  // Whether the sandbox executable can be found on this machine.
  virtual bool Available() const = 0;

  // Exit code of the sandbox itself when it fails.
  int FailureExitCode() const;

  const schema::SandboxOptions& Options() const { return options_; }

  virtual ~Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

 protected:
  explicit Sandbox(schema::SandboxOptions options)
      : options_(std::move(options)) {}

  schema::SandboxOptions options_;
};

}  // namespace sandbox

#endif
