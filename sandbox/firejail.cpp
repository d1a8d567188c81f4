#include "sandbox/firejail.hpp"

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace sandbox {

namespace {

bool AnyUnder(const std::vector<std::string>& paths, const std::string& root) {
  for (const std::string& path : paths) {
    if (path == root || absl::StartsWith(path, root + "/")) return true;
  }
  return false;
}

}  // namespace

std::vector<std::string> Firejail::WrapCommand(
    const std::vector<std::string>& command, const SharedPaths& paths) const {
  const std::vector<std::string> shared = paths.All();
  std::vector<std::string> args = {FLAGS_firejail_command};
  if (FLAGS_sandbox_debug) args.push_back("--allow-debuggers");
  args.push_back("--seccomp=mbind");
  if (options_.cpu_limit > 0) {
    std::string cpus;
    for (int32_t i = 0; i < options_.cpu_limit; i++) {
      absl::StrAppend(&cpus, i == 0 ? "" : ",", i);
    }
    args.push_back("--cpu=" + cpus);
  }
  args.push_back(absl::StrCat("--rlimit-as=", options_.memory_limit_bytes));
  args.push_back("--hostname=" + FLAGS_sandbox_hostname);
  args.push_back("--net=none");
  args.push_back("--caps.drop=all");
  args.push_back("--private-bin=bash");
  args.push_back("--private-dev");
  args.push_back("--private-etc=_");
  // A private home would hide the shared paths living there.
  if (!AnyUnder(shared, "/home")) args.push_back("--private");
  if (!AnyUnder(shared, "/opt")) args.push_back("--private-opt=_");
  args.push_back("--private-srv=_");
  args.push_back("--private-tmp");
  args.push_back("--read-only=/opt");
  args.push_back("--read-only=/home");
  args.push_back("--read-write=" + paths.evaluation_dir);
  args.push_back("--deterministic-exit-code");
  args.push_back("-c");
  args.insert(args.end(), command.begin(), command.end());
  return args;
}

bool Firejail::Available() const {
  return !util::which(FLAGS_firejail_command).empty();
}

}  // namespace sandbox
