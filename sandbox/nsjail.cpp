#include "sandbox/nsjail.hpp"

#include "absl/strings/str_cat.h"
#include "util/flags.hpp"
#include "util/which.hpp"

namespace sandbox {

std::vector<std::string> NsJail::WrapCommand(
    const std::vector<std::string>& command, const SharedPaths& paths) const {
  const int64_t memory_mib =
      (options_.memory_limit_bytes + (int64_t{1} << 20) - 1) >> 20;
  std::vector<std::string> args = {FLAGS_nsjail_command, "--mode", "o",
                                   "--quiet", "--keep_env", "--chroot", "/",
                                   "--hostname", FLAGS_sandbox_hostname};
  if (options_.cpu_limit > 0) {
    args.push_back("--max_cpus");
    args.push_back(absl::StrCat(options_.cpu_limit));
  }
  args.push_back("--rlimit_as");
  args.push_back(absl::StrCat(memory_mib));
  args.push_back("--rlimit_fsize");
  args.push_back("64");
  args.push_back("--rlimit_nofile");
  args.push_back("256");
  // Time is enforced by the limiter.
  args.push_back("--time_limit");
  args.push_back("0");
  args.push_back("--bindmount");
  args.push_back(paths.evaluation_dir);
  args.push_back("--tmpfsmount");
  args.push_back("/tmp");
  args.push_back("--cwd");
  args.push_back(paths.evaluation_dir);
  args.push_back("--");
  args.insert(args.end(), command.begin(), command.end());
  return args;
}

bool NsJail::Available() const {
  return !util::which(FLAGS_nsjail_command).empty();
}

}  // namespace sandbox
