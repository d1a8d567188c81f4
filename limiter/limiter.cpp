#include "limiter/limiter.hpp"

#include <chrono>
#include <thread>
#include <utility>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

int64_t TimevalToMicros(const struct timeval& tv) {
  return static_cast<int64_t>(tv.tv_sec) * 1000000 + tv.tv_usec;
}
}  // namespace

namespace limiter {

static const constexpr size_t kStrErrorBufSize = 2048;

int ParseSignal(const std::string& name) {
  static const std::pair<const char*, int> kSignals[] = {
      {"HUP", SIGHUP},   {"INT", SIGINT},   {"QUIT", SIGQUIT},
      {"KILL", SIGKILL}, {"USR1", SIGUSR1}, {"USR2", SIGUSR2},
      {"ALRM", SIGALRM}, {"TERM", SIGTERM}};
  std::string bare = name.compare(0, 3, "SIG") == 0 ? name.substr(3) : name;
  for (const auto& signal : kSignals) {
    if (bare == signal.first) return signal.second;
  }
  if (bare.empty() || bare.find_first_not_of("0123456789") != std::string::npos)
    return -1;
  int number = atoi(bare.c_str());
  return number > 0 && number < NSIG ? number : -1;
}

bool Limiter::Run(const LimiterOptions& options, LimiterOutcome* outcome,
                  std::string* error_msg) {
  if (options.args.empty()) {
    *error_msg = "no command given";
    return false;
  }
  options_ = &options;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(outcome, error_msg)) return false;
  return true;
}

bool Limiter::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (pipe(pipe_fds_) == -1) {
    *error_msg = "pipe: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (fcntl(pipe_fds_[0], F_SETFD, FD_CLOEXEC) == -1 ||
      fcntl(pipe_fds_[1], F_SETFD, FD_CLOEXEC) == -1) {
    *error_msg = "fcntl: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  return true;
}

bool Limiter::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

void Limiter::Child() {
  close(pipe_fds_[0]);
  auto die = [this](const char* prefix, int err) {
    char errbuf[kStrErrorBufSize] = {};
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, mystrerror(err, errbuf, kStrErrorBufSize), kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      if (write(pipe_fds_[1], buf, len) != len) _Exit(127);
    }
    close(pipe_fds_[1]);
    _Exit(127);
  };

  // Own process group, so that the whole tree can be signalled at once.
  if (setpgid(0, 0) == -1) die("setpgid", errno);

  std::vector<std::vector<char>> vec_args;
  for (const std::string& arg : options_->args) {
    vec_args.emplace_back(arg.begin(), arg.end());
    vec_args.back().push_back(0);
  }
  std::vector<char*> args;
  for (std::vector<char>& arg : vec_args) args.push_back(arg.data());
  args.push_back(nullptr);

  int count = 0;
  do {
    execvp(args[0], args.data());
    usleep(100);
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  _Exit(127);
}

bool Limiter::Wait(LimiterOutcome* outcome, std::string* error_msg) {
  close(pipe_fds_[1]);
  int error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    if (read(pipe_fds_[0], error, error_len) < 0) error[0] = 0;
    *error_msg = error;
    close(pipe_fds_[0]);
    waitpid(child_pid_, nullptr, 0);
    return false;
  }
  close(pipe_fds_[0]);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  int child_status = 0;
  bool stop_sent = false;
  bool kill_sent = false;
  while (true) {
    int ret = waitpid(child_pid_, &child_status, WNOHANG);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      char buf[kStrErrorBufSize] = {};
      *error_msg = "waitpid: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      kill(-child_pid_, SIGKILL);
      return false;
    }
    if (ret == child_pid_) break;
    int64_t elapsed = elapsed_millis();
    if (!stop_sent && options_->time_limit_millis &&
        elapsed >= options_->time_limit_millis) {
      kill(-child_pid_, options_->stop_signal);
      stop_sent = true;
    }
    if (stop_sent && !kill_sent &&
        elapsed >= options_->time_limit_millis + options_->kill_after_millis) {
      kill(-child_pid_, SIGKILL);
      kill_sent = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  auto elapsed_nsec = std::chrono::duration_cast<std::chrono::nanoseconds>(
                          std::chrono::steady_clock::now() - program_start)
                          .count();
  // Stray descendants must not outlive the command.
  kill(-child_pid_, SIGKILL);

  struct rusage rusage {};
  getrusage(RUSAGE_CHILDREN, &rusage);

  ResourceUsage& usage = outcome->trailer.usage;
  usage.utime_usec = TimevalToMicros(rusage.ru_utime);
  usage.stime_usec = TimevalToMicros(rusage.ru_stime);
  usage.time_usec = usage.utime_usec + usage.stime_usec;
  usage.maxrss_kb = rusage.ru_maxrss;
  usage.minflt = rusage.ru_minflt;
  usage.majflt = rusage.ru_majflt;
  usage.inblock = rusage.ru_inblock;
  usage.oublock = rusage.ru_oublock;
  usage.nvcsw = rusage.ru_nvcsw;
  usage.nivcsw = rusage.ru_nivcsw;
  usage.elapsed_nsec = elapsed_nsec;

  LimitDetection& detection = outcome->trailer.detection;
  const int64_t limit_usec = options_->time_limit_millis * 1000;
  if (limit_usec) {
    detection.cpu_overuse = usage.time_usec >= limit_usec;
    detection.utime_overuse = usage.utime_usec >= limit_usec;
    detection.stime_overuse = usage.stime_usec >= limit_usec;
  }
  detection.exit_status = WIFEXITED(child_status)
                              ? WEXITSTATUS(child_status)
                              : 128 + WTERMSIG(child_status);
  outcome->timed_out = stop_sent;
  return true;
}

}  // namespace limiter
