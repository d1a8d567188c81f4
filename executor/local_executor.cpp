#include "executor/local_executor.hpp"

#include <chrono>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "glog/logging.h"

namespace {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr size_t kReadChunk = 64 * 1024;
static const constexpr std::chrono::milliseconds kWaitPollInterval{10};

std::string ErrnoMessage(const char* prefix, int err) {
  char buf[kStrErrorBufSize] = {};
#ifdef _GNU_SOURCE
  const char* msg = strerror_r(err, buf, kStrErrorBufSize);
#else
  strerror_r(err, buf, kStrErrorBufSize);
  const char* msg = buf;
#endif
  return std::string(prefix) + ": " + msg;
}

bool MakePipe(int fds[2], std::string* error_msg) {
  if (pipe(fds) == -1) {
    *error_msg = ErrnoMessage("pipe", errno);
    return false;
  }
  if (fcntl(fds[0], F_SETFD, FD_CLOEXEC) == -1 ||
      fcntl(fds[1], F_SETFD, FD_CLOEXEC) == -1) {
    *error_msg = ErrnoMessage("fcntl", errno);
    close(fds[0]);
    close(fds[1]);
    return false;
  }
  return true;
}

[[noreturn]] void RunChild(const executor::Request& request, int error_fd,
                           int stdout_fd, int stderr_fd) {
  auto die = [error_fd](const char* prefix, int err) {
    std::string msg = ErrnoMessage(prefix, err);
    int len = msg.size();
    if (write(error_fd, &len, sizeof(len)) == sizeof(len)) {
      if (write(error_fd, msg.c_str(), len) != len) _Exit(127);
    }
    _Exit(127);
  };

  // Change process group, so that we do not receive Ctrl-Cs in the terminal
  // and the whole tree can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  int null_fd = open("/dev/null", O_RDONLY);
  if (null_fd == -1) die("open", errno);
  if (dup2(null_fd, STDIN_FILENO) == -1) die("redir stdin", errno);
  if (dup2(stdout_fd, STDOUT_FILENO) == -1) die("redir stdout", errno);
  if (dup2(stderr_fd, STDERR_FILENO) == -1) die("redir stderr", errno);

  if (!request.working_directory.empty() &&
      chdir(request.working_directory.c_str()) == -1) {
    die("chdir", errno);
  }

  std::vector<std::vector<char>> vec_args;
  for (const std::string& arg : request.args) {
    vec_args.emplace_back(arg.begin(), arg.end());
    vec_args.back().push_back(0);
  }
  std::vector<char*> args;
  for (std::vector<char>& arg : vec_args) args.push_back(arg.data());
  args.push_back(nullptr);

  execvp(args[0], args.data());
  die("exec", errno);
}

}  // namespace

namespace executor {

bool LocalExecutor::Execute(const Request& request, Response* response,
                            std::string* error_msg) {
  if (request.args.empty()) {
    *error_msg = "empty command";
    return false;
  }
  int error_pipe[2];
  int stdout_pipe[2];
  int stderr_pipe[2];
  if (!MakePipe(error_pipe, error_msg)) return false;
  if (!MakePipe(stdout_pipe, error_msg)) {
    close(error_pipe[0]);
    close(error_pipe[1]);
    return false;
  }
  if (!MakePipe(stderr_pipe, error_msg)) {
    for (int fd :
         {error_pipe[0], error_pipe[1], stdout_pipe[0], stdout_pipe[1]}) {
      close(fd);
    }
    return false;
  }

  VLOG(1) << "Executing " << request.args[0] << " with "
          << request.args.size() - 1 << " arguments";
  auto start = std::chrono::steady_clock::now();
  pid_t pid = fork();
  if (pid == -1) {
    *error_msg = ErrnoMessage("fork", errno);
    for (int fd : {error_pipe[0], error_pipe[1], stdout_pipe[0],
                   stdout_pipe[1], stderr_pipe[0], stderr_pipe[1]})
      close(fd);
    return false;
  }
  if (pid == 0) {
    close(error_pipe[0]);
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);
    RunChild(request, error_pipe[1], stdout_pipe[1], stderr_pipe[1]);
  }
  close(error_pipe[1]);
  close(stdout_pipe[1]);
  close(stderr_pipe[1]);

  int error_len = 0;
  if (read(error_pipe[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= PIPE_BUF) error_len = PIPE_BUF - 1;
    if (read(error_pipe[0], error, error_len) < 0) error[0] = 0;
    *error_msg = error;
    close(error_pipe[0]);
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);
    waitpid(pid, nullptr, 0);
    return false;
  }
  close(error_pipe[0]);

  auto elapsed_millis = [&start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
  };

  *response = Response();
  struct pollfd fds[2] = {{stdout_pipe[0], POLLIN, 0},
                          {stderr_pipe[0], POLLIN, 0}};
  std::string* sinks[2] = {&response->stdout_contents,
                           &response->stderr_contents};
  int open_fds = 2;
  char buf[kReadChunk];
  while (open_fds > 0) {
    int timeout = -1;
    if (request.wall_limit_millis) {
      int64_t remaining = request.wall_limit_millis - elapsed_millis();
      if (remaining <= 0) {
        response->wall_limit_exceeded = true;
        break;
      }
      timeout = static_cast<int>(remaining);
    }
    int ret = poll(fds, 2, timeout);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) {
      *error_msg = ErrnoMessage("poll", errno);
      kill(-pid, SIGKILL);
      waitpid(pid, nullptr, 0);
      close(stdout_pipe[0]);
      close(stderr_pipe[0]);
      return false;
    }
    for (int i = 0; i < 2; i++) {
      if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;
      ssize_t amount = read(fds[i].fd, buf, kReadChunk);
      if (amount == -1 && errno == EINTR) continue;
      if (amount <= 0) {
        close(fds[i].fd);
        fds[i].fd = -1;
        open_fds--;
        continue;
      }
      sinks[i]->append(buf, amount);
    }
  }
  if (response->wall_limit_exceeded) kill(-pid, SIGKILL);
  for (const struct pollfd& fd : fds) {
    if (fd.fd >= 0) close(fd.fd);
  }

  // Both streams may be closed while the command is still running, so the
  // wall clock limit also applies to the wait.
  int child_status = 0;
  while (true) {
    const bool bounded =
        request.wall_limit_millis && !response->wall_limit_exceeded;
    pid_t waited = waitpid(pid, &child_status, bounded ? WNOHANG : 0);
    if (waited == pid) break;
    if (waited == -1) {
      if (errno == EINTR) continue;
      *error_msg = ErrnoMessage("waitpid", errno);
      return false;
    }
    if (elapsed_millis() >= request.wall_limit_millis) {
      response->wall_limit_exceeded = true;
      kill(-pid, SIGKILL);
      continue;
    }
    std::this_thread::sleep_for(kWaitPollInterval);
  }
  response->wall_time_millis = elapsed_millis();
  response->status_code =
      WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  response->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  VLOG(1) << "Command exited with status " << response->status_code
          << ", signal " << response->signal << " after "
          << response->wall_time_millis << "ms";
  return true;
}

}  // namespace executor
