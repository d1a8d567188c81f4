#include "runner/process.hpp"

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace runner {

namespace {

std::string ErrnoMessage(const char* prefix, int err) {
  return std::string(prefix) + ": " + strerror(err);
}

}  // namespace

bool RunCaptured(const std::vector<std::string>& args,
                 const std::string& directory, ProcessResult* result,
                 std::string* error_msg) {
  if (args.empty()) {
    *error_msg = "empty command";
    return false;
  }
  int error_pipe[2];
  int out_pipe[2];
  int err_pipe[2];
  if (pipe2(error_pipe, O_CLOEXEC) == -1) {
    *error_msg = ErrnoMessage("pipe", errno);
    return false;
  }
  if (pipe2(out_pipe, O_CLOEXEC) == -1) {
    *error_msg = ErrnoMessage("pipe", errno);
    close(error_pipe[0]);
    close(error_pipe[1]);
    return false;
  }
  if (pipe2(err_pipe, O_CLOEXEC) == -1) {
    *error_msg = ErrnoMessage("pipe", errno);
    for (int fd : {error_pipe[0], error_pipe[1], out_pipe[0], out_pipe[1]})
      close(fd);
    return false;
  }

  std::vector<std::vector<char>> vec_args;
  for (const std::string& arg : args) {
    vec_args.emplace_back(arg.begin(), arg.end());
    vec_args.back().push_back(0);
  }
  std::vector<char*> argv;
  for (std::vector<char>& arg : vec_args) argv.push_back(arg.data());
  argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid == -1) {
    *error_msg = ErrnoMessage("fork", errno);
    for (int fd : {error_pipe[0], error_pipe[1], out_pipe[0], out_pipe[1],
                   err_pipe[0], err_pipe[1]})
      close(fd);
    return false;
  }
  if (pid == 0) {
    auto die = [&error_pipe](int err) {
      if (write(error_pipe[1], &err, sizeof(err)) != sizeof(err)) _Exit(127);
      _Exit(127);
    };
    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd == -1 || dup2(null_fd, STDIN_FILENO) == -1) die(errno);
    if (dup2(out_pipe[1], STDOUT_FILENO) == -1) die(errno);
    if (dup2(err_pipe[1], STDERR_FILENO) == -1) die(errno);
    if (chdir(directory.c_str()) == -1) die(errno);
    execvp(argv[0], argv.data());
    die(errno);
  }
  close(error_pipe[1]);
  close(out_pipe[1]);
  close(err_pipe[1]);

  int child_errno = 0;
  if (read(error_pipe[0], &child_errno, sizeof(child_errno)) ==
      sizeof(child_errno)) {
    *error_msg = ErrnoMessage(args[0].c_str(), child_errno);
    close(error_pipe[0]);
    close(out_pipe[0]);
    close(err_pipe[0]);
    waitpid(pid, nullptr, 0);
    return false;
  }
  close(error_pipe[0]);

  *result = ProcessResult();
  struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
  std::string* sinks[2] = {&result->stdout_contents, &result->stderr_contents};
  int open_fds = 2;
  bool poll_failed = false;
  char buf[PIPE_BUF];
  while (open_fds > 0) {
    if (poll(fds, 2, -1) == -1) {
      if (errno == EINTR) continue;
      *error_msg = ErrnoMessage("poll", errno);
      poll_failed = true;
      break;
    }
    for (int i = 0; i < 2; i++) {
      if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;
      ssize_t amount = read(fds[i].fd, buf, sizeof(buf));
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
  for (const struct pollfd& fd : fds) {
    if (fd.fd >= 0) close(fd.fd);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      *error_msg = ErrnoMessage("waitpid", errno);
      return false;
    }
  }
  result->status_code = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
  result->signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
  return !poll_failed;
}

}  // namespace runner
