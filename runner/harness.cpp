#include "runner/harness.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "runner/runner_interface.hpp"

namespace runner {

namespace {

core::CaseResult ErrorCase(const std::string& name,
                           const core::EvaluationTag& tag,
                           const std::string& reviewer_message) {
  core::CaseResult result;
  result.name = name;
  result.status = core::Status::ERROR;
  result.tags = {tag};
  result.reviewer_message = reviewer_message;
  return result;
}

[[noreturn]] void RunInChild(const std::string& name,
                             const Harness::CaseFunction& function,
                             int result_fd) {
  CaseContext context(name);
  try {
    function(&context);
  } catch (const std::exception& e) {
    context.Error("", std::string("uncaught exception: ") + e.what());
    context.AddTag(core::UnexpectedAbortion());
  }
  std::string encoded = CaseToWire(context.Result()).dump();
  size_t pos = 0;
  while (pos < encoded.size()) {
    ssize_t written = write(result_fd, encoded.data() + pos,
                            encoded.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) _exit(1);
    pos += written;
  }
  close(result_fd);
  fflush(stdout);
  fflush(stderr);
  _exit(0);
}

}  // namespace

CaseContext::CaseContext(std::string name) {
  result_.name = std::move(name);
  result_.status = core::Status::PASS;
}

void CaseContext::Fail(const std::string& student_message,
                       const std::string& reviewer_message) {
  result_.status = core::Status::FAIL;
  result_.student_message = student_message;
  result_.reviewer_message = reviewer_message;
}

void CaseContext::Error(const std::string& student_message,
                        const std::string& reviewer_message) {
  result_.status = core::Status::ERROR;
  result_.student_message = student_message;
  result_.reviewer_message = reviewer_message;
}

void CaseContext::AddTag(const core::EvaluationTag& tag) {
  result_.tags.push_back(tag);
}

void CaseContext::SetStudentMessage(const std::string& message) {
  result_.student_message = message;
}

void CaseContext::SetSystemMessage(const std::string& message) {
  result_.system_message = message;
}

void Harness::AddCase(const std::string& name, CaseFunction function) {
  for (const auto& test_case : cases_) {
    if (test_case.first == name)
      throw std::invalid_argument("duplicate case name " + name);
  }
  cases_.emplace_back(name, std::move(function));
}

core::CaseResult Harness::RunCase(const std::string& name,
                                  const CaseFunction& function) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1)
    return ErrorCase(name, core::EvaluationSystemError(), "pipe failed");
  fflush(stdout);
  fflush(stderr);
  pid_t pid = fork();
  if (pid == -1) {
    close(fds[0]);
    close(fds[1]);
    return ErrorCase(name, core::EvaluationSystemError(), "fork failed");
  }
  if (pid == 0) {
    close(fds[0]);
    RunInChild(name, function, fds[1]);
  }
  close(fds[1]);

  auto start = std::chrono::steady_clock::now();
  std::string encoded;
  bool timed_out = false;
  char buf[4096];
  while (true) {
    int timeout = -1;
    if (case_time_limit_millis_) {
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - start)
                         .count();
      if (elapsed >= case_time_limit_millis_) {
        timed_out = true;
        break;
      }
      timeout = static_cast<int>(case_time_limit_millis_ - elapsed);
    }
    struct pollfd pfd = {fds[0], POLLIN, 0};
    int ret = poll(&pfd, 1, timeout);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == 0) continue;
    if (ret == -1) break;
    ssize_t amount = read(fds[0], buf, sizeof(buf));
    if (amount == -1 && errno == EINTR) continue;
    if (amount <= 0) break;
    encoded.append(buf, amount);
  }
  close(fds[0]);
  if (timed_out) kill(pid, SIGKILL);

  int status = 0;
  while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
  if (timed_out)
    return ErrorCase(name, core::TimeLimitExceeded(), "case timed out");
  if (WIFSIGNALED(status))
    return ErrorCase(name, core::UnexpectedAbortion(),
                     "killed by signal " + std::to_string(WTERMSIG(status)));
  if (encoded.empty())
    return ErrorCase(name, core::UnexpectedAbortion(),
                     "exited without a result");
  try {
    core::CaseResult result = ParseCaseResults("[" + encoded + "]").at(0);
    result.name = name;
    return result;
  } catch (const malformed_payload& e) {
    return ErrorCase(name, core::EvaluationSystemError(), e.what());
  }
}

std::vector<core::CaseResult> Harness::RunAll() {
  std::vector<core::CaseResult> results;
  for (const auto& test_case : cases_) {
    results.push_back(RunCase(test_case.first, test_case.second));
  }
  return results;
}

int Harness::Main() {
  std::vector<core::CaseResult> results = RunAll();
  std::cout << "\n" << CasesToWire(results).dump() << std::endl;
  return 0;
}

}  // namespace runner
