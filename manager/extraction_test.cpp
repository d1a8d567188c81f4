#include "manager/extraction.hpp"

#include <signal.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "limiter/statistics.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

const char* kPassingCase =
    R"([{"name": "a", "status": "pass", "tags": [], "msg": "", "err": ""}])";

manager::StateLimits limits() {
  manager::StateLimits state_limits;
  state_limits.time_limit_micros = 2000000;
  state_limits.memory_limit_bytes = int64_t{256} << 20;
  return state_limits;
}

std::string trailer(int64_t elapsed_nsec, int64_t maxrss_kb,
                    int exit_status = 0) {
  limiter::Trailer t;
  t.usage.elapsed_nsec = elapsed_nsec;
  t.usage.maxrss_kb = maxrss_kb;
  t.detection.exit_status = exit_status;
  return limiter::FormatTrailer(t);
}

executor::Response response(const std::string& stderr_contents,
                            int status_code = 0) {
  executor::Response r;
  r.status_code = status_code;
  r.stderr_contents = stderr_contents;
  return r;
}

/*
 * ClassifyExit
 */

// NOLINTNEXTLINE
TEST(Extraction, ClassifyExit) {
  using manager::ExitClass;
  executor::Response r;
  EXPECT_EQ(manager::ClassifyExit(r, 255), ExitClass::OK);
  r.status_code = 255;
  EXPECT_EQ(manager::ClassifyExit(r, 255), ExitClass::DEFERRED);
  r.status_code = 124;
  EXPECT_EQ(manager::ClassifyExit(r, 255), ExitClass::DEFERRED);
  r.status_code = 196;
  EXPECT_EQ(manager::ClassifyExit(r, 255), ExitClass::RUNNER_ERROR);
  r.status_code = 253;
  EXPECT_EQ(manager::ClassifyExit(r, 255), ExitClass::RUNNER_ERROR);
  r.status_code = 1;
  EXPECT_EQ(manager::ClassifyExit(r, 255), ExitClass::UNEXPECTED_ABORT);
  r.status_code = 0;
  r.signal = SIGSEGV;
  EXPECT_EQ(manager::ClassifyExit(r, 255), ExitClass::UNEXPECTED_ABORT);
  r.signal = SIGKILL;
  EXPECT_EQ(manager::ClassifyExit(r, 255), ExitClass::HARD_KILLED);
  r.wall_limit_exceeded = true;
  EXPECT_EQ(manager::ClassifyExit(r, 255), ExitClass::WALL_LIMIT);
}

// NOLINTNEXTLINE
TEST(Extraction, IrregularTags) {
  using manager::ExitClass;
  EXPECT_TRUE(manager::IrregularTags(ExitClass::OK).empty());
  EXPECT_TRUE(manager::IrregularTags(ExitClass::DEFERRED).empty());
  EXPECT_THAT(manager::IrregularTags(ExitClass::HARD_KILLED),
              ElementsAre(core::BackendSystemError()));
  EXPECT_THAT(manager::IrregularTags(ExitClass::RUNNER_ERROR),
              ElementsAre(core::EvaluationSystemError()));
  EXPECT_THAT(manager::IrregularTags(ExitClass::UNEXPECTED_ABORT),
              ElementsAre(core::UnexpectedAbortion()));
  EXPECT_THAT(manager::IrregularTags(ExitClass::WALL_LIMIT),
              ElementsAre(core::TimeLimitExceeded()));
}

/*
 * ExtractState
 */

// NOLINTNEXTLINE
TEST(Extraction, Cases) {
  manager::StateExtraction extraction = manager::ExtractState(
      response(std::string("runner diagnostics\nmore\n") + kPassingCase +
               "\n\n" + trailer(1000000, 4096)),
      limits());
  EXPECT_FALSE(extraction.halt);
  ASSERT_EQ(extraction.cases.size(), 1);
  EXPECT_EQ(extraction.cases[0].name, "a");
  EXPECT_EQ(extraction.cases[0].status, core::Status::PASS);
  EXPECT_EQ(extraction.time, absl::optional<int64_t>(1000000));
  EXPECT_EQ(extraction.memory, absl::optional<int64_t>(4096));
  EXPECT_EQ(extraction.cases[0].system_message, "runner diagnostics\nmore");
}

// NOLINTNEXTLINE
TEST(Extraction, DiagnosticsKeptWithCases) {
  const std::string payload =
      R"([{"name": "a", "status": "pass", "tags": [], "msg": "", "err": ""},)"
      R"( {"name": "b", "status": "fail", "tags": [], "msg": "", "err": "",)"
      R"( "system_message": "assert"}])";
  manager::StateExtraction extraction = manager::ExtractState(
      response("warning: x\n" + payload + "\n" + trailer(1000, 10)),
      limits());
  ASSERT_EQ(extraction.cases.size(), 2);
  EXPECT_EQ(extraction.cases[0].system_message, "warning: x");
  EXPECT_EQ(extraction.cases[1].system_message, "assert\nwarning: x");
}

// NOLINTNEXTLINE
TEST(Extraction, DeferredToTrailer) {
  manager::StateExtraction extraction = manager::ExtractState(
      response(std::string(kPassingCase) + "\n" + trailer(1000, 10, 3), 255),
      limits());
  EXPECT_FALSE(extraction.halt);
  ASSERT_EQ(extraction.cases.size(), 1);
  EXPECT_EQ(extraction.cases[0].status, core::Status::PASS);
}

// NOLINTNEXTLINE
TEST(Extraction, TimeLimitExceeded) {
  manager::StateExtraction extraction = manager::ExtractState(
      response("\n" + trailer(2000000000, 10, 143), 124), limits());
  EXPECT_FALSE(extraction.halt);
  ASSERT_EQ(extraction.cases.size(), 1);
  EXPECT_EQ(extraction.cases[0].name, core::kEntireStageCaseName);
  EXPECT_EQ(extraction.cases[0].status, core::Status::ERROR);
  EXPECT_THAT(extraction.cases[0].tags,
              ElementsAre(core::TimeLimitExceeded()));
  EXPECT_EQ(extraction.time, absl::optional<int64_t>(2000000000));
}

// NOLINTNEXTLINE
TEST(Extraction, JustUnderTimeLimit) {
  manager::StateExtraction extraction = manager::ExtractState(
      response(std::string(kPassingCase) + "\n" + trailer(1999999999, 10)),
      limits());
  ASSERT_EQ(extraction.cases.size(), 1);
  EXPECT_EQ(extraction.cases[0].name, "a");
}

// NOLINTNEXTLINE
TEST(Extraction, MemoryLimitExceeded) {
  manager::StateExtraction extraction = manager::ExtractState(
      response(std::string(kPassingCase) + "\n" + trailer(1000, 256 * 1024)),
      limits());
  EXPECT_FALSE(extraction.halt);
  ASSERT_EQ(extraction.cases.size(), 1);
  EXPECT_EQ(extraction.cases[0].status, core::Status::ERROR);
  EXPECT_THAT(extraction.cases[0].tags,
              ElementsAre(core::UnexpectedAbortion()));
  EXPECT_EQ(extraction.cases[0].reviewer_message, "MLE");
  EXPECT_EQ(extraction.memory, absl::optional<int64_t>(256 * 1024));
  EXPECT_THAT(extraction.cases[0].system_message, HasSubstr("MLE; 262144KiB"));
}

// NOLINTNEXTLINE
TEST(Extraction, TimeAndMemoryLimitExceeded) {
  manager::StateExtraction extraction = manager::ExtractState(
      response("still running\n" + trailer(3000000000, 512 * 1024), 124),
      limits());
  EXPECT_FALSE(extraction.halt);
  ASSERT_EQ(extraction.cases.size(), 2);
  EXPECT_THAT(extraction.cases[0].tags,
              ElementsAre(core::TimeLimitExceeded()));
  EXPECT_EQ(extraction.cases[0].system_message, "still running");
  EXPECT_THAT(extraction.cases[1].tags,
              ElementsAre(core::UnexpectedAbortion()));
  EXPECT_EQ(extraction.cases[1].reviewer_message, "MLE");
  EXPECT_THAT(extraction.cases[1].system_message, HasSubstr("still running"));
}

// NOLINTNEXTLINE
TEST(Extraction, MalformedPayload) {
  manager::StateExtraction extraction = manager::ExtractState(
      response("Traceback\nnot json\n" + trailer(1000, 10)), limits());
  EXPECT_FALSE(extraction.halt);
  ASSERT_EQ(extraction.cases.size(), 1);
  EXPECT_EQ(extraction.cases[0].status, core::Status::FATAL);
  EXPECT_THAT(extraction.cases[0].tags,
              ElementsAre(core::BackendSystemError()));
  EXPECT_THAT(extraction.cases[0].reviewer_message,
              HasSubstr("Invalid runner output"));
  EXPECT_EQ(extraction.cases[0].system_message, "Traceback");
  EXPECT_TRUE(extraction.time);
}

// NOLINTNEXTLINE
TEST(Extraction, MissingTrailer) {
  manager::StateExtraction extraction =
      manager::ExtractState(response(kPassingCase), limits());
  EXPECT_TRUE(extraction.halt);
  ASSERT_EQ(extraction.cases.size(), 1);
  EXPECT_EQ(extraction.cases[0].status, core::Status::FATAL);
  EXPECT_THAT(extraction.cases[0].tags,
              ElementsAre(core::BackendSystemError()));
  EXPECT_FALSE(extraction.time);
  EXPECT_FALSE(extraction.memory);
}

// NOLINTNEXTLINE
TEST(Extraction, IrregularExitHalts) {
  executor::Response r = response("whatever", 1);
  manager::StateExtraction extraction = manager::ExtractState(r, limits());
  EXPECT_TRUE(extraction.halt);
  ASSERT_EQ(extraction.cases.size(), 1);
  EXPECT_EQ(extraction.cases[0].name, core::kEntireStageCaseName);
  EXPECT_EQ(extraction.cases[0].status, core::Status::FATAL);
  EXPECT_THAT(extraction.cases[0].tags,
              ElementsAre(core::UnexpectedAbortion()));
  EXPECT_THAT(extraction.cases[0].system_message, HasSubstr("status 1"));

  r = response("", 0);
  r.wall_limit_exceeded = true;
  r.signal = SIGKILL;
  extraction = manager::ExtractState(r, limits());
  EXPECT_TRUE(extraction.halt);
  EXPECT_THAT(extraction.cases.at(0).tags,
              ElementsAre(core::TimeLimitExceeded()));
}

// NOLINTNEXTLINE
TEST(Extraction, FatalCase) {
  core::CaseResult result = manager::FatalCase(
      "__setup__", {core::EvaluationSystemError()}, "review", "system");
  EXPECT_EQ(result.name, "__setup__");
  EXPECT_EQ(result.status, core::Status::FATAL);
  EXPECT_EQ(result.reviewer_message, "review");
  EXPECT_EQ(result.system_message, "system");
}

}  // namespace
