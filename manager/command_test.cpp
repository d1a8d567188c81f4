#include "manager/command.hpp"

#include <algorithm>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runner/runner_interface.hpp"
#include "util/flags.hpp"

namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

schema::ExerciseConcrete exercise() {
  schema::ExerciseConcrete concrete;
  concrete.directory = "/srv/exercises/hello";
  concrete.setting.exercise_name = "hello";
  concrete.setting.environment.name = "python3.9";
  concrete.setting.sandbox.kind = schema::SandboxKind::NSJAIL;
  return concrete;
}

manager::EvaluationOptions options() {
  manager::EvaluationOptions opts;
  opts.submission_dir = "/srv/submissions/42";
  opts.submission_filename = "main.py";
  opts.evaluation_dir = "/var/lib/stagejudge/eval-42";
  opts.result_filename = "result";
  opts.log_level = "DEBUG";
  return opts;
}

manager::ExecutionContext context() {
  manager::ExecutionContext ctx;
  ctx.state_name = "compile";
  ctx.state_dir = "/var/lib/stagejudge/eval-42/compile";
  ctx.evaluation_filename = "main.py";
  ctx.test_script = "compile.py";
  ctx.runner_path = "/opt/stagejudge/runners/test_runner";
  ctx.runner_options = runner::EncodeOptions("{}");
  ctx.time_limit_micros = 1500000;
  return ctx;
}

class Command : public ::testing::Test {
 protected:
  void SetUp() override {
    FLAGS_environment_root = "/opt/stagejudge/environments";
    FLAGS_runner_dir = "/opt/stagejudge/runners";
    FLAGS_limiter_command = "/opt/stagejudge/bin/stagejudge-limiter";
    FLAGS_kill_grace_seconds = 1;
    FLAGS_wall_clock_margin_seconds = 3;
  }

 private:
  gflags::FlagSaver saver_;
};

// NOLINTNEXTLINE
TEST_F(Command, RunnerCommand) {
  EXPECT_THAT(
      manager::RunnerCommand(exercise(), options(), context()),
      ElementsAre("/opt/stagejudge/runners/test_runner", "/srv/exercises/hello",
                  "compile", "/var/lib/stagejudge/eval-42", "main.py",
                  "result__compile", "e30=", "-l", "DEBUG", "-s",
                  "compile.py"));
}

// NOLINTNEXTLINE
TEST_F(Command, LimiterCommand) {
  EXPECT_THAT(manager::LimiterCommand({"runner", "x"}, 2),
              ElementsAre("/opt/stagejudge/bin/stagejudge-limiter",
                          "--signal=TERM", "--kill_after=1", "--time_limit=2",
                          "--", "runner", "x"));
}

// NOLINTNEXTLINE
TEST_F(Command, KillGraceIsRelativeToTimeLimit) {
  FLAGS_kill_grace_seconds = 2;
  EXPECT_THAT(manager::LimiterCommand({"runner"}, 10),
              ElementsAre("/opt/stagejudge/bin/stagejudge-limiter",
                          "--signal=TERM", "--kill_after=2", "--time_limit=10",
                          "--", "runner"));
}

// NOLINTNEXTLINE
TEST_F(Command, SharedPaths) {
  sandbox::SharedPaths paths = manager::SharedPathsFor(exercise(), options());
  EXPECT_EQ(paths.environment_root, "/opt/stagejudge/environments");
  EXPECT_EQ(paths.limiter, "/opt/stagejudge/bin");
  EXPECT_EQ(paths.runner_dir, "/opt/stagejudge/runners");
  EXPECT_EQ(paths.exercise_dir, "/srv/exercises/hello");
  EXPECT_EQ(paths.evaluation_dir, "/var/lib/stagejudge/eval-42");

  FLAGS_limiter_command = "stagejudge-limiter";
  EXPECT_EQ(manager::SharedPathsFor(exercise(), options()).limiter, "");
}

// NOLINTNEXTLINE
TEST_F(Command, ComposeCommand) {
  schema::ExerciseConcrete concrete = exercise();
  auto sandbox = sandbox::Sandbox::Create(concrete.setting.sandbox);
  manager::ComposedCommand composed =
      manager::ComposeCommand(concrete, *sandbox, options(), context());

  // 1.5s rounds up to 2s, plus the margin.
  EXPECT_EQ(composed.wall_limit_millis, 5000);
  EXPECT_EQ(composed.working_directory, "/var/lib/stagejudge/eval-42");
  ASSERT_EQ(composed.args.size(), 3);
  EXPECT_EQ(composed.args[0], "bash");
  EXPECT_EQ(composed.args[1], "-c");
  const std::string& line = composed.args[2];
  EXPECT_THAT(line, HasSubstr("source /opt/stagejudge/environments/python3.9/"
                              "venv/bin/activate && " +
                              FLAGS_nsjail_command + " "));
  EXPECT_THAT(line, HasSubstr(" -- /opt/stagejudge/bin/stagejudge-limiter "
                              "--signal=TERM --kill_after=1 --time_limit=2 -- "
                              "/opt/stagejudge/runners/test_runner "));
  EXPECT_THAT(line, HasSubstr(" result__compile e30= -l DEBUG -s compile.py"));
}

// NOLINTNEXTLINE
TEST_F(Command, ComposeCommandIsPure) {
  schema::ExerciseConcrete concrete = exercise();
  concrete.setting.sandbox.kind = schema::SandboxKind::FIREJAIL;
  auto sandbox = sandbox::Sandbox::Create(concrete.setting.sandbox);
  manager::ComposedCommand first =
      manager::ComposeCommand(concrete, *sandbox, options(), context());
  manager::ComposedCommand second =
      manager::ComposeCommand(concrete, *sandbox, options(), context());
  EXPECT_EQ(first.args, second.args);
  EXPECT_EQ(first.working_directory, "/srv");
}

}  // namespace
