#include "manager/evaluation.hpp"

#include <sstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "limiter/statistics.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

using ::testing::_;
using ::testing::DoAll;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::SetArgPointee;
using core::Status;

const std::string test_tmpdir = "/tmp/stagejudge_testdir";

class MockExecutor : public executor::Executor {
 public:
  MOCK_METHOD(std::string, Id, (), (const, override));
  MOCK_METHOD(bool, Execute,
              (const executor::Request& request, executor::Response* response,
               std::string* error_msg),
              (override));
};

executor::Response finished(const std::string& payload,
                            int64_t elapsed_nsec = 1000000,
                            int64_t maxrss_kb = 1024) {
  limiter::Trailer trailer;
  trailer.usage.elapsed_nsec = elapsed_nsec;
  trailer.usage.maxrss_kb = maxrss_kb;
  executor::Response response;
  response.stderr_contents = payload + "\n" + limiter::FormatTrailer(trailer);
  return response;
}

std::string cases(const std::string& status) {
  return R"([{"name": "case", "status": ")" + status +
         R"(", "tags": [], "msg": "", "err": ""}])";
}

schema::TransitionTarget target(const std::string& next,
                                absl::optional<int64_t> grade) {
  schema::TransitionTarget t;
  t.next_state = next;
  t.grade = grade;
  return t;
}

class Evaluation : public ::testing::Test {
 protected:
  Evaluation() : tmp_(test_tmpdir + "/evaluation") {}

  void SetUp() override {
    const std::string root = tmp_.Path();
    FLAGS_environment_root = root + "/environments";
    FLAGS_runner_dir = root + "/runners";
    util::File::Write(root + "/environments/python3.9/environment_ready", "");
    util::File::Write(root + "/runners/test_runner", "#!/bin/sh\n");

    exercise_.directory = root + "/exercise";
    schema::Setting& setting = exercise_.setting;
    setting.exercise_name = "hello";
    setting.exercise_version = "2";
    setting.environment.name = "python3.9";
    setting.sandbox.kind = schema::SandboxKind::NSJAIL;
    setting.initial_state = "compile";
    AddState("compile", 2000000);
    AddState("test", 1000000);
    setting.transitions.AddRule("compile", {Status::PASS},
                                target("test", 5));
    setting.transitions.AddOtherwise("compile", target("$", 0));
    setting.transitions.AddRule("test", {Status::PASS}, target("$", 8));
    setting.transitions.AddRule("test", {Status::ERROR}, target("$", 2));
    setting.transitions.AddRule("test", {Status::PASS, Status::FATAL},
                                target("$", absl::nullopt));

    options_.submission_dir = root + "/submission";
    options_.submission_filename = "main.py";
    options_.evaluation_dir = root + "/evaluation";
    options_.submission_key = "submission-1";
    options_.evaluation_key = "evaluation-1";
    util::File::Write(options_.submission_dir + "/main.py", "x = 1\n");
  }

  void AddState(const std::string& name, int64_t time_limit_micros) {
    schema::StateSpec state;
    state.name = name;
    state.runner.name = "test_runner";
    state.runner.version = "1.0";
    state.time_limit_micros = time_limit_micros;
    state.test_script = name + ".py";
    exercise_.setting.states[name] = state;
    util::File::Write(exercise_.directory + "/" + state.test_script, "");
  }

  core::EvaluationResponse Run() {
    manager::Evaluation evaluation(exercise_, &executor_);
    return evaluation.Evaluate(options_);
  }

  util::TempDir tmp_;
  schema::ExerciseConcrete exercise_;
  manager::EvaluationOptions options_;
  MockExecutor executor_;

 private:
  gflags::FlagSaver saver_;
};

// NOLINTNEXTLINE
TEST_F(Evaluation, GradeOfLastTransition) {
  {
    InSequence sequence;
    EXPECT_CALL(executor_, Execute(_, _, _))
        .WillOnce(DoAll(SetArgPointee<1>(finished(cases("pass"), 100, 2048)),
                        Return(true)));
    EXPECT_CALL(executor_, Execute(_, _, _))
        .WillOnce(DoAll(SetArgPointee<1>(finished(cases("pass"), 50, 1024)),
                        Return(true)));
  }
  core::EvaluationResponse response = Run();
  EXPECT_THAT(response.state_history, ElementsAre("compile", "test"));
  EXPECT_EQ(response.overall_result.grade, absl::optional<int64_t>(8));
  EXPECT_THAT(response.overall_result.status_set, ElementsAre(Status::PASS));
  EXPECT_EQ(response.overall_result.time, 150);
  EXPECT_EQ(response.overall_result.memory, 3072);
  ASSERT_EQ(response.state_results.size(), 2);
  const core::StateResult& compile = response.state_results.at("compile");
  EXPECT_EQ(compile.runner.name, "test_runner");
  EXPECT_EQ(compile.runner.version, "1.0");
  EXPECT_EQ(compile.result.time, absl::optional<int64_t>(100));
  EXPECT_EQ(compile.cases.at(0).name, "case");
}

// NOLINTNEXTLINE
TEST_F(Evaluation, Metadata) {
  EXPECT_CALL(executor_, Execute(_, _, _))
      .WillOnce(
          DoAll(SetArgPointee<1>(finished(cases("fail"))), Return(true)));
  core::EvaluationResponse response = Run();
  EXPECT_EQ(response.metadata.submission_key, "submission-1");
  EXPECT_EQ(response.metadata.evaluation_key, "evaluation-1");
  EXPECT_EQ(response.metadata.exercise_name, "hello");
  EXPECT_EQ(response.metadata.exercise_version, "2");
  EXPECT_EQ(response.metadata.evaluator_name, "stagejudge");
  EXPECT_FALSE(response.metadata.evaluator_version.empty());
  EXPECT_THAT(response.metadata.evaluated_at, ::testing::EndsWith("Z"));
}

// NOLINTNEXTLINE
TEST_F(Evaluation, OtherwiseTransition) {
  EXPECT_CALL(executor_, Execute(_, _, _))
      .WillOnce(
          DoAll(SetArgPointee<1>(finished(cases("fail"))), Return(true)));
  core::EvaluationResponse response = Run();
  EXPECT_THAT(response.state_history, ElementsAre("compile"));
  EXPECT_EQ(response.overall_result.grade, absl::optional<int64_t>(0));
  EXPECT_THAT(response.overall_result.status_set, ElementsAre(Status::FAIL));
}

// NOLINTNEXTLINE
TEST_F(Evaluation, TimeLimitExceeded) {
  {
    InSequence sequence;
    EXPECT_CALL(executor_, Execute(_, _, _))
        .WillOnce(
            DoAll(SetArgPointee<1>(finished(cases("pass"))), Return(true)));
    executor::Response timed_out = finished("", 1000000000);
    timed_out.status_code = 124;
    EXPECT_CALL(executor_, Execute(_, _, _))
        .WillOnce(DoAll(SetArgPointee<1>(timed_out), Return(true)));
  }
  core::EvaluationResponse response = Run();
  EXPECT_THAT(response.state_history, ElementsAre("compile", "test"));
  EXPECT_EQ(response.overall_result.grade, absl::optional<int64_t>(2));
  const core::StateResult& test = response.state_results.at("test");
  ASSERT_EQ(test.cases.size(), 1);
  EXPECT_EQ(test.cases[0].name, core::kEntireStageCaseName);
  EXPECT_THAT(test.result.tag_set, ElementsAre(core::TimeLimitExceeded()));
  EXPECT_THAT(response.overall_result.status_set,
              ElementsAre(Status::ERROR, Status::PASS));
}

// NOLINTNEXTLINE
TEST_F(Evaluation, NullGradeOverwrites) {
  {
    InSequence sequence;
    EXPECT_CALL(executor_, Execute(_, _, _))
        .WillOnce(
            DoAll(SetArgPointee<1>(finished(cases("pass"))), Return(true)));
    EXPECT_CALL(executor_, Execute(_, _, _))
        .WillOnce(DoAll(
            SetArgPointee<1>(finished(
                R"([{"name": "a", "status": "pass", "tags": [], "msg": "",)"
                R"( "err": ""}, {"name": "b", "status": "fatal", "tags": [],)"
                R"( "msg": "", "err": ""}])")),
            Return(true)));
  }
  core::EvaluationResponse response = Run();
  EXPECT_THAT(response.state_history, ElementsAre("compile", "test"));
  EXPECT_FALSE(response.overall_result.grade);
}

// NOLINTNEXTLINE
TEST_F(Evaluation, CrashHalts) {
  executor::Response crashed;
  crashed.status_code = 1;
  crashed.stderr_contents = "Segmentation fault";
  EXPECT_CALL(executor_, Execute(_, _, _))
      .WillOnce(DoAll(SetArgPointee<1>(crashed), Return(true)));
  core::EvaluationResponse response = Run();
  EXPECT_THAT(response.state_history, ElementsAre("compile"));
  EXPECT_FALSE(response.overall_result.grade);
  EXPECT_THAT(response.overall_result.status_set, ElementsAre(Status::FATAL));
  EXPECT_THAT(response.overall_result.tag_set,
              ElementsAre(core::UnexpectedAbortion()));
}

// NOLINTNEXTLINE
TEST_F(Evaluation, MissingRequiredFileHalts) {
  exercise_.setting.states["test"].required_files = {"data/missing.txt"};
  EXPECT_CALL(executor_, Execute(_, _, _))
      .WillOnce(
          DoAll(SetArgPointee<1>(finished(cases("pass"))), Return(true)));
  core::EvaluationResponse response = Run();
  EXPECT_THAT(response.state_history, ElementsAre("compile", "test"));
  EXPECT_EQ(response.overall_result.grade, absl::optional<int64_t>(5));
  const core::StateResult& test = response.state_results.at("test");
  ASSERT_EQ(test.cases.size(), 1);
  EXPECT_EQ(test.cases[0].name, core::kSetupCaseName);
  EXPECT_EQ(test.cases[0].status, Status::FATAL);
  EXPECT_THAT(test.cases[0].tags, ElementsAre(core::EvaluationSystemError()));
  EXPECT_THAT(test.cases[0].reviewer_message, HasSubstr("data/missing.txt"));
  EXPECT_FALSE(test.result.time);
  EXPECT_FALSE(util::File::Exists(options_.evaluation_dir + "/test"));
}

// NOLINTNEXTLINE
TEST_F(Evaluation, NoMatchingTransition) {
  {
    InSequence sequence;
    EXPECT_CALL(executor_, Execute(_, _, _))
        .WillOnce(
            DoAll(SetArgPointee<1>(finished(cases("pass"))), Return(true)));
    EXPECT_CALL(executor_, Execute(_, _, _))
        .WillOnce(
            DoAll(SetArgPointee<1>(finished(cases("fail"))), Return(true)));
  }
  core::EvaluationResponse response = Run();
  EXPECT_THAT(response.state_history, ElementsAre("compile", "test"));
  EXPECT_EQ(response.overall_result.grade, absl::optional<int64_t>(5));
  const core::StateResult& test = response.state_results.at("test");
  ASSERT_EQ(test.cases.size(), 1);
  EXPECT_EQ(test.cases[0].status, Status::FATAL);
  EXPECT_THAT(test.cases[0].tags, ElementsAre(core::EvaluationSystemError()));
  EXPECT_THAT(test.result.status_set, ElementsAre(Status::FATAL));
}

// NOLINTNEXTLINE
TEST_F(Evaluation, ExecuteFailure) {
  EXPECT_CALL(executor_, Execute(_, _, _))
      .WillOnce(DoAll(SetArgPointee<2>(std::string("fork: out of memory")),
                      Return(false)));
  core::EvaluationResponse response = Run();
  EXPECT_THAT(response.state_history, ElementsAre("compile"));
  const core::StateResult& compile = response.state_results.at("compile");
  ASSERT_EQ(compile.cases.size(), 1);
  EXPECT_EQ(compile.cases[0].status, Status::FATAL);
  EXPECT_THAT(compile.cases[0].tags, ElementsAre(core::BackendSystemError()));
  EXPECT_THAT(compile.cases[0].system_message, HasSubstr("out of memory"));
}

// NOLINTNEXTLINE
TEST_F(Evaluation, MalformedPayloadUsesTransitions) {
  EXPECT_CALL(executor_, Execute(_, _, _))
      .WillOnce(DoAll(SetArgPointee<1>(finished("garbage")), Return(true)));
  core::EvaluationResponse response = Run();
  EXPECT_THAT(response.state_history, ElementsAre("compile"));
  EXPECT_EQ(response.overall_result.grade, absl::optional<int64_t>(0));
  EXPECT_THAT(response.overall_result.tag_set,
              ElementsAre(core::BackendSystemError()));
}

// NOLINTNEXTLINE
TEST_F(Evaluation, StagesAndComposesRequest) {
  executor::Request request;
  EXPECT_CALL(executor_, Execute(_, _, _))
      .WillOnce(DoAll(SaveArg<0>(&request),
                      SetArgPointee<1>(finished(cases("fail"))),
                      Return(true)));
  Run();
  EXPECT_EQ(request.wall_limit_millis,
            (2 + FLAGS_wall_clock_margin_seconds) * 1000);
  EXPECT_EQ(request.working_directory, options_.evaluation_dir);
  ASSERT_EQ(request.args.size(), 3);
  EXPECT_EQ(request.args[0], "bash");
  EXPECT_THAT(request.args[2], HasSubstr("--time_limit=2"));
  EXPECT_THAT(request.args[2], HasSubstr(" result__compile "));
  EXPECT_EQ(util::File::Read(options_.evaluation_dir + "/compile/main.py"),
            "x = 1\n");
  EXPECT_TRUE(util::File::IsRegularFile(options_.evaluation_dir +
                                        "/compile/compile.py"));
}

// NOLINTNEXTLINE
TEST_F(Evaluation, PublishResponse) {
  EXPECT_CALL(executor_, Execute(_, _, _))
      .WillOnce(DoAll(SetArgPointee<1>(finished(cases("fail"))), Return(true)));
  core::EvaluationResponse response = Run();
  const std::string path = tmp_.Path() + "/evaluation/result.json";
  std::ostringstream out;
  manager::PublishResponse(response, path, &out);

  nlohmann::json written = nlohmann::json::parse(util::File::Read(path));
  EXPECT_EQ(written["overall_result"]["grade"], 0);
  EXPECT_EQ(written["metadata"]["submission_key"], "submission-1");
  const std::string printed = out.str();
  ASSERT_FALSE(printed.empty());
  EXPECT_EQ(printed.back(), '\n');
  EXPECT_EQ(printed.find('\n'), printed.size() - 1);
  EXPECT_EQ(nlohmann::json::parse(printed), written);
}

}  // namespace
