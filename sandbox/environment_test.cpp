#include "sandbox/environment.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

const std::string test_tmpdir = "/tmp/stagejudge_testdir";

void makeEnvironment(const std::string& root, const std::string& name,
                     bool ready = true) {
  util::File::MakeDirs(root + "/" + name + "/venv/bin");
  if (ready) util::File::Write(root + "/" + name + "/environment_ready", "");
}

// NOLINTNEXTLINE
TEST(Environment, ListEnvironments) {
  util::TempDir tmp(test_tmpdir + "/environment");
  makeEnvironment(tmp.Path(), "python3.9");
  makeEnvironment(tmp.Path(), "cpp17");
  makeEnvironment(tmp.Path(), "installing", false);
  makeEnvironment(tmp.Path(), ".hidden");
  makeEnvironment(tmp.Path(), "_template");
  makeEnvironment(tmp.Path(), "-broken");
  util::File::Write(tmp.Path() + "/README", "");
  EXPECT_THAT(sandbox::ListEnvironments(tmp.Path()),
              ElementsAre("cpp17", "python3.9"));
}

// NOLINTNEXTLINE
TEST(Environment, MissingRoot) {
  util::TempDir tmp(test_tmpdir + "/environment");
  EXPECT_THAT(sandbox::ListEnvironments(tmp.Path() + "/missing"), IsEmpty());
}

// NOLINTNEXTLINE
TEST(Environment, WrapInEnvironment) {
  EXPECT_EQ(sandbox::ActivationScript("/opt/envs", "python3.9"),
            "/opt/envs/python3.9/venv/bin/activate");
  EXPECT_THAT(
      sandbox::WrapInEnvironment("/opt/envs", "python3.9",
                                 {"/opt/runners/test_runner", "it's", "-l"}),
      ElementsAre("bash", "-c",
                  "source /opt/envs/python3.9/venv/bin/activate && "
                  "/opt/runners/test_runner 'it'\"'\"'s' -l"));
}

}  // namespace
