#include "stagehand/executor/shell_task.hpp"
#include "stagehand/scheduler/task_writer.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <filesystem>
#include <string>

using namespace stagehand;
using namespace std::chrono_literals;

class ShellTaskTest : public ::testing::Test {
protected:
  auto run(ShellTaskConfig config) -> TaskStatus {
    auto fn = make_shell_task(std::move(config));
    return test::run_coro(fn(writer_), 20s);
  }

  TaskWriter writer_{TaskContext{.name = TaskId{"shell"}}};
};

TEST_F(ShellTaskTest, CapturesStandardOutput) {
  EXPECT_EQ(run({.command = "echo hello"}), TaskStatus::Success);
  EXPECT_EQ(writer_.std_output(), "hello\n");
  EXPECT_TRUE(writer_.std_error().empty());
}

TEST_F(ShellTaskTest, NonBlankStandardErrorIsAWarning) {
  EXPECT_EQ(run({.command = "echo careful >&2"}),
            TaskStatus::SuccessWithWarning);
  EXPECT_EQ(writer_.std_error(), "careful\n");
}

TEST_F(ShellTaskTest, WhitespaceOnlyStandardErrorIsIgnored) {
  EXPECT_EQ(run({.command = "printf '  \\n' >&2"}), TaskStatus::Success);
}

TEST_F(ShellTaskTest, NonZeroExitFails) {
  EXPECT_EQ(run({.command = "echo partial; exit 3"}), TaskStatus::Failure);
  EXPECT_EQ(writer_.std_output(), "partial\n");
}

TEST_F(ShellTaskTest, EmptyCommandSucceedsWithoutSpawning) {
  EXPECT_EQ(run({.command = ""}), TaskStatus::Success);
  EXPECT_TRUE(writer_.std_output().empty());
}

TEST_F(ShellTaskTest, EnvironmentOverridesAreVisible) {
  EXPECT_EQ(run({.command = "echo \"$STAGEHAND_GREETING\"",
                 .env = {{"STAGEHAND_GREETING", "hi there"}}}),
            TaskStatus::Success);
  EXPECT_EQ(writer_.std_output(), "hi there\n");
}

TEST_F(ShellTaskTest, RunsInWorkingDirectory) {
  auto dir = test::make_temp_dir();
  ASSERT_FALSE(dir.empty());
  EXPECT_EQ(run({.command = "pwd", .working_dir = dir}), TaskStatus::Success);
  auto printed = writer_.std_output();
  EXPECT_EQ(std::filesystem::canonical(printed.substr(0, printed.size() - 1)),
            std::filesystem::canonical(dir));
  std::filesystem::remove_all(dir);
}

TEST_F(ShellTaskTest, TimeoutKillsTheCommand) {
  auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(run({.command = "sleep 30", .timeout = 1s}), TaskStatus::Failure);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 15s);
  EXPECT_NE(writer_.std_error().find("timed out after 1s"), std::string::npos);
}

TEST_F(ShellTaskTest, BackgroundChildDoesNotHoldTheTaskOpen) {
  auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(run({.command = "echo started; sleep 30 &", .timeout = 1s}),
            TaskStatus::Success);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  EXPECT_EQ(writer_.std_output(), "started\n");
}

TEST_F(ShellTaskTest, MissingWorkingDirectoryFailsToStart) {
  EXPECT_EQ(run({.command = "echo unreachable",
                 .working_dir = "/nonexistent/stagehand/dir"}),
            TaskStatus::Failure);
  EXPECT_TRUE(writer_.std_output().empty());
  EXPECT_TRUE(writer_.std_error().starts_with("Failed to start command"));
}

TEST(ShellTaskValidationTest, RejectsBadEnvironmentNames) {
  auto r = validate_shell_task({.command = "true", .env = {{"1BAD", "x"}}});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidArgument);
  EXPECT_TRUE(
      validate_shell_task({.command = "true", .env = {{"GOOD_1", "x"}}})
          .has_value());
}

TEST(ShellTaskValidationTest, RejectsNonPositiveTimeout) {
  auto r = validate_shell_task({.command = "true", .timeout = 0s});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::InvalidArgument);
}
