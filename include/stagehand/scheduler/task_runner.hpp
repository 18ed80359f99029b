#pragma once

#include "stagehand/core/coroutine.hpp"
#include "stagehand/core/error.hpp"
#include "stagehand/output/report_builder.hpp"
#include "stagehand/output/terminal.hpp"
#include "stagehand/scheduler/parallelism.hpp"
#include "stagehand/scheduler/task.hpp"

#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace stagehand {

struct TaskRunnerOptions {
  /// Suppress output of tasks that succeed cleanly.
  bool quiet_mode{false};
  ParallelismSetting parallelism{std::string{"max"}};
  /// Forwarded to every task through TaskWriter::context().
  bool changed_projects_only{false};
  /// Null means a ConsoleTerminal.
  std::shared_ptr<ITerminal> terminal;
  bool allow_warnings_in_successful_build{false};
};

// Registers tasks and their dependencies, then runs them once.
//
//   auto runner = TaskRunner::create({.parallelism = 4});
//   runner->add_task({.name = TaskId{"build"}, .execute = ...});
//   auto run = runner->execute();          // cycle check happens here
//   auto verdict = co_await std::move(*run);
//
// The runner must outlive the coroutine returned by execute().
class TaskRunner {
public:
  /// Fails with Error::InvalidParallelism when the setting cannot be parsed.
  [[nodiscard]] static auto create(TaskRunnerOptions options)
      -> Result<TaskRunner>;

  ~TaskRunner();
  TaskRunner(TaskRunner &&) noexcept;
  TaskRunner &operator=(TaskRunner &&) noexcept;

  [[nodiscard]] auto add_task(TaskDefinition definition) -> Result<void>;
  [[nodiscard]] auto add_dependencies(std::string_view task,
                                      std::span<const std::string> dependencies)
      -> Result<void>;
  [[nodiscard]] auto
  add_dependencies(std::string_view task,
                   std::initializer_list<std::string_view> dependencies)
      -> Result<void>;

  /// The outer Result fails synchronously (cycle, second call) before any
  /// task starts; the inner one is the verdict of the finished run.
  [[nodiscard]] auto execute() -> Result<task<Result<RunSummary>>>;

  [[nodiscard]] auto parallelism() const noexcept -> Parallelism;
  [[nodiscard]] auto task_count() const noexcept -> std::size_t;

private:
  struct Impl;
  explicit TaskRunner(std::unique_ptr<Impl> impl);

  std::unique_ptr<Impl> impl_;
};

} // namespace stagehand
