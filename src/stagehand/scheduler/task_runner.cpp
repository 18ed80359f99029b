#include "stagehand/scheduler/task_runner.hpp"

#include "stagehand/graph/cycle_detector.hpp"
#include "stagehand/output/collator.hpp"
#include "stagehand/scheduler/execution_engine.hpp"
#include "stagehand/scheduler/task_registry.hpp"
#include "stagehand/util/log.hpp"

#include <chrono>
#include <format>

namespace stagehand {

struct TaskRunner::Impl {
  Impl(TaskRunnerOptions opts, Parallelism limit)
      : options(std::move(opts)), parallelism(limit),
        collator(options.terminal,
                 CollatorOptions{.quiet_mode = options.quiet_mode,
                                 .allow_warnings_in_successful_build =
                                     options.allow_warnings_in_successful_build}),
        report(collator.options()) {}

  auto run() -> task<Result<RunSummary>>;

  TaskRunnerOptions options;
  Parallelism parallelism;
  TaskRegistry registry;
  OutputCollator collator;
  ReportBuilder report;
};

auto TaskRunner::Impl::run() -> task<Result<RunSummary>> {
  const auto start = std::chrono::steady_clock::now();
  if (!options.quiet_mode) {
    collator.write_line(std::format("Executing a total of {} tasks "
                                    "(parallelism: {})",
                                    registry.size(), parallelism.to_string()),
                        TextColor::Cyan);
  }

  ExecutionEngine engine(registry, parallelism, options.changed_projects_only,
                         [this](const TaskOutcome &outcome) {
                           collator.collate(outcome);
                           report.record(outcome);
                         });
  auto stats = co_await engine.run();
  if (!stats) {
    co_return fail(stats.error());
  }
  log::debug("run dispatched {} tasks, peak concurrency {}", stats->dispatched,
             stats->peak_running);

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  report.print_summary(collator, elapsed);
  co_return report.verdict(elapsed);
}

TaskRunner::TaskRunner(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}
TaskRunner::~TaskRunner() = default;
TaskRunner::TaskRunner(TaskRunner &&) noexcept = default;
TaskRunner &TaskRunner::operator=(TaskRunner &&) noexcept = default;

auto TaskRunner::create(TaskRunnerOptions options) -> Result<TaskRunner> {
  auto parallelism = Parallelism::from_setting(options.parallelism);
  if (!parallelism) {
    return fail(parallelism.error());
  }
  return TaskRunner{std::make_unique<Impl>(std::move(options), *parallelism)};
}

auto TaskRunner::add_task(TaskDefinition definition) -> Result<void> {
  return impl_->registry.add_task(std::move(definition));
}

auto TaskRunner::add_dependencies(std::string_view task,
                                  std::span<const std::string> dependencies)
    -> Result<void> {
  return impl_->registry.add_dependencies(task, dependencies);
}

auto TaskRunner::add_dependencies(
    std::string_view task, std::initializer_list<std::string_view> dependencies)
    -> Result<void> {
  return impl_->registry.add_dependencies(task, dependencies);
}

auto TaskRunner::execute() -> Result<task<Result<RunSummary>>> {
  if (impl_->registry.is_sealed()) {
    return fail(Error::InvalidState, "execute() may only be called once");
  }
  if (auto acyclic = check_acyclic(impl_->registry.graph()); !acyclic) {
    log::error("{}", acyclic.error().message());
    return fail(acyclic.error());
  }

  impl_->registry.seal();
  return impl_->run();
}

auto TaskRunner::parallelism() const noexcept -> Parallelism {
  return impl_->parallelism;
}

auto TaskRunner::task_count() const noexcept -> std::size_t {
  return impl_->registry.size();
}

} // namespace stagehand
