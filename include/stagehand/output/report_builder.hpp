#pragma once

#include "stagehand/core/error.hpp"
#include "stagehand/output/collator.hpp"
#include "stagehand/scheduler/execution_engine.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace stagehand {

/// Final tally of a run that did not fail.
struct RunSummary {
  std::vector<TaskId> succeeded;
  std::vector<TaskId> succeeded_with_warnings;
  std::vector<TaskId> failed;
  std::vector<TaskId> blocked;
  std::chrono::milliseconds elapsed{0};

  [[nodiscard]] auto total() const noexcept -> std::size_t {
    return succeeded.size() + succeeded_with_warnings.size() + failed.size() +
           blocked.size();
  }
};

struct ReportEntry {
  TaskId name;
  TaskStatus status{TaskStatus::Failure};
  std::chrono::milliseconds elapsed{0};
  bool had_empty_script{false};
  std::optional<TaskId> blocked_by;
  /// Rendered report, kept for failures and warnings only.
  std::string block;
};

// Accumulates outcomes in completion order and turns them into the run
// verdict. Only touched from the scheduling loop.
class ReportBuilder {
public:
  explicit ReportBuilder(CollatorOptions options) : options_(options) {}

  auto record(const TaskOutcome &outcome) -> void;

  /// Status groups with per-task timings. Quiet mode prints only the groups
  /// that need attention; failures go to the error stream and warnings to
  /// the warning stream.
  auto print_summary(OutputCollator &collator,
                     std::chrono::milliseconds elapsed) const -> void;

  [[nodiscard]] auto summary(std::chrono::milliseconds elapsed) const
      -> RunSummary;

  /// Error::TasksFailed carrying compose_failure_message() when any task
  /// failed, or warned while warnings are not allowed.
  [[nodiscard]] auto verdict(std::chrono::milliseconds elapsed) const
      -> Result<RunSummary>;

  [[nodiscard]] auto compose_failure_message() const -> std::string;

private:
  [[nodiscard]] auto names_with(TaskStatus status) const -> std::vector<TaskId>;

  CollatorOptions options_;
  std::vector<ReportEntry> entries_;
};

[[nodiscard]] auto format_elapsed(std::chrono::milliseconds elapsed)
    -> std::string;

} // namespace stagehand
