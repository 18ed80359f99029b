#include "stagehand/output/report_builder.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <ranges>

namespace stagehand {

namespace {

[[nodiscard]] auto join_names(const std::vector<TaskId> &names)
    -> std::string {
  std::string out;
  for (const auto &name : names) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name.value();
  }
  return out;
}

[[nodiscard]] auto plural_tasks(std::size_t n) -> std::string {
  return std::format("{} {}", n, n == 1 ? "task" : "tasks");
}

// Groups that need attention go to the diagnostic streams.
[[nodiscard]] auto summary_stream(TaskStatus status) -> TerminalStream {
  switch (status) {
  case TaskStatus::Failure:
    return TerminalStream::Error;
  case TaskStatus::SuccessWithWarning:
    return TerminalStream::Warning;
  case TaskStatus::Success:
  case TaskStatus::Blocked:
    break;
  }
  return TerminalStream::Output;
}

} // namespace

auto format_elapsed(std::chrono::milliseconds elapsed) -> std::string {
  return std::format("{:.2f} seconds",
                     static_cast<double>(elapsed.count()) / 1000.0);
}

auto ReportBuilder::record(const TaskOutcome &outcome) -> void {
  ReportEntry entry{.name = outcome.name,
                    .status = outcome.status,
                    .elapsed = outcome.elapsed,
                    .had_empty_script = outcome.had_empty_script,
                    .blocked_by = outcome.blocked_by,
                    .block = {}};
  if (outcome.status == TaskStatus::Failure ||
      outcome.status == TaskStatus::SuccessWithWarning) {
    entry.block = render_report_block(outcome);
  }
  entries_.push_back(std::move(entry));
}

auto ReportBuilder::names_with(TaskStatus status) const
    -> std::vector<TaskId> {
  std::vector<TaskId> out;
  for (const auto &entry : entries_) {
    if (entry.status == status) {
      out.push_back(entry.name);
    }
  }
  return out;
}

auto ReportBuilder::print_summary(OutputCollator &collator,
                                  std::chrono::milliseconds elapsed) const
    -> void {
  static constexpr std::array kGroups = {
      TaskStatus::Success, TaskStatus::SuccessWithWarning, TaskStatus::Blocked,
      TaskStatus::Failure};

  for (auto status : kGroups) {
    if (status == TaskStatus::Success && options_.quiet_mode) {
      continue;
    }
    auto members = entries_ | std::views::filter([status](const auto &e) {
                     return e.status == status;
                   });
    const auto count =
        static_cast<std::size_t>(std::ranges::distance(members));
    if (count == 0) {
      continue;
    }

    const auto stream = summary_stream(status);
    collator.write_line(
        make_banner(std::format("{}: {}", status_label(status),
                                plural_tasks(count))),
        status_color(status), stream);
    for (const auto &entry : members) {
      if (status == TaskStatus::Blocked && entry.blocked_by) {
        collator.write_line(
            std::format("{} (blocked by {})", entry.name, *entry.blocked_by),
            TextColor::Default, stream);
      } else if (entry.had_empty_script) {
        collator.write_line(std::format("{} (empty script)", entry.name),
                            TextColor::Default, stream);
      } else {
        collator.write_line(std::format("{} ({})", entry.name,
                                        format_elapsed(entry.elapsed)),
                            TextColor::Default, stream);
      }
    }
  }

  if (!options_.quiet_mode) {
    collator.write_line(std::format("Finished {} in {}",
                                    plural_tasks(entries_.size()),
                                    format_elapsed(elapsed)));
  }
}

auto ReportBuilder::summary(std::chrono::milliseconds elapsed) const
    -> RunSummary {
  return RunSummary{
      .succeeded = names_with(TaskStatus::Success),
      .succeeded_with_warnings = names_with(TaskStatus::SuccessWithWarning),
      .failed = names_with(TaskStatus::Failure),
      .blocked = names_with(TaskStatus::Blocked),
      .elapsed = elapsed,
  };
}

auto ReportBuilder::compose_failure_message() const -> std::string {
  const bool allow = options_.allow_warnings_in_successful_build;
  std::string out;

  if (auto failed = names_with(TaskStatus::Failure); !failed.empty()) {
    out += std::format("Task(s) failed: {}\n", join_names(failed));
  }
  if (auto warned = names_with(TaskStatus::SuccessWithWarning);
      !allow && !warned.empty()) {
    out += std::format("Task(s) succeeded with warnings: {}\n",
                       join_names(warned));
  }
  if (auto blocked = names_with(TaskStatus::Blocked); !blocked.empty()) {
    out += std::format("Task(s) blocked: {}\n", join_names(blocked));
  }

  for (const auto &entry : entries_) {
    if (!counts_as_failure(entry.status, allow)) {
      continue;
    }
    out += std::format("\n{}\n", entry.block);
  }

  while (!out.empty() && out.back() == '\n') {
    out.pop_back();
  }
  return out;
}

auto ReportBuilder::verdict(std::chrono::milliseconds elapsed) const
    -> Result<RunSummary> {
  const bool allow = options_.allow_warnings_in_successful_build;
  const bool failed = std::ranges::any_of(entries_, [allow](const auto &e) {
    return counts_as_failure(e.status, allow);
  });
  if (failed) {
    return fail(Error::TasksFailed, compose_failure_message());
  }
  return ok(summary(elapsed));
}

} // namespace stagehand
