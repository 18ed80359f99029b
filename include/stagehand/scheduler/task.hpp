#pragma once

#include "stagehand/core/coroutine.hpp"
#include "stagehand/util/enum.hpp"
#include "stagehand/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <functional>

namespace stagehand {

/// Terminal outcome of one task in one run.
enum class TaskStatus : std::uint8_t {
  Success,
  SuccessWithWarning,
  Failure,
  Blocked,
};
BOOST_DESCRIBE_ENUM(TaskStatus, Success, SuccessWithWarning, Failure, Blocked)
STAGEHAND_DEFINE_ENUM_SERDE(TaskStatus)

enum class TaskState : std::uint8_t {
  Pending,
  Ready,
  Running,
  Success,
  SuccessWithWarning,
  Failure,
  Blocked,
};
BOOST_DESCRIBE_ENUM(TaskState, Pending, Ready, Running, Success,
                    SuccessWithWarning, Failure, Blocked)
STAGEHAND_DEFINE_ENUM_SERDE(TaskState)

[[nodiscard]] constexpr bool is_terminal(TaskState s) noexcept {
  return s == TaskState::Success || s == TaskState::SuccessWithWarning ||
         s == TaskState::Failure || s == TaskState::Blocked;
}

/// Dependents may start once a dependency ends in one of these.
[[nodiscard]] constexpr bool unblocks_dependents(TaskStatus s) noexcept {
  return s == TaskStatus::Success || s == TaskStatus::SuccessWithWarning;
}

[[nodiscard]] constexpr auto to_state(TaskStatus s) noexcept -> TaskState {
  switch (s) {
  case TaskStatus::Success:
    return TaskState::Success;
  case TaskStatus::SuccessWithWarning:
    return TaskState::SuccessWithWarning;
  case TaskStatus::Failure:
    return TaskState::Failure;
  case TaskStatus::Blocked:
    return TaskState::Blocked;
  }
  return TaskState::Failure;
}

// Flags forwarded to a running task. The scheduler never reads them.
struct TaskContext {
  TaskId name;
  bool is_incremental_build_allowed{false};
  bool changed_projects_only{false};
};

class TaskWriter;

using TaskFunction = std::move_only_function<task<TaskStatus>(TaskWriter &)>;

struct TaskDefinition {
  TaskId name;
  TaskFunction execute;
  bool is_incremental_build_allowed{false};
  /// Display only: marks the task in the run summary.
  bool had_empty_script{false};
};

} // namespace stagehand
