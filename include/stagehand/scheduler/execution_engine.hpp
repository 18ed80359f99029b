#pragma once

#include "stagehand/core/coroutine.hpp"
#include "stagehand/core/error.hpp"
#include "stagehand/scheduler/parallelism.hpp"
#include "stagehand/scheduler/task.hpp"
#include "stagehand/scheduler/task_registry.hpp"
#include "stagehand/scheduler/task_writer.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stagehand {

/// What the engine knows about a task once it reaches a terminal status.
/// Blocked tasks carry no output and name the failed ancestor that stopped
/// them.
struct TaskOutcome {
  TaskId name;
  TaskStatus status{TaskStatus::Failure};
  std::chrono::milliseconds elapsed{0};
  std::string std_output;
  std::string std_error;
  std::optional<TaskId> blocked_by;
  bool had_empty_script{false};
};

/// Invoked on the scheduling loop, once per task, in completion order.
using OutcomeHandler = std::move_only_function<void(const TaskOutcome &)>;

struct EngineStats {
  std::size_t dispatched{0};
  std::size_t peak_running{0};
};

// Walks a sealed, acyclic registry in dependency order. A single loop owns all
// scheduling state: it starts ready tasks up to the parallelism limit, then
// suspends on a completion channel that the task coroutines post into.
class ExecutionEngine {
public:
  ExecutionEngine(TaskRegistry &registry, Parallelism parallelism,
                  bool changed_projects_only, OutcomeHandler on_outcome);
  ~ExecutionEngine();

  ExecutionEngine(const ExecutionEngine &) = delete;
  ExecutionEngine &operator=(const ExecutionEngine &) = delete;

  /// Completes once every task is terminal. Fails only if the completion
  /// channel breaks; task failures are outcomes, not errors.
  [[nodiscard]] auto run() -> task<Result<EngineStats>>;

  [[nodiscard]] auto state(NodeIndex idx) const -> TaskState {
    return states_.at(idx);
  }

private:
  struct Completion;
  class ReadyQueue;

  auto dispatch(NodeIndex idx) -> void;
  auto on_completed(Completion completion) -> void;
  auto finish(NodeIndex idx, TaskStatus status,
              std::optional<NodeIndex> blocked_by) -> void;
  auto block_dependents(NodeIndex failed) -> void;

  TaskRegistry &registry_;
  Parallelism parallelism_;
  bool changed_projects_only_;
  OutcomeHandler on_outcome_;

  std::vector<TaskState> states_;
  std::vector<std::size_t> pending_deps_;
  std::vector<std::unique_ptr<TaskWriter>> writers_;
  std::vector<std::chrono::steady_clock::time_point> started_at_;
  std::vector<std::chrono::milliseconds> elapsed_;
  std::unique_ptr<ReadyQueue> ready_;
  std::size_t running_{0};
  std::size_t finished_{0};
  EngineStats stats_;

  struct ChannelHolder;
  std::shared_ptr<ChannelHolder> channel_;
};

} // namespace stagehand
