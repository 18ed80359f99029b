#pragma once

#include "stagehand/core/error.hpp"
#include "stagehand/graph/dependency_graph.hpp"
#include "stagehand/scheduler/task.hpp"

#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stagehand {

// Owns every task definition and the edges between them. Append-only; once
// sealed (execution has begun) all mutation fails with Error::ReadOnly.
class TaskRegistry {
public:
  [[nodiscard]] auto add_task(TaskDefinition definition) -> Result<void>;

  /// `task` now waits for each of `dependencies`. Every name is checked
  /// before any edge is inserted, so a failed call leaves the graph as it
  /// was.
  [[nodiscard]] auto add_dependencies(std::string_view task,
                                      std::span<const std::string> dependencies)
      -> Result<void>;
  [[nodiscard]] auto
  add_dependencies(std::string_view task,
                   std::initializer_list<std::string_view> dependencies)
      -> Result<void>;

  auto seal() noexcept -> void { sealed_ = true; }
  [[nodiscard]] auto is_sealed() const noexcept -> bool { return sealed_; }

  [[nodiscard]] auto graph() const noexcept -> const DependencyGraph & {
    return graph_;
  }
  [[nodiscard]] auto definition(NodeIndex idx) -> TaskDefinition & {
    return definitions_.at(idx);
  }
  [[nodiscard]] auto definition(NodeIndex idx) const -> const TaskDefinition & {
    return definitions_.at(idx);
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return definitions_.size();
  }

private:
  [[nodiscard]] auto link(std::string_view task,
                          std::span<const std::string_view> dependencies)
      -> Result<void>;

  DependencyGraph graph_;
  std::vector<TaskDefinition> definitions_;
  bool sealed_{false};
};

} // namespace stagehand
