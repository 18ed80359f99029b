#include "stagehand/scheduler/task_registry.hpp"

#include "stagehand/util/log.hpp"

#include <format>

namespace stagehand {

auto TaskRegistry::add_task(TaskDefinition definition) -> Result<void> {
  if (sealed_) {
    return fail(Error::ReadOnly,
                std::format("Cannot add task \"{}\" after execution started",
                            definition.name));
  }
  if (!is_valid_id_text(definition.name.value())) {
    return fail(Error::InvalidArgument, "Task name must be non-empty");
  }
  if (!definition.execute) {
    return fail(Error::InvalidArgument,
                std::format("Task \"{}\" has no operation", definition.name));
  }

  auto idx = graph_.add_node(definition.name);
  if (!idx) {
    return fail(idx.error());
  }
  definitions_.emplace_back(std::move(definition));
  log::trace("registered task '{}' at index {}", definitions_.back().name,
             *idx);
  return ok();
}

auto TaskRegistry::add_dependencies(std::string_view task,
                                    std::span<const std::string> dependencies)
    -> Result<void> {
  std::vector<std::string_view> names(dependencies.begin(), dependencies.end());
  return link(task, names);
}

auto TaskRegistry::add_dependencies(
    std::string_view task, std::initializer_list<std::string_view> dependencies)
    -> Result<void> {
  return link(task, std::span<const std::string_view>(dependencies.begin(),
                                                      dependencies.size()));
}

auto TaskRegistry::link(std::string_view task,
                        std::span<const std::string_view> dependencies)
    -> Result<void> {
  if (sealed_) {
    return fail(Error::ReadOnly,
                std::format("Cannot add dependencies to \"{}\" after execution "
                            "started",
                            task));
  }

  const NodeIndex dependent = graph_.index_of(task);
  if (dependent == kInvalidNode) {
    return fail(Error::UnknownTask,
                std::format("The task \"{}\" has not been registered", task));
  }

  std::vector<NodeIndex> resolved;
  resolved.reserve(dependencies.size());
  for (auto name : dependencies) {
    const NodeIndex dep = graph_.index_of(name);
    if (dep == kInvalidNode) {
      return fail(Error::UnknownDependency,
                  std::format("The task \"{}\" depends on \"{}\", which has "
                              "not been registered",
                              task, name));
    }
    resolved.push_back(dep);
  }

  for (NodeIndex dep : resolved) {
    if (auto r = graph_.add_edge(dep, dependent); !r) {
      return fail(r.error());
    }
  }
  return ok();
}

} // namespace stagehand
