#include "stagehand/graph/dependency_graph.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

namespace stagehand {

auto DependencyGraph::add_node(TaskId task_id) -> Result<NodeIndex> {
  if (key_to_idx_.contains(task_id)) {
    return fail(Error::DuplicateTask,
                std::format("A task with the name \"{}\" already exists",
                            task_id));
  }
  if (nodes_.size() >= kInvalidNode) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }

  auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.emplace_back(task_id);
  key_to_idx_.emplace(std::move(task_id), idx);
  return ok(idx);
}

auto DependencyGraph::add_edge(NodeIndex dependency, NodeIndex dependent)
    -> Result<void> {
  if (dependency >= nodes_.size() || dependent >= nodes_.size()) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }
  if (has_edge(dependency, dependent)) {
    return ok();
  }

  nodes_[dependent].deps.emplace_back(dependency);
  nodes_[dependency].dependents.emplace_back(dependent);
  ++edge_count_;
  return ok();
}

auto DependencyGraph::has_edge(NodeIndex dependency,
                               NodeIndex dependent) const noexcept -> bool {
  if (dependency >= nodes_.size() || dependent >= nodes_.size()) [[unlikely]]
    return false;
  const auto &dependents = nodes_[dependency].dependents;
  return std::ranges::find(dependents, dependent) != dependents.end();
}

auto DependencyGraph::has_node(const TaskId &task_id) const -> bool {
  return key_to_idx_.contains(task_id);
}

auto DependencyGraph::index_of(std::string_view name) const -> NodeIndex {
  auto it = key_to_idx_.find(TaskId{name});
  return it != key_to_idx_.end() ? it->second : kInvalidNode;
}

auto DependencyGraph::key_of(NodeIndex idx) const -> const TaskId & {
  static const TaskId kEmpty;
  if (idx >= keys_.size()) {
    return kEmpty;
  }
  return keys_[idx];
}

auto DependencyGraph::deps_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto DependencyGraph::dependents_view(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto DependencyGraph::topological_order() const -> std::vector<NodeIndex> {
  std::vector<std::size_t> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto &node : nodes_) {
    in_degree.emplace_back(node.deps.size());
  }

  std::vector<NodeIndex> order;
  order.reserve(nodes_.size());
  for (auto [i, deg] : std::views::enumerate(in_degree)) {
    if (deg == 0) {
      order.emplace_back(static_cast<NodeIndex>(i));
    }
  }

  std::size_t head = 0;
  while (head < order.size()) {
    NodeIndex current = order[head++];
    for (NodeIndex dependent : nodes_[current].dependents) {
      if (--in_degree[dependent] == 0) {
        order.emplace_back(dependent);
      }
    }
  }
  return order;
}

auto DependencyGraph::critical_path_lengths() const
    -> std::vector<std::uint32_t> {
  std::vector<std::uint32_t> lengths(nodes_.size(), 1);
  auto order = topological_order();
  for (NodeIndex idx : order | std::views::reverse) {
    for (NodeIndex dependent : nodes_[idx].dependents) {
      lengths[idx] = std::max(lengths[idx], lengths[dependent] + 1);
    }
  }
  return lengths;
}

auto DependencyGraph::dependency_closure(
    std::span<const NodeIndex> roots) const -> std::vector<NodeIndex> {
  std::vector<bool> seen(nodes_.size(), false);
  std::vector<NodeIndex> stack;
  for (NodeIndex root : roots) {
    if (root < nodes_.size() && !seen[root]) {
      seen[root] = true;
      stack.push_back(root);
    }
  }
  while (!stack.empty()) {
    NodeIndex current = stack.back();
    stack.pop_back();
    for (NodeIndex dep : nodes_[current].deps) {
      if (!seen[dep]) {
        seen[dep] = true;
        stack.push_back(dep);
      }
    }
  }

  std::vector<NodeIndex> out;
  for (NodeIndex i = 0; i < seen.size(); ++i) {
    if (seen[i]) {
      out.push_back(i);
    }
  }
  return out;
}

} // namespace stagehand
