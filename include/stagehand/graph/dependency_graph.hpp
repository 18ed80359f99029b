#pragma once

#include "stagehand/core/error.hpp"
#include "stagehand/util/id.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <span>
#include <vector>

namespace stagehand {

using NodeIndex = std::uint32_t;
constexpr NodeIndex kInvalidNode = UINT32_MAX;

// Directed graph of task names. An edge `dependency -> dependent` means the
// dependent may only start once the dependency has finished. Nodes keep
// their registration order as their index.
class DependencyGraph {
public:
  [[nodiscard]] auto add_node(TaskId task_id) -> Result<NodeIndex>;

  /// Idempotent. Self-edges are accepted here and rejected by the cycle
  /// check.
  [[nodiscard]] auto add_edge(NodeIndex dependency, NodeIndex dependent)
      -> Result<void>;

  [[nodiscard]] auto has_node(const TaskId &task_id) const -> bool;
  [[nodiscard]] auto has_edge(NodeIndex dependency,
                              NodeIndex dependent) const noexcept -> bool;

  [[nodiscard]] auto index_of(std::string_view name) const -> NodeIndex;
  [[nodiscard]] auto key_of(NodeIndex idx) const -> const TaskId &;

  [[nodiscard]] auto deps_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto dependents_view(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;

  /// Kahn order, ties broken by registration order. Nodes on a cycle are
  /// omitted, so a short result means the graph is not acyclic.
  [[nodiscard]] auto topological_order() const -> std::vector<NodeIndex>;

  /// For each node, the number of tasks on the longest chain that starts at
  /// it and follows dependents. Requires an acyclic graph.
  [[nodiscard]] auto critical_path_lengths() const -> std::vector<std::uint32_t>;

  /// The node plus everything it transitively depends on, in index order.
  [[nodiscard]] auto dependency_closure(std::span<const NodeIndex> roots) const
      -> std::vector<NodeIndex>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }
  [[nodiscard]] auto edge_count() const noexcept -> std::size_t {
    return edge_count_;
  }

private:
  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<TaskId> keys_;
  ankerl::unordered_dense::map<TaskId, NodeIndex> key_to_idx_;
  std::size_t edge_count_{0};
};

} // namespace stagehand
