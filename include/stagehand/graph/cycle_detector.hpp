#pragma once

#include "stagehand/core/error.hpp"
#include "stagehand/graph/dependency_graph.hpp"

#include <string>
#include <vector>

namespace stagehand {

/// One cycle in "depends on" order, closed: the first node is repeated at the
/// end (`a -> b -> a` is {a, b, a}). Empty when the graph is acyclic.
[[nodiscard]] auto find_cycle(const DependencyGraph &graph)
    -> std::vector<NodeIndex>;

[[nodiscard]] auto describe_cycle(const DependencyGraph &graph,
                                  const std::vector<NodeIndex> &cycle)
    -> std::string;

/// Fails with Error::CycleDetected naming the tasks of the first cycle found.
[[nodiscard]] auto check_acyclic(const DependencyGraph &graph) -> Result<void>;

} // namespace stagehand
