#include "stagehand/graph/cycle_detector.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <utility>

namespace stagehand {

namespace {

enum class Visit : std::uint8_t { New, OnStack, Done };

} // namespace

auto find_cycle(const DependencyGraph &graph) -> std::vector<NodeIndex> {
  // Snapshot of the adjacency so the walk never sees a graph mid-mutation.
  std::vector<std::vector<NodeIndex>> deps;
  deps.reserve(graph.size());
  for (auto idx : std::views::iota(NodeIndex{0},
                                   static_cast<NodeIndex>(graph.size()))) {
    auto view = graph.deps_view(idx);
    deps.emplace_back(view.begin(), view.end());
  }

  std::vector<Visit> state(deps.size(), Visit::New);
  std::vector<std::pair<NodeIndex, std::size_t>> stack;
  stack.reserve(deps.size());

  for (auto start :
       std::views::iota(NodeIndex{0}, static_cast<NodeIndex>(deps.size()))) {
    if (state[start] != Visit::New)
      continue;

    stack.emplace_back(start, 0);
    state[start] = Visit::OnStack;

    while (!stack.empty()) {
      auto &[node, child_idx] = stack.back();
      const auto &edges = deps[node];

      if (child_idx >= edges.size()) {
        state[node] = Visit::Done;
        stack.pop_back();
        continue;
      }

      NodeIndex child = edges[child_idx++];
      if (state[child] == Visit::OnStack) {
        auto first = std::ranges::find_if(
            stack, [child](const auto &frame) { return frame.first == child; });
        std::vector<NodeIndex> cycle;
        for (auto it = first; it != stack.end(); ++it) {
          cycle.push_back(it->first);
        }
        cycle.push_back(child);
        return cycle;
      }
      if (state[child] == Visit::New) {
        state[child] = Visit::OnStack;
        stack.emplace_back(child, 0);
      }
    }
  }
  return {};
}

auto describe_cycle(const DependencyGraph &graph,
                    const std::vector<NodeIndex> &cycle) -> std::string {
  std::string out = "A cyclic dependency was encountered:";
  for (auto [i, idx] : std::views::enumerate(cycle)) {
    if (i == 0) {
      out += std::format("\n  {}", graph.key_of(idx));
    } else {
      out += std::format("\n  -> depends on -> {}", graph.key_of(idx));
    }
  }
  return out;
}

auto check_acyclic(const DependencyGraph &graph) -> Result<void> {
  auto cycle = find_cycle(graph);
  if (cycle.empty()) {
    return ok();
  }
  return fail(Error::CycleDetected, describe_cycle(graph, cycle));
}

} // namespace stagehand
