#include "stagehand/cli/commands.hpp"
#include "stagehand/config/pipeline_config.hpp"
#include "stagehand/graph/cycle_detector.hpp"

#include <print>
#include <vector>

namespace stagehand::cli {

auto cmd_order(const OrderOptions &opts) -> int {
  auto config = PipelineLoader::load_from_file(opts.config_file);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }
  auto graph = build_graph(*config);
  if (!graph) {
    std::println(stderr, "Error: {}", graph.error().message());
    return 1;
  }
  if (auto acyclic = check_acyclic(*graph); !acyclic) {
    std::println(stderr, "{}", acyclic.error().message());
    return 1;
  }

  std::vector<bool> selected(graph->size(), opts.only.empty());
  if (!opts.only.empty()) {
    std::vector<NodeIndex> roots;
    for (const auto &name : opts.only) {
      const auto idx = graph->index_of(name);
      if (idx == kInvalidNode) {
        std::println(stderr, "Error: unknown task '{}'", name);
        return 1;
      }
      roots.push_back(idx);
    }
    for (auto idx : graph->dependency_closure(roots)) {
      selected[idx] = true;
    }
  }

  std::size_t position = 0;
  for (auto idx : graph->topological_order()) {
    if (selected[idx]) {
      std::println("{:>3}. {}", ++position, graph->key_of(idx));
    }
  }
  return 0;
}

} // namespace stagehand::cli
