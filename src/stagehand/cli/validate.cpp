#include "stagehand/cli/commands.hpp"
#include "stagehand/config/pipeline_config.hpp"
#include "stagehand/graph/cycle_detector.hpp"
#include "stagehand/util/log.hpp"

#include <print>

namespace stagehand::cli {

auto cmd_validate(const ValidateOptions &opts) -> int {
  auto res =
      PipelineLoader::load_from_file(opts.config_file)
          .and_then([](const PipelineConfig &config) -> Result<std::size_t> {
            auto graph = build_graph(config);
            if (!graph) {
              return fail(graph.error());
            }
            if (auto acyclic = check_acyclic(*graph); !acyclic) {
              return fail(acyclic.error());
            }
            return ok(graph->size());
          });

  if (!res) {
    log::debug("validation of '{}' failed: {}", opts.config_file,
               res.error().code().message());
    std::println(stderr, "Invalid: {}\n{}", opts.config_file,
                 res.error().message());
    return 1;
  }
  std::println("Valid: {} ({} tasks)", opts.config_file, *res);
  return 0;
}

} // namespace stagehand::cli
