#pragma once

#include "stagehand/core/error.hpp"
#include "stagehand/executor/shell_task.hpp"
#include "stagehand/graph/dependency_graph.hpp"
#include "stagehand/scheduler/task_runner.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace stagehand {

struct RunnerSettings {
  std::string parallelism{"max"};
  bool quiet{false};
  bool changed_projects_only{false};
  bool allow_warnings_in_successful_build{false};
};

struct LogSettings {
  std::string level{"info"};
  std::string file;
};

struct PipelineTask {
  std::string name;
  ShellTaskConfig shell;
  std::vector<std::string> dependencies;
  bool incremental{false};
};

// A pipeline file:
//
//   [runner]
//   parallelism = "4"
//
//   [[tasks]]
//   name = "build"
//   command = "make"
//   dependencies = ["codegen"]
struct PipelineConfig {
  RunnerSettings runner;
  LogSettings log;
  std::vector<PipelineTask> tasks;

  [[nodiscard]] auto runner_options() const -> TaskRunnerOptions;
};

class PipelineLoader {
public:
  /// STAGEHAND_PARALLELISM, STAGEHAND_QUIET and STAGEHAND_LOG_LEVEL override
  /// the file.
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<PipelineConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml)
      -> Result<PipelineConfig>;
};

/// Task and dependency graph of `config`, in file order. Fails on a
/// dependency that names no task; cycles are left for the caller to check.
[[nodiscard]] auto build_graph(const PipelineConfig &config)
    -> Result<DependencyGraph>;

/// Register every task of `config` (restricted to `only` and its transitive
/// dependencies when non-empty) with `runner`.
[[nodiscard]] auto populate_runner(const PipelineConfig &config,
                                   TaskRunner &runner,
                                   const std::vector<std::string> &only = {})
    -> Result<void>;

} // namespace stagehand
