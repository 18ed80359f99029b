#include "stagehand/config/pipeline_config.hpp"
#include "stagehand/config/toml_util.hpp"

#include "stagehand/graph/dependency_graph.hpp"
#include "stagehand/util/log.hpp"

#include <boost/lexical_cast.hpp>

#include <cstdlib>
#include <format>
#include <string>
#include <string_view>
#include <unordered_set>

namespace stagehand {
namespace detail {

struct RunnerToml {
  std::string parallelism{"max"};
  bool quiet{false};
  bool changed_projects_only{false};
  bool allow_warnings_in_successful_build{false};
};

struct LogToml {
  std::string level{"info"};
  std::string file;
};

struct TaskToml {
  std::string name;
  std::string command;
  std::string working_dir;
  std::vector<std::string> dependencies;
  bool incremental{false};
  int timeout_sec{3600};
  std::vector<std::string> env;
};

struct PipelineToml {
  RunnerToml runner{};
  LogToml log{};
  std::vector<TaskToml> tasks;
};

} // namespace detail
} // namespace stagehand

namespace glz {
template <> struct meta<stagehand::detail::RunnerToml> {
  using T = stagehand::detail::RunnerToml;
  static constexpr auto value =
      object("parallelism", &T::parallelism, "quiet", &T::quiet,
             "changed_projects_only", &T::changed_projects_only,
             "allow_warnings_in_successful_build",
             &T::allow_warnings_in_successful_build);
};

template <> struct meta<stagehand::detail::LogToml> {
  using T = stagehand::detail::LogToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<stagehand::detail::TaskToml> {
  using T = stagehand::detail::TaskToml;
  static constexpr auto value =
      object("name", &T::name, "command", &T::command, "working_dir",
             &T::working_dir, "dependencies", &T::dependencies, "incremental",
             &T::incremental, "timeout_sec", &T::timeout_sec, "env", &T::env);
};

template <> struct meta<stagehand::detail::PipelineToml> {
  using T = stagehand::detail::PipelineToml;
  static constexpr auto value =
      object("runner", &T::runner, "log", &T::log, "tasks", &T::tasks);
};
} // namespace glz

namespace stagehand {
namespace {

[[nodiscard]] auto parse_flag(std::string_view v) -> bool {
  if (v == "true" || v == "yes")
    return true;
  if (v == "false" || v == "no")
    return false;
  return boost::lexical_cast<bool>(v);
}

[[nodiscard]] auto convert_task(detail::TaskToml &raw) -> Result<PipelineTask> {
  if (!is_valid_id_text(raw.name)) {
    return fail(Error::ParseError, "Every task needs a non-empty name");
  }

  PipelineTask out;
  out.name = std::move(raw.name);
  out.dependencies = std::move(raw.dependencies);
  out.incremental = raw.incremental;
  out.shell.command = std::move(raw.command);
  out.shell.working_dir = std::move(raw.working_dir);
  out.shell.timeout = std::chrono::seconds(raw.timeout_sec);
  for (const auto &entry : raw.env) {
    auto eq = entry.find('=');
    if (eq == std::string::npos) {
      return fail(Error::ParseError,
                  std::format("Task '{}': env entry '{}' is not KEY=VALUE",
                              out.name, entry));
    }
    out.shell.env.insert_or_assign(entry.substr(0, eq), entry.substr(eq + 1));
  }

  if (auto valid = validate_shell_task(out.shell); !valid) {
    return fail(Error::ParseError,
                std::format("Task '{}': {}", out.name, valid.error().message()));
  }
  return ok(std::move(out));
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<PipelineConfig> {
  auto raw_result = toml_util::parse_toml<detail::PipelineToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  PipelineConfig cfg{};
  cfg.runner.parallelism = std::move(raw.runner.parallelism);
  cfg.runner.quiet = raw.runner.quiet;
  cfg.runner.changed_projects_only = raw.runner.changed_projects_only;
  cfg.runner.allow_warnings_in_successful_build =
      raw.runner.allow_warnings_in_successful_build;
  cfg.log.level = std::move(raw.log.level);
  cfg.log.file = std::move(raw.log.file);

  if (const char *v = std::getenv("STAGEHAND_PARALLELISM"); v != nullptr) {
    cfg.runner.parallelism = v;
  }
  if (const char *v = std::getenv("STAGEHAND_QUIET"); v != nullptr) {
    cfg.runner.quiet = parse_flag(v);
  }
  if (const char *v = std::getenv("STAGEHAND_LOG_LEVEL"); v != nullptr) {
    cfg.log.level = v;
  }

  if (auto p = Parallelism::parse(cfg.runner.parallelism); !p) {
    return fail(p.error());
  }

  std::unordered_set<std::string> seen;
  cfg.tasks.reserve(raw.tasks.size());
  for (auto &raw_task : raw.tasks) {
    auto task = convert_task(raw_task);
    if (!task) {
      return fail(task.error());
    }
    if (!seen.insert(task->name).second) {
      return fail(Error::DuplicateTask,
                  std::format("Task '{}' is defined more than once",
                              task->name));
    }
    cfg.tasks.push_back(std::move(*task));
  }
  return ok(std::move(cfg));
}

} // namespace

auto PipelineConfig::runner_options() const -> TaskRunnerOptions {
  TaskRunnerOptions options;
  options.quiet_mode = runner.quiet;
  options.parallelism = runner.parallelism;
  options.changed_projects_only = runner.changed_projects_only;
  options.allow_warnings_in_successful_build =
      runner.allow_warnings_in_successful_build;
  return options;
}

auto PipelineLoader::load_from_file(std::string_view path)
    -> Result<PipelineConfig> {
  auto text = toml_util::read_file(path);
  if (!text) {
    return fail(text.error());
  }
  return load_from_string(*text);
}

auto PipelineLoader::load_from_string(std::string_view toml_str)
    -> Result<PipelineConfig> {
  try {
    return convert_toml(toml_str);
  } catch (const boost::bad_lexical_cast &e) {
    log::error("Invalid environment override: {}", e.what());
    return fail(Error::ParseError,
                std::format("Invalid environment override: {}", e.what()));
  }
}

auto build_graph(const PipelineConfig &config) -> Result<DependencyGraph> {
  DependencyGraph graph;
  for (const auto &task : config.tasks) {
    if (auto idx = graph.add_node(TaskId{task.name}); !idx) {
      return fail(idx.error());
    }
  }
  for (const auto &task : config.tasks) {
    const auto dependent = graph.index_of(task.name);
    for (const auto &dep : task.dependencies) {
      const auto dependency = graph.index_of(dep);
      if (dependency == kInvalidNode) {
        return fail(Error::UnknownDependency,
                    std::format("The task \"{}\" depends on \"{}\", which has "
                                "not been registered",
                                task.name, dep));
      }
      if (auto r = graph.add_edge(dependency, dependent); !r) {
        return fail(r.error());
      }
    }
  }
  return ok(std::move(graph));
}

auto populate_runner(const PipelineConfig &config, TaskRunner &runner,
                     const std::vector<std::string> &only) -> Result<void> {
  // Resolve the selection first so unknown names fail before anything is
  // registered.
  auto graph_result = build_graph(config);
  if (!graph_result) {
    return fail(graph_result.error());
  }
  const auto &graph = *graph_result;

  std::vector<bool> selected(config.tasks.size(), only.empty());
  if (!only.empty()) {
    std::vector<NodeIndex> roots;
    for (const auto &name : only) {
      const auto idx = graph.index_of(name);
      if (idx == kInvalidNode) {
        return fail(Error::UnknownTask,
                    std::format("The task \"{}\" has not been registered",
                                name));
      }
      roots.push_back(idx);
    }
    for (auto idx : graph.dependency_closure(roots)) {
      selected[idx] = true;
    }
  }

  for (std::size_t i = 0; i < config.tasks.size(); ++i) {
    if (!selected[i]) {
      continue;
    }
    const auto &task = config.tasks[i];
    auto added = runner.add_task(TaskDefinition{
        .name = TaskId{task.name},
        .execute = make_shell_task(task.shell),
        .is_incremental_build_allowed = task.incremental,
        .had_empty_script = task.shell.command.empty(),
    });
    if (!added) {
      return fail(added.error());
    }
  }
  for (std::size_t i = 0; i < config.tasks.size(); ++i) {
    if (!selected[i]) {
      continue;
    }
    const auto &task = config.tasks[i];
    if (auto r = runner.add_dependencies(task.name, task.dependencies); !r) {
      return fail(r.error());
    }
  }
  log::debug("registered {} of {} pipeline tasks", runner.task_count(),
             config.tasks.size());
  return ok();
}

} // namespace stagehand
