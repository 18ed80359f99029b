#include "stagehand/cli/commands.hpp"
#include "stagehand/config/pipeline_config.hpp"
#include "stagehand/core/runtime.hpp"
#include "stagehand/scheduler/task_runner.hpp"
#include "stagehand/util/log.hpp"

#include <print>

namespace stagehand::cli {

namespace {

// Starts the async log writer for the lifetime of a command.
class LogSession {
public:
  LogSession(const LogSettings &settings,
             const std::optional<std::string> &level_override,
             const std::optional<std::string> &file_override) {
    log::set_level(level_override.value_or(settings.level));
    const auto &file = file_override ? *file_override : settings.file;
    if (!file.empty() && !log::set_output_file(file)) {
      std::println(stderr, "Warning: cannot open log file '{}'", file);
    }
    log::start();
  }
  ~LogSession() { log::stop(); }

  LogSession(const LogSession &) = delete;
  LogSession &operator=(const LogSession &) = delete;
};

} // namespace

auto cmd_run(const RunOptions &opts) -> int {
  auto config_res = PipelineLoader::load_from_file(opts.config_file);
  if (!config_res) {
    std::println(stderr, "Error: {}", config_res.error().message());
    return 1;
  }
  auto &config = *config_res;
  if (opts.parallelism) {
    config.runner.parallelism = *opts.parallelism;
  }
  config.runner.quiet = config.runner.quiet || opts.quiet;
  config.runner.allow_warnings_in_successful_build =
      config.runner.allow_warnings_in_successful_build || opts.allow_warnings;

  LogSession session(config.log, opts.log_level, opts.log_file);

  auto runner = TaskRunner::create(config.runner_options());
  if (!runner) {
    std::println(stderr, "Error: {}", runner.error().message());
    return 1;
  }
  if (auto r = populate_runner(config, *runner, opts.only); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }

  auto run = runner->execute();
  if (!run) {
    std::println(stderr, "Error: {}", run.error().message());
    return 1;
  }

  Runtime runtime;
  if (auto r = runtime.start(); !r) {
    std::println(stderr, "Error: {}", r.error().message());
    return 1;
  }
  auto verdict = runtime.block_on(std::move(*run));
  runtime.stop();

  if (!verdict) {
    std::println(stderr, "{}", verdict.error().message());
    return 1;
  }
  log::info("pipeline finished: {} tasks", verdict->total());
  return 0;
}

} // namespace stagehand::cli
