#include "stagehand/cli/commands.hpp"
#include "stagehand/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("STAGEHAND_CONFIG"); env && *env) {
    return env;
  }
  return {};
}
} // namespace

int main(int argc, char *argv[]) {
  // Diagnostics stay on stderr so task output owns stdout.
  stagehand::log::set_output_stderr();
  stagehand::log::set_level(stagehand::log::Level::Warn);

  CLI::App app{"stagehand", "A dependency-aware task runner"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  stagehand run -c pipeline.toml\n"
             "  stagehand run -c pipeline.toml --parallelism 4 --only test\n"
             "\nTip: Set STAGEHAND_CONFIG=pipeline.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  stagehand::cli::RunOptions run_opts;
  auto *run = app.add_subcommand("run", "Run the pipeline");
  run->footer("\nExamples:\n"
              "  stagehand run -c pipeline.toml --quiet\n"
              "  stagehand run -c pipeline.toml --parallelism max\n"
              "  stagehand run -c pipeline.toml --only lint,test");
  run_opts.config_file = env_config;
  auto *run_cfg = run->add_option("-c,--config", run_opts.config_file,
                                  "Pipeline file")
                      ->check(CLI::ExistingFile);
  if (env_config.empty())
    run_cfg->required();
  run->add_option("-p,--parallelism", run_opts.parallelism,
                  "Maximum concurrent tasks: a positive number or 'max'");
  run->add_flag("-q,--quiet", run_opts.quiet,
                "Hide output of tasks that succeed cleanly");
  run->add_flag("--allow-warnings", run_opts.allow_warnings,
                "Do not fail the run on tasks that succeed with warnings");
  run->add_option("--only", run_opts.only,
                  "Run only these tasks and their dependencies")
      ->delimiter(',');
  run->add_option("--log-level", run_opts.log_level,
                  "Log level override: trace|debug|info|warn|error");
  run->add_option("--log-file", run_opts.log_file, "Write diagnostics here");
  run->callback(
      [&run_opts]() { std::exit(stagehand::cli::cmd_run(run_opts)); });

  stagehand::cli::ValidateOptions validate_opts;
  auto *validate = app.add_subcommand(
      "validate", "Check the pipeline file and its dependency graph");
  validate_opts.config_file = env_config;
  auto *validate_cfg =
      validate
          ->add_option("-c,--config", validate_opts.config_file,
                       "Pipeline file")
          ->check(CLI::ExistingFile);
  if (env_config.empty())
    validate_cfg->required();
  validate->callback([&validate_opts]() {
    std::exit(stagehand::cli::cmd_validate(validate_opts));
  });

  stagehand::cli::OrderOptions order_opts;
  auto *order =
      app.add_subcommand("order", "Print the tasks in a valid run order");
  order_opts.config_file = env_config;
  auto *order_cfg =
      order->add_option("-c,--config", order_opts.config_file, "Pipeline file")
          ->check(CLI::ExistingFile);
  if (env_config.empty())
    order_cfg->required();
  order->add_option("--only", order_opts.only,
                    "Print only these tasks and their dependencies")
      ->delimiter(',');
  order->callback(
      [&order_opts]() { std::exit(stagehand::cli::cmd_order(order_opts)); });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
