#pragma once

#include "stagehand/core/error.hpp"
#include "stagehand/scheduler/task.hpp"

#include <chrono>
#include <map>
#include <string>

namespace stagehand {

struct ShellTaskConfig {
  std::string command;
  std::string working_dir;
  /// Overrides layered on top of the inherited environment.
  std::map<std::string, std::string> env;
  std::chrono::seconds timeout{std::chrono::hours(1)};
};

/// Rejects environment keys that are not POSIX names and non-positive
/// timeouts.
[[nodiscard]] auto validate_shell_task(const ShellTaskConfig &config)
    -> Result<void>;

/// Runs `config.command` through /bin/sh, streaming stdout and stderr into
/// the task's writer. Exit 0 is Success, or SuccessWithWarning when anything
/// non-blank reached stderr; every other outcome is Failure. An empty command
/// succeeds without starting a process. Once the shell exits, output still
/// held open by a background child is read for a short grace period only.
[[nodiscard]] auto make_shell_task(ShellTaskConfig config) -> TaskFunction;

} // namespace stagehand
