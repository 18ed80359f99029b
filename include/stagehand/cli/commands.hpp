#pragma once

#include <optional>
#include <string>
#include <vector>

namespace stagehand::cli {

struct RunOptions {
  std::string config_file;
  std::optional<std::string> parallelism;
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  std::vector<std::string> only; // Restrict to these tasks and their deps
  bool quiet{false};
  bool allow_warnings{false};
};

struct ValidateOptions {
  std::string config_file;
};

struct OrderOptions {
  std::string config_file;
  std::vector<std::string> only;
};

[[nodiscard]] auto cmd_run(const RunOptions &opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions &opts) -> int;
[[nodiscard]] auto cmd_order(const OrderOptions &opts) -> int;

} // namespace stagehand::cli
