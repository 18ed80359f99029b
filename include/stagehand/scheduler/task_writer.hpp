#pragma once

#include "stagehand/scheduler/task.hpp"

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace stagehand {

// Capture sink handed to a running task. Two append-only channels; writes may
// come from any thread. After close() further writes are dropped.
class TaskWriter {
public:
  explicit TaskWriter(TaskContext context) : context_(std::move(context)) {}

  TaskWriter(const TaskWriter &) = delete;
  TaskWriter &operator=(const TaskWriter &) = delete;

  auto write(std::string_view text) -> void;
  auto write_line(std::string_view text) -> void;
  auto write_error(std::string_view text) -> void;
  auto write_error_line(std::string_view text) -> void;

  /// Standard channel, chunks concatenated in write order.
  [[nodiscard]] auto std_output() const -> std::string;
  [[nodiscard]] auto std_error() const -> std::string;

  auto close() noexcept -> void;

  [[nodiscard]] auto context() const noexcept -> const TaskContext & {
    return context_;
  }
  [[nodiscard]] auto name() const noexcept -> const TaskId & {
    return context_.name;
  }

private:
  auto append(std::vector<std::string> &channel, std::string_view text,
              bool newline) -> void;
  [[nodiscard]] static auto join(const std::vector<std::string> &chunks)
      -> std::string;

  TaskContext context_;
  mutable std::mutex mutex_;
  std::vector<std::string> std_chunks_;
  std::vector<std::string> err_chunks_;
  bool closed_{false};
};

} // namespace stagehand
