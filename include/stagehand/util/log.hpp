#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/describe/enum.hpp>
#include <boost/system/error_code.hpp>

#include "stagehand/util/enum.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace stagehand::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };
BOOST_DESCRIBE_ENUM(Level, Trace, Debug, Info, Warn, Error)

[[nodiscard]] inline auto level_name(Level level) noexcept -> std::string_view {
  return util::enum_label(level);
}

// ANSI colour of the level tag.
[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  switch (level) {
  case Level::Trace:
    return "\o{33}[90m";
  case Level::Debug:
    return "\o{33}[36m";
  case Level::Info:
    return "\o{33}[32m";
  case Level::Warn:
    return "\o{33}[33m";
  case Level::Error:
    return "\o{33}[31m";
  }
  return "";
}

/// Unknown names map to Info.
[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> Level {
  return util::parse_enum<Level>(name).value_or(Level::Info);
}

// Diagnostics sink. Lines are formatted on the calling thread and handed to
// a writer thread through a bounded channel; before start() (or after stop())
// lines are written synchronously.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kMaxBatch = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

public:
  Logger() = default;
  ~Logger();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void;
  auto stop() -> void;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }
  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto set_output_stderr() noexcept -> void;
  /// Append to `path`; an empty path switches back to stdout. Only valid
  /// while the logger is stopped.
  [[nodiscard]] auto set_output_file(std::string_view path) -> bool;

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;
    enqueue(format_line(level, std::format(fmt, std::forward<Args>(args)...)));
  }

private:
  [[nodiscard]] static auto format_line(Level level, std::string_view body)
      -> std::string;
  auto enqueue(std::string line) -> void;
  auto write_now(std::string_view line) -> void;
  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<FILE *> output_{stdout};
  std::atomic<std::uint64_t> dropped_{0};
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;
};

auto logger() -> Logger &;

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() noexcept -> void {
  logger().set_output_stderr();
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace stagehand::log
