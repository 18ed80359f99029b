#include "stagehand/executor/shell_task.hpp"

#include "stagehand/core/asio_awaitable.hpp"
#include "stagehand/core/coroutine.hpp"
#include "stagehand/output/abridge.hpp"
#include "stagehand/scheduler/task_writer.hpp"
#include "stagehand/util/log.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cctype>
#include <csignal>
#include <format>
#include <string_view>
#include <utility>
#include <vector>

namespace stagehand {

namespace {

namespace bp = boost::process::v2;

inline constexpr std::size_t kMaxChannelBytes = 10UZ * 1024 * 1024;
inline constexpr std::size_t kReadBufferSize = 4096;

enum class Channel : std::uint8_t { Standard, Error };

// A finished process may leave its pipes open through a background child;
// after exit the remaining output gets this long to arrive.
inline constexpr std::chrono::milliseconds kDrainGrace{500};

// Cancellation for the two pipe pumps, plus the grace timer that waits for
// them after exit. A cancellation slot holds one handler, so each pipe gets
// its own signal. Only touched from the task's strand.
struct PipeDrain {
  boost::asio::cancellation_signal out;
  boost::asio::cancellation_signal err;
  boost::asio::cancellation_signal grace;
  int open{2};

  auto signal_for(Channel channel) -> boost::asio::cancellation_signal & {
    return channel == Channel::Standard ? out : err;
  }

  auto cancel_pipes() -> void {
    out.emit(boost::asio::cancellation_type::total);
    err.emit(boost::asio::cancellation_type::total);
  }

  auto pipe_closed() -> void {
    if (--open == 0) {
      grace.emit(boost::asio::cancellation_type::total);
    }
  }
};

// POSIX: [A-Za-z_][A-Za-z0-9_]*
[[nodiscard]] auto is_env_name(std::string_view key) -> bool {
  if (key.empty() || std::isdigit(static_cast<unsigned char>(key[0])) != 0)
    return false;
  return std::ranges::all_of(key, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
  });
}

[[nodiscard]] auto preview(std::string_view cmd) -> std::string {
  constexpr std::size_t kPreview = 80;
  if (cmd.size() <= kPreview)
    return std::string(cmd);
  return std::format("{}...", cmd.substr(0, kPreview));
}

[[nodiscard]] auto build_process_env(const std::map<std::string, std::string> &custom)
    -> bp::process_environment {
  std::vector<bp::environment::key_value_pair> env_vec;
  env_vec.reserve(64);

  for (const auto &entry : bp::environment::current()) {
    auto key = entry.key();
    if (custom.contains(std::string(key.data(), key.size()))) {
      continue;
    }
    env_vec.emplace_back(entry);
  }
  for (const auto &[k, v] : custom) {
    env_vec.emplace_back(bp::environment::key{k}, bp::environment::value{v});
  }
  return bp::process_environment(std::move(env_vec));
}

[[nodiscard]] auto spawn_shell(boost::asio::any_io_executor executor,
                               const ShellTaskConfig &config,
                               boost::asio::readable_pipe &stdout_pipe,
                               boost::asio::readable_pipe &stderr_pipe)
    -> Result<bp::process> {
  try {
    std::vector<std::string> args{"-c", config.command};
    auto stdio =
        bp::process_stdio{.in = nullptr, .out = stdout_pipe, .err = stderr_pipe};
    const bool has_env = !config.env.empty();
    const bool has_dir = !config.working_dir.empty();
    if (has_env && has_dir) {
      return bp::process(executor, "/bin/sh", args, std::move(stdio),
                         bp::process_start_dir{config.working_dir},
                         build_process_env(config.env));
    }
    if (has_env) {
      return bp::process(executor, "/bin/sh", args, std::move(stdio),
                         build_process_env(config.env));
    }
    if (has_dir) {
      return bp::process(executor, "/bin/sh", args, std::move(stdio),
                         bp::process_start_dir{config.working_dir});
    }
    return bp::process(executor, "/bin/sh", args, std::move(stdio));
  } catch (const std::exception &ex) {
    log::error("failed to start '{}': {}", preview(config.command), ex.what());
    return fail(Error::ProcessSpawnFailed,
                std::format("Failed to start command: {}", ex.what()));
  }
}

[[nodiscard]] auto pump_pipe(boost::asio::readable_pipe &pipe,
                             TaskWriter &writer, Channel channel,
                             PipeDrain &drain) -> task<void> {
  std::array<char, kReadBufferSize> buffer{};
  std::size_t forwarded = 0;
  auto &cancel_sig = drain.signal_for(channel);
  while (true) {
    auto [ec, bytes] = co_await pipe.async_read_some(
        boost::asio::buffer(buffer.data(), buffer.size()),
        boost::asio::bind_cancellation_slot(cancel_sig.slot(), use_nothrow));
    if (ec) {
      drain.pipe_closed();
      co_return;
    }
    if (bytes == 0 || forwarded >= kMaxChannelBytes) {
      continue;
    }
    const auto take = std::min(bytes, kMaxChannelBytes - forwarded);
    forwarded += take;
    const std::string_view chunk{buffer.data(), take};
    if (channel == Channel::Standard) {
      writer.write(chunk);
    } else {
      writer.write_error(chunk);
    }
  }
}

// Exit code of the process. Fails with Error::Timeout after killing it when
// `timeout` elapses first.
[[nodiscard]] auto wait_for_exit(bp::process &proc,
                                 std::chrono::seconds timeout,
                                 PipeDrain &drain) -> task<Result<int>> {
  auto [ec, exit_code] =
      co_await proc.async_wait(boost::asio::cancel_after(timeout, use_nothrow));
  if (ec == boost::asio::error::operation_aborted) {
    drain.cancel_pipes();
    boost::system::error_code terminate_ec;
    proc.terminate(terminate_ec);
    if (terminate_ec && proc.id() > 0) {
      (void)::kill(proc.id(), SIGKILL);
    }
    auto [reap_ec, reaped] = co_await proc.async_wait(use_nothrow);
    if (reap_ec) {
      log::warn("failed to reap timed out process: {}", reap_ec.message());
    }
    co_return fail(Error::Timeout, std::format("Command timed out after {}s",
                                               timeout.count()));
  }
  if (ec) {
    log::error("waiting for process failed: {}", ec.message());
    drain.cancel_pipes();
    co_return fail(std::error_code(ec));
  }

  if (drain.open > 0) {
    boost::asio::steady_timer grace(co_await boost::asio::this_coro::executor,
                                    kDrainGrace);
    auto [grace_ec] = co_await grace.async_wait(
        boost::asio::bind_cancellation_slot(drain.grace.slot(), use_nothrow));
    if (!grace_ec) {
      log::warn("output pipes still open {}ms after exit, closing them",
                kDrainGrace.count());
      drain.cancel_pipes();
    }
  }
  co_return exit_code;
}

auto run_shell(const ShellTaskConfig &config, TaskWriter &writer)
    -> task<TaskStatus> {
  if (config.command.empty()) {
    co_return TaskStatus::Success;
  }

  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::readable_pipe stdout_pipe(executor);
  boost::asio::readable_pipe stderr_pipe(executor);

  auto proc = spawn_shell(executor, config, stdout_pipe, stderr_pipe);
  if (!proc) {
    writer.write_error_line(proc.error().message());
    co_return TaskStatus::Failure;
  }

  log::debug("task '{}' started pid={} cmd='{}'", writer.name(), proc->id(),
             preview(config.command));

  PipeDrain drain;
  using namespace boost::asio::experimental::awaitable_operators;
  auto exit_code =
      co_await (pump_pipe(stdout_pipe, writer, Channel::Standard, drain) &&
                pump_pipe(stderr_pipe, writer, Channel::Error, drain) &&
                wait_for_exit(*proc, config.timeout, drain));

  if (!exit_code) {
    log::debug("task '{}' did not exit cleanly: {}", writer.name(),
               exit_code.error().message());
    writer.write_error_line(exit_code.error().message());
    co_return TaskStatus::Failure;
  }
  log::debug("task '{}' exited code={}", writer.name(), *exit_code);

  if (*exit_code != 0) {
    co_return TaskStatus::Failure;
  }
  if (!output::trim_output(writer.std_error()).empty()) {
    co_return TaskStatus::SuccessWithWarning;
  }
  co_return TaskStatus::Success;
}

} // namespace

auto validate_shell_task(const ShellTaskConfig &config) -> Result<void> {
  for (const auto &[key, value] : config.env) {
    if (!is_env_name(key)) {
      return fail(Error::InvalidArgument,
                  std::format("Invalid environment variable name '{}'", key));
    }
  }
  if (config.timeout.count() <= 0) {
    return fail(Error::InvalidArgument, "Timeout must be positive");
  }
  return ok();
}

auto make_shell_task(ShellTaskConfig config) -> TaskFunction {
  // Pipes, process and cancellation signals of one run share a strand.
  return [config = std::move(config)](TaskWriter &writer) -> task<TaskStatus> {
    auto executor = co_await boost::asio::this_coro::executor;
    co_return co_await co_spawn(boost::asio::make_strand(executor),
                                run_shell(config, writer),
                                boost::asio::use_awaitable);
  };
}

} // namespace stagehand
