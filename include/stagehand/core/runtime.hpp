#pragma once

#include "stagehand/core/coroutine.hpp"
#include "stagehand/core/error.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace stagehand {

// One io_context driven by a pool of worker threads. Coroutines spawned here
// may resume on any worker, so anything they share must be synchronized.
class Runtime {
public:
  explicit Runtime(unsigned num_threads = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto thread_count() const noexcept -> unsigned {
    return num_threads_;
  }

  [[nodiscard]] auto executor() noexcept
      -> boost::asio::io_context::executor_type {
    return ctx_.get_executor();
  }

  /// Launch a coroutine on the pool without waiting for it.
  template <typename T> auto spawn(task<T> coro) -> void {
    co_spawn(ctx_, std::move(coro), detached);
  }

  /// Launch a coroutine on the pool and block the calling thread until it
  /// finishes. Must not be called from a worker thread.
  template <typename T> auto block_on(task<T> coro) -> T {
    auto fut = co_spawn(ctx_, std::move(coro), boost::asio::use_future);
    return fut.get();
  }

private:
  alignas(64) std::atomic<bool> running_{false};
  unsigned num_threads_;
  boost::asio::io_context ctx_;
  std::optional<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::jthread> threads_;
};

} // namespace stagehand
