#include "stagehand/util/log.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace stagehand::log {

auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

Logger::~Logger() {
  stop();
  if (file_) {
    std::fclose(file_);
  }
}

auto Logger::format_line(Level level, std::string_view body) -> std::string {
  auto time =
      std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
  auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
  return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}\o{33}[0m] [{}] {}\n", time,
                     level_color(level), level_name(level), tid, body);
}

auto Logger::start() -> void {
  if (running_.exchange(true, std::memory_order_acq_rel))
    return;
  queue_ctx_.restart();
  auto channel =
      std::make_shared<LogChannel>(queue_ctx_.get_executor(), kQueueCapacity);
  queue_.store(channel, std::memory_order_release);
  writer_ = std::jthread([this, channel] { writer_loop(channel); });
}

auto Logger::stop() -> void {
  if (!running_.exchange(false, std::memory_order_acq_rel))
    return;

  if (auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel)) {
    queue->close();
  }
  queue_ctx_.stop();
  if (writer_.joinable()) {
    writer_.join();
  }
  if (auto dropped = dropped_.exchange(0, std::memory_order_relaxed);
      dropped > 0) {
    write_now(format_line(
        Level::Warn,
        std::format("{} log lines dropped while the queue was full", dropped)));
  }
}

auto Logger::set_output_stderr() noexcept -> void {
  output_.store(stderr, std::memory_order_release);
}

auto Logger::set_output_file(std::string_view path) -> bool {
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }
  FILE *next = stdout;
  if (!path.empty()) {
    next = std::fopen(std::string(path).c_str(), "a");
    if (!next)
      return false;
    std::setvbuf(next, nullptr, _IOLBF, 0);
  }
  output_.store(next, std::memory_order_release);
  if (file_)
    std::fclose(file_);
  file_ = path.empty() ? nullptr : next;
  return true;
}

auto Logger::write_now(std::string_view line) -> void {
  auto *out = output_.load(std::memory_order_acquire);
  std::fwrite(line.data(), 1, line.size(), out ? out : stdout);
  std::fflush(out ? out : stdout);
}

auto Logger::enqueue(std::string line) -> void {
  auto queue = queue_.load(std::memory_order_acquire);
  if (!queue) {
    write_now(line);
    return;
  }
  if (!queue->try_send(boost::system::error_code{}, std::move(line))) {
    // Full queue: never block the caller.
    dropped_.fetch_add(1, std::memory_order_relaxed);
  }
}

auto Logger::writer_loop(std::shared_ptr<LogChannel> queue) -> void {
  std::vector<std::string> batch;
  batch.reserve(kMaxBatch);

  auto drain = [&] {
    while (batch.size() < kMaxBatch) {
      std::optional<std::string> msg;
      bool received = queue->try_receive(
          [&](const boost::system::error_code &ec, std::string item) {
            if (!ec) {
              msg = std::move(item);
            }
          });
      if (!received || !msg) {
        break;
      }
      batch.push_back(std::move(*msg));
    }
  };

  auto flush = [&] {
    auto *out = output_.load(std::memory_order_acquire);
    if (!out) {
      out = stdout;
    }
    for (const auto &msg : batch) {
      std::fwrite(msg.data(), 1, msg.size(), out);
    }
    std::fflush(out);
    batch.clear();
  };

  while (running_.load(std::memory_order_acquire)) {
    boost::system::error_code recv_ec;
    queue->async_receive(
        [&](const boost::system::error_code &ec, std::string item) {
          recv_ec = ec;
          if (!ec) {
            batch.push_back(std::move(item));
          }
        });
    queue_ctx_.restart();
    (void)queue_ctx_.run_one();
    if (recv_ec) {
      break;
    }
    drain();
    flush();
  }

  // Complete the receive cancelled by close() while its captures are alive.
  queue_ctx_.restart();
  (void)queue_ctx_.poll();

  // Whatever was queued before close() still goes out.
  for (;;) {
    drain();
    if (batch.empty()) {
      break;
    }
    flush();
  }
}

} // namespace stagehand::log
