#include "stagehand/scheduler/task_writer.hpp"

namespace stagehand {

auto TaskWriter::append(std::vector<std::string> &channel,
                        std::string_view text, bool newline) -> void {
  std::lock_guard lock(mutex_);
  if (closed_) {
    return;
  }
  auto &chunk = channel.emplace_back(text);
  if (newline) {
    chunk.push_back('\n');
  }
}

auto TaskWriter::write(std::string_view text) -> void {
  append(std_chunks_, text, false);
}

auto TaskWriter::write_line(std::string_view text) -> void {
  append(std_chunks_, text, true);
}

auto TaskWriter::write_error(std::string_view text) -> void {
  append(err_chunks_, text, false);
}

auto TaskWriter::write_error_line(std::string_view text) -> void {
  append(err_chunks_, text, true);
}

auto TaskWriter::join(const std::vector<std::string> &chunks) -> std::string {
  std::size_t total = 0;
  for (const auto &c : chunks) {
    total += c.size();
  }
  std::string out;
  out.reserve(total);
  for (const auto &c : chunks) {
    out += c;
  }
  return out;
}

auto TaskWriter::std_output() const -> std::string {
  std::lock_guard lock(mutex_);
  return join(std_chunks_);
}

auto TaskWriter::std_error() const -> std::string {
  std::lock_guard lock(mutex_);
  return join(err_chunks_);
}

auto TaskWriter::close() noexcept -> void {
  std::lock_guard lock(mutex_);
  closed_ = true;
}

} // namespace stagehand
