#include "stagehand/output/terminal.hpp"

#include <print>
#include <unistd.h>

namespace stagehand {

namespace {

namespace ansi {
inline constexpr std::string_view kReset = "\033[0m";
inline constexpr std::string_view kGreen = "\033[32m";
inline constexpr std::string_view kYellow = "\033[33m";
inline constexpr std::string_view kRed = "\033[31m";
inline constexpr std::string_view kCyan = "\033[36m";
inline constexpr std::string_view kGray = "\033[90m";
} // namespace ansi

[[nodiscard]] auto color_code(TextColor color) -> std::string_view {
  switch (color) {
  case TextColor::Green:
    return ansi::kGreen;
  case TextColor::Yellow:
    return ansi::kYellow;
  case TextColor::Red:
    return ansi::kRed;
  case TextColor::Cyan:
    return ansi::kCyan;
  case TextColor::Gray:
    return ansi::kGray;
  case TextColor::Default:
    break;
  }
  return {};
}

} // namespace

ConsoleTerminal::ConsoleTerminal()
    : stdout_tty_(::isatty(::fileno(stdout)) != 0),
      stderr_tty_(::isatty(::fileno(stderr)) != 0) {}

auto ConsoleTerminal::write(TerminalStream stream, std::string_view text,
                            TextColor color) -> void {
  const bool to_stderr =
      stream == TerminalStream::Warning || stream == TerminalStream::Error;
  FILE *out = to_stderr ? stderr : stdout;
  const bool tty = to_stderr ? stderr_tty_ : stdout_tty_;
  const auto code = color_code(color);

  std::lock_guard lock(mutex_);
  if (tty && !code.empty()) {
    std::print(out, "{}{}{}", code, text, ansi::kReset);
  } else {
    std::print(out, "{}", text);
  }
  std::fflush(out);
}

auto StringBufferTerminal::write(TerminalStream stream, std::string_view text,
                                 [[maybe_unused]] TextColor color) -> void {
  std::lock_guard lock(mutex_);
  switch (stream) {
  case TerminalStream::Output:
    output_.append(text);
    break;
  case TerminalStream::Warning:
    warning_.append(text);
    break;
  case TerminalStream::Error:
    error_.append(text);
    break;
  }
  all_.append(text);
}

auto StringBufferTerminal::output() const -> std::string {
  std::lock_guard lock(mutex_);
  return output_;
}

auto StringBufferTerminal::warning() const -> std::string {
  std::lock_guard lock(mutex_);
  return warning_;
}

auto StringBufferTerminal::error() const -> std::string {
  std::lock_guard lock(mutex_);
  return error_;
}

auto StringBufferTerminal::all() const -> std::string {
  std::lock_guard lock(mutex_);
  return all_;
}

} // namespace stagehand
