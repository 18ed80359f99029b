#pragma once

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>

namespace stagehand {

enum class TerminalStream : std::uint8_t { Output, Warning, Error };

enum class TextColor : std::uint8_t { Default, Green, Yellow, Red, Cyan, Gray };

// Rendering sink shared by a whole run. Callers pass complete text including
// any line breaks.
class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual auto write(TerminalStream stream, std::string_view text,
                     TextColor color = TextColor::Default) -> void = 0;
};

// stdout for Output, stderr for Warning and Error. Colour is applied only
// when the target stream is a TTY.
class ConsoleTerminal final : public ITerminal {
public:
  ConsoleTerminal();
  auto write(TerminalStream stream, std::string_view text, TextColor color)
      -> void override;

private:
  std::mutex mutex_;
  bool stdout_tty_;
  bool stderr_tty_;
};

// Keeps every stream in memory; colour is discarded.
class StringBufferTerminal final : public ITerminal {
public:
  auto write(TerminalStream stream, std::string_view text, TextColor color)
      -> void override;

  [[nodiscard]] auto output() const -> std::string;
  [[nodiscard]] auto warning() const -> std::string;
  [[nodiscard]] auto error() const -> std::string;
  /// All streams interleaved in write order.
  [[nodiscard]] auto all() const -> std::string;

private:
  mutable std::mutex mutex_;
  std::string output_;
  std::string warning_;
  std::string error_;
  std::string all_;
};

} // namespace stagehand
