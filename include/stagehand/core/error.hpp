#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace stagehand {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  ParseError,
  InvalidArgument,
  InvalidParallelism,
  UnknownTask,
  UnknownDependency,
  DuplicateTask,
  CycleDetected,
  ReadOnly,
  InvalidState,
  TasksFailed,
  ProcessSpawnFailed,
  Timeout,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 14> messages = {
      "success",
      "file not found",
      "parse error",
      "invalid argument",
      "invalid parallelism",
      "unknown task",
      "unknown dependency",
      "duplicate task",
      "cyclic dependency",
      "task graph is read-only",
      "invalid state",
      "one or more tasks failed",
      "failed to spawn process",
      "timeout",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "stagehand";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      std::unreachable();
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

} // namespace stagehand

template <> struct std::is_error_code_enum<stagehand::Error> : std::true_type {};

namespace stagehand {

// An error code plus the human-readable detail that produced it (a task name,
// a cycle path, a composed failure report). Converts implicitly from
// std::error_code so plain codes propagate unchanged.
class ErrorInfo {
public:
  ErrorInfo() = default;
  ErrorInfo(std::error_code code) : code_(code) {}
  ErrorInfo(Error e) : code_(make_error_code(e)) {}
  ErrorInfo(std::error_code code, std::string detail)
      : code_(code), detail_(std::move(detail)) {}

  [[nodiscard]] auto code() const noexcept -> std::error_code { return code_; }
  [[nodiscard]] auto detail() const noexcept -> const std::string & {
    return detail_;
  }

  /// The detail when present, otherwise the category message.
  [[nodiscard]] auto message() const -> std::string {
    return detail_.empty() ? code_.message() : detail_;
  }

  [[nodiscard]] friend auto operator==(const ErrorInfo &lhs, Error rhs)
      -> bool {
    return lhs.code_ == make_error_code(rhs);
  }
  [[nodiscard]] friend auto operator==(const ErrorInfo &lhs,
                                       const ErrorInfo &rhs) -> bool {
    return lhs.code_ == rhs.code_ && lhs.detail_ == rhs.detail_;
  }

  friend auto operator<<(std::ostream &os, const ErrorInfo &e)
      -> std::ostream & {
    return os << e.code_.message() << " (" << e.detail_ << ")";
  }

private:
  std::error_code code_;
  std::string detail_;
};

// Concept for types that can be used with Result<T>
template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, ErrorInfo>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<ErrorInfo> {
  return std::unexpected{ErrorInfo{e}};
}

[[nodiscard]] inline auto fail(Error e, std::string detail)
    -> std::unexpected<ErrorInfo> {
  return std::unexpected{ErrorInfo{make_error_code(e), std::move(detail)}};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<ErrorInfo> {
  return std::unexpected{ErrorInfo{ec}};
}

[[nodiscard]] inline auto fail(ErrorInfo info) -> std::unexpected<ErrorInfo> {
  return std::unexpected{std::move(info)};
}

} // namespace stagehand
