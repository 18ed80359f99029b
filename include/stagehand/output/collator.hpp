#pragma once

#include "stagehand/output/terminal.hpp"
#include "stagehand/scheduler/execution_engine.hpp"
#include "stagehand/scheduler/task.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace stagehand {

inline constexpr std::size_t kBannerWidth = 79;

struct CollatorOptions {
  bool quiet_mode{false};
  bool allow_warnings_in_successful_build{false};
};

/// Upper-case heading used in banners and the run summary.
[[nodiscard]] auto status_label(TaskStatus status) -> std::string_view;
[[nodiscard]] auto status_color(TaskStatus status) -> TextColor;

/// "==[ title ]====..." padded with '=' to kBannerWidth.
[[nodiscard]] auto make_banner(std::string_view title) -> std::string;

/// Failure always counts against a run; a warning does unless allowed.
[[nodiscard]] constexpr auto counts_as_failure(TaskStatus status,
                                               bool allow_warnings) noexcept
    -> bool {
  return status == TaskStatus::Failure ||
         (status == TaskStatus::SuccessWithWarning && !allow_warnings);
}

/// Banner naming the status, then the abridged error channel, or the
/// abridged standard channel when the error channel is blank.
[[nodiscard]] auto render_report_block(const TaskOutcome &outcome)
    -> std::string;

// The only writer of the shared terminal during a run. Each call emits one
// whole block under the collator's lock, so blocks from concurrently
// finishing tasks never interleave.
class OutputCollator {
public:
  OutputCollator(std::shared_ptr<ITerminal> terminal, CollatorOptions options);

  auto write_line(std::string_view text, TextColor color = TextColor::Default,
                  TerminalStream stream = TerminalStream::Output) -> void;

  /// Surface a terminal outcome according to its status and quiet mode.
  auto collate(const TaskOutcome &outcome) -> void;

  [[nodiscard]] auto options() const noexcept -> const CollatorOptions & {
    return options_;
  }

private:
  auto emit(std::string_view text, TextColor color, TerminalStream stream)
      -> void;

  std::mutex mutex_;
  std::shared_ptr<ITerminal> terminal_;
  CollatorOptions options_;
};

} // namespace stagehand
