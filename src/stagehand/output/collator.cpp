#include "stagehand/output/collator.hpp"

#include "stagehand/output/abridge.hpp"

#include <format>

namespace stagehand {

auto status_label(TaskStatus status) -> std::string_view {
  switch (status) {
  case TaskStatus::Success:
    return "SUCCESS";
  case TaskStatus::SuccessWithWarning:
    return "SUCCESS WITH WARNINGS";
  case TaskStatus::Failure:
    return "FAILURE";
  case TaskStatus::Blocked:
    return "BLOCKED";
  }
  return "UNKNOWN";
}

auto status_color(TaskStatus status) -> TextColor {
  switch (status) {
  case TaskStatus::Success:
    return TextColor::Green;
  case TaskStatus::SuccessWithWarning:
    return TextColor::Yellow;
  case TaskStatus::Failure:
    return TextColor::Red;
  case TaskStatus::Blocked:
    return TextColor::Gray;
  }
  return TextColor::Default;
}

auto make_banner(std::string_view title) -> std::string {
  auto banner = std::format("==[ {} ]==", title);
  if (banner.size() < kBannerWidth) {
    banner.append(kBannerWidth - banner.size(), '=');
  }
  return banner;
}

auto render_report_block(const TaskOutcome &outcome) -> std::string {
  auto block = make_banner(
      std::format("{}: {}", status_label(outcome.status), outcome.name));
  auto body = output::abridge_output(outcome.std_error);
  if (body.empty()) {
    body = output::abridge_output(outcome.std_output);
  }
  if (!body.empty()) {
    block.push_back('\n');
    block += body;
  }
  return block;
}

OutputCollator::OutputCollator(std::shared_ptr<ITerminal> terminal,
                               CollatorOptions options)
    : terminal_(terminal ? std::move(terminal)
                         : std::make_shared<ConsoleTerminal>()),
      options_(options) {}

auto OutputCollator::emit(std::string_view text, TextColor color,
                          TerminalStream stream) -> void {
  terminal_->write(stream, text, color);
}

auto OutputCollator::write_line(std::string_view text, TextColor color,
                                TerminalStream stream) -> void {
  std::lock_guard lock(mutex_);
  emit(std::format("{}\n", text), color, stream);
}

auto OutputCollator::collate(const TaskOutcome &outcome) -> void {
  switch (outcome.status) {
  case TaskStatus::Blocked:
    return;
  case TaskStatus::Success: {
    if (options_.quiet_mode) {
      return;
    }
    auto body = output::trim_output(outcome.std_output);
    std::lock_guard lock(mutex_);
    emit(std::format("{}\n", make_banner(outcome.name.value())),
         TextColor::Green, TerminalStream::Output);
    if (!body.empty()) {
      emit(std::format("{}\n", body), TextColor::Default,
           TerminalStream::Output);
    }
    return;
  }
  case TaskStatus::SuccessWithWarning:
  case TaskStatus::Failure: {
    auto block = render_report_block(outcome);
    std::lock_guard lock(mutex_);
    emit(std::format("{}\n", block), status_color(outcome.status),
         TerminalStream::Output);
    return;
  }
  }
}

} // namespace stagehand
