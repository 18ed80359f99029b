#include "stagehand/output/abridge.hpp"

#include <format>
#include <ranges>
#include <span>

namespace stagehand::output {

namespace {

[[nodiscard]] auto rstrip(std::string_view line) -> std::string_view {
  const auto end = line.find_last_not_of(" \t\r\f\v");
  return end == std::string_view::npos ? std::string_view{}
                                       : line.substr(0, end + 1);
}

// Lines are separated, not terminated, by '\n'. `continues` means `out`
// already holds a line that the first of `lines` must follow.
auto append_joined(std::string &out, std::span<const std::string_view> lines,
                   bool continues) -> void {
  for (auto line : lines) {
    if (continues) {
      out.push_back('\n');
    }
    out.append(line);
    continues = true;
  }
}

} // namespace

auto trimmed_lines(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> lines;
  for (auto part : text | std::views::split('\n')) {
    lines.push_back(rstrip(std::string_view(part.begin(), part.end())));
  }
  while (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }
  return lines;
}

auto trim_output(std::string_view text) -> std::string {
  auto lines = trimmed_lines(text);
  std::string out;
  out.reserve(text.size());
  append_joined(out, lines, false);
  return out;
}

auto abridge_output(std::string_view text) -> std::string {
  auto lines = trimmed_lines(text);
  std::string out;
  if (lines.size() <= kAbridgeThreshold) {
    append_joined(out, lines, false);
    return out;
  }

  const std::span<const std::string_view> all{lines};
  append_joined(out, all.first(kAbridgeHead), false);
  out += std::format("\n[...{} lines omitted...]",
                     lines.size() - kAbridgeHead - kAbridgeTail);
  append_joined(out, all.last(kAbridgeTail), true);
  return out;
}

} // namespace stagehand::output
