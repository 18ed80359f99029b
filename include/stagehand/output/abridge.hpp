#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace stagehand::output {

inline constexpr std::size_t kAbridgeThreshold = 12;
inline constexpr std::size_t kAbridgeHead = 4;
inline constexpr std::size_t kAbridgeTail = 4;

/// Split on '\n' and strip trailing whitespace (including '\r') from every
/// line. Trailing blank lines are dropped; leading and interior ones stay.
[[nodiscard]] auto trimmed_lines(std::string_view text)
    -> std::vector<std::string_view>;

/// Trimmed lines rejoined with '\n', no trailing newline.
[[nodiscard]] auto trim_output(std::string_view text) -> std::string;

/// trim_output(), and when more than kAbridgeThreshold lines remain only the
/// first kAbridgeHead and last kAbridgeTail are kept around a single
/// "[...N lines omitted...]" marker.
[[nodiscard]] auto abridge_output(std::string_view text) -> std::string;

} // namespace stagehand::output
