#pragma once

#include "stagehand/core/error.hpp"
#include "stagehand/util/log.hpp"

#include <glaze/toml.hpp>

#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace stagehand::toml_util {

[[nodiscard]] inline auto read_file(std::string_view path)
    -> Result<std::string> {
  std::ifstream in(std::string(path), std::ios::binary);
  if (!in) {
    return fail(Error::FileNotFound,
                std::format("Cannot open '{}'", path));
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

/// Parse TOML text into a glaze-described struct. Unknown keys are ignored;
/// the glaze diagnostic becomes the error detail.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text) -> Result<T> {
  T raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    auto detail = glz::format_error(ec, text);
    log::debug("TOML parse error: {}", detail);
    return fail(Error::ParseError, std::move(detail));
  }
  return ok(std::move(raw));
}

} // namespace stagehand::toml_util
