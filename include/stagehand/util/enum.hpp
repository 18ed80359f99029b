#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace stagehand {

/// Specialized per enum by STAGEHAND_DEFINE_ENUM_SERDE.
template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> std::optional<T>;

namespace util {

/// Lower-case alphanumerics only: "Success-With_Warning" -> "successwithwarning".
[[nodiscard]] inline auto normalize_enum_token(std::string_view token)
    -> std::string {
  std::string out;
  out.reserve(token.size());
  for (char c : token) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) != 0) {
      out.push_back(static_cast<char>(std::tolower(uc)));
    }
  }
  return out;
}

// "SuccessWithWarning" -> "success_with_warning"
[[nodiscard]] inline auto camel_to_snake(std::string_view name) -> std::string {
  std::string out;
  for (std::size_t i = 0; i < name.size(); ++i) {
    const auto uc = static_cast<unsigned char>(name[i]);
    if (i > 0 && std::isupper(uc) != 0) {
      out.push_back('_');
    }
    out.push_back(static_cast<char>(std::tolower(uc)));
  }
  return out;
}

/// snake_case name of a described enumerator, or "unknown".
template <typename E>
[[nodiscard]] auto enum_label(E value) noexcept -> std::string_view {
  using enumerators = boost::describe::describe_enumerators<E>;
  static const auto labels = [] {
    std::array<std::pair<E, std::string>,
               boost::mp11::mp_size<enumerators>::value>
        out{};
    std::size_t i = 0;
    boost::mp11::mp_for_each<enumerators>([&](auto d) {
      out[i++] = {d.value, camel_to_snake(d.name)};
    });
    return out;
  }();

  for (const auto &[v, label] : labels) {
    if (v == value) {
      return label;
    }
  }
  return "unknown";
}

/// Case, '_' and '-' are ignored: "success-with-warning" finds
/// SuccessWithWarning.
template <typename E>
[[nodiscard]] auto parse_enum(std::string_view text) noexcept
    -> std::optional<E> {
  const auto wanted = normalize_enum_token(text);
  std::optional<E> found;
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
      [&](auto d) {
        if (!found && wanted == normalize_enum_token(d.name)) {
          found = d.value;
        }
      });
  return found;
}

} // namespace util

#define STAGEHAND_DEFINE_ENUM_SERDE(EnumType)                                  \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept            \
      -> std::string_view {                                                    \
    return ::stagehand::util::enum_label(value);                               \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s) noexcept       \
      -> std::optional<EnumType> {                                             \
    return ::stagehand::util::parse_enum<EnumType>(s);                         \
  }

} // namespace stagehand
