#pragma once

#include "stagehand/core/error.hpp"

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <variant>

namespace stagehand {

/// How a caller spells the limit: a count, or text such as "4" or "max".
using ParallelismSetting = std::variant<int, std::string>;

// Upper bound on concurrently running tasks. Either a positive count or
// unbounded ("max"/"all": every ready task may run at once).
class Parallelism {
public:
  [[nodiscard]] static auto parse(std::string_view text) -> Result<Parallelism>;
  [[nodiscard]] static auto from_count(long long count) -> Result<Parallelism>;
  [[nodiscard]] static auto from_setting(const ParallelismSetting &setting)
      -> Result<Parallelism>;
  [[nodiscard]] static constexpr auto unbounded() noexcept -> Parallelism {
    return Parallelism{kUnbounded};
  }

  [[nodiscard]] constexpr auto is_unbounded() const noexcept -> bool {
    return limit_ == kUnbounded;
  }
  [[nodiscard]] constexpr auto limit() const noexcept -> std::size_t {
    return limit_;
  }
  [[nodiscard]] auto to_string() const -> std::string;

  [[nodiscard]] friend constexpr auto operator==(Parallelism,
                                                 Parallelism) -> bool = default;

private:
  static constexpr std::size_t kUnbounded =
      std::numeric_limits<std::size_t>::max();

  constexpr explicit Parallelism(std::size_t limit) noexcept : limit_(limit) {}

  std::size_t limit_;
};

} // namespace stagehand
