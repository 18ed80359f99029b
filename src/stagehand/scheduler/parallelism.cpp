#include "stagehand/scheduler/parallelism.hpp"

#include <boost/algorithm/string/predicate.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

namespace stagehand {

auto Parallelism::parse(std::string_view text) -> Result<Parallelism> {
  if (boost::algorithm::iequals(text, "max") ||
      boost::algorithm::iequals(text, "all")) {
    return ok(unbounded());
  }

  const bool all_digits =
      !text.empty() && std::ranges::all_of(text, [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      });
  if (!all_digits) {
    return fail(Error::InvalidParallelism,
                std::format("Invalid parallelism value of '{}', expected a "
                            "positive number or 'max'",
                            text));
  }

  long long count = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                   count);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return fail(Error::InvalidParallelism,
                std::format("Invalid parallelism value of '{}'", text));
  }
  return from_count(count);
}

auto Parallelism::from_count(long long count) -> Result<Parallelism> {
  if (count < 1) {
    return fail(Error::InvalidParallelism,
                std::format("Invalid parallelism value of '{}', expected a "
                            "positive number or 'max'",
                            count));
  }
  return ok(Parallelism{static_cast<std::size_t>(count)});
}

auto Parallelism::from_setting(const ParallelismSetting &setting)
    -> Result<Parallelism> {
  if (const auto *count = std::get_if<int>(&setting)) {
    return from_count(*count);
  }
  return parse(std::get<std::string>(setting));
}

auto Parallelism::to_string() const -> std::string {
  return is_unbounded() ? std::string{"max"} : std::to_string(limit_);
}

} // namespace stagehand
