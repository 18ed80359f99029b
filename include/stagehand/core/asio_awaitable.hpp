#pragma once

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace stagehand {

/// Completion token that reports errors as the first tuple element instead
/// of throwing.
inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

} // namespace stagehand
