#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

namespace stagehand {

template <typename T = void> using task = boost::asio::awaitable<T>;

using boost::asio::co_spawn;
using boost::asio::detached;

} // namespace stagehand
