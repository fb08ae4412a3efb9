#pragma once

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace simqueue {

/// Completion token for socket and timer waits: `auto [ec, n] = co_await
/// op(use_nothrow);`. Timeouts come back as operation_aborted in `ec`.
inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

} // namespace simqueue
