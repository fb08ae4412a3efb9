#pragma once

#include "simqueue/core/coroutine.hpp"
#include "simqueue/core/error.hpp"
#include "simqueue/util/log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <future>

namespace simqueue {

/// Runs `op` on an executor driven by other threads and blocks the caller
/// until it finishes. Must not be called from that executor's own thread.
template <typename Executor, typename T>
auto sync_wait(const Executor &ex, task<Result<T>> op) -> Result<T> {
  auto fut = co_spawn(ex, std::move(op), boost::asio::use_future);
  try {
    return fut.get();
  } catch (const std::exception &e) {
    log::error("Async operation failed: {}", e.what());
    return fail(Error::Unknown);
  }
}

/// Drives `io` on the calling thread until `op` completes. For tools and
/// tests that own a private io_context.
template <typename T>
auto run_task(boost::asio::io_context &io, task<T> op) -> T {
  auto fut = co_spawn(io, std::move(op), boost::asio::use_future);
  while (fut.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
    io.run_one();
  }
  io.restart();
  return fut.get();
}

} // namespace simqueue
