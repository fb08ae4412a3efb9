#pragma once

#include "simqueue/core/coroutine.hpp"
#include "simqueue/queue/job.hpp"

#include <benchmark/benchmark.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <format>
#include <string>

namespace simqueue::bench {

constexpr int kSmallSize = 100;
constexpr int kMediumSize = 1000;
constexpr int kLargeSize = 10000;

// Drive one coroutine on a local io_context without a full Runtime.
template <typename T>
[[nodiscard]] auto run_on_io(boost::asio::io_context &io, task<T> t) -> T {
  auto fut = boost::asio::co_spawn(io, std::move(t), boost::asio::use_future);
  io.run();
  io.restart();
  return fut.get();
}

[[nodiscard]] inline auto make_bench_input(int i) -> EnqueueInput {
  EnqueueInput in;
  in.user_id = 1 + i % 16;
  in.service_id = std::format("svc-{}", i % 32);
  in.current_config = std::format(R"({{"replicas":{}}})", i % 8);
  in.proposed_config = std::format(R"({{"replicas":{}}})", i % 8 + 1);
  in.priority = i % 101;
  return in;
}

} // namespace simqueue::bench
