#pragma once

#include "simqueue/core/coroutine.hpp"
#include "simqueue/core/error.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <cassert>
#include <cstdint>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace simqueue {

using IoContext = boost::asio::io_context;
using shard_id = unsigned;

/// A fixed set of io_contexts, each driven by its own thread. Connections,
/// the worker loop and API handlers are spawned onto these shards.
class Runtime {
public:
  explicit Runtime(unsigned num_shards = 0);
  ~Runtime() noexcept;

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  template <typename T> auto spawn_on(shard_id target, task<T> coro) -> void {
    assert(target < contexts_.size());
    co_spawn(contexts_[target]->get_executor(), std::move(coro), detached);
  }

  /// Round-robin across shards, used for accepted connections.
  template <typename T> auto spawn_external(task<T> coro) -> void {
    auto target = static_cast<shard_id>(
        external_rr_.fetch_add(1, std::memory_order_relaxed) %
        contexts_.size());
    spawn_on(target, std::move(coro));
  }

  [[nodiscard]] auto shard_count() const noexcept -> unsigned {
    return static_cast<unsigned>(contexts_.size());
  }
  [[nodiscard]] auto context(shard_id id) noexcept -> IoContext & {
    assert(id < contexts_.size());
    return *contexts_[id];
  }
  [[nodiscard]] auto executor_for(shard_id id) -> IoContext::executor_type {
    return context(id).get_executor();
  }

private:
  auto run_shard(shard_id id) -> void;

  std::atomic<bool> running_{false};
  std::vector<std::unique_ptr<IoContext>> contexts_;
  std::vector<
      std::optional<boost::asio::executor_work_guard<IoContext::executor_type>>>
      work_guards_;
  std::vector<std::jthread> threads_;
  std::atomic<std::uint64_t> external_rr_{0};
};

} // namespace simqueue
