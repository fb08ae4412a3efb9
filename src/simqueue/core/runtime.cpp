#include "simqueue/core/runtime.hpp"

#include "simqueue/util/log.hpp"

#include <exception>
#include <ranges>

namespace simqueue {

Runtime::Runtime(unsigned num_shards) {
  if (num_shards == 0) {
    num_shards = 4;
  }
  contexts_.reserve(num_shards);
  for ([[maybe_unused]] auto i : std::views::iota(0U, num_shards)) {
    contexts_.emplace_back(std::make_unique<IoContext>(1));
  }
  work_guards_.resize(num_shards);
}

Runtime::~Runtime() noexcept { stop(); }

auto Runtime::start() -> Result<void> {
  if (running_.exchange(true))
    return ok();

  log::debug("Starting runtime with {} shards", contexts_.size());

  threads_.reserve(contexts_.size());
  for (auto i : std::views::iota(0U, shard_count())) {
    auto &ctx = *contexts_[i];
    ctx.restart();
    work_guards_[i].emplace(boost::asio::make_work_guard(ctx));
    threads_.emplace_back([this, i] { run_shard(i); });
  }
  return ok();
}

auto Runtime::stop() noexcept -> void {
  if (!running_.exchange(false))
    return;

  for (auto i : std::views::iota(0U, shard_count())) {
    work_guards_[i].reset();
    contexts_[i]->stop();
  }
  threads_.clear();
}

auto Runtime::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

// Exceptions escaping a detached handler are logged; the shard keeps running.
auto Runtime::run_shard(shard_id id) -> void {
  auto &ctx = *contexts_[id];
  while (!ctx.stopped()) {
    try {
      ctx.run();
    } catch (const std::exception &e) {
      log::error("Shard {} handler threw: {}", id, e.what());
    }
  }
}

} // namespace simqueue
