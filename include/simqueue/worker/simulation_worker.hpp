#pragma once

#include "simqueue/core/coroutine.hpp"
#include "simqueue/core/error.hpp"
#include "simqueue/execution/execution_delegate.hpp"
#include "simqueue/storage/job_store.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace simqueue {

/// Polls the store once per interval, claims at most one job per tick, runs
/// it through the delegate and records the outcome. There is no retry: a
/// failed evaluation fails the job permanently.
///
/// request_stop() is observed between ticks. A job already handed to the
/// delegate always finishes, and its outcome is written, before the loop
/// exits. Destroying a started worker stops it and blocks until the loop has
/// exited, so it must not be destroyed from the executor it runs on.
class SimulationWorker {
public:
  struct Counters {
    std::uint64_t claimed{0};
    std::uint64_t completed{0};
    std::uint64_t failed{0};
  };

  SimulationWorker(JobStore &store, ExecutionDelegate &delegate,
                   std::chrono::milliseconds poll_interval);
  ~SimulationWorker();

  SimulationWorker(const SimulationWorker &) = delete;
  SimulationWorker &operator=(const SimulationWorker &) = delete;

  auto start(boost::asio::any_io_executor executor) -> void;
  auto request_stop() -> void;
  /// Blocks the calling thread until the loop has exited. Must not be
  /// called from the executor the worker runs on.
  auto wait_stopped() const -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;
  [[nodiscard]] auto stop_requested() const noexcept -> bool;

  /// One claim-and-execute cycle. Yields true when a job was processed,
  /// false when nothing was pending.
  auto run_once() -> task<Result<bool>>;

  [[nodiscard]] auto counters() const noexcept -> Counters;

private:
  auto run_loop() -> spawn_task;
  auto record_outcome(const Job &job, const Result<DelegateResponse> &outcome)
      -> task<Result<void>>;

  JobStore &store_;
  ExecutionDelegate &delegate_;
  std::chrono::milliseconds poll_interval_;

  std::optional<boost::asio::strand<boost::asio::any_io_executor>> strand_;
  // Shared with the stop handler, which may run after the loop has exited.
  std::shared_ptr<boost::asio::steady_timer> timer_;
  // Set by the loop's frame as its last touch of worker state; one per run.
  std::shared_ptr<std::atomic<bool>> exited_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};

  std::atomic<std::uint64_t> claimed_{0};
  std::atomic<std::uint64_t> completed_{0};
  std::atomic<std::uint64_t> failed_{0};
};

/// Text stored in error_message for an evaluation that did not succeed.
[[nodiscard]] auto describe_failure(const Result<DelegateResponse> &outcome)
    -> std::optional<std::string>;

} // namespace simqueue
