#include "simqueue/worker/simulation_worker.hpp"

#include "simqueue/core/asio_awaitable.hpp"
#include "simqueue/util/json.hpp"
#include "simqueue/util/log.hpp"

#include <boost/asio/post.hpp>

#include <format>

namespace simqueue {

namespace {

constexpr std::size_t kMaxBodyInError = 8192;

[[nodiscard]] auto clip(std::string_view body) -> std::string_view {
  return body.substr(0, kMaxBodyInError);
}

} // namespace

auto describe_failure(const Result<DelegateResponse> &outcome)
    -> std::optional<std::string> {
  if (!outcome) {
    return std::format("delegate request failed: {}",
                       outcome.error().message());
  }
  if (!outcome->is_success()) {
    return std::format("delegate returned {}: {}", outcome->status,
                       clip(outcome->body));
  }
  if (!is_valid_json(outcome->body)) {
    return std::format("delegate returned {} with a non-JSON body: {}",
                       outcome->status, clip(outcome->body));
  }
  return std::nullopt;
}

SimulationWorker::SimulationWorker(JobStore &store,
                                   ExecutionDelegate &delegate,
                                   std::chrono::milliseconds poll_interval)
    : store_(store), delegate_(delegate), poll_interval_(poll_interval) {}

SimulationWorker::~SimulationWorker() {
  request_stop();
  wait_stopped();
}

auto SimulationWorker::start(boost::asio::any_io_executor executor) -> void {
  if (running_.exchange(true)) {
    return;
  }
  stop_requested_.store(false);
  strand_.emplace(boost::asio::make_strand(std::move(executor)));
  timer_ = std::make_shared<boost::asio::steady_timer>(*strand_);
  exited_ = std::make_shared<std::atomic<bool>>(false);
  co_spawn(*strand_, run_loop(), detached);
}

auto SimulationWorker::request_stop() -> void {
  if (stop_requested_.exchange(true) || !strand_) {
    return;
  }
  // The timer is only touched on the strand; an in-flight job is never
  // waiting on it, so cancelling cannot interrupt a job.
  boost::asio::post(*strand_, [timer = timer_] { timer->cancel(); });
}

auto SimulationWorker::wait_stopped() const -> void {
  if (auto exited = exited_) {
    exited->wait(false, std::memory_order_acquire);
  }
}

auto SimulationWorker::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto SimulationWorker::stop_requested() const noexcept -> bool {
  return stop_requested_.load(std::memory_order_acquire);
}

auto SimulationWorker::counters() const noexcept -> Counters {
  return {claimed_.load(), completed_.load(), failed_.load()};
}

auto SimulationWorker::run_loop() -> spawn_task {
  const auto exited = exited_;
  log::info("Simulation worker started (poll interval {}ms)",
            poll_interval_.count());

  while (!stop_requested()) {
    timer_->expires_after(poll_interval_);
    auto [ec] = co_await timer_->async_wait(use_nothrow);
    (void)ec;
    if (stop_requested()) {
      break;
    }
    if (auto r = co_await run_once(); !r) {
      log::warn("Simulation worker tick failed: {}", r.error().message());
    }
  }

  log::info("Simulation worker stopped");
  running_.store(false, std::memory_order_release);
  exited->store(true, std::memory_order_release);
  exited->notify_all();
}

auto SimulationWorker::run_once() -> task<Result<bool>> {
  auto claimed = co_await store_.claim_next_ready();
  if (!claimed) {
    log::error("Failed to claim next job: {}", claimed.error().message());
    co_return fail(claimed.error());
  }
  if (!claimed->has_value()) {
    co_return ok(false);
  }

  const Job job = std::move(**claimed);
  claimed_.fetch_add(1, std::memory_order_relaxed);
  log::info("Processing simulation job {} (service={}, user={}, "
            "priority={})",
            job.id, job.service_id, job.user_id, job.priority);

  auto outcome = co_await delegate_.evaluate(job);
  if (auto written = co_await record_outcome(job, outcome); !written) {
    // InvalidState: someone else already finished this job.
    log::error("Job {}: recording outcome failed: {}", job.id,
               written.error().message());
  }
  co_return ok(true);
}

auto SimulationWorker::record_outcome(const Job &job,
                                      const Result<DelegateResponse> &outcome)
    -> task<Result<void>> {
  if (auto failure = describe_failure(outcome)) {
    failed_.fetch_add(1, std::memory_order_relaxed);
    log::warn("Simulation job {} failed: {}", job.id, *failure);
    co_return co_await store_.mark_failed(job.id, std::move(*failure));
  }

  completed_.fetch_add(1, std::memory_order_relaxed);
  log::info("Simulation job {} completed", job.id);
  co_return co_await store_.mark_completed(job.id, outcome->body);
}

} // namespace simqueue
