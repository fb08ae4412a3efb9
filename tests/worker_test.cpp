#include "simqueue/core/runtime.hpp"
#include "simqueue/storage/memory_job_store.hpp"
#include "simqueue/worker/simulation_worker.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

using namespace simqueue;
using namespace std::chrono_literals;
using test::make_input;
using test::run_coro;

namespace {

class FakeDelegate final : public ExecutionDelegate {
public:
  explicit FakeDelegate(Result<DelegateResponse> reply,
                        std::chrono::milliseconds delay = 0ms)
      : reply_(std::move(reply)), delay_(delay) {}

  auto evaluate(const Job &job) -> task<Result<DelegateResponse>> override {
    {
      std::scoped_lock lock(mu_);
      seen_.push_back(job.id);
    }
    started_.store(true);
    if (delay_ > 0ms) {
      boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
      timer.expires_after(delay_);
      auto [ec] = co_await timer.async_wait(use_nothrow);
      (void)ec;
    }
    co_return reply_;
  }

  auto seen() -> std::vector<JobId> {
    std::scoped_lock lock(mu_);
    return seen_;
  }
  [[nodiscard]] auto started() const -> bool { return started_.load(); }

private:
  Result<DelegateResponse> reply_;
  std::chrono::milliseconds delay_;
  std::mutex mu_;
  std::vector<JobId> seen_;
  std::atomic<bool> started_{false};
};

auto reply(unsigned status, std::string body) -> Result<DelegateResponse> {
  return DelegateResponse{.status = status, .body = std::move(body)};
}

auto fetch(storage::MemoryJobStore &store, JobId id) -> Job {
  auto job = run_coro(store.get_job(id));
  EXPECT_TRUE(job.has_value() && job->has_value());
  return **job;
}

} // namespace

TEST(WorkerTest, DescribeFailureSuccessIsNull) {
  EXPECT_FALSE(describe_failure(reply(200, R"({"ok":true})")).has_value());
  EXPECT_FALSE(describe_failure(reply(204, "null")).has_value());
}

TEST(WorkerTest, DescribeFailureTexts) {
  EXPECT_EQ(describe_failure(reply(500, "upstream exploded")),
            "delegate returned 500: upstream exploded");
  EXPECT_EQ(describe_failure(reply(200, "<html>")),
            "delegate returned 200 with a non-JSON body: <html>");
  EXPECT_EQ(describe_failure(fail(Error::Timeout)),
            "delegate request failed: timeout");
}

TEST(WorkerTest, DescribeFailureClipsLongBodies) {
  auto text = describe_failure(reply(502, std::string(20000, 'x')));
  ASSERT_TRUE(text.has_value());
  EXPECT_LT(text->size(), 8300U);
}

TEST(WorkerTest, RunOnceWithEmptyQueue) {
  storage::MemoryJobStore store;
  ASSERT_TRUE(run_coro(store.open()).has_value());
  FakeDelegate delegate(reply(200, "{}"));
  SimulationWorker worker(store, delegate, 10ms);

  auto r = run_coro(worker.run_once());
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(*r);
  EXPECT_TRUE(delegate.seen().empty());
}

TEST(WorkerTest, SuccessfulEvaluationCompletesJob) {
  storage::MemoryJobStore store;
  ASSERT_TRUE(run_coro(store.open()).has_value());
  FakeDelegate delegate(reply(200, R"({"recommendation":"ship it"})"));
  SimulationWorker worker(store, delegate, 10ms);
  auto job = store.enqueue_now(make_input());
  ASSERT_TRUE(job.has_value());

  auto r = run_coro(worker.run_once());
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(*r);

  auto done = fetch(store, job->id);
  EXPECT_EQ(done.status, JobStatus::Completed);
  EXPECT_EQ(done.result, R"({"recommendation":"ship it"})");
  EXPECT_FALSE(done.error_message.has_value());
  EXPECT_TRUE(done.started_at.has_value());
  EXPECT_TRUE(done.completed_at.has_value());
  EXPECT_EQ(worker.counters().completed, 1U);
}

TEST(WorkerTest, ErrorStatusFailsJob) {
  storage::MemoryJobStore store;
  ASSERT_TRUE(run_coro(store.open()).has_value());
  FakeDelegate delegate(reply(503, "overloaded"));
  SimulationWorker worker(store, delegate, 10ms);
  auto job = store.enqueue_now(make_input());
  ASSERT_TRUE(job.has_value());

  ASSERT_TRUE(run_coro(worker.run_once()).has_value());

  auto done = fetch(store, job->id);
  EXPECT_EQ(done.status, JobStatus::Failed);
  EXPECT_EQ(done.error_message, "delegate returned 503: overloaded");
  EXPECT_FALSE(done.result.has_value());
  EXPECT_EQ(worker.counters().failed, 1U);
}

TEST(WorkerTest, TransportErrorFailsJob) {
  storage::MemoryJobStore store;
  ASSERT_TRUE(run_coro(store.open()).has_value());
  FakeDelegate delegate(fail(Error::Timeout));
  SimulationWorker worker(store, delegate, 10ms);
  auto job = store.enqueue_now(make_input());
  ASSERT_TRUE(job.has_value());

  ASSERT_TRUE(run_coro(worker.run_once()).has_value());

  auto done = fetch(store, job->id);
  EXPECT_EQ(done.status, JobStatus::Failed);
  EXPECT_EQ(done.error_message, "delegate request failed: timeout");
}

TEST(WorkerTest, NonJsonSuccessFailsJob) {
  storage::MemoryJobStore store;
  ASSERT_TRUE(run_coro(store.open()).has_value());
  FakeDelegate delegate(reply(200, "not json"));
  SimulationWorker worker(store, delegate, 10ms);
  auto job = store.enqueue_now(make_input());
  ASSERT_TRUE(job.has_value());

  ASSERT_TRUE(run_coro(worker.run_once()).has_value());
  EXPECT_EQ(fetch(store, job->id).status, JobStatus::Failed);
}

TEST(WorkerTest, OneJobPerCycleInPriorityOrder) {
  storage::MemoryJobStore store;
  ASSERT_TRUE(run_coro(store.open()).has_value());
  FakeDelegate delegate(reply(200, "{}"));
  SimulationWorker worker(store, delegate, 10ms);
  auto low = store.enqueue_now(make_input("svc", 10));
  auto high = store.enqueue_now(make_input("svc", 90));
  ASSERT_TRUE(low.has_value() && high.has_value());

  ASSERT_TRUE(run_coro(worker.run_once()).has_value());
  EXPECT_EQ(delegate.seen(), std::vector<JobId>{high->id});
  EXPECT_EQ(fetch(store, low->id).status, JobStatus::Pending);

  ASSERT_TRUE(run_coro(worker.run_once()).has_value());
  EXPECT_EQ(delegate.seen(), (std::vector<JobId>{high->id, low->id}));
}

TEST(WorkerTest, LoopProcessesQueuedJobs) {
  Runtime runtime(1);
  ASSERT_TRUE(runtime.start().has_value());
  storage::MemoryJobStore store;
  ASSERT_TRUE(run_coro(store.open()).has_value());
  FakeDelegate delegate(reply(200, R"({"done":true})"));
  SimulationWorker worker(store, delegate, 20ms);

  auto a = store.enqueue_now(make_input());
  auto b = store.enqueue_now(make_input());
  ASSERT_TRUE(a.has_value() && b.has_value());

  worker.start(runtime.executor_for(0));
  EXPECT_TRUE(worker.is_running());
  EXPECT_TRUE(test::poll_until(
      [&] { return worker.counters().completed == 2; }, 5s));

  worker.request_stop();
  worker.wait_stopped();
  EXPECT_FALSE(worker.is_running());
  EXPECT_EQ(fetch(store, a->id).status, JobStatus::Completed);
  EXPECT_EQ(fetch(store, b->id).status, JobStatus::Completed);
  runtime.stop();
}

TEST(WorkerTest, StopLetsInFlightJobFinish) {
  Runtime runtime(1);
  ASSERT_TRUE(runtime.start().has_value());
  storage::MemoryJobStore store;
  ASSERT_TRUE(run_coro(store.open()).has_value());
  FakeDelegate delegate(reply(200, R"({"slow":true})"), 300ms);
  SimulationWorker worker(store, delegate, 10ms);

  auto job = store.enqueue_now(make_input());
  ASSERT_TRUE(job.has_value());

  worker.start(runtime.executor_for(0));
  ASSERT_TRUE(test::poll_until([&] { return delegate.started(); }, 5s));

  worker.request_stop();
  worker.wait_stopped();

  auto done = fetch(store, job->id);
  EXPECT_EQ(done.status, JobStatus::Completed);
  EXPECT_EQ(done.result, R"({"slow":true})");
  runtime.stop();
}

TEST(WorkerTest, DestroyingStartedWorkerWaitsForJob) {
  Runtime runtime(1);
  ASSERT_TRUE(runtime.start().has_value());
  storage::MemoryJobStore store;
  ASSERT_TRUE(run_coro(store.open()).has_value());
  FakeDelegate delegate(reply(200, R"({"late":true})"), 200ms);

  auto job = store.enqueue_now(make_input());
  ASSERT_TRUE(job.has_value());
  {
    SimulationWorker worker(store, delegate, 10ms);
    worker.start(runtime.executor_for(0));
    ASSERT_TRUE(test::poll_until([&] { return delegate.started(); }, 5s));
  }

  auto done = fetch(store, job->id);
  EXPECT_EQ(done.status, JobStatus::Completed);
  EXPECT_EQ(done.result, R"({"late":true})");
  runtime.stop();
}

TEST(WorkerTest, DestroyingIdleWorkerIsPrompt) {
  Runtime runtime(1);
  ASSERT_TRUE(runtime.start().has_value());
  storage::MemoryJobStore store;
  ASSERT_TRUE(run_coro(store.open()).has_value());
  FakeDelegate delegate(reply(200, "{}"));

  const auto begin = std::chrono::steady_clock::now();
  {
    SimulationWorker worker(store, delegate, 60s);
    worker.start(runtime.executor_for(0));
  }
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
  runtime.stop();
}

TEST(WorkerTest, StopWhileIdleIsPrompt) {
  Runtime runtime(1);
  ASSERT_TRUE(runtime.start().has_value());
  storage::MemoryJobStore store;
  ASSERT_TRUE(run_coro(store.open()).has_value());
  FakeDelegate delegate(reply(200, "{}"));
  SimulationWorker worker(store, delegate, 60s);

  worker.start(runtime.executor_for(0));
  const auto begin = std::chrono::steady_clock::now();
  worker.request_stop();
  worker.wait_stopped();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
  EXPECT_TRUE(worker.stop_requested());
  runtime.stop();
}

TEST(WorkerScenarioTest, ApprovedVerdictIsStored) {
  storage::MemoryJobStore store;
  ASSERT_TRUE(run_coro(store.open()).has_value());
  FakeDelegate delegate(reply(200, R"({"verdict":"approved"})"));
  SimulationWorker worker(store, delegate, 10ms);

  EnqueueInput in;
  in.user_id = 1;
  in.service_id = "svc1";
  in.current_config = R"({"heap":"2g"})";
  in.proposed_config = R"({"heap":"4g"})";
  in.priority = 80;
  auto job = store.enqueue_now(in);
  ASSERT_TRUE(job.has_value());

  ASSERT_TRUE(run_coro(worker.run_once()).value_or(false));
  auto done = fetch(store, job->id);
  EXPECT_EQ(done.status, JobStatus::Completed);
  EXPECT_EQ(done.result, R"({"verdict":"approved"})");
  EXPECT_FALSE(done.error_message.has_value());
  EXPECT_TRUE(done.completed_at.has_value());
}

TEST(WorkerScenarioTest, ServerErrorIsRecorded) {
  storage::MemoryJobStore store;
  ASSERT_TRUE(run_coro(store.open()).has_value());
  FakeDelegate delegate(reply(500, "internal error"));
  SimulationWorker worker(store, delegate, 10ms);
  auto job = store.enqueue_now(make_input("svc1", 80));
  ASSERT_TRUE(job.has_value());

  ASSERT_TRUE(run_coro(worker.run_once()).value_or(false));
  auto done = fetch(store, job->id);
  EXPECT_EQ(done.status, JobStatus::Failed);
  ASSERT_TRUE(done.error_message.has_value());
  EXPECT_NE(done.error_message->find("500"), std::string::npos);
  EXPECT_NE(done.error_message->find("internal error"), std::string::npos);
}
