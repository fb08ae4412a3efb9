#include "simqueue/app/application.hpp"
#include "simqueue/app/http/http_server.hpp"
#include "simqueue/app/http/router.hpp"
#include "simqueue/storage/job_store.hpp"
#include "simqueue/worker/simulation_worker.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <atomic>
#include <chrono>
#include <format>

using namespace simqueue;
using namespace std::chrono_literals;
using test::run_coro;

namespace {

auto job_status(JobStore &store, JobId id) -> std::optional<JobStatus> {
  auto job = run_coro(store.get_job(id));
  if (!job || !job->has_value()) {
    return std::nullopt;
  }
  return (*job)->status;
}

auto memory_config() -> Config {
  Config cfg;
  cfg.server.shards = 2;
  cfg.api.port = 0;
  cfg.worker.poll_interval = 20ms;
  cfg.worker.delegate_timeout = 5s;
  return cfg;
}

} // namespace

TEST(ApplicationTest, DefaultsAreAccessible) {
  Application app(Config{}, AppOptions{.api = false, .worker = false,
                                       .memory_store = true});
  EXPECT_EQ(app.config().api.host, "127.0.0.1");
  EXPECT_FALSE(app.is_running());
  EXPECT_EQ(app.api_port(), 0);
}

TEST(ApplicationTest, StartsApiOnEphemeralPort) {
  Application app(memory_config(),
                  AppOptions{.api = true, .worker = false,
                             .memory_store = true});
  ASSERT_TRUE(app.start().has_value());
  EXPECT_TRUE(app.is_running());
  EXPECT_NE(app.api_port(), 0);
  EXPECT_EQ(app.worker(), nullptr);
  app.stop();
  EXPECT_FALSE(app.is_running());
}

TEST(ApplicationTest, WorkerEvaluatesQueuedJobs) {
  Runtime delegate_rt(1);
  ASSERT_TRUE(delegate_rt.start().has_value());
  http::HttpServer delegate_server(delegate_rt);
  std::atomic<int> calls{0};
  delegate_server.router().post(
      "/api/v1/evaluate",
      [&calls](http::HttpRequest) -> task<http::HttpResponse> {
        calls.fetch_add(1);
        co_return http::HttpResponse::json(R"({"risk":"low"})");
      });
  ASSERT_TRUE(delegate_server.start("127.0.0.1", 0).has_value());

  auto cfg = memory_config();
  cfg.worker.delegate_url =
      std::format("http://127.0.0.1:{}", delegate_server.local_port());
  Application app(std::move(cfg), AppOptions{.api = false, .worker = true,
                                             .memory_store = true});
  ASSERT_TRUE(app.start().has_value());
  ASSERT_NE(app.worker(), nullptr);

  auto job = run_coro(app.store().enqueue(test::make_input()));
  ASSERT_TRUE(job.has_value());
  EXPECT_TRUE(test::poll_until(
      [&] {
        return job_status(app.store(), job->id) == JobStatus::Completed;
      },
      5s));
  EXPECT_EQ(calls.load(), 1);

  auto done = run_coro(app.store().get_job(job->id));
  ASSERT_TRUE(done.has_value() && done->has_value());
  EXPECT_EQ((*done)->result, R"({"risk":"low"})");

  app.stop();
  delegate_server.stop();
  delegate_rt.stop();
}

TEST(ApplicationTest, UnreachableDelegateFailsJob) {
  auto port = test::pick_unused_tcp_port();
  ASSERT_TRUE(port.has_value());
  auto cfg = memory_config();
  cfg.worker.delegate_url = std::format("http://127.0.0.1:{}", *port);
  Application app(std::move(cfg), AppOptions{.api = false, .worker = true,
                                             .memory_store = true});
  ASSERT_TRUE(app.start().has_value());

  auto job = run_coro(app.store().enqueue(test::make_input()));
  ASSERT_TRUE(job.has_value());
  EXPECT_TRUE(test::poll_until(
      [&] { return job_status(app.store(), job->id) == JobStatus::Failed; },
      5s));

  auto failed = run_coro(app.store().get_job(job->id));
  ASSERT_TRUE(failed.has_value() && failed->has_value());
  ASSERT_TRUE((*failed)->error_message.has_value());
  EXPECT_TRUE((*failed)->error_message->starts_with("delegate request failed"));
  app.stop();
}

TEST(ApplicationTest, InvalidDelegateUrlAbortsStart) {
  auto cfg = memory_config();
  cfg.worker.delegate_url = "not a url at all";
  Application app(std::move(cfg), AppOptions{.api = false, .worker = true,
                                             .memory_store = true});
  EXPECT_FALSE(app.start().has_value());
  EXPECT_FALSE(app.is_running());
}
