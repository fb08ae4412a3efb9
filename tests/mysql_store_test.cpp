#include "simqueue/core/runtime.hpp"
#include "simqueue/core/sync_wait.hpp"
#include "simqueue/storage/mysql_job_store.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace simqueue;

namespace {

auto env_or_default(const char *name, std::string fallback) -> std::string {
  if (const char *v = std::getenv(name); v != nullptr && *v != '\0') {
    return v;
  }
  return fallback;
}

auto close_store(JobStore &store) -> task<Result<void>> {
  co_await store.close();
  co_return ok();
}

// Runs against a real server only when SIMQUEUE_TEST_MYSQL_HOST is set.
class MySQLStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    if (std::getenv("SIMQUEUE_TEST_MYSQL_HOST") == nullptr) {
      GTEST_SKIP() << "SIMQUEUE_TEST_MYSQL_HOST not set";
    }
    DatabaseConfig cfg;
    cfg.host = env_or_default("SIMQUEUE_TEST_MYSQL_HOST", cfg.host);
    cfg.username = env_or_default("SIMQUEUE_TEST_MYSQL_USER", cfg.username);
    cfg.password = env_or_default("SIMQUEUE_TEST_MYSQL_PASSWORD", cfg.password);
    cfg.database = env_or_default("SIMQUEUE_TEST_MYSQL_DB", "simqueue_test");

    ASSERT_TRUE(runtime_.start().has_value());
    store_ = std::make_unique<storage::MySQLJobStore>(runtime_.executor_for(0),
                                                      cfg);
    if (auto r = run(store_->open()); !r) {
      GTEST_SKIP() << "MySQL unavailable: " << r.error().message();
    }
    drain_pending();

    user_ = static_cast<UserId>(
        std::chrono::steady_clock::now().time_since_epoch().count() %
        1'000'000'000);
  }

  void TearDown() override {
    if (store_) {
      EXPECT_TRUE(run(close_store(*store_)).has_value());
    }
    runtime_.stop();
  }

  template <typename T> auto run(task<Result<T>> op) -> Result<T> {
    return sync_wait(runtime_.executor_for(0), std::move(op));
  }

  // Leftover pending rows from earlier runs would win claims.
  auto drain_pending() -> void {
    while (true) {
      auto job = run(store_->claim_next_ready());
      ASSERT_TRUE(job.has_value());
      if (!job->has_value()) {
        return;
      }
      ASSERT_TRUE(
          run(store_->mark_failed((*job)->id, "drained by test")).has_value());
    }
  }

  auto enqueue(std::optional<int> priority = std::nullopt) -> Job {
    auto job = run(store_->enqueue(test::make_input("svc", priority, user_)));
    EXPECT_TRUE(job.has_value());
    return *job;
  }

  auto fetch(JobId id) -> Job {
    auto job = run(store_->get_job(id));
    EXPECT_TRUE(job.has_value() && job->has_value());
    return **job;
  }

  Runtime runtime_{1};
  std::unique_ptr<storage::MySQLJobStore> store_;
  UserId user_{1};
};

} // namespace

TEST_F(MySQLStoreTest, EnqueueAndGet) {
  auto job = enqueue(70);
  EXPECT_GT(job.id, 0);
  EXPECT_EQ(job.status, JobStatus::Pending);
  EXPECT_EQ(job.priority, 70);

  auto got = fetch(job.id);
  EXPECT_EQ(got.user_id, user_);
  EXPECT_EQ(got.service_id, "svc");
  EXPECT_EQ(got.current_config, R"({"replicas":2})");
  EXPECT_EQ(got.proposed_config, R"({"replicas":4})");
  EXPECT_FALSE(got.started_at.has_value());
}

TEST_F(MySQLStoreTest, ClaimOrderAndLifecycle) {
  auto low = enqueue(10);
  auto high = enqueue(90);
  auto mid = enqueue(50);

  std::vector<JobId> order;
  for (int i = 0; i < 3; ++i) {
    auto claimed = run(store_->claim_next_ready());
    ASSERT_TRUE(claimed.has_value() && claimed->has_value());
    EXPECT_EQ((*claimed)->status, JobStatus::Running);
    order.push_back((*claimed)->id);
  }
  EXPECT_EQ(order, (std::vector<JobId>{high.id, mid.id, low.id}));

  ASSERT_TRUE(run(store_->mark_completed(high.id, R"({"ok":1})")).has_value());
  ASSERT_TRUE(run(store_->mark_failed(mid.id, "boom")).has_value());

  auto done = fetch(high.id);
  EXPECT_EQ(done.status, JobStatus::Completed);
  EXPECT_EQ(done.result, R"({"ok":1})");
  EXPECT_TRUE(done.completed_at.has_value());
  EXPECT_EQ(fetch(mid.id).error_message, "boom");

  auto again = run(store_->mark_failed(high.id, "late"));
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error(), make_error_code(Error::InvalidState));
}

TEST_F(MySQLStoreTest, ConcurrentClaimsAreDistinct) {
  constexpr int kJobs = 40;
  for (int i = 0; i < kJobs; ++i) {
    enqueue(i % 5 * 10);
  }

  std::mutex mu;
  std::vector<JobId> claimed;
  {
    std::vector<std::jthread> threads;
    for (int t = 0; t < 4; ++t) {
      threads.emplace_back([&] {
        while (true) {
          auto job = run(store_->claim_next_ready());
          if (!job || !job->has_value()) {
            return;
          }
          std::scoped_lock lock(mu);
          claimed.push_back((*job)->id);
        }
      });
    }
  }
  std::set<JobId> unique(claimed.begin(), claimed.end());
  EXPECT_EQ(claimed.size(), static_cast<std::size_t>(kJobs));
  EXPECT_EQ(unique.size(), claimed.size());
}

TEST_F(MySQLStoreTest, CancelOnlyPending) {
  auto pending = enqueue(1);
  ASSERT_TRUE(run(store_->cancel_job(pending.id)).has_value());
  EXPECT_EQ(fetch(pending.id).status, JobStatus::Cancelled);

  auto twice = run(store_->cancel_job(pending.id));
  ASSERT_FALSE(twice.has_value());
  EXPECT_EQ(twice.error(), make_error_code(Error::Conflict));
}

TEST_F(MySQLStoreTest, ListByUser) {
  enqueue();
  enqueue();
  enqueue();
  auto page = run(store_->list_jobs({.user_id = user_, .status = {}}, 2, 0));
  ASSERT_TRUE(page.has_value());
  EXPECT_EQ(page->total, 3);
  EXPECT_EQ(page->jobs.size(), 2U);

  auto stats = run(store_->get_queue_stats());
  ASSERT_TRUE(stats.has_value());
  EXPECT_GE(stats->pending, 3);
}
