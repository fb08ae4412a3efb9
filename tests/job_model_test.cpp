#include "simqueue/queue/job.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <chrono>

using namespace simqueue;
using test::make_input;

TEST(JobModelTest, StatusSpellings) {
  EXPECT_EQ(to_string_view(JobStatus::Pending), "pending");
  EXPECT_EQ(to_string_view(JobStatus::Running), "running");
  EXPECT_EQ(to_string_view(JobStatus::Completed), "completed");
  EXPECT_EQ(to_string_view(JobStatus::Failed), "failed");
  EXPECT_EQ(to_string_view(JobStatus::Cancelled), "cancelled");
}

TEST(JobModelTest, ParseStatusIsStrict) {
  EXPECT_EQ(parse<JobStatus>("running"), JobStatus::Running);
  EXPECT_EQ(parse<JobStatus>("cancelled"), JobStatus::Cancelled);
  EXPECT_FALSE(parse<JobStatus>("Running").has_value());
  EXPECT_FALSE(parse<JobStatus>("canceled").has_value());
  EXPECT_FALSE(parse<JobStatus>("").has_value());
}

TEST(JobModelTest, LegalTransitions) {
  EXPECT_TRUE(can_transition(JobStatus::Pending, JobStatus::Running));
  EXPECT_TRUE(can_transition(JobStatus::Pending, JobStatus::Cancelled));
  EXPECT_TRUE(can_transition(JobStatus::Running, JobStatus::Completed));
  EXPECT_TRUE(can_transition(JobStatus::Running, JobStatus::Failed));

  EXPECT_FALSE(can_transition(JobStatus::Pending, JobStatus::Completed));
  EXPECT_FALSE(can_transition(JobStatus::Running, JobStatus::Cancelled));
  EXPECT_FALSE(can_transition(JobStatus::Running, JobStatus::Pending));
}

TEST(JobModelTest, TerminalStatesHaveNoExits) {
  for (auto from : {JobStatus::Completed, JobStatus::Failed,
                    JobStatus::Cancelled}) {
    EXPECT_TRUE(is_terminal(from));
    util::for_each_enumerator<JobStatus>([&](JobStatus to) {
      EXPECT_FALSE(can_transition(from, to))
          << to_string_view(from) << " -> " << to_string_view(to);
    });
  }
  EXPECT_FALSE(is_terminal(JobStatus::Pending));
  EXPECT_FALSE(is_terminal(JobStatus::Running));
}

TEST(JobModelTest, ValidateFillsDefaultPriority) {
  auto r = validate_enqueue(make_input());
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->priority, kDefaultPriority);
}

TEST(JobModelTest, ValidateKeepsBoundaryPriorities) {
  auto low = validate_enqueue(make_input("svc", 0));
  ASSERT_TRUE(low.has_value());
  EXPECT_EQ(low->priority, 0);

  auto high = validate_enqueue(make_input("svc", 100));
  ASSERT_TRUE(high.has_value());
  EXPECT_EQ(high->priority, 100);
}

TEST(JobModelTest, ValidateRejectsOutOfRangePriority) {
  EXPECT_EQ(validate_enqueue(make_input("svc", -1)).error(),
            make_error_code(Error::InvalidArgument));
  EXPECT_EQ(validate_enqueue(make_input("svc", 101)).error(),
            make_error_code(Error::InvalidArgument));
}

TEST(JobModelTest, ValidateRequiresServiceAndConfigs) {
  EXPECT_FALSE(validate_enqueue(make_input("")).has_value());

  auto no_current = make_input();
  no_current.current_config.reset();
  EXPECT_FALSE(validate_enqueue(no_current).has_value());

  auto null_proposed = make_input();
  null_proposed.proposed_config = "null";
  EXPECT_FALSE(validate_enqueue(null_proposed).has_value());

  auto garbage = make_input();
  garbage.current_config = "{not json";
  EXPECT_FALSE(validate_enqueue(garbage).has_value());
}

TEST(JobModelTest, ValidateDropsNullOptionalBlobs) {
  auto in = make_input();
  in.context = "null";
  in.options = R"({"fast":true})";
  in.llm_provider = "";

  auto r = validate_enqueue(in);
  ASSERT_TRUE(r.has_value());
  EXPECT_FALSE(r->context.has_value());
  ASSERT_TRUE(r->options.has_value());
  EXPECT_EQ(*r->options, R"({"fast":true})");
  EXPECT_FALSE(r->llm_provider.has_value());
}

TEST(JobModelTest, PendingJobKeepsBlobBytes) {
  auto in = make_input();
  in.current_config = R"({ "a" : [1, 2,3] })";
  auto valid = validate_enqueue(in);
  ASSERT_TRUE(valid.has_value());

  const auto now = util::now_millis();
  auto job = make_pending_job(7, std::move(*valid), now);
  EXPECT_EQ(job.id, 7);
  EXPECT_EQ(job.status, JobStatus::Pending);
  EXPECT_EQ(job.current_config, R"({ "a" : [1, 2,3] })");
  EXPECT_EQ(job.queued_at, now);
  EXPECT_EQ(job.created_at, now);
  EXPECT_FALSE(job.started_at.has_value());
  EXPECT_FALSE(job.completed_at.has_value());
  EXPECT_FALSE(job.result.has_value());
  EXPECT_FALSE(job.error_message.has_value());
}

TEST(JobModelTest, ClaimOrder) {
  const auto t0 = util::now_millis();
  Job a;
  a.id = 1;
  a.priority = 10;
  a.queued_at = t0;
  Job b = a;
  b.id = 2;
  b.priority = 90;
  EXPECT_TRUE(claims_before(b, a));

  // Equal priority: older first.
  Job c = a;
  c.id = 3;
  c.queued_at = t0 - std::chrono::milliseconds(5);
  EXPECT_TRUE(claims_before(c, a));

  // Equal priority and time: lower id first.
  Job d = a;
  d.id = 4;
  EXPECT_TRUE(claims_before(a, d));
  EXPECT_FALSE(claims_before(d, a));
}

TEST(JobModelTest, StatsTotal) {
  QueueStats stats;
  stats.count_for(JobStatus::Pending) = 3;
  stats.count_for(JobStatus::Failed) = 2;
  EXPECT_EQ(stats.pending, 3);
  EXPECT_EQ(stats.failed, 2);
  EXPECT_EQ(stats.total(), 5);
}
