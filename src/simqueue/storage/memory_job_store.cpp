#include "simqueue/storage/memory_job_store.hpp"

#include <algorithm>
#include <ranges>
#include <vector>

namespace simqueue::storage {

auto MemoryJobStore::pending_key(const Job &job) -> PendingKey {
  return {-job.priority, util::to_unix_millis(job.queued_at), job.id};
}

auto MemoryJobStore::open() -> task<Result<void>> {
  open_.store(true, std::memory_order_release);
  co_return ok();
}

auto MemoryJobStore::close() -> task<void> {
  open_.store(false, std::memory_order_release);
  co_return;
}

auto MemoryJobStore::is_open() const noexcept -> bool {
  return open_.load(std::memory_order_acquire);
}

auto MemoryJobStore::ping() -> task<Result<void>> {
  if (!is_open()) {
    co_return fail(Error::SystemNotRunning);
  }
  co_return ok();
}

auto MemoryJobStore::enqueue_now(EnqueueInput input) -> Result<Job> {
  if (!is_open()) {
    return fail(Error::SystemNotRunning);
  }
  auto valid = validate_enqueue(std::move(input));
  if (!valid) {
    return fail(valid.error());
  }

  std::scoped_lock lock(mu_);
  auto job = make_pending_job(next_id_++, std::move(*valid), util::now_millis());
  pending_.insert(pending_key(job));
  auto [it, inserted] = jobs_.emplace(job.id, std::move(job));
  return ok(it->second);
}

auto MemoryJobStore::claim_now() -> Result<std::optional<Job>> {
  if (!is_open()) {
    return fail(Error::SystemNotRunning);
  }
  std::scoped_lock lock(mu_);
  if (pending_.empty()) {
    return ok(std::optional<Job>{});
  }
  auto key = *pending_.begin();
  pending_.erase(pending_.begin());

  auto &job = jobs_.at(std::get<2>(key));
  const auto now = util::now_millis();
  job.status = JobStatus::Running;
  job.started_at = now;
  job.updated_at = now;
  return ok(std::optional<Job>{job});
}

auto MemoryJobStore::finish_now(JobId id, JobStatus terminal,
                                std::string payload) -> Result<void> {
  if (!is_open()) {
    return fail(Error::SystemNotRunning);
  }
  if (terminal != JobStatus::Completed && terminal != JobStatus::Failed) {
    return fail(Error::InvalidArgument);
  }

  std::scoped_lock lock(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    return fail(Error::NotFound);
  }
  auto &job = it->second;
  if (!can_transition(job.status, terminal)) {
    return fail(Error::InvalidState);
  }

  const auto now = util::now_millis();
  if (terminal == JobStatus::Completed) {
    job.result = std::move(payload);
  } else {
    job.error_message = std::move(payload);
  }
  job.status = terminal;
  job.completed_at = now;
  job.updated_at = now;
  return ok();
}

auto MemoryJobStore::cancel_now(JobId id) -> Result<void> {
  if (!is_open()) {
    return fail(Error::SystemNotRunning);
  }
  std::scoped_lock lock(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end() ||
      !can_transition(it->second.status, JobStatus::Cancelled)) {
    return fail(Error::Conflict);
  }
  auto &job = it->second;
  pending_.erase(pending_key(job));
  const auto now = util::now_millis();
  job.status = JobStatus::Cancelled;
  job.completed_at = now;
  job.updated_at = now;
  return ok();
}

auto MemoryJobStore::enqueue(EnqueueInput input) -> task<Result<Job>> {
  co_return enqueue_now(std::move(input));
}

auto MemoryJobStore::claim_next_ready() -> task<Result<std::optional<Job>>> {
  co_return claim_now();
}

auto MemoryJobStore::mark_completed(JobId id, std::string result)
    -> task<Result<void>> {
  co_return finish_now(id, JobStatus::Completed, std::move(result));
}

auto MemoryJobStore::mark_failed(JobId id, std::string error_message)
    -> task<Result<void>> {
  co_return finish_now(id, JobStatus::Failed, std::move(error_message));
}

auto MemoryJobStore::cancel_job(JobId id) -> task<Result<void>> {
  co_return cancel_now(id);
}

auto MemoryJobStore::get_job(JobId id) -> task<Result<std::optional<Job>>> {
  if (!is_open()) {
    co_return fail(Error::SystemNotRunning);
  }
  std::scoped_lock lock(mu_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) {
    co_return ok(std::optional<Job>{});
  }
  co_return ok(std::optional<Job>{it->second});
}

auto MemoryJobStore::list_jobs(JobFilter filter, std::int64_t limit,
                               std::int64_t offset) -> task<Result<JobPage>> {
  if (!is_open()) {
    co_return fail(Error::SystemNotRunning);
  }
  if (limit < 0 || offset < 0) {
    co_return fail(Error::InvalidArgument);
  }

  std::vector<const Job *> matched;
  JobPage page;
  {
    std::scoped_lock lock(mu_);
    for (const auto &job : jobs_ | std::views::values) {
      if (filter.user_id && job.user_id != *filter.user_id) {
        continue;
      }
      if (filter.status && job.status != *filter.status) {
        continue;
      }
      matched.push_back(&job);
    }
    std::ranges::sort(matched, [](const Job *a, const Job *b) {
      return claims_before(*a, *b);
    });

    page.total = std::ssize(matched);
    auto window = matched | std::views::drop(offset) | std::views::take(limit);
    for (const auto *job : window) {
      page.jobs.push_back(*job);
    }
  }
  co_return ok(std::move(page));
}

auto MemoryJobStore::get_queue_stats() -> task<Result<QueueStats>> {
  if (!is_open()) {
    co_return fail(Error::SystemNotRunning);
  }
  QueueStats stats;
  {
    std::scoped_lock lock(mu_);
    for (const auto &job : jobs_ | std::views::values) {
      ++stats.count_for(job.status);
    }
  }
  co_return ok(stats);
}

} // namespace simqueue::storage
