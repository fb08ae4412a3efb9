#pragma once

#include "simqueue/storage/job_store.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <tuple>

namespace simqueue::storage {

/// In-process JobStore. One mutex guards all rows, so a claim is atomic
/// with respect to every other operation; the pending index keeps claims
/// logarithmic. Outside open()/close() every operation fails with
/// Error::SystemNotRunning.
class MemoryJobStore final : public JobStore {
public:
  MemoryJobStore() = default;

  MemoryJobStore(const MemoryJobStore &) = delete;
  MemoryJobStore &operator=(const MemoryJobStore &) = delete;

  auto open() -> task<Result<void>> override;
  auto close() -> task<void> override;
  [[nodiscard]] auto is_open() const noexcept -> bool override;
  auto ping() -> task<Result<void>> override;

  auto enqueue(EnqueueInput input) -> task<Result<Job>> override;
  auto claim_next_ready() -> task<Result<std::optional<Job>>> override;
  auto mark_completed(JobId id, std::string result)
      -> task<Result<void>> override;
  auto mark_failed(JobId id, std::string error_message)
      -> task<Result<void>> override;
  auto cancel_job(JobId id) -> task<Result<void>> override;
  auto get_job(JobId id) -> task<Result<std::optional<Job>>> override;
  auto list_jobs(JobFilter filter, std::int64_t limit, std::int64_t offset)
      -> task<Result<JobPage>> override;
  auto get_queue_stats() -> task<Result<QueueStats>> override;

  // Synchronous forms; the coroutine overrides delegate to these.
  [[nodiscard]] auto enqueue_now(EnqueueInput input) -> Result<Job>;
  [[nodiscard]] auto claim_now() -> Result<std::optional<Job>>;
  [[nodiscard]] auto finish_now(JobId id, JobStatus terminal,
                                std::string payload) -> Result<void>;
  [[nodiscard]] auto cancel_now(JobId id) -> Result<void>;

private:
  // (-priority, queued_at millis, id): begin() is the next job to claim.
  using PendingKey = std::tuple<int, std::int64_t, JobId>;

  [[nodiscard]] static auto pending_key(const Job &job) -> PendingKey;

  std::atomic<bool> open_{false};
  mutable std::mutex mu_;
  JobId next_id_{1};
  std::map<JobId, Job> jobs_;
  std::set<PendingKey> pending_;
};

} // namespace simqueue::storage
