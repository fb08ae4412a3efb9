#pragma once

#include "simqueue/core/coroutine.hpp"
#include "simqueue/core/error.hpp"
#include "simqueue/queue/job.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace simqueue {

// Durable home of simulation jobs. Implementations: MySQLJobStore and
// MemoryJobStore. All methods are coroutines returning task<Result<T>>.
//
// Claims must be safe under any number of concurrent callers: each caller
// receives a distinct pending job or std::nullopt, and no caller blocks on
// another caller's in-flight claim.
class JobStore {
public:
  virtual ~JobStore() = default;

  // Lifecycle
  virtual auto open() -> task<Result<void>> = 0;
  virtual auto close() -> task<void> = 0;
  [[nodiscard]] virtual auto is_open() const noexcept -> bool = 0;
  virtual auto ping() -> task<Result<void>> = 0;

  /// Inserts a pending job. InvalidArgument when a config is missing.
  virtual auto enqueue(EnqueueInput input) -> task<Result<Job>> = 0;

  /// pending -> running for the highest-priority, oldest pending job.
  virtual auto claim_next_ready() -> task<Result<std::optional<Job>>> = 0;

  /// running -> completed. InvalidState when the job is not running.
  virtual auto mark_completed(JobId id, std::string result)
      -> task<Result<void>> = 0;

  /// running -> failed. InvalidState when the job is not running.
  virtual auto mark_failed(JobId id, std::string error_message)
      -> task<Result<void>> = 0;

  /// pending -> cancelled. Conflict when the job is absent or not pending.
  virtual auto cancel_job(JobId id) -> task<Result<void>> = 0;

  virtual auto get_job(JobId id) -> task<Result<std::optional<Job>>> = 0;
  virtual auto list_jobs(JobFilter filter, std::int64_t limit,
                         std::int64_t offset) -> task<Result<JobPage>> = 0;
  virtual auto get_queue_stats() -> task<Result<QueueStats>> = 0;
};

} // namespace simqueue
