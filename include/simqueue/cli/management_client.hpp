#pragma once

#include "simqueue/config/system_config.hpp"
#include "simqueue/core/error.hpp"
#include "simqueue/queue/job.hpp"
#include "simqueue/storage/mysql_job_store.hpp"

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <optional>

namespace simqueue::cli {

/// Blocking facade over MySQLJobStore for one-shot CLI commands. Drives a
/// private io_context on the calling thread.
class ManagementClient {
public:
  explicit ManagementClient(const DatabaseConfig &db_config);
  ~ManagementClient();

  ManagementClient(const ManagementClient &) = delete;
  auto operator=(const ManagementClient &) -> ManagementClient & = delete;

  [[nodiscard]] auto open() -> Result<void>;

  [[nodiscard]] auto list_jobs(const JobFilter &filter, std::int64_t limit,
                               std::int64_t offset) -> Result<JobPage>;
  [[nodiscard]] auto get_job(JobId id) -> Result<std::optional<Job>>;
  [[nodiscard]] auto get_queue_stats() -> Result<QueueStats>;
  [[nodiscard]] auto cancel_job(JobId id) -> Result<void>;
  [[nodiscard]] auto enqueue(EnqueueInput input) -> Result<Job>;

private:
  boost::asio::io_context io_{1};
  storage::MySQLJobStore store_;
};

} // namespace simqueue::cli
