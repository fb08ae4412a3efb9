#pragma once

#include "simqueue/config/system_config.hpp"
#include "simqueue/storage/job_store.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/connection_pool.hpp>
#include <boost/mysql/pool_params.hpp>

#include <atomic>

namespace simqueue::storage {

class MySQLJobStore final : public JobStore {
public:
  MySQLJobStore(boost::asio::any_io_executor executor,
                const DatabaseConfig &config);
  ~MySQLJobStore() override;

  MySQLJobStore(const MySQLJobStore &) = delete;
  MySQLJobStore &operator=(const MySQLJobStore &) = delete;

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

private:
  auto ensure_database_exists() -> task<Result<void>>;
  auto ensure_schema(boost::mysql::any_connection &conn) -> task<Result<void>>;
  auto get_connection() -> task<Result<boost::mysql::pooled_connection>>;
  auto finish(JobId id, JobStatus terminal, std::string payload)
      -> task<Result<void>>;

  DatabaseConfig cfg_;
  boost::mysql::connection_pool pool_;
  std::atomic<bool> open_{false};
};

} // namespace simqueue::storage
