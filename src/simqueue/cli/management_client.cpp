#include "simqueue/cli/management_client.hpp"

#include "simqueue/core/sync_wait.hpp"
#include "simqueue/util/log.hpp"

namespace simqueue::cli {
namespace {

template <typename T>
auto run_store_task(boost::asio::io_context &io, task<Result<T>> op)
    -> Result<T> {
  try {
    return run_task(io, std::move(op));
  } catch (const std::exception &e) {
    log::error("ManagementClient async operation failed: {}", e.what());
    return fail(Error::Unknown);
  }
}

} // namespace

ManagementClient::ManagementClient(const DatabaseConfig &db_config)
    : store_(io_.get_executor(), db_config) {}

ManagementClient::~ManagementClient() {
  if (!store_.is_open()) {
    return;
  }
  try {
    run_task(io_, store_.close());
  } catch (const std::exception &e) {
    log::warn("Closing job store failed: {}", e.what());
  }
}

auto ManagementClient::open() -> Result<void> {
  return run_store_task(io_, store_.open());
}

auto ManagementClient::list_jobs(const JobFilter &filter, std::int64_t limit,
                                 std::int64_t offset) -> Result<JobPage> {
  return run_store_task(io_, store_.list_jobs(filter, limit, offset));
}

auto ManagementClient::get_job(JobId id) -> Result<std::optional<Job>> {
  return run_store_task(io_, store_.get_job(id));
}

auto ManagementClient::get_queue_stats() -> Result<QueueStats> {
  return run_store_task(io_, store_.get_queue_stats());
}

auto ManagementClient::cancel_job(JobId id) -> Result<void> {
  return run_store_task(io_, store_.cancel_job(id));
}

auto ManagementClient::enqueue(EnqueueInput input) -> Result<Job> {
  return run_store_task(io_, store_.enqueue(std::move(input)));
}

} // namespace simqueue::cli
