#include "simqueue/queue/job.hpp"

#include "simqueue/util/json.hpp"

#include <tuple>
#include <utility>

namespace simqueue {

namespace {

[[nodiscard]] auto is_missing_blob(const std::optional<std::string> &blob)
    -> bool {
  return !blob.has_value() || is_null_json(*blob);
}

[[nodiscard]] auto check_blob(std::optional<std::string> &blob)
    -> Result<void> {
  if (is_missing_blob(blob)) {
    blob.reset();
    return ok();
  }
  if (!is_valid_json(*blob)) {
    return fail(Error::InvalidArgument);
  }
  return ok();
}

} // namespace

auto validate_enqueue(EnqueueInput input) -> Result<EnqueueInput> {
  if (input.service_id.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (is_missing_blob(input.current_config) ||
      is_missing_blob(input.proposed_config)) {
    return fail(Error::InvalidArgument);
  }
  if (!is_valid_json(*input.current_config) ||
      !is_valid_json(*input.proposed_config)) {
    return fail(Error::InvalidArgument);
  }
  if (auto r = check_blob(input.context); !r) {
    return fail(r.error());
  }
  if (auto r = check_blob(input.options); !r) {
    return fail(r.error());
  }

  const int priority = input.priority.value_or(kDefaultPriority);
  if (priority < kMinPriority || priority > kMaxPriority) {
    return fail(Error::InvalidArgument);
  }
  input.priority = priority;

  if (input.llm_provider && input.llm_provider->empty()) {
    input.llm_provider.reset();
  }
  return ok(std::move(input));
}

auto make_pending_job(JobId id, EnqueueInput input, Timestamp now) -> Job {
  Job job;
  job.id = id;
  job.user_id = input.user_id;
  job.service_id = std::move(input.service_id);
  job.llm_provider = std::move(input.llm_provider);
  job.prompt_version_id = input.prompt_version_id;
  job.current_config = std::move(input.current_config).value_or("{}");
  job.proposed_config = std::move(input.proposed_config).value_or("{}");
  job.context = std::move(input.context);
  job.options = std::move(input.options);
  job.status = JobStatus::Pending;
  job.priority = input.priority.value_or(kDefaultPriority);
  job.queued_at = now;
  job.created_at = now;
  return job;
}

auto QueueStats::count_for(JobStatus status) noexcept -> std::int64_t & {
  switch (status) {
  case JobStatus::Pending:
    return pending;
  case JobStatus::Running:
    return running;
  case JobStatus::Completed:
    return completed;
  case JobStatus::Failed:
    return failed;
  case JobStatus::Cancelled:
    return cancelled;
  }
  std::unreachable();
}

auto QueueStats::count_for(JobStatus status) const noexcept -> std::int64_t {
  return const_cast<QueueStats *>(this)->count_for(status);
}

auto claims_before(const Job &a, const Job &b) noexcept -> bool {
  return std::tuple{-a.priority, a.queued_at, a.id} <
         std::tuple{-b.priority, b.queued_at, b.id};
}

} // namespace simqueue
