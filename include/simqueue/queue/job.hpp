#pragma once

#include "simqueue/core/error.hpp"
#include "simqueue/util/enum.hpp"
#include "simqueue/util/time.hpp"

#include <boost/describe/enum.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace simqueue {

using JobId = std::int64_t;
using UserId = std::int64_t;
using util::Timestamp;

enum class JobStatus : std::uint8_t {
  Pending,
  Running,
  Completed,
  Failed,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(JobStatus, Pending, Running, Completed, Failed, Cancelled)
SIMQUEUE_DEFINE_ENUM_SERDE(JobStatus)

inline constexpr int kMinPriority = 0;
inline constexpr int kMaxPriority = 100;
inline constexpr int kDefaultPriority = 50;

[[nodiscard]] constexpr auto is_terminal(JobStatus status) noexcept -> bool {
  switch (status) {
  case JobStatus::Pending:
  case JobStatus::Running:
    return false;
  case JobStatus::Completed:
  case JobStatus::Failed:
  case JobStatus::Cancelled:
    return true;
  }
  return false;
}

/// The only legal edges: pending->running (claim), running->completed,
/// running->failed and pending->cancelled.
[[nodiscard]] constexpr auto can_transition(JobStatus from,
                                            JobStatus to) noexcept -> bool {
  switch (from) {
  case JobStatus::Pending:
    return to == JobStatus::Running || to == JobStatus::Cancelled;
  case JobStatus::Running:
    return to == JobStatus::Completed || to == JobStatus::Failed;
  case JobStatus::Completed:
  case JobStatus::Failed:
  case JobStatus::Cancelled:
    return false;
  }
  return false;
}

/// One queued simulation request. Config blobs, context, options and the
/// result are stored as raw JSON text and never reinterpreted.
struct Job {
  JobId id{0};
  UserId user_id{0};
  std::string service_id;

  std::optional<std::string> llm_provider;
  std::optional<std::int64_t> prompt_version_id;
  std::string current_config;
  std::string proposed_config;
  std::optional<std::string> context;
  std::optional<std::string> options;

  JobStatus status{JobStatus::Pending};
  int priority{kDefaultPriority};

  std::optional<std::string> result;
  std::optional<std::string> error_message;

  Timestamp queued_at{};
  std::optional<Timestamp> started_at;
  std::optional<Timestamp> completed_at;
  Timestamp created_at{};
  std::optional<Timestamp> updated_at;

  auto operator==(const Job &) const -> bool = default;
};

/// Caller-supplied fields for a new job. Config payloads are optional here
/// so that a missing one can be reported instead of silently defaulted.
struct EnqueueInput {
  UserId user_id{0};
  std::string service_id;
  std::optional<std::string> llm_provider;
  std::optional<std::int64_t> prompt_version_id;
  std::optional<std::string> current_config;
  std::optional<std::string> proposed_config;
  std::optional<std::string> context;
  std::optional<std::string> options;
  std::optional<int> priority;
};

/// Checks mandatory payloads and priority range, fills the default
/// priority, and drops optional blobs that carry a JSON null.
[[nodiscard]] auto validate_enqueue(EnqueueInput input)
    -> Result<EnqueueInput>;

/// Builds the pending job a store persists for already-validated input.
[[nodiscard]] auto make_pending_job(JobId id, EnqueueInput input,
                                    Timestamp now) -> Job;

struct JobFilter {
  std::optional<UserId> user_id;
  std::optional<JobStatus> status;
};

inline constexpr std::int64_t kDefaultPageLimit = 20;

struct JobPage {
  std::vector<Job> jobs;
  std::int64_t total{0};
};

struct QueueStats {
  std::int64_t pending{0};
  std::int64_t running{0};
  std::int64_t completed{0};
  std::int64_t failed{0};
  std::int64_t cancelled{0};

  [[nodiscard]] auto total() const noexcept -> std::int64_t {
    return pending + running + completed + failed + cancelled;
  }
  auto count_for(JobStatus status) noexcept -> std::int64_t &;
  [[nodiscard]] auto count_for(JobStatus status) const noexcept
      -> std::int64_t;
};

/// Claim order: higher priority first, then older queued_at, then lower id.
[[nodiscard]] auto claims_before(const Job &a, const Job &b) noexcept -> bool;

} // namespace simqueue
