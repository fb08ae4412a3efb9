#pragma once

#include "simqueue/core/error.hpp"
#include "simqueue/queue/job.hpp"

#include <string>
#include <string_view>

namespace simqueue::api {

/// Wire form of a job. Stored blobs are spliced in as raw JSON; a blob
/// that is not valid JSON is emitted as a JSON string instead.
[[nodiscard]] auto job_to_json(const Job &job) -> std::string;

/// `{"job": {...}}`
[[nodiscard]] auto job_envelope_json(const Job &job) -> std::string;

/// `{"jobs": [...], "total": N}`
[[nodiscard]] auto job_page_json(const JobPage &page) -> std::string;

/// `{"stats": {"pending": n, ..., "total": n}}`
[[nodiscard]] auto queue_stats_json(const QueueStats &stats) -> std::string;

/// `{"error": "<message>"}`
[[nodiscard]] auto error_json(std::string_view message) -> std::string;

/// `{"message": "<message>"}`
[[nodiscard]] auto message_json(std::string_view message) -> std::string;

/// Body of POST /api/v1/simulations/queue. Unknown keys are ignored.
/// Blobs keep their exact bytes; a JSON null counts as absent.
struct EnqueueRequest {
  std::string service_id;
  std::optional<std::string> llm_provider;
  std::optional<std::int64_t> prompt_version_id;
  std::optional<std::string> current_config;
  std::optional<std::string> proposed_config;
  std::optional<std::string> context;
  std::optional<std::string> options;
  std::optional<int> priority;
};

/// ParseError when the body is not a JSON object of the expected shape.
[[nodiscard]] auto parse_enqueue_request(std::string_view body)
    -> Result<EnqueueRequest>;

} // namespace simqueue::api
