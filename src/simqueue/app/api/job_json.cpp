#include "simqueue/app/api/job_json.hpp"

#include "simqueue/util/json.hpp"
#include "simqueue/util/log.hpp"
#include "simqueue/util/time.hpp"

#include <glaze/glaze.hpp>

#include <vector>

namespace simqueue::api {

namespace api_dto {

struct JobDto {
  JobId id{0};
  UserId user_id{0};
  std::string service_id;
  std::optional<std::string> llm_provider;
  std::optional<std::int64_t> prompt_version_id;
  RawJson current_config;
  RawJson proposed_config;
  std::optional<RawJson> context;
  std::optional<RawJson> options;
  std::string status;
  int priority{kDefaultPriority};
  std::optional<RawJson> result;
  std::optional<std::string> error_message;
  std::string queued_at;
  std::optional<std::string> started_at;
  std::optional<std::string> completed_at;
  std::string created_at;
  std::optional<std::string> updated_at;
};

struct JobEnvelopeDto {
  JobDto job;
};

struct JobPageDto {
  std::vector<JobDto> jobs;
  std::int64_t total{0};
};

struct StatsDto {
  std::int64_t pending{0};
  std::int64_t running{0};
  std::int64_t completed{0};
  std::int64_t failed{0};
  std::int64_t cancelled{0};
  std::int64_t total{0};
};

struct StatsEnvelopeDto {
  StatsDto stats;
};

struct ErrorDto {
  std::string error;
};

struct MessageDto {
  std::string message;
};

struct EnqueueRequestDto {
  std::string service_id;
  std::optional<std::string> llm_provider;
  std::optional<std::int64_t> prompt_version_id;
  std::optional<RawJson> current_config;
  std::optional<RawJson> proposed_config;
  std::optional<RawJson> context;
  std::optional<RawJson> options;
  std::optional<int> priority;
};

} // namespace api_dto

} // namespace simqueue::api

namespace glz {

template <> struct meta<simqueue::api::api_dto::JobDto> {
  using T = simqueue::api::api_dto::JobDto;
  static constexpr auto value = object(
      "id", &T::id, "user_id", &T::user_id, "service_id", &T::service_id,
      "llm_provider", &T::llm_provider, "prompt_version_id",
      &T::prompt_version_id, "current_config", &T::current_config,
      "proposed_config", &T::proposed_config, "context", &T::context,
      "options", &T::options, "status", &T::status, "priority", &T::priority,
      "result", &T::result, "error_message", &T::error_message, "queued_at",
      &T::queued_at, "started_at", &T::started_at, "completed_at",
      &T::completed_at, "created_at", &T::created_at, "updated_at",
      &T::updated_at);
};

template <> struct meta<simqueue::api::api_dto::JobEnvelopeDto> {
  using T = simqueue::api::api_dto::JobEnvelopeDto;
  static constexpr auto value = object("job", &T::job);
};

template <> struct meta<simqueue::api::api_dto::JobPageDto> {
  using T = simqueue::api::api_dto::JobPageDto;
  static constexpr auto value = object("jobs", &T::jobs, "total", &T::total);
};

template <> struct meta<simqueue::api::api_dto::StatsDto> {
  using T = simqueue::api::api_dto::StatsDto;
  static constexpr auto value =
      object("pending", &T::pending, "running", &T::running, "completed",
             &T::completed, "failed", &T::failed, "cancelled", &T::cancelled,
             "total", &T::total);
};

template <> struct meta<simqueue::api::api_dto::StatsEnvelopeDto> {
  using T = simqueue::api::api_dto::StatsEnvelopeDto;
  static constexpr auto value = object("stats", &T::stats);
};

template <> struct meta<simqueue::api::api_dto::ErrorDto> {
  using T = simqueue::api::api_dto::ErrorDto;
  static constexpr auto value = object("error", &T::error);
};

template <> struct meta<simqueue::api::api_dto::MessageDto> {
  using T = simqueue::api::api_dto::MessageDto;
  static constexpr auto value = object("message", &T::message);
};

template <> struct meta<simqueue::api::api_dto::EnqueueRequestDto> {
  using T = simqueue::api::api_dto::EnqueueRequestDto;
  static constexpr auto value = object(
      "service_id", &T::service_id, "llm_provider", &T::llm_provider,
      "prompt_version_id", &T::prompt_version_id, "current_config",
      &T::current_config, "proposed_config", &T::proposed_config, "context",
      &T::context, "options", &T::options, "priority", &T::priority);
};

} // namespace glz

namespace simqueue::api {

namespace {

using namespace api_dto;

[[nodiscard]] auto as_raw(const std::string &blob) -> RawJson {
  if (is_valid_json(blob)) {
    return RawJson{blob};
  }
  std::string quoted;
  if (auto ec = glz::write_json(blob, quoted); ec) {
    return RawJson{"null"};
  }
  return RawJson{std::move(quoted)};
}

[[nodiscard]] auto as_raw(const std::optional<std::string> &blob)
    -> std::optional<RawJson> {
  if (!blob) {
    return std::nullopt;
  }
  return as_raw(*blob);
}

[[nodiscard]] auto as_iso(const std::optional<Timestamp> &tp)
    -> std::optional<std::string> {
  if (!tp) {
    return std::nullopt;
  }
  return util::format_iso8601(*tp);
}

[[nodiscard]] auto to_dto(const Job &job) -> JobDto {
  return JobDto{
      .id = job.id,
      .user_id = job.user_id,
      .service_id = job.service_id,
      .llm_provider = job.llm_provider,
      .prompt_version_id = job.prompt_version_id,
      .current_config = as_raw(job.current_config),
      .proposed_config = as_raw(job.proposed_config),
      .context = as_raw(job.context),
      .options = as_raw(job.options),
      .status = std::string(to_string_view(job.status)),
      .priority = job.priority,
      .result = as_raw(job.result),
      .error_message = job.error_message,
      .queued_at = util::format_iso8601(job.queued_at),
      .started_at = as_iso(job.started_at),
      .completed_at = as_iso(job.completed_at),
      .created_at = util::format_iso8601(job.created_at),
      .updated_at = as_iso(job.updated_at),
  };
}

template <typename T> [[nodiscard]] auto write(const T &value) -> std::string {
  std::string buffer;
  if (auto ec = glz::write_json(value, buffer); ec) {
    log::error("JSON serialization failed: {}", glz::format_error(ec, buffer));
    return R"({"error":"JSON serialization failed"})";
  }
  return buffer;
}

} // namespace

auto job_to_json(const Job &job) -> std::string { return write(to_dto(job)); }

auto job_envelope_json(const Job &job) -> std::string {
  return write(JobEnvelopeDto{.job = to_dto(job)});
}

auto job_page_json(const JobPage &page) -> std::string {
  JobPageDto dto{.jobs = {}, .total = page.total};
  dto.jobs.reserve(page.jobs.size());
  for (const auto &job : page.jobs) {
    dto.jobs.emplace_back(to_dto(job));
  }
  return write(dto);
}

auto queue_stats_json(const QueueStats &stats) -> std::string {
  return write(StatsEnvelopeDto{.stats = StatsDto{
                                    .pending = stats.pending,
                                    .running = stats.running,
                                    .completed = stats.completed,
                                    .failed = stats.failed,
                                    .cancelled = stats.cancelled,
                                    .total = stats.total(),
                                }});
}

auto error_json(std::string_view message) -> std::string {
  return write(ErrorDto{.error = std::string(message)});
}

auto message_json(std::string_view message) -> std::string {
  return write(MessageDto{.message = std::string(message)});
}

auto parse_enqueue_request(std::string_view body) -> Result<EnqueueRequest> {
  EnqueueRequestDto dto{};
  constexpr auto kOpts =
      glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(dto, body); ec) {
    log::debug("Rejected enqueue body: {}", glz::format_error(ec, body));
    return fail(Error::ParseError);
  }

  auto unwrap = [](std::optional<RawJson> &raw) -> std::optional<std::string> {
    if (!raw || is_null_json(raw->str)) {
      return std::nullopt;
    }
    return std::move(raw->str);
  };

  return ok(EnqueueRequest{
      .service_id = std::move(dto.service_id),
      .llm_provider = std::move(dto.llm_provider),
      .prompt_version_id = dto.prompt_version_id,
      .current_config = unwrap(dto.current_config),
      .proposed_config = unwrap(dto.proposed_config),
      .context = unwrap(dto.context),
      .options = unwrap(dto.options),
      .priority = dto.priority,
  });
}

} // namespace simqueue::api
