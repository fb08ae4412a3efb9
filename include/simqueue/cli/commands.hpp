#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace simqueue::cli {

struct ServeStartOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  bool no_api{false};
  bool no_worker{false};
  bool memory_store{false};
  bool daemon{false};
};

struct ServeStopOptions {
  std::string config_file;
  int timeout_sec{30};
  bool force{false};
};

struct ServeStatusOptions {
  std::string config_file;
  bool json{false};
};

struct DbOptions {
  std::string config_file;
};

struct JobsListOptions {
  std::string config_file;
  std::optional<std::int64_t> user_id;
  std::string status; // empty: any status
  std::int64_t limit{20};
  std::int64_t offset{0};
  bool json{false};
};

struct JobsShowOptions {
  std::string config_file;
  std::int64_t job_id{0};
  bool json{false};
};

struct JobsStatsOptions {
  std::string config_file;
  bool json{false};
};

struct JobsCancelOptions {
  std::string config_file;
  std::int64_t job_id{0};
};

struct JobsEnqueueOptions {
  std::string config_file;
  std::int64_t user_id{0};
  std::string service_id;
  std::string current_config;  // JSON text or @path
  std::string proposed_config; // JSON text or @path
  std::optional<std::string> context;
  std::optional<std::string> options;
  std::optional<std::string> llm_provider;
  std::optional<int> priority;
  bool json{false};
};

[[nodiscard]] auto cmd_serve_start(const ServeStartOptions &opts) -> int;
[[nodiscard]] auto cmd_serve_stop(const ServeStopOptions &opts) -> int;
[[nodiscard]] auto cmd_serve_status(const ServeStatusOptions &opts) -> int;
[[nodiscard]] auto cmd_db_init(const DbOptions &opts) -> int;
[[nodiscard]] auto cmd_jobs_list(const JobsListOptions &opts) -> int;
[[nodiscard]] auto cmd_jobs_show(const JobsShowOptions &opts) -> int;
[[nodiscard]] auto cmd_jobs_stats(const JobsStatsOptions &opts) -> int;
[[nodiscard]] auto cmd_jobs_cancel(const JobsCancelOptions &opts) -> int;
[[nodiscard]] auto cmd_jobs_enqueue(const JobsEnqueueOptions &opts) -> int;

} // namespace simqueue::cli
