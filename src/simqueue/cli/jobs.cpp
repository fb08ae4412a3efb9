#include "simqueue/app/api/job_json.hpp"
#include "simqueue/cli/commands.hpp"
#include "simqueue/cli/formatting.hpp"
#include "simqueue/cli/management_client.hpp"
#include "simqueue/config/config.hpp"
#include "simqueue/config/toml_util.hpp"
#include "simqueue/util/log.hpp"

#include <format>
#include <memory>
#include <print>
#include <string>

namespace simqueue::cli {
namespace {

auto open_client(std::string_view config_file)
    -> Result<std::unique_ptr<ManagementClient>> {
  log::set_output_stderr();
  auto config = ConfigLoader::load_from_file(config_file);
  if (!config) {
    std::println(stderr, "Error: failed to load config '{}': {}", config_file,
                 config.error().message());
    return fail(config.error());
  }
  auto client = std::make_unique<ManagementClient>(config->database);
  if (auto r = client->open(); !r) {
    std::println(stderr, "Error: cannot open database: {}",
                 r.error().message());
    return fail(r.error());
  }
  return ok(std::move(client));
}

/// `@path` reads the payload from a file; anything else is the payload.
auto load_payload(std::string_view arg, std::string_view what)
    -> Result<std::string> {
  if (!arg.starts_with('@')) {
    return ok(std::string(arg));
  }
  auto text = toml_util::read_file(arg.substr(1));
  if (!text) {
    std::println(stderr, "Error: cannot read {} from '{}'", what,
                 arg.substr(1));
  }
  return text;
}

auto print_field(std::string_view name, std::string_view value) -> void {
  std::println("  {:<18} {}", fmt::ansi::bold(name), value);
}

auto print_job_details(const Job &job) -> void {
  std::println("{} {}", fmt::ansi::bold("Job"), job.id);
  print_field("status", fmt::colorize_status(job.status));
  print_field("user_id", std::to_string(job.user_id));
  print_field("service_id", job.service_id);
  print_field("priority", std::to_string(job.priority));
  print_field("llm_provider", job.llm_provider.value_or("-"));
  print_field("prompt_version_id",
              job.prompt_version_id ? std::to_string(*job.prompt_version_id)
                                    : std::string{"-"});
  print_field("queued_at", util::format_local_timestamp(job.queued_at));
  print_field("started_at", util::format_local_timestamp(job.started_at));
  print_field("completed_at", util::format_local_timestamp(job.completed_at));
  print_field("duration", fmt::format_duration(job.started_at,
                                               job.completed_at));
  print_field("current_config", job.current_config);
  print_field("proposed_config", job.proposed_config);
  if (job.context) {
    print_field("context", *job.context);
  }
  if (job.options) {
    print_field("options", *job.options);
  }
  if (job.result) {
    print_field("result", *job.result);
  }
  if (job.error_message) {
    print_field("error", *job.error_message);
  }
}

} // namespace

auto cmd_jobs_list(const JobsListOptions &opts) -> int {
  JobFilter filter{.user_id = opts.user_id, .status = std::nullopt};
  if (!opts.status.empty()) {
    auto status = parse<JobStatus>(opts.status);
    if (!status) {
      std::println(stderr,
                   "Error: unknown status '{}' (pending, running, completed, "
                   "failed, cancelled)",
                   opts.status);
      return 1;
    }
    filter.status = *status;
  }

  auto client = open_client(opts.config_file);
  if (!client) {
    return 1;
  }
  auto page = (*client)->list_jobs(filter, opts.limit, opts.offset);
  if (!page) {
    std::println(stderr, "Error: {}", page.error().message());
    return 1;
  }

  if (opts.json) {
    std::println("{}", api::job_page_json(*page));
    return 0;
  }

  if (page->jobs.empty()) {
    std::println("No jobs found.");
    return 0;
  }

  fmt::Table table({{"ID", 8, true},
                    {"USER", 8, true},
                    {"SERVICE", 24},
                    {"STATUS", 10},
                    {"PRIO", 4, true},
                    {"QUEUED", 19},
                    {"DURATION", 8}});
  table.print_header();
  for (const auto &job : page->jobs) {
    table.print_row({std::to_string(job.id), std::to_string(job.user_id),
                     fmt::ellipsize(job.service_id, 24),
                     fmt::colorize_status(job.status),
                     std::to_string(job.priority),
                     util::format_local_timestamp(job.queued_at),
                     fmt::format_duration(job.started_at, job.completed_at)});
  }
  std::println("{}", fmt::ansi::dim(std::format(
                         "showing {}-{} of {}", opts.offset + 1,
                         opts.offset +
                             static_cast<std::int64_t>(page->jobs.size()),
                         page->total)));
  return 0;
}

auto cmd_jobs_show(const JobsShowOptions &opts) -> int {
  auto client = open_client(opts.config_file);
  if (!client) {
    return 1;
  }
  auto job = (*client)->get_job(opts.job_id);
  if (!job) {
    std::println(stderr, "Error: {}", job.error().message());
    return 1;
  }
  if (!job->has_value()) {
    std::println(stderr, "Error: job {} not found", opts.job_id);
    return 1;
  }

  if (opts.json) {
    std::println("{}", api::job_to_json(**job));
  } else {
    print_job_details(**job);
  }
  return 0;
}

auto cmd_jobs_stats(const JobsStatsOptions &opts) -> int {
  auto client = open_client(opts.config_file);
  if (!client) {
    return 1;
  }
  auto stats = (*client)->get_queue_stats();
  if (!stats) {
    std::println(stderr, "Error: {}", stats.error().message());
    return 1;
  }

  if (opts.json) {
    std::println("{}", api::queue_stats_json(*stats));
    return 0;
  }

  fmt::Table table({{"STATUS", 10}, {"COUNT", 8, true}});
  table.print_header();
  util::for_each_enumerator<JobStatus>([&](JobStatus status) {
    table.print_row({fmt::colorize_status(status),
                     std::to_string(stats->count_for(status))});
  });
  table.print_row({fmt::ansi::bold("total"), std::to_string(stats->total())});
  return 0;
}

auto cmd_jobs_cancel(const JobsCancelOptions &opts) -> int {
  auto client = open_client(opts.config_file);
  if (!client) {
    return 1;
  }
  if (auto r = (*client)->cancel_job(opts.job_id); !r) {
    if (r.error() == make_error_code(Error::Conflict)) {
      std::println(stderr, "Error: job {} not found or not pending",
                   opts.job_id);
    } else {
      std::println(stderr, "Error: {}", r.error().message());
    }
    return 1;
  }
  std::println("Job {} cancelled.", opts.job_id);
  return 0;
}

auto cmd_jobs_enqueue(const JobsEnqueueOptions &opts) -> int {
  auto current = load_payload(opts.current_config, "current config");
  auto proposed = load_payload(opts.proposed_config, "proposed config");
  if (!current || !proposed) {
    return 1;
  }
  std::optional<std::string> context;
  if (opts.context) {
    auto loaded = load_payload(*opts.context, "context");
    if (!loaded) {
      return 1;
    }
    context = std::move(*loaded);
  }
  std::optional<std::string> options;
  if (opts.options) {
    auto loaded = load_payload(*opts.options, "options");
    if (!loaded) {
      return 1;
    }
    options = std::move(*loaded);
  }

  auto input = validate_enqueue(EnqueueInput{
      .user_id = opts.user_id,
      .service_id = opts.service_id,
      .llm_provider = opts.llm_provider,
      .prompt_version_id = std::nullopt,
      .current_config = std::move(*current),
      .proposed_config = std::move(*proposed),
      .context = std::move(context),
      .options = std::move(options),
      .priority = opts.priority,
  });
  if (!input) {
    std::println(stderr,
                 "Error: invalid job (service id required, configs must be "
                 "JSON, priority {}-{})",
                 kMinPriority, kMaxPriority);
    return 1;
  }

  auto client = open_client(opts.config_file);
  if (!client) {
    return 1;
  }
  auto job = (*client)->enqueue(std::move(*input));
  if (!job) {
    std::println(stderr, "Error: {}", job.error().message());
    return 1;
  }

  if (opts.json) {
    std::println("{}", api::job_to_json(*job));
  } else {
    std::println("Enqueued job {} (priority {}).", job->id, job->priority);
  }
  return 0;
}

} // namespace simqueue::cli
