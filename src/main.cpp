#include "simqueue/cli/commands.hpp"
#include "simqueue/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("SIMQUEUE_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

// -c/--config on every subcommand; required unless SIMQUEUE_CONFIG is set.
auto add_config_option(CLI::App *cmd, std::string &target,
                       const std::string &env_config) -> void {
  target = env_config;
  auto *opt = cmd->add_option("-c,--config", target, "System config file")
                  ->check(CLI::ExistingFile);
  if (env_config.empty())
    opt->required();
}
} // namespace

int main(int argc, char *argv[]) {
  // Keep non-serve CLI output clean by default.
  simqueue::log::set_output_stderr();
  simqueue::log::set_level(simqueue::log::Level::Warn);

  CLI::App app{"simqueue", "Prioritised simulation job queue"};
  app.require_subcommand(1);
  app.footer("\nExamples:\n"
             "  simqueue serve start -c simqueue.toml\n"
             "  simqueue jobs list -c simqueue.toml --status pending\n"
             "\nTip: Set SIMQUEUE_CONFIG=simqueue.toml to skip -c on every "
             "command.");

  const std::string env_config = default_config();

  auto *serve = app.add_subcommand("serve", "Service lifecycle operations");
  serve->require_subcommand(1);
  serve->footer("\nExamples:\n"
                "  simqueue serve start -c simqueue.toml\n"
                "  simqueue serve start -c simqueue.toml --daemon "
                "--log-file simqueue.log\n"
                "  simqueue serve start -c simqueue.toml --no-worker\n"
                "  simqueue serve status -c simqueue.toml\n"
                "  simqueue serve stop -c simqueue.toml");

  simqueue::cli::ServeStartOptions serve_start_opts;
  auto *serve_start =
      serve->add_subcommand("start", "Start the queue API and worker");
  add_config_option(serve_start, serve_start_opts.config_file, env_config);
  serve_start->add_flag("--no-api", serve_start_opts.no_api,
                        "Disable the HTTP API");
  serve_start->add_flag("--no-worker", serve_start_opts.no_worker,
                        "Disable the simulation worker");
  serve_start->add_flag("--memory", serve_start_opts.memory_store,
                        "Use a non-durable in-memory job store");
  serve_start->add_option("--log-file", serve_start_opts.log_file,
                          "Log file path (required for --daemon)");
  serve_start
      ->add_option("--log-level", serve_start_opts.log_level,
                   "Log level override: trace|debug|info|warn|error")
      ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"},
                            CLI::ignore_case));
  serve_start->add_flag("-d,--daemon", serve_start_opts.daemon,
                        "Run as daemon");
  serve_start->callback([&serve_start_opts]() {
    std::exit(simqueue::cli::cmd_serve_start(serve_start_opts));
  });

  simqueue::cli::ServeStatusOptions serve_status_opts;
  auto *serve_status =
      serve->add_subcommand("status", "Show service status");
  add_config_option(serve_status, serve_status_opts.config_file, env_config);
  serve_status->add_flag("--json", serve_status_opts.json, "Output JSON");
  serve_status->callback([&serve_status_opts]() {
    std::exit(simqueue::cli::cmd_serve_status(serve_status_opts));
  });

  simqueue::cli::ServeStopOptions serve_stop_opts;
  auto *serve_stop = serve->add_subcommand("stop", "Stop the service");
  add_config_option(serve_stop, serve_stop_opts.config_file, env_config);
  serve_stop->add_option("--timeout", serve_stop_opts.timeout_sec,
                         "Seconds to wait before failing or forcing stop");
  serve_stop->add_flag("--force", serve_stop_opts.force,
                       "Send SIGKILL if graceful stop times out");
  serve_stop->callback([&serve_stop_opts]() {
    std::exit(simqueue::cli::cmd_serve_stop(serve_stop_opts));
  });

  auto *db = app.add_subcommand("db", "Database management");
  db->require_subcommand(1);

  simqueue::cli::DbOptions db_init_opts;
  auto *db_init = db->add_subcommand("init", "Create database and schema");
  add_config_option(db_init, db_init_opts.config_file, env_config);
  db_init->callback([&db_init_opts]() {
    std::exit(simqueue::cli::cmd_db_init(db_init_opts));
  });

  auto *jobs = app.add_subcommand("jobs", "Inspect and manage queued jobs");
  jobs->require_subcommand(1);
  jobs->footer(
      "\nExamples:\n"
      "  simqueue jobs list -c simqueue.toml --user 7 --status failed\n"
      "  simqueue jobs show -c simqueue.toml 42 --json\n"
      "  simqueue jobs enqueue -c simqueue.toml --user 7 --service checkout "
      "--current @cur.json --proposed @new.json --priority 80");

  simqueue::cli::JobsListOptions jobs_list_opts;
  auto *jobs_list = jobs->add_subcommand("list", "List jobs");
  add_config_option(jobs_list, jobs_list_opts.config_file, env_config);
  jobs_list->add_option("--user", jobs_list_opts.user_id,
                        "Only jobs owned by this user id");
  jobs_list
      ->add_option("--status", jobs_list_opts.status,
                   "pending|running|completed|failed|cancelled")
      ->check(CLI::IsMember(
          {"pending", "running", "completed", "failed", "cancelled"}));
  jobs_list
      ->add_option("--limit", jobs_list_opts.limit,
                   "Max records to display (default: 20)")
      ->check(CLI::PositiveNumber);
  jobs_list
      ->add_option("--offset", jobs_list_opts.offset, "Records to skip")
      ->check(CLI::NonNegativeNumber);
  jobs_list->add_flag("--json", jobs_list_opts.json, "Output JSON");
  jobs_list->callback([&jobs_list_opts]() {
    std::exit(simqueue::cli::cmd_jobs_list(jobs_list_opts));
  });

  simqueue::cli::JobsShowOptions jobs_show_opts;
  auto *jobs_show = jobs->add_subcommand("show", "Show one job");
  add_config_option(jobs_show, jobs_show_opts.config_file, env_config);
  jobs_show->add_option("job_id", jobs_show_opts.job_id, "Job ID")->required();
  jobs_show->add_flag("--json", jobs_show_opts.json, "Output JSON");
  jobs_show->callback([&jobs_show_opts]() {
    std::exit(simqueue::cli::cmd_jobs_show(jobs_show_opts));
  });

  simqueue::cli::JobsStatsOptions jobs_stats_opts;
  auto *jobs_stats = jobs->add_subcommand("stats", "Job counts by status");
  add_config_option(jobs_stats, jobs_stats_opts.config_file, env_config);
  jobs_stats->add_flag("--json", jobs_stats_opts.json, "Output JSON");
  jobs_stats->callback([&jobs_stats_opts]() {
    std::exit(simqueue::cli::cmd_jobs_stats(jobs_stats_opts));
  });

  simqueue::cli::JobsCancelOptions jobs_cancel_opts;
  auto *jobs_cancel = jobs->add_subcommand("cancel", "Cancel a pending job");
  add_config_option(jobs_cancel, jobs_cancel_opts.config_file, env_config);
  jobs_cancel->add_option("job_id", jobs_cancel_opts.job_id, "Job ID")
      ->required();
  jobs_cancel->callback([&jobs_cancel_opts]() {
    std::exit(simqueue::cli::cmd_jobs_cancel(jobs_cancel_opts));
  });

  simqueue::cli::JobsEnqueueOptions jobs_enqueue_opts;
  auto *jobs_enqueue = jobs->add_subcommand("enqueue", "Submit a job");
  add_config_option(jobs_enqueue, jobs_enqueue_opts.config_file, env_config);
  jobs_enqueue->add_option("--user", jobs_enqueue_opts.user_id, "Owner id")
      ->required()
      ->check(CLI::PositiveNumber);
  jobs_enqueue->add_option("--service", jobs_enqueue_opts.service_id,
                           "Target service id")
      ->required();
  jobs_enqueue
      ->add_option("--current", jobs_enqueue_opts.current_config,
                   "Current config JSON, or @file")
      ->required();
  jobs_enqueue
      ->add_option("--proposed", jobs_enqueue_opts.proposed_config,
                   "Proposed config JSON, or @file")
      ->required();
  jobs_enqueue->add_option("--context", jobs_enqueue_opts.context,
                           "Context JSON, or @file");
  jobs_enqueue->add_option("--options", jobs_enqueue_opts.options,
                           "Options JSON, or @file");
  jobs_enqueue->add_option("--llm-provider", jobs_enqueue_opts.llm_provider,
                           "LLM provider name");
  jobs_enqueue
      ->add_option("--priority", jobs_enqueue_opts.priority,
                   "0-100, higher runs first (default: 50)")
      ->check(CLI::Range(0, 100));
  jobs_enqueue->add_flag("--json", jobs_enqueue_opts.json, "Output JSON");
  jobs_enqueue->callback([&jobs_enqueue_opts]() {
    std::exit(simqueue::cli::cmd_jobs_enqueue(jobs_enqueue_opts));
  });

  CLI11_PARSE(app, argc, argv);
  return 0;
}
