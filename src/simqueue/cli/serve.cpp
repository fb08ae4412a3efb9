#include "simqueue/app/application.hpp"
#include "simqueue/cli/commands.hpp"
#include "simqueue/config/config.hpp"
#include "simqueue/util/daemon.hpp"
#include "simqueue/util/json.hpp"
#include "simqueue/util/log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <csignal>
#include <format>
#include <print>
#include <string>

namespace simqueue::cli {
namespace {

auto load_config_or_print(std::string_view path) -> Result<Config> {
  return ConfigLoader::load_from_file(path).or_else(
      [&](std::error_code ec) -> Result<Config> {
        std::println(stderr, "Error: failed to load config '{}': {}", path,
                     ec.message());
        return fail(ec);
      });
}

struct ServerState {
  std::int64_t pid{0}; // 0 when there is no pid file
  bool alive{false};
};

auto inspect_server(const std::string &pid_file) -> Result<ServerState> {
  auto pid = read_pid_file(pid_file);
  if (pid) {
    return ServerState{.pid = *pid, .alive = is_process_alive(*pid)};
  }
  if (pid.error() == make_error_code(Error::FileNotFound)) {
    return ServerState{};
  }
  std::println(stderr, "Error: Failed to read pid file '{}': {}", pid_file,
               pid.error().message());
  return fail(pid.error());
}

// true when the process exited within `wait`.
auto signal_and_wait(std::int64_t pid, int signal_no,
                     std::chrono::milliseconds wait) -> Result<bool> {
  if (auto r = send_signal(pid, signal_no); !r) {
    std::println(stderr, "Error: Failed to send {} to pid {}: {}",
                 signal_no == SIGKILL ? "SIGKILL" : "SIGTERM", pid,
                 r.error().message());
    return fail(r.error());
  }
  return wait_for_process_exit(pid, wait);
}

} // namespace

auto cmd_serve_start(const ServeStartOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  auto config = std::move(*config_res);

  if (opts.log_level.has_value()) {
    config.server.log_level = *opts.log_level;
  }

  const auto log_file = opts.log_file.value_or(config.server.log_file);
  if (opts.daemon && log_file.empty()) {
    std::println(
        stderr,
        "Error: --daemon requires log_file (set in config or --log-file)");
    return 1;
  }
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon) {
    if (auto r = daemonize(); !r) {
      std::println(stderr, "Error: Failed to daemonize - {}",
                   r.error().message());
      return 1;
    }
  }

  log::set_level(config.server.log_level);
  log::start();

  const auto pid_file = config.server.pid_file;
  auto pid_guard = PidFileGuard::acquire(pid_file);
  if (!pid_guard) {
    if (pid_guard.error() == make_error_code(Error::Conflict)) {
      log::error("simqueue is already running (pid file locked: {})",
                 pid_file);
    } else {
      log::error("Failed to acquire pid file '{}': {}", pid_file,
                 pid_guard.error().message());
    }
    log::stop();
    return 1;
  }

  Application app(std::move(config),
                  AppOptions{.api = !opts.no_api,
                             .worker = !opts.no_worker,
                             .memory_store = opts.memory_store});
  setup_signal_handlers();

  if (auto r = app.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }

  const auto &cfg = app.config();
  const auto api_desc =
      app.api_port() != 0 ? std::format("{}:{}", cfg.api.host, app.api_port())
                          : std::string{"off"};
  log::info("simqueue running (api={}, worker={}, store={}, pid_file={})",
            api_desc, app.worker() != nullptr,
            opts.memory_store ? "memory" : "mysql", pid_file);

  wait_for_shutdown();
  log::info("Shutdown requested");
  app.stop();
  log::stop();
  return 0;
}

auto cmd_serve_stop(const ServeStopOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  const auto &pid_file = config_res->server.pid_file;

  auto server = inspect_server(pid_file);
  if (!server) {
    return 1;
  }
  if (server->pid == 0) {
    std::println("simqueue is not running (no pid file: {}).", pid_file);
    return 0;
  }
  if (!server->alive) {
    if (auto r = remove_pid_file(pid_file); !r) {
      std::println(stderr, "Warning: could not remove stale pid file: {}",
                   r.error().message());
    }
    std::println("simqueue is not running (stale pid file removed).");
    return 0;
  }

  // SIGTERM lets the worker finish its in-flight job first.
  const auto grace = std::chrono::seconds(std::max(opts.timeout_sec, 1));
  auto stopped = signal_and_wait(server->pid, SIGTERM, grace);
  if (!stopped) {
    return 1;
  }
  if (*stopped) {
    std::println("simqueue stopped (pid={}).", server->pid);
    return 0;
  }
  if (!opts.force) {
    std::println(stderr,
                 "Error: Timed out waiting for simqueue to stop (pid={}). "
                 "Retry with --force.",
                 server->pid);
    return 1;
  }

  stopped = signal_and_wait(server->pid, SIGKILL, std::chrono::seconds(2));
  if (!stopped) {
    return 1;
  }
  if (!*stopped) {
    std::println(stderr, "Error: Process {} did not exit after SIGKILL.",
                 server->pid);
    return 1;
  }
  if (auto r = remove_pid_file(pid_file); !r) {
    std::println(stderr, "Warning: could not remove pid file: {}",
                 r.error().message());
  }
  std::println("simqueue killed (pid={}). Its running job stays 'running'.",
               server->pid);
  return 0;
}

auto cmd_serve_status(const ServeStatusOptions &opts) -> int {
  auto config_res = load_config_or_print(opts.config_file);
  if (!config_res) {
    return 1;
  }
  const auto &pid_file = config_res->server.pid_file;

  auto server = inspect_server(pid_file);
  if (!server) {
    return 1;
  }
  const bool stale = server->pid != 0 && !server->alive;

  if (opts.json) {
    JsonValue obj{
        {"running", server->alive},
        {"pid", server->pid},
        {"stale_pid_file", stale},
        {"pid_file", pid_file},
    };
    std::println("{}", dump_json(obj));
    return server->alive ? 0 : 1;
  }

  if (server->alive) {
    std::println("simqueue is running.");
    std::println("  pid: {}", server->pid);
  } else if (stale) {
    std::println("simqueue is stopped (stale pid file).");
    std::println("  stale_pid: {}", server->pid);
  } else {
    std::println("simqueue is stopped.");
  }
  std::println("  pid_file: {}", pid_file);
  return server->alive ? 0 : 1;
}

} // namespace simqueue::cli
