#include "simqueue/app/application.hpp"

#include "simqueue/app/api/api_server.hpp"
#include "simqueue/app/api/authorizer.hpp"
#include "simqueue/core/sync_wait.hpp"
#include "simqueue/execution/http_execution_delegate.hpp"
#include "simqueue/storage/memory_job_store.hpp"
#include "simqueue/storage/mysql_job_store.hpp"
#include "simqueue/util/log.hpp"
#include "simqueue/worker/simulation_worker.hpp"

#include <csignal>

namespace simqueue {

namespace {

auto close_store(JobStore &store) -> task<Result<void>> {
  co_await store.close();
  co_return ok();
}

} // namespace

Application::Application(Config config, AppOptions options)
    : config_(std::move(config)), options_(options),
      runtime_(config_.server.shards) {
  std::signal(SIGPIPE, SIG_IGN);
  if (options_.memory_store) {
    store_ = std::make_unique<storage::MemoryJobStore>();
  } else {
    store_ = std::make_unique<storage::MySQLJobStore>(runtime_.executor_for(0),
                                                      config_.database);
  }
  authorizer_ = std::make_unique<api::HeaderAuthorizer>();
}

Application::~Application() { stop(); }

auto Application::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  if (auto r = runtime_.start(); !r) {
    running_ = false;
    return fail(r.error());
  }
  log::info("Runtime started with {} shards", runtime_.shard_count());

  if (auto r = sync_wait(runtime_.executor_for(0), store_->open()); !r) {
    log::error("Failed to open job store: {}", r.error().message());
    shutdown();
    return fail(r.error());
  }

  if (options_.api && config_.api.enabled) {
    api_ = std::make_unique<api::ApiServer>(runtime_, *store_, *authorizer_,
                                            config_.api);
    if (auto r = api_->start(); !r) {
      log::error("Failed to start API server: {}", r.error().message());
      shutdown();
      return fail(r.error());
    }
  } else {
    log::info("API server disabled");
  }

  if (options_.worker && config_.worker.enabled) {
    if (auto r = start_worker(); !r) {
      shutdown();
      return fail(r.error());
    }
  } else {
    log::info("Simulation worker disabled");
  }

  log::info("simqueue started");
  return ok();
}

auto Application::start_worker() -> Result<void> {
  const auto worker_shard = runtime_.shard_count() - 1;
  auto delegate = HttpExecutionDelegate::create(
      runtime_.executor_for(worker_shard), config_.worker);
  if (!delegate) {
    log::error("Invalid delegate endpoint '{}{}': {}",
               config_.worker.delegate_url, config_.worker.delegate_path,
               delegate.error().message());
    return fail(delegate.error());
  }
  delegate_ = std::make_unique<HttpExecutionDelegate>(std::move(*delegate));
  worker_ = std::make_unique<SimulationWorker>(*store_, *delegate_,
                                               config_.worker.poll_interval);
  worker_->start(runtime_.executor_for(worker_shard));
  return ok();
}

auto Application::stop() noexcept -> void {
  if (!running_.load()) {
    return;
  }
  log::info("Stopping simqueue...");
  shutdown();
  log::info("simqueue stopped");
}

auto Application::shutdown() noexcept -> void {
  // Stop taking requests first so nothing new lands in the store.
  if (api_) {
    api_->stop();
  }

  if (worker_) {
    worker_->request_stop();
    if (worker_->is_running()) {
      log::info("Waiting for the simulation worker to finish its job");
    }
    worker_->wait_stopped();
  }

  if (store_ && store_->is_open()) {
    if (auto r = sync_wait(runtime_.executor_for(0), close_store(*store_));
        !r) {
      log::warn("Closing job store failed: {}", r.error().message());
    }
  }

  runtime_.stop();

  worker_.reset();
  delegate_.reset();
  api_.reset();
  running_ = false;
}

auto Application::is_running() const noexcept -> bool {
  return running_.load();
}

auto Application::api_port() const -> std::uint16_t {
  return api_ ? api_->port() : 0;
}

} // namespace simqueue
