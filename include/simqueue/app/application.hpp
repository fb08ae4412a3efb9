#pragma once

#include "simqueue/config/config.hpp"
#include "simqueue/core/error.hpp"
#include "simqueue/core/runtime.hpp"

#include <atomic>
#include <cstdint>
#include <memory>

namespace simqueue {

class ExecutionDelegate;
class JobStore;
class SimulationWorker;

namespace api {
class ApiServer;
class Authorizer;
} // namespace api

struct AppOptions {
  bool api{true};
  bool worker{true};
  // Non-durable store; jobs vanish with the process.
  bool memory_store{false};
};

/// Owns the runtime shards and every long-lived service. start() brings
/// them up in dependency order and stop() tears them down in reverse.
class Application {
public:
  explicit Application(Config config, AppOptions options = {});
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto config() const noexcept -> const Config & {
    return config_;
  }
  [[nodiscard]] auto runtime() -> Runtime & { return runtime_; }
  [[nodiscard]] auto store() -> JobStore & { return *store_; }
  [[nodiscard]] auto worker() -> SimulationWorker * { return worker_.get(); }
  [[nodiscard]] auto api_port() const -> std::uint16_t;

private:
  [[nodiscard]] auto start_worker() -> Result<void>;
  auto shutdown() noexcept -> void;

  std::atomic<bool> running_{false};
  Config config_;
  AppOptions options_;

  Runtime runtime_;
  std::unique_ptr<JobStore> store_;
  std::unique_ptr<api::Authorizer> authorizer_;
  std::unique_ptr<api::ApiServer> api_;
  std::unique_ptr<ExecutionDelegate> delegate_;
  std::unique_ptr<SimulationWorker> worker_;
};

} // namespace simqueue
