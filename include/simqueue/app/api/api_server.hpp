#pragma once

#include "simqueue/client/http/http_types.hpp"
#include "simqueue/config/system_config.hpp"
#include "simqueue/core/error.hpp"

#include <cstdint>
#include <memory>
#include <system_error>

namespace simqueue {

class Runtime;
class JobStore;

namespace api {

class Authorizer;

/// Queue API under /api/v1/simulations/queue plus /health and /ready.
/// Every queue route requires an identity from the Authorizer.
class ApiServer {
public:
  ApiServer(Runtime &runtime, JobStore &store, Authorizer &authorizer,
            ApiConfig config);
  ~ApiServer();

  ApiServer(const ApiServer &) = delete;
  ApiServer &operator=(const ApiServer &) = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const -> bool;
  [[nodiscard]] auto port() const -> std::uint16_t;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

[[nodiscard]] auto status_from_error(const std::error_code &ec)
    -> http::HttpStatus;

} // namespace api
} // namespace simqueue
