#pragma once

#include "simqueue/client/http/http_types.hpp"
#include "simqueue/core/error.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace simqueue {
class Runtime;
}

namespace simqueue::http {

class Router;

/// HTTP/1.1 keep-alive server on the Runtime shards. Plain and TLS clients
/// share one port: the first bytes of each connection decide which.
class HttpServer {
public:
  explicit HttpServer(Runtime &runtime);
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  auto operator=(const HttpServer &) -> HttpServer & = delete;

  auto router() -> Router &;
  [[nodiscard]] auto set_tls_credentials(std::string cert_chain_file,
                                         std::string private_key_file)
      -> Result<void>;

  /// Binds and starts accepting. Port 0 picks an ephemeral port, readable
  /// through local_port() afterwards.
  [[nodiscard]] auto start(std::string_view host, std::uint16_t port,
                           bool reuse_port = false) -> Result<void>;
  auto stop() -> void;

  [[nodiscard]] auto is_running() const -> bool;
  [[nodiscard]] auto local_port() const -> std::uint16_t;

private:
  struct Impl;
  std::shared_ptr<Impl> impl_;
};

} // namespace simqueue::http
