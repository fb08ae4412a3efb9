#pragma once

#include "simqueue/client/http/http_types.hpp"
#include "simqueue/core/coroutine.hpp"
#include "simqueue/core/error.hpp"
#include "simqueue/util/url.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

namespace simqueue::http {

struct HttpClientConfig {
  std::chrono::milliseconds connect_timeout{10000};
  std::chrono::milliseconds read_timeout{30000};
  /// Absolute cut-off for the whole exchange. Resolve, connect, handshake,
  /// write and read each get the smaller of their own timeout and what is
  /// left until the deadline.
  std::optional<std::chrono::steady_clock::time_point> deadline;
  std::size_t max_response_size{10UL * 1024UL * 1024UL};
  bool verify_peer{true};
};

/// One HTTP/1.1 connection, plain or TLS. Transport failures are returned
/// as errors; any HTTP status, 5xx included, is a successful response.
class HttpClient {
public:
  ~HttpClient();

  HttpClient(const HttpClient &) = delete;
  auto operator=(const HttpClient &) -> HttpClient & = delete;

  static auto connect(boost::asio::any_io_executor executor,
                      const util::ParsedHttpUrl &target,
                      HttpClientConfig config = {})
      -> task<Result<std::unique_ptr<HttpClient>>>;

  auto request(HttpRequest req) -> task<Result<HttpResponse>>;

  auto get(std::string_view path, const HttpHeaders &headers = {})
      -> task<Result<HttpResponse>>;

  auto post_json(std::string_view path, std::string_view json,
                 const HttpHeaders &headers = {})
      -> task<Result<HttpResponse>>;

  auto delete_(std::string_view path, const HttpHeaders &headers = {})
      -> task<Result<HttpResponse>>;

  [[nodiscard]] auto is_connected() const noexcept -> bool;
  auto close() -> void;

private:
  struct Impl;
  explicit HttpClient(std::unique_ptr<Impl> impl);

  std::unique_ptr<Impl> impl_;
};

} // namespace simqueue::http
