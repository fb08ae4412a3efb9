#include "simqueue/client/http/http_client.hpp"

#include "simqueue/core/asio_awaitable.hpp"
#include "simqueue/util/log.hpp"

#include <boost/asio/cancel_after.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace simqueue::http {

namespace {

namespace beast = boost::beast;
namespace beast_http = beast::http;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

using TlsStream = ssl::stream<tcp::socket>;

[[nodiscard]] auto to_beast_verb(HttpMethod method) -> beast_http::verb {
  switch (method) {
  case HttpMethod::GET:
    return beast_http::verb::get;
  case HttpMethod::POST:
    return beast_http::verb::post;
  case HttpMethod::PUT:
    return beast_http::verb::put;
  case HttpMethod::DELETE:
    return beast_http::verb::delete_;
  case HttpMethod::PATCH:
    return beast_http::verb::patch;
  case HttpMethod::HEAD:
    return beast_http::verb::head;
  }
  return beast_http::verb::get;
}

[[nodiscard]] auto to_response(
    beast_http::response<beast_http::vector_body<std::uint8_t>> &&msg)
    -> HttpResponse {
  HttpResponse out;
  out.status = static_cast<HttpStatus>(msg.result_int());
  for (const auto &field : msg.base()) {
    out.headers.emplace(field.name_string(), field.value());
  }
  out.body = std::move(msg.body());
  return out;
}

// cancel_after surfaces an expired deadline as operation_aborted.
[[nodiscard]] auto transport_error(const boost::system::error_code &ec)
    -> std::unexpected<std::error_code> {
  if (ec == boost::asio::error::operation_aborted) {
    return fail(Error::Timeout);
  }
  return fail(ec);
}

// Time a single step may take, or nullopt once the deadline has passed.
[[nodiscard]] auto step_budget(const HttpClientConfig &config,
                               std::chrono::milliseconds step_timeout)
    -> std::optional<std::chrono::milliseconds> {
  if (!config.deadline) {
    return step_timeout;
  }
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      *config.deadline - std::chrono::steady_clock::now());
  if (left <= std::chrono::milliseconds::zero()) {
    return std::nullopt;
  }
  return std::min(step_timeout, left);
}

} // namespace

struct HttpClient::Impl {
  std::unique_ptr<ssl::context> tls_ctx;
  std::variant<tcp::socket, TlsStream> stream;
  HttpClientConfig config;
  std::string host_header;

  Impl(tcp::socket socket, HttpClientConfig cfg)
      : stream(std::move(socket)), config(cfg) {}
  Impl(std::unique_ptr<ssl::context> ctx, tcp::socket socket,
       HttpClientConfig cfg)
      : tls_ctx(std::move(ctx)),
        stream(std::in_place_type<TlsStream>, std::move(socket), *tls_ctx),
        config(cfg) {}

  auto lowest_layer() -> tcp::socket & {
    if (auto *tls = std::get_if<TlsStream>(&stream)) {
      return tls->next_layer();
    }
    return std::get<tcp::socket>(stream);
  }

  template <typename Stream>
  auto exchange(Stream &s, beast_http::request<beast_http::string_body> &req)
      -> task<Result<HttpResponse>> {
    auto write_budget = step_budget(config, config.read_timeout);
    if (!write_budget) {
      co_return fail(Error::Timeout);
    }
    auto [write_ec, written] = co_await beast_http::async_write(
        s, req, boost::asio::cancel_after(*write_budget, use_nothrow));
    (void)written;
    if (write_ec) {
      log::debug("HTTP write to {} failed: {}", host_header,
                 write_ec.message());
      co_return transport_error(write_ec);
    }

    beast::flat_buffer buffer;
    beast_http::response_parser<beast_http::vector_body<std::uint8_t>> parser;
    parser.header_limit(256 * 1024);
    parser.body_limit(config.max_response_size);

    auto read_budget = step_budget(config, config.read_timeout);
    if (!read_budget) {
      co_return fail(Error::Timeout);
    }
    auto [read_ec, read_n] = co_await beast_http::async_read(
        s, buffer, parser, boost::asio::cancel_after(*read_budget, use_nothrow));
    (void)read_n;
    if (read_ec) {
      log::debug("HTTP read from {} failed: {}", host_header,
                 read_ec.message());
      co_return transport_error(read_ec);
    }
    co_return ok(to_response(parser.release()));
  }
};

HttpClient::HttpClient(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

HttpClient::~HttpClient() = default;

auto HttpClient::connect(boost::asio::any_io_executor executor,
                         const util::ParsedHttpUrl &target,
                         HttpClientConfig config)
    -> task<Result<std::unique_ptr<HttpClient>>> {
  auto budget = step_budget(config, config.connect_timeout);
  if (!budget) {
    co_return fail(Error::Timeout);
  }
  tcp::resolver resolver(executor);
  auto [resolve_ec, endpoints] = co_await resolver.async_resolve(
      target.host, std::to_string(target.port),
      boost::asio::cancel_after(*budget, use_nothrow));
  if (resolve_ec) {
    log::debug("Failed to resolve {}:{} - {}", target.host, target.port,
               resolve_ec.message());
    co_return transport_error(resolve_ec);
  }

  budget = step_budget(config, config.connect_timeout);
  if (!budget) {
    co_return fail(Error::Timeout);
  }
  tcp::socket socket(executor);
  auto [connect_ec, endpoint] = co_await boost::asio::async_connect(
      socket, endpoints, boost::asio::cancel_after(*budget, use_nothrow));
  (void)endpoint;
  if (connect_ec) {
    log::debug("Failed to connect to {}:{} - {}", target.host, target.port,
               connect_ec.message());
    co_return transport_error(connect_ec);
  }
  socket.set_option(tcp::no_delay(true));

  std::unique_ptr<Impl> impl;
  if (!target.tls) {
    impl = std::make_unique<Impl>(std::move(socket), config);
  } else {
    auto ctx = std::make_unique<ssl::context>(ssl::context::tls_client);
    ctx->set_default_verify_paths();
    ctx->set_verify_mode(config.verify_peer ? ssl::verify_peer
                                            : ssl::verify_none);
    impl = std::make_unique<Impl>(std::move(ctx), std::move(socket), config);

    auto &tls = std::get<TlsStream>(impl->stream);
    if (!SSL_set_tlsext_host_name(tls.native_handle(), target.host.c_str())) {
      co_return fail(Error::ProtocolError);
    }
    if (config.verify_peer) {
      tls.set_verify_callback(ssl::host_name_verification(target.host));
    }
    budget = step_budget(config, config.connect_timeout);
    if (!budget) {
      co_return fail(Error::Timeout);
    }
    auto [hs_ec] = co_await tls.async_handshake(
        ssl::stream_base::client,
        boost::asio::cancel_after(*budget, use_nothrow));
    if (hs_ec) {
      log::debug("TLS handshake with {} failed: {}", target.host,
                 hs_ec.message());
      co_return transport_error(hs_ec);
    }
  }

  impl->host_header =
      (target.port == 80 || target.port == 443)
          ? target.host
          : std::format("{}:{}", target.host, target.port);
  co_return ok(std::unique_ptr<HttpClient>(new HttpClient(std::move(impl))));
}

auto HttpClient::request(HttpRequest req) -> task<Result<HttpResponse>> {
  if (!is_connected()) {
    co_return fail(Error::SystemNotRunning);
  }

  auto target = req.path;
  if (!req.query_string.empty()) {
    target.push_back('?');
    target.append(req.query_string);
  }

  beast_http::request<beast_http::string_body> msg{to_beast_verb(req.method),
                                                   target, 11};
  msg.set(beast_http::field::host, impl_->host_header);
  msg.set(beast_http::field::user_agent, "simqueue");
  for (const auto &[key, value] : req.headers) {
    msg.set(key, value);
  }
  msg.body().assign(req.body.begin(), req.body.end());
  msg.prepare_payload();

  if (auto *tls = std::get_if<TlsStream>(&impl_->stream)) {
    co_return co_await impl_->exchange(*tls, msg);
  }
  co_return co_await impl_->exchange(std::get<tcp::socket>(impl_->stream),
                                     msg);
}

auto HttpClient::get(std::string_view path, const HttpHeaders &headers)
    -> task<Result<HttpResponse>> {
  HttpRequest req;
  req.method = HttpMethod::GET;
  req.path = std::string(path);
  req.headers = headers;
  co_return co_await request(std::move(req));
}

auto HttpClient::post_json(std::string_view path, std::string_view json,
                           const HttpHeaders &headers)
    -> task<Result<HttpResponse>> {
  HttpRequest req;
  req.method = HttpMethod::POST;
  req.path = std::string(path);
  req.body.assign(json.begin(), json.end());
  req.headers = headers;
  req.headers["Content-Type"] = "application/json";
  co_return co_await request(std::move(req));
}

auto HttpClient::delete_(std::string_view path, const HttpHeaders &headers)
    -> task<Result<HttpResponse>> {
  HttpRequest req;
  req.method = HttpMethod::DELETE;
  req.path = std::string(path);
  req.headers = headers;
  co_return co_await request(std::move(req));
}

auto HttpClient::is_connected() const noexcept -> bool {
  return impl_ && impl_->lowest_layer().is_open();
}

auto HttpClient::close() -> void {
  boost::system::error_code ec;
  impl_->lowest_layer().shutdown(tcp::socket::shutdown_both, ec);
  impl_->lowest_layer().close(ec);
}

} // namespace simqueue::http
