#include "simqueue/app/http/http_server.hpp"

#include "simqueue/app/http/router.hpp"
#include "simqueue/core/asio_awaitable.hpp"
#include "simqueue/core/runtime.hpp"
#include "simqueue/util/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/url/parse.hpp>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <sys/socket.h>
#include <vector>

namespace simqueue::http {

namespace {
constexpr auto kHttpIoTimeout = std::chrono::seconds(30);
constexpr std::uint32_t kParserHeaderLimit = 64 * 1024;
constexpr std::uint64_t kParserBodyLimit = 10ULL * 1024ULL * 1024ULL;

namespace beast = boost::beast;
namespace beast_http = beast::http;
namespace net = boost::asio;

using BeastRequest = beast_http::request<beast_http::vector_body<uint8_t>>;
using BeastResponse = beast_http::response<beast_http::vector_body<uint8_t>>;

auto to_method(beast_http::verb verb) noexcept -> std::optional<HttpMethod> {
  switch (verb) {
  case beast_http::verb::get:
    return HttpMethod::GET;
  case beast_http::verb::post:
    return HttpMethod::POST;
  case beast_http::verb::put:
    return HttpMethod::PUT;
  case beast_http::verb::delete_:
    return HttpMethod::DELETE;
  case beast_http::verb::patch:
    return HttpMethod::PATCH;
  case beast_http::verb::head:
    return HttpMethod::HEAD;
  default:
    return std::nullopt;
  }
}

auto to_request(BeastRequest &msg, HttpMethod method) -> HttpRequest {
  HttpRequest out;
  out.method = method;

  std::string target(msg.target());
  if (auto parsed = boost::urls::parse_origin_form(target); parsed) {
    out.path = std::string(parsed->path());
    if (auto query = parsed->encoded_query(); !query.empty()) {
      out.query_string.assign(query.data(), query.size());
    }
  } else {
    out.path = std::move(target);
  }

  for (const auto &field : msg.base()) {
    out.headers.insert_or_assign(std::string(field.name_string()),
                                 std::string(field.value()));
  }
  out.body = std::move(msg.body());
  return out;
}

auto to_beast_response(const HttpResponse &resp, unsigned version,
                       bool keep_alive) -> BeastResponse {
  BeastResponse out{static_cast<beast_http::status>(resp.status), version};
  out.keep_alive(keep_alive);
  for (const auto &[k, v] : resp.headers) {
    out.set(k, v);
  }
  out.body() = resp.body;
  out.prepare_payload();
  return out;
}

[[nodiscard]] auto is_quiet_close(const boost::system::error_code &ec) -> bool {
  return ec == net::error::eof || ec == beast::error::timeout ||
         ec == beast_http::error::end_of_stream ||
         ec == net::error::operation_aborted ||
         ec == net::ssl::error::stream_truncated;
}
} // namespace

struct HttpServer::Impl : std::enable_shared_from_this<HttpServer::Impl> {
  Runtime &runtime;
  Router router_;
  std::shared_ptr<net::ssl::context> tls_ctx;
  std::vector<std::shared_ptr<net::ip::tcp::acceptor>> acceptors;
  std::atomic<bool> running{false};
  std::atomic<std::uint16_t> bound_port{0};

  explicit Impl(Runtime &rt) : runtime(rt) {}

  /// Request/response loop shared by plain and TLS streams.
  template <typename Stream>
  auto serve(Stream &stream, beast::flat_buffer &read_buffer) -> task<void> {
    while (running.load(std::memory_order_acquire)) {
      beast_http::request_parser<beast_http::vector_body<uint8_t>> parser;
      parser.header_limit(kParserHeaderLimit);
      parser.body_limit(kParserBodyLimit);

      auto [read_ec, read_n] = co_await beast_http::async_read(
          stream, read_buffer, parser,
          net::cancel_after(kHttpIoTimeout, simqueue::use_nothrow));
      (void)read_n;
      if (read_ec) {
        if (!is_quiet_close(read_ec)) {
          log::warn("HTTP read failed: {}", read_ec.message());
        }
        co_return;
      }

      auto beast_req = parser.release();
      const auto version = beast_req.version();
      const bool keep_alive = beast_req.keep_alive();

      HttpResponse resp;
      if (auto method = to_method(beast_req.method()); !method) {
        resp = HttpResponse::json(R"({"error":"method not allowed"})",
                                  HttpStatus::MethodNotAllowed);
      } else {
        auto req = to_request(beast_req, *method);
        log::debug("HTTP request: {} {}", req.method, req.path);
        try {
          resp = co_await router_.route(std::move(req));
        } catch (const std::exception &e) {
          log::error("Unhandled exception in HTTP handler: {}", e.what());
          resp = HttpResponse::json(R"({"error":"internal server error"})",
                                    HttpStatus::InternalServerError);
        }
      }

      auto beast_resp = to_beast_response(resp, version, keep_alive);
      auto [write_ec, written] = co_await beast_http::async_write(
          stream, beast_resp,
          net::cancel_after(kHttpIoTimeout, simqueue::use_nothrow));
      (void)written;
      if (write_ec) {
        log::warn("HTTP write failed: {}", write_ec.message());
        co_return;
      }
      if (!keep_alive) {
        co_return;
      }
    }
  }

  auto handle_connection(net::ip::tcp::socket socket,
                         beast::flat_buffer read_buffer) -> spawn_task {
    auto self = shared_from_this();
    co_await serve(socket, read_buffer);
    boost::system::error_code ec;
    socket.shutdown(net::ip::tcp::socket::shutdown_send, ec);
  }

  auto handle_tls_connection(net::ip::tcp::socket socket,
                             beast::flat_buffer detect_buffer) -> spawn_task {
    auto self = shared_from_this();
    net::ssl::stream<net::ip::tcp::socket> stream(std::move(socket), *tls_ctx);

    auto [hs_ec, consumed] = co_await stream.async_handshake(
        net::ssl::stream_base::server, detect_buffer.data(),
        net::cancel_after(kHttpIoTimeout, simqueue::use_nothrow));
    if (hs_ec) {
      log::warn("TLS handshake failed: {}", hs_ec.message());
      co_return;
    }
    detect_buffer.consume(consumed);

    co_await serve(stream, detect_buffer);

    auto [shutdown_ec] = co_await stream.async_shutdown(
        net::cancel_after(kHttpIoTimeout, simqueue::use_nothrow));
    (void)shutdown_ec;
  }

  /// Sniffs the first bytes for a TLS ClientHello. Runs per connection; a
  /// silent client holds only its own socket.
  auto handle_accepted(net::ip::tcp::socket socket) -> spawn_task {
    auto self = shared_from_this();
    beast::flat_buffer detect_buffer;
    auto [detect_ec, is_ssl] = co_await beast::async_detect_ssl(
        socket, detect_buffer,
        net::cancel_after(kHttpIoTimeout, simqueue::use_nothrow));
    if (detect_ec) {
      log::debug("SSL detection failed: {}", detect_ec.message());
      co_return;
    }
    if (!is_ssl) {
      co_await handle_connection(std::move(socket), std::move(detect_buffer));
      co_return;
    }
    if (!tls_ctx) {
      log::warn("TLS client detected but TLS is not configured; closing");
      co_return;
    }
    co_await handle_tls_connection(std::move(socket), std::move(detect_buffer));
  }

  auto accept_loop(std::shared_ptr<net::ip::tcp::acceptor> acceptor)
      -> spawn_task {
    auto self = shared_from_this();
    while (running.load(std::memory_order_acquire)) {
      net::ip::tcp::socket socket(acceptor->get_executor());
      auto [accept_ec] =
          co_await acceptor->async_accept(socket, simqueue::use_nothrow);
      if (accept_ec) {
        if (running && accept_ec != net::error::operation_aborted) {
          log::error("Accept failed: {}", accept_ec.message());
        }
        break;
      }

      boost::system::error_code nodelay_ec;
      socket.set_option(net::ip::tcp::no_delay(true), nodelay_ec);

      runtime.spawn_external(handle_accepted(std::move(socket)));
    }
  }

  auto open_acceptor(IoContext &io_ctx, const net::ip::tcp::endpoint &ep,
                     bool reuse_port)
      -> Result<std::shared_ptr<net::ip::tcp::acceptor>> {
    auto acceptor = std::make_shared<net::ip::tcp::acceptor>(io_ctx);
    boost::system::error_code ec;

    acceptor->open(ep.protocol(), ec);
    if (ec) {
      log::error("Failed to open acceptor: {}", ec.message());
      return fail(ec);
    }
    acceptor->set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
      log::warn("Failed to set SO_REUSEADDR: {}", ec.message());
      ec.clear();
    }
#ifdef SO_REUSEPORT
    if (reuse_port) {
      int reuse = 1;
      if (::setsockopt(acceptor->native_handle(), SOL_SOCKET, SO_REUSEPORT,
                       &reuse, sizeof(reuse)) < 0) {
        const auto err = std::error_code(errno, std::system_category());
        log::error("Failed to set SO_REUSEPORT: {}", err.message());
        return fail(err);
      }
    }
#else
    if (reuse_port) {
      log::error("SO_REUSEPORT is not supported on this platform");
      return fail(Error::InvalidArgument);
    }
#endif
    acceptor->bind(ep, ec);
    if (ec) {
      log::error("Failed to bind {}:{}: {}", ep.address().to_string(),
                 ep.port(), ec.message());
      return fail(ec);
    }
    acceptor->listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
      log::error("Failed to listen on {}:{}: {}", ep.address().to_string(),
                 ep.port(), ec.message());
      return fail(ec);
    }
    return ok(std::move(acceptor));
  }

  auto close_acceptors() -> void {
    for (std::size_t i = 0; i < acceptors.size(); ++i) {
      net::post(acceptors[i]->get_executor(), [acc = acceptors[i]]() {
        boost::system::error_code ec;
        acc->cancel(ec);
        acc->close(ec);
      });
    }
    acceptors.clear();
  }
};

HttpServer::HttpServer(Runtime &runtime)
    : impl_(std::make_shared<Impl>(runtime)) {}

HttpServer::~HttpServer() { stop(); }

auto HttpServer::router() -> Router & { return impl_->router_; }

auto HttpServer::set_tls_credentials(std::string cert_chain_file,
                                     std::string private_key_file)
    -> Result<void> {
  auto ctx = std::make_shared<net::ssl::context>(net::ssl::context::tls_server);
  boost::system::error_code ec;
  ctx->set_options(net::ssl::context::default_workarounds |
                       net::ssl::context::no_sslv2 |
                       net::ssl::context::no_sslv3 |
                       net::ssl::context::single_dh_use,
                   ec);
  if (ec) {
    log::error("TLS context option setup failed: {}", ec.message());
    return fail(Error::InvalidArgument);
  }

  ctx->use_certificate_chain_file(cert_chain_file, ec);
  if (ec) {
    log::error("Failed to load TLS certificate '{}': {}", cert_chain_file,
               ec.message());
    return fail(Error::InvalidArgument);
  }

  ctx->use_private_key_file(private_key_file, net::ssl::context::pem, ec);
  if (ec) {
    log::error("Failed to load TLS private key '{}': {}", private_key_file,
               ec.message());
    return fail(Error::InvalidArgument);
  }

  impl_->tls_ctx = std::move(ctx);
  log::info("TLS enabled for HTTP server (cert='{}')", cert_chain_file);
  return ok();
}

auto HttpServer::start(std::string_view host, std::uint16_t port,
                       bool reuse_port) -> Result<void> {
  if (impl_->running.load()) {
    return fail(Error::InvalidState);
  }

  boost::system::error_code addr_ec;
  net::ip::address bind_address;
  if (host.empty() || host == "0.0.0.0") {
    bind_address = net::ip::address_v4::any();
  } else {
    bind_address = net::ip::make_address(std::string(host), addr_ec);
  }
  if (addr_ec) {
    log::error("Invalid host address '{}': {}", host, addr_ec.message());
    return fail(Error::InvalidArgument);
  }

  const unsigned acceptor_count =
      reuse_port ? std::max(1U, impl_->runtime.shard_count()) : 1U;

  net::ip::tcp::endpoint ep{bind_address, port};
  for (unsigned i = 0; i < acceptor_count; ++i) {
    auto acceptor = impl_->open_acceptor(impl_->runtime.context(i), ep,
                                         reuse_port);
    if (!acceptor) {
      impl_->close_acceptors();
      return fail(acceptor.error());
    }
    if (i == 0) {
      // Later acceptors share the port the first one was given.
      boost::system::error_code ep_ec;
      ep.port((*acceptor)->local_endpoint(ep_ec).port());
      impl_->bound_port.store(ep.port());
    }
    impl_->acceptors.push_back(std::move(*acceptor));
  }

  impl_->running = true;
  for (unsigned i = 0; i < acceptor_count; ++i) {
    impl_->runtime.spawn_on(i, impl_->accept_loop(impl_->acceptors[i]));
  }

  log::info("HTTP server listening on {}:{} (acceptors={}, tls={})", host,
            ep.port(), acceptor_count, impl_->tls_ctx != nullptr);
  return ok();
}

auto HttpServer::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }
  log::info("Stopping HTTP server...");
  impl_->close_acceptors();
  log::info("HTTP server stopped");
}

auto HttpServer::is_running() const -> bool { return impl_->running.load(); }

auto HttpServer::local_port() const -> std::uint16_t {
  return impl_->bound_port.load();
}

} // namespace simqueue::http
