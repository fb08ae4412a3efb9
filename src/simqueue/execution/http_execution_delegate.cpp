#include "simqueue/execution/http_execution_delegate.hpp"

#include "simqueue/client/http/http_client.hpp"
#include "simqueue/util/log.hpp"

#include <chrono>

namespace simqueue {

HttpExecutionDelegate::HttpExecutionDelegate(
    boost::asio::any_io_executor executor, util::ParsedHttpUrl endpoint,
    std::chrono::milliseconds timeout)
    : executor_(std::move(executor)), endpoint_(std::move(endpoint)),
      timeout_(timeout) {}

auto HttpExecutionDelegate::create(boost::asio::any_io_executor executor,
                                   const WorkerConfig &config)
    -> Result<HttpExecutionDelegate> {
  auto base = util::parse_http_url(config.delegate_url);
  if (!base) {
    log::error("Invalid delegate URL '{}'", config.delegate_url);
    return fail(base.error());
  }
  auto endpoint = *base;
  endpoint.path = util::join_url_path(base->path, config.delegate_path);
  return HttpExecutionDelegate(
      std::move(executor), std::move(endpoint),
      std::chrono::duration_cast<std::chrono::milliseconds>(
          config.delegate_timeout));
}

auto HttpExecutionDelegate::evaluate(const Job &job)
    -> task<Result<DelegateResponse>> {
  http::HttpClientConfig client_cfg;
  client_cfg.connect_timeout = timeout_;
  client_cfg.read_timeout = timeout_;
  client_cfg.deadline = std::chrono::steady_clock::now() + timeout_;

  auto client = co_await http::HttpClient::connect(executor_, endpoint_,
                                                   client_cfg);
  if (!client) {
    co_return fail(client.error());
  }

  log::debug("Job {}: POST {}:{}{}", job.id, endpoint_.host, endpoint_.port,
             endpoint_.path);
  auto resp = co_await (*client)->post_json(endpoint_.path,
                                            build_evaluate_request(job));
  (*client)->close();
  if (!resp) {
    co_return fail(resp.error());
  }
  co_return ok(DelegateResponse{
      .status = resp->status_code(),
      .body = std::string(resp->body_as_string()),
  });
}

} // namespace simqueue
