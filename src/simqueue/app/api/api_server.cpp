#include "simqueue/app/api/api_server.hpp"

#include "simqueue/app/api/authorizer.hpp"
#include "simqueue/app/api/job_json.hpp"
#include "simqueue/app/http/http_server.hpp"
#include "simqueue/app/http/router.hpp"
#include "simqueue/core/coroutine.hpp"
#include "simqueue/core/runtime.hpp"
#include "simqueue/storage/job_store.hpp"
#include "simqueue/util/conv.hpp"
#include "simqueue/util/log.hpp"

#include <format>
#include <string>
#include <utility>

namespace simqueue::api {

using namespace http;

namespace {

constexpr std::string_view kQueuePath = "/api/v1/simulations/queue";

auto error_response(HttpStatus status, std::string_view message)
    -> HttpResponse {
  return HttpResponse::json(error_json(message), status);
}

auto store_error_response(std::string_view what, const std::error_code &ec)
    -> HttpResponse {
  const auto status = status_from_error(ec);
  if (status == HttpStatus::InternalServerError ||
      status == HttpStatus::ServiceUnavailable) {
    log::error("{}: {}", what, ec.message());
  }
  return error_response(status, std::format("{}: {}", what, ec.message()));
}

auto parse_job_id(const HttpRequest &req) -> Result<JobId> {
  auto raw = req.path_param("id");
  if (!raw) {
    return fail(raw.error());
  }
  return util::parse_int<JobId>(*raw);
}

} // namespace

auto status_from_error(const std::error_code &ec) -> HttpStatus {
  if (ec.category() != error_category()) {
    return HttpStatus::InternalServerError;
  }
  if (is_infrastructure_error(ec)) {
    return HttpStatus::ServiceUnavailable;
  }
  switch (static_cast<Error>(ec.value())) {
  case Error::InvalidArgument:
  case Error::ParseError:
    return HttpStatus::BadRequest;
  case Error::Unauthorized:
    return HttpStatus::Unauthorized;
  case Error::NotFound:
    return HttpStatus::NotFound;
  case Error::Conflict:
  case Error::InvalidState:
    return HttpStatus::Conflict;
  case Error::Timeout:
    return HttpStatus::ServiceUnavailable;
  default:
    return HttpStatus::InternalServerError;
  }
}

struct ApiServer::Impl {
  JobStore &store_;
  Authorizer &authorizer_;
  ApiConfig config_;
  HttpServer server_;

  Impl(Runtime &runtime, JobStore &store, Authorizer &authorizer,
       ApiConfig config)
      : store_(store), authorizer_(authorizer), config_(std::move(config)),
        server_(runtime) {}

  using AuthedHandler = task<HttpResponse> (Impl::*)(HttpRequest, UserId);

  auto authed(AuthedHandler fn) -> RouteHandler {
    return [this, fn](HttpRequest req) -> task<HttpResponse> {
      auto user = co_await authorizer_.authenticate(req);
      if (!user) {
        co_return error_response(HttpStatus::Unauthorized,
                                 "user not authenticated");
      }
      co_return co_await (this->*fn)(std::move(req), *user);
    };
  }

  auto setup_routes() -> void {
    auto &router = server_.router();
    const std::string queue(kQueuePath);

    router.post(queue, authed(&Impl::enqueue));
    router.get(queue, authed(&Impl::list_jobs));
    router.get(queue + "/stats", authed(&Impl::queue_stats));
    router.get(queue + "/{id}", authed(&Impl::get_job));
    router.del(queue + "/{id}", authed(&Impl::cancel_job));

    router.get("/health", [](HttpRequest) -> task<HttpResponse> {
      co_return HttpResponse::json(R"({"status":"ok"})");
    });
    router.get("/ready", [this](HttpRequest) -> task<HttpResponse> {
      if (auto r = co_await store_.ping(); !r) {
        log::warn("Readiness check failed: {}", r.error().message());
        co_return HttpResponse::json(R"({"status":"unavailable"})",
                                     HttpStatus::ServiceUnavailable);
      }
      co_return HttpResponse::json(R"({"status":"ready"})");
    });
  }

  auto enqueue(HttpRequest req, UserId user) -> task<HttpResponse> {
    auto body = parse_enqueue_request(req.body_as_string());
    if (!body) {
      co_return error_response(HttpStatus::BadRequest,
                               "invalid request body");
    }
    if (body->service_id.empty()) {
      co_return error_response(HttpStatus::BadRequest,
                               "service_id is required");
    }
    if (!body->current_config || !body->proposed_config) {
      co_return error_response(
          HttpStatus::BadRequest,
          "current_config and proposed_config are required");
    }

    int priority = body->priority.value_or(0);
    if (priority == 0) {
      priority = kDefaultPriority;
    }
    if (priority < kMinPriority || priority > kMaxPriority) {
      co_return error_response(
          HttpStatus::BadRequest,
          std::format("priority must be between {} and {}", kMinPriority,
                      kMaxPriority));
    }

    log::info("Enqueue request: user={} service={} current_config={}B "
              "proposed_config={}B",
              user, body->service_id, body->current_config->size(),
              body->proposed_config->size());

    auto job = co_await store_.enqueue(EnqueueInput{
        .user_id = user,
        .service_id = std::move(body->service_id),
        .llm_provider = std::move(body->llm_provider),
        .prompt_version_id = body->prompt_version_id,
        .current_config = std::move(body->current_config),
        .proposed_config = std::move(body->proposed_config),
        .context = std::move(body->context),
        .options = std::move(body->options),
        .priority = priority,
    });
    if (!job) {
      co_return store_error_response("failed to enqueue simulation",
                                     job.error());
    }
    co_return HttpResponse::json(job_envelope_json(*job), HttpStatus::Created);
  }

  auto list_jobs(HttpRequest req, UserId user) -> task<HttpResponse> {
    const auto query = req.query();

    JobFilter filter{.user_id = user, .status = std::nullopt};
    if (auto status = query.get("status"); status && !status->empty()) {
      auto parsed = parse<JobStatus>(*status);
      if (!parsed) {
        co_return error_response(HttpStatus::BadRequest,
                                 std::format("invalid status '{}'", *status));
      }
      filter.status = *parsed;
    }

    std::int64_t limit = kDefaultPageLimit;
    if (auto raw = query.get("limit")) {
      if (auto v = util::parse_int<std::int64_t>(*raw); v && *v > 0) {
        limit = *v;
      }
    }
    std::int64_t offset = 0;
    if (auto raw = query.get("offset")) {
      if (auto v = util::parse_int<std::int64_t>(*raw); v && *v >= 0) {
        offset = *v;
      }
    }

    auto page = co_await store_.list_jobs(filter, limit, offset);
    if (!page) {
      co_return store_error_response("failed to list jobs", page.error());
    }
    co_return HttpResponse::json(job_page_json(*page));
  }

  auto queue_stats(HttpRequest, UserId) -> task<HttpResponse> {
    auto stats = co_await store_.get_queue_stats();
    if (!stats) {
      co_return store_error_response("failed to get queue stats",
                                     stats.error());
    }
    co_return HttpResponse::json(queue_stats_json(*stats));
  }

  auto get_job(HttpRequest req, UserId) -> task<HttpResponse> {
    auto id = parse_job_id(req);
    if (!id) {
      co_return error_response(HttpStatus::BadRequest, "invalid job ID");
    }
    auto job = co_await store_.get_job(*id);
    if (!job) {
      co_return store_error_response("failed to retrieve job", job.error());
    }
    if (!job->has_value()) {
      co_return error_response(HttpStatus::NotFound, "job not found");
    }
    co_return HttpResponse::json(job_envelope_json(**job));
  }

  auto cancel_job(HttpRequest req, UserId user) -> task<HttpResponse> {
    auto id = parse_job_id(req);
    if (!id) {
      co_return error_response(HttpStatus::BadRequest, "invalid job ID");
    }
    if (auto r = co_await store_.cancel_job(*id); !r) {
      if (r.error() == make_error_code(Error::Conflict)) {
        co_return error_response(HttpStatus::Conflict,
                                 "job not found or not pending");
      }
      co_return store_error_response("failed to cancel job", r.error());
    }
    log::info("Job {} cancelled by user {}", *id, user);
    co_return HttpResponse::json(message_json("job cancelled"));
  }
};

ApiServer::ApiServer(Runtime &runtime, JobStore &store,
                     Authorizer &authorizer, ApiConfig config)
    : impl_(std::make_shared<Impl>(runtime, store, authorizer,
                                   std::move(config))) {
  impl_->setup_routes();
}

ApiServer::~ApiServer() { stop(); }

auto ApiServer::start() -> Result<void> {
  const auto &cfg = impl_->config_;
  if (cfg.tls_enabled) {
    if (auto r = impl_->server_.set_tls_credentials(cfg.tls_cert_file,
                                                    cfg.tls_key_file);
        !r) {
      return fail(r.error());
    }
  }
  return impl_->server_.start(cfg.host, cfg.port, cfg.reuse_port);
}

auto ApiServer::stop() -> void { impl_->server_.stop(); }

auto ApiServer::is_running() const -> bool {
  return impl_->server_.is_running();
}

auto ApiServer::port() const -> std::uint16_t {
  return impl_->server_.local_port();
}

} // namespace simqueue::api
