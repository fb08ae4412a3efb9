#include "simqueue/app/http/router.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <string>

using namespace simqueue;
using namespace simqueue::http;
using test::run_coro;

namespace {

auto make_request(HttpMethod method, std::string path) -> HttpRequest {
  HttpRequest req;
  req.method = method;
  req.path = std::move(path);
  return req;
}

auto text(std::string body) -> RouteHandler {
  return [body = std::move(body)](HttpRequest) -> task<HttpResponse> {
    co_return HttpResponse::json(body);
  };
}

} // namespace

TEST(RouterTest, StaticRoute) {
  Router router;
  router.get("/health", text(R"({"status":"ok"})"));

  auto resp = run_coro(router.route(make_request(HttpMethod::GET, "/health")));
  EXPECT_EQ(resp.status, HttpStatus::Ok);
  EXPECT_EQ(resp.body_as_string(), R"({"status":"ok"})");
}

TEST(RouterTest, UnknownPathIs404) {
  Router router;
  router.get("/health", text("{}"));

  auto resp = run_coro(router.route(make_request(HttpMethod::GET, "/nope")));
  EXPECT_EQ(resp.status, HttpStatus::NotFound);
  EXPECT_EQ(resp.body_as_string(), R"({"error":"not found"})");
}

TEST(RouterTest, MethodsAreSeparate) {
  Router router;
  router.get("/queue", text(R"("get")"));
  router.post("/queue", text(R"("post")"));

  auto get = run_coro(router.route(make_request(HttpMethod::GET, "/queue")));
  auto post = run_coro(router.route(make_request(HttpMethod::POST, "/queue")));
  auto del = run_coro(router.route(make_request(HttpMethod::DELETE, "/queue")));
  EXPECT_EQ(get.body_as_string(), R"("get")");
  EXPECT_EQ(post.body_as_string(), R"("post")");
  EXPECT_EQ(del.status, HttpStatus::NotFound);
}

TEST(RouterTest, PathParameter) {
  Router router;
  router.get("/queue/{id}", [](HttpRequest req) -> task<HttpResponse> {
    auto id = req.path_param("id");
    co_return HttpResponse::json(id ? "\"" + *id + "\"" : "null");
  });

  auto resp =
      run_coro(router.route(make_request(HttpMethod::GET, "/queue/42")));
  EXPECT_EQ(resp.status, HttpStatus::Ok);
  EXPECT_EQ(resp.body_as_string(), R"("42")");
}

TEST(RouterTest, StaticRouteWinsOverParameter) {
  Router router;
  router.get("/queue/{id}", text(R"("job")"));
  router.get("/queue/stats", text(R"("stats")"));

  auto stats =
      run_coro(router.route(make_request(HttpMethod::GET, "/queue/stats")));
  auto job = run_coro(router.route(make_request(HttpMethod::GET, "/queue/7")));
  EXPECT_EQ(stats.body_as_string(), R"("stats")");
  EXPECT_EQ(job.body_as_string(), R"("job")");
}

TEST(RouterTest, EmptyParameterDoesNotMatch) {
  Router router;
  router.del("/queue/{id}", text("{}"));

  auto resp =
      run_coro(router.route(make_request(HttpMethod::DELETE, "/queue/")));
  EXPECT_EQ(resp.status, HttpStatus::NotFound);
}

TEST(RouterTest, SegmentCountMustMatch) {
  Router router;
  router.get("/queue/{id}", text("{}"));

  auto deeper =
      run_coro(router.route(make_request(HttpMethod::GET, "/queue/1/extra")));
  EXPECT_EQ(deeper.status, HttpStatus::NotFound);
}
