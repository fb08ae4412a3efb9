#pragma once

#include "simqueue/client/http/http_types.hpp"
#include "simqueue/core/coroutine.hpp"

#include <functional>
#include <memory>
#include <string>

namespace simqueue::http {

using RouteHandler =
    std::move_only_function<simqueue::task<HttpResponse>(HttpRequest)>;

/// Exact-path routes are looked up by hash; `{name}` segments match any
/// single non-empty segment and are exposed through
/// HttpRequest::path_param().
class Router {
public:
  Router();
  ~Router();

  Router(const Router &) = delete;
  auto operator=(const Router &) -> Router & = delete;

  auto add_route(HttpMethod method, std::string path, RouteHandler handler)
      -> void;

  auto get(std::string path, RouteHandler handler) -> void;
  auto post(std::string path, RouteHandler handler) -> void;
  auto del(std::string path, RouteHandler handler) -> void;

  [[nodiscard]] auto route(HttpRequest req) -> simqueue::task<HttpResponse>;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace simqueue::http
