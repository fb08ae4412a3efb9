#include "simqueue/app/http/router.hpp"

#include <ankerl/unordered_dense.h>

#include <algorithm>
#include <array>
#include <optional>
#include <ranges>
#include <string_view>
#include <utility>
#include <vector>

namespace simqueue::http {

namespace {

[[nodiscard]] auto not_found() -> HttpResponse {
  return HttpResponse::json(R"({"error":"not found"})",
                            HttpStatus::NotFound);
}

} // namespace

struct Router::Impl {
  using Params = std::vector<std::pair<std::string, std::string>>;

  struct Segment {
    std::string text; // literal, or the parameter name
    bool param{false};
  };

  struct ParamRoute {
    std::vector<Segment> segments;
    RouteHandler handler;
  };

  // Exact paths hit the hash map; parameterised routes are bucketed by
  // segment count and tried in registration order.
  struct MethodTable {
    ankerl::unordered_dense::map<std::string, RouteHandler, StringHash,
                                 StringEqual>
        exact;
    ankerl::unordered_dense::map<std::size_t, std::vector<ParamRoute>> by_depth;
  };

  static constexpr std::size_t kMethodCount =
      static_cast<std::size_t>(HttpMethod::HEAD) + 1;

  std::array<MethodTable, kMethodCount> tables;

  auto table(HttpMethod method) -> MethodTable & {
    return tables[static_cast<std::size_t>(method)];
  }

  static auto split_path(std::string_view path)
      -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    for (auto part : path | std::views::split('/')) {
      parts.emplace_back(std::string_view(part));
    }
    return parts;
  }

  static auto parse_pattern(std::string_view pattern) -> std::vector<Segment> {
    std::vector<Segment> segments;
    for (auto seg : split_path(pattern)) {
      if (seg.size() > 2 && seg.front() == '{' && seg.back() == '}') {
        segments.push_back({std::string(seg.substr(1, seg.size() - 2)), true});
      } else {
        segments.push_back({std::string(seg), false});
      }
    }
    return segments;
  }

  static auto match(const ParamRoute &route,
                    const std::vector<std::string_view> &parts)
      -> std::optional<Params> {
    Params params;
    for (auto &&[seg, part] : std::views::zip(route.segments, parts)) {
      if (!seg.param) {
        if (seg.text != part) {
          return std::nullopt;
        }
      } else if (part.empty()) {
        return std::nullopt;
      } else {
        params.emplace_back(seg.text, part);
      }
    }
    return params;
  }
};

Router::Router() : impl_(std::make_unique<Impl>()) {}

Router::~Router() = default;

auto Router::add_route(HttpMethod method, std::string path,
                       RouteHandler handler) -> void {
  auto &table = impl_->table(method);
  auto segments = Impl::parse_pattern(path);
  if (std::ranges::none_of(segments, &Impl::Segment::param)) {
    table.exact.insert_or_assign(std::move(path), std::move(handler));
    return;
  }
  const auto depth = segments.size();
  table.by_depth[depth].push_back(
      {.segments = std::move(segments), .handler = std::move(handler)});
}

auto Router::get(std::string path, RouteHandler handler) -> void {
  add_route(HttpMethod::GET, std::move(path), std::move(handler));
}

auto Router::post(std::string path, RouteHandler handler) -> void {
  add_route(HttpMethod::POST, std::move(path), std::move(handler));
}

auto Router::del(std::string path, RouteHandler handler) -> void {
  add_route(HttpMethod::DELETE, std::move(path), std::move(handler));
}

auto Router::route(HttpRequest req) -> simqueue::task<HttpResponse> {
  auto &table = impl_->table(req.method);

  if (auto it = table.exact.find(req.path); it != table.exact.end()) {
    co_return co_await it->second(std::move(req));
  }

  const auto parts = Impl::split_path(req.path);
  if (auto bucket = table.by_depth.find(parts.size());
      bucket != table.by_depth.end()) {
    for (auto &candidate : bucket->second) {
      auto params = Impl::match(candidate, parts);
      if (!params) {
        continue;
      }
      req.path_params.clear();
      for (auto &[name, value] : *params) {
        req.path_params.insert_or_assign(std::move(name), std::move(value));
      }
      co_return co_await candidate.handler(std::move(req));
    }
  }

  co_return not_found();
}

} // namespace simqueue::http
