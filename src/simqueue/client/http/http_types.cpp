#include "simqueue/client/http/http_types.hpp"

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/url/parse_query.hpp>

namespace simqueue::http {

QueryParams::QueryParams(std::string_view query_string) {
  if (query_string.empty()) {
    return;
  }
  auto parsed = boost::urls::parse_query(query_string);
  if (!parsed) {
    return;
  }
  for (const auto &param : *parsed) {
    params_[param.key.decode()] = param.value.decode();
  }
}

auto QueryParams::get(std::string_view key) const -> Result<std::string> {
  auto it = params_.find(key);
  if (it != params_.end())
    return ok(it->second);
  return fail(Error::NotFound);
}

auto QueryParams::has(std::string_view key) const -> bool {
  return params_.find(key) != params_.end();
}

auto HttpRequest::header(std::string_view key) const -> Result<std::string> {
  if (auto it = headers.find(key); it != headers.end()) {
    return ok(it->second);
  }
  // Field names are case-insensitive on the wire.
  for (const auto &[name, value] : headers) {
    if (boost::beast::iequals(name, key)) {
      return ok(value);
    }
  }
  return fail(Error::NotFound);
}

auto HttpRequest::body_as_string() const -> std::string_view {
  return {reinterpret_cast<const char *>(body.data()), body.size()};
}

auto HttpRequest::path_param(std::string_view key) const
    -> Result<std::string> {
  auto it = path_params.find(key);
  if (it != path_params.end()) {
    return ok(it->second);
  }
  return fail(Error::NotFound);
}

auto HttpRequest::query() const -> QueryParams {
  return QueryParams{query_string};
}

auto HttpResponse::json(std::string_view json_str, HttpStatus status)
    -> HttpResponse {
  HttpResponse resp{.status = status, .headers = {}, .body = {}};
  resp.headers["Content-Type"] = "application/json";
  resp.body.assign(json_str.begin(), json_str.end());
  return resp;
}

auto HttpResponse::set_header(std::string key, std::string value)
    -> HttpResponse & {
  headers[std::move(key)] = std::move(value);
  return *this;
}

auto HttpResponse::body_as_string() const -> std::string_view {
  return {reinterpret_cast<const char *>(body.data()), body.size()};
}

auto method_name(HttpMethod method) -> std::string_view {
  switch (method) {
  case HttpMethod::GET:
    return "GET";
  case HttpMethod::POST:
    return "POST";
  case HttpMethod::PUT:
    return "PUT";
  case HttpMethod::DELETE:
    return "DELETE";
  case HttpMethod::PATCH:
    return "PATCH";
  case HttpMethod::HEAD:
    return "HEAD";
  }
  return "UNKNOWN";
}

auto status_reason_phrase(HttpStatus status) -> std::string_view {
  namespace beast_http = boost::beast::http;
  return beast_http::obsolete_reason(static_cast<beast_http::status>(status));
}

} // namespace simqueue::http
