#pragma once

#include "simqueue/core/error.hpp"
#include "simqueue/util/string_hash.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace simqueue::http {

enum class HttpMethod : std::uint8_t { GET, POST, PUT, DELETE, PATCH, HEAD };

// Any numeric code may be carried; the named values are the ones the
// queue API produces.
enum class HttpStatus : std::uint16_t {
  Ok = 200,
  Created = 201,
  NoContent = 204,

  BadRequest = 400,
  Unauthorized = 401,
  NotFound = 404,
  MethodNotAllowed = 405,
  Conflict = 409,

  InternalServerError = 500,
  ServiceUnavailable = 503
};

[[nodiscard]] constexpr auto is_success(HttpStatus status) noexcept -> bool {
  const auto code = static_cast<std::uint16_t>(status);
  return code >= 200 && code < 300;
}

using HttpHeaders = std::unordered_map<std::string, std::string, StringHash,
                                       StringEqual>;

/// Decoded `key=value` pairs of a query string. Later duplicates win.
class QueryParams {
public:
  QueryParams() = default;
  explicit QueryParams(std::string_view query_string);

  [[nodiscard]] auto get(std::string_view key) const -> Result<std::string>;
  [[nodiscard]] auto has(std::string_view key) const -> bool;

private:
  std::unordered_map<std::string, std::string, StringHash, StringEqual>
      params_;
};

struct HttpRequest {
  HttpMethod method{HttpMethod::GET};
  std::string path;
  std::string query_string;
  HttpHeaders headers;
  std::vector<std::uint8_t> body;
  // Filled by the router while matching `{name}` segments.
  mutable std::unordered_map<std::string, std::string, StringHash,
                             StringEqual>
      path_params;

  [[nodiscard]] auto header(std::string_view key) const -> Result<std::string>;
  [[nodiscard]] auto body_as_string() const -> std::string_view;
  [[nodiscard]] auto path_param(std::string_view key) const
      -> Result<std::string>;
  [[nodiscard]] auto query() const -> QueryParams;
};

struct HttpResponse {
  HttpStatus status{HttpStatus::Ok};
  HttpHeaders headers;
  std::vector<std::uint8_t> body;

  [[nodiscard]] static auto json(std::string_view json_str,
                                 HttpStatus status = HttpStatus::Ok)
      -> HttpResponse;

  auto set_header(std::string key, std::string value) -> HttpResponse &;
  [[nodiscard]] auto body_as_string() const -> std::string_view;
  [[nodiscard]] auto status_code() const noexcept -> unsigned {
    return static_cast<unsigned>(status);
  }
};

[[nodiscard]] auto method_name(HttpMethod method) -> std::string_view;
[[nodiscard]] auto status_reason_phrase(HttpStatus status) -> std::string_view;

} // namespace simqueue::http

template <>
struct std::formatter<simqueue::http::HttpMethod>
    : std::formatter<std::string_view> {
  auto format(simqueue::http::HttpMethod method, auto &ctx) const {
    return std::formatter<std::string_view>::format(
        simqueue::http::method_name(method), ctx);
  }
};

template <>
struct std::formatter<simqueue::http::HttpStatus>
    : std::formatter<std::uint16_t> {
  auto format(simqueue::http::HttpStatus status, auto &ctx) const {
    return std::formatter<std::uint16_t>::format(
        static_cast<std::uint16_t>(status), ctx);
  }
};
