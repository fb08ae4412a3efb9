#pragma once

#include "simqueue/core/error.hpp"

#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace simqueue::util {

struct ParsedHttpUrl {
  bool tls{false};
  std::string host;
  std::uint16_t port{80};
  std::string path{"/"};
};

/// Accepts `http://` and `https://` URLs; a bare `host:port` is treated as
/// plain http. Any query string stays attached to `path`.
[[nodiscard]] inline auto parse_http_url(std::string_view url)
    -> Result<ParsedHttpUrl> {
  std::string normalized;
  if (url.find("://") == std::string_view::npos) {
    normalized = "http://";
    normalized.append(url);
    url = normalized;
  }

  auto parsed = boost::urls::parse_uri(url);
  if (!parsed) {
    return fail(Error::InvalidUrl);
  }
  const boost::urls::url_view &uri = *parsed;

  ParsedHttpUrl out;
  if (uri.scheme() == "https") {
    out.tls = true;
    out.port = 443;
  } else if (uri.scheme() != "http") {
    return fail(Error::InvalidUrl);
  }

  out.host = std::string(uri.host());
  if (out.host.empty()) {
    return fail(Error::InvalidUrl);
  }

  if (uri.has_port()) {
    auto port = uri.port_number();
    if (port == 0) {
      return fail(Error::InvalidUrl);
    }
    out.port = port;
  }

  auto path = std::string(uri.encoded_path());
  if (path.empty()) {
    path = "/";
  }
  if (auto query = uri.encoded_query(); !query.empty()) {
    path.push_back('?');
    path.append(query.data(), query.size());
  }
  out.path = std::move(path);
  return out;
}

/// Joins a base URL path and an endpoint path with exactly one slash.
[[nodiscard]] inline auto join_url_path(std::string_view base,
                                        std::string_view suffix)
    -> std::string {
  while (!base.empty() && base.back() == '/') {
    base.remove_suffix(1);
  }
  while (!suffix.empty() && suffix.front() == '/') {
    suffix.remove_prefix(1);
  }
  std::string out(base);
  out.push_back('/');
  out.append(suffix);
  return out;
}

} // namespace simqueue::util
