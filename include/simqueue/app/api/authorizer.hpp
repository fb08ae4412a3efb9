#pragma once

#include "simqueue/client/http/http_types.hpp"
#include "simqueue/core/coroutine.hpp"
#include "simqueue/core/error.hpp"
#include "simqueue/queue/job.hpp"

#include <string>

namespace simqueue::api {

/// Resolves the user a request acts for. Error::Unauthorized when the
/// request carries no acceptable identity.
class Authorizer {
public:
  virtual ~Authorizer() = default;
  virtual auto authenticate(const http::HttpRequest &req)
      -> task<Result<UserId>> = 0;
};

/// Trusts a user id forwarded by an upstream gateway in a request header.
class HeaderAuthorizer final : public Authorizer {
public:
  static constexpr std::string_view kDefaultHeader = "X-User-Id";

  explicit HeaderAuthorizer(std::string header = std::string(kDefaultHeader))
      : header_(std::move(header)) {}

  auto authenticate(const http::HttpRequest &req)
      -> task<Result<UserId>> override;

private:
  std::string header_;
};

} // namespace simqueue::api
