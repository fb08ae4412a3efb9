#include "simqueue/app/api/authorizer.hpp"

#include "simqueue/util/conv.hpp"

namespace simqueue::api {

auto HeaderAuthorizer::authenticate(const http::HttpRequest &req)
    -> task<Result<UserId>> {
  auto value = req.header(header_);
  if (!value) {
    co_return fail(Error::Unauthorized);
  }
  auto id = util::parse_int<UserId>(*value);
  if (!id || *id <= 0) {
    co_return fail(Error::Unauthorized);
  }
  co_return ok(*id);
}

} // namespace simqueue::api
