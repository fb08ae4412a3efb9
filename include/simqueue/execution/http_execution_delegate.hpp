#pragma once

#include "simqueue/config/system_config.hpp"
#include "simqueue/execution/execution_delegate.hpp"
#include "simqueue/util/url.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <chrono>

namespace simqueue {

/// POSTs each job to `{delegate_url}{delegate_path}` over a fresh
/// connection. `timeout` bounds the whole call, from resolve to the last
/// byte of the response.
class HttpExecutionDelegate final : public ExecutionDelegate {
public:
  HttpExecutionDelegate(boost::asio::any_io_executor executor,
                        util::ParsedHttpUrl endpoint,
                        std::chrono::milliseconds timeout);

  [[nodiscard]] static auto create(boost::asio::any_io_executor executor,
                                   const WorkerConfig &config)
      -> Result<HttpExecutionDelegate>;

  auto evaluate(const Job &job) -> task<Result<DelegateResponse>> override;

  [[nodiscard]] auto endpoint() const noexcept -> const util::ParsedHttpUrl & {
    return endpoint_;
  }

private:
  boost::asio::any_io_executor executor_;
  util::ParsedHttpUrl endpoint_;
  std::chrono::milliseconds timeout_;
};

} // namespace simqueue
