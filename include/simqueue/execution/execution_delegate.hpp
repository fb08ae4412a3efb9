#pragma once

#include "simqueue/core/coroutine.hpp"
#include "simqueue/core/error.hpp"
#include "simqueue/queue/job.hpp"

#include <string>

namespace simqueue {

/// What the evaluation service answered. Any status is a response; only a
/// failure to exchange the request at all is an error.
struct DelegateResponse {
  unsigned status{0};
  std::string body;

  [[nodiscard]] auto is_success() const noexcept -> bool {
    return status >= 200 && status < 300;
  }
};

/// The remote service that performs one simulation per job.
class ExecutionDelegate {
public:
  virtual ~ExecutionDelegate() = default;

  virtual auto evaluate(const Job &job) -> task<Result<DelegateResponse>> = 0;
};

/// JSON body sent to the evaluation service: service_id and both configs
/// always, llm_provider, prompt_version_id, context and options when set.
[[nodiscard]] auto build_evaluate_request(const Job &job) -> std::string;

} // namespace simqueue
