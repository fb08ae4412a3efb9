#include "simqueue/execution/execution_delegate.hpp"

#include "simqueue/util/json.hpp"

#include <cstdint>
#include <optional>

namespace simqueue::execution_dto {

struct EvaluateRequest {
  std::string service_id;
  RawJson current_config;
  RawJson proposed_config;
  std::optional<std::string> llm_provider;
  std::optional<std::int64_t> prompt_version_id;
  std::optional<RawJson> context;
  std::optional<RawJson> options;
};

} // namespace simqueue::execution_dto

namespace glz {
template <> struct meta<simqueue::execution_dto::EvaluateRequest> {
  using T = simqueue::execution_dto::EvaluateRequest;
  static constexpr auto value =
      object("service_id", &T::service_id, "current_config",
             &T::current_config, "proposed_config", &T::proposed_config,
             "llm_provider", &T::llm_provider, "prompt_version_id",
             &T::prompt_version_id, "context", &T::context, "options",
             &T::options);
};
} // namespace glz

namespace simqueue {

auto build_evaluate_request(const Job &job) -> std::string {
  execution_dto::EvaluateRequest req{
      .service_id = job.service_id,
      .current_config = RawJson{job.current_config},
      .proposed_config = RawJson{job.proposed_config},
      .llm_provider = job.llm_provider,
      .prompt_version_id = job.prompt_version_id,
      .context = std::nullopt,
      .options = std::nullopt,
  };
  if (job.context) {
    req.context = RawJson{*job.context};
  }
  if (job.options) {
    req.options = RawJson{*job.options};
  }
  auto out = glz::write_json(req);
  return out ? std::move(*out) : std::string{"{}"};
}

} // namespace simqueue
