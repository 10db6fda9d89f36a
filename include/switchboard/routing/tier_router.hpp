#pragma once

#include "switchboard/routing/router.hpp"
#include "switchboard/routing/rules.hpp"
#include "switchboard/routing/static_router.hpp"

#include <memory>
#include <string>
#include <vector>

namespace switchboard::routing {

struct TierRouterOptions {
  std::string local_backend = DEFAULT_LOCAL_BACKEND;
  std::vector<std::string> cloud_priority = {"openrouter", "anthropic", "openai", "huggingface"};
};

/// Routes by agent tier. Hybrid agents go to the cloud when the request's complexity score
/// reaches their threshold and stay local otherwise.
class TierRouter final : public PipelineRouter {
public:
  [[nodiscard]] static common::Result<std::shared_ptr<TierRouter>>
  create(RouterDeps deps, BackendMap backends, TierRouterOptions options = {});

  [[nodiscard]] std::string_view strategy() const override { return "tier"; }

protected:
  [[nodiscard]] GatewayResult<Selection> select(const backends::CompletionRequest &request,
                                                const agents::AgentConfig &agent) override;

private:
  TierRouter(RouterDeps deps, BackendMap backends, TierRouterOptions options);

  [[nodiscard]] std::optional<Selection> select_local(const backends::CompletionRequest &request,
                                                      std::string rule) const;
  [[nodiscard]] std::optional<Selection> select_cloud(const backends::CompletionRequest &request,
                                                      const std::string &rule) const;

  BackendMap backends_;
  TierRouterOptions options_;
  RuleTable cloud_table_;
};

} // namespace switchboard::routing
