#pragma once

#include "switchboard/routing/router.hpp"
#include "switchboard/routing/rules.hpp"
#include "switchboard/routing/static_router.hpp"

#include <memory>
#include <string>
#include <vector>

namespace switchboard::routing {

struct CloudRouterOptions {
  /// Used when no model rule matches.
  std::string default_backend = "openrouter";
  std::vector<std::string> priority = {"openrouter", "anthropic", "openai", "huggingface"};
  /// Excluded from the cloud set even when present in the backend map.
  std::string local_backend = DEFAULT_LOCAL_BACKEND;
};

/// Static-style routing restricted to cloud backends.
class CloudRouter final : public PipelineRouter {
public:
  [[nodiscard]] static common::Result<std::shared_ptr<CloudRouter>>
  create(RouterDeps deps, BackendMap backends, CloudRouterOptions options = {});

  [[nodiscard]] std::string_view strategy() const override { return "cloud"; }
  [[nodiscard]] const RuleTable &table() const { return table_; }

protected:
  [[nodiscard]] GatewayResult<Selection> select(const backends::CompletionRequest &request,
                                                const agents::AgentConfig &agent) override;

private:
  CloudRouter(RouterDeps deps, BackendMap backends, CloudRouterOptions options);

  BackendMap backends_;
  CloudRouterOptions options_;
  RuleTable table_;
};

} // namespace switchboard::routing
