#pragma once

#include "switchboard/routing/router.hpp"
#include "switchboard/routing/rules.hpp"

#include <memory>
#include <string>
#include <vector>

namespace switchboard::routing {

struct StaticRouterOptions {
  std::string local_backend = DEFAULT_LOCAL_BACKEND;
  /// Consulted in order when no model rule matches. Empty means unmatched models fail.
  std::vector<std::string> fallback_order = {"ollama", "openrouter", "anthropic", "openai",
                                             "huggingface"};
};

/// Picks a backend from the model name alone.
class StaticRouter final : public PipelineRouter {
public:
  [[nodiscard]] static common::Result<std::shared_ptr<StaticRouter>>
  create(RouterDeps deps, BackendMap backends, StaticRouterOptions options = {});

  [[nodiscard]] std::string_view strategy() const override { return "static"; }
  [[nodiscard]] const RuleTable &table() const { return table_; }

protected:
  [[nodiscard]] GatewayResult<Selection> select(const backends::CompletionRequest &request,
                                                const agents::AgentConfig &agent) override;

private:
  StaticRouter(RouterDeps deps, BackendMap backends, StaticRouterOptions options);

  BackendMap backends_;
  StaticRouterOptions options_;
  RuleTable table_;
};

} // namespace switchboard::routing
