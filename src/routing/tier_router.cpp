#include "switchboard/routing/tier_router.hpp"

#include "switchboard/common/fs.hpp"
#include "switchboard/routing/complexity.hpp"

#include <sstream>

namespace switchboard::routing {

namespace {

std::vector<std::string> cloud_ids(const BackendMap &backends, const std::string &local) {
  std::vector<std::string> ids;
  for (const auto &[id, backend] : backends) {
    if (id != local) {
      ids.push_back(id);
    }
  }
  return ids;
}

GatewayError no_backend(const std::string &message) {
  return GatewayError{.kind = GatewayErrorKind::NoBackendAvailable, .message = message};
}

} // namespace

common::Result<std::shared_ptr<TierRouter>>
TierRouter::create(RouterDeps deps, BackendMap backends, TierRouterOptions options) {
  using R = common::Result<std::shared_ptr<TierRouter>>;
  if (!deps.registry) {
    return R::failure("agent registry is required");
  }
  if (backends.empty()) {
    return R::failure("at least one backend is required");
  }
  return R::success(std::shared_ptr<TierRouter>(
      new TierRouter(std::move(deps), std::move(backends), std::move(options))));
}

TierRouter::TierRouter(RouterDeps deps, BackendMap backends, TierRouterOptions options)
    : PipelineRouter(std::move(deps)), backends_(std::move(backends)),
      options_(std::move(options)),
      cloud_table_(cloud_route_table(
          merge_priority({options_.cloud_priority, cloud_ids(backends_, options_.local_backend)}))) {}

std::optional<Selection> TierRouter::select_local(const backends::CompletionRequest &request,
                                                  std::string rule) const {
  auto backend = find_backend(backends_, options_.local_backend);
  if (!backend) {
    return std::nullopt;
  }
  Selection selection{.backend = std::move(backend), .local = true, .rule = std::move(rule)};
  const std::string model = request.model.value_or("");
  for (const char *prefix : {"ollama/", "local/"}) {
    if (common::starts_with(common::to_lower(model), prefix)) {
      selection.model_override = model.substr(std::string(prefix).size());
      break;
    }
  }
  return selection;
}

std::optional<Selection> TierRouter::select_cloud(const backends::CompletionRequest &request,
                                                  const std::string &rule) const {
  const auto decision =
      cloud_table_.resolve(request.model.value_or(""), [this](const std::string &id) {
        return id != options_.local_backend && backends_.contains(id);
      });
  if (!decision.has_value()) {
    return std::nullopt;
  }
  return Selection{.backend = backends_.at(decision->backend),
                   .local = false,
                   .model_override = decision->model,
                   .deprecated_for = decision->deprecated_for,
                   .rule = rule + ":" + decision->rule};
}

GatewayResult<Selection> TierRouter::select(const backends::CompletionRequest &request,
                                            const agents::AgentConfig &agent) {
  std::optional<Selection> selection;
  switch (agent.tier) {
  case agents::Tier::Local:
    selection = select_local(request, "tier-local");
    if (!selection) {
      return GatewayResult<Selection>::failure(no_backend(
          "agent '" + agent.id + "' requires local backend '" + options_.local_backend + "'"));
    }
    break;
  case agents::Tier::Cloud:
    selection = select_cloud(request, "tier-cloud");
    if (!selection) {
      return GatewayResult<Selection>::failure(
          no_backend("no cloud backend available for agent '" + agent.id + "'"));
    }
    break;
  case agents::Tier::Hybrid: {
    const double score = complexity_score(request);
    std::ostringstream rule;
    rule << "hybrid score=" << score << " threshold=" << agent.complexity_threshold;
    if (score >= agent.complexity_threshold) {
      selection = select_cloud(request, rule.str());
      if (!selection) {
        selection = select_local(request, rule.str() + " (no cloud backend)");
      }
    } else {
      selection = select_local(request, rule.str());
      if (!selection) {
        selection = select_cloud(request, rule.str() + " (no local backend)");
      }
    }
    if (!selection) {
      return GatewayResult<Selection>::failure(
          no_backend("no backend available for agent '" + agent.id + "'"));
    }
    break;
  }
  }
  return GatewayResult<Selection>::success(std::move(*selection));
}

} // namespace switchboard::routing
