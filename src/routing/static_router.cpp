#include "switchboard/routing/static_router.hpp"

namespace switchboard::routing {

common::Result<std::shared_ptr<StaticRouter>>
StaticRouter::create(RouterDeps deps, BackendMap backends, StaticRouterOptions options) {
  using R = common::Result<std::shared_ptr<StaticRouter>>;
  if (!deps.registry) {
    return R::failure("agent registry is required");
  }
  if (backends.empty()) {
    return R::failure("at least one backend is required");
  }
  return R::success(std::shared_ptr<StaticRouter>(
      new StaticRouter(std::move(deps), std::move(backends), std::move(options))));
}

StaticRouter::StaticRouter(RouterDeps deps, BackendMap backends, StaticRouterOptions options)
    : PipelineRouter(std::move(deps)), backends_(std::move(backends)),
      options_(std::move(options)),
      table_(static_route_table(options_.local_backend, options_.fallback_order)) {}

GatewayResult<Selection> StaticRouter::select(const backends::CompletionRequest &request,
                                              const agents::AgentConfig & /*agent*/) {
  const std::string model = request.model.value_or("");
  const auto decision = table_.resolve(
      model, [this](const std::string &id) { return backends_.contains(id); });
  if (!decision.has_value()) {
    return GatewayResult<Selection>::failure(
        GatewayError{.kind = GatewayErrorKind::NoBackendAvailable,
                     .message = "no backend matches model '" + model + "'"});
  }

  return GatewayResult<Selection>::success(
      Selection{.backend = backends_.at(decision->backend),
                .local = decision->backend == options_.local_backend,
                .model_override = decision->model,
                .deprecated_for = decision->deprecated_for,
                .rule = decision->rule});
}

} // namespace switchboard::routing
