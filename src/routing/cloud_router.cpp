#include "switchboard/routing/cloud_router.hpp"

namespace switchboard::routing {

namespace {

BackendMap without(BackendMap backends, const std::string &id) {
  backends.erase(id);
  return backends;
}

std::vector<std::string> ids_of(const BackendMap &backends) {
  std::vector<std::string> ids;
  ids.reserve(backends.size());
  for (const auto &[id, backend] : backends) {
    ids.push_back(id);
  }
  return ids;
}

} // namespace

common::Result<std::shared_ptr<CloudRouter>>
CloudRouter::create(RouterDeps deps, BackendMap backends, CloudRouterOptions options) {
  using R = common::Result<std::shared_ptr<CloudRouter>>;
  if (!deps.registry) {
    return R::failure("agent registry is required");
  }
  BackendMap cloud = without(std::move(backends), options.local_backend);
  if (cloud.empty()) {
    return R::failure("at least one cloud provider is required");
  }
  return R::success(std::shared_ptr<CloudRouter>(
      new CloudRouter(std::move(deps), std::move(cloud), std::move(options))));
}

CloudRouter::CloudRouter(RouterDeps deps, BackendMap backends, CloudRouterOptions options)
    : PipelineRouter(std::move(deps)), backends_(std::move(backends)),
      options_(std::move(options)),
      table_(cloud_route_table(
          merge_priority({{options_.default_backend}, options_.priority, ids_of(backends_)}))) {}

GatewayResult<Selection> CloudRouter::select(const backends::CompletionRequest &request,
                                             const agents::AgentConfig & /*agent*/) {
  const std::string model = request.model.value_or("");
  const auto decision = table_.resolve(
      model, [this](const std::string &id) { return backends_.contains(id); });
  if (!decision.has_value()) {
    return GatewayResult<Selection>::failure(
        GatewayError{.kind = GatewayErrorKind::NoBackendAvailable,
                     .message = "no cloud backend matches model '" + model + "'"});
  }
  return GatewayResult<Selection>::success(
      Selection{.backend = backends_.at(decision->backend),
                .local = false,
                .model_override = decision->model,
                .deprecated_for = decision->deprecated_for,
                .rule = decision->rule});
}

} // namespace switchboard::routing
