#include "switchboard/routing/factory.hpp"

#include "switchboard/routing/cloud_router.hpp"
#include "switchboard/routing/failover.hpp"
#include "switchboard/routing/rules.hpp"
#include "switchboard/routing/static_router.hpp"
#include "switchboard/routing/tier_router.hpp"

namespace switchboard::routing {

namespace {

resilience::BreakerOptions breaker_options(const config::BreakerConfig &breaker) {
  return resilience::BreakerOptions{
      .failure_threshold = breaker.failure_threshold,
      .reset_timeout = std::chrono::seconds(breaker.reset_timeout_secs)};
}

template <typename RouterT>
common::Result<RoutingStack> wrap(common::Result<std::shared_ptr<RouterT>> built,
                                  std::vector<std::shared_ptr<resilience::CircuitBreaker>> breakers) {
  if (!built.ok()) {
    return common::Result<RoutingStack>::failure(built.error());
  }
  return common::Result<RoutingStack>::success(
      RoutingStack{.router = built.value(), .breakers = std::move(breakers)});
}

} // namespace

std::shared_ptr<resilience::CircuitBreaker> RoutingStack::breaker(const std::string &id) const {
  for (const auto &candidate : breakers) {
    if (candidate->id() == id) {
      return candidate;
    }
  }
  return nullptr;
}

common::Result<RoutingStack> create_router(const config::Config &config, RouterDeps deps,
                                           BackendMap backends, common::Clock clock) {
  const auto &routing = config.routing;
  deps.cache = routing.cache_enabled
                   ? std::make_shared<cache::ResponseCache>(
                         std::chrono::seconds(routing.cache_ttl_secs), clock)
                   : nullptr;

  if (routing.strategy == "failover") {
    std::vector<std::string> ids;
    for (const auto &[id, backend] : backends) {
      ids.push_back(id);
    }
    std::vector<std::shared_ptr<backends::Backend>> ordered;
    for (const auto &id : merge_priority({routing.failover_order, routing.cloud_priority, ids})) {
      if (auto backend = find_backend(backends, id)) {
        ordered.push_back(std::move(backend));
      }
    }
    auto built = FailoverOrchestrator::create(
        std::move(deps), std::move(ordered),
        FailoverOptions{.breaker = breaker_options(config.breaker), .clock = clock});
    if (!built.ok()) {
      return common::Result<RoutingStack>::failure(built.error());
    }
    auto breakers = built.value()->breakers();
    return wrap(std::move(built), std::move(breakers));
  }

  std::vector<std::shared_ptr<resilience::CircuitBreaker>> breakers;
  if (routing.use_circuit_breakers) {
    for (auto &[id, backend] : backends) {
      auto breaker = std::make_shared<resilience::CircuitBreaker>(
          backend, breaker_options(config.breaker), clock, deps.observer);
      breakers.push_back(breaker);
      backend = std::move(breaker);
    }
  }

  if (routing.strategy == "static") {
    StaticRouterOptions options;
    options.fallback_order =
        merge_priority({{DEFAULT_LOCAL_BACKEND, routing.default_backend}, routing.cloud_priority});
    return wrap(StaticRouter::create(std::move(deps), std::move(backends), std::move(options)),
                std::move(breakers));
  }
  if (routing.strategy == "cloud") {
    CloudRouterOptions options{.default_backend = routing.default_backend,
                               .priority = routing.cloud_priority};
    return wrap(CloudRouter::create(std::move(deps), std::move(backends), std::move(options)),
                std::move(breakers));
  }
  if (routing.strategy == "tier") {
    TierRouterOptions options{.cloud_priority =
                                  merge_priority({{routing.default_backend}, routing.cloud_priority})};
    return wrap(TierRouter::create(std::move(deps), std::move(backends), std::move(options)),
                std::move(breakers));
  }
  return common::Result<RoutingStack>::failure("unknown routing strategy: " + routing.strategy);
}

} // namespace switchboard::routing
