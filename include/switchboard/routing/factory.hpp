#pragma once

#include "switchboard/config/schema.hpp"
#include "switchboard/resilience/circuit_breaker.hpp"
#include "switchboard/routing/router.hpp"

#include <memory>
#include <vector>

namespace switchboard::routing {

/// The configured strategy plus the breakers guarding its backends (empty when disabled).
struct RoutingStack {
  std::shared_ptr<Router> router;
  std::vector<std::shared_ptr<resilience::CircuitBreaker>> breakers;

  [[nodiscard]] std::shared_ptr<resilience::CircuitBreaker> breaker(const std::string &id) const;
};

/// Builds the `[routing] strategy` router over `backends`. `deps.cache` is replaced according
/// to `cache_enabled` / `cache_ttl_secs`.
[[nodiscard]] common::Result<RoutingStack> create_router(const config::Config &config,
                                                         RouterDeps deps, BackendMap backends,
                                                         common::Clock clock = common::system_clock());

} // namespace switchboard::routing
