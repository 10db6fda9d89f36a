#pragma once

#include "switchboard/agents/registry.hpp"
#include "switchboard/backends/traits.hpp"
#include "switchboard/common/result.hpp"
#include "switchboard/config/schema.hpp"
#include "switchboard/cost/analytics.hpp"
#include "switchboard/cost/tracker.hpp"
#include "switchboard/observability/observer.hpp"
#include "switchboard/routing/factory.hpp"

#include <memory>

namespace switchboard::runtime {

/// Everything a running gateway owns. Built once and shared by the HTTP layer and CLI.
struct Services {
  std::shared_ptr<observability::IObserver> observer;
  std::shared_ptr<agents::AgentRegistry> registry;
  std::shared_ptr<cost::CostTracker> ledger;
  std::shared_ptr<cost::CostAnalytics> analytics;
  routing::RoutingStack routing;
};

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;

  [[nodiscard]] common::Result<std::shared_ptr<Services>>
  create_services(std::shared_ptr<backends::HttpClient> http_client =
                      std::make_shared<backends::CurlHttpClient>(),
                  common::Clock clock = common::system_clock());

private:
  config::Config config_;
};

/// Wires services over an explicit backend map (tests inject scripted backends here).
[[nodiscard]] common::Result<std::shared_ptr<Services>>
assemble_services(const config::Config &config, backends::BackendMap backends,
                  std::shared_ptr<observability::IObserver> observer,
                  common::Clock clock = common::system_clock());

} // namespace switchboard::runtime
