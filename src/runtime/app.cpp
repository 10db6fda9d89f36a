#include "switchboard/runtime/app.hpp"

#include "switchboard/backends/factory.hpp"
#include "switchboard/config/config.hpp"
#include "switchboard/observability/factory.hpp"

namespace switchboard::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

common::Result<std::shared_ptr<Services>>
RuntimeContext::create_services(std::shared_ptr<backends::HttpClient> http_client,
                                common::Clock clock) {
  auto validated = config::validate_config(config_);
  if (!validated.ok()) {
    return common::Result<std::shared_ptr<Services>>::failure(validated.error());
  }

  std::shared_ptr<observability::IObserver> observer = observability::create_observer(config_);
  for (const auto &warning : validated.value()) {
    observer->record_event(observability::ErrorEvent{.component = "config", .message = warning});
  }

  auto backends = backends::create_backends(config_, std::move(http_client));
  if (!backends.ok()) {
    return common::Result<std::shared_ptr<Services>>::failure(backends.error());
  }
  return assemble_services(config_, std::move(backends.value()), std::move(observer),
                           std::move(clock));
}

common::Result<std::shared_ptr<Services>>
assemble_services(const config::Config &config, backends::BackendMap backends,
                  std::shared_ptr<observability::IObserver> observer, common::Clock clock) {
  using R = common::Result<std::shared_ptr<Services>>;

  auto registry = agents::InMemoryAgentRegistry::from_config(config);
  if (!registry.ok()) {
    return R::failure(registry.error());
  }

  auto services = std::make_shared<Services>();
  services->observer = std::move(observer);
  services->registry = registry.value();
  services->ledger = std::make_shared<cost::CostTracker>(
      cost::Budgets{.daily_usd = config.cost.daily_budget_usd,
                    .monthly_usd = config.cost.monthly_budget_usd},
      cost::PriceTable::defaults(), clock);
  services->analytics = std::make_shared<cost::CostAnalytics>(
      services->ledger,
      cost::AnalyticsOptions{
          .snapshot_interval = std::chrono::seconds(config.cost.snapshot_interval_secs),
          .max_history_size = config.cost.max_history_size},
      clock);

  routing::RouterDeps deps{.registry = services->registry,
                           .ledger = services->ledger,
                           .observer = services->observer.get()};
  auto stack = routing::create_router(config, std::move(deps), std::move(backends), clock);
  if (!stack.ok()) {
    return R::failure(stack.error());
  }
  services->routing = std::move(stack.value());
  return R::success(std::move(services));
}

} // namespace switchboard::runtime
