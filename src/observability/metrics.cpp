#include "switchboard/observability/metrics.hpp"

namespace switchboard::observability {

void record_request(IObserver &observer, const std::string &backend, const std::string &model,
                    const std::string &agent_id, const std::string &cache_status,
                    const std::chrono::milliseconds duration) {
  observer.record_event(RequestEvent{.backend = backend,
                                     .model = model,
                                     .agent_id = agent_id,
                                     .cache_status = cache_status,
                                     .duration = duration});
}

void record_cost(IObserver &observer, const std::string &backend, const std::string &model,
                 const double usd) {
  observer.record_metric(CostMetric{.backend = backend, .model = model, .usd = usd});
}

void record_tokens(IObserver &observer, const std::string &kind, const std::string &backend,
                   const std::string &model, const std::uint64_t count) {
  observer.record_metric(
      TokensMetric{.kind = kind, .backend = backend, .model = model, .count = count});
}

void update_cache_hit_rate(IObserver &observer, const std::string &agent_id, const double ratio) {
  observer.record_metric(CacheHitRateMetric{.agent_id = agent_id, .ratio = ratio});
}

void record_provider_error(IObserver &observer, const std::string &backend,
                           const std::string &message) {
  observer.record_event(ProviderErrorEvent{.backend = backend, .message = message});
}

void record_error(IObserver &observer, const std::string &component, const std::string &message) {
  observer.record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace switchboard::observability
