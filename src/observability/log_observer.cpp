#include "switchboard/observability/log_observer.hpp"

#include "switchboard/common/json_util.hpp"

#include <iostream>
#include <type_traits>

namespace switchboard::observability {

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::write(const std::string_view level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RequestEvent>) {
          write("INFO", "request backend=" + evt.backend + " model=" + evt.model +
                            " agent=" + evt.agent_id + " cache=" + evt.cache_status +
                            " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ProviderErrorEvent>) {
          write("WARN", "backend.error backend=" + evt.backend + " " + evt.message);
        } else if constexpr (std::is_same_v<T, BreakerTransitionEvent>) {
          write("WARN", "breaker.transition backend=" + evt.backend + " from=" + evt.from +
                            " to=" + evt.to);
        } else if constexpr (std::is_same_v<T, DeprecatedRouteEvent>) {
          write("WARN", "route.deprecated model=" + evt.model + " backend=" + evt.legacy_backend +
                            " use=" + evt.replacement);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          write("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, CostMetric>) {
          write("DEBUG", "metric.cost_usd=" + common::json_number(m.usd) + " backend=" +
                             m.backend + " model=" + m.model);
        } else if constexpr (std::is_same_v<T, TokensMetric>) {
          write("DEBUG", "metric.tokens kind=" + m.kind + " count=" + std::to_string(m.count) +
                             " backend=" + m.backend + " model=" + m.model);
        } else if constexpr (std::is_same_v<T, CacheHitRateMetric>) {
          write("DEBUG", "metric.cache_hit_rate=" + common::json_number(m.ratio, 3) +
                             " agent=" + m.agent_id);
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace switchboard::observability
