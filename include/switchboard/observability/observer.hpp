#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace switchboard::observability {

struct RequestEvent {
  std::string backend;
  std::string model;
  std::string agent_id;
  std::string cache_status;
  std::chrono::milliseconds duration{0};
};

struct ProviderErrorEvent {
  std::string backend;
  std::string message;
};

struct BreakerTransitionEvent {
  std::string backend;
  std::string from;
  std::string to;
};

struct DeprecatedRouteEvent {
  std::string model;
  std::string legacy_backend;
  std::string replacement;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<RequestEvent, ProviderErrorEvent, BreakerTransitionEvent,
                                   DeprecatedRouteEvent, ErrorEvent>;

struct CostMetric {
  std::string backend;
  std::string model;
  double usd = 0.0;
};

struct TokensMetric {
  std::string kind;
  std::string backend;
  std::string model;
  std::uint64_t count = 0;
};

struct CacheHitRateMetric {
  std::string agent_id;
  double ratio = 0.0;
};

using ObserverMetric = std::variant<CostMetric, TokensMetric, CacheHitRateMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace switchboard::observability
