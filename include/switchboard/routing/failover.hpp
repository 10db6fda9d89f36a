#pragma once

#include "switchboard/resilience/circuit_breaker.hpp"
#include "switchboard/routing/router.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace switchboard::routing {

struct FailoverOptions {
  resilience::BreakerOptions breaker;
  std::string local_backend = DEFAULT_LOCAL_BACKEND;
  common::Clock clock = common::system_clock();
};

/// Walks an ordered list of breaker-wrapped backends until one succeeds.
///
/// Open breakers are skipped. Exhaustion reports the last real failure as its cause, or the
/// first open-circuit rejection when every breaker was open. A failure at any position after the first bumps
/// failover_count(); skips and successful switch-overs never do.
class FailoverOrchestrator final : public Router {
public:
  [[nodiscard]] static common::Result<std::shared_ptr<FailoverOrchestrator>>
  create(RouterDeps deps, std::vector<std::shared_ptr<backends::Backend>> ordered,
         FailoverOptions options = {});

  [[nodiscard]] std::string_view strategy() const override { return "failover"; }

  [[nodiscard]] GatewayResult<backends::CompletionResponse>
  complete(const backends::CompletionRequest &request) override;
  [[nodiscard]] GatewayResult<void> stream(const common::CancellationToken &token,
                                           const backends::CompletionRequest &request,
                                           const backends::ChunkSink &emit) override;
  [[nodiscard]] RouterMetrics metrics() const override { return counters_.snapshot(); }

  /// Returns false for an unknown backend id.
  bool reset(const std::string &backend_id);
  [[nodiscard]] std::vector<resilience::BreakerStatus> breaker_states() const;
  [[nodiscard]] std::uint64_t failover_count() const { return failovers_.load(); }
  [[nodiscard]] const std::vector<std::shared_ptr<resilience::CircuitBreaker>> &breakers() const {
    return breakers_;
  }

private:
  FailoverOrchestrator(RouterDeps deps, std::vector<std::shared_ptr<backends::Backend>> ordered,
                       FailoverOptions options);

  [[nodiscard]] backends::CompletionRequest prepare(const backends::CompletionRequest &request) const;
  void note_failure(std::size_t index, const backends::BackendError &error);
  [[nodiscard]] GatewayError exhausted(const std::optional<backends::BackendError> &last) const;
  void count_hit(const std::string &backend_id);

  RouterDeps deps_;
  FailoverOptions options_;
  std::vector<std::shared_ptr<resilience::CircuitBreaker>> breakers_;
  RouterCounters counters_;
  CacheHitTracker hit_rates_;
  std::atomic<std::uint64_t> failovers_{0};
};

} // namespace switchboard::routing
