#pragma once

#include "switchboard/agents/registry.hpp"
#include "switchboard/backends/factory.hpp"
#include "switchboard/backends/traits.hpp"
#include "switchboard/cache/response_cache.hpp"
#include "switchboard/common/cancellation.hpp"
#include "switchboard/cost/tracker.hpp"
#include "switchboard/observability/observer.hpp"
#include "switchboard/routing/errors.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace switchboard::routing {

using backends::BackendMap;

/// Backend id treated as the local (on-host) model server.
inline constexpr const char *DEFAULT_LOCAL_BACKEND = "ollama";

struct RouterMetrics {
  std::uint64_t total_calls = 0;
  std::uint64_t cache_hits = 0;
  std::uint64_t local_hits = 0;
  std::uint64_t cloud_hits = 0;
  std::uint64_t errors = 0;
  std::uint64_t deprecated_routes = 0;
};

class RouterCounters {
public:
  std::atomic<std::uint64_t> total_calls{0};
  std::atomic<std::uint64_t> cache_hits{0};
  std::atomic<std::uint64_t> local_hits{0};
  std::atomic<std::uint64_t> cloud_hits{0};
  std::atomic<std::uint64_t> errors{0};
  std::atomic<std::uint64_t> deprecated_routes{0};

  [[nodiscard]] RouterMetrics snapshot() const;
};

/// A routing strategy. Implementations are safe to call from many threads at once.
class Router {
public:
  virtual ~Router() = default;

  [[nodiscard]] virtual std::string_view strategy() const = 0;

  [[nodiscard]] virtual GatewayResult<backends::CompletionResponse>
  complete(const backends::CompletionRequest &request) = 0;

  /// Streams never touch the cache or the ledger. A selection failure still emits one
  /// terminal chunk carrying the error.
  [[nodiscard]] virtual GatewayResult<void> stream(const common::CancellationToken &token,
                                                   const backends::CompletionRequest &request,
                                                   const backends::ChunkSink &emit) = 0;

  [[nodiscard]] virtual RouterMetrics metrics() const = 0;
};

/// Shared collaborators. `cache` and `ledger` are optional; a null observer disables hooks.
struct RouterDeps {
  std::shared_ptr<agents::AgentRegistry> registry;
  std::shared_ptr<cache::ResponseCache> cache;
  std::shared_ptr<cost::CostTracker> ledger;
  observability::IObserver *observer = nullptr;
};

struct Selection {
  std::shared_ptr<backends::Backend> backend;
  bool local = false;
  /// Model name actually sent to the backend when it differs from the request's.
  std::optional<std::string> model_override;
  std::string deprecated_for;
  std::string rule;
};

/// Running cache hit ratio per agent. Only the first `max_agents` distinct ids get a bucket of
/// their own; later ids share the "default" bucket.
class CacheHitTracker {
public:
  static constexpr std::size_t kDefaultMaxAgents = 256;

  struct Rate {
    std::string agent_id;
    double ratio = 0.0;
  };

  explicit CacheHitTracker(std::size_t max_agents = kDefaultMaxAgents);

  [[nodiscard]] Rate record(const std::string &agent_id, bool hit);
  [[nodiscard]] std::size_t tracked() const;

private:
  std::size_t max_agents_;
  mutable std::mutex mutex_;
  std::map<std::string, std::pair<std::uint64_t, std::uint64_t>> lookups_;
};

/// Records a lookup and publishes the agent's new hit rate; a null observer only records.
void report_cache_lookup(CacheHitTracker &tracker, observability::IObserver *observer,
                         const std::string &agent_id, bool hit);

/// Fills unset model, max tokens and temperature from the agent's configuration.
void apply_agent_defaults(backends::CompletionRequest &request, const agents::AgentConfig &agent);

/// agent defaults -> cache lookup -> select -> invoke -> ledger -> cache store.
/// Strategies only decide which backend serves a request.
class PipelineRouter : public Router {
public:
  [[nodiscard]] GatewayResult<backends::CompletionResponse>
  complete(const backends::CompletionRequest &request) final;
  [[nodiscard]] GatewayResult<void> stream(const common::CancellationToken &token,
                                           const backends::CompletionRequest &request,
                                           const backends::ChunkSink &emit) final;
  [[nodiscard]] RouterMetrics metrics() const final { return counters_.snapshot(); }

  [[nodiscard]] std::string cache_key(const backends::CompletionRequest &request) const;

protected:
  explicit PipelineRouter(RouterDeps deps);

  [[nodiscard]] virtual GatewayResult<Selection>
  select(const backends::CompletionRequest &request, const agents::AgentConfig &agent) = 0;

  [[nodiscard]] const RouterDeps &deps() const { return deps_; }

private:
  [[nodiscard]] GatewayResult<Selection> select_and_announce(const backends::CompletionRequest &request,
                                                             const agents::AgentConfig &agent);

  RouterDeps deps_;
  RouterCounters counters_;
  CacheHitTracker hit_rates_;
};

/// Looks a backend up by id; null when absent.
[[nodiscard]] std::shared_ptr<backends::Backend> find_backend(const BackendMap &backends,
                                                              const std::string &id);

} // namespace switchboard::routing
