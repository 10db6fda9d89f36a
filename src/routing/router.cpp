#include "switchboard/routing/router.hpp"

#include "switchboard/observability/metrics.hpp"

#include <chrono>

namespace switchboard::routing {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(const Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

backends::CompletionChunk error_chunk(const GatewayError &error) {
  return backends::CompletionChunk{
      .backend = error.backend, .done = true, .error = error.to_string()};
}

} // namespace

RouterMetrics RouterCounters::snapshot() const {
  return RouterMetrics{.total_calls = total_calls.load(),
                       .cache_hits = cache_hits.load(),
                       .local_hits = local_hits.load(),
                       .cloud_hits = cloud_hits.load(),
                       .errors = errors.load(),
                       .deprecated_routes = deprecated_routes.load()};
}

void apply_agent_defaults(backends::CompletionRequest &request, const agents::AgentConfig &agent) {
  if ((!request.model.has_value() || request.model->empty()) && !agent.default_model.empty()) {
    request.model = agent.default_model;
  }
  if (!request.max_tokens.has_value() && agent.max_tokens > 0) {
    request.max_tokens = agent.max_tokens;
  }
  if (!request.temperature.has_value()) {
    request.temperature = agent.temperature;
  }
}

std::shared_ptr<backends::Backend> find_backend(const BackendMap &backends, const std::string &id) {
  const auto it = backends.find(id);
  return it == backends.end() ? nullptr : it->second;
}

CacheHitTracker::CacheHitTracker(const std::size_t max_agents) : max_agents_(max_agents) {}

CacheHitTracker::Rate CacheHitTracker::record(const std::string &agent_id, const bool hit) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string key = agent_id;
  if (!lookups_.contains(key) && lookups_.size() >= max_agents_) {
    key = "default";
  }
  auto &[hits, lookups] = lookups_[key];
  if (hit) {
    ++hits;
  }
  ++lookups;
  return Rate{.agent_id = std::move(key),
              .ratio = static_cast<double>(hits) / static_cast<double>(lookups)};
}

std::size_t CacheHitTracker::tracked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lookups_.size();
}

void report_cache_lookup(CacheHitTracker &tracker, observability::IObserver *observer,
                         const std::string &agent_id, const bool hit) {
  const auto rate = tracker.record(agent_id, hit);
  if (observer != nullptr) {
    observability::update_cache_hit_rate(*observer, rate.agent_id, rate.ratio);
  }
}

PipelineRouter::PipelineRouter(RouterDeps deps) : deps_(std::move(deps)) {}

std::string PipelineRouter::cache_key(const backends::CompletionRequest &request) const {
  return cache::build_cache_key(request, request.model.value_or(""));
}

GatewayResult<Selection> PipelineRouter::select_and_announce(const backends::CompletionRequest &request,
                                                             const agents::AgentConfig &agent) {
  auto selection = select(request, agent);
  if (!selection.ok()) {
    ++counters_.errors;
    if (deps_.observer != nullptr) {
      observability::record_error(*deps_.observer, "router", selection.error().to_string());
    }
    return selection;
  }

  const auto &chosen = selection.value();
  if (!chosen.deprecated_for.empty()) {
    ++counters_.deprecated_routes;
    if (deps_.observer != nullptr) {
      deps_.observer->record_event(observability::DeprecatedRouteEvent{
          .model = request.model.value_or(""),
          .legacy_backend = chosen.backend->id(),
          .replacement = chosen.deprecated_for});
    }
  }
  return selection;
}

GatewayResult<backends::CompletionResponse>
PipelineRouter::complete(const backends::CompletionRequest &incoming) {
  const auto started = Clock::now();
  ++counters_.total_calls;

  const agents::AgentConfig agent = deps_.registry->get(incoming.agent_id);
  backends::CompletionRequest request = incoming;
  apply_agent_defaults(request, agent);

  std::string key;
  if (deps_.cache) {
    key = cache_key(request);
    if (auto cached = deps_.cache->get(key)) {
      ++counters_.cache_hits;
      report_cache_lookup(hit_rates_, deps_.observer, request.agent_id, true);
      if (deps_.observer != nullptr) {
        observability::record_request(*deps_.observer, cached->backend, cached->model,
                                      request.agent_id, "hit", since(started));
      }
      return GatewayResult<backends::CompletionResponse>::success(std::move(*cached));
    }
    report_cache_lookup(hit_rates_, deps_.observer, request.agent_id, false);
  }

  auto selection = select_and_announce(request, agent);
  if (!selection.ok()) {
    return GatewayResult<backends::CompletionResponse>::failure(selection.error());
  }
  const Selection &chosen = selection.value();

  backends::CompletionRequest forward = request;
  if (chosen.model_override.has_value()) {
    forward.model = chosen.model_override;
  }

  auto result = chosen.backend->complete(forward);
  if (!result.ok()) {
    ++counters_.errors;
    auto error = from_backend_error(result.error());
    if (error.backend.empty()) {
      error.backend = chosen.backend->id();
    }
    if (deps_.observer != nullptr) {
      observability::record_provider_error(*deps_.observer, error.backend, error.to_string());
    }
    return GatewayResult<backends::CompletionResponse>::failure(std::move(error));
  }

  backends::CompletionResponse response = std::move(result.value());
  if (response.backend.empty()) {
    response.backend = chosen.backend->id();
  }
  if (response.model.empty()) {
    response.model = forward.model.value_or("");
  }
  if (chosen.local) {
    ++counters_.local_hits;
  } else {
    ++counters_.cloud_hits;
  }

  if (deps_.ledger) {
    const double usd = deps_.ledger->track_usage(response.model, response.usage.prompt,
                                                 response.usage.completion);
    if (deps_.observer != nullptr) {
      observability::record_cost(*deps_.observer, response.backend, response.model, usd);
    }
  }
  if (deps_.observer != nullptr) {
    observability::record_tokens(*deps_.observer, "prompt", response.backend, response.model,
                                 response.usage.prompt);
    observability::record_tokens(*deps_.observer, "completion", response.backend,
                                 response.model, response.usage.completion);
    observability::record_request(*deps_.observer, response.backend, response.model,
                                  request.agent_id, deps_.cache ? "miss" : "disabled",
                                  since(started));
  }

  if (deps_.cache) {
    deps_.cache->set(key, response);
  }
  return GatewayResult<backends::CompletionResponse>::success(std::move(response));
}

GatewayResult<void> PipelineRouter::stream(const common::CancellationToken &token,
                                           const backends::CompletionRequest &incoming,
                                           const backends::ChunkSink &emit) {
  const auto started = Clock::now();
  ++counters_.total_calls;

  const agents::AgentConfig agent = deps_.registry->get(incoming.agent_id);
  backends::CompletionRequest request = incoming;
  apply_agent_defaults(request, agent);

  auto selection = select_and_announce(request, agent);
  if (!selection.ok()) {
    (void)emit(error_chunk(selection.error()));
    return GatewayResult<void>::failure(selection.error());
  }
  const Selection &chosen = selection.value();

  backends::CompletionRequest forward = request;
  if (chosen.model_override.has_value()) {
    forward.model = chosen.model_override;
  }

  auto result = chosen.backend->stream(token, forward, emit);
  if (!result.ok()) {
    ++counters_.errors;
    auto error = from_backend_error(result.error());
    if (error.backend.empty()) {
      error.backend = chosen.backend->id();
    }
    if (deps_.observer != nullptr) {
      observability::record_provider_error(*deps_.observer, error.backend, error.to_string());
    }
    return GatewayResult<void>::failure(std::move(error));
  }

  if (chosen.local) {
    ++counters_.local_hits;
  } else {
    ++counters_.cloud_hits;
  }
  if (deps_.observer != nullptr) {
    observability::record_request(*deps_.observer, chosen.backend->id(),
                                  forward.model.value_or(""), request.agent_id, "stream",
                                  since(started));
  }
  return GatewayResult<void>::success();
}

} // namespace switchboard::routing
