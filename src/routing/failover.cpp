#include "switchboard/routing/failover.hpp"

#include "switchboard/observability/metrics.hpp"

#include <chrono>

namespace switchboard::routing {

using backends::BackendErrorCode;

namespace {

std::chrono::milliseconds since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

common::Result<std::shared_ptr<FailoverOrchestrator>>
FailoverOrchestrator::create(RouterDeps deps,
                             std::vector<std::shared_ptr<backends::Backend>> ordered,
                             FailoverOptions options) {
  using R = common::Result<std::shared_ptr<FailoverOrchestrator>>;
  std::erase(ordered, nullptr);
  if (ordered.empty()) {
    return R::failure("at least one backend is required");
  }
  return R::success(std::shared_ptr<FailoverOrchestrator>(
      new FailoverOrchestrator(std::move(deps), std::move(ordered), std::move(options))));
}

FailoverOrchestrator::FailoverOrchestrator(RouterDeps deps,
                                           std::vector<std::shared_ptr<backends::Backend>> ordered,
                                           FailoverOptions options)
    : deps_(std::move(deps)), options_(std::move(options)) {
  breakers_.reserve(ordered.size());
  for (auto &backend : ordered) {
    // Reuse a breaker the caller already wrapped instead of stacking a second one.
    if (auto existing = std::dynamic_pointer_cast<resilience::CircuitBreaker>(backend)) {
      breakers_.push_back(std::move(existing));
      continue;
    }
    breakers_.push_back(std::make_shared<resilience::CircuitBreaker>(
        std::move(backend), options_.breaker, options_.clock, deps_.observer));
  }
}

backends::CompletionRequest
FailoverOrchestrator::prepare(const backends::CompletionRequest &request) const {
  backends::CompletionRequest prepared = request;
  if (deps_.registry) {
    apply_agent_defaults(prepared, deps_.registry->get(request.agent_id));
  }
  return prepared;
}

void FailoverOrchestrator::note_failure(const std::size_t index,
                                        const backends::BackendError &error) {
  if (index > 0) {
    ++failovers_;
  }
  if (deps_.observer != nullptr) {
    observability::record_provider_error(*deps_.observer, breakers_[index]->id(),
                                         error.to_string());
  }
}

GatewayError
FailoverOrchestrator::exhausted(const std::optional<backends::BackendError> &last) const {
  GatewayError error{.kind = GatewayErrorKind::AllBackendsFailed,
                     .message = "all " + std::to_string(breakers_.size()) + " backends failed",
                     .cause = last};
  if (last.has_value()) {
    error.backend = last->backend;
  }
  return error;
}

void FailoverOrchestrator::count_hit(const std::string &backend_id) {
  if (backend_id == options_.local_backend) {
    ++counters_.local_hits;
  } else {
    ++counters_.cloud_hits;
  }
}

GatewayResult<backends::CompletionResponse>
FailoverOrchestrator::complete(const backends::CompletionRequest &incoming) {
  const auto started = std::chrono::steady_clock::now();
  ++counters_.total_calls;
  const backends::CompletionRequest request = prepare(incoming);

  std::string key;
  if (deps_.cache) {
    key = cache::build_cache_key(request, request.model.value_or(""));
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

  // Open-breaker rejections only stand in as the cause when nothing actually failed.
  std::optional<backends::BackendError> last;
  std::optional<backends::BackendError> rejected;
  for (std::size_t i = 0; i < breakers_.size(); ++i) {
    auto result = breakers_[i]->complete(request);
    if (result.ok()) {
      backends::CompletionResponse response = std::move(result.value());
      if (response.backend.empty()) {
        response.backend = breakers_[i]->id();
      }
      if (response.model.empty()) {
        response.model = request.model.value_or("");
      }
      count_hit(response.backend);
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

    const auto &error = result.error();
    if (error.code == BackendErrorCode::CircuitOpen) {
      if (!rejected.has_value()) {
        rejected = error;
      }
      continue;
    }
    if (error.code == BackendErrorCode::Canceled) {
      ++counters_.errors;
      return GatewayResult<backends::CompletionResponse>::failure(from_backend_error(error));
    }
    note_failure(i, error);
    last = error;
  }

  ++counters_.errors;
  return GatewayResult<backends::CompletionResponse>::failure(
      exhausted(last.has_value() ? last : rejected));
}

GatewayResult<void> FailoverOrchestrator::stream(const common::CancellationToken &token,
                                                 const backends::CompletionRequest &incoming,
                                                 const backends::ChunkSink &emit) {
  const auto started = std::chrono::steady_clock::now();
  ++counters_.total_calls;
  const backends::CompletionRequest request = prepare(incoming);

  std::optional<backends::BackendError> last;
  std::optional<backends::BackendError> rejected;
  for (std::size_t i = 0; i < breakers_.size(); ++i) {
    bool emitted_content = false;
    backends::CompletionChunk terminal;
    // Terminal chunks are held back so a failed attempt can still hand over to the next backend.
    const backends::ChunkSink relay = [&](const backends::CompletionChunk &chunk) {
      if (chunk.done) {
        terminal = chunk;
        return common::Status::success();
      }
      emitted_content = true;
      return emit(chunk);
    };

    auto result = breakers_[i]->stream(token, request, relay);
    if (result.ok()) {
      count_hit(breakers_[i]->id());
      terminal.done = true;
      terminal.error.reset();
      if (terminal.backend.empty()) {
        terminal.backend = breakers_[i]->id();
      }
      (void)emit(terminal);
      if (deps_.observer != nullptr) {
        observability::record_request(*deps_.observer, breakers_[i]->id(),
                                      request.model.value_or(""), request.agent_id, "stream",
                                      since(started));
      }
      return GatewayResult<void>::success();
    }

    const auto &error = result.error();
    if (error.code == BackendErrorCode::CircuitOpen) {
      if (!rejected.has_value()) {
        rejected = error;
      }
      continue;
    }
    if (error.code != BackendErrorCode::Canceled) {
      note_failure(i, error);
    }
    if (emitted_content || error.code == BackendErrorCode::Canceled) {
      ++counters_.errors;
      auto gateway_error = from_backend_error(error);
      (void)emit(backends::CompletionChunk{
          .backend = error.backend, .done = true, .error = gateway_error.to_string()});
      return GatewayResult<void>::failure(std::move(gateway_error));
    }
    last = error;
  }

  ++counters_.errors;
  auto error = exhausted(last.has_value() ? last : rejected);
  (void)emit(backends::CompletionChunk{.backend = error.backend, .done = true,
                                       .error = error.to_string()});
  return GatewayResult<void>::failure(std::move(error));
}

bool FailoverOrchestrator::reset(const std::string &backend_id) {
  for (const auto &breaker : breakers_) {
    if (breaker->id() == backend_id) {
      breaker->reset();
      return true;
    }
  }
  return false;
}

std::vector<resilience::BreakerStatus> FailoverOrchestrator::breaker_states() const {
  std::vector<resilience::BreakerStatus> states;
  states.reserve(breakers_.size());
  for (const auto &breaker : breakers_) {
    states.push_back(breaker->status());
  }
  return states;
}

} // namespace switchboard::routing
