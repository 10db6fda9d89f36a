#include "switchboard/resilience/circuit_breaker.hpp"

namespace switchboard::resilience {

using backends::BackendError;
using backends::BackendErrorCode;

std::string_view state_name(const CircuitState state) {
  switch (state) {
  case CircuitState::Closed:
    return "closed";
  case CircuitState::Open:
    return "open";
  case CircuitState::HalfOpen:
    return "half_open";
  }
  return "closed";
}

CircuitBreaker::CircuitBreaker(std::shared_ptr<backends::Backend> inner, BreakerOptions options,
                               common::Clock clock, observability::IObserver *observer)
    : inner_(std::move(inner)), options_(options), clock_(std::move(clock)), observer_(observer),
      id_(inner_->id()) {
  if (options_.failure_threshold <= 0) {
    options_.failure_threshold = 3;
  }
  if (options_.reset_timeout.count() <= 0) {
    options_.reset_timeout = std::chrono::seconds(60);
  }
}

std::string CircuitBreaker::id() const { return id_; }

void CircuitBreaker::transition_locked(const CircuitState next,
                                       std::optional<CircuitState> &changed_from) {
  if (state_ != next) {
    changed_from = state_;
    state_ = next;
  }
}

void CircuitBreaker::report(const std::optional<CircuitState> from, const CircuitState to) {
  if (!from.has_value() || observer_ == nullptr) {
    return;
  }
  observer_->record_event(observability::BreakerTransitionEvent{
      .backend = id_, .from = std::string(state_name(*from)), .to = std::string(state_name(to))});
}

bool CircuitBreaker::allow_request() {
  std::optional<CircuitState> changed_from;
  bool allowed = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::Open) {
      allowed = clock_() - last_failure_ > options_.reset_timeout;
      if (allowed) {
        transition_locked(CircuitState::HalfOpen, changed_from);
        success_streak_ = 0;
      }
    }
  }
  report(changed_from, CircuitState::HalfOpen);
  return allowed;
}

void CircuitBreaker::record_result(const std::optional<BackendError> &error) {
  if (error.has_value() && error->code == BackendErrorCode::Canceled) {
    return;
  }

  std::optional<CircuitState> changed_from;
  CircuitState now_state;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (error.has_value()) {
      ++failure_count_;
      last_failure_ = clock_();
      success_streak_ = 0;
      if (failure_count_ >= options_.failure_threshold) {
        transition_locked(CircuitState::Open, changed_from);
      }
    } else {
      ++success_streak_;
      if (state_ == CircuitState::HalfOpen && success_streak_ >= HALF_OPEN_SUCCESSES_TO_CLOSE) {
        transition_locked(CircuitState::Closed, changed_from);
        failure_count_ = 0;
      }
    }
    now_state = state_;
  }
  report(changed_from, now_state);
}

void CircuitBreaker::reset() {
  std::optional<CircuitState> changed_from;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    transition_locked(CircuitState::Closed, changed_from);
    failure_count_ = 0;
    success_streak_ = 0;
    last_failure_ = {};
  }
  report(changed_from, CircuitState::Closed);
}

CircuitState CircuitBreaker::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

int CircuitBreaker::failure_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failure_count_;
}

int CircuitBreaker::success_streak() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return success_streak_;
}

BreakerStatus CircuitBreaker::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return BreakerStatus{.backend = id_,
                       .state = state_,
                       .failure_count = failure_count_,
                       .success_streak = success_streak_};
}

BackendError CircuitBreaker::rejection() const {
  return BackendError{.code = BackendErrorCode::CircuitOpen,
                      .status = 503,
                      .message = "circuit breaker open",
                      .backend = id_};
}

backends::BackendResult<backends::CompletionResponse>
CircuitBreaker::complete(const backends::CompletionRequest &request) {
  if (!allow_request()) {
    return backends::BackendResult<backends::CompletionResponse>::failure(rejection());
  }
  auto result = inner_->complete(request);
  record_result(result.ok() ? std::nullopt : std::optional<BackendError>(result.error()));
  return result;
}

backends::BackendResult<void> CircuitBreaker::stream(const common::CancellationToken &token,
                                                     const backends::CompletionRequest &request,
                                                     const backends::ChunkSink &emit) {
  if (!allow_request()) {
    auto error = rejection();
    (void)emit(backends::CompletionChunk{.backend = id_, .done = true, .error = error.to_string()});
    return backends::BackendResult<void>::failure(std::move(error));
  }
  auto result = inner_->stream(token, request, emit);
  record_result(result.ok() ? std::nullopt : std::optional<BackendError>(result.error()));
  return result;
}

} // namespace switchboard::resilience
