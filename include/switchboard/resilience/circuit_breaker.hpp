#pragma once

#include "switchboard/backends/traits.hpp"
#include "switchboard/common/clock.hpp"
#include "switchboard/observability/observer.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace switchboard::resilience {

enum class CircuitState { Closed, Open, HalfOpen };

[[nodiscard]] std::string_view state_name(CircuitState state);

struct BreakerOptions {
  /// Non-positive values fall back to 3.
  int failure_threshold = 3;
  /// Zero falls back to 60 s.
  std::chrono::milliseconds reset_timeout{60'000};
};

struct BreakerStatus {
  std::string backend;
  CircuitState state = CircuitState::Closed;
  int failure_count = 0;
  int success_streak = 0;
};

/// Successes needed in half-open before the breaker closes again.
inline constexpr int HALF_OPEN_SUCCESSES_TO_CLOSE = 2;

/// Wraps one backend and short-circuits calls while it is failing.
///
///   closed    -> open       failure_count reaches failure_threshold
///   open      -> half_open  first allow_request() after reset_timeout since the last failure
///   half_open -> closed     two successes in a row
///   any       -> open       a failure that keeps failure_count at or above the threshold
///
/// Rejected calls never reach the wrapped backend and fail with BackendErrorCode::CircuitOpen.
class CircuitBreaker final : public backends::Backend {
public:
  CircuitBreaker(std::shared_ptr<backends::Backend> inner, BreakerOptions options = {},
                 common::Clock clock = common::system_clock(),
                 observability::IObserver *observer = nullptr);

  [[nodiscard]] std::string id() const override;
  [[nodiscard]] backends::BackendResult<backends::CompletionResponse>
  complete(const backends::CompletionRequest &request) override;
  [[nodiscard]] backends::BackendResult<void> stream(const common::CancellationToken &token,
                                                     const backends::CompletionRequest &request,
                                                     const backends::ChunkSink &emit) override;

  [[nodiscard]] bool allow_request();
  /// nullopt records a success. Caller cancellations are not counted against the backend.
  void record_result(const std::optional<backends::BackendError> &error);
  void reset();

  [[nodiscard]] CircuitState state() const;
  [[nodiscard]] int failure_count() const;
  [[nodiscard]] int success_streak() const;
  [[nodiscard]] BreakerStatus status() const;
  [[nodiscard]] const BreakerOptions &options() const { return options_; }

private:
  [[nodiscard]] backends::BackendError rejection() const;
  void transition_locked(CircuitState next, std::optional<CircuitState> &changed_from);
  void report(std::optional<CircuitState> from, CircuitState to);

  std::shared_ptr<backends::Backend> inner_;
  BreakerOptions options_;
  common::Clock clock_;
  observability::IObserver *observer_;
  const std::string id_;

  mutable std::mutex mutex_;
  CircuitState state_ = CircuitState::Closed;
  int failure_count_ = 0;
  int success_streak_ = 0;
  common::TimePoint last_failure_{};
};

} // namespace switchboard::resilience
