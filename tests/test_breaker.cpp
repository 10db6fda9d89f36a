#include "test_framework.hpp"

#include "switchboard/resilience/circuit_breaker.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

namespace {

using switchboard::backends::BackendErrorCode;
using switchboard::resilience::CircuitBreaker;
using switchboard::resilience::CircuitState;
using switchboard::testing::ManualClock;
using switchboard::testing::ScriptedBackend;

struct BreakerFixture {
  ManualClock clock;
  std::shared_ptr<ScriptedBackend> backend = std::make_shared<ScriptedBackend>("openai");
  CircuitBreaker breaker{backend,
                         {.failure_threshold = 3, .reset_timeout = std::chrono::seconds(30)},
                         clock.clock()};

  void fail(const int times) {
    for (int i = 0; i < times; ++i) {
      (void)breaker.complete(switchboard::testing::user_request("a", "hi"));
    }
  }
};

} // namespace

void register_breaker_tests(std::vector<switchboard::tests::TestCase> &tests) {
  using switchboard::tests::require;

  tests.push_back({"breaker_opens_after_threshold_and_rejects_without_calling", [] {
                     BreakerFixture f;
                     f.backend->fail_always(BackendErrorCode::Api);
                     f.fail(2);
                     require(f.breaker.state() == CircuitState::Closed, "two failures stay closed");
                     f.fail(1);
                     require(f.breaker.state() == CircuitState::Open, "third failure opens");
                     require(f.backend->calls() == 3, "three calls reached the backend");

                     auto rejected = f.breaker.complete(switchboard::testing::user_request("a", "hi"));
                     require(!rejected.ok(), "open breaker must reject");
                     require(rejected.error().code == BackendErrorCode::CircuitOpen,
                             "rejection code should be circuit_open");
                     require(f.backend->calls() == 3, "rejected call must not reach the backend");
                   }});

  tests.push_back({"breaker_half_opens_only_after_timeout_elapses", [] {
                     BreakerFixture f;
                     f.backend->fail_always(BackendErrorCode::Network);
                     f.fail(3);
                     f.clock.advance(std::chrono::seconds(30));
                     require(!f.breaker.allow_request(), "exactly the timeout is not enough");
                     require(f.breaker.state() == CircuitState::Open, "still open");
                     f.clock.advance(std::chrono::milliseconds(1));
                     require(f.breaker.allow_request(), "probe allowed after timeout");
                     require(f.breaker.state() == CircuitState::HalfOpen, "half open after probe");
                     require(f.breaker.allow_request(), "half open keeps allowing");
                   }});

  tests.push_back({"breaker_needs_two_successes_to_close", [] {
                     BreakerFixture f;
                     f.backend->fail_always(BackendErrorCode::Api);
                     f.fail(3);
                     f.clock.advance(std::chrono::seconds(31));
                     f.backend->succeed_always();

                     auto first = f.breaker.complete(switchboard::testing::user_request("a", "one"));
                     require(first.ok(), "probe should succeed");
                     require(f.breaker.state() == CircuitState::HalfOpen,
                             "one success must not close the breaker");
                     require(f.breaker.success_streak() == 1, "streak should be 1");

                     auto second = f.breaker.complete(switchboard::testing::user_request("a", "two"));
                     require(second.ok(), "second call should succeed");
                     require(f.breaker.state() == CircuitState::Closed, "two successes close");
                     require(f.breaker.failure_count() == 0, "failure count reset on close");
                   }});

  tests.push_back({"breaker_probe_failure_reopens_immediately", [] {
                     BreakerFixture f;
                     f.backend->fail_always(BackendErrorCode::Api);
                     f.fail(3);
                     f.clock.advance(std::chrono::seconds(31));
                     f.fail(1);
                     require(f.breaker.state() == CircuitState::Open, "failed probe reopens");
                     require(f.backend->calls() == 4, "probe reached the backend");
                     require(!f.breaker.allow_request(), "timeout restarts from the probe failure");
                   }});

  tests.push_back({"breaker_ignores_caller_cancellation", [] {
                     BreakerFixture f;
                     f.backend->fail_always(BackendErrorCode::Canceled);
                     f.fail(5);
                     require(f.breaker.state() == CircuitState::Closed,
                             "cancellations must not open the breaker");
                     require(f.breaker.failure_count() == 0, "cancellations are not failures");
                   }});

  tests.push_back({"breaker_reset_closes_and_clears_counts", [] {
                     BreakerFixture f;
                     f.backend->fail_always(BackendErrorCode::Api);
                     f.fail(3);
                     f.breaker.reset();
                     const auto status = f.breaker.status();
                     require(status.state == CircuitState::Closed, "reset closes");
                     require(status.failure_count == 0, "reset clears failures");
                     require(status.backend == "openai", "status names the backend");
                     require(f.breaker.allow_request(), "reset breaker allows");
                   }});

  tests.push_back({"breaker_reports_transitions_to_observer", [] {
                     ManualClock clock;
                     switchboard::testing::RecordingObserver observer;
                     auto backend = std::make_shared<ScriptedBackend>("anthropic");
                     CircuitBreaker breaker(backend,
                                            {.failure_threshold = 1,
                                             .reset_timeout = std::chrono::seconds(5)},
                                            clock.clock(), &observer);
                     backend->push_error(BackendErrorCode::Api);
                     (void)breaker.complete(switchboard::testing::user_request("a", "x"));
                     clock.advance(std::chrono::seconds(6));
                     (void)breaker.complete(switchboard::testing::user_request("a", "x"));
                     (void)breaker.complete(switchboard::testing::user_request("a", "x"));

                     const auto events =
                         observer.events<switchboard::observability::BreakerTransitionEvent>();
                     require(events.size() == 3, "expected three transitions");
                     require(events[0].from == "closed" && events[0].to == "open", "closed->open");
                     require(events[1].from == "open" && events[1].to == "half_open",
                             "open->half_open");
                     require(events[2].from == "half_open" && events[2].to == "closed",
                             "half_open->closed");
                   }});

  tests.push_back({"breaker_stream_rejection_emits_terminal_chunk", [] {
                     BreakerFixture f;
                     f.backend->fail_always(BackendErrorCode::Api);
                     f.fail(3);
                     switchboard::common::CancellationToken token;
                     std::vector<switchboard::backends::CompletionChunk> chunks;
                     auto result = f.breaker.stream(
                         token, switchboard::testing::user_request("a", "hi"),
                         [&](const switchboard::backends::CompletionChunk &chunk) {
                           chunks.push_back(chunk);
                           return switchboard::common::Status::success();
                         });
                     require(!result.ok(), "stream should be rejected");
                     require(chunks.size() == 1, "exactly one chunk");
                     require(chunks[0].done && chunks[0].error.has_value(),
                             "chunk must be terminal with an error");
                   }});

  tests.push_back({"breaker_non_positive_options_fall_back_to_defaults", [] {
                     auto backend = std::make_shared<ScriptedBackend>("x");
                     CircuitBreaker breaker(backend, {.failure_threshold = 0,
                                                      .reset_timeout = std::chrono::milliseconds(0)});
                     require(breaker.options().failure_threshold == 3, "threshold defaults to 3");
                     require(breaker.options().reset_timeout == std::chrono::seconds(60),
                             "timeout defaults to 60s");
                     require(switchboard::resilience::state_name(CircuitState::HalfOpen) ==
                                 "half_open",
                             "state name mismatch");
                   }});
}
