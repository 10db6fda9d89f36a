#pragma once

#include "switchboard/common/clock.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace switchboard::agents {

/// Per-key sliding window: at most `max_events` admissions in any `window`.
/// A zero limit or window disables limiting.
class SlidingWindowLimiter {
public:
  SlidingWindowLimiter(std::size_t max_events, std::chrono::seconds window,
                       common::Clock clock = common::system_clock());

  [[nodiscard]] bool allow(const std::string &key);
  void clear(const std::string &key);
  [[nodiscard]] std::size_t in_window(const std::string &key) const;
  /// Keys currently holding admissions. Idle keys are dropped at most one window after going quiet.
  [[nodiscard]] std::size_t tracked_keys() const;

private:
  void prune_locked(std::deque<common::TimePoint> &events, common::TimePoint now) const;
  void sweep_locked(common::TimePoint now);

  std::size_t max_events_ = 0;
  std::chrono::seconds window_{0};
  common::Clock clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::deque<common::TimePoint>> events_by_key_;
  common::TimePoint last_sweep_{};
};

} // namespace switchboard::agents
