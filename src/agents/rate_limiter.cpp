#include "switchboard/agents/rate_limiter.hpp"

#include "switchboard/common/fs.hpp"

namespace switchboard::agents {

namespace {

std::string normalize_key(const std::string &key) {
  std::string trimmed = common::trim(key);
  return trimmed.empty() ? "default" : trimmed;
}

} // namespace

SlidingWindowLimiter::SlidingWindowLimiter(const std::size_t max_events,
                                           const std::chrono::seconds window,
                                           common::Clock clock)
    : max_events_(max_events), window_(window), clock_(std::move(clock)) {}

void SlidingWindowLimiter::prune_locked(std::deque<common::TimePoint> &events,
                                        const common::TimePoint now) const {
  const auto cutoff = now - window_;
  while (!events.empty() && events.front() <= cutoff) {
    events.pop_front();
  }
}

void SlidingWindowLimiter::sweep_locked(const common::TimePoint now) {
  if (now - last_sweep_ < window_) {
    return;
  }
  last_sweep_ = now;
  for (auto it = events_by_key_.begin(); it != events_by_key_.end();) {
    prune_locked(it->second, now);
    if (it->second.empty()) {
      it = events_by_key_.erase(it);
    } else {
      ++it;
    }
  }
}

bool SlidingWindowLimiter::allow(const std::string &key) {
  if (max_events_ == 0 || window_.count() <= 0) {
    return true;
  }
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  sweep_locked(now);
  auto &events = events_by_key_[normalize_key(key)];
  prune_locked(events, now);
  if (events.size() >= max_events_) {
    return false;
  }
  events.push_back(now);
  return true;
}

void SlidingWindowLimiter::clear(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_by_key_.erase(normalize_key(key));
}

std::size_t SlidingWindowLimiter::in_window(const std::string &key) const {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = events_by_key_.find(normalize_key(key));
  if (it == events_by_key_.end()) {
    return 0;
  }
  auto events = it->second;
  prune_locked(events, now);
  return events.size();
}

std::size_t SlidingWindowLimiter::tracked_keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_by_key_.size();
}

} // namespace switchboard::agents
