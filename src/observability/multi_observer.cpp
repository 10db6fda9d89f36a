#include "switchboard/observability/multi_observer.hpp"

#include <algorithm>

namespace switchboard::observability {

bool MultiObserver::add(std::shared_ptr<IObserver> observer) {
  if (observer == nullptr || observer.get() == this) {
    return false;
  }
  if (std::any_of(observers_.begin(), observers_.end(),
                  [&](const auto &existing) { return existing == observer; })) {
    return false;
  }
  observers_.push_back(std::move(observer));
  return true;
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &observer : observers_) {
    observer->flush();
  }
}

} // namespace switchboard::observability
