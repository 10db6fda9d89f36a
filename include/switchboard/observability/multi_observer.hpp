#pragma once

#include "switchboard/observability/observer.hpp"

#include <memory>
#include <vector>

namespace switchboard::observability {

/// Fans every call out to its children in insertion order. Children may be shared with other
/// owners, so a gateway can add an observer it also holds elsewhere.
class MultiObserver final : public IObserver {
public:
  /// Ignores null and an instance that is already a child. Returns whether it was added.
  bool add(std::shared_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::shared_ptr<IObserver>> observers_;
};

} // namespace switchboard::observability
