#pragma once

#include "switchboard/observability/observer.hpp"

#include <mutex>
#include <ostream>

namespace switchboard::observability {

/// Writes one `[LEVEL] key=value ...` line per event to a stream (stderr by default).
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void write(std::string_view level, const std::string &message);

  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace switchboard::observability
