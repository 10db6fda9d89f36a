#pragma once

#include "switchboard/cost/analytics.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace switchboard::runtime {

/// Background loop calling CostAnalytics::record_snapshot() every `interval`.
class SnapshotJob {
public:
  SnapshotJob(std::shared_ptr<cost::CostAnalytics> analytics, std::chrono::milliseconds interval);
  ~SnapshotJob();

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

private:
  void run_loop();

  std::shared_ptr<cost::CostAnalytics> analytics_;
  std::chrono::milliseconds interval_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace switchboard::runtime
