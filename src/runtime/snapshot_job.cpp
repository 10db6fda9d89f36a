#include "switchboard/runtime/snapshot_job.hpp"

#include <algorithm>

namespace switchboard::runtime {

SnapshotJob::SnapshotJob(std::shared_ptr<cost::CostAnalytics> analytics,
                         const std::chrono::milliseconds interval)
    : analytics_(std::move(analytics)), interval_(interval) {}

SnapshotJob::~SnapshotJob() { stop(); }

void SnapshotJob::start() {
  if (running_ || !analytics_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void SnapshotJob::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool SnapshotJob::is_running() const { return running_; }

void SnapshotJob::run_loop() {
  while (running_) {
    (void)analytics_->record_snapshot();
    const auto wait_steps = std::max<long long>(1, interval_.count() / 100);
    for (long long i = 0; i < wait_steps && running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
}

} // namespace switchboard::runtime
