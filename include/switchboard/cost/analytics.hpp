#pragma once

#include "switchboard/common/clock.hpp"
#include "switchboard/cost/tracker.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace switchboard::cost {

struct CostSnapshot {
  common::TimePoint timestamp;
  double daily_spend = 0.0;
  double monthly_spend = 0.0;
  double total_spend = 0.0;
  std::uint64_t request_count = 0;
  std::uint64_t token_count = 0;
};

struct TrendMetrics {
  double spend_change = 0.0;
  std::int64_t request_change = 0;
  std::int64_t token_change = 0;
  double duration_hours = 0.0;
  double avg_spend_per_hour = 0.0;
  double avg_requests_per_hour = 0.0;
  double avg_tokens_per_hour = 0.0;
  std::size_t snapshot_count = 0;
};

struct TrendAnalysis {
  TrendMetrics last_hour;
  TrendMetrics last_day;
  TrendMetrics last_week;
};

struct CostPrediction {
  double predicted_monthly_total = 0.0;
  double current_monthly_spend = 0.0;
  double days_elapsed = 0.0;
  double days_remaining = 0.0;
  double daily_average = 0.0;
  double confidence = 0.0;
  bool will_exceed_budget = false;
  double percent_of_budget = 0.0;
  double monthly_budget = 0.0;
};

enum class AlertLevel { Info, Warning, Critical };

[[nodiscard]] std::string_view alert_level_name(AlertLevel level);

struct CostAlert {
  AlertLevel level = AlertLevel::Info;
  std::string type;
  std::string message;
  double percent = 0.0;
  double spend = 0.0;
  double budget = 0.0;
  double threshold = 0.0;
};

struct AnalyticsOptions {
  std::chrono::seconds snapshot_interval{60};
  std::size_t max_history_size = 1440;
};

/// Snapshot history over a CostTracker. Has no timer of its own: someone must call
/// record_snapshot() on a cadence.
class CostAnalytics {
public:
  CostAnalytics(std::shared_ptr<CostTracker> tracker, AnalyticsOptions options = {},
                common::Clock clock = common::system_clock());

  /// Returns false when the previous snapshot is younger than the interval.
  bool record_snapshot();

  [[nodiscard]] std::vector<CostSnapshot> historical_data(common::TimePoint since) const;
  [[nodiscard]] TrendAnalysis trends() const;
  [[nodiscard]] CostPrediction predict_monthly_cost() const;
  [[nodiscard]] std::vector<CostAlert> alerts() const;
  [[nodiscard]] std::size_t history_size() const;

private:
  [[nodiscard]] std::vector<CostSnapshot> since_locked(common::TimePoint since) const;
  [[nodiscard]] CostPrediction predict(const CostStatus &status, std::size_t history_size) const;

  std::shared_ptr<CostTracker> tracker_;
  AnalyticsOptions options_;
  common::Clock clock_;

  mutable std::mutex mutex_;
  std::vector<CostSnapshot> history_;
  std::optional<common::TimePoint> last_snapshot_;
};

[[nodiscard]] TrendMetrics calculate_trend(const std::vector<CostSnapshot> &snapshots);
[[nodiscard]] double calculate_confidence(double days_elapsed, std::size_t history_size);

} // namespace switchboard::cost
