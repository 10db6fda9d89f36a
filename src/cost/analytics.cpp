#include "switchboard/cost/analytics.hpp"

#include <algorithm>
#include <iterator>

namespace switchboard::cost {

namespace {

constexpr std::size_t FULL_CONFIDENCE_SNAPSHOTS = 1440;

struct Threshold {
  double percent;
  AlertLevel level;
  const char *suffix;
  const char *label;
};

// Highest first so the most severe alert of each period leads the list.
constexpr Threshold DAILY_THRESHOLDS[] = {
    {100.0, AlertLevel::Critical, "exceeded", "exceeded"},
    {90.0, AlertLevel::Warning, "90", "at 90%"},
    {75.0, AlertLevel::Info, "75", "at 75%"},
};

constexpr Threshold MONTHLY_THRESHOLDS[] = {
    {100.0, AlertLevel::Critical, "exceeded", "exceeded"},
    {90.0, AlertLevel::Warning, "90", "at 90%"},
    {75.0, AlertLevel::Info, "75", "at 75%"},
    {50.0, AlertLevel::Info, "50", "at 50%"},
};

template <std::size_t N>
void append_period_alerts(std::vector<CostAlert> &out, const char *period, const char *title,
                          const Threshold (&thresholds)[N], const double percent,
                          const double spend, const double budget) {
  if (budget <= 0.0) {
    return;
  }
  for (const auto &threshold : thresholds) {
    if (percent < threshold.percent) {
      continue;
    }
    out.push_back(CostAlert{
        .level = threshold.level,
        .type = std::string(period) + "_budget_" + threshold.suffix,
        .message = std::string(title) + " budget " + threshold.label,
        .percent = percent,
        .spend = spend,
        .budget = budget,
        .threshold = threshold.percent,
    });
  }
}

} // namespace

std::string_view alert_level_name(const AlertLevel level) {
  switch (level) {
  case AlertLevel::Info:
    return "info";
  case AlertLevel::Warning:
    return "warning";
  case AlertLevel::Critical:
    return "critical";
  }
  return "info";
}

TrendMetrics calculate_trend(const std::vector<CostSnapshot> &snapshots) {
  TrendMetrics metrics;
  if (snapshots.empty()) {
    return metrics;
  }

  const auto [first, last] = std::minmax_element(
      snapshots.begin(), snapshots.end(),
      [](const CostSnapshot &a, const CostSnapshot &b) { return a.timestamp < b.timestamp; });

  metrics.snapshot_count = snapshots.size();
  metrics.spend_change = last->total_spend - first->total_spend;
  metrics.request_change = static_cast<std::int64_t>(last->request_count) -
                           static_cast<std::int64_t>(first->request_count);
  metrics.token_change =
      static_cast<std::int64_t>(last->token_count) - static_cast<std::int64_t>(first->token_count);
  metrics.duration_hours =
      std::chrono::duration<double, std::ratio<3600>>(last->timestamp - first->timestamp).count();
  if (metrics.duration_hours > 0.0) {
    metrics.avg_spend_per_hour = metrics.spend_change / metrics.duration_hours;
    metrics.avg_requests_per_hour =
        static_cast<double>(metrics.request_change) / metrics.duration_hours;
    metrics.avg_tokens_per_hour =
        static_cast<double>(metrics.token_change) / metrics.duration_hours;
  }
  return metrics;
}

double calculate_confidence(const double days_elapsed, const std::size_t history_size) {
  const double day_confidence = std::min(days_elapsed / 7.0, 1.0);
  const double history_confidence = std::min(
      static_cast<double>(history_size) / static_cast<double>(FULL_CONFIDENCE_SNAPSHOTS), 1.0);
  return day_confidence * 0.7 + history_confidence * 0.3;
}

CostAnalytics::CostAnalytics(std::shared_ptr<CostTracker> tracker, AnalyticsOptions options,
                             common::Clock clock)
    : tracker_(std::move(tracker)), options_(options), clock_(std::move(clock)) {
  if (options_.snapshot_interval.count() <= 0) {
    options_.snapshot_interval = std::chrono::seconds(60);
  }
  if (options_.max_history_size == 0) {
    options_.max_history_size = FULL_CONFIDENCE_SNAPSHOTS;
  }
}

bool CostAnalytics::record_snapshot() {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  if (last_snapshot_.has_value() && now - *last_snapshot_ < options_.snapshot_interval) {
    return false;
  }

  const CostStatus status = tracker_->status();
  history_.push_back(CostSnapshot{
      .timestamp = now,
      .daily_spend = status.daily_spend,
      .monthly_spend = status.monthly_spend,
      .total_spend = status.total_spend,
      .request_count = status.request_count,
      .token_count = status.token_count,
  });
  last_snapshot_ = now;

  if (history_.size() > options_.max_history_size) {
    history_.erase(history_.begin(),
                   history_.begin() +
                       static_cast<std::ptrdiff_t>(history_.size() - options_.max_history_size));
  }
  return true;
}

std::vector<CostSnapshot> CostAnalytics::since_locked(const common::TimePoint since) const {
  std::vector<CostSnapshot> out;
  std::copy_if(history_.begin(), history_.end(), std::back_inserter(out),
               [since](const CostSnapshot &snapshot) { return snapshot.timestamp >= since; });
  return out;
}

std::vector<CostSnapshot> CostAnalytics::historical_data(const common::TimePoint since) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return since_locked(since);
}

TrendAnalysis CostAnalytics::trends() const {
  using std::chrono::hours;
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  return TrendAnalysis{
      .last_hour = calculate_trend(since_locked(now - hours(1))),
      .last_day = calculate_trend(since_locked(now - hours(24))),
      .last_week = calculate_trend(since_locked(now - hours(24 * 7))),
  };
}

CostPrediction CostAnalytics::predict(const CostStatus &status,
                                      const std::size_t history_size) const {
  const auto calendar = to_calendar(clock_());

  CostPrediction prediction;
  prediction.current_monthly_spend = status.monthly_spend;
  prediction.monthly_budget = status.monthly_budget;
  prediction.days_elapsed = calendar.day + calendar.hour / 24.0;
  prediction.days_remaining = calendar.days_in_month - prediction.days_elapsed;
  prediction.daily_average = status.monthly_spend / prediction.days_elapsed;
  prediction.predicted_monthly_total =
      status.monthly_spend + prediction.daily_average * prediction.days_remaining;
  prediction.confidence = calculate_confidence(prediction.days_elapsed, history_size);
  prediction.will_exceed_budget =
      status.monthly_budget > 0.0 && prediction.predicted_monthly_total > status.monthly_budget;
  if (status.monthly_budget > 0.0) {
    prediction.percent_of_budget =
        prediction.predicted_monthly_total / status.monthly_budget * 100.0;
  }
  return prediction;
}

CostPrediction CostAnalytics::predict_monthly_cost() const {
  const CostStatus status = tracker_->status();
  return predict(status, history_size());
}

std::vector<CostAlert> CostAnalytics::alerts() const {
  const CostStatus status = tracker_->status();
  std::vector<CostAlert> out;
  append_period_alerts(out, "daily", "Daily", DAILY_THRESHOLDS, status.daily_percent,
                       status.daily_spend, status.daily_budget);
  append_period_alerts(out, "monthly", "Monthly", MONTHLY_THRESHOLDS, status.monthly_percent,
                       status.monthly_spend, status.monthly_budget);

  const CostPrediction prediction = predict(status, history_size());
  if (prediction.will_exceed_budget) {
    out.push_back(CostAlert{
        .level = AlertLevel::Warning,
        .type = "predicted_budget_exceeded",
        .message = "Predicted to exceed monthly budget",
        .percent = prediction.percent_of_budget,
        .spend = prediction.predicted_monthly_total,
        .budget = status.monthly_budget,
        .threshold = 100.0,
    });
  }
  return out;
}

std::size_t CostAnalytics::history_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_.size();
}

} // namespace switchboard::cost
