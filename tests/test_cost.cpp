#include "test_framework.hpp"

#include "switchboard/cost/analytics.hpp"
#include "switchboard/cost/tracker.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <memory>

namespace {

using switchboard::cost::AlertLevel;
using switchboard::cost::CostAnalytics;
using switchboard::cost::CostTracker;
using switchboard::cost::PriceTable;
using switchboard::testing::local_time;
using switchboard::testing::ManualClock;

bool near(const double a, const double b, const double eps = 1e-9) { return std::fabs(a - b) < eps; }

bool has_alert(const std::vector<switchboard::cost::CostAlert> &alerts, const std::string &type) {
  return std::any_of(alerts.begin(), alerts.end(),
                     [&](const switchboard::cost::CostAlert &alert) { return alert.type == type; });
}

} // namespace

void register_cost_tests(std::vector<switchboard::tests::TestCase> &tests) {
  using switchboard::tests::require;

  tests.push_back({"cost_known_and_default_prices", [] {
                     require(switchboard::cost::calculate_cost("gpt-4o", 1'000'000, 0) == 2.50,
                             "gpt-4o input price should be 2.50");
                     require(switchboard::cost::calculate_cost("unknown-model", 1'000'000,
                                                               1'000'000) == 4.00,
                             "unknown model should use 1.00 + 3.00");
                     require(switchboard::cost::calculate_cost("llama3.2", 5'000'000, 5'000'000) ==
                                 0.0,
                             "local families are free");
                   }});

  tests.push_back({"cost_price_lookup_prefix_and_namespace", [] {
                     const auto table = PriceTable::defaults();
                     const auto mini = table.lookup("gpt-4o-mini-2024-07-18");
                     require(mini.input_per_million == 0.15, "longest prefix should win");
                     const auto namespaced = table.lookup("openai/gpt-4o");
                     require(namespaced.output_per_million == 15.00,
                             "namespace should be stripped for lookup");
                     const auto upper = table.lookup("  GPT-4O ");
                     require(upper.input_per_million == 2.50, "lookup is case-insensitive");
                     const auto fallback = table.lookup("mystery");
                     require(fallback.input_per_million == 1.00 && fallback.output_per_million == 3.00,
                             "default price mismatch");
                   }});

  tests.push_back({"cost_day_boundary_resets_only_daily", [] {
                     ManualClock clock(local_time(2024, 3, 15, 23));
                     CostTracker tracker({.daily_usd = 10.0, .monthly_usd = 100.0},
                                         PriceTable::defaults(), clock.clock());
                     (void)tracker.track_usage("gpt-4o", 1'000'000, 0);
                     auto before = tracker.status();
                     require(before.daily_spend == 2.50, "daily spend before rollover");

                     clock.set(local_time(2024, 3, 16, 1));
                     (void)tracker.track_usage("gpt-4o", 1'000'000, 0);
                     auto after = tracker.status();
                     require(after.daily_spend == 2.50, "daily spend resets at midnight");
                     require(after.monthly_spend == 5.00, "monthly spend keeps accumulating");
                     require(after.total_spend == 5.00, "lifetime spend never resets");
                     require(after.request_count == 2, "request count mismatch");
                     require(after.token_count == 2'000'000, "token count mismatch");
                   }});

  tests.push_back({"cost_status_rolls_over_on_read", [] {
                     ManualClock clock(local_time(2024, 1, 31, 12));
                     CostTracker tracker({.daily_usd = 10.0, .monthly_usd = 100.0},
                                         PriceTable::defaults(), clock.clock());
                     (void)tracker.track_usage("gpt-4o", 2'000'000, 0);
                     clock.set(local_time(2024, 2, 1, 12));
                     const auto status = tracker.status();
                     require(status.daily_spend == 0.0, "read after midnight shows a fresh day");
                     require(status.monthly_spend == 0.0, "read after month end shows a fresh month");
                     require(status.total_spend == 5.00, "lifetime spend survives");
                     require(status.daily_remaining == 10.0, "remaining budget mismatch");
                   }});

  tests.push_back({"cost_check_budget_reports_exceeding_call", [] {
                     ManualClock clock;
                     CostTracker tracker({.daily_usd = 1.0, .monthly_usd = 0.0},
                                         PriceTable::defaults(), clock.clock());
                     require(tracker.check_budget(0.5).allowed, "within budget");
                     (void)tracker.track_usage("gpt-4o", 50'000, 25'000);
                     const auto check = tracker.check_budget(0.75);
                     require(!check.allowed, "0.5 + 0.75 exceeds 1.0");
                     require(check.reason.find("daily budget exceeded") != std::string::npos,
                             "reason should name the daily budget");
                     require(tracker.status().daily_spend == 0.5,
                             "checking never records spend");
                   }});

  tests.push_back({"cost_budget_alert_end_to_end", [] {
                     ManualClock clock;
                     auto tracker = std::make_shared<CostTracker>(
                         switchboard::cost::Budgets{.daily_usd = 1.0, .monthly_usd = 0.0},
                         PriceTable::defaults(), clock.clock());
                     CostAnalytics analytics(tracker, {}, clock.clock());
                     require(near(tracker->track_usage("gpt-4o", 50'000, 25'000), 0.50),
                             "one call should cost 0.50");
                     (void)tracker->track_usage("gpt-4o", 50'000, 25'000);
                     require(near(tracker->status().daily_percent, 100.0), "daily percent ~100");

                     const auto alerts = analytics.alerts();
                     const auto it = std::find_if(alerts.begin(), alerts.end(), [](const auto &a) {
                       return a.type == "daily_budget_exceeded";
                     });
                     require(it != alerts.end(), "daily_budget_exceeded alert missing");
                     require(it->level == AlertLevel::Critical, "exceeded alert must be critical");
                     require(alerts.front().type == "daily_budget_exceeded",
                             "most severe alert leads the list");
                     require(has_alert(alerts, "daily_budget_90") &&
                                 has_alert(alerts, "daily_budget_75"),
                             "lower thresholds are reported too");
                     require(!has_alert(alerts, "monthly_budget_exceeded"),
                             "no monthly alerts without a monthly budget");
                   }});

  tests.push_back({"cost_alerts_empty_without_budgets", [] {
                     ManualClock clock;
                     auto tracker = std::make_shared<CostTracker>(switchboard::cost::Budgets{},
                                                                  PriceTable::defaults(),
                                                                  clock.clock());
                     (void)tracker->track_usage("gpt-4o", 10'000'000, 10'000'000);
                     CostAnalytics analytics(tracker, {}, clock.clock());
                     require(analytics.alerts().empty(), "no budgets, no alerts");
                   }});

  tests.push_back({"cost_monthly_thresholds_and_prediction_alert", [] {
                     ManualClock clock(local_time(2024, 4, 10, 12));
                     auto tracker = std::make_shared<CostTracker>(
                         switchboard::cost::Budgets{.daily_usd = 0.0, .monthly_usd = 10.0},
                         PriceTable::defaults(), clock.clock());
                     CostAnalytics analytics(tracker, {}, clock.clock());
                     (void)tracker->track_usage("gpt-4o", 2'200'000, 0);
                     const auto alerts = analytics.alerts();
                     require(has_alert(alerts, "monthly_budget_50"), "55% crosses the 50 mark");
                     require(!has_alert(alerts, "monthly_budget_75"), "55% is below 75");
                     require(has_alert(alerts, "predicted_budget_exceeded"),
                             "spending 5.50 in 10 days projects past 10.00");
                     require(alerts.back().level == AlertLevel::Warning,
                             "prediction alert is a warning");
                   }});

  tests.push_back({"cost_snapshot_interval_and_history_cap", [] {
                     ManualClock clock;
                     auto tracker = std::make_shared<CostTracker>(switchboard::cost::Budgets{},
                                                                  PriceTable::defaults(),
                                                                  clock.clock());
                     CostAnalytics analytics(tracker,
                                             {.snapshot_interval = std::chrono::seconds(60),
                                              .max_history_size = 3},
                                             clock.clock());
                     require(analytics.record_snapshot(), "first snapshot always records");
                     require(!analytics.record_snapshot(), "too soon for a second one");
                     for (int i = 0; i < 4; ++i) {
                       clock.advance(std::chrono::seconds(60));
                       require(analytics.record_snapshot(), "interval elapsed");
                     }
                     require(analytics.history_size() == 3, "history trimmed to the cap");

                     const auto recent = analytics.historical_data(clock.now() - std::chrono::seconds(60));
                     require(recent.size() == 2, "since is inclusive");
                   }});

  tests.push_back({"cost_trends_over_windows", [] {
                     ManualClock clock;
                     auto tracker = std::make_shared<CostTracker>(switchboard::cost::Budgets{},
                                                                  PriceTable::defaults(),
                                                                  clock.clock());
                     CostAnalytics analytics(tracker, {}, clock.clock());
                     require(analytics.record_snapshot(), "initial snapshot");
                     (void)tracker->track_usage("gpt-4o", 1'000'000, 0);
                     clock.advance(std::chrono::hours(3));
                     require(analytics.record_snapshot(), "snapshot outside the hour");
                     (void)tracker->track_usage("gpt-4o", 1'000'000, 0);
                     clock.advance(std::chrono::minutes(30));
                     require(analytics.record_snapshot(), "latest snapshot");

                     const auto trends = analytics.trends();
                     require(trends.last_hour.snapshot_count == 2, "two snapshots in the hour");
                     require(near(trends.last_hour.spend_change, 2.50), "hour spend change");
                     require(trends.last_hour.request_change == 1, "hour request change");
                     require(near(trends.last_hour.duration_hours, 0.5), "hour duration");
                     require(near(trends.last_hour.avg_spend_per_hour, 5.0), "hourly rate");

                     require(trends.last_day.snapshot_count == 3, "day reaches the first snapshot");
                     require(near(trends.last_day.spend_change, 5.0), "day spend change");
                     require(trends.last_day.request_change == 2, "day request change");
                     require(near(trends.last_day.duration_hours, 3.5), "day duration");
                     require(near(trends.last_day.avg_spend_per_hour, 5.0 / 3.5), "day rate");
                     require(trends.last_week.snapshot_count == 3, "week matches the day");

                     const auto empty = switchboard::cost::calculate_trend({});
                     require(empty.snapshot_count == 0 && empty.avg_spend_per_hour == 0.0,
                             "empty history yields zero metrics");
                   }});

  tests.push_back({"cost_prediction_extrapolates_month", [] {
                     ManualClock clock(local_time(2024, 4, 10, 0));
                     auto tracker = std::make_shared<CostTracker>(
                         switchboard::cost::Budgets{.daily_usd = 0.0, .monthly_usd = 20.0},
                         PriceTable::defaults(), clock.clock());
                     CostAnalytics analytics(tracker, {}, clock.clock());
                     (void)tracker->track_usage("gpt-4o", 4'000'000, 0);
                     const auto prediction = analytics.predict_monthly_cost();
                     require(near(prediction.days_elapsed, 10.0), "days elapsed");
                     require(near(prediction.days_remaining, 20.0), "april has 30 days");
                     require(near(prediction.daily_average, 1.0), "daily average");
                     require(near(prediction.predicted_monthly_total, 30.0), "projected total");
                     require(prediction.will_exceed_budget, "30 > 20");
                     require(near(prediction.percent_of_budget, 150.0), "percent of budget");
                     require(prediction.confidence > 0.69 && prediction.confidence < 0.71,
                             "10 days with no history gives 0.7 confidence");
                   }});
}
