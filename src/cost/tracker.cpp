#include "switchboard/cost/tracker.hpp"

#include "switchboard/common/fs.hpp"
#include "switchboard/common/json_util.hpp"

#include <ctime>

namespace switchboard::cost {

namespace {

bool is_leap(const int year) { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

int days_in(const int year, const int month) {
  static constexpr int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return month == 2 && is_leap(year) ? 29 : DAYS[month - 1];
}

double percent_of(const double spend, const double budget) {
  return budget > 0.0 ? spend / budget * 100.0 : 0.0;
}

} // namespace

CalendarPoint to_calendar(const common::TimePoint tp) {
  const std::time_t raw = std::chrono::system_clock::to_time_t(tp);
  std::tm local{};
  localtime_r(&raw, &local);
  CalendarPoint point;
  point.year = local.tm_year + 1900;
  point.month = local.tm_mon + 1;
  point.day = local.tm_mday;
  point.hour = local.tm_hour;
  point.days_in_month = days_in(point.year, point.month);
  return point;
}

PriceTable PriceTable::defaults() {
  PriceTable table;
  table.set("gpt-4o", {2.50, 15.00});
  table.set("gpt-4o-mini", {0.15, 0.60});
  table.set("gpt-4-turbo", {10.00, 30.00});
  table.set("gpt-4", {30.00, 60.00});
  table.set("gpt-3.5-turbo", {0.50, 1.50});
  table.set("o1", {15.00, 60.00});
  table.set("o1-mini", {3.00, 12.00});
  table.set("claude-3-5-sonnet", {3.00, 15.00});
  table.set("claude-3.5-sonnet", {3.00, 15.00});
  table.set("claude-3-5-haiku", {0.80, 4.00});
  table.set("claude-3-opus", {15.00, 75.00});
  table.set("claude-3-haiku", {0.25, 1.25});
  for (const char *local : {"llama", "mistral", "phi", "qwen", "gemma", "codellama"}) {
    table.set(local, {0.0, 0.0});
  }
  return table;
}

void PriceTable::set(const std::string &model, const ModelPrice price) {
  prices_[common::to_lower(model)] = price;
}

const ModelPrice *PriceTable::find(const std::string &model) const {
  if (const auto it = prices_.find(model); it != prices_.end()) {
    return &it->second;
  }
  const ModelPrice *best = nullptr;
  std::size_t best_length = 0;
  for (const auto &[name, price] : prices_) {
    if (name.size() > best_length && common::starts_with(model, name)) {
      best = &price;
      best_length = name.size();
    }
  }
  return best;
}

ModelPrice PriceTable::lookup(const std::string &model) const {
  const std::string name = common::to_lower(common::trim(model));
  if (const auto *price = find(name)) {
    return *price;
  }
  if (const auto slash = name.rfind('/'); slash != std::string::npos) {
    if (const auto *price = find(name.substr(slash + 1))) {
      return *price;
    }
  }
  return DEFAULT_PRICE;
}

double PriceTable::cost(const std::string &model, const std::uint64_t prompt_tokens,
                        const std::uint64_t completion_tokens) const {
  const ModelPrice price = lookup(model);
  // Scale once at the end so whole-dollar prices stay exact.
  return (static_cast<double>(prompt_tokens) * price.input_per_million +
          static_cast<double>(completion_tokens) * price.output_per_million) /
         1'000'000.0;
}

double calculate_cost(const std::string &model, const std::uint64_t prompt_tokens,
                      const std::uint64_t completion_tokens) {
  static const PriceTable table = PriceTable::defaults();
  return table.cost(model, prompt_tokens, completion_tokens);
}

CostTracker::CostTracker(Budgets budgets, PriceTable prices, common::Clock clock)
    : budgets_(budgets), prices_(std::move(prices)), clock_(std::move(clock)) {
  const auto now = to_calendar(clock_());
  day_marker_ = now.year * 10000 + now.month * 100 + now.day;
  month_marker_ = now.year * 100 + now.month;
}

void CostTracker::roll_periods_locked() {
  const auto now = to_calendar(clock_());
  const int day = now.year * 10000 + now.month * 100 + now.day;
  const int month = now.year * 100 + now.month;
  if (day != day_marker_) {
    daily_spend_ = 0.0;
    day_marker_ = day;
  }
  if (month != month_marker_) {
    monthly_spend_ = 0.0;
    month_marker_ = month;
  }
}

double CostTracker::calculate_cost(const std::string &model, const std::uint64_t prompt_tokens,
                                   const std::uint64_t completion_tokens) const {
  return prices_.cost(model, prompt_tokens, completion_tokens);
}

double CostTracker::track_usage(const std::string &model, const std::uint64_t prompt_tokens,
                                const std::uint64_t completion_tokens) {
  const double cost = calculate_cost(model, prompt_tokens, completion_tokens);
  std::lock_guard<std::mutex> lock(mutex_);
  roll_periods_locked();
  daily_spend_ += cost;
  monthly_spend_ += cost;
  total_spend_ += cost;
  ++request_count_;
  token_count_ += prompt_tokens + completion_tokens;
  return cost;
}

BudgetCheck CostTracker::check_budget(const double estimated_cost) {
  std::lock_guard<std::mutex> lock(mutex_);
  roll_periods_locked();
  if (budgets_.daily_usd > 0.0 && daily_spend_ + estimated_cost > budgets_.daily_usd) {
    return {false, "daily budget exceeded: $" + common::json_number(daily_spend_, 4) + " + $" +
                       common::json_number(estimated_cost, 4) + " > $" +
                       common::json_number(budgets_.daily_usd, 2)};
  }
  if (budgets_.monthly_usd > 0.0 && monthly_spend_ + estimated_cost > budgets_.monthly_usd) {
    return {false, "monthly budget exceeded: $" + common::json_number(monthly_spend_, 4) +
                       " + $" + common::json_number(estimated_cost, 4) + " > $" +
                       common::json_number(budgets_.monthly_usd, 2)};
  }
  return {true, ""};
}

CostStatus CostTracker::status() {
  std::lock_guard<std::mutex> lock(mutex_);
  roll_periods_locked();

  CostStatus status;
  status.daily_spend = daily_spend_;
  status.daily_budget = budgets_.daily_usd;
  status.daily_remaining = budgets_.daily_usd > 0.0 ? budgets_.daily_usd - daily_spend_ : 0.0;
  status.daily_percent = percent_of(daily_spend_, budgets_.daily_usd);
  status.monthly_spend = monthly_spend_;
  status.monthly_budget = budgets_.monthly_usd;
  status.monthly_remaining =
      budgets_.monthly_usd > 0.0 ? budgets_.monthly_usd - monthly_spend_ : 0.0;
  status.monthly_percent = percent_of(monthly_spend_, budgets_.monthly_usd);
  status.total_spend = total_spend_;
  status.request_count = request_count_;
  status.token_count = token_count_;
  return status;
}

} // namespace switchboard::cost
