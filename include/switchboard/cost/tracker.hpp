#pragma once

#include "switchboard/common/clock.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace switchboard::cost {

/// USD per 1,000,000 tokens.
struct ModelPrice {
  double input_per_million = 0.0;
  double output_per_million = 0.0;
};

inline constexpr ModelPrice DEFAULT_PRICE{1.00, 3.00};

/// Per-model prices. Lookup tries the exact name or its longest registered prefix, then the
/// same on the part after the last `/`, then DEFAULT_PRICE.
class PriceTable {
public:
  [[nodiscard]] static PriceTable defaults();

  void set(const std::string &model, ModelPrice price);
  [[nodiscard]] ModelPrice lookup(const std::string &model) const;
  [[nodiscard]] double cost(const std::string &model, std::uint64_t prompt_tokens,
                            std::uint64_t completion_tokens) const;

private:
  [[nodiscard]] const ModelPrice *find(const std::string &model) const;

  std::map<std::string, ModelPrice> prices_;
};

/// Cost of a call priced with the default table.
[[nodiscard]] double calculate_cost(const std::string &model, std::uint64_t prompt_tokens,
                                    std::uint64_t completion_tokens);

struct CostStatus {
  double daily_spend = 0.0;
  double daily_budget = 0.0;
  double daily_remaining = 0.0;
  double daily_percent = 0.0;
  double monthly_spend = 0.0;
  double monthly_budget = 0.0;
  double monthly_remaining = 0.0;
  double monthly_percent = 0.0;
  double total_spend = 0.0;
  std::uint64_t request_count = 0;
  std::uint64_t token_count = 0;
};

struct BudgetCheck {
  bool allowed = true;
  std::string reason;
};

struct Budgets {
  double daily_usd = 0.0;
  double monthly_usd = 0.0;
};

/// In-memory spend ledger. Period sums reset when the local calendar day or month changes;
/// the lifetime sum never resets.
class CostTracker {
public:
  explicit CostTracker(Budgets budgets, PriceTable prices = PriceTable::defaults(),
                       common::Clock clock = common::system_clock());

  [[nodiscard]] double calculate_cost(const std::string &model, std::uint64_t prompt_tokens,
                                      std::uint64_t completion_tokens) const;

  /// Records one call and returns its cost.
  double track_usage(const std::string &model, std::uint64_t prompt_tokens,
                     std::uint64_t completion_tokens);

  /// Never invoked by the routers; callers that want enforcement ask first.
  [[nodiscard]] BudgetCheck check_budget(double estimated_cost);

  [[nodiscard]] CostStatus status();
  [[nodiscard]] Budgets budgets() const { return budgets_; }
  [[nodiscard]] const common::Clock &clock() const { return clock_; }

private:
  void roll_periods_locked();

  const Budgets budgets_;
  const PriceTable prices_;
  const common::Clock clock_;

  std::mutex mutex_;
  double daily_spend_ = 0.0;
  double monthly_spend_ = 0.0;
  double total_spend_ = 0.0;
  std::uint64_t request_count_ = 0;
  std::uint64_t token_count_ = 0;
  int day_marker_ = 0;
  int month_marker_ = 0;
};

/// Local-time calendar fields used for period boundaries.
struct CalendarPoint {
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int days_in_month = 0;
};

[[nodiscard]] CalendarPoint to_calendar(common::TimePoint tp);

} // namespace switchboard::cost
