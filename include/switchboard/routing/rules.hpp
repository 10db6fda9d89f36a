#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace switchboard::routing {

using ModelPredicate = std::function<bool(const std::string &model)>;
using BackendAvailable = std::function<bool(const std::string &backend_id)>;

struct RouteTarget {
  std::string backend;
  /// Send only the part after the first `/` (e.g. `openai/gpt-4o` -> `gpt-4o`).
  bool strip_namespace = false;
};

struct RouteRule {
  std::string name;
  ModelPredicate matches;
  /// Tried in order; the first registered backend wins.
  std::vector<RouteTarget> targets;
  /// Non-empty marks a legacy mapping that still routes but should move to this backend.
  std::string deprecated_for;
};

struct RouteDecision {
  std::string backend;
  std::string rule;
  std::optional<std::string> model;
  std::string deprecated_for;
};

/// Ordered (predicate, target) rules evaluated top to bottom, then a fallback priority list.
/// A rule whose targets are all unregistered is skipped.
class RuleTable {
public:
  RuleTable &add(RouteRule rule);
  RuleTable &fallback(std::vector<std::string> backend_ids);

  [[nodiscard]] std::optional<RouteDecision> resolve(const std::string &model,
                                                     const BackendAvailable &available) const;

  [[nodiscard]] const std::vector<RouteRule> &rules() const { return rules_; }

private:
  std::vector<RouteRule> rules_;
  std::vector<std::string> fallbacks_;
};

/// Case-insensitive prefix match against any of `prefixes`.
[[nodiscard]] ModelPredicate has_prefix(std::vector<std::string> prefixes);
[[nodiscard]] ModelPredicate has_namespace();

/// Model families served by the local backend.
[[nodiscard]] const std::vector<std::string> &local_model_prefixes();

/// Static strategy: local families, HuggingFace, vendor prefixes (Anthropic legacy), aggregator.
[[nodiscard]] RuleTable static_route_table(const std::string &local_backend,
                                           std::vector<std::string> fallback);

/// Cloud-only rules. `vendor/model` names prefer the aggregator; bare vendor names prefer
/// the vendor.
[[nodiscard]] RuleTable cloud_route_table(std::vector<std::string> fallback);

/// Joins lists left to right, dropping empty ids and duplicates.
[[nodiscard]] std::vector<std::string>
merge_priority(const std::vector<std::vector<std::string>> &lists);

} // namespace switchboard::routing
