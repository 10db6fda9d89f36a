#include "switchboard/routing/rules.hpp"

#include "switchboard/common/fs.hpp"

#include <algorithm>

namespace switchboard::routing {

namespace {

constexpr const char *AGGREGATOR = "openrouter";

std::string strip_namespace(const std::string &model) {
  const auto slash = model.find('/');
  return slash == std::string::npos ? model : model.substr(slash + 1);
}

} // namespace

RuleTable &RuleTable::add(RouteRule rule) {
  rules_.push_back(std::move(rule));
  return *this;
}

RuleTable &RuleTable::fallback(std::vector<std::string> backend_ids) {
  fallbacks_ = std::move(backend_ids);
  return *this;
}

std::optional<RouteDecision> RuleTable::resolve(const std::string &model,
                                                const BackendAvailable &available) const {
  if (!model.empty()) {
    for (const auto &rule : rules_) {
      if (!rule.matches(model)) {
        continue;
      }
      for (const auto &target : rule.targets) {
        if (!available(target.backend)) {
          continue;
        }
        RouteDecision decision{.backend = target.backend,
                               .rule = rule.name,
                               .deprecated_for = rule.deprecated_for};
        if (target.strip_namespace) {
          decision.model = strip_namespace(model);
        }
        return decision;
      }
    }
  }

  for (const auto &id : fallbacks_) {
    if (available(id)) {
      return RouteDecision{.backend = id, .rule = "fallback"};
    }
  }
  return std::nullopt;
}

ModelPredicate has_prefix(std::vector<std::string> prefixes) {
  for (auto &prefix : prefixes) {
    prefix = common::to_lower(prefix);
  }
  return [prefixes = std::move(prefixes)](const std::string &model) {
    const std::string lowered = common::to_lower(model);
    return std::any_of(prefixes.begin(), prefixes.end(), [&](const std::string &prefix) {
      return common::starts_with(lowered, prefix);
    });
  };
}

ModelPredicate has_namespace() {
  return [](const std::string &model) { return model.find('/') != std::string::npos; };
}

const std::vector<std::string> &local_model_prefixes() {
  static const std::vector<std::string> prefixes = {"llama", "mistral", "mixtral", "phi",
                                                    "qwen",  "gemma",   "codellama"};
  return prefixes;
}

RuleTable static_route_table(const std::string &local_backend,
                             std::vector<std::string> fallback) {
  RuleTable table;
  table.add({.name = "local-namespace",
             .matches = has_prefix({"ollama/", "local/"}),
             .targets = {{local_backend, true}}})
      .add({.name = "local-family",
            .matches = has_prefix(local_model_prefixes()),
            .targets = {{local_backend}}})
      .add({.name = "huggingface",
            .matches = has_prefix({"hf/", "huggingface/"}),
            .targets = {{"huggingface"}}})
      .add({.name = "anthropic-direct",
            .matches = has_prefix({"claude"}),
            .targets = {{"anthropic"}},
            .deprecated_for = AGGREGATOR})
      .add({.name = "openai-direct",
            .matches = has_prefix({"gpt-", "o1", "o3", "chatgpt"}),
            .targets = {{"openai"}}})
      .add({.name = "aggregator", .matches = has_namespace(), .targets = {{AGGREGATOR}}})
      .fallback(std::move(fallback));
  return table;
}

RuleTable cloud_route_table(std::vector<std::string> fallback) {
  RuleTable table;
  table.add({.name = "huggingface",
             .matches = has_prefix({"hf/", "huggingface/"}),
             .targets = {{"huggingface"}}})
      .add({.name = "anthropic-namespaced",
            .matches = has_prefix({"anthropic/"}),
            .targets = {{AGGREGATOR}, {"anthropic", true}}})
      .add({.name = "openai-namespaced",
            .matches = has_prefix({"openai/"}),
            .targets = {{AGGREGATOR}, {"openai", true}}})
      .add({.name = "anthropic",
            .matches = has_prefix({"claude"}),
            .targets = {{"anthropic"}, {AGGREGATOR}}})
      .add({.name = "openai",
            .matches = has_prefix({"gpt-", "o1", "o3", "chatgpt"}),
            .targets = {{"openai"}, {AGGREGATOR}}})
      .add({.name = "aggregator", .matches = has_namespace(), .targets = {{AGGREGATOR}}})
      .fallback(std::move(fallback));
  return table;
}

std::vector<std::string> merge_priority(const std::vector<std::vector<std::string>> &lists) {
  std::vector<std::string> merged;
  for (const auto &list : lists) {
    for (const auto &id : list) {
      if (!id.empty() && std::find(merged.begin(), merged.end(), id) == merged.end()) {
        merged.push_back(id);
      }
    }
  }
  return merged;
}

} // namespace switchboard::routing
