#include "switchboard/agents/registry.hpp"

#include "switchboard/common/fs.hpp"

namespace switchboard::agents {

std::string_view tier_name(const Tier tier) {
  switch (tier) {
  case Tier::Local:
    return "local";
  case Tier::Cloud:
    return "cloud";
  case Tier::Hybrid:
    return "hybrid";
  }
  return "hybrid";
}

std::optional<Tier> parse_tier(const std::string &name) {
  const std::string lowered = common::to_lower(common::trim(name));
  if (lowered == "local") {
    return Tier::Local;
  }
  if (lowered == "cloud") {
    return Tier::Cloud;
  }
  if (lowered == "hybrid") {
    return Tier::Hybrid;
  }
  return std::nullopt;
}

InMemoryAgentRegistry::InMemoryAgentRegistry(std::vector<AgentConfig> agents,
                                             const std::size_t max_requests,
                                             const std::chrono::seconds window,
                                             common::Clock clock)
    : limiter_(max_requests, window, std::move(clock)) {
  for (auto &agent : agents) {
    upsert(std::move(agent));
  }
}

common::Result<std::shared_ptr<InMemoryAgentRegistry>>
InMemoryAgentRegistry::from_config(const config::Config &config) {
  using RegistryResult = common::Result<std::shared_ptr<InMemoryAgentRegistry>>;
  std::vector<AgentConfig> agents;
  for (const auto &section : config.agents) {
    const auto tier = parse_tier(section.tier);
    if (!tier.has_value()) {
      return RegistryResult::failure("Invalid tier for agent " + section.id + ": " +
                                     section.tier);
    }
    agents.push_back(AgentConfig{
        .id = section.id,
        .name = section.name,
        .tier = *tier,
        .default_model = section.default_model,
        .max_tokens = section.max_tokens,
        .temperature = section.temperature,
        .complexity_threshold = section.complexity_threshold,
        .latency_budget_ms = section.latency_budget_ms,
    });
  }
  return RegistryResult::success(std::make_shared<InMemoryAgentRegistry>(
      std::move(agents), config.rate_limit.max_requests,
      std::chrono::seconds(config.rate_limit.window_secs)));
}

AgentConfig InMemoryAgentRegistry::get(const std::string &agent_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto it = agents_.find(agent_id); it != agents_.end()) {
    return it->second;
  }
  AgentConfig defaults;
  defaults.id = agent_id;
  defaults.name = agent_id;
  return defaults;
}

bool InMemoryAgentRegistry::allow(const std::string &agent_id) { return limiter_.allow(agent_id); }

std::vector<std::string> InMemoryAgentRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(agents_.size());
  for (const auto &[id, agent] : agents_) {
    ids.push_back(id);
  }
  return ids;
}

void InMemoryAgentRegistry::upsert(AgentConfig agent) {
  if (agent.name.empty()) {
    agent.name = agent.id;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  agents_[agent.id] = std::move(agent);
}

} // namespace switchboard::agents
