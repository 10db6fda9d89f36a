#pragma once

#include "switchboard/agents/rate_limiter.hpp"
#include "switchboard/common/result.hpp"
#include "switchboard/config/schema.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace switchboard::agents {

enum class Tier { Local, Cloud, Hybrid };

[[nodiscard]] std::string_view tier_name(Tier tier);
[[nodiscard]] std::optional<Tier> parse_tier(const std::string &name);

struct AgentConfig {
  std::string id;
  std::string name;
  Tier tier = Tier::Hybrid;
  std::string default_model;
  /// Zero leaves the request's max tokens untouched.
  std::uint32_t max_tokens = 0;
  double temperature = 0.7;
  double complexity_threshold = 0.5;
  std::uint64_t latency_budget_ms = 0;
};

/// Read-only agent settings plus admission control, consumed by routers and the gateway.
class AgentRegistry {
public:
  virtual ~AgentRegistry() = default;

  /// Unknown ids yield defaults carrying that id.
  [[nodiscard]] virtual AgentConfig get(const std::string &agent_id) const = 0;
  [[nodiscard]] virtual bool allow(const std::string &agent_id) = 0;
  [[nodiscard]] virtual std::vector<std::string> list() const = 0;
};

class InMemoryAgentRegistry final : public AgentRegistry {
public:
  InMemoryAgentRegistry(std::vector<AgentConfig> agents, std::size_t max_requests,
                        std::chrono::seconds window,
                        common::Clock clock = common::system_clock());

  [[nodiscard]] static common::Result<std::shared_ptr<InMemoryAgentRegistry>>
  from_config(const config::Config &config);

  [[nodiscard]] AgentConfig get(const std::string &agent_id) const override;
  [[nodiscard]] bool allow(const std::string &agent_id) override;
  [[nodiscard]] std::vector<std::string> list() const override;

  void upsert(AgentConfig agent);

private:
  mutable std::mutex mutex_;
  std::map<std::string, AgentConfig> agents_;
  SlidingWindowLimiter limiter_;
};

} // namespace switchboard::agents
