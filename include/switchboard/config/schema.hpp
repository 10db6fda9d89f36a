#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace switchboard::config {

struct GatewayConfig {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8080;
  std::size_t max_body_bytes = 1024 * 1024;
};

struct RoutingConfig {
  std::string strategy = "tier";
  std::string default_backend = "openrouter";
  bool cache_enabled = true;
  std::uint64_t cache_ttl_secs = 300;
  bool use_circuit_breakers = true;
  std::vector<std::string> failover_order;
  std::vector<std::string> cloud_priority = {"openrouter", "anthropic", "openai", "huggingface"};
};

struct BreakerConfig {
  int failure_threshold = 3;
  std::uint64_t reset_timeout_secs = 60;
};

struct CostConfig {
  double daily_budget_usd = 0.0;
  double monthly_budget_usd = 0.0;
  std::uint64_t snapshot_interval_secs = 60;
  std::size_t max_history_size = 1440;
};

struct RateLimitConfig {
  std::uint32_t max_requests = 0;
  std::uint32_t window_secs = 60;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct BackendConfig {
  std::string id;
  bool enabled = false;
  std::string api_key;
  std::string base_url;
  std::string default_model;
  std::uint64_t timeout_ms = 120'000;
};

struct AgentSection {
  std::string id;
  std::string name;
  std::string tier = "hybrid";
  std::string default_model;
  std::uint32_t max_tokens = 0;
  double temperature = 0.7;
  double complexity_threshold = 0.5;
  std::uint64_t latency_budget_ms = 0;
};

struct Config {
  GatewayConfig gateway;
  RoutingConfig routing;
  BreakerConfig breaker;
  CostConfig cost;
  RateLimitConfig rate_limit;
  ObservabilityConfig observability;
  std::vector<BackendConfig> backends;
  std::vector<AgentSection> agents;

  [[nodiscard]] const BackendConfig *find_backend(const std::string &id) const;
};

} // namespace switchboard::config
