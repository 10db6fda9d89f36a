#include "switchboard/config/config.hpp"

#include "switchboard/common/fs.hpp"
#include "switchboard/common/toml.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <unordered_map>

namespace switchboard::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".switchboard";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

struct BackendDefaults {
  std::string base_url;
  std::string default_model;
  std::vector<const char *> key_env;
  bool enabled_without_key = false;
};

const std::unordered_map<std::string, BackendDefaults> &backend_defaults() {
  static const std::unordered_map<std::string, BackendDefaults> defaults = {
      {"openai", {"https://api.openai.com/v1", "gpt-4o-mini", {"OPENAI_API_KEY"}}},
      {"anthropic",
       {"https://api.anthropic.com", "claude-3-5-sonnet-20241022", {"ANTHROPIC_API_KEY"}}},
      {"openrouter",
       {"https://openrouter.ai/api/v1", "anthropic/claude-3.5-sonnet", {"OPENROUTER_API_KEY"}}},
      {"ollama", {"http://localhost:11434/v1", "llama3.2", {}, true}},
      {"huggingface",
       {"https://api-inference.huggingface.co/v1",
        "meta-llama/Llama-3.1-8B-Instruct",
        {"HUGGINGFACE_API_KEY", "HF_TOKEN"}}},
  };
  return defaults;
}

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("SWITCHBOARD_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<std::string> read_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr) {
    return std::nullopt;
  }
  std::string trimmed = common::trim(value);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

std::string expand_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }
  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string text = common::trim(line);
    if (text.empty() || text.front() == '#') {
      continue;
    }
    if (common::starts_with(text, "export ")) {
      text = common::trim(text.substr(7));
    }
    const auto eq = text.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(text.substr(0, eq));
    if (key.empty() || read_env(key.c_str()).has_value()) {
      continue;
    }
    setenv(key.c_str(), strip_env_quotes(text.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  if (const auto env_file = read_env("SWITCHBOARD_ENV_FILE")) {
    load_dotenv_file(common::expand_path(*env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    load_dotenv_file(cwd / ".env");
  }
}

BackendConfig load_backend(const common::TomlDocument &doc, const std::string &id) {
  const auto &defaults = backend_defaults().at(id);
  const std::string prefix = "backends." + id + ".";

  BackendConfig backend;
  backend.id = id;
  backend.api_key = expand_value(doc.get_string(prefix + "api_key"));
  if (backend.api_key.empty()) {
    for (const auto *env_name : defaults.key_env) {
      if (auto key = read_env(env_name)) {
        backend.api_key = *key;
        break;
      }
    }
  }
  backend.base_url = expand_value(doc.get_string(prefix + "base_url", defaults.base_url));
  backend.default_model = doc.get_string(prefix + "default_model", defaults.default_model);
  backend.timeout_ms = doc.get_u64(prefix + "timeout_ms", backend.timeout_ms);
  const bool usable = defaults.enabled_without_key || !backend.api_key.empty();
  backend.enabled = doc.get_bool(prefix + "enabled", usable);
  return backend;
}

AgentSection load_agent(const common::TomlDocument &doc, const std::string &id) {
  const std::string prefix = "agents." + id + ".";
  AgentSection agent;
  agent.id = id;
  agent.name = doc.get_string(prefix + "name", id);
  agent.tier = common::to_lower(doc.get_string(prefix + "tier", agent.tier));
  agent.default_model = doc.get_string(prefix + "default_model");
  agent.max_tokens = static_cast<std::uint32_t>(doc.get_u64(prefix + "max_tokens", 0));
  agent.temperature = doc.get_double(prefix + "temperature", agent.temperature);
  agent.complexity_threshold =
      doc.get_double(prefix + "complexity_threshold", agent.complexity_threshold);
  agent.latency_budget_ms = doc.get_u64(prefix + "latency_budget_ms", 0);
  return agent;
}

bool contains(const std::vector<std::string> &values, const std::string &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

const BackendConfig *Config::find_backend(const std::string &id) const {
  const auto it = std::find_if(backends.begin(), backends.end(),
                               [&](const BackendConfig &backend) { return backend.id == id; });
  return it == backends.end() ? nullptr : &*it;
}

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override()) {
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  const auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

const std::vector<std::string> &known_backends() {
  static const std::vector<std::string> ids = {"openai", "anthropic", "openrouter", "ollama",
                                               "huggingface"};
  return ids;
}

bool is_cloud_backend(const std::string &id) {
  return id != "ollama" && contains(known_backends(), id);
}

common::Result<Config> parse_config(const std::string &toml_text) {
  auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.gateway.host = doc.get_string("gateway.host", config.gateway.host);
  const int port = doc.get_int("gateway.port", config.gateway.port);
  if (port < 0 || port > 65535) {
    return common::Result<Config>::failure("gateway.port out of range: " + std::to_string(port));
  }
  config.gateway.port = static_cast<std::uint16_t>(port);
  config.gateway.max_body_bytes = static_cast<std::size_t>(
      doc.get_u64("gateway.max_body_bytes", config.gateway.max_body_bytes));

  auto &routing = config.routing;
  routing.strategy = common::to_lower(doc.get_string("routing.strategy", routing.strategy));
  routing.default_backend = doc.get_string("routing.default_backend", routing.default_backend);
  routing.cache_enabled = doc.get_bool("routing.cache_enabled", routing.cache_enabled);
  routing.cache_ttl_secs = doc.get_u64("routing.cache_ttl_secs", routing.cache_ttl_secs);
  routing.use_circuit_breakers =
      doc.get_bool("routing.use_circuit_breakers", routing.use_circuit_breakers);
  routing.failover_order = doc.get_string_array("routing.failover_order", routing.failover_order);
  routing.cloud_priority = doc.get_string_array("routing.cloud_priority", routing.cloud_priority);

  config.breaker.failure_threshold =
      doc.get_int("breaker.failure_threshold", config.breaker.failure_threshold);
  config.breaker.reset_timeout_secs =
      doc.get_u64("breaker.reset_timeout_secs", config.breaker.reset_timeout_secs);

  config.cost.daily_budget_usd = doc.get_double("cost.daily_budget_usd", 0.0);
  config.cost.monthly_budget_usd = doc.get_double("cost.monthly_budget_usd", 0.0);
  config.cost.snapshot_interval_secs =
      doc.get_u64("cost.snapshot_interval_secs", config.cost.snapshot_interval_secs);
  config.cost.max_history_size = static_cast<std::size_t>(
      doc.get_u64("cost.max_history_size", config.cost.max_history_size));

  config.rate_limit.max_requests =
      static_cast<std::uint32_t>(doc.get_u64("rate_limit.max_requests", 0));
  config.rate_limit.window_secs = static_cast<std::uint32_t>(
      doc.get_u64("rate_limit.window_secs", config.rate_limit.window_secs));

  config.observability.backend =
      common::to_lower(doc.get_string("observability.backend", config.observability.backend));

  for (const auto &id : doc.child_tables("backends")) {
    if (!contains(known_backends(), id)) {
      return common::Result<Config>::failure("Unknown backend: " + id);
    }
  }
  for (const auto &id : known_backends()) {
    config.backends.push_back(load_backend(doc, id));
  }
  for (const auto &id : doc.child_tables("agents")) {
    config.agents.push_back(load_agent(doc, id));
  }

  return common::Result<Config>::success(std::move(config));
}

void apply_env_overrides(Config &config) {
  if (auto strategy = read_env("SWITCHBOARD_STRATEGY")) {
    config.routing.strategy = common::to_lower(*strategy);
  }
  if (auto host = read_env("SWITCHBOARD_HOST")) {
    config.gateway.host = *host;
  }
  if (auto port = read_env("SWITCHBOARD_PORT")) {
    const long parsed = std::strtol(port->c_str(), nullptr, 10);
    if (parsed > 0 && parsed <= 65535) {
      config.gateway.port = static_cast<std::uint16_t>(parsed);
    }
  }
  if (auto daily = read_env("SWITCHBOARD_DAILY_BUDGET_USD")) {
    config.cost.daily_budget_usd = std::strtod(daily->c_str(), nullptr);
  }
  if (auto monthly = read_env("SWITCHBOARD_MONTHLY_BUDGET_USD")) {
    config.cost.monthly_budget_usd = std::strtod(monthly->c_str(), nullptr);
  }
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure(path.error());
  }

  std::string text;
  std::error_code ec;
  if (std::filesystem::exists(path.value(), ec)) {
    auto content = common::read_file(path.value());
    if (!content.ok()) {
      return common::Result<Config>::failure(content.error());
    }
    text = std::move(content.value());
  }

  auto config = parse_config(text);
  if (!config.ok()) {
    return common::Result<Config>::failure(path.value().string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const auto &routing = config.routing;
  if (!contains({"tier", "static", "cloud", "failover"}, routing.strategy)) {
    return ValidationResult::failure("Invalid routing.strategy: " + routing.strategy);
  }
  if (config.gateway.port == 0) {
    return ValidationResult::failure("gateway.port must be 1-65535");
  }
  if (config.breaker.failure_threshold <= 0) {
    return ValidationResult::failure("breaker.failure_threshold must be positive");
  }
  if (config.breaker.reset_timeout_secs == 0) {
    return ValidationResult::failure("breaker.reset_timeout_secs must be positive");
  }
  if (config.cost.daily_budget_usd < 0.0 || config.cost.monthly_budget_usd < 0.0) {
    return ValidationResult::failure("cost budgets must not be negative");
  }
  if (config.cost.max_history_size == 0) {
    return ValidationResult::failure("cost.max_history_size must be positive");
  }

  for (const auto &agent : config.agents) {
    if (!contains({"local", "cloud", "hybrid"}, agent.tier)) {
      return ValidationResult::failure("Invalid tier for agent " + agent.id + ": " + agent.tier);
    }
    if (agent.complexity_threshold < 0.0 || agent.complexity_threshold > 1.0) {
      warnings.push_back("agents." + agent.id + ".complexity_threshold is outside [0, 1]");
    }
  }

  const auto check_backend_list = [&](const std::vector<std::string> &ids,
                                      const std::string &field) -> std::optional<std::string> {
    for (const auto &id : ids) {
      const auto *backend = config.find_backend(id);
      if (backend == nullptr) {
        return "Unknown backend in " + field + ": " + id;
      }
      if (!backend->enabled) {
        warnings.push_back(field + " names disabled backend " + id);
      }
    }
    return std::nullopt;
  };
  if (auto error = check_backend_list(routing.failover_order, "routing.failover_order")) {
    return ValidationResult::failure(*error);
  }
  if (auto error = check_backend_list(routing.cloud_priority, "routing.cloud_priority")) {
    return ValidationResult::failure(*error);
  }
  if (auto error = check_backend_list({routing.default_backend}, "routing.default_backend")) {
    return ValidationResult::failure(*error);
  }

  const bool any_enabled = std::any_of(config.backends.begin(), config.backends.end(),
                                       [](const BackendConfig &backend) { return backend.enabled; });
  if (!any_enabled) {
    warnings.push_back("no backend is enabled");
  }
  if (routing.cache_enabled && routing.cache_ttl_secs == 0) {
    warnings.push_back("routing.cache_ttl_secs is 0; cached responses expire immediately");
  }

  return ValidationResult::success(std::move(warnings));
}

} // namespace switchboard::config
