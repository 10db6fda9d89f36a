#include "switchboard/backends/factory.hpp"

#include "switchboard/backends/anthropic.hpp"
#include "switchboard/backends/compatible.hpp"

namespace switchboard::backends {

common::Result<std::shared_ptr<Backend>> create_backend(const config::BackendConfig &backend,
                                                        std::shared_ptr<HttpClient> http_client) {
  using BackendPtrResult = common::Result<std::shared_ptr<Backend>>;
  if (http_client == nullptr) {
    return BackendPtrResult::failure("http client is required");
  }

  if (backend.id == "anthropic") {
    AnthropicOptions options;
    options.id = backend.id;
    if (!backend.base_url.empty()) {
      options.base_url = backend.base_url;
    }
    if (!backend.default_model.empty()) {
      options.default_model = backend.default_model;
    }
    options.api_key = backend.api_key;
    options.timeout_ms = backend.timeout_ms;
    return BackendPtrResult::success(
        std::make_shared<AnthropicBackend>(std::move(options), std::move(http_client)));
  }

  CompatibleOptions options{
      .id = backend.id,
      .base_url = backend.base_url,
      .api_key = backend.api_key,
      .default_model = backend.default_model,
      .timeout_ms = backend.timeout_ms,
  };
  if (backend.id == "ollama") {
    options.require_api_key = false;
  } else if (backend.id == "openrouter") {
    options.extra_headers = {{"HTTP-Referer", "https://github.com/switchboard"},
                             {"X-Title", "switchboard"}};
  } else if (backend.id == "huggingface") {
    options.normalize_model = normalize_huggingface_model;
    options.text_generation_url = huggingface_models_url(backend.base_url);
  } else if (backend.id != "openai") {
    return BackendPtrResult::failure("Unknown backend: " + backend.id);
  }
  if (options.base_url.empty()) {
    return BackendPtrResult::failure("backends." + backend.id + ".base_url is empty");
  }
  return BackendPtrResult::success(
      std::make_shared<CompatibleBackend>(std::move(options), std::move(http_client)));
}

common::Result<BackendMap> create_backends(const config::Config &config,
                                           std::shared_ptr<HttpClient> http_client) {
  BackendMap backends;
  for (const auto &entry : config.backends) {
    if (!entry.enabled) {
      continue;
    }
    auto backend = create_backend(entry, http_client);
    if (!backend.ok()) {
      return common::Result<BackendMap>::failure(backend.error());
    }
    backends.emplace(entry.id, std::move(backend.value()));
  }
  return common::Result<BackendMap>::success(std::move(backends));
}

} // namespace switchboard::backends
