#pragma once

#include "switchboard/backends/traits.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace switchboard::backends {

struct CompatibleOptions {
  std::string id;
  std::string base_url;
  std::string api_key;
  std::string default_model;
  bool require_api_key = true;
  std::uint64_t timeout_ms = 120'000;
  HttpHeaders extra_headers;
  /// Rewrites the model name before it is sent upstream.
  std::function<std::string(const std::string &)> normalize_model;
  /// When set, a failed chat call is retried once against the text-generation pipeline at
  /// `<text_generation_url>/<model>`. Streams never fall back.
  std::string text_generation_url;
};

/// OpenAI-style `/chat/completions` backend; also serves OpenRouter, Ollama and HuggingFace.
class CompatibleBackend : public Backend {
public:
  CompatibleBackend(CompatibleOptions options, std::shared_ptr<HttpClient> http_client);

  [[nodiscard]] std::string id() const override;
  [[nodiscard]] BackendResult<CompletionResponse>
  complete(const CompletionRequest &request) override;
  [[nodiscard]] BackendResult<void> stream(const common::CancellationToken &token,
                                           const CompletionRequest &request,
                                           const ChunkSink &emit) override;

  [[nodiscard]] std::string resolve_model(const CompletionRequest &request) const;
  [[nodiscard]] std::string build_body(const CompletionRequest &request, bool stream) const;
  [[nodiscard]] std::string build_text_generation_body(const CompletionRequest &request) const;

private:
  [[nodiscard]] std::optional<BackendError> check_credentials() const;
  [[nodiscard]] HttpHeaders headers(bool stream) const;
  [[nodiscard]] std::string endpoint() const;
  [[nodiscard]] BackendResult<CompletionResponse>
  complete_text_generation(const CompletionRequest &request);

  CompatibleOptions options_;
  std::shared_ptr<HttpClient> http_client_;
};

/// Strips the `huggingface/` or `hf/` routing prefix from a model name.
[[nodiscard]] std::string normalize_huggingface_model(const std::string &model);

/// Text-generation pipeline URL for a HuggingFace chat base URL (`.../v1` becomes `.../models`).
[[nodiscard]] std::string huggingface_models_url(const std::string &chat_base_url);

/// Flattens a conversation into `Role: text` paragraphs ending with an open assistant turn.
[[nodiscard]] std::string format_messages_as_prompt(const std::vector<Message> &messages);

/// Parses the pipeline's `[{"generated_text": ...}]` reply. The pipeline reports no usage.
[[nodiscard]] BackendResult<CompletionResponse>
parse_text_generation(const std::string &body, const std::string &backend, const std::string &model);

[[nodiscard]] BackendResult<CompletionResponse>
parse_chat_completion(const std::string &body, const std::string &backend,
                      const std::string &fallback_model);

} // namespace switchboard::backends
