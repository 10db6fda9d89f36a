#pragma once

#include "switchboard/backends/traits.hpp"

#include <memory>
#include <string>

namespace switchboard::backends {

struct AnthropicOptions {
  std::string id = "anthropic";
  std::string base_url = "https://api.anthropic.com";
  std::string api_key;
  std::string default_model = "claude-3-5-sonnet-20241022";
  std::uint32_t default_max_tokens = 4096;
  std::uint64_t timeout_ms = 120'000;
};

/// Anthropic `/v1/messages` backend. System messages are lifted into the top-level field.
class AnthropicBackend : public Backend {
public:
  AnthropicBackend(AnthropicOptions options, std::shared_ptr<HttpClient> http_client);

  [[nodiscard]] std::string id() const override;
  [[nodiscard]] BackendResult<CompletionResponse>
  complete(const CompletionRequest &request) override;
  [[nodiscard]] BackendResult<void> stream(const common::CancellationToken &token,
                                           const CompletionRequest &request,
                                           const ChunkSink &emit) override;

  [[nodiscard]] std::string build_body(const CompletionRequest &request, bool stream) const;

private:
  [[nodiscard]] std::string resolve_model(const CompletionRequest &request) const;
  [[nodiscard]] HttpHeaders headers() const;

  AnthropicOptions options_;
  std::shared_ptr<HttpClient> http_client_;
};

[[nodiscard]] BackendResult<CompletionResponse>
parse_anthropic_message(const std::string &body, const std::string &backend,
                        const std::string &fallback_model);

} // namespace switchboard::backends
