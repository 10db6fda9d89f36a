#pragma once

#include "switchboard/common/cancellation.hpp"
#include "switchboard/common/result.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace switchboard::backends {

enum class MessageRole { System, User, Assistant };

[[nodiscard]] std::string_view role_name(MessageRole role);
[[nodiscard]] std::optional<MessageRole> parse_role(const std::string &name);

struct Message {
  MessageRole role = MessageRole::User;
  std::string text;
};

struct CompletionRequest {
  std::string agent_id;
  std::vector<Message> messages;
  std::optional<std::string> model;
  std::optional<double> temperature;
  std::optional<std::uint32_t> max_tokens;
};

struct TokenUsage {
  std::uint64_t prompt = 0;
  std::uint64_t completion = 0;
  std::uint64_t total = 0;
};

struct CompletionResponse {
  std::string text;
  std::string model;
  std::string backend;
  TokenUsage usage;
};

struct CompletionChunk {
  std::string text;
  std::string model;
  std::string backend;
  bool done = false;
  std::optional<std::string> error;
};

enum class BackendErrorCode {
  Api,
  Network,
  Auth,
  RateLimit,
  ModelNotFound,
  InvalidResponse,
  Timeout,
  Canceled,
  CircuitOpen,
};

[[nodiscard]] std::string_view error_code_name(BackendErrorCode code);

struct BackendError {
  BackendErrorCode code = BackendErrorCode::Api;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;
  std::string backend;

  [[nodiscard]] std::string to_string() const;
};

template <typename T> using BackendResult = common::Result<T, BackendError>;

/// Receives streamed chunks. A non-ok status stops the stream.
using ChunkSink = std::function<common::Status(const CompletionChunk &)>;

/// Uniform contract every vendor integration satisfies.
class Backend {
public:
  virtual ~Backend() = default;

  [[nodiscard]] virtual std::string id() const = 0;

  [[nodiscard]] virtual BackendResult<CompletionResponse>
  complete(const CompletionRequest &request) = 0;

  /// Emits zero or more content chunks followed by exactly one chunk with `done = true`,
  /// also on the error path. The default implementation replays `complete()`.
  [[nodiscard]] virtual BackendResult<void> stream(const common::CancellationToken &token,
                                                   const CompletionRequest &request,
                                                   const ChunkSink &emit);
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  bool aborted = false;
  std::string network_error_message;
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

/// Receives raw body bytes as they arrive. Returning false aborts the transfer.
using StreamChunkCallback = std::function<bool(std::string_view)>;

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
  [[nodiscard]] virtual HttpResponse
  post_json_stream(const std::string &url, const HttpHeaders &headers, const std::string &body,
                   std::uint64_t timeout_ms, const StreamChunkCallback &on_chunk) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body,
                                       std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_json_stream(const std::string &url, const HttpHeaders &headers,
                                              const std::string &body, std::uint64_t timeout_ms,
                                              const StreamChunkCallback &on_chunk) override;
};

/// Maps transport failures and non-2xx statuses onto BackendError; nullopt for success.
[[nodiscard]] std::optional<BackendError> classify_http_response(const HttpResponse &response,
                                                                 const std::string &backend);

/// Incremental `data:` line assembler for server-sent event streams.
class SseDecoder {
public:
  /// Appends bytes and returns every event payload completed by them.
  [[nodiscard]] std::vector<std::string> feed(std::string_view bytes);
  /// Flushes a trailing event that was not terminated by a blank line.
  [[nodiscard]] std::vector<std::string> finish();

private:
  std::string line_buffer_;
  std::string event_data_;
};

} // namespace switchboard::backends
