#include "switchboard/backends/anthropic.hpp"

#include "switchboard/common/fs.hpp"
#include "switchboard/common/json_util.hpp"

#include <cstdlib>
#include <sstream>

namespace switchboard::backends {

namespace {

std::uint64_t parse_count(const std::string &raw) {
  return raw.empty() ? 0 : std::strtoull(raw.c_str(), nullptr, 10);
}

} // namespace

BackendResult<CompletionResponse> parse_anthropic_message(const std::string &body,
                                                          const std::string &backend,
                                                          const std::string &fallback_model) {
  auto top = common::json_parse_flat(body);
  if (!top.contains("content")) {
    return BackendResult<CompletionResponse>::failure(
        {.code = BackendErrorCode::InvalidResponse,
         .message = "content field missing",
         .backend = backend});
  }

  CompletionResponse response;
  response.backend = backend;
  for (const auto &block : common::json_split_top_level_objects(top["content"])) {
    auto fields = common::json_parse_flat(block);
    if (fields["type"] == "text") {
      response.text += fields["text"];
    }
  }
  response.model = top["model"].empty() ? fallback_model : top["model"];

  const std::string usage = top["usage"];
  response.usage.prompt = parse_count(common::json_get_number(usage, "input_tokens"));
  response.usage.completion = parse_count(common::json_get_number(usage, "output_tokens"));
  response.usage.total = response.usage.prompt + response.usage.completion;
  return BackendResult<CompletionResponse>::success(std::move(response));
}

AnthropicBackend::AnthropicBackend(AnthropicOptions options,
                                   std::shared_ptr<HttpClient> http_client)
    : options_(std::move(options)), http_client_(std::move(http_client)) {
  while (!options_.base_url.empty() && options_.base_url.back() == '/') {
    options_.base_url.pop_back();
  }
}

std::string AnthropicBackend::id() const { return options_.id; }

std::string AnthropicBackend::resolve_model(const CompletionRequest &request) const {
  return request.model.has_value() && !request.model->empty() ? *request.model
                                                              : options_.default_model;
}

HttpHeaders AnthropicBackend::headers() const {
  return {
      {"Content-Type", "application/json"},
      {"anthropic-version", "2023-06-01"},
      {"x-api-key", options_.api_key},
  };
}

std::string AnthropicBackend::build_body(const CompletionRequest &request,
                                         const bool stream) const {
  std::string system;
  std::ostringstream messages;
  bool first = true;
  for (const auto &message : request.messages) {
    if (message.role == MessageRole::System) {
      system += system.empty() ? message.text : "\n\n" + message.text;
      continue;
    }
    if (!first) {
      messages << ',';
    }
    first = false;
    messages << "{\"role\":\"" << role_name(message.role) << "\",\"content\":\""
             << common::json_escape(message.text) << "\"}";
  }

  std::ostringstream body;
  body << "{\"model\":\"" << common::json_escape(resolve_model(request)) << "\",";
  body << "\"max_tokens\":" << request.max_tokens.value_or(options_.default_max_tokens) << ",";
  if (!system.empty()) {
    body << "\"system\":\"" << common::json_escape(system) << "\",";
  }
  if (request.temperature.has_value()) {
    body << "\"temperature\":" << common::json_number(*request.temperature, 3) << ",";
  }
  body << "\"messages\":[" << messages.str() << "],";
  body << "\"stream\":" << (stream ? "true" : "false") << "}";
  return body.str();
}

BackendResult<CompletionResponse> AnthropicBackend::complete(const CompletionRequest &request) {
  if (options_.api_key.empty()) {
    return BackendResult<CompletionResponse>::failure(
        {.code = BackendErrorCode::Auth, .message = "missing API key", .backend = options_.id});
  }

  const auto response = http_client_->post_json(options_.base_url + "/v1/messages", headers(),
                                                build_body(request, false), options_.timeout_ms);
  if (auto error = classify_http_response(response, options_.id)) {
    return BackendResult<CompletionResponse>::failure(std::move(*error));
  }
  return parse_anthropic_message(response.body, options_.id, resolve_model(request));
}

BackendResult<void> AnthropicBackend::stream(const common::CancellationToken &token,
                                             const CompletionRequest &request,
                                             const ChunkSink &emit) {
  const std::string model = resolve_model(request);
  const auto fail = [&](BackendError error) {
    (void)emit(CompletionChunk{
        .model = model, .backend = options_.id, .done = true, .error = error.to_string()});
    return BackendResult<void>::failure(std::move(error));
  };

  if (options_.api_key.empty()) {
    return fail({.code = BackendErrorCode::Auth, .message = "missing API key", .backend = options_.id});
  }

  SseDecoder decoder;
  bool stopped = false;
  std::optional<std::string> stream_error;
  const auto deliver = [&](const std::vector<std::string> &events) {
    for (const auto &event : events) {
      const std::string type = common::json_get_string(event, "type");
      if (type == "error") {
        stream_error = common::json_get_string(event, "message");
        return false;
      }
      if (type != "content_block_delta") {
        continue;
      }
      const std::string text = common::json_get_string(event, "text");
      if (text.empty()) {
        continue;
      }
      const auto status =
          emit(CompletionChunk{.text = text, .model = model, .backend = options_.id});
      if (!status.ok()) {
        stopped = true;
        return false;
      }
    }
    return !token.is_canceled();
  };

  HttpHeaders stream_headers = headers();
  stream_headers["Accept"] = "text/event-stream";
  const auto response = http_client_->post_json_stream(
      options_.base_url + "/v1/messages", stream_headers, build_body(request, true),
      options_.timeout_ms,
      [&](const std::string_view bytes) { return deliver(decoder.feed(bytes)); });

  if (stream_error.has_value()) {
    return fail({.code = BackendErrorCode::Api, .message = *stream_error, .backend = options_.id});
  }
  if (stopped || token.is_canceled()) {
    return fail({.code = BackendErrorCode::Canceled, .message = "canceled", .backend = options_.id});
  }
  if (auto error = classify_http_response(response, options_.id)) {
    return fail(std::move(*error));
  }
  if (!deliver(decoder.finish())) {
    if (stream_error.has_value()) {
      return fail({.code = BackendErrorCode::Api, .message = *stream_error, .backend = options_.id});
    }
    return fail({.code = BackendErrorCode::Canceled, .message = "canceled", .backend = options_.id});
  }

  (void)emit(CompletionChunk{.model = model, .backend = options_.id, .done = true});
  return BackendResult<void>::success();
}

} // namespace switchboard::backends
