#include "switchboard/backends/compatible.hpp"

#include "switchboard/common/fs.hpp"
#include "switchboard/common/json_util.hpp"

#include <cstdlib>
#include <sstream>

namespace switchboard::backends {

namespace {

std::uint64_t parse_count(const std::string &raw) {
  return raw.empty() ? 0 : std::strtoull(raw.c_str(), nullptr, 10);
}

TokenUsage parse_usage(const std::string &usage_json) {
  TokenUsage usage;
  if (usage_json.empty()) {
    return usage;
  }
  usage.prompt = parse_count(common::json_get_number(usage_json, "prompt_tokens"));
  usage.completion = parse_count(common::json_get_number(usage_json, "completion_tokens"));
  usage.total = parse_count(common::json_get_number(usage_json, "total_tokens"));
  if (usage.total == 0) {
    usage.total = usage.prompt + usage.completion;
  }
  return usage;
}

} // namespace

std::string normalize_huggingface_model(const std::string &model) {
  for (const std::string prefix : {"huggingface/", "hf/"}) {
    if (common::starts_with(model, prefix)) {
      return model.substr(prefix.size());
    }
  }
  return model;
}

std::string huggingface_models_url(const std::string &chat_base_url) {
  std::string base = chat_base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  const std::string versioned = "/v1";
  if (base.size() >= versioned.size() &&
      base.compare(base.size() - versioned.size(), versioned.size(), versioned) == 0) {
    base.resize(base.size() - versioned.size());
  }
  return base + "/models";
}

std::string format_messages_as_prompt(const std::vector<Message> &messages) {
  std::ostringstream prompt;
  for (const auto &message : messages) {
    switch (message.role) {
    case MessageRole::System:
      prompt << "System: ";
      break;
    case MessageRole::User:
      prompt << "User: ";
      break;
    case MessageRole::Assistant:
      prompt << "Assistant: ";
      break;
    }
    prompt << message.text << "\n\n";
  }
  prompt << "Assistant: ";
  return prompt.str();
}

BackendResult<CompletionResponse> parse_text_generation(const std::string &body,
                                                        const std::string &backend,
                                                        const std::string &model) {
  const auto generations = common::json_split_top_level_objects(common::trim(body));
  if (generations.empty()) {
    return BackendResult<CompletionResponse>::failure(
        {.code = BackendErrorCode::InvalidResponse,
         .message = "no text generated",
         .backend = backend});
  }
  const auto fields = common::json_parse_flat(generations.front());
  const auto text = fields.find("generated_text");
  if (text == fields.end()) {
    return BackendResult<CompletionResponse>::failure(
        {.code = BackendErrorCode::InvalidResponse,
         .message = "generated_text missing",
         .backend = backend});
  }
  return BackendResult<CompletionResponse>::success(
      CompletionResponse{.text = text->second, .model = model, .backend = backend});
}

BackendResult<CompletionResponse> parse_chat_completion(const std::string &body,
                                                        const std::string &backend,
                                                        const std::string &fallback_model) {
  const auto top = common::json_parse_flat(body);
  const auto choices = top.find("choices");
  if (choices == top.end()) {
    return BackendResult<CompletionResponse>::failure(
        {.code = BackendErrorCode::InvalidResponse,
         .message = "choices field missing",
         .backend = backend});
  }

  const auto first_choice = common::json_split_top_level_objects(choices->second);
  const std::string message =
      first_choice.empty() ? "" : common::json_get_object(first_choice.front(), "message");
  if (message.empty()) {
    return BackendResult<CompletionResponse>::failure(
        {.code = BackendErrorCode::InvalidResponse,
         .message = "choices[0].message missing",
         .backend = backend});
  }

  CompletionResponse response;
  response.text = common::json_parse_flat(message)["content"];
  response.backend = backend;
  const auto model = top.find("model");
  response.model = model != top.end() && !model->second.empty() ? model->second : fallback_model;
  const auto usage = top.find("usage");
  response.usage = parse_usage(usage == top.end() ? "" : usage->second);
  return BackendResult<CompletionResponse>::success(std::move(response));
}

CompatibleBackend::CompatibleBackend(CompatibleOptions options,
                                     std::shared_ptr<HttpClient> http_client)
    : options_(std::move(options)), http_client_(std::move(http_client)) {
  while (!options_.base_url.empty() && options_.base_url.back() == '/') {
    options_.base_url.pop_back();
  }
}

std::string CompatibleBackend::id() const { return options_.id; }

std::string CompatibleBackend::endpoint() const { return options_.base_url + "/chat/completions"; }

std::string CompatibleBackend::resolve_model(const CompletionRequest &request) const {
  const std::string model =
      request.model.has_value() && !request.model->empty() ? *request.model : options_.default_model;
  return options_.normalize_model ? options_.normalize_model(model) : model;
}

std::string CompatibleBackend::build_body(const CompletionRequest &request,
                                          const bool stream) const {
  std::ostringstream body;
  body << "{\"model\":\"" << common::json_escape(resolve_model(request)) << "\",";
  body << "\"messages\":[";
  for (std::size_t i = 0; i < request.messages.size(); ++i) {
    const auto &message = request.messages[i];
    if (i > 0) {
      body << ',';
    }
    body << "{\"role\":\"" << role_name(message.role) << "\",\"content\":\""
         << common::json_escape(message.text) << "\"}";
  }
  body << "],";
  if (request.temperature.has_value()) {
    body << "\"temperature\":" << common::json_number(*request.temperature, 3) << ",";
  }
  if (request.max_tokens.has_value()) {
    body << "\"max_tokens\":" << *request.max_tokens << ",";
  }
  if (stream) {
    body << "\"stream_options\":{\"include_usage\":true},";
  }
  body << "\"stream\":" << (stream ? "true" : "false") << "}";
  return body.str();
}

std::string CompatibleBackend::build_text_generation_body(const CompletionRequest &request) const {
  const double temperature = request.temperature.value_or(0.0);
  std::ostringstream body;
  body << "{\"inputs\":\"" << common::json_escape(format_messages_as_prompt(request.messages))
       << "\",\"parameters\":{\"max_new_tokens\":" << request.max_tokens.value_or(2048);
  if (temperature > 0.0) {
    body << ",\"temperature\":" << common::json_number(temperature, 3) << ",\"do_sample\":true";
  }
  body << ",\"return_full_text\":false},\"options\":{\"wait_for_model\":true}}";
  return body.str();
}

std::optional<BackendError> CompatibleBackend::check_credentials() const {
  if (options_.require_api_key && options_.api_key.empty()) {
    return BackendError{
        .code = BackendErrorCode::Auth, .message = "missing API key", .backend = options_.id};
  }
  return std::nullopt;
}

HttpHeaders CompatibleBackend::headers(const bool stream) const {
  HttpHeaders out = {{"Content-Type", "application/json"}};
  if (stream) {
    out["Accept"] = "text/event-stream";
  }
  if (!options_.api_key.empty()) {
    out["Authorization"] = "Bearer " + options_.api_key;
  }
  for (const auto &[key, value] : options_.extra_headers) {
    out[key] = value;
  }
  return out;
}

BackendResult<CompletionResponse> CompatibleBackend::complete(const CompletionRequest &request) {
  if (auto error = check_credentials()) {
    return BackendResult<CompletionResponse>::failure(std::move(*error));
  }

  const auto response = http_client_->post_json(endpoint(), headers(false),
                                                build_body(request, false), options_.timeout_ms);
  auto error = classify_http_response(response, options_.id);
  if (!error.has_value()) {
    auto parsed = parse_chat_completion(response.body, options_.id, resolve_model(request));
    if (parsed.ok() || options_.text_generation_url.empty()) {
      return parsed;
    }
    return complete_text_generation(request);
  }
  if (options_.text_generation_url.empty() || error->code == BackendErrorCode::Canceled) {
    return BackendResult<CompletionResponse>::failure(std::move(*error));
  }
  return complete_text_generation(request);
}

BackendResult<CompletionResponse>
CompatibleBackend::complete_text_generation(const CompletionRequest &request) {
  const std::string model = resolve_model(request);
  const auto response =
      http_client_->post_json(options_.text_generation_url + "/" + model, headers(false),
                              build_text_generation_body(request), options_.timeout_ms);
  if (auto error = classify_http_response(response, options_.id)) {
    return BackendResult<CompletionResponse>::failure(std::move(*error));
  }
  return parse_text_generation(response.body, options_.id, model);
}

BackendResult<void> CompatibleBackend::stream(const common::CancellationToken &token,
                                              const CompletionRequest &request,
                                              const ChunkSink &emit) {
  const std::string model = resolve_model(request);
  const auto fail = [&](BackendError error) {
    (void)emit(CompletionChunk{
        .model = model, .backend = options_.id, .done = true, .error = error.to_string()});
    return BackendResult<void>::failure(std::move(error));
  };

  if (auto error = check_credentials()) {
    return fail(std::move(*error));
  }
  if (token.is_canceled()) {
    return fail({.code = BackendErrorCode::Canceled, .message = "canceled", .backend = options_.id});
  }

  SseDecoder decoder;
  std::optional<std::string> sink_error;
  const auto deliver = [&](const std::vector<std::string> &events) {
    for (const auto &event : events) {
      if (common::trim(event) == "[DONE]") {
        continue;
      }
      const std::string delta = common::json_get_object(event, "delta");
      const std::string text = delta.empty() ? "" : common::json_get_string(delta, "content");
      if (text.empty()) {
        continue;
      }
      const auto status =
          emit(CompletionChunk{.text = text, .model = model, .backend = options_.id});
      if (!status.ok()) {
        sink_error = status.error();
        return false;
      }
    }
    return !token.is_canceled();
  };

  const auto response = http_client_->post_json_stream(
      endpoint(), headers(true), build_body(request, true), options_.timeout_ms,
      [&](const std::string_view bytes) { return deliver(decoder.feed(bytes)); });

  if (sink_error.has_value()) {
    return fail({.code = BackendErrorCode::Canceled,
                 .message = "consumer stopped: " + *sink_error,
                 .backend = options_.id});
  }
  if (token.is_canceled()) {
    return fail({.code = BackendErrorCode::Canceled, .message = "canceled", .backend = options_.id});
  }
  if (auto error = classify_http_response(response, options_.id)) {
    return fail(std::move(*error));
  }
  if (!deliver(decoder.finish())) {
    return fail({.code = BackendErrorCode::Canceled, .message = "canceled", .backend = options_.id});
  }

  (void)emit(CompletionChunk{.model = model, .backend = options_.id, .done = true});
  return BackendResult<void>::success();
}

} // namespace switchboard::backends
