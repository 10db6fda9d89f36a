#include "switchboard/backends/traits.hpp"

#include "switchboard/common/fs.hpp"

#include <curl/curl.h>

#include <charconv>
#include <sstream>

namespace switchboard::backends {

namespace {

struct WriteContext {
  std::string *body = nullptr;
  const StreamChunkCallback *on_chunk = nullptr;
  bool *aborted = nullptr;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *context = static_cast<WriteContext *>(userdata);
  context->body->append(ptr, total);
  if (context->on_chunk != nullptr && *context->on_chunk &&
      !(*context->on_chunk)(std::string_view(ptr, total))) {
    *context->aborted = true;
    return 0;
  }
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  const std::string header(buffer, total);
  auto *headers = static_cast<HttpHeaders *>(userdata);
  if (const auto colon = header.find(':'); colon != std::string::npos) {
    (*headers)[common::to_lower(common::trim(header.substr(0, colon)))] =
        common::trim(header.substr(colon + 1));
  }
  return total;
}

HttpResponse execute_post(const std::string &url, const HttpHeaders &headers,
                          const std::string &body, const std::uint64_t timeout_ms,
                          const StreamChunkCallback *on_chunk) {
  HttpResponse response;
  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  WriteContext context{.body = &response.body, .on_chunk = on_chunk, .aborted = &response.aborted};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "Switchboard/0.1");
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    header_list = curl_slist_append(header_list, (key + ": " + value).c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);
  if (code != CURLE_OK && !response.aborted) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  }

  curl_slist_free_all(header_list);
  curl_easy_cleanup(curl);
  return response;
}

} // namespace

std::string_view role_name(const MessageRole role) {
  switch (role) {
  case MessageRole::System:
    return "system";
  case MessageRole::User:
    return "user";
  case MessageRole::Assistant:
    return "assistant";
  }
  return "user";
}

std::optional<MessageRole> parse_role(const std::string &name) {
  const std::string lowered = common::to_lower(common::trim(name));
  if (lowered == "system") {
    return MessageRole::System;
  }
  if (lowered == "user") {
    return MessageRole::User;
  }
  if (lowered == "assistant") {
    return MessageRole::Assistant;
  }
  return std::nullopt;
}

std::string_view error_code_name(const BackendErrorCode code) {
  switch (code) {
  case BackendErrorCode::Api:
    return "api";
  case BackendErrorCode::Network:
    return "network";
  case BackendErrorCode::Auth:
    return "auth";
  case BackendErrorCode::RateLimit:
    return "rate_limit";
  case BackendErrorCode::ModelNotFound:
    return "model_not_found";
  case BackendErrorCode::InvalidResponse:
    return "invalid_response";
  case BackendErrorCode::Timeout:
    return "timeout";
  case BackendErrorCode::Canceled:
    return "canceled";
  case BackendErrorCode::CircuitOpen:
    return "circuit_open";
  }
  return "api";
}

std::string BackendError::to_string() const {
  std::ostringstream stream;
  stream << "Backend error [" << error_code_name(code) << "]";
  if (!backend.empty()) {
    stream << " backend=" << backend;
  }
  if (status != 0) {
    stream << " status=" << status;
  }
  if (retry_after.has_value()) {
    stream << " retry_after=" << *retry_after;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

BackendResult<void> Backend::stream(const common::CancellationToken &token,
                                    const CompletionRequest &request, const ChunkSink &emit) {
  const auto finish = [&](const std::optional<std::string> &error) {
    (void)emit(CompletionChunk{.backend = id(), .done = true, .error = error});
  };

  if (token.is_canceled()) {
    BackendError error{.code = BackendErrorCode::Canceled, .message = "canceled", .backend = id()};
    finish(error.to_string());
    return BackendResult<void>::failure(std::move(error));
  }

  auto response = complete(request);
  if (!response.ok()) {
    finish(response.error().to_string());
    return BackendResult<void>::failure(response.error());
  }

  const auto &value = response.value();
  if (!value.text.empty()) {
    const auto status =
        emit(CompletionChunk{.text = value.text, .model = value.model, .backend = value.backend});
    if (!status.ok()) {
      BackendError error{
          .code = BackendErrorCode::Canceled, .message = status.error(), .backend = id()};
      finish(error.to_string());
      return BackendResult<void>::failure(std::move(error));
    }
  }
  (void)emit(CompletionChunk{.model = value.model, .backend = value.backend, .done = true});
  return BackendResult<void>::success();
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  return execute_post(url, headers, body, timeout_ms, nullptr);
}

HttpResponse CurlHttpClient::post_json_stream(const std::string &url, const HttpHeaders &headers,
                                              const std::string &body,
                                              const std::uint64_t timeout_ms,
                                              const StreamChunkCallback &on_chunk) {
  return execute_post(url, headers, body, timeout_ms, &on_chunk);
}

std::optional<BackendError> classify_http_response(const HttpResponse &response,
                                                   const std::string &backend) {
  if (response.aborted) {
    return BackendError{
        .code = BackendErrorCode::Canceled, .message = "stream aborted", .backend = backend};
  }
  if (response.timeout) {
    return BackendError{
        .code = BackendErrorCode::Timeout, .message = "request timed out", .backend = backend};
  }
  if (response.network_error) {
    return BackendError{.code = BackendErrorCode::Network,
                        .message = response.network_error_message,
                        .backend = backend};
  }
  if (response.status >= 200 && response.status < 300) {
    return std::nullopt;
  }

  BackendError error{.status = response.status, .message = response.body, .backend = backend};
  switch (response.status) {
  case 401:
  case 403:
    error.code = BackendErrorCode::Auth;
    break;
  case 404:
    error.code = BackendErrorCode::ModelNotFound;
    break;
  case 429: {
    error.code = BackendErrorCode::RateLimit;
    if (const auto it = response.headers.find("retry-after"); it != response.headers.end()) {
      std::uint64_t seconds = 0;
      const auto *first = it->second.data();
      const auto *last = first + it->second.size();
      if (const auto [ptr, ec] = std::from_chars(first, last, seconds);
          ec == std::errc() && ptr == last) {
        error.retry_after = seconds;
      }
    }
    break;
  }
  default:
    error.code = BackendErrorCode::Api;
    break;
  }
  return error;
}

std::vector<std::string> SseDecoder::feed(const std::string_view bytes) {
  std::vector<std::string> events;
  line_buffer_.append(bytes);
  std::size_t line_end = std::string::npos;
  while ((line_end = line_buffer_.find('\n')) != std::string::npos) {
    std::string line = line_buffer_.substr(0, line_end);
    line_buffer_.erase(0, line_end + 1);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      if (!event_data_.empty()) {
        events.push_back(std::move(event_data_));
        event_data_.clear();
      }
      continue;
    }
    if (!common::starts_with(line, "data:")) {
      continue;
    }

    std::string payload = line.substr(5);
    if (!payload.empty() && payload.front() == ' ') {
      payload.erase(payload.begin());
    }
    if (!event_data_.empty()) {
      event_data_.push_back('\n');
    }
    event_data_ += payload;
  }
  return events;
}

std::vector<std::string> SseDecoder::finish() {
  auto events = feed("\n\n");
  if (!event_data_.empty()) {
    events.push_back(std::move(event_data_));
    event_data_.clear();
  }
  return events;
}

} // namespace switchboard::backends
