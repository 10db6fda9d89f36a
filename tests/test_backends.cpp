#include "test_framework.hpp"

#include "switchboard/backends/anthropic.hpp"
#include "switchboard/backends/compatible.hpp"
#include "switchboard/backends/factory.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

namespace {

using switchboard::backends::AnthropicBackend;
using switchboard::backends::AnthropicOptions;
using switchboard::backends::BackendErrorCode;
using switchboard::backends::CompatibleBackend;
using switchboard::backends::CompatibleOptions;
using switchboard::backends::CompletionChunk;
using switchboard::backends::HttpResponse;
using switchboard::backends::MessageRole;
using switchboard::backends::SseDecoder;
using switchboard::testing::MockHttpClient;
using switchboard::testing::user_request;

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

HttpResponse ok_response(std::string body) {
  HttpResponse response;
  response.status = 200;
  response.body = std::move(body);
  return response;
}

CompatibleOptions openai_options() {
  return CompatibleOptions{.id = "openai",
                           .base_url = "https://api.openai.com/v1/",
                           .api_key = "sk-test",
                           .default_model = "gpt-4o-mini"};
}

struct StreamCapture {
  std::vector<CompletionChunk> chunks;
  bool stop_after_first = false;

  [[nodiscard]] switchboard::backends::ChunkSink sink() {
    return [this](const CompletionChunk &chunk) {
      chunks.push_back(chunk);
      if (stop_after_first && !chunk.done) {
        return switchboard::common::Status::error("client gone");
      }
      return switchboard::common::Status::success();
    };
  }

  [[nodiscard]] std::string text() const {
    std::string out;
    for (const auto &chunk : chunks) {
      out += chunk.text;
    }
    return out;
  }

  [[nodiscard]] std::size_t terminals() const {
    std::size_t count = 0;
    for (const auto &chunk : chunks) {
      count += chunk.done ? 1 : 0;
    }
    return count;
  }
};

} // namespace

void register_backends_tests(std::vector<switchboard::tests::TestCase> &tests) {
  using switchboard::tests::require;

  tests.push_back({"compatible_posts_chat_completion_and_parses_reply", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->next_post = ok_response(
                         R"({"id":"x","model":"gpt-4o-2024-08-06","choices":[{"index":0,"message":{"role":"assistant","content":"Hello there"}}],"usage":{"prompt_tokens":12,"completion_tokens":3,"total_tokens":15}})");
                     CompatibleBackend backend(openai_options(), http);

                     auto request = user_request("a", "hi", "gpt-4o");
                     request.temperature = 0.5;
                     request.max_tokens = 64;
                     auto result = backend.complete(request);
                     require(result.ok(), result.ok() ? "" : result.error().to_string());
                     require(result.value().text == "Hello there", "content parsed");
                     require(result.value().model == "gpt-4o-2024-08-06", "upstream model kept");
                     require(result.value().backend == "openai", "backend id set");
                     require(result.value().usage.prompt == 12 && result.value().usage.total == 15,
                             "usage parsed");

                     require(http->last_url == "https://api.openai.com/v1/chat/completions",
                             "trailing slash trimmed before the endpoint");
                     require(http->last_headers["Authorization"] == "Bearer sk-test", "bearer key");
                     require(!http->last_headers.contains("Accept"), "no SSE accept header");
                     require(contains(http->last_body, R"("model":"gpt-4o")"), "model in body");
                     require(contains(http->last_body, R"("temperature":0.500)"), "temperature");
                     require(contains(http->last_body, R"("max_tokens":64)"), "max tokens");
                     require(contains(http->last_body, R"("stream":false)"), "non-streaming");
                   }});

  tests.push_back({"compatible_defaults_model_and_usage_total", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->next_post = ok_response(
                         R"({"choices":[{"message":{"content":"ok"}}],"usage":{"prompt_tokens":4,"completion_tokens":6}})");
                     CompatibleBackend backend(openai_options(), http);
                     auto result = backend.complete(user_request("a", "hi"));
                     require(result.ok(), "reply parsed");
                     require(result.value().model == "gpt-4o-mini", "falls back to requested model");
                     require(result.value().usage.total == 10, "total derived from parts");
                     require(contains(http->last_body, R"("model":"gpt-4o-mini")"),
                             "default model sent");
                     require(!contains(http->last_body, "temperature"), "unset fields omitted");
                   }});

  tests.push_back({"compatible_missing_key_fails_without_request", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     auto options = openai_options();
                     options.api_key.clear();
                     CompatibleBackend backend(options, http);
                     auto result = backend.complete(user_request("a", "hi"));
                     require(!result.ok() && result.error().code == BackendErrorCode::Auth,
                             "missing key is an auth error");
                     require(http->posts == 0, "nothing sent");

                     options.require_api_key = false;
                     http->next_post = ok_response(R"({"choices":[{"message":{"content":"x"}}]})");
                     CompatibleBackend keyless(options, http);
                     require(keyless.complete(user_request("a", "hi")).ok(),
                             "keyless backends may omit the key");
                     require(!http->last_headers.contains("Authorization"),
                             "no authorization header without a key");
                   }});

  tests.push_back({"compatible_maps_http_errors", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     CompatibleBackend backend(openai_options(), http);

                     http->next_post = HttpResponse{.status = 429, .body = "slow down",
                                                    .headers = {{"retry-after", "12"}}};
                     auto limited = backend.complete(user_request("a", "hi"));
                     require(!limited.ok(), "429 fails");
                     require(limited.error().code == BackendErrorCode::RateLimit, "rate limit code");
                     require(limited.error().retry_after == std::optional<std::uint64_t>(12),
                             "retry-after parsed");
                     require(limited.error().message == "slow down", "body becomes the message");

                     http->next_post = HttpResponse{.status = 404, .body = "no such model"};
                     require(backend.complete(user_request("a", "hi")).error().code ==
                                 BackendErrorCode::ModelNotFound,
                             "404 is model not found");

                     http->next_post = HttpResponse{.status = 401};
                     require(backend.complete(user_request("a", "hi")).error().code ==
                                 BackendErrorCode::Auth,
                             "401 is auth");

                     http->next_post = ok_response(R"({"object":"list"})");
                     auto invalid = backend.complete(user_request("a", "hi"));
                     require(!invalid.ok() &&
                                 invalid.error().code == BackendErrorCode::InvalidResponse,
                             "missing choices is invalid");
                   }});

  tests.push_back({"classify_transport_failures", [] {
                     HttpResponse timeout;
                     timeout.timeout = true;
                     require(switchboard::backends::classify_http_response(timeout, "x")->code ==
                                 BackendErrorCode::Timeout,
                             "timeout");
                     HttpResponse network;
                     network.network_error = true;
                     network.network_error_message = "connection refused";
                     require(switchboard::backends::classify_http_response(network, "x")->code ==
                                 BackendErrorCode::Network,
                             "network");
                     HttpResponse aborted;
                     aborted.aborted = true;
                     require(switchboard::backends::classify_http_response(aborted, "x")->code ==
                                 BackendErrorCode::Canceled,
                             "aborted transfer");
                     require(!switchboard::backends::classify_http_response(ok_response("{}"), "x")
                                  .has_value(),
                             "2xx is success");
                     HttpResponse server;
                     server.status = 503;
                     require(switchboard::backends::classify_http_response(server, "x")->code ==
                                 BackendErrorCode::Api,
                             "other statuses are api errors");
                   }});

  tests.push_back({"sse_decoder_assembles_split_events", [] {
                     SseDecoder decoder;
                     auto first = decoder.feed("data: {\"a\":");
                     require(first.empty(), "incomplete event held back");
                     auto second = decoder.feed("1}\r\n\r\n: keepalive\n\ndata: x\ndata: y\n\n");
                     require(second.size() == 2, "two events completed");
                     require(second[0] == "{\"a\":1}", "carriage return stripped");
                     require(second[1] == "x\ny", "multi-line data joined with newline");

                     auto tail = decoder.feed("data: [DONE]");
                     require(tail.empty(), "unterminated event waits");
                     auto flushed = decoder.finish();
                     require(flushed.size() == 1 && flushed[0] == "[DONE]", "finish flushes");
                   }});

  tests.push_back({"compatible_stream_relays_deltas", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->next_post_stream = ok_response("");
                     http->stream_chunks = {
                         "data: {\"choices\":[{\"delta\":{\"role\":\"assistant\"}}]}\n\n",
                         "data: {\"choices\":[{\"delta\":{\"content\":\"Hel\"}}]}\n\ndata: {\"choi",
                         "ces\":[{\"delta\":{\"content\":\"lo\"}}]}\n\n",
                         "data: [DONE]\n\n"};
                     CompatibleBackend backend(openai_options(), http);
                     switchboard::common::CancellationToken token;
                     StreamCapture capture;
                     auto result = backend.stream(token, user_request("a", "hi"), capture.sink());
                     require(result.ok(), result.ok() ? "" : result.error().to_string());
                     require(capture.text() == "Hello", "deltas concatenated");
                     require(capture.chunks.size() == 3, "two content chunks plus terminal");
                     require(capture.terminals() == 1 && capture.chunks.back().done,
                             "single trailing terminal");
                     require(http->last_headers["Accept"] == "text/event-stream", "SSE accept");
                     require(contains(http->last_body, R"("stream_options":{"include_usage":true})"),
                             "usage requested on streams");
                     require(contains(http->last_body, R"("stream":true)"), "streaming body");
                   }});

  tests.push_back({"compatible_stream_stops_when_consumer_fails", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->next_post_stream = ok_response("");
                     http->stream_chunks = {
                         "data: {\"choices\":[{\"delta\":{\"content\":\"a\"}}]}\n\n",
                         "data: {\"choices\":[{\"delta\":{\"content\":\"b\"}}]}\n\n"};
                     CompatibleBackend backend(openai_options(), http);
                     switchboard::common::CancellationToken token;
                     StreamCapture capture;
                     capture.stop_after_first = true;
                     auto result = backend.stream(token, user_request("a", "hi"), capture.sink());
                     require(!result.ok() && result.error().code == BackendErrorCode::Canceled,
                             "consumer failure cancels");
                     require(contains(result.error().message, "consumer stopped: client gone"),
                             "reason carried");
                     require(capture.text() == "a", "no content after the stop");
                     require(capture.terminals() == 1 && capture.chunks.back().error.has_value(),
                             "terminal error chunk still emitted");
                   }});

  tests.push_back({"compatible_stream_http_error_emits_terminal", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->next_post_stream = HttpResponse{.status = 500, .body = "boom"};
                     CompatibleBackend backend(openai_options(), http);
                     switchboard::common::CancellationToken token;
                     StreamCapture capture;
                     auto result = backend.stream(token, user_request("a", "hi"), capture.sink());
                     require(!result.ok() && result.error().code == BackendErrorCode::Api,
                             "500 fails the stream");
                     require(capture.chunks.size() == 1 && capture.chunks[0].done &&
                                 capture.chunks[0].error.has_value(),
                             "one terminal error chunk");

                     token.cancel();
                     StreamCapture canceled;
                     auto early = backend.stream(token, user_request("a", "hi"), canceled.sink());
                     require(!early.ok() && early.error().code == BackendErrorCode::Canceled,
                             "pre-canceled token fails fast");
                   }});

  tests.push_back({"huggingface_model_prefix_normalized", [] {
                     require(switchboard::backends::normalize_huggingface_model(
                                 "huggingface/meta-llama/Llama-3") == "meta-llama/Llama-3",
                             "huggingface/ stripped");
                     require(switchboard::backends::normalize_huggingface_model("hf/mistral") ==
                                 "mistral",
                             "hf/ stripped");
                     require(switchboard::backends::normalize_huggingface_model("gpt2") == "gpt2",
                             "other names untouched");
                   }});

  tests.push_back({"huggingface_models_url_derived_from_chat_base", [] {
                     using switchboard::backends::huggingface_models_url;
                     require(huggingface_models_url("https://api-inference.huggingface.co/v1") ==
                                 "https://api-inference.huggingface.co/models",
                             "hosted api");
                     require(huggingface_models_url("http://hf.local/v1/") ==
                                 "http://hf.local/models",
                             "trailing slash");
                     require(huggingface_models_url("http://endpoint") == "http://endpoint/models",
                             "unversioned endpoint");
                   }});

  tests.push_back({"huggingface_falls_back_to_text_generation", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->queued_posts.push_back(
                         HttpResponse{.status = 503, .body = R"({"error":"model loading"})"});
                     http->queued_posts.push_back(
                         HttpResponse{.status = 200, .body = R"([{"generated_text":"from pipeline"}])"});
                     CompatibleBackend backend(
                         CompatibleOptions{
                             .id = "huggingface",
                             .base_url = "https://hf.test/v1",
                             .api_key = "hk",
                             .default_model = "hf/org/model",
                             .normalize_model = switchboard::backends::normalize_huggingface_model,
                             .text_generation_url = "https://hf.test/models"},
                         http);
                     auto request = user_request("a", "hi");
                     request.messages.insert(request.messages.begin(),
                                             switchboard::backends::Message{
                                                 .role = MessageRole::System, .text = "Be brief."});
                     request.max_tokens = 64;

                     auto result = backend.complete(request);
                     require(result.ok(), "pipeline answer accepted");
                     require(result.value().text == "from pipeline", "generated text");
                     require(result.value().model == "org/model", "normalized model reported");
                     require(result.value().usage.total == 0, "pipeline reports no usage");
                     require(http->post_urls.size() == 2 &&
                                 http->post_urls[0] == "https://hf.test/v1/chat/completions" &&
                                 http->post_urls[1] == "https://hf.test/models/org/model",
                             "chat first, then the model's pipeline");
                     require(contains(http->last_body,
                                      R"("inputs":"System: Be brief.\n\nUser: hi\n\nAssistant: ")"),
                             "conversation flattened into a prompt");
                     require(contains(http->last_body, R"("max_new_tokens":64)"), "token limit");
                     require(contains(http->last_body, R"("return_full_text":false)"),
                             "only new text requested");
                     require(contains(http->last_body, R"("wait_for_model":true)"),
                             "waits for cold models");
                     require(http->last_headers["Authorization"] == "Bearer hk", "auth header");
                   }});

  tests.push_back({"huggingface_fallback_failure_and_chat_success", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     CompatibleOptions options{.id = "huggingface",
                                               .base_url = "https://hf.test/v1",
                                               .api_key = "hk",
                                               .default_model = "org/model",
                                               .text_generation_url = "https://hf.test/models"};
                     CompatibleBackend backend(options, http);

                     http->queued_posts.push_back(HttpResponse{.status = 500, .body = "boom"});
                     http->queued_posts.push_back(HttpResponse{.status = 404, .body = "missing"});
                     auto failed = backend.complete(user_request("a", "hi"));
                     require(!failed.ok() &&
                                 failed.error().code == BackendErrorCode::ModelNotFound,
                             "pipeline error is reported");

                     http->post_urls.clear();
                     http->next_post = HttpResponse{
                         .status = 200,
                         .body = R"({"choices":[{"message":{"content":"chat ok"}}]})"};
                     auto served = backend.complete(user_request("a", "hi"));
                     require(served.ok() && served.value().text == "chat ok", "chat answer used");
                     require(http->post_urls.size() == 1, "no fallback after a chat success");

                     CompatibleBackend openai(
                         CompatibleOptions{.id = "openai", .base_url = "https://o.test/v1",
                                           .api_key = "k"},
                         http);
                     http->post_urls.clear();
                     http->next_post = HttpResponse{.status = 503, .body = "busy"};
                     require(!openai.complete(user_request("a", "hi")).ok(),
                             "other backends surface the chat failure");
                     require(http->post_urls.size() == 1, "no pipeline without a url");
                   }});

  tests.push_back({"anthropic_lifts_system_messages", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     AnthropicBackend backend(AnthropicOptions{.api_key = "ak"}, http);
                     auto request = user_request("a", "hi");
                     request.messages.insert(request.messages.begin(),
                                             {{.role = MessageRole::System, .text = "Be brief."},
                                              {.role = MessageRole::System, .text = "Be kind."}});
                     const std::string body = backend.build_body(request, false);
                     require(contains(body, R"("system":"Be brief.\n\nBe kind.")"),
                             "system messages joined into the top-level field");
                     require(contains(body, R"("max_tokens":4096)"), "default max tokens");
                     require(!contains(body, R"("role":"system")"), "no system role in messages");
                     require(contains(body, R"("model":"claude-3-5-sonnet-20241022")"),
                             "default model");
                   }});

  tests.push_back({"anthropic_complete_parses_content_blocks", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->next_post = ok_response(
                         R"({"id":"msg_1","model":"claude-3-opus","content":[{"type":"text","text":"Hi "},{"type":"text","text":"there"}],"usage":{"input_tokens":9,"output_tokens":2}})");
                     AnthropicBackend backend(AnthropicOptions{.api_key = "ak"}, http);
                     auto result = backend.complete(user_request("a", "hi", "claude-3-opus"));
                     require(result.ok(), result.ok() ? "" : result.error().to_string());
                     require(result.value().text == "Hi there", "text blocks concatenated");
                     require(result.value().usage.prompt == 9 && result.value().usage.total == 11,
                             "usage mapped");
                     require(http->last_url == "https://api.anthropic.com/v1/messages", "endpoint");
                     require(http->last_headers["x-api-key"] == "ak", "api key header");
                     require(http->last_headers["anthropic-version"] == "2023-06-01",
                             "version header");

                     auto missing = switchboard::backends::parse_anthropic_message("{}", "anthropic", "m");
                     require(!missing.ok() &&
                                 missing.error().code == BackendErrorCode::InvalidResponse,
                             "missing content is invalid");
                   }});

  tests.push_back({"anthropic_stream_relays_text_and_errors", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->next_post_stream = ok_response("");
                     http->stream_chunks = {
                         "event: message_start\ndata: {\"type\":\"message_start\"}\n\n",
                         "data: {\"type\":\"content_block_delta\",\"index\":0,\"delta\":{\"type\":\"text_delta\",\"text\":\"Yo\"}}\n\n",
                         "data: {\"type\":\"message_stop\"}\n\n"};
                     AnthropicBackend backend(AnthropicOptions{.api_key = "ak"}, http);
                     switchboard::common::CancellationToken token;
                     StreamCapture capture;
                     auto result = backend.stream(token, user_request("a", "hi"), capture.sink());
                     require(result.ok(), "stream succeeds");
                     require(capture.text() == "Yo" && capture.terminals() == 1, "text relayed");

                     http->stream_chunks = {
                         "data: {\"type\":\"error\",\"error\":{\"type\":\"overloaded_error\",\"message\":\"Overloaded\"}}\n\n"};
                     StreamCapture failed;
                     auto broken = backend.stream(token, user_request("a", "hi"), failed.sink());
                     require(!broken.ok() && broken.error().code == BackendErrorCode::Api,
                             "error event fails the stream");
                     require(broken.error().message == "Overloaded", "upstream message kept");
                     require(failed.terminals() == 1, "terminal error chunk emitted");
                   }});

  tests.push_back({"backend_default_stream_replays_complete", [] {
                     auto backend = std::make_shared<switchboard::testing::ScriptedBackend>("s");
                     switchboard::common::CancellationToken token;
                     StreamCapture capture;
                     auto result = backend->stream(token, user_request("a", "ping"), capture.sink());
                     require(result.ok(), "replay succeeds");
                     require(capture.chunks.size() == 2 && capture.text() == "echo: ping",
                             "one content chunk then terminal");

                     token.cancel();
                     StreamCapture canceled;
                     auto refused = backend->stream(token, user_request("a", "ping"), canceled.sink());
                     require(!refused.ok() && refused.error().code == BackendErrorCode::Canceled,
                             "pre-canceled replay fails");
                   }});

  tests.push_back({"backend_factory_builds_known_backends", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     switchboard::config::BackendConfig ollama{
                         .id = "ollama", .enabled = true, .base_url = "http://localhost:11434/v1"};
                     auto local = switchboard::backends::create_backend(ollama, http);
                     require(local.ok() && local.value()->id() == "ollama", "ollama built");

                     switchboard::config::BackendConfig router{
                         .id = "openrouter", .enabled = true, .api_key = "or",
                         .base_url = "https://openrouter.ai/api/v1"};
                     http->next_post = ok_response(R"({"choices":[{"message":{"content":"x"}}]})");
                     auto aggregator = switchboard::backends::create_backend(router, http);
                     require(aggregator.ok(), "openrouter built");
                     (void)aggregator.value()->complete(user_request("a", "hi"));
                     require(http->last_headers.contains("HTTP-Referer") &&
                                 http->last_headers.contains("X-Title"),
                             "attribution headers sent");

                     auto unknown = switchboard::backends::create_backend(
                         {.id = "bard", .base_url = "https://x"}, http);
                     require(!unknown.ok() && unknown.error() == "Unknown backend: bard",
                             "unknown id rejected");
                     auto no_url = switchboard::backends::create_backend({.id = "openai"}, http);
                     require(!no_url.ok() && no_url.error() == "backends.openai.base_url is empty",
                             "empty base url rejected");
                     auto no_http = switchboard::backends::create_backend(ollama, nullptr);
                     require(!no_http.ok() && no_http.error() == "http client is required",
                             "http client required");
                   }});

  tests.push_back({"backend_factory_skips_disabled", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     auto config = switchboard::testing::mock_config();
                     for (auto &entry : config.backends) {
                       entry.base_url = "http://localhost:1/v1";
                     }
                     auto backends = switchboard::backends::create_backends(config, http);
                     require(backends.ok(), backends.ok() ? "" : backends.error());
                     require(backends.value().size() == 1 && backends.value().contains("ollama"),
                             "only enabled backends are built");
                   }});
}
