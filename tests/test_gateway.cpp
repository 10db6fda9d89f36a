#include "test_framework.hpp"

#include "switchboard/gateway/server.hpp"
#include "switchboard/runtime/app.hpp"
#include "switchboard/runtime/snapshot_job.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <memory>
#include <thread>

namespace {

namespace gw = switchboard::gateway;
using switchboard::backends::BackendErrorCode;
using switchboard::testing::ManualClock;
using switchboard::testing::RecordingObserver;
using switchboard::testing::ScriptedBackend;

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

switchboard::config::Config gateway_config() {
  auto config = switchboard::testing::mock_config();
  config.routing.strategy = "static";
  config.agents.push_back({.id = "coder", .name = "Coder", .tier = "cloud",
                           .default_model = "gpt-4o"});
  config.agents.push_back({.id = "helper", .tier = "local"});
  return config;
}

/// Gateway over scripted ollama and openai backends.
struct GatewayFixture {
  ManualClock clock;
  switchboard::config::Config config;
  std::shared_ptr<ScriptedBackend> ollama = std::make_shared<ScriptedBackend>("ollama");
  std::shared_ptr<ScriptedBackend> openai = std::make_shared<ScriptedBackend>("openai");
  std::shared_ptr<RecordingObserver> observer = std::make_shared<RecordingObserver>();
  std::shared_ptr<switchboard::runtime::Services> services;
  std::unique_ptr<gw::GatewayServer> server;

  explicit GatewayFixture(switchboard::config::Config cfg = gateway_config())
      : config(std::move(cfg)) {
    auto assembled = switchboard::runtime::assemble_services(
        config, {{"ollama", ollama}, {"openai", openai}}, observer, clock.clock());
    switchboard::tests::require(assembled.ok(), assembled.ok() ? "" : assembled.error());
    services = assembled.value();
    server = std::make_unique<gw::GatewayServer>(config, services);
  }

  gw::HttpResponse get(const std::string &path,
                       std::unordered_map<std::string, std::string> query = {}) {
    return server->dispatch_for_test(
        gw::HttpRequest{.method = "GET", .path = path, .raw_path = path, .query = std::move(query)});
  }

  gw::HttpResponse post(const std::string &path, const std::string &body = "") {
    return server->dispatch_for_test(
        gw::HttpRequest{.method = "POST", .path = path, .raw_path = path, .body = body});
  }
};

const std::string CHAT_BODY =
    R"({"agent_id":"coder","model":"gpt-4o","messages":[{"role":"user","content":"hi"}]})";

} // namespace

void register_gateway_tests(std::vector<switchboard::tests::TestCase> &tests) {
  using switchboard::tests::require;

  tests.push_back({"gateway_health_reports_strategy_and_request_id", [] {
                     GatewayFixture f;
                     const auto response = f.get("/health");
                     require(response.status == 200, "health should be 200");
                     require(contains(response.body, R"("status":"ok")"), "status ok");
                     require(contains(response.body, R"("strategy":"static")"), "strategy");
                     require(contains(response.body, R"("breakers":2)"), "breaker count");
                     require(response.headers.at("X-Request-Id").rfind("req-", 0) == 0,
                             "generated request id");

                     const auto echoed = f.server->dispatch_for_test(gw::HttpRequest{
                         .method = "GET", .path = "/health", .raw_path = "/health",
                         .headers = {{"x-request-id", "abc-123"}}});
                     require(echoed.headers.at("X-Request-Id") == "abc-123",
                             "caller request id echoed");
                   }});

  tests.push_back({"gateway_chat_routes_and_renders_completion", [] {
                     GatewayFixture f;
                     const auto response = f.post("/v1/chat", CHAT_BODY);
                     require(response.status == 200, "chat should succeed: " + response.body);
                     require(contains(response.body, R"("text":"echo: hi")"), "text rendered");
                     require(contains(response.body, R"("backend":"openai")"), "backend rendered");
                     require(contains(response.body,
                                      R"("usage":{"prompt":10,"completion":5,"total":15})"),
                             "usage rendered");
                     require(f.openai->calls() == 1, "backend called once");

                     const auto prompt_only = f.post("/v1/chat", R"({"prompt":"hello"})");
                     require(prompt_only.status == 200, "bare prompt accepted");
                     require(f.ollama->calls() == 1, "no model falls back to the local backend");
                   }});

  tests.push_back({"gateway_chat_rejects_invalid_bodies", [] {
                     GatewayFixture f;
                     const auto not_json = f.post("/v1/chat", "hello");
                     require(not_json.status == 400, "non-object is a bad request");
                     require(contains(not_json.body, R"("kind":"invalid_request")"), "kind");
                     require(contains(not_json.body, "request body must be a JSON object"),
                             "message");

                     const auto bad_role = f.post(
                         "/v1/chat", R"({"messages":[{"role":"robot","content":"x"}]})");
                     require(bad_role.status == 400 &&
                                 contains(bad_role.body, "unknown message role: robot"),
                             "unknown role rejected");

                     const auto empty = f.post("/v1/chat", R"({"messages":[]})");
                     require(empty.status == 400 &&
                                 contains(empty.body, "at least one message is required"),
                             "empty conversation rejected");
                     require(f.openai->calls() == 0 && f.ollama->calls() == 0,
                             "invalid bodies never reach a backend");
                   }});

  tests.push_back({"gateway_chat_enforces_body_limit", [] {
                     auto config = gateway_config();
                     config.gateway.max_body_bytes = 32;
                     GatewayFixture f(config);
                     const auto response = f.post("/v1/chat", CHAT_BODY);
                     require(response.status == 413, "oversized body should be 413");
                     require(response.body == R"({"error":"request_too_large"})", "413 body");
                   }});

  tests.push_back({"gateway_chat_rate_limits_per_agent", [] {
                     auto config = gateway_config();
                     config.rate_limit.max_requests = 1;
                     GatewayFixture f(config);
                     require(f.post("/v1/chat", CHAT_BODY).status == 200, "first admitted");
                     const auto refused = f.post("/v1/chat", CHAT_BODY);
                     require(refused.status == 429, "second refused");
                     require(contains(refused.body, R"("kind":"rate_limited")"), "kind");
                     require(f.post("/v1/chat", R"({"agent_id":"helper","prompt":"x"})").status ==
                                 200,
                             "other agents have their own window");
                   }});

  tests.push_back({"gateway_chat_maps_backend_failures", [] {
                     GatewayFixture f;
                     f.openai->fail_always(BackendErrorCode::RateLimit);
                     const auto response = f.post("/v1/chat", CHAT_BODY);
                     require(response.status == 502, "backend failure is a bad gateway");
                     require(contains(response.body, R"("kind":"backend_error")"), "kind");
                     require(contains(response.body, R"("backend":"openai")"), "backend named");
                     require(contains(response.body, "rate_limit"), "cause rendered");
                   }});

  tests.push_back({"gateway_lists_agents", [] {
                     GatewayFixture f;
                     const auto response = f.get("/v1/agents");
                     require(response.status == 200, "agents ok");
                     require(contains(response.body, R"({"agents":[{"id":"coder","name":"Coder","tier":"cloud")"),
                             "sorted agents rendered");
                     require(contains(response.body, R"("id":"helper")"), "second agent listed");
                   }});

  tests.push_back({"gateway_router_metrics", [] {
                     GatewayFixture f;
                     (void)f.post("/v1/chat", CHAT_BODY);
                     (void)f.post("/v1/chat", CHAT_BODY);
                     const auto response = f.get("/v1/router/metrics");
                     require(response.status == 200, "metrics ok");
                     require(contains(response.body, R"("total_calls":2)"), "total calls");
                     require(contains(response.body, R"("cache_hits":1)"), "cache hit");
                     require(!contains(response.body, "failover_count"),
                             "failover counter only for the failover strategy");

                     auto config = gateway_config();
                     config.routing.strategy = "failover";
                     GatewayFixture failover(config);
                     require(contains(failover.get("/v1/router/metrics").body,
                                      R"("failover_count":0)"),
                             "failover counter exposed");
                   }});

  tests.push_back({"gateway_cost_endpoints", [] {
                     GatewayFixture f;
                     (void)f.post("/v1/chat", CHAT_BODY);
                     const auto status = f.get("/v1/cost/status");
                     require(status.status == 200 && contains(status.body, R"("request_count":1)"),
                             "status reflects the call");
                     require(contains(status.body, R"("token_count":15)"), "tokens tracked");

                     require(contains(f.get("/v1/cost/trends").body, R"("last_hour":)"), "trends");
                     require(contains(f.get("/v1/cost/prediction").body,
                                      R"("will_exceed_budget":false)"),
                             "prediction");
                     require(f.get("/v1/cost/alerts").body == R"({"alerts":[]})",
                             "no budgets, no alerts");

                     require(f.services->analytics->record_snapshot(), "snapshot recorded");
                     const auto history = f.get("/v1/cost/history", {{"since", "0"}});
                     require(history.status == 200 && contains(history.body, R"({"snapshots":[{"timestamp":)"),
                             "history lists snapshots");
                     require(f.get("/v1/cost/history", {{"since", "yesterday"}}).status == 400,
                             "bad since is a bad request");
                     require(f.get("/v1/cost/unknown").status == 404, "unknown section");
                   }});

  tests.push_back({"gateway_cost_alerts_render_budget_breach", [] {
                     auto config = gateway_config();
                     config.cost.daily_budget_usd = 0.000001;
                     GatewayFixture f(config);
                     (void)f.post("/v1/chat", CHAT_BODY);
                     const auto alerts = f.get("/v1/cost/alerts");
                     require(contains(alerts.body, R"("type":"daily_budget_exceeded")"),
                             "exceeded alert rendered");
                     require(contains(alerts.body, R"("level":"critical")"), "critical level");
                   }});

  tests.push_back({"gateway_breakers_list_and_reset", [] {
                     auto config = gateway_config();
                     config.breaker.failure_threshold = 1;
                     GatewayFixture f(config);
                     f.openai->fail_always(BackendErrorCode::Api);
                     (void)f.post("/v1/chat", CHAT_BODY);

                     const auto listed = f.get("/v1/breakers");
                     require(listed.status == 200, "breakers ok");
                     require(contains(listed.body, R"({"backend":"openai","state":"open")"),
                             "tripped breaker listed as open");

                     const auto unknown = f.post("/v1/breakers/bard/reset");
                     require(unknown.status == 404 && contains(unknown.body, "unknown backend"),
                             "unknown breaker is 404");

                     const auto reset = f.post("/v1/breakers/openai/reset");
                     require(reset.status == 200, "reset ok");
                     require(contains(reset.body, R"("state":"closed")"), "reset closes");
                     require(f.services->routing.breaker("openai")->failure_count() == 0,
                             "failure count cleared");
                   }});

  tests.push_back({"gateway_unknown_routes", [] {
                     GatewayFixture f;
                     require(f.get("/v1/nothing").status == 404, "unknown path is 404");
                     require(f.get("/v1/chat/stream").status == 405, "stream needs POST");
                     require(f.get("/v1/chat").status == 404, "chat needs POST");
                   }});

  tests.push_back({"gateway_stream_writes_sse_frames", [] {
                     GatewayFixture f;
                     f.openai->set_stream_script({"Hel", "lo"});
                     std::vector<std::string> writes;
                     const int status = f.server->stream_for_test(
                         gw::HttpRequest{.method = "POST", .path = "/v1/chat/stream",
                                         .raw_path = "/v1/chat/stream", .body = CHAT_BODY},
                         [&](const std::string &bytes) {
                           writes.push_back(bytes);
                           return true;
                         });
                     require(status == 200, "stream completes");
                     require(writes.size() == 5, "head, two content frames, terminal, done");
                     require(contains(writes[0], "HTTP/1.1 200 OK\r\n"), "status line");
                     require(contains(writes[0], "Content-Type: text/event-stream"), "SSE type");
                     require(writes[1].rfind("data: {\"text\":\"Hel\"", 0) == 0, "first frame");
                     require(contains(writes[3], R"("done":true)"), "terminal frame");
                     require(writes[4] == "data: [DONE]\n\n", "done marker");
                   }});

  tests.push_back({"gateway_stream_client_disconnect_is_499", [] {
                     GatewayFixture f;
                     f.openai->set_stream_script({"a", "b", "c"});
                     int writes = 0;
                     const int status = f.server->stream_for_test(
                         gw::HttpRequest{.method = "POST", .path = "/v1/chat/stream",
                                         .raw_path = "/v1/chat/stream", .body = CHAT_BODY},
                         [&](const std::string &) { return ++writes < 2; });
                     require(status == 499, "client gone");
                     require(!f.observer->events<switchboard::observability::ErrorEvent>().empty(),
                             "aborted stream reported");
                   }});

  tests.push_back({"gateway_stream_errors_before_head_are_whole_responses", [] {
                     GatewayFixture f;
                     std::string written;
                     const int status = f.server->stream_for_test(
                         gw::HttpRequest{.method = "POST", .path = "/v1/chat/stream",
                                         .raw_path = "/v1/chat/stream", .body = "[]"},
                         [&](const std::string &bytes) {
                           written += bytes;
                           return true;
                         });
                     require(status == 400, "invalid body");
                     require(contains(written, "HTTP/1.1 400 Bad Request"), "status line");
                     require(contains(written, "Content-Type: application/json"), "json body");
                     require(contains(written, R"("kind":"invalid_request")"), "error rendered");
                   }});

  tests.push_back({"gateway_parse_chat_request_fields", [] {
                     const auto parsed = gw::parse_chat_request(
                         R"({"model":"gpt-4o","temperature":0.2,"max_tokens":128,"messages":[{"role":"system","content":"be terse"},{"role":"user","content":"hi \"there\""}]})");
                     require(parsed.ok(), parsed.ok() ? "" : parsed.error());
                     const auto &request = parsed.value();
                     require(request.agent_id == "default", "agent defaults");
                     require(request.model == std::optional<std::string>("gpt-4o"), "model");
                     require(request.temperature == std::optional<double>(0.2), "temperature");
                     require(request.max_tokens == std::optional<std::uint32_t>(128), "max tokens");
                     require(request.messages.size() == 2 &&
                                 request.messages[0].role ==
                                     switchboard::backends::MessageRole::System,
                             "messages in order");
                     require(request.messages[1].text == "hi \"there\"", "content unescaped");

                     const auto bad_number = gw::parse_chat_request(
                         R"({"prompt":"x","temperature":"warm"})");
                     require(!bad_number.ok() &&
                                 bad_number.error() == "temperature and max_tokens must be numbers",
                             "non-numeric temperature rejected");
                     const auto missing = gw::parse_chat_request(R"({"messages":[{"role":"user"}]})");
                     require(!missing.ok() &&
                                 missing.error() == "each message needs a role and content",
                             "content required");
                   }});

  tests.push_back({"gateway_render_completion_escapes_text", [] {
                     const auto body = gw::render_completion(switchboard::backends::CompletionResponse{
                         .text = "line\n\"quoted\"", .model = "m", .backend = "b",
                         .usage = {.prompt = 1, .completion = 2, .total = 3}});
                     require(body == R"({"text":"line\n\"quoted\"","model":"m","backend":"b","usage":{"prompt":1,"completion":2,"total":3}})",
                             "rendered body: " + body);
                   }});

  tests.push_back({"snapshot_job_records_in_background", [] {
                     GatewayFixture f;
                     switchboard::runtime::SnapshotJob job(f.services->analytics,
                                                           std::chrono::milliseconds(100));
                     require(!job.is_running(), "idle before start");
                     job.start();
                     require(job.is_running(), "running after start");
                     for (int i = 0; i < 50 && f.services->analytics->history_size() == 0; ++i) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(10));
                     }
                     job.stop();
                     require(!job.is_running(), "stopped");
                     require(f.services->analytics->history_size() == 1,
                             "first snapshot recorded; the frozen clock blocks the rest");
                   }});
}
