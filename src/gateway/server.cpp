#include "switchboard/gateway/server.hpp"

#include "switchboard/common/cancellation.hpp"
#include "switchboard/common/fs.hpp"
#include "switchboard/common/json_util.hpp"
#include "switchboard/observability/metrics.hpp"
#include "switchboard/routing/failover.hpp"
#include "switchboard/version.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace switchboard::gateway {

namespace {

constexpr int kListenBacklog = 64;
constexpr const char *kStreamPath = "/v1/chat/stream";
constexpr const char *kBreakersPrefix = "/v1/breakers/";

std::string header_lookup(const HttpRequest &request, const std::string &key) {
  const auto it = request.headers.find(common::to_lower(key));
  return it == request.headers.end() ? "" : it->second;
}

std::string json_string(const std::string &value) {
  return "\"" + common::json_escape(value) + "\"";
}

std::string status_text(const int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 429:
    return "Too Many Requests";
  case 499:
    return "Client Closed Request";
  case 500:
    return "Internal Server Error";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  default:
    return "OK";
  }
}

std::unordered_map<std::string, std::string> parse_query_string(const std::string &query) {
  std::unordered_map<std::string, std::string> out;
  std::stringstream stream(query);
  std::string part;
  while (std::getline(stream, part, '&')) {
    if (part.empty()) {
      continue;
    }
    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      out[part] = "";
      continue;
    }
    out[part.substr(0, eq)] = part.substr(eq + 1);
  }
  return out;
}

HttpResponse make_json_response(const int status, const std::string &body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = body;
  return response;
}

HttpResponse make_error_response(const routing::GatewayError &error) {
  std::ostringstream body;
  body << "{\"error\":{\"kind\":" << json_string(std::string(routing::kind_name(error.kind)))
       << ",\"message\":" << json_string(error.message);
  if (!error.backend.empty()) {
    body << ",\"backend\":" << json_string(error.backend);
  }
  if (error.cause.has_value()) {
    body << ",\"cause\":" << json_string(error.cause->to_string());
  }
  body << "}}";
  return make_json_response(error.http_status(), body.str());
}

HttpResponse invalid_request(const std::string &message) {
  return make_error_response(
      routing::GatewayError{.kind = routing::GatewayErrorKind::InvalidRequest, .message = message});
}

std::string render_http_head(const int status, const std::string &content_type,
                             const std::unordered_map<std::string, std::string> &headers,
                             const std::optional<std::size_t> content_length) {
  std::ostringstream out;
  out << "HTTP/1.1 " << status << " " << status_text(status) << "\r\n";
  out << "Content-Type: " << content_type << "\r\n";
  if (content_length.has_value()) {
    out << "Content-Length: " << *content_length << "\r\n";
  }
  out << "Connection: close\r\n";
  for (const auto &[k, v] : headers) {
    out << k << ": " << v << "\r\n";
  }
  out << "\r\n";
  return out.str();
}

std::string render_http_response(const HttpResponse &response) {
  return render_http_head(response.status, response.content_type, response.headers,
                          response.body.size()) +
         response.body;
}

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return common::Result<HttpRequest>::failure("incomplete request");
  }

  std::istringstream head_stream(raw.substr(0, header_end));
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure("missing request line");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream req_line(line);
  HttpRequest request;
  std::string http_version;
  if (!(req_line >> request.method >> request.raw_path >> http_version)) {
    return common::Result<HttpRequest>::failure("invalid request line");
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const auto colon = line.find(':');
    if (line.empty() || colon == std::string::npos) {
      continue;
    }
    request.headers[common::to_lower(common::trim(line.substr(0, colon)))] =
        common::trim(line.substr(colon + 1));
  }

  request.body = raw.substr(header_end + 4);
  const auto qpos = request.raw_path.find('?');
  if (qpos == std::string::npos) {
    request.path = request.raw_path;
  } else {
    request.path = request.raw_path.substr(0, qpos);
    request.query = parse_query_string(request.raw_path.substr(qpos + 1));
  }
  return common::Result<HttpRequest>::success(std::move(request));
}

std::string render_chunk(const backends::CompletionChunk &chunk) {
  std::ostringstream out;
  out << "{\"text\":" << json_string(chunk.text) << ",\"model\":" << json_string(chunk.model)
      << ",\"backend\":" << json_string(chunk.backend)
      << ",\"done\":" << (chunk.done ? "true" : "false");
  if (chunk.error.has_value()) {
    out << ",\"error\":" << json_string(*chunk.error);
  }
  out << "}";
  return out.str();
}

std::string render_status(const cost::CostStatus &s) {
  std::ostringstream out;
  out << "{\"daily\":{\"spend\":" << common::json_number(s.daily_spend)
      << ",\"budget\":" << common::json_number(s.daily_budget)
      << ",\"remaining\":" << common::json_number(s.daily_remaining)
      << ",\"percent\":" << common::json_number(s.daily_percent, 2) << "},";
  out << "\"monthly\":{\"spend\":" << common::json_number(s.monthly_spend)
      << ",\"budget\":" << common::json_number(s.monthly_budget)
      << ",\"remaining\":" << common::json_number(s.monthly_remaining)
      << ",\"percent\":" << common::json_number(s.monthly_percent, 2) << "},";
  out << "\"total_spend\":" << common::json_number(s.total_spend)
      << ",\"request_count\":" << s.request_count << ",\"token_count\":" << s.token_count << "}";
  return out.str();
}

std::string render_trend(const cost::TrendMetrics &t) {
  std::ostringstream out;
  out << "{\"spend_change\":" << common::json_number(t.spend_change)
      << ",\"request_change\":" << t.request_change << ",\"token_change\":" << t.token_change
      << ",\"duration_hours\":" << common::json_number(t.duration_hours, 3)
      << ",\"avg_spend_per_hour\":" << common::json_number(t.avg_spend_per_hour)
      << ",\"avg_requests_per_hour\":" << common::json_number(t.avg_requests_per_hour, 3)
      << ",\"avg_tokens_per_hour\":" << common::json_number(t.avg_tokens_per_hour, 3)
      << ",\"snapshot_count\":" << t.snapshot_count << "}";
  return out.str();
}

std::string render_prediction(const cost::CostPrediction &p) {
  std::ostringstream out;
  out << "{\"predicted_monthly_total\":" << common::json_number(p.predicted_monthly_total)
      << ",\"current_monthly_spend\":" << common::json_number(p.current_monthly_spend)
      << ",\"days_elapsed\":" << common::json_number(p.days_elapsed, 3)
      << ",\"days_remaining\":" << common::json_number(p.days_remaining, 3)
      << ",\"daily_average\":" << common::json_number(p.daily_average)
      << ",\"confidence\":" << common::json_number(p.confidence, 3)
      << ",\"will_exceed_budget\":" << (p.will_exceed_budget ? "true" : "false")
      << ",\"percent_of_budget\":" << common::json_number(p.percent_of_budget, 2)
      << ",\"monthly_budget\":" << common::json_number(p.monthly_budget) << "}";
  return out.str();
}

std::string render_alert(const cost::CostAlert &a) {
  std::ostringstream out;
  out << "{\"level\":" << json_string(std::string(cost::alert_level_name(a.level)))
      << ",\"type\":" << json_string(a.type) << ",\"message\":" << json_string(a.message)
      << ",\"percent\":" << common::json_number(a.percent, 2)
      << ",\"spend\":" << common::json_number(a.spend)
      << ",\"budget\":" << common::json_number(a.budget)
      << ",\"threshold\":" << common::json_number(a.threshold, 2) << "}";
  return out.str();
}

std::string render_breaker(const resilience::BreakerStatus &status) {
  std::ostringstream out;
  out << "{\"backend\":" << json_string(status.backend)
      << ",\"state\":" << json_string(std::string(resilience::state_name(status.state)))
      << ",\"failure_count\":" << status.failure_count
      << ",\"success_streak\":" << status.success_streak << "}";
  return out.str();
}

template <typename T, typename Render>
std::string render_array(const std::vector<T> &items, Render render) {
  std::string out = "[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += ',';
    }
    out += render(items[i]);
  }
  out += ']';
  return out;
}

} // namespace

common::Result<backends::CompletionRequest> parse_chat_request(const std::string &body) {
  using R = common::Result<backends::CompletionRequest>;
  const std::string trimmed = common::trim(body);
  if (trimmed.size() < 2 || trimmed.front() != '{' || trimmed.back() != '}') {
    return R::failure("request body must be a JSON object");
  }

  const auto fields = common::json_parse_flat(trimmed);
  backends::CompletionRequest request;

  const auto agent_it = fields.find("agent_id");
  request.agent_id = agent_it == fields.end() ? "default" : common::trim(agent_it->second);
  if (request.agent_id.empty()) {
    request.agent_id = "default";
  }

  if (const auto it = fields.find("model"); it != fields.end() && !it->second.empty() &&
                                            it->second != "null") {
    request.model = it->second;
  }
  try {
    if (const auto it = fields.find("temperature"); it != fields.end() && it->second != "null") {
      request.temperature = std::stod(it->second);
    }
    if (const auto it = fields.find("max_tokens"); it != fields.end() && it->second != "null") {
      request.max_tokens = static_cast<std::uint32_t>(std::stoul(it->second));
    }
  } catch (const std::exception &) {
    return R::failure("temperature and max_tokens must be numbers");
  }

  if (const auto it = fields.find("messages"); it != fields.end()) {
    for (const auto &raw : common::json_split_top_level_objects(it->second)) {
      const auto message = common::json_parse_flat(raw);
      const auto role_it = message.find("role");
      const auto content_it = message.find("content");
      if (role_it == message.end() || content_it == message.end()) {
        return R::failure("each message needs a role and content");
      }
      const auto role = backends::parse_role(role_it->second);
      if (!role.has_value()) {
        return R::failure("unknown message role: " + role_it->second);
      }
      request.messages.push_back({.role = *role, .text = content_it->second});
    }
  } else if (const auto prompt = fields.find("prompt"); prompt != fields.end()) {
    request.messages.push_back({.role = backends::MessageRole::User, .text = prompt->second});
  }

  if (request.messages.empty()) {
    return R::failure("at least one message is required");
  }
  return R::success(std::move(request));
}

std::string render_completion(const backends::CompletionResponse &response) {
  std::ostringstream out;
  out << "{\"text\":" << json_string(response.text) << ",\"model\":" << json_string(response.model)
      << ",\"backend\":" << json_string(response.backend) << ",\"usage\":{\"prompt\":"
      << response.usage.prompt << ",\"completion\":" << response.usage.completion
      << ",\"total\":" << response.usage.total << "}}";
  return out.str();
}

GatewayServer::GatewayServer(const config::Config &config,
                             std::shared_ptr<runtime::Services> services)
    : config_(config), services_(std::move(services)) {}

GatewayServer::~GatewayServer() { stop(); }

common::Status GatewayServer::start(const GatewayOptions &options) {
  if (running_) {
    return common::Status::error("gateway already running");
  }

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create listen socket");
  }

  int reuse = 1;
  setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  if (inet_pton(AF_INET, options.host.c_str(), &addr.sin_addr) != 1) {
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("invalid bind host");
  }

  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("bind failed: " + msg);
  }

  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string msg = std::strerror(errno);
    close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("listen failed: " + msg);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options.port;
  }

  running_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  return common::Status::success();
}

void GatewayServer::stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    for (const int fd : client_fds_) {
      shutdown(fd, SHUT_RDWR);
    }
  }
  while (active_clients_.load() > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

std::uint16_t GatewayServer::port() const { return bound_port_; }

bool GatewayServer::is_running() const { return running_.load(); }

std::string GatewayServer::next_request_id() {
  const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
  return "req-" + std::to_string(now) + "-" + std::to_string(++request_seq_);
}

HttpResponse GatewayServer::dispatch_for_test(const HttpRequest &request) {
  std::string request_id = header_lookup(request, "x-request-id");
  if (request_id.empty()) {
    request_id = next_request_id();
  }

  HttpResponse response;
  if (request.method == "GET" && request.path == "/health") {
    response = handle_health(request);
  } else if (request.method == "POST" && request.path == "/v1/chat") {
    response = handle_chat(request);
  } else if (request.method == "GET" && request.path == "/v1/agents") {
    response = handle_agents(request);
  } else if (request.method == "GET" && request.path == "/v1/router/metrics") {
    response = handle_router_metrics(request);
  } else if (request.method == "GET" && common::starts_with(request.path, "/v1/cost/")) {
    response = handle_cost(request);
  } else if (request.method == "GET" && request.path == "/v1/breakers") {
    response = handle_breakers(request);
  } else if (request.method == "POST" && common::starts_with(request.path, kBreakersPrefix)) {
    response = handle_breaker_reset(request);
  } else if (request.path == kStreamPath) {
    response = make_json_response(405, R"({"error":"use POST with a streaming client"})");
  } else {
    response = make_json_response(404, R"({"error":"not found"})");
  }
  response.headers["X-Request-Id"] = request_id;
  return response;
}

HttpResponse GatewayServer::handle_health(const HttpRequest &) const {
  std::ostringstream body;
  body << "{\"status\":\"ok\",\"version\":" << json_string(SWITCHBOARD_VERSION)
       << ",\"strategy\":" << json_string(std::string(services_->routing.router->strategy()))
       << ",\"breakers\":" << services_->routing.breakers.size() << "}";
  return make_json_response(200, body.str());
}

HttpResponse GatewayServer::handle_chat(const HttpRequest &request) {
  if (request.body.size() > config_.gateway.max_body_bytes) {
    return make_json_response(413, R"({"error":"request_too_large"})");
  }
  auto parsed = parse_chat_request(request.body);
  if (!parsed.ok()) {
    return invalid_request(parsed.error());
  }
  const auto &chat = parsed.value();
  if (!services_->registry->allow(chat.agent_id)) {
    return make_error_response(routing::GatewayError{.kind = routing::GatewayErrorKind::RateLimited,
                                                     .message = "rate limit exceeded for agent '" +
                                                                chat.agent_id + "'"});
  }

  auto result = services_->routing.router->complete(chat);
  if (!result.ok()) {
    return make_error_response(result.error());
  }
  return make_json_response(200, render_completion(result.value()));
}

int GatewayServer::stream_for_test(const HttpRequest &request, const StreamWriter &writer) {
  const auto send_whole = [&](const HttpResponse &response) {
    (void)writer(render_http_response(response));
    return response.status;
  };

  if (request.body.size() > config_.gateway.max_body_bytes) {
    return send_whole(make_json_response(413, R"({"error":"request_too_large"})"));
  }
  auto parsed = parse_chat_request(request.body);
  if (!parsed.ok()) {
    return send_whole(invalid_request(parsed.error()));
  }
  const auto &chat = parsed.value();
  if (!services_->registry->allow(chat.agent_id)) {
    return send_whole(make_error_response(
        routing::GatewayError{.kind = routing::GatewayErrorKind::RateLimited,
                              .message = "rate limit exceeded for agent '" + chat.agent_id + "'"}));
  }

  std::string request_id = header_lookup(request, "x-request-id");
  if (request_id.empty()) {
    request_id = next_request_id();
  }
  if (!writer(render_http_head(200, "text/event-stream",
                              {{"Cache-Control", "no-cache"}, {"X-Request-Id", request_id}},
                              std::nullopt))) {
    return 499;
  }

  common::CancellationToken token;
  const auto result = services_->routing.router->stream(
      token, chat, [&](const backends::CompletionChunk &chunk) {
        if (!writer("data: " + render_chunk(chunk) + "\n\n")) {
          token.cancel();
          return common::Status::error("client disconnected");
        }
        return common::Status::success();
      });
  if (!result.ok()) {
    observability::record_error(*services_->observer, "gateway", result.error().to_string());
  }
  if (token.is_canceled()) {
    return 499;
  }
  (void)writer("data: [DONE]\n\n");
  return 200;
}

HttpResponse GatewayServer::handle_agents(const HttpRequest &) const {
  std::ostringstream body;
  body << "{\"agents\":[";
  const auto ids = services_->registry->list();
  for (std::size_t i = 0; i < ids.size(); ++i) {
    const auto agent = services_->registry->get(ids[i]);
    if (i > 0) {
      body << ',';
    }
    body << "{\"id\":" << json_string(agent.id) << ",\"name\":" << json_string(agent.name)
         << ",\"tier\":" << json_string(std::string(agents::tier_name(agent.tier)))
         << ",\"default_model\":" << json_string(agent.default_model)
         << ",\"max_tokens\":" << agent.max_tokens
         << ",\"temperature\":" << common::json_number(agent.temperature, 2)
         << ",\"complexity_threshold\":" << common::json_number(agent.complexity_threshold, 2)
         << ",\"latency_budget_ms\":" << agent.latency_budget_ms << "}";
  }
  body << "]}";
  return make_json_response(200, body.str());
}

HttpResponse GatewayServer::handle_router_metrics(const HttpRequest &) const {
  const auto &router = services_->routing.router;
  const auto m = router->metrics();
  std::ostringstream body;
  body << "{\"strategy\":" << json_string(std::string(router->strategy()))
       << ",\"total_calls\":" << m.total_calls << ",\"cache_hits\":" << m.cache_hits
       << ",\"local_hits\":" << m.local_hits << ",\"cloud_hits\":" << m.cloud_hits
       << ",\"errors\":" << m.errors << ",\"deprecated_routes\":" << m.deprecated_routes;
  if (const auto failover = std::dynamic_pointer_cast<routing::FailoverOrchestrator>(router)) {
    body << ",\"failover_count\":" << failover->failover_count();
  }
  body << "}";
  return make_json_response(200, body.str());
}

HttpResponse GatewayServer::handle_cost(const HttpRequest &request) const {
  const std::string section = request.path.substr(std::string("/v1/cost/").size());
  auto &analytics = *services_->analytics;

  if (section == "status") {
    return make_json_response(200, render_status(services_->ledger->status()));
  }
  if (section == "trends") {
    const auto trends = analytics.trends();
    return make_json_response(200, "{\"last_hour\":" + render_trend(trends.last_hour) +
                                       ",\"last_day\":" + render_trend(trends.last_day) +
                                       ",\"last_week\":" + render_trend(trends.last_week) + "}");
  }
  if (section == "prediction") {
    return make_json_response(200, render_prediction(analytics.predict_monthly_cost()));
  }
  if (section == "alerts") {
    return make_json_response(200, "{\"alerts\":" + render_array(analytics.alerts(), render_alert) +
                                       "}");
  }
  if (section == "history") {
    std::int64_t since = 0;
    if (const auto it = request.query.find("since"); it != request.query.end()) {
      try {
        since = std::stoll(it->second);
      } catch (const std::exception &) {
        return invalid_request("since must be a unix timestamp");
      }
    }
    const auto snapshots = analytics.historical_data(common::from_unix_seconds(since));
    const auto render_snapshot = [](const cost::CostSnapshot &s) {
      std::ostringstream out;
      out << "{\"timestamp\":" << common::to_unix_seconds(s.timestamp)
          << ",\"daily_spend\":" << common::json_number(s.daily_spend)
          << ",\"monthly_spend\":" << common::json_number(s.monthly_spend)
          << ",\"total_spend\":" << common::json_number(s.total_spend)
          << ",\"request_count\":" << s.request_count << ",\"token_count\":" << s.token_count
          << "}";
      return out.str();
    };
    return make_json_response(200, "{\"snapshots\":" + render_array(snapshots, render_snapshot) +
                                       "}");
  }
  return make_json_response(404, R"({"error":"not found"})");
}

HttpResponse GatewayServer::handle_breakers(const HttpRequest &) const {
  std::vector<resilience::BreakerStatus> states;
  for (const auto &breaker : services_->routing.breakers) {
    states.push_back(breaker->status());
  }
  return make_json_response(200, "{\"breakers\":" + render_array(states, render_breaker) + "}");
}

HttpResponse GatewayServer::handle_breaker_reset(const HttpRequest &request) {
  std::string rest = request.path.substr(std::string(kBreakersPrefix).size());
  const std::string suffix = "/reset";
  if (rest.size() <= suffix.size() || rest.compare(rest.size() - suffix.size(), suffix.size(),
                                                   suffix) != 0) {
    return make_json_response(404, R"({"error":"not found"})");
  }
  const std::string id = rest.substr(0, rest.size() - suffix.size());
  const auto breaker = services_->routing.breaker(id);
  if (!breaker) {
    return make_json_response(404, "{\"error\":\"unknown backend\",\"backend\":" +
                                       json_string(id) + "}");
  }
  breaker->reset();
  return make_json_response(200, render_breaker(breaker->status()));
}

void GatewayServer::accept_loop() {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client < 0) {
      if (!running_) {
        break;
      }
      continue;
    }
    // One worker per connection; the shared components do their own locking.
    ++active_clients_;
    {
      std::lock_guard<std::mutex> lock(clients_mutex_);
      client_fds_.insert(client);
    }
    std::thread([this, client]() {
      handle_client(client);
      {
        // Deregister before close so stop() never shuts down a recycled descriptor.
        std::lock_guard<std::mutex> lock(clients_mutex_);
        client_fds_.erase(client);
      }
      close(client);
      --active_clients_;
    }).detach();
  }
}

void GatewayServer::handle_client(const int client_fd) {
  const std::size_t max_body = config_.gateway.max_body_bytes;
  std::string raw;
  raw.reserve(4096);
  std::array<char, 4096> buf{};

  const auto send_all = [client_fd](const std::string &text) {
    std::size_t sent = 0;
    while (sent < text.size()) {
      const ssize_t n = send(client_fd, text.data() + sent, text.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) {
        return false;
      }
      sent += static_cast<std::size_t>(n);
    }
    return true;
  };

  std::size_t content_length = 0;
  bool header_parsed = false;
  while (raw.size() < (max_body + 8192)) {
    const ssize_t n = recv(client_fd, buf.data(), buf.size(), 0);
    if (n <= 0) {
      break;
    }
    raw.append(buf.data(), static_cast<std::size_t>(n));

    const auto header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
      continue;
    }
    if (!header_parsed) {
      header_parsed = true;
      auto parsed = parse_http_request(raw.substr(0, header_end + 4));
      if (parsed.ok()) {
        const std::string cl = header_lookup(parsed.value(), "content-length");
        if (!cl.empty()) {
          try {
            content_length = static_cast<std::size_t>(std::stoull(cl));
          } catch (const std::exception &) {
            content_length = 0;
          }
        }
      }
      if (content_length > max_body) {
        (void)send_all(
            render_http_response(make_json_response(413, R"({"error":"request_too_large"})")));
        return;
      }
    }
    if (raw.size() >= header_end + 4 + content_length) {
      break;
    }
  }

  auto parsed = parse_http_request(raw);
  if (!parsed.ok()) {
    (void)send_all(
        render_http_response(make_json_response(400, R"({"error":"invalid_request"})")));
    return;
  }
  if (parsed.value().method == "POST" && parsed.value().path == kStreamPath) {
    (void)stream_for_test(parsed.value(), send_all);
    return;
  }
  (void)send_all(render_http_response(dispatch_for_test(parsed.value())));
}

} // namespace switchboard::gateway
