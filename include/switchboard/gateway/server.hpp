#pragma once

#include "switchboard/backends/traits.hpp"
#include "switchboard/common/result.hpp"
#include "switchboard/config/schema.hpp"
#include "switchboard/runtime/app.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace switchboard::gateway {

struct GatewayOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8080;
};

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  std::unordered_map<std::string, std::string> headers;
  std::unordered_map<std::string, std::string> query;
  std::string body;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

/// Decodes a chat body: {"agent_id", "model"?, "temperature"?, "max_tokens"?,
/// "messages": [{"role", "content"}]} or a bare "prompt" string.
[[nodiscard]] common::Result<backends::CompletionRequest> parse_chat_request(const std::string &body);

[[nodiscard]] std::string render_completion(const backends::CompletionResponse &response);

/// Writes raw bytes to the client. Returns false once the client is gone.
using StreamWriter = std::function<bool(const std::string &)>;

class GatewayServer {
public:
  GatewayServer(const config::Config &config, std::shared_ptr<runtime::Services> services);
  ~GatewayServer();

  [[nodiscard]] common::Status start(const GatewayOptions &options);
  void stop();

  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] bool is_running() const;

  [[nodiscard]] HttpResponse dispatch_for_test(const HttpRequest &request);
  /// Serves POST /v1/chat/stream as server-sent events. Returns the HTTP status sent.
  int stream_for_test(const HttpRequest &request, const StreamWriter &writer);

private:
  [[nodiscard]] HttpResponse handle_health(const HttpRequest &request) const;
  [[nodiscard]] HttpResponse handle_chat(const HttpRequest &request);
  [[nodiscard]] HttpResponse handle_agents(const HttpRequest &request) const;
  [[nodiscard]] HttpResponse handle_router_metrics(const HttpRequest &request) const;
  [[nodiscard]] HttpResponse handle_cost(const HttpRequest &request) const;
  [[nodiscard]] HttpResponse handle_breakers(const HttpRequest &request) const;
  [[nodiscard]] HttpResponse handle_breaker_reset(const HttpRequest &request);

  [[nodiscard]] std::string next_request_id();

  void accept_loop();
  void handle_client(int client_fd);

  const config::Config &config_;
  std::shared_ptr<runtime::Services> services_;

  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;
  std::atomic<std::uint64_t> request_seq_{0};
  std::atomic<int> active_clients_{0};
  /// Open client sockets; stop() shuts them down so idle workers leave recv().
  std::mutex clients_mutex_;
  std::unordered_set<int> client_fds_;
};

} // namespace switchboard::gateway
