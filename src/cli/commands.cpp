#include "switchboard/cli/commands.hpp"

#include "switchboard/common/fs.hpp"
#include "switchboard/config/config.hpp"
#include "switchboard/cost/tracker.hpp"
#include "switchboard/gateway/server.hpp"
#include "switchboard/runtime/app.hpp"
#include "switchboard/runtime/snapshot_job.hpp"
#include "switchboard/version.hpp"

#include <chrono>
#include <cstdio>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace switchboard::cli {

namespace {

std::string version_string() {
  std::string version = SWITCHBOARD_VERSION;
#ifdef SWITCHBOARD_GIT_COMMIT
  const std::string commit = SWITCHBOARD_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "switchboard " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::optional<std::uint64_t> parse_count(const std::string &raw) {
  if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return static_cast<std::uint64_t>(std::stoull(raw));
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

int run_serve(std::vector<std::string> args) {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  const auto &cfg = context.value().config();

  gateway::GatewayOptions options;
  std::string host;
  std::string port_raw;
  std::string duration_raw;
  const bool once = take_flag(args, "--once");
  (void)take_option(args, "--host", "", host);
  (void)take_option(args, "--port", "-p", port_raw);
  (void)take_option(args, "--duration-secs", "", duration_raw);
  options.host = host.empty() ? cfg.gateway.host : host;
  if (!port_raw.empty()) {
    const auto port = parse_count(port_raw);
    if (!port.has_value() || *port > 65535) {
      std::cerr << "invalid port: " << port_raw << "\n";
      return 1;
    }
    options.port = static_cast<std::uint16_t>(*port);
  } else {
    options.port = cfg.gateway.port;
  }

  auto services = context.value().create_services();
  if (!services.ok()) {
    std::cerr << services.error() << "\n";
    return 1;
  }

  gateway::GatewayServer server(cfg, services.value());
  auto status = server.start(options);
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }

  runtime::SnapshotJob snapshots(services.value()->analytics,
                                 std::chrono::seconds(cfg.cost.snapshot_interval_secs));
  snapshots.start();

  std::cout << "Gateway listening on " << options.host << ":" << server.port() << " (strategy "
            << services.value()->routing.router->strategy() << ")\n";

  if (once) {
    snapshots.stop();
    server.stop();
    return 0;
  }

  if (const auto duration = parse_count(duration_raw); duration.has_value() && *duration > 0) {
    std::this_thread::sleep_for(std::chrono::seconds(*duration));
  } else {
    std::cout << "Press Enter to stop gateway...\n";
    std::string line;
    std::getline(std::cin, line);
  }
  snapshots.stop();
  server.stop();
  return 0;
}

int run_route(std::vector<std::string> args) {
  std::string model;
  (void)take_option(args, "--model", "-m", model);
  const bool stream = take_flag(args, "--stream");
  if (args.size() < 2) {
    std::cerr << "usage: switchboard route <agent> <prompt...> [--model M] [--stream]\n";
    return 1;
  }

  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto services = context.value().create_services();
  if (!services.ok()) {
    std::cerr << services.error() << "\n";
    return 1;
  }

  backends::CompletionRequest request;
  request.agent_id = args[0];
  request.messages.push_back({.role = backends::MessageRole::User, .text = join_tokens(args, 1)});
  if (!model.empty()) {
    request.model = model;
  }

  auto &router = *services.value()->routing.router;
  if (stream) {
    common::CancellationToken token;
    const auto result = router.stream(token, request, [](const backends::CompletionChunk &chunk) {
      if (!chunk.done) {
        std::cout << chunk.text << std::flush;
      }
      return common::Status::success();
    });
    std::cout << "\n";
    if (!result.ok()) {
      std::cerr << result.error().to_string() << "\n";
      return 1;
    }
    return 0;
  }

  const auto result = router.complete(request);
  if (!result.ok()) {
    std::cerr << result.error().to_string() << "\n";
    return 1;
  }
  const auto &response = result.value();
  std::cout << response.text << "\n";
  std::cerr << "[" << response.backend << " " << response.model << " tokens "
            << response.usage.prompt << "+" << response.usage.completion << "]\n";
  return 0;
}

int run_cost(std::vector<std::string> args) {
  if (args.empty() || args[0] != "price" || args.size() != 4) {
    std::cerr << "usage: switchboard cost price <model> <prompt_tokens> <completion_tokens>\n";
    return 1;
  }
  const auto prompt = parse_count(args[2]);
  const auto completion = parse_count(args[3]);
  if (!prompt.has_value() || !completion.has_value()) {
    std::cerr << "token counts must be non-negative integers\n";
    return 1;
  }

  const auto table = cost::PriceTable::defaults();
  const auto price = table.lookup(args[1]);
  char line[128];
  std::snprintf(line, sizeof(line), "$%.6f", table.cost(args[1], *prompt, *completion));
  std::cout << args[1] << ": " << line << " (input $" << price.input_per_million
            << "/1M, output $" << price.output_per_million << "/1M)\n";
  return 0;
}

int run_config(std::vector<std::string> args) {
  if (args.empty() || args[0] == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  if (args[0] == "validate") {
    auto cfg = config::load_config();
    if (!cfg.ok()) {
      std::cerr << cfg.error() << "\n";
      return 1;
    }
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << "invalid: " << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "ok (strategy " << cfg.value().routing.strategy << ", "
              << cfg.value().agents.size() << " agents)\n";
    return 0;
  }

  std::cerr << "unknown config command\n";
  return 1;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: switchboard [--config PATH] <command> [options]\n\n";
  std::cout << "  serve [--host H] [--port P]      Start the HTTP gateway\n";
  std::cout << "  route <agent> <prompt...>        One-shot completion [--model M] [--stream]\n";
  std::cout << "  cost price <model> <in> <out>    Price a call from token counts\n";
  std::cout << "  config validate | path           Check or locate the configuration\n";
  std::cout << "  version                          Show version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "route") {
    return run_route(std::move(args));
  }
  if (subcommand == "cost") {
    return run_cost(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace switchboard::cli
