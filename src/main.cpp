#include "config.hpp"
#include "discovery.hpp"
#include "mcp_error.hpp"
#include "server_spec.hpp"

#include <nlohmann/json.hpp>

#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

mcpdock::CancelToken g_cancel;

static void HandleInterrupt(int) {
  g_cancel.Cancel();
}

static void PrintUsage() {
  std::cerr << "usage:\n"
            << "  mcpdock tools <server.json> [--pull] [--cleanup] [--debug]\n"
            << "  mcpdock prompts <server.json> [--pull] [--cleanup] [--debug]\n"
            << "  mcpdock call <server.json> <tool> [json-arguments] [--pull] [--debug]\n";
}

struct CliArgs {
  std::string command;
  std::vector<std::string> positional;
  bool pull = false;
  bool cleanup = false;
  bool debug = false;
};

static std::optional<CliArgs> ParseArgs(int argc, char** argv) {
  if (argc < 2) return std::nullopt;
  CliArgs out;
  out.command = argv[1];
  for (int i = 2; i < argc; i++) {
    std::string a = argv[i];
    if (a == "--pull") {
      out.pull = true;
    } else if (a == "--cleanup") {
      out.cleanup = true;
    } else if (a == "--debug") {
      out.debug = true;
    } else if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
      std::cerr << "unknown flag: " << a << "\n";
      return std::nullopt;
    } else {
      out.positional.push_back(std::move(a));
    }
  }
  if (out.command == "tools" || out.command == "prompts") {
    if (out.positional.size() != 1) return std::nullopt;
  } else if (out.command == "call") {
    if (out.positional.size() < 2 || out.positional.size() > 3 || out.cleanup) return std::nullopt;
  } else {
    return std::nullopt;
  }
  return out;
}

static int Fail(const mcpdock::McpError& err) {
  std::cerr << "[mcpdock] error: " << mcpdock::FormatError(err) << "\n";
  return 1;
}

}  // namespace

int main(int argc, char** argv) {
  auto args = ParseArgs(argc, argv);
  if (!args) {
    PrintUsage();
    return 2;
  }

  std::cout.setf(std::ios::unitbuf);
  auto cfg = mcpdock::LoadConfigFromEnv();
  if (args->debug) cfg.debug = true;

  std::signal(SIGINT, HandleInterrupt);
  std::signal(SIGTERM, HandleInterrupt);

  if (cfg.debug) {
    std::cerr << "[mcpdock] runtime=" << cfg.runtime_binary << "\n";
    std::cerr << "[mcpdock] engine="
              << (cfg.engine.unix_socket.empty()
                      ? cfg.engine.scheme + "://" + cfg.engine.host + ":" + std::to_string(cfg.engine.port) +
                            cfg.engine.base_path
                      : "unix://" + cfg.engine.unix_socket)
              << "\n";
    std::cerr << "[mcpdock] protocol_version=" << cfg.protocol_version
              << " init_timeout_seconds=" << cfg.init_timeout_seconds
              << " requirement_timeout_seconds=" << cfg.requirement_timeout_seconds << "\n";
  }

  mcpdock::McpError err;
  auto server = mcpdock::LoadServerSpecFile(args->positional[0], &err);
  if (!server) return Fail(err);

  auto opts = mcpdock::DiscoveryOptionsFromConfig(cfg);
  opts.pull = args->pull;
  opts.requirement.pull = args->pull;
  opts.cleanup = args->cleanup;
  opts.cancel = &g_cancel;

  if (args->command == "tools") {
    auto tools = mcpdock::DiscoverTools(*server, opts, &err);
    if (!tools) return Fail(err);
    std::cout << mcpdock::ToJson(*tools).dump(2) << "\n";
    return 0;
  }
  if (args->command == "prompts") {
    auto prompts = mcpdock::DiscoverPrompts(*server, opts, &err);
    if (!prompts) return Fail(err);
    std::cout << mcpdock::ToJson(*prompts).dump(2) << "\n";
    return 0;
  }

  nlohmann::json arguments = nlohmann::json::object();
  if (args->positional.size() == 3) {
    arguments = nlohmann::json::parse(args->positional[2], nullptr, false);
    if (arguments.is_discarded() || !arguments.is_object()) {
      std::cerr << "[mcpdock] tool arguments must be a JSON object\n";
      return 2;
    }
  }
  auto result = mcpdock::CallServerTool(*server, args->positional[1], arguments, opts, &err);
  if (!result) return Fail(err);
  std::cout << result->dump(2) << "\n";
  return 0;
}
