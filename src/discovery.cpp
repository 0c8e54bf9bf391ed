#include "discovery.hpp"

#include <iostream>
#include <memory>
#include <utility>

namespace mcpdock {
namespace {

// Requirement, session start and handshake. On success the caller owns both
// the session and the (possibly null) sidecar handle.
static std::unique_ptr<McpSession> Open(const ServerSpec& server,
                                        const DiscoveryOptions& opts,
                                        std::unique_ptr<RequirementHandle>* sidecar,
                                        McpError* err) {
  std::vector<std::string> extra_args;
  std::vector<std::pair<std::string, std::string>> extra_env;
  if (!server.requirement.empty()) {
    *sidecar = SatisfyRequirement(server.requirement, opts.requirement, opts.cancel, err);
    if (!*sidecar) return nullptr;
    extra_args = (*sidecar)->NetworkArgs();
    extra_env = (*sidecar)->Env();
  }

  LaunchSpec launch = LaunchSpecFromServer(server, std::move(extra_args), extra_env);
  launch.pull = opts.pull;
  SessionOptions session_opts = opts.session;
  session_opts.cancel = opts.cancel;
  auto session = std::make_unique<McpSession>(std::move(launch), std::move(session_opts));
  if (!session->Start(err)) return nullptr;
  if (!session->Initialize(opts.protocol_version, opts.client, nlohmann::json::object(), err)) {
    McpError close_err;
    if (!session->Close(false, &close_err)) {
      std::cerr << "[mcpdock] close after failed handshake: " << FormatError(close_err) << "\n";
    }
    return nullptr;
  }
  return session;
}

// Closes the session; a close failure only surfaces when nothing failed earlier.
static bool Finish(McpSession* session, bool cleanup, bool ok, McpError* err) {
  McpError close_err;
  if (session->Close(cleanup, &close_err)) return ok;
  if (!ok) {
    std::cerr << "[mcpdock] close: " << FormatError(close_err) << "\n";
    return false;
  }
  if (err) *err = close_err;
  return false;
}

template <typename List>
static std::optional<nlohmann::json> ListFrom(const ServerSpec& server,
                                              const DiscoveryOptions& opts,
                                              List list,
                                              McpError* err) {
  std::unique_ptr<RequirementHandle> sidecar;
  auto session = Open(server, opts, &sidecar, err);
  if (!session) return std::nullopt;

  CallOptions call;
  call.cancel = opts.cancel;
  auto raw = list(session.get(), call, err);
  if (!Finish(session.get(), opts.cleanup, raw.has_value(), err)) return std::nullopt;
  return raw;
}

}  // namespace

DiscoveryOptions DiscoveryOptionsFromConfig(const DockConfig& cfg) {
  DiscoveryOptions opts;
  opts.session = SessionOptionsFromConfig(cfg);
  opts.requirement = RequirementOptionsFromConfig(cfg);
  opts.protocol_version = cfg.protocol_version;
  opts.client.name = cfg.client_name;
  opts.client.version = cfg.client_version;
  return opts;
}

std::optional<std::vector<Tool>> DiscoverTools(const ServerSpec& server, const DiscoveryOptions& opts, McpError* err) {
  auto raw = ListFrom(
      server, opts, [](McpSession* s, const CallOptions& call, McpError* e) { return s->ListTools(call, e); }, err);
  if (!raw) return std::nullopt;
  auto tools = NormalizeTools(*raw);
  std::cerr << "[mcpdock] " << server.image << ": " << tools.size() << " tools\n";
  return tools;
}

std::optional<std::vector<Prompt>> DiscoverPrompts(const ServerSpec& server,
                                                   const DiscoveryOptions& opts,
                                                   McpError* err) {
  auto raw = ListFrom(
      server, opts, [](McpSession* s, const CallOptions& call, McpError* e) { return s->ListPrompts(call, e); }, err);
  if (!raw) return std::nullopt;
  auto prompts = NormalizePrompts(*raw);
  std::cerr << "[mcpdock] " << server.image << ": " << prompts.size() << " prompts\n";
  return prompts;
}

std::optional<nlohmann::json> CallServerTool(const ServerSpec& server,
                                             const std::string& tool,
                                             const nlohmann::json& arguments,
                                             const DiscoveryOptions& opts,
                                             McpError* err) {
  std::unique_ptr<RequirementHandle> sidecar;
  auto session = Open(server, opts, &sidecar, err);
  if (!session) return std::nullopt;

  CallOptions call;
  call.cancel = opts.cancel;
  auto result = session->CallTool(tool, arguments, call, err);
  if (!Finish(session.get(), false, result.has_value(), err)) return std::nullopt;
  return result;
}

}  // namespace mcpdock
