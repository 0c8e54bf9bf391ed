#include "session.hpp"

#include "image_client.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace mcpdock {
namespace {

constexpr int kMaxListPages = 64;

static std::string GetString(const nlohmann::json& obj, const char* key) {
  if (obj.is_object() && obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
  return {};
}

static InitializeResult ParseInitializeResult(const nlohmann::json& r) {
  InitializeResult out;
  out.protocol_version = GetString(r, "protocolVersion");
  out.instructions = GetString(r, "instructions");
  if (r.contains("serverInfo") && r["serverInfo"].is_object()) {
    out.server_name = GetString(r["serverInfo"], "name");
    out.server_version = GetString(r["serverInfo"], "version");
  }
  if (r.contains("capabilities") && r["capabilities"].is_object()) out.capabilities = r["capabilities"];
  return out;
}

static void Prefix(McpError* err, const std::string& context) {
  if (err) err->message = context + ": " + err->message;
}

}  // namespace

SessionOptions SessionOptionsFromConfig(const DockConfig& cfg) {
  SessionOptions opts;
  opts.runtime_binary = cfg.runtime_binary;
  opts.engine = cfg.engine;
  opts.debug = cfg.debug;
  opts.init_timeout = std::chrono::seconds(cfg.init_timeout_seconds);
  return opts;
}

McpSession::McpSession(LaunchSpec spec, SessionOptions opts) : spec_(std::move(spec)), opts_(std::move(opts)) {}

McpSession::~McpSession() {
  if (auto t = Transport()) t->Close();
}

std::shared_ptr<StdioTransport> McpSession::Transport() const {
  std::lock_guard<std::mutex> lock(mu_);
  return transport_;
}

bool McpSession::Start(McpError* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (transport_) {
    SetError(err, ErrorCode::kAlreadyStarted, "already started " + spec_.image);
    return false;
  }

  if (spec_.pull) {
    ImageClient images(opts_.engine);
    std::string pull_err;
    if (!images.Pull(spec_.image, &pull_err)) {
      SetError(err, ErrorCode::kProcess, pull_err);
      return false;
    }
  }

  auto plan = BuildLaunchPlan(spec_, opts_.runtime_binary);
  TransportOptions topts;
  topts.debug = opts_.debug;
  auto transport = StdioTransport::Start(plan, topts, err);
  if (!transport) {
    Prefix(err, "starting " + spec_.image);
    return false;
  }
  transport_ = std::move(transport);
  std::cerr << "[mcp-session] started image=" << spec_.image << "\n";
  return true;
}

std::optional<InitializeResult> McpSession::Initialize(const std::string& protocol_version,
                                                       const ClientInfo& client,
                                                       const nlohmann::json& capabilities,
                                                       McpError* err) {
  auto transport = Transport();
  if (!transport) {
    SetError(err, ErrorCode::kNotStarted, "initializing " + spec_.image + ": not started");
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(init_mu_);
  if (initialized_) {
    SetError(err, ErrorCode::kAlreadyInitialized, "initializing " + spec_.image + ": already initialized");
    return std::nullopt;
  }

  nlohmann::json params;
  params["protocolVersion"] = protocol_version;
  params["capabilities"] = capabilities.is_object() ? capabilities : nlohmann::json::object();
  params["clientInfo"] = {{"name", client.name}, {"version", client.version}};

  CallOptions call;
  call.timeout = opts_.init_timeout;
  call.cancel = opts_.cancel;
  McpError rpc_err;
  auto r = transport->SendRequest("initialize", params, call, &rpc_err);
  if (!r) {
    const std::string context = "initializing " + spec_.image;
    if (rpc_err.code == ErrorCode::kTimeout || rpc_err.code == ErrorCode::kTransportClosed) {
      // A failing server nearly always explains itself on stderr.
      auto stderr_text = transport->DrainedStderr(std::chrono::milliseconds(500));
      auto code = rpc_err.code == ErrorCode::kTimeout ? ErrorCode::kHandshakeTimeout : ErrorCode::kTransportClosed;
      SetError(err, code, context + ": " + (stderr_text.empty() ? rpc_err.message : stderr_text));
    } else {
      SetError(err, rpc_err.code, context + ": " + rpc_err.message);
    }
    return std::nullopt;
  }
  if (!r->is_object()) {
    SetError(err, ErrorCode::kInvalidResponse, "initializing " + spec_.image + ": result is not an object");
    return std::nullopt;
  }

  if (!transport->SendNotification("notifications/initialized", nlohmann::json(), err)) {
    Prefix(err, "initializing " + spec_.image);
    return std::nullopt;
  }
  initialized_ = true;

  auto result = ParseInitializeResult(*r);
  std::cerr << "[mcp-session] initialized image=" << spec_.image << " server=" << result.server_name << "/"
            << result.server_version << " protocol=" << result.protocol_version << "\n";
  return result;
}

std::optional<nlohmann::json> McpSession::ListPaged(const std::string& method,
                                                    const char* key,
                                                    const CallOptions& call,
                                                    McpError* err) {
  auto transport = Transport();
  if (!transport || !initialized_) {
    SetError(err, ErrorCode::kNotStarted, method + " " + spec_.image + ": not started");
    return std::nullopt;
  }

  nlohmann::json out = nlohmann::json::array();
  std::string cursor;
  for (int page = 0; page < kMaxListPages; page++) {
    nlohmann::json params = nlohmann::json::object();
    if (!cursor.empty()) params["cursor"] = cursor;
    auto r = transport->SendRequest(method, params, call, err);
    if (!r) {
      Prefix(err, method + " " + spec_.image);
      return std::nullopt;
    }
    if (!r->is_object() || !r->contains(key) || !(*r)[key].is_array()) {
      SetError(err, ErrorCode::kInvalidResponse, method + " " + spec_.image + ": missing " + key + " array");
      return std::nullopt;
    }
    for (auto& item : (*r)[key]) out.push_back(std::move(item));
    cursor = GetString(*r, "nextCursor");
    if (cursor.empty()) break;
  }
  return out;
}

std::optional<nlohmann::json> McpSession::ListTools(const CallOptions& call, McpError* err) {
  return ListPaged("tools/list", "tools", call, err);
}

std::optional<nlohmann::json> McpSession::ListPrompts(const CallOptions& call, McpError* err) {
  return ListPaged("prompts/list", "prompts", call, err);
}

std::optional<nlohmann::json> McpSession::CallTool(const std::string& name,
                                                   const nlohmann::json& arguments,
                                                   const CallOptions& call,
                                                   McpError* err) {
  auto transport = Transport();
  if (!transport || !initialized_) {
    SetError(err, ErrorCode::kNotStarted, "calling tool " + name + ": not started");
    return std::nullopt;
  }
  if (!arguments.is_null() && !arguments.is_object()) {
    SetError(err, ErrorCode::kInvalidArgument, "calling tool " + name + ": arguments must be an object");
    return std::nullopt;
  }

  nlohmann::json params;
  params["name"] = name;
  params["arguments"] = arguments.is_object() ? arguments : nlohmann::json::object();
  // Some servers reject an empty argument object.
  if (params["arguments"].empty()) params["arguments"]["args"] = "...";

  auto r = transport->SendRequest("tools/call", params, call, err);
  if (!r) {
    Prefix(err, "calling tool " + name + " on " + spec_.image);
    return std::nullopt;
  }
  return r;
}

bool McpSession::Close(bool delete_image, McpError* err) {
  auto transport = Transport();
  if (!transport) {
    SetError(err, ErrorCode::kNotStarted, "closing " + spec_.image + ": not started");
    return false;
  }
  transport->Close();

  if (delete_image) {
    ImageClient images(opts_.engine);
    std::string rm_err;
    if (!images.Remove(spec_.image, true, &rm_err)) {
      SetError(err, ErrorCode::kProcess, rm_err);
      return false;
    }
  }
  return true;
}

std::string McpSession::StderrText() const {
  auto transport = Transport();
  return transport ? transport->StderrText() : std::string();
}

}  // namespace mcpdock
