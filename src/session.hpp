#pragma once

#include "config.hpp"
#include "launcher.hpp"
#include "mcp_error.hpp"
#include "stdio_transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mcpdock {

struct ClientInfo {
  std::string name = "docker";
  std::string version = "1.0.0";
};

struct InitializeResult {
  std::string protocol_version;
  std::string server_name;
  std::string server_version;
  std::string instructions;
  nlohmann::json capabilities = nlohmann::json::object();
};

struct SessionOptions {
  std::string runtime_binary = "docker";
  HttpEndpoint engine = DefaultEngineEndpoint();
  bool debug = false;
  std::chrono::milliseconds init_timeout{60000};
  // Aborts the handshake wait when fired.
  const CancelToken* cancel = nullptr;
};

SessionOptions SessionOptionsFromConfig(const DockConfig& cfg);

// One containerized MCP server. Start and Initialize run once; the list and
// call operations may then be used from several threads at once.
class McpSession {
 public:
  McpSession(LaunchSpec spec, SessionOptions opts);
  ~McpSession();
  McpSession(const McpSession&) = delete;
  McpSession& operator=(const McpSession&) = delete;

  bool Start(McpError* err);

  std::optional<InitializeResult> Initialize(const std::string& protocol_version,
                                             const ClientInfo& client,
                                             const nlohmann::json& capabilities,
                                             McpError* err);

  // Raw tool and prompt arrays, merged across pages.
  std::optional<nlohmann::json> ListTools(const CallOptions& call, McpError* err);
  std::optional<nlohmann::json> ListTools(McpError* err) { return ListTools(CallOptions{}, err); }
  std::optional<nlohmann::json> ListPrompts(const CallOptions& call, McpError* err);
  std::optional<nlohmann::json> ListPrompts(McpError* err) { return ListPrompts(CallOptions{}, err); }

  std::optional<nlohmann::json> CallTool(const std::string& name,
                                         const nlohmann::json& arguments,
                                         const CallOptions& call,
                                         McpError* err);
  std::optional<nlohmann::json> CallTool(const std::string& name, const nlohmann::json& arguments, McpError* err) {
    return CallTool(name, arguments, CallOptions{}, err);
  }

  bool Close(bool delete_image, McpError* err);

  bool IsInitialized() const { return initialized_; }
  std::string StderrText() const;
  const LaunchSpec& Spec() const { return spec_; }

 private:
  std::shared_ptr<StdioTransport> Transport() const;
  std::optional<nlohmann::json> ListPaged(const std::string& method,
                                          const char* key,
                                          const CallOptions& call,
                                          McpError* err);

  LaunchSpec spec_;
  SessionOptions opts_;

  mutable std::mutex mu_;
  std::shared_ptr<StdioTransport> transport_;
  std::mutex init_mu_;
  std::atomic<bool> initialized_{false};
};

}  // namespace mcpdock
