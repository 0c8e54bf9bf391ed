#pragma once

#include "config.hpp"
#include "mcp_error.hpp"
#include "requirements.hpp"
#include "server_spec.hpp"
#include "session.hpp"
#include "tool_normalizer.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcpdock {

struct DiscoveryOptions {
  SessionOptions session;
  RequirementOptions requirement;
  bool pull = false;
  // Remove the server image once listing is done.
  bool cleanup = false;
  std::string protocol_version = "2025-03-26";
  ClientInfo client;
  const CancelToken* cancel = nullptr;
};

DiscoveryOptions DiscoveryOptionsFromConfig(const DockConfig& cfg);

std::optional<std::vector<Tool>> DiscoverTools(const ServerSpec& server, const DiscoveryOptions& opts, McpError* err);
std::optional<std::vector<Prompt>> DiscoverPrompts(const ServerSpec& server,
                                                   const DiscoveryOptions& opts,
                                                   McpError* err);

// Starts the server, runs a single tools/call and shuts everything down again.
std::optional<nlohmann::json> CallServerTool(const ServerSpec& server,
                                             const std::string& tool,
                                             const nlohmann::json& arguments,
                                             const DiscoveryOptions& opts,
                                             McpError* err);

}  // namespace mcpdock
