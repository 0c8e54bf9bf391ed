#pragma once

#include "child_process.hpp"
#include "config.hpp"
#include "mcp_error.hpp"
#include "stdio_transport.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcpdock {

// A sidecar container some servers need running before they start.
struct RequirementSpec {
  std::string name;
  std::string image;
  std::vector<std::string> run_env;
  std::string ready_marker;
  // KEY=VALUE pairs handed to the main server.
  std::vector<std::pair<std::string, std::string>> exported_env;
};

std::optional<RequirementSpec> LookupRequirement(const std::string& name);

struct RequirementOptions {
  std::string runtime_binary = "docker";
  HttpEndpoint engine = DefaultEngineEndpoint();
  bool pull = true;
  std::chrono::milliseconds poll_interval{100};
  std::chrono::milliseconds ready_timeout{30000};
};

RequirementOptions RequirementOptionsFromConfig(const DockConfig& cfg);

// A running sidecar. Stops it when released or destroyed.
class RequirementHandle {
 public:
  RequirementHandle(std::unique_ptr<ChildProcess> sidecar,
                    std::string sidecar_id,
                    std::vector<std::pair<std::string, std::string>> env);
  ~RequirementHandle();
  RequirementHandle(const RequirementHandle&) = delete;
  RequirementHandle& operator=(const RequirementHandle&) = delete;

  void Release();

  const std::string& SidecarId() const { return sidecar_id_; }
  const std::vector<std::pair<std::string, std::string>>& Env() const { return env_; }
  // Extra `run` flags that put the main server in the sidecar's network namespace.
  std::vector<std::string> NetworkArgs() const { return {"--network", "container:" + sidecar_id_}; }
  std::string LogText() const;

 private:
  std::unique_ptr<ChildProcess> sidecar_;
  std::string sidecar_id_;
  std::vector<std::pair<std::string, std::string>> env_;
};

LaunchPlan BuildSidecarPlan(const RequirementSpec& spec, const std::string& container_name,
                            const std::string& runtime_binary);

std::unique_ptr<RequirementHandle> SatisfyRequirement(const std::string& name,
                                                      const RequirementOptions& opts,
                                                      const CancelToken* cancel,
                                                      McpError* err);

}  // namespace mcpdock
