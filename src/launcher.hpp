#pragma once

#include "child_process.hpp"
#include "server_spec.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace mcpdock {

// Legacy catalog placeholder that resolves to the working directory.
constexpr const char* kLegacyPathsPlaceholder = "{{filesystem.paths|volume-target|into}}";

// Everything a Session needs to start one containerized server.
struct LaunchSpec {
  std::string image;
  bool pull = false;
  std::vector<EnvVar> env;
  std::vector<SecretVar> secrets;
  // Extra `run` flags, placed before the per-variable -e flags.
  std::vector<std::string> args;
  std::vector<std::string> command;
};

// Config env, extra env (e.g. from a requirement) and run env, in that order.
LaunchSpec LaunchSpecFromServer(const ServerSpec& server,
                                std::vector<std::string> extra_args,
                                const std::vector<std::pair<std::string, std::string>>& extra_env);

std::string ExampleText(const EnvVar& var);

std::string ReplacePlaceholder(const std::string& arg,
                               const std::vector<EnvVar>& env,
                               const std::vector<SecretVar>& secrets);

std::vector<std::pair<std::string, std::string>> BuildChildEnv(const std::vector<EnvVar>& env,
                                                               const std::vector<SecretVar>& secrets);

LaunchPlan BuildLaunchPlan(const LaunchSpec& spec, const std::string& runtime_binary);

}  // namespace mcpdock
