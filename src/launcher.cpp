#include "launcher.hpp"

#include <string>
#include <utility>
#include <vector>

namespace mcpdock {

LaunchSpec LaunchSpecFromServer(const ServerSpec& server,
                                std::vector<std::string> extra_args,
                                const std::vector<std::pair<std::string, std::string>>& extra_env) {
  LaunchSpec spec;
  spec.image = server.image;
  spec.env = server.env;
  for (const auto& [name, value] : extra_env) {
    EnvVar v;
    v.name = name;
    v.example = value;
    spec.env.push_back(std::move(v));
  }
  for (const auto& v : server.run_env) spec.env.push_back(v);
  spec.secrets = server.secrets;
  spec.args = std::move(extra_args);
  spec.command = server.command;
  return spec;
}

std::string ExampleText(const EnvVar& var) {
  const auto& ex = var.example;
  if (ex.is_null()) return var.value;
  if (ex.is_string()) return ex.get<std::string>();
  if (ex.is_boolean()) return ex.get<bool>() ? "true" : "false";
  return ex.dump();
}

std::string ReplacePlaceholder(const std::string& arg,
                               const std::vector<EnvVar>& env,
                               const std::vector<SecretVar>& secrets) {
  // TODO: drop once catalog entries stop emitting the legacy volume placeholder.
  if (arg == kLegacyPathsPlaceholder) return ".";

  for (const auto& v : env) {
    if (arg == "$" + v.name) return ExampleText(v);
  }
  for (const auto& s : secrets) {
    if (arg == "$" + s.env) return s.example;
  }
  return arg;
}

std::vector<std::pair<std::string, std::string>> BuildChildEnv(const std::vector<EnvVar>& env,
                                                               const std::vector<SecretVar>& secrets) {
  std::vector<std::pair<std::string, std::string>> out;
  out.reserve(env.size() + secrets.size());
  for (const auto& v : env) out.emplace_back(v.name, ExampleText(v));
  for (const auto& s : secrets) out.emplace_back(s.env, s.example);
  return out;
}

LaunchPlan BuildLaunchPlan(const LaunchSpec& spec, const std::string& runtime_binary) {
  LaunchPlan plan;
  plan.program = runtime_binary;
  plan.args = {"run", "--rm", "-i", "--init", "--cap-drop=ALL"};
  plan.args.insert(plan.args.end(), spec.args.begin(), spec.args.end());
  // Names only: values travel in the environment, never on the command line.
  for (const auto& v : spec.env) {
    plan.args.push_back("-e");
    plan.args.push_back(v.name);
  }
  for (const auto& s : spec.secrets) {
    plan.args.push_back("-e");
    plan.args.push_back(s.env);
  }
  plan.args.push_back(spec.image);
  for (const auto& arg : spec.command) plan.args.push_back(ReplacePlaceholder(arg, spec.env, spec.secrets));
  plan.env = BuildChildEnv(spec.env, spec.secrets);
  return plan;
}

}  // namespace mcpdock
