#include "requirements.hpp"

#include "image_client.hpp"

#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace mcpdock {
namespace {

static std::string RandLetters(size_t n) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  static const char kLetters[] = "abcdefghijklmnopqrstuvwxyz";
  std::uniform_int_distribution<size_t> dist(0, sizeof(kLetters) - 2);
  std::string out;
  out.reserve(n);
  for (size_t i = 0; i < n; i++) out.push_back(kLetters[dist(rng)]);
  return out;
}

}  // namespace

std::optional<RequirementSpec> LookupRequirement(const std::string& name) {
  if (name == "neo4j") {
    RequirementSpec spec;
    spec.name = "neo4j";
    spec.image = "neo4j";
    spec.run_env = {"NEO4J_AUTH=none"};
    spec.ready_marker = "Started.";
    // localhost works because the server joins the sidecar's network namespace.
    spec.exported_env = {{"NEO4J_URL", "bolt://localhost:7687"}};
    return spec;
  }
  return std::nullopt;
}

RequirementOptions RequirementOptionsFromConfig(const DockConfig& cfg) {
  RequirementOptions opts;
  opts.runtime_binary = cfg.runtime_binary;
  opts.engine = cfg.engine;
  opts.poll_interval = std::chrono::milliseconds(cfg.requirement_poll_ms);
  opts.ready_timeout = std::chrono::seconds(cfg.requirement_timeout_seconds);
  return opts;
}

RequirementHandle::RequirementHandle(std::unique_ptr<ChildProcess> sidecar,
                                     std::string sidecar_id,
                                     std::vector<std::pair<std::string, std::string>> env)
    : sidecar_(std::move(sidecar)), sidecar_id_(std::move(sidecar_id)), env_(std::move(env)) {}

RequirementHandle::~RequirementHandle() {
  Release();
}

void RequirementHandle::Release() {
  if (!sidecar_) return;
  std::cerr << "[requirement] stopping sidecar=" << sidecar_id_ << "\n";
  sidecar_->Terminate(std::chrono::seconds(10));
  sidecar_.reset();
}

std::string RequirementHandle::LogText() const {
  return sidecar_ ? sidecar_->StdoutText() : std::string();
}

LaunchPlan BuildSidecarPlan(const RequirementSpec& spec, const std::string& container_name,
                            const std::string& runtime_binary) {
  LaunchPlan plan;
  plan.program = runtime_binary;
  plan.args = {"run", "--name", container_name, "--rm", "--init"};
  for (const auto& kv : spec.run_env) {
    plan.args.push_back("-e");
    plan.args.push_back(kv);
  }
  plan.args.push_back(spec.image);
  return plan;
}

std::unique_ptr<RequirementHandle> SatisfyRequirement(const std::string& name,
                                                      const RequirementOptions& opts,
                                                      const CancelToken* cancel,
                                                      McpError* err) {
  auto spec = LookupRequirement(name);
  if (!spec) {
    SetError(err, ErrorCode::kUnsupportedRequirement, "unsupported requirement: " + name);
    return nullptr;
  }

  // Pull first so the pull does not count against the readiness deadline.
  if (opts.pull) {
    ImageClient images(opts.engine);
    std::string pull_err;
    if (!images.Pull(spec->image, &pull_err)) {
      SetError(err, ErrorCode::kProcess, "failed to pull " + spec->name + ": " + pull_err);
      return nullptr;
    }
  }

  const std::string container_name = spec->name + "-" + RandLetters(8);
  ChildProcess::Options popts;
  popts.pipe_stdin = false;
  popts.capture_stdout = true;
  std::string spawn_err;
  auto sidecar = ChildProcess::Spawn(BuildSidecarPlan(*spec, container_name, opts.runtime_binary), popts, &spawn_err);
  if (!sidecar) {
    SetError(err, ErrorCode::kProcess, "failed to start " + spec->name + ": " + spawn_err);
    return nullptr;
  }
  std::cerr << "[requirement] started sidecar=" << container_name << " image=" << spec->image << "\n";

  const auto start = std::chrono::steady_clock::now();
  while (true) {
    std::this_thread::sleep_for(opts.poll_interval);
    if (cancel && cancel->IsCancelled()) {
      sidecar->Terminate(std::chrono::seconds(10));
      SetError(err, ErrorCode::kCancelled, "waiting for " + spec->name + ": cancelled");
      return nullptr;
    }
    if (sidecar->StdoutText().find(spec->ready_marker) != std::string::npos) break;
    if (auto status = sidecar->ExitStatus(); status.has_value()) {
      sidecar->WaitOutputClosed(std::chrono::milliseconds(200));
      SetError(err, ErrorCode::kProcess,
               "failed to start " + spec->name + ": sidecar exited with status " + std::to_string(*status) + " [" +
                   sidecar->StdoutText() + sidecar->StderrText() + "]");
      return nullptr;
    }
    if (std::chrono::steady_clock::now() - start > opts.ready_timeout) {
      auto log = sidecar->StdoutText();
      sidecar->Terminate(std::chrono::seconds(10));
      SetError(err, ErrorCode::kRequirementTimeout, "failed to start " + spec->name + ": [" + log + "]");
      return nullptr;
    }
  }

  std::cerr << "[requirement] ready sidecar=" << container_name << "\n";
  return std::make_unique<RequirementHandle>(std::move(sidecar), container_name, spec->exported_env);
}

}  // namespace mcpdock
