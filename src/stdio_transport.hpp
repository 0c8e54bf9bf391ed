#pragma once

#include "child_process.hpp"
#include "mcp_error.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace mcpdock {

class CancelToken {
 public:
  void Cancel() { cancelled_ = true; }
  bool IsCancelled() const { return cancelled_; }

 private:
  std::atomic<bool> cancelled_{false};
};

struct CallOptions {
  // Zero means no deadline.
  std::chrono::milliseconds timeout{0};
  const CancelToken* cancel = nullptr;
};

struct TransportOptions {
  bool debug = false;
  std::chrono::milliseconds close_grace{5000};
};

// JSON-RPC over a child's stdin/stdout. Any number of threads may call
// SendRequest at once; a single dispatch thread routes each response to its
// caller by request id.
class StdioTransport {
 public:
  static std::unique_ptr<StdioTransport> Start(const LaunchPlan& plan, TransportOptions opts, McpError* err);

  ~StdioTransport();
  StdioTransport(const StdioTransport&) = delete;
  StdioTransport& operator=(const StdioTransport&) = delete;

  std::optional<nlohmann::json> SendRequest(const std::string& method,
                                            const nlohmann::json& params,
                                            const CallOptions& call,
                                            McpError* err);
  bool SendNotification(const std::string& method, const nlohmann::json& params, McpError* err);

  // Terminates the child and releases every waiting caller. Idempotent.
  void Close();

  bool IsClosed() const;
  std::string StderrText() const;
  // Stderr once the child has closed it, or whatever arrived within the timeout.
  std::string DrainedStderr(std::chrono::milliseconds timeout);
  size_t PendingCount() const;
  std::optional<int> ExitStatus();

 private:
  struct PendingCall {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    std::optional<nlohmann::json> result;
    McpError error;
  };

  StdioTransport(std::unique_ptr<ChildProcess> process, TransportOptions opts);

  void DispatchLoop();
  void ReplyLoop();
  void HandleLine(const std::string& line);
  void Deliver(int64_t id, std::optional<nlohmann::json> result, McpError error);
  void ReleaseAll(const std::string& reason);
  void Forget(int64_t id);

  std::unique_ptr<ChildProcess> process_;
  TransportOptions opts_;
  std::atomic<int64_t> next_id_{0};

  mutable std::mutex mu_;
  bool closed_ = false;
  std::unordered_map<int64_t, std::shared_ptr<PendingCall>> pending_;

  std::mutex close_mu_;
  std::atomic<bool> stopping_{false};
  std::thread dispatch_thread_;

  std::mutex reply_mu_;
  std::condition_variable reply_cv_;
  std::deque<std::string> replies_;
  std::thread reply_thread_;
};

}  // namespace mcpdock
