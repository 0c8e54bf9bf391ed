#include "stdio_transport.hpp"

#include "wire.hpp"

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace mcpdock {
namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(50);

}  // namespace

std::unique_ptr<StdioTransport> StdioTransport::Start(const LaunchPlan& plan, TransportOptions opts, McpError* err) {
  ChildProcess::Options popts;
  popts.pipe_stdin = true;
  popts.mirror_stderr = opts.debug;
  std::string spawn_err;
  auto process = ChildProcess::Spawn(plan, popts, &spawn_err);
  if (!process) {
    SetError(err, ErrorCode::kProcess, spawn_err);
    return nullptr;
  }
  if (opts.debug) {
    std::cerr << "[mcp-transport] started pid=" << process->Pid() << " program=" << plan.program << "\n";
  }
  std::unique_ptr<StdioTransport> t(new StdioTransport(std::move(process), opts));
  t->dispatch_thread_ = std::thread([p = t.get()]() { p->DispatchLoop(); });
  t->reply_thread_ = std::thread([p = t.get()]() { p->ReplyLoop(); });
  return t;
}

StdioTransport::StdioTransport(std::unique_ptr<ChildProcess> process, TransportOptions opts)
    : process_(std::move(process)), opts_(opts) {}

StdioTransport::~StdioTransport() {
  Close();
}

std::optional<nlohmann::json> StdioTransport::SendRequest(const std::string& method,
                                                          const nlohmann::json& params,
                                                          const CallOptions& call_opts,
                                                          McpError* err) {
  const bool has_deadline = call_opts.timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + call_opts.timeout;

  const int64_t id = ++next_id_;
  auto call = std::make_shared<PendingCall>();
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (closed_) {
      SetError(err, ErrorCode::kTransportClosed, "transport closed");
      return std::nullopt;
    }
    pending_.emplace(id, call);
  }

  if (opts_.debug) std::cerr << "[mcp-transport] -> id=" << id << " method=" << method << "\n";
  ChildProcess::WriteLimits limits;
  if (has_deadline) limits.deadline = deadline;
  limits.interrupted = [this, &call_opts]() {
    return stopping_.load() || (call_opts.cancel && call_opts.cancel->IsCancelled());
  };
  std::string write_err;
  size_t written = 0;
  auto status = process_->WriteStdin(EncodeRequest(id, method, params), limits, &written, &write_err);
  if (status != ChildProcess::WriteStatus::kOk) {
    Forget(id);
    if (status == ChildProcess::WriteStatus::kFailed || stopping_) {
      SetError(err, ErrorCode::kTransportClosed, "transport closed: " + (write_err.empty() ? "closing" : write_err));
      return std::nullopt;
    }
    const bool cancelled = status == ChildProcess::WriteStatus::kInterrupted;
    if (written > 0) {
      // The server has half a frame; nothing sent after it would parse.
      std::cerr << "[mcp-transport] abandoned " << method << " after " << written << " bytes, closing transport\n";
      ReleaseAll("transport closed: partial request abandoned");
      if (!process_->Signal(SIGTERM)) std::cerr << "[mcp-transport] failed to signal server process\n";
    }
    if (cancelled) {
      SetError(err, ErrorCode::kCancelled, method + ": cancelled");
    } else {
      SetError(err, ErrorCode::kTimeout, method + ": timed out after " + std::to_string(call_opts.timeout.count()) + "ms");
    }
    return std::nullopt;
  }

  std::unique_lock<std::mutex> lk(call->mu);
  while (!call->done) {
    ErrorCode abandon = ErrorCode::kNone;
    if (call_opts.cancel && call_opts.cancel->IsCancelled()) {
      abandon = ErrorCode::kCancelled;
    } else if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
      abandon = ErrorCode::kTimeout;
    }
    if (abandon != ErrorCode::kNone) {
      lk.unlock();
      Forget(id);
      lk.lock();
      // The dispatch loop may have claimed the slot just before Forget.
      if (call->done) break;
      if (abandon == ErrorCode::kCancelled) {
        SetError(err, abandon, method + ": cancelled");
      } else {
        SetError(err, abandon, method + ": timed out after " + std::to_string(call_opts.timeout.count()) + "ms");
      }
      return std::nullopt;
    }
    auto wake = std::chrono::steady_clock::now() + kWaitSlice;
    if (has_deadline) wake = std::min(wake, deadline);
    call->cv.wait_until(lk, wake);
  }

  if (!call->result) {
    if (err) *err = call->error;
    return std::nullopt;
  }
  return std::move(*call->result);
}

bool StdioTransport::SendNotification(const std::string& method, const nlohmann::json& params, McpError* err) {
  if (IsClosed()) {
    SetError(err, ErrorCode::kTransportClosed, "transport closed");
    return false;
  }
  std::string write_err;
  if (!process_->WriteStdin(EncodeNotification(method, params), &write_err)) {
    SetError(err, ErrorCode::kTransportClosed, "transport closed: " + write_err);
    return false;
  }
  return true;
}

void StdioTransport::Close() {
  std::lock_guard<std::mutex> lock(close_mu_);
  {
    std::lock_guard<std::mutex> reply_lock(reply_mu_);
    stopping_ = true;
  }
  reply_cv_.notify_all();
  process_->Terminate(opts_.close_grace);
  process_->CloseStdin();
  if (dispatch_thread_.joinable()) dispatch_thread_.join();
  if (reply_thread_.joinable()) reply_thread_.join();
  ReleaseAll("transport closed");
}

bool StdioTransport::IsClosed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return closed_;
}

std::string StdioTransport::StderrText() const {
  return process_->StderrText();
}

std::string StdioTransport::DrainedStderr(std::chrono::milliseconds timeout) {
  process_->WaitOutputClosed(timeout);
  return process_->StderrText();
}

size_t StdioTransport::PendingCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_.size();
}

std::optional<int> StdioTransport::ExitStatus() {
  return process_->ExitStatus();
}

void StdioTransport::DispatchLoop() {
  const int fd = process_->StdoutFd();
  LineReader reader;
  std::string line;
  char buf[8192];
  while (!stopping_) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    int pr = ::poll(&pfd, 1, 100);
    if (pr < 0) {
      if (errno == EINTR) continue;
      std::cerr << "[mcp-transport] poll failed: " << std::strerror(errno) << "\n";
      break;
    }
    if (pr == 0) continue;
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      std::cerr << "[mcp-transport] read failed: " << std::strerror(errno) << "\n";
      break;
    }
    if (n == 0) break;
    reader.Append(buf, static_cast<size_t>(n));
    while (reader.Next(&line)) HandleLine(line);
  }
  if (reader.Flush(&line)) HandleLine(line);

  if (stopping_) {
    ReleaseAll("transport closed");
    return;
  }
  std::string reason = "transport closed: server process exited";
  if (auto status = process_->WaitFor(std::chrono::milliseconds(200)); status.has_value()) {
    reason += " with status " + std::to_string(*status);
  }
  if (opts_.debug) std::cerr << "[mcp-transport] " << reason << "\n";
  ReleaseAll(reason);
}

void StdioTransport::ReplyLoop() {
  ChildProcess::WriteLimits limits;
  limits.interrupted = [this]() { return stopping_.load(); };
  while (true) {
    std::string reply;
    {
      std::unique_lock<std::mutex> lock(reply_mu_);
      reply_cv_.wait(lock, [this]() { return stopping_ || !replies_.empty(); });
      if (stopping_) return;
      reply = std::move(replies_.front());
      replies_.pop_front();
    }
    std::string write_err;
    if (process_->WriteStdin(reply, limits, nullptr, &write_err) == ChildProcess::WriteStatus::kFailed) {
      if (opts_.debug) std::cerr << "[mcp-transport] reply to server request failed: " << write_err << "\n";
      return;
    }
  }
}

void StdioTransport::HandleLine(const std::string& line) {
  if (line.find_first_not_of(" \t") == std::string::npos) return;

  std::string decode_err;
  auto msg = DecodeLine(line, &decode_err);
  if (!msg) {
    std::cerr << "[mcp-transport] skipping non-protocol line (" << decode_err << "): " << TruncateForLog(line, 200)
              << "\n";
    return;
  }

  switch (msg->kind) {
    case WireKind::kNotification:
      if (opts_.debug) std::cerr << "[mcp-transport] notification method=" << msg->method << "\n";
      return;
    case WireKind::kRequest: {
      // Server-initiated requests share the id space with ours; answer them
      // here so they never reach a pending caller. The reply thread writes
      // them, since this thread must keep draining stdout.
      std::string reply = msg->method == "ping" ? EncodeResult(*msg->id, nlohmann::json::object())
                                                : EncodeError(*msg->id, -32601, "method not found: " + msg->method);
      {
        std::lock_guard<std::mutex> lock(reply_mu_);
        replies_.push_back(std::move(reply));
      }
      reply_cv_.notify_one();
      return;
    }
    case WireKind::kResponse:
      break;
  }

  if (msg->error) {
    McpError e;
    e.code = ErrorCode::kProtocol;
    e.message = msg->error->message;
    Deliver(*msg->id, std::nullopt, std::move(e));
  } else {
    Deliver(*msg->id, std::move(msg->result), McpError{});
  }
}

void StdioTransport::Deliver(int64_t id, std::optional<nlohmann::json> result, McpError error) {
  std::shared_ptr<PendingCall> call;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
      if (opts_.debug) std::cerr << "[mcp-transport] dropping response for unknown id=" << id << "\n";
      return;
    }
    call = std::move(it->second);
    pending_.erase(it);
  }
  {
    std::lock_guard<std::mutex> lock(call->mu);
    call->result = std::move(result);
    call->error = std::move(error);
    call->done = true;
  }
  call->cv.notify_all();
}

void StdioTransport::ReleaseAll(const std::string& reason) {
  std::unordered_map<int64_t, std::shared_ptr<PendingCall>> orphans;
  {
    std::lock_guard<std::mutex> lock(mu_);
    closed_ = true;
    orphans.swap(pending_);
  }
  for (auto& [id, call] : orphans) {
    {
      std::lock_guard<std::mutex> lock(call->mu);
      call->result.reset();
      call->error = McpError{ErrorCode::kTransportClosed, reason};
      call->done = true;
    }
    call->cv.notify_all();
  }
}

void StdioTransport::Forget(int64_t id) {
  std::lock_guard<std::mutex> lock(mu_);
  pending_.erase(id);
}

}  // namespace mcpdock
