#include "child_process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

extern char** environ;

namespace mcpdock {
namespace {

constexpr size_t kMaxCaptureBytes = 1 << 20;
constexpr auto kWriteSlice = std::chrono::milliseconds(50);

static void IgnoreSigpipeOnce() {
  static std::once_flag once;
  std::call_once(once, []() { ::signal(SIGPIPE, SIG_IGN); });
}

static void CloseFd(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}

static std::vector<std::string> BuildEnviron(const std::vector<std::pair<std::string, std::string>>& overlay) {
  std::vector<std::string> out;
  std::unordered_map<std::string, size_t> index;
  for (char** e = environ; e && *e; ++e) {
    std::string kv(*e);
    auto eq = kv.find('=');
    if (eq == std::string::npos) continue;
    index[kv.substr(0, eq)] = out.size();
    out.push_back(std::move(kv));
  }
  for (const auto& [name, value] : overlay) {
    if (name.empty()) continue;
    auto it = index.find(name);
    if (it != index.end()) {
      out[it->second] = name + "=" + value;
    } else {
      index[name] = out.size();
      out.push_back(name + "=" + value);
    }
  }
  return out;
}

static std::vector<char*> ToCharVec(std::vector<std::string>& strs) {
  std::vector<char*> out;
  out.reserve(strs.size() + 1);
  for (auto& s : strs) out.push_back(s.data());
  out.push_back(nullptr);
  return out;
}

static int DecodeStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

static void AppendCapped(std::string* sink, const char* data, size_t n) {
  sink->append(data, n);
  if (sink->size() > kMaxCaptureBytes) sink->erase(0, sink->size() - kMaxCaptureBytes);
}

}  // namespace

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const LaunchPlan& plan, const Options& opts, std::string* err) {
  IgnoreSigpipeOnce();
  if (plan.program.empty()) {
    if (err) *err = "empty program";
    return nullptr;
  }

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  auto close_all = [&]() {
    for (int* p : {in_pipe, out_pipe, err_pipe}) {
      CloseFd(&p[0]);
      CloseFd(&p[1]);
    }
  };
  if ((opts.pipe_stdin && ::pipe2(in_pipe, O_CLOEXEC) != 0) || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
      ::pipe2(err_pipe, O_CLOEXEC) != 0) {
    if (err) *err = std::string("pipe: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  if (opts.pipe_stdin) {
    posix_spawn_file_actions_adddup2(&actions, in_pipe[0], STDIN_FILENO);
  } else {
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  }
  posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);

  std::vector<std::string> argv_strs;
  argv_strs.push_back(plan.program);
  for (const auto& a : plan.args) argv_strs.push_back(a);
  auto env_strs = BuildEnviron(plan.env);
  auto argv = ToCharVec(argv_strs);
  auto envp = ToCharVec(env_strs);

  pid_t pid = -1;
  int rc = ::posix_spawnp(&pid, plan.program.c_str(), &actions, nullptr, argv.data(), envp.data());
  posix_spawn_file_actions_destroy(&actions);
  if (rc != 0) {
    if (err) *err = "failed to start " + plan.program + ": " + std::strerror(rc);
    close_all();
    return nullptr;
  }

  std::unique_ptr<ChildProcess> child(new ChildProcess());
  child->pid_ = pid;
  CloseFd(&in_pipe[0]);
  CloseFd(&out_pipe[1]);
  CloseFd(&err_pipe[1]);
  child->stdin_fd_ = in_pipe[1];
  if (child->stdin_fd_ >= 0) {
    // Writers poll so a stalled reader cannot pin them past their deadline.
    int flags = ::fcntl(child->stdin_fd_, F_GETFL);
    if (flags >= 0) ::fcntl(child->stdin_fd_, F_SETFL, flags | O_NONBLOCK);
  }
  child->stderr_fd_ = err_pipe[0];
  if (opts.capture_stdout) {
    child->capture_stdout_fd_ = out_pipe[0];
    child->stdout_closed_ = false;
    child->stdout_thread_ = std::thread([c = child.get()]() {
      c->CaptureLoop(c->capture_stdout_fd_, &c->stdout_buf_, false);
      {
        std::lock_guard<std::mutex> lock(c->buf_mu_);
        c->stdout_closed_ = true;
      }
      c->output_closed_cv_.notify_all();
    });
  } else {
    child->stdout_fd_ = out_pipe[0];
  }
  child->stderr_thread_ = std::thread([c = child.get(), mirror = opts.mirror_stderr]() {
    c->CaptureLoop(c->stderr_fd_, &c->stderr_buf_, mirror);
    {
      std::lock_guard<std::mutex> lock(c->buf_mu_);
      c->stderr_closed_ = true;
    }
    c->output_closed_cv_.notify_all();
  });
  return child;
}

ChildProcess::~ChildProcess() {
  Terminate(std::chrono::seconds(5));
  CloseStdin();
  stop_capture_ = true;
  if (stderr_thread_.joinable()) stderr_thread_.join();
  if (stdout_thread_.joinable()) stdout_thread_.join();
  CloseFd(&stdout_fd_);
  CloseFd(&stderr_fd_);
  CloseFd(&capture_stdout_fd_);
}

ChildProcess::WriteStatus ChildProcess::WriteStdin(const std::string& data,
                                                   const WriteLimits& limits,
                                                   size_t* written,
                                                   std::string* err) {
  size_t off = 0;
  if (written) *written = 0;
  auto give_up = [&]() -> std::optional<WriteStatus> {
    if (limits.interrupted && limits.interrupted()) return WriteStatus::kInterrupted;
    if (std::chrono::steady_clock::now() >= limits.deadline) return WriteStatus::kTimedOut;
    return std::nullopt;
  };

  std::unique_lock<std::timed_mutex> lock(write_mu_, std::defer_lock);
  while (!lock.try_lock_for(kWriteSlice)) {
    if (auto s = give_up()) return *s;
  }
  if (stdin_fd_ < 0) {
    if (err) *err = "stdin closed";
    return WriteStatus::kFailed;
  }

  while (off < data.size()) {
    ssize_t n = ::write(stdin_fd_, data.data() + off, data.size() - off);
    if (n > 0) {
      off += static_cast<size_t>(n);
      if (written) *written = off;
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (auto s = give_up()) return *s;
      auto wait = kWriteSlice;
      if (limits.deadline != std::chrono::steady_clock::time_point::max()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(limits.deadline -
                                                                          std::chrono::steady_clock::now());
        wait = std::max(std::chrono::milliseconds(1), std::min(wait, left));
      }
      pollfd pfd{};
      pfd.fd = stdin_fd_;
      pfd.events = POLLOUT;
      ::poll(&pfd, 1, static_cast<int>(wait.count()));
      continue;
    }
    if (err) *err = std::string("write: ") + std::strerror(n < 0 ? errno : EIO);
    return WriteStatus::kFailed;
  }
  return WriteStatus::kOk;
}

bool ChildProcess::WriteStdin(const std::string& data, std::string* err) {
  return WriteStdin(data, WriteLimits{}, nullptr, err) == WriteStatus::kOk;
}

void ChildProcess::CloseStdin() {
  std::lock_guard<std::timed_mutex> lock(write_mu_);
  CloseFd(&stdin_fd_);
}

std::string ChildProcess::StderrText() const {
  std::lock_guard<std::mutex> lock(buf_mu_);
  return stderr_buf_;
}

std::string ChildProcess::StdoutText() const {
  std::lock_guard<std::mutex> lock(buf_mu_);
  return stdout_buf_;
}

bool ChildProcess::WaitOutputClosed(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(buf_mu_);
  return output_closed_cv_.wait_for(lock, timeout, [this]() { return stderr_closed_ && stdout_closed_; });
}

bool ChildProcess::TryReap() {
  if (exit_status_) return true;
  int status = 0;
  pid_t r = ::waitpid(pid_, &status, WNOHANG);
  if (r == pid_) {
    exit_status_ = DecodeStatus(status);
    return true;
  }
  if (r < 0 && errno == ECHILD) {
    exit_status_ = -1;
    return true;
  }
  return false;
}

bool ChildProcess::Signal(int sig) {
  std::lock_guard<std::mutex> lock(reap_mu_);
  if (pid_ <= 0 || TryReap()) return false;
  return ::kill(pid_, sig) == 0;
}

std::optional<int> ChildProcess::ExitStatus() {
  std::lock_guard<std::mutex> lock(reap_mu_);
  if (pid_ > 0) TryReap();
  return exit_status_;
}

std::optional<int> ChildProcess::WaitFor(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    {
      std::lock_guard<std::mutex> lock(reap_mu_);
      if (pid_ <= 0 || TryReap()) return exit_status_;
    }
    if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void ChildProcess::Terminate(std::chrono::milliseconds grace) {
  if (!Signal(SIGTERM)) return;
  if (WaitFor(grace)) return;
  std::cerr << "[process] pid=" << pid_ << " ignored SIGTERM, sending SIGKILL\n";
  Signal(SIGKILL);
  WaitFor(std::chrono::seconds(5));
}

void ChildProcess::CaptureLoop(int fd, std::string* sink, bool mirror) {
  char buf[4096];
  while (true) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    int pr = ::poll(&pfd, 1, 100);
    if (pr < 0) {
      if (errno == EINTR) continue;
      return;
    }
    if (pr == 0) {
      if (stop_capture_) return;
      continue;
    }
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      return;
    }
    if (n == 0) return;
    if (mirror) std::cerr.write(buf, n);
    std::lock_guard<std::mutex> lock(buf_mu_);
    AppendCapped(sink, buf, static_cast<size_t>(n));
  }
}

}  // namespace mcpdock
