#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace mcpdock {

struct LaunchPlan {
  std::string program;
  std::vector<std::string> args;
  // Overlaid on the parent's environment.
  std::vector<std::pair<std::string, std::string>> env;
};

class ChildProcess {
 public:
  struct Options {
    bool pipe_stdin = true;
    // Background-capture stdout into StdoutText() instead of handing the fd out.
    bool capture_stdout = false;
    // Copy the child's stderr to our stderr as it arrives.
    bool mirror_stderr = false;
  };

  enum class WriteStatus {
    kOk,
    kFailed,
    kTimedOut,
    kInterrupted,
  };

  struct WriteLimits {
    // time_point::max() means no deadline.
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    // Polled while the write waits on the pipe or on another writer.
    std::function<bool()> interrupted;
  };

  static std::unique_ptr<ChildProcess> Spawn(const LaunchPlan& plan, const Options& opts, std::string* err);

  ~ChildProcess();
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  pid_t Pid() const { return pid_; }
  // -1 when stdout is captured.
  int StdoutFd() const { return stdout_fd_; }

  // Writes all of data, or gives up at the deadline or on interruption.
  // *written reports how much of data reached the pipe.
  WriteStatus WriteStdin(const std::string& data, const WriteLimits& limits, size_t* written, std::string* err);
  bool WriteStdin(const std::string& data, std::string* err);
  void CloseStdin();

  std::string StderrText() const;
  std::string StdoutText() const;
  // Waits for every captured stream to reach end-of-file, so the text is complete.
  bool WaitOutputClosed(std::chrono::milliseconds timeout);

  bool Signal(int sig);
  // Returns the exit status once the child has been reaped.
  std::optional<int> WaitFor(std::chrono::milliseconds timeout);
  std::optional<int> ExitStatus();
  // SIGTERM, then SIGKILL if the child outlives the grace period.
  void Terminate(std::chrono::milliseconds grace);

 private:
  ChildProcess() = default;

  bool TryReap();
  void CaptureLoop(int fd, std::string* sink, bool mirror);

  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  int capture_stdout_fd_ = -1;

  std::timed_mutex write_mu_;
  mutable std::mutex buf_mu_;
  std::condition_variable output_closed_cv_;
  bool stderr_closed_ = false;
  // Stays true when stdout is handed out instead of captured.
  bool stdout_closed_ = true;
  std::string stderr_buf_;
  std::string stdout_buf_;

  std::mutex reap_mu_;
  std::optional<int> exit_status_;

  std::atomic<bool> stop_capture_{false};
  std::thread stderr_thread_;
  std::thread stdout_thread_;
};

}  // namespace mcpdock
