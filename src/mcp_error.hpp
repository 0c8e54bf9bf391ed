#pragma once

#include <string>
#include <utility>

namespace mcpdock {

enum class ErrorCode {
  kNone = 0,
  kNotStarted,
  kAlreadyStarted,
  kAlreadyInitialized,
  kUnsupportedRequirement,
  kRequirementTimeout,
  kHandshakeTimeout,
  kTransportClosed,
  kTimeout,
  kCancelled,
  kProtocol,
  kInvalidResponse,
  kProcess,
  kInvalidSpec,
  kInvalidArgument,
};

struct McpError {
  ErrorCode code = ErrorCode::kNone;
  std::string message;
};

const char* ErrorCodeName(ErrorCode code);

inline void SetError(McpError* err, ErrorCode code, std::string message) {
  if (!err) return;
  err->code = code;
  err->message = std::move(message);
}

// "<code>: <message>", for logs and the CLI.
std::string FormatError(const McpError& err);

}  // namespace mcpdock
