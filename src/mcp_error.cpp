#include "mcp_error.hpp"

namespace mcpdock {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "ok";
    case ErrorCode::kNotStarted:
      return "not_started";
    case ErrorCode::kAlreadyStarted:
      return "already_started";
    case ErrorCode::kAlreadyInitialized:
      return "already_initialized";
    case ErrorCode::kUnsupportedRequirement:
      return "unsupported_requirement";
    case ErrorCode::kRequirementTimeout:
      return "requirement_timeout";
    case ErrorCode::kHandshakeTimeout:
      return "handshake_timeout";
    case ErrorCode::kTransportClosed:
      return "transport_closed";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kCancelled:
      return "cancelled";
    case ErrorCode::kProtocol:
      return "protocol_error";
    case ErrorCode::kInvalidResponse:
      return "invalid_response";
    case ErrorCode::kProcess:
      return "process_error";
    case ErrorCode::kInvalidSpec:
      return "invalid_spec";
    case ErrorCode::kInvalidArgument:
      return "invalid_argument";
  }
  return "unknown";
}

std::string FormatError(const McpError& err) {
  std::string out = ErrorCodeName(err.code);
  if (!err.message.empty()) out += ": " + err.message;
  return out;
}

}  // namespace mcpdock
