#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace mcpdock {

constexpr const char* kJsonRpcVersion = "2.0";

enum class WireKind {
  kRequest,
  kResponse,
  kNotification,
};

struct RpcError {
  int code = 0;
  std::string message;
  nlohmann::json data;
};

// One JSON-RPC envelope. Requests and responses carry an id; notifications
// never do.
struct WireMessage {
  WireKind kind = WireKind::kNotification;
  std::optional<int64_t> id;
  std::string method;
  nlohmann::json params;
  nlohmann::json result;
  std::optional<RpcError> error;
};

// Each Encode* returns one complete, newline-terminated line.
std::string EncodeRequest(int64_t id, const std::string& method, const nlohmann::json& params);
std::string EncodeNotification(const std::string& method, const nlohmann::json& params);
std::string EncodeResult(int64_t id, const nlohmann::json& result);
std::string EncodeError(int64_t id, int code, const std::string& message);

// Invalid UTF-8 sequences in the line are replaced with U+FFFD before parsing.
std::optional<WireMessage> DecodeLine(const std::string& line, std::string* err);

std::string SanitizeUtf8(const std::string& in);

// Cuts s so that, suffix included, it is at most max_chars long.
std::string TruncateForLog(std::string s, size_t max_chars);

// Splits a byte stream into lines. A trailing '\r' is dropped.
class LineReader {
 public:
  void Append(const char* data, size_t n);
  bool Next(std::string* line);
  // Hands out the unterminated remainder once the stream has ended.
  bool Flush(std::string* line);
  size_t Buffered() const { return buf_.size(); }

 private:
  std::string buf_;
};

}  // namespace mcpdock
