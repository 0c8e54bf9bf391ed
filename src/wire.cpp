#include "wire.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>

namespace mcpdock {
namespace {

static bool ParseId(const nlohmann::json& v, int64_t* out) {
  if (v.is_number_integer()) {
    *out = v.get<int64_t>();
    return true;
  }
  if (v.is_string()) {
    const auto& s = v.get_ref<const std::string&>();
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long long n = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    *out = static_cast<int64_t>(n);
    return true;
  }
  return false;
}

static std::string Line(const nlohmann::json& j) {
  // dump() escapes control characters, so the payload never contains a raw newline.
  std::string out = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  out.push_back('\n');
  return out;
}

// Length of the well-formed UTF-8 sequence starting at p, or 0.
static size_t Utf8SequenceLength(const unsigned char* p, size_t avail) {
  const unsigned char c = p[0];
  if (c < 0x80) return 1;
  size_t len = 0;
  unsigned char lo = 0x80, hi = 0xBF;
  if (c >= 0xC2 && c <= 0xDF) {
    len = 2;
  } else if (c >= 0xE0 && c <= 0xEF) {
    len = 3;
    if (c == 0xE0) lo = 0xA0;
    if (c == 0xED) hi = 0x9F;
  } else if (c >= 0xF0 && c <= 0xF4) {
    len = 4;
    if (c == 0xF0) lo = 0x90;
    if (c == 0xF4) hi = 0x8F;
  } else {
    return 0;
  }
  if (avail < len) return 0;
  if (p[1] < lo || p[1] > hi) return 0;
  for (size_t i = 2; i < len; i++) {
    if (p[i] < 0x80 || p[i] > 0xBF) return 0;
  }
  return len;
}

}  // namespace

std::string SanitizeUtf8(const std::string& in) {
  static const char kReplacement[] = "\xEF\xBF\xBD";
  std::string out;
  out.reserve(in.size());
  const auto* p = reinterpret_cast<const unsigned char*>(in.data());
  size_t i = 0;
  while (i < in.size()) {
    size_t len = Utf8SequenceLength(p + i, in.size() - i);
    if (len == 0) {
      out += kReplacement;
      i++;
    } else {
      out.append(in, i, len);
      i += len;
    }
  }
  return out;
}

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

std::string EncodeRequest(int64_t id, const std::string& method, const nlohmann::json& params) {
  nlohmann::json j;
  j["jsonrpc"] = kJsonRpcVersion;
  j["id"] = id;
  j["method"] = method;
  if (!params.is_null()) j["params"] = params;
  return Line(j);
}

std::string EncodeNotification(const std::string& method, const nlohmann::json& params) {
  nlohmann::json j;
  j["jsonrpc"] = kJsonRpcVersion;
  j["method"] = method;
  if (!params.is_null()) j["params"] = params;
  return Line(j);
}

std::string EncodeResult(int64_t id, const nlohmann::json& result) {
  nlohmann::json j;
  j["jsonrpc"] = kJsonRpcVersion;
  j["id"] = id;
  j["result"] = result;
  return Line(j);
}

std::string EncodeError(int64_t id, int code, const std::string& message) {
  nlohmann::json j;
  j["jsonrpc"] = kJsonRpcVersion;
  j["id"] = id;
  j["error"] = {{"code", code}, {"message", message}};
  return Line(j);
}

std::optional<WireMessage> DecodeLine(const std::string& line, std::string* err) {
  auto j = nlohmann::json::parse(SanitizeUtf8(line), nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = "invalid json";
    return std::nullopt;
  }
  if (!j.is_object()) {
    if (err) *err = "not a json-rpc object";
    return std::nullopt;
  }

  WireMessage msg;
  if (j.contains("id") && !j["id"].is_null()) {
    int64_t id = 0;
    if (!ParseId(j["id"], &id)) {
      if (err) *err = "unsupported id: " + j["id"].dump();
      return std::nullopt;
    }
    msg.id = id;
  }

  if (j.contains("method") && j["method"].is_string()) {
    msg.method = j["method"].get<std::string>();
    msg.kind = msg.id ? WireKind::kRequest : WireKind::kNotification;
    if (j.contains("params")) msg.params = j["params"];
    return msg;
  }

  if (!msg.id) {
    if (err) *err = "message has neither id nor method";
    return std::nullopt;
  }

  msg.kind = WireKind::kResponse;
  if (j.contains("error") && j["error"].is_object()) {
    const auto& e = j["error"];
    RpcError re;
    if (e.contains("code") && e["code"].is_number_integer()) re.code = e["code"].get<int>();
    if (e.contains("message") && e["message"].is_string()) re.message = e["message"].get<std::string>();
    if (re.message.empty()) re.message = "json-rpc error";
    if (e.contains("data")) re.data = e["data"];
    msg.error = std::move(re);
    return msg;
  }
  if (!j.contains("result")) {
    if (err) *err = "response has neither result nor error";
    return std::nullopt;
  }
  msg.result = j["result"];
  return msg;
}

void LineReader::Append(const char* data, size_t n) {
  buf_.append(data, n);
}

bool LineReader::Next(std::string* line) {
  auto pos = buf_.find('\n');
  if (pos == std::string::npos) return false;
  line->assign(buf_, 0, pos);
  buf_.erase(0, pos + 1);
  if (!line->empty() && line->back() == '\r') line->pop_back();
  return true;
}

bool LineReader::Flush(std::string* line) {
  if (buf_.empty()) return false;
  *line = std::move(buf_);
  buf_.clear();
  if (!line->empty() && line->back() == '\r') line->pop_back();
  return true;
}

}  // namespace mcpdock
