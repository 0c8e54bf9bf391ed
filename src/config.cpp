#include "config.hpp"

#include <cstdlib>
#include <string>

namespace mcpdock {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParsePositiveInt(const std::string& s, int* out) {
  if (s.empty() || !out) return false;
  char* end = nullptr;
  long n = std::strtol(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0') return false;
  if (n <= 0 || n > 86400000L) return false;
  *out = static_cast<int>(n);
  return true;
}

}  // namespace

HttpEndpoint DefaultEngineEndpoint() {
  return ParseEngineEndpoint("unix:///var/run/docker.sock");
}

HttpEndpoint ParseEngineEndpoint(const std::string& url) {
  HttpEndpoint ep;
  std::string s = url;
  if (StartsWith(s, "unix://")) {
    ep.scheme = "unix";
    ep.unix_socket = s.substr(7);
    ep.host = "localhost";
    ep.port = 80;
    return ep;
  }
  if (StartsWith(s, "tcp://")) {
    ep.scheme = "http";
    s = s.substr(6);
  } else if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  if (ep.base_path == "/") ep.base_path.clear();

  ep.port = 0;
  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = 2375;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

DockConfig LoadConfigFromEnv() {
  DockConfig cfg;
  cfg.engine = DefaultEngineEndpoint();

  if (auto rt = GetEnvStr("MCPDOCK_RUNTIME"); !rt.empty()) cfg.runtime_binary = rt;
  if (auto host = GetEnvStr("DOCKER_HOST"); !host.empty()) cfg.engine = ParseEngineEndpoint(host);

  if (auto debug = GetEnvStr("MCPDOCK_DEBUG"); !debug.empty()) {
    bool b = false;
    if (TryParseBool(debug, &b)) cfg.debug = b;
  }

  int n = 0;
  if (TryParsePositiveInt(GetEnvStr("MCPDOCK_INIT_TIMEOUT"), &n)) cfg.init_timeout_seconds = n;
  if (TryParsePositiveInt(GetEnvStr("MCPDOCK_REQUIREMENT_TIMEOUT"), &n)) cfg.requirement_timeout_seconds = n;
  if (TryParsePositiveInt(GetEnvStr("MCPDOCK_REQUIREMENT_POLL_MS"), &n)) cfg.requirement_poll_ms = n;

  if (auto pv = GetEnvStr("MCPDOCK_PROTOCOL_VERSION"); !pv.empty()) cfg.protocol_version = pv;

  return cfg;
}

}  // namespace mcpdock
