#pragma once

#include <string>

namespace mcpdock {

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 2375;
  std::string base_path;
  // Set for unix:// endpoints; host/port are then unused.
  std::string unix_socket;
};

struct DockConfig {
  std::string runtime_binary = "docker";
  HttpEndpoint engine;
  bool debug = false;
  int init_timeout_seconds = 60;
  int requirement_timeout_seconds = 30;
  int requirement_poll_ms = 100;
  std::string protocol_version = "2025-03-26";
  std::string client_name = "docker";
  std::string client_version = "1.0.0";
};

HttpEndpoint ParseEngineEndpoint(const std::string& url);
HttpEndpoint DefaultEngineEndpoint();

DockConfig LoadConfigFromEnv();

bool TryParseBool(const std::string& s, bool* out);

}  // namespace mcpdock
