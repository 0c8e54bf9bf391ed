#include "image_client.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <sys/socket.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace mcpdock {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep, int connect_timeout_seconds,
                                                   int read_timeout_seconds) {
  std::unique_ptr<httplib::Client> cli;
  if (!ep.unix_socket.empty()) {
    cli = std::make_unique<httplib::Client>(ep.unix_socket);
    cli->set_address_family(AF_UNIX);
  } else {
    cli = std::make_unique<httplib::Client>(ep.host, ep.port);
  }
  cli->set_connection_timeout(connect_timeout_seconds);
  cli->set_read_timeout(read_timeout_seconds);
  cli->set_write_timeout(30);
  return cli;
}

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

static std::string PercentEncode(const std::string& in) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(in.size());
  for (unsigned char c : in) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0f]);
    }
  }
  return out;
}

// The engine reports pull failures inside a 200 progress stream.
static std::string FindStreamError(const std::string& body) {
  std::istringstream iss(body);
  std::string line;
  while (std::getline(iss, line)) {
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) continue;
    if (j.contains("error") && j["error"].is_string()) return j["error"].get<std::string>();
    if (j.contains("errorDetail") && j["errorDetail"].is_object() && j["errorDetail"].contains("message") &&
        j["errorDetail"]["message"].is_string()) {
      return j["errorDetail"]["message"].get<std::string>();
    }
  }
  return {};
}

static std::string EngineMessage(const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (!j.is_discarded() && j.is_object() && j.contains("message") && j["message"].is_string()) {
    return j["message"].get<std::string>();
  }
  return body;
}

}  // namespace

ImageRef SplitImageRef(const std::string& image) {
  ImageRef ref;
  if (image.find('@') != std::string::npos) {
    ref.repo = image;
    return ref;
  }
  auto slash = image.rfind('/');
  auto colon = image.rfind(':');
  if (colon != std::string::npos && (slash == std::string::npos || colon > slash)) {
    ref.repo = image.substr(0, colon);
    ref.tag = image.substr(colon + 1);
  } else {
    ref.repo = image;
    ref.tag = "latest";
  }
  return ref;
}

ImageClient::ImageClient(HttpEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

void ImageClient::SetTimeouts(int connect_seconds, int read_seconds) {
  if (connect_seconds > 0) connect_timeout_seconds_ = connect_seconds;
  if (read_seconds > 0) read_timeout_seconds_ = read_seconds;
}

bool ImageClient::Pull(const std::string& image, std::string* err) {
  auto ref = SplitImageRef(image);
  std::string path = "/images/create?fromImage=" + PercentEncode(ref.repo);
  if (!ref.tag.empty()) path += "&tag=" + PercentEncode(ref.tag);

  auto cli = MakeClient(endpoint_, connect_timeout_seconds_, read_timeout_seconds_);
  auto res = cli->Post(JoinPath(endpoint_.base_path, path), "", "application/json");
  if (!res) {
    if (err) *err = "pulling image " + image + ": failed to connect to engine (" + httplib::to_string(res.error()) + ")";
    return false;
  }
  std::cerr << "[image] pull image=" << image << " status=" << res->status << "\n";
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "pulling image " + image + ": http " + std::to_string(res->status) + " " + EngineMessage(res->body);
    return false;
  }
  auto stream_err = FindStreamError(res->body);
  if (!stream_err.empty()) {
    if (err) *err = "pulling image " + image + ": " + stream_err;
    return false;
  }
  return true;
}

bool ImageClient::Remove(const std::string& image, bool force, std::string* err) {
  std::string path = "/images/" + image;
  if (force) path += "?force=1";

  auto cli = MakeClient(endpoint_, connect_timeout_seconds_, 60);
  auto res = cli->Delete(JoinPath(endpoint_.base_path, path));
  if (!res) {
    if (err) *err = "removing image " + image + ": failed to connect to engine (" + httplib::to_string(res.error()) + ")";
    return false;
  }
  std::cerr << "[image] remove image=" << image << " status=" << res->status << "\n";
  if (res->status == 404) return true;
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "removing image " + image + ": http " + std::to_string(res->status) + " " + EngineMessage(res->body);
    return false;
  }
  return true;
}

}  // namespace mcpdock
