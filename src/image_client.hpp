#pragma once

#include "config.hpp"

#include <string>

namespace mcpdock {

struct ImageRef {
  std::string repo;
  // Empty for digest references.
  std::string tag;
};

ImageRef SplitImageRef(const std::string& image);

// Image pulls and removals through the container engine's HTTP API.
class ImageClient {
 public:
  explicit ImageClient(HttpEndpoint endpoint);

  bool Pull(const std::string& image, std::string* err);
  bool Remove(const std::string& image, bool force, std::string* err);

  void SetTimeouts(int connect_seconds, int read_seconds);

 private:
  HttpEndpoint endpoint_;
  int connect_timeout_seconds_ = 5;
  int read_timeout_seconds_ = 900;
};

}  // namespace mcpdock
