#pragma once

#include <chrono>
#include <map>
#include <string>

namespace wscoro {

/// What the backend should connect to. Passed unchanged to backend::connect().
struct request {
  /// ws:// or wss:// URL.
  std::string url{};

  /// Extra HTTP headers for the upgrade request.
  std::map<std::string, std::string> headers{};

  /// Upper bound the backend applies to the opening handshake. Must be positive.
  std::chrono::milliseconds connect_timeout{std::chrono::seconds{5}};
};

}  // namespace wscoro
