#pragma once

#include <wscoro/network_path.hpp>

#include <functional>

namespace wscoro {

/// Platform reachability source (netlink, SCNetworkReachability, NWPathMonitor, ...).
///
/// Contract:
/// - start() begins monitoring and reports the current path as its first update.
/// - The handler may be invoked from any thread.
/// - After cancel() returns the handler is not invoked again.
/// - start() may be called again after cancel().
class path_monitor {
 public:
  using update_handler = std::function<void(network_path)>;

  virtual ~path_monitor() = default;

  [[nodiscard]] virtual auto current_path() const -> network_path = 0;

  virtual void start(update_handler handler) = 0;

  virtual void cancel() = 0;
};

}  // namespace wscoro
