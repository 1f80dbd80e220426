#pragma once

#include <wscoro/error.hpp>
#include <wscoro/error_info.hpp>
#include <wscoro/expected.hpp>
#include <wscoro/request.hpp>

#include <chrono>
#include <string>

namespace wscoro {

/// Immutable client configuration.
///
/// The backend, path monitor and reconnect strategy are passed to the client constructor
/// separately since they are owned objects, not values.
struct config {
  /// Connection target handed to backend::connect().
  request target{};

  /// Period of the keep-alive ping while connected.
  ///
  /// - 0 disables auto-ping.
  /// - The first ping is sent as soon as the connection is established.
  /// - Must not be negative.
  std::chrono::milliseconds auto_ping_interval{0};

  /// Settling window applied to network path updates.
  ///
  /// - 0 delivers every raw update immediately.
  /// - Otherwise only the last update of a burst is delivered, `network_debounce` after the
  ///   burst ends.
  /// - Must not be negative.
  std::chrono::milliseconds network_debounce{0};
};

/// Check construction parameters. Returns `error::invalid_configuration` with a detail naming
/// the first offending field.
inline auto validate(config const& cfg) -> expected<void, error_info> {
  if (cfg.target.url.empty()) {
    return unexpected(error_info{error::invalid_configuration, "target.url is empty"});
  }
  if (cfg.target.connect_timeout.count() <= 0) {
    return unexpected(
      error_info{error::invalid_configuration, "target.connect_timeout must be positive"});
  }
  if (cfg.auto_ping_interval.count() < 0) {
    return unexpected(
      error_info{error::invalid_configuration, "auto_ping_interval must not be negative"});
  }
  if (cfg.network_debounce.count() < 0) {
    return unexpected(
      error_info{error::invalid_configuration, "network_debounce must not be negative"});
  }
  return {};
}

}  // namespace wscoro
