#pragma once

#include <wscoro/event.hpp>
#include <wscoro/logger.hpp>
#include <wscoro/network_path.hpp>
#include <wscoro/reconnect_strategy.hpp>
#include <wscoro/status.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace wscoro {

/// One log line emitted by a client, mirrored to its delegate.
struct log_record {
  log_level level{log_level::info};
  std::string message{};
};

/// Observer of a single client. Every method defaults to a no-op.
///
/// Lifetime: the client stores a non-owning pointer (see client::set_delegate()); the delegate
/// must outlive the client or be detached with set_delegate(nullptr) first. No callback is made
/// once the client's destructor has returned.
///
/// Threading: callbacks run on the client's strand, one at a time, in the order the client
/// observed the underlying facts. Implementations should return quickly and must not block.
/// An exception thrown from a callback is logged and discarded.
class client_delegate {
 public:
  virtual ~client_delegate() = default;

  /// Called after the status changed and its side effects (timers) were applied.
  virtual void did_update_status(status) {}

  /// Called for every backend event, after the event's status transition.
  virtual void did_receive_event(event const&) {}

  /// Called for every log line of this client, regardless of the global log level.
  virtual void did_output_log(log_record const&) {}

  /// A reconnect attempt was scheduled `delay` from now (zero means right away).
  virtual void will_reconnect(reconnect_reason const&, std::chrono::milliseconds) {}

  /// A reconnect attempt was issued; `attempt` counts attempts since the last success.
  virtual void did_reconnect(reconnect_reason const&, std::uint32_t) {}

  virtual void did_send_auto_ping() {}

  /// Called for every debounced network path update, before any reconnect decision.
  virtual void did_update_network_path(network_path const&) {}
};

}  // namespace wscoro
