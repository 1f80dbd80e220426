#pragma once

#include <wscoro/channel.hpp>
#include <wscoro/close_code.hpp>
#include <wscoro/event.hpp>
#include <wscoro/expected.hpp>
#include <wscoro/frame.hpp>
#include <wscoro/request.hpp>

#include <iocoro/awaitable.hpp>

#include <optional>
#include <string>

namespace wscoro {

/// Stream of transport events consumed by the client's event loop.
using event_stream = channel<event>;

/// WebSocket transport driven by the client.
///
/// The backend performs the opening handshake, framing and socket I/O. The client never
/// inspects frames on the wire; it only reacts to the events the backend publishes.
///
/// Contract:
/// - connect() starts opening a connection and may complete before the connection is open.
///   Success or failure is reported through events() (`connected`, `disconnected`, `error`).
/// - disconnect() starts a close handshake; the resulting `disconnected` event is published
///   through events() as well.
/// - write() reports transport failures as an error value.
/// - events() stays the same object for the lifetime of the backend; the client is its only
///   consumer and closes it when it shuts down.
///
/// A backend is owned by exactly one client. Exceptions escaping connect()/disconnect()/write()
/// are caught by the client and reported as `events::error` or as a log record.
class backend {
 public:
  virtual ~backend() = default;

  virtual auto connect(request const& req) -> iocoro::awaitable<void> = 0;

  virtual auto disconnect(close_code code, std::optional<std::string> reason)
    -> iocoro::awaitable<void> = 0;

  virtual auto write(frame f) -> iocoro::awaitable<write_result> = 0;

  virtual auto events() -> event_stream& = 0;
};

}  // namespace wscoro
