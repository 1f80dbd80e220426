#pragma once

#include <cstdint>

namespace wscoro {

enum class closure_state : std::uint8_t {
  /// The consumer or the reconnect strategy ended the session on purpose.
  normal,
  /// Backend error, abnormal close code, or transport cancellation.
  abnormal,
};

enum class status_kind : std::uint8_t {
  connecting,
  connected,
  closed,
};

/// Connection status as observed by the consumer.
///
/// State diagram:
///
///   closed(normal) --connect()--> connecting --connected event--> connected
///        ^                            |                               |
///        |                            v                               v
///        +------ disconnect() --- closed(normal | abnormal) <--- disconnected / error
///
/// Transition rules:
/// - Only the controller's single update path writes the status.
/// - Writing the current value again is a no-op (no side effects, no notification).
/// - connect() is accepted only from `closed`; there is no connecting -> connecting self-loop.
/// - There is no terminal state; a client cycles through these states until destroyed.
///
/// `closure` is meaningful only when `kind == closed` and is normalized to `normal` otherwise so
/// that equality compares exactly the three observable states.
struct status {
  status_kind kind{status_kind::closed};
  closure_state closure{closure_state::normal};

  [[nodiscard]] static constexpr auto connecting() noexcept -> status {
    return status{status_kind::connecting, closure_state::normal};
  }

  [[nodiscard]] static constexpr auto connected() noexcept -> status {
    return status{status_kind::connected, closure_state::normal};
  }

  [[nodiscard]] static constexpr auto closed(closure_state s) noexcept -> status {
    return status{status_kind::closed, s};
  }

  [[nodiscard]] constexpr auto is_connecting() const noexcept -> bool {
    return kind == status_kind::connecting;
  }

  [[nodiscard]] constexpr auto is_connected() const noexcept -> bool {
    return kind == status_kind::connected;
  }

  [[nodiscard]] constexpr auto is_closed() const noexcept -> bool {
    return kind == status_kind::closed;
  }

  [[nodiscard]] constexpr auto is_abnormal_closed() const noexcept -> bool {
    return kind == status_kind::closed && closure == closure_state::abnormal;
  }

  friend constexpr auto operator==(status const&, status const&) -> bool = default;
};

constexpr auto to_string(closure_state s) noexcept -> char const* {
  switch (s) {
    case closure_state::normal:
      return "normal";
    case closure_state::abnormal:
      return "abnormal";
    default:
      return "unknown";
  }
}

constexpr auto to_string(status s) noexcept -> char const* {
  switch (s.kind) {
    case status_kind::connecting:
      return "connecting";
    case status_kind::connected:
      return "connected";
    case status_kind::closed:
      return s.closure == closure_state::normal ? "normal_closed" : "abnormal_closed";
    default:
      return "unknown";
  }
}

}  // namespace wscoro
