#pragma once

#include <wscoro/close_code.hpp>
#include <wscoro/error_info.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace wscoro {

/// Events produced by a backend, in the order the transport observed them.
namespace events {

struct connected {
  std::map<std::string, std::string> headers{};
  friend auto operator==(connected const&, connected const&) -> bool = default;
};

struct disconnected {
  std::optional<std::string> reason{};
  close_code code{close_code::normal_closure};
  friend auto operator==(disconnected const&, disconnected const&) -> bool = default;
};

struct text {
  std::string payload{};
  friend auto operator==(text const&, text const&) -> bool = default;
};

struct data {
  std::vector<std::byte> payload{};
  friend auto operator==(data const&, data const&) -> bool = default;
};

struct pong {
  friend auto operator==(pong const&, pong const&) -> bool = default;
};

struct error {
  error_info info{};
  friend auto operator==(error const&, error const&) -> bool = default;
};

/// The transport task was cancelled underneath the backend.
struct cancelled {
  friend auto operator==(cancelled const&, cancelled const&) -> bool = default;
};

/// The peer dropped the TCP stream without a close handshake.
struct peer_closed {
  friend auto operator==(peer_closed const&, peer_closed const&) -> bool = default;
};

/// The backend believes a better path exists and a reconnect would help.
struct reconnect_suggested {
  bool suggested{false};
  friend auto operator==(reconnect_suggested const&, reconnect_suggested const&) -> bool = default;
};

}  // namespace events

using event = std::variant<events::connected, events::disconnected, events::text, events::data,
                           events::pong, events::error, events::cancelled, events::peer_closed,
                           events::reconnect_suggested>;

/// True for events that can only be observed on an open connection.
inline auto is_connected(event const& ev) noexcept -> bool {
  return std::holds_alternative<events::connected>(ev) ||
         std::holds_alternative<events::text>(ev) || std::holds_alternative<events::data>(ev) ||
         std::holds_alternative<events::pong>(ev);
}

/// True for events that end the session through failure.
inline auto is_abnormal_closed(event const& ev) noexcept -> bool {
  if (auto const* d = std::get_if<events::disconnected>(&ev)) {
    return is_abnormal(d->code);
  }
  return std::holds_alternative<events::error>(ev) ||
         std::holds_alternative<events::cancelled>(ev) ||
         std::holds_alternative<events::peer_closed>(ev);
}

inline auto is_reconnect_suggested(event const& ev) noexcept -> bool {
  auto const* r = std::get_if<events::reconnect_suggested>(&ev);
  return r != nullptr && r->suggested;
}

inline auto to_string(event const& ev) -> std::string {
  return std::visit(
    [](auto const& e) -> std::string {
      using T = std::decay_t<decltype(e)>;
      if constexpr (std::is_same_v<T, events::connected>) {
        std::string out{"connected with headers: {"};
        bool first = true;
        for (auto const& [k, v] : e.headers) {
          if (!first) {
            out += ", ";
          }
          first = false;
          out += k + ": " + v;
        }
        return out + "}";
      } else if constexpr (std::is_same_v<T, events::disconnected>) {
        return "disconnected with close code: " +
               std::to_string(static_cast<unsigned>(e.code)) +
               ", reason: " + e.reason.value_or("none");
      } else if constexpr (std::is_same_v<T, events::text>) {
        return "text: " + e.payload;
      } else if constexpr (std::is_same_v<T, events::data>) {
        return "data of " + std::to_string(e.payload.size()) + " bytes";
      } else if constexpr (std::is_same_v<T, events::pong>) {
        return "pong";
      } else if constexpr (std::is_same_v<T, events::error>) {
        return "error: " + e.info.to_string();
      } else if constexpr (std::is_same_v<T, events::cancelled>) {
        return "cancelled";
      } else if constexpr (std::is_same_v<T, events::peer_closed>) {
        return "peer closed";
      } else {
        return std::string{"reconnect suggested: "} + (e.suggested ? "true" : "false");
      }
    },
    ev);
}

}  // namespace wscoro
