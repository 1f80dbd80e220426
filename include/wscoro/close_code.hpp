#pragma once

#include <cstdint>

namespace wscoro {

/// WebSocket close codes (RFC 6455 section 7.4.1).
///
/// `invalid` stands for "no code" and for any number outside the table.
enum class close_code : std::uint16_t {
  invalid = 0,
  normal_closure = 1000,
  going_away = 1001,
  protocol_error = 1002,
  unsupported_data = 1003,
  no_status_received = 1005,
  abnormal_closure = 1006,
  invalid_frame_payload_data = 1007,
  policy_violation = 1008,
  message_too_big = 1009,
  mandatory_extension_missing = 1010,
  internal_server_error = 1011,
  tls_handshake_failure = 1015,
};

/// Only normal_closure, going_away and mandatory_extension_missing end a session intentionally.
constexpr auto is_abnormal(close_code code) noexcept -> bool {
  switch (code) {
    case close_code::normal_closure:
    case close_code::going_away:
    case close_code::mandatory_extension_missing:
      return false;
    default:
      return true;
  }
}

constexpr auto close_code_from(std::uint16_t raw) noexcept -> close_code {
  switch (raw) {
    case 1000:
    case 1001:
    case 1002:
    case 1003:
    case 1005:
    case 1006:
    case 1007:
    case 1008:
    case 1009:
    case 1010:
    case 1011:
    case 1015:
      return static_cast<close_code>(raw);
    default:
      return close_code::invalid;
  }
}

constexpr auto to_string(close_code code) noexcept -> char const* {
  switch (code) {
    case close_code::invalid:
      return "invalid";
    case close_code::normal_closure:
      return "normal_closure";
    case close_code::going_away:
      return "going_away";
    case close_code::protocol_error:
      return "protocol_error";
    case close_code::unsupported_data:
      return "unsupported_data";
    case close_code::no_status_received:
      return "no_status_received";
    case close_code::abnormal_closure:
      return "abnormal_closure";
    case close_code::invalid_frame_payload_data:
      return "invalid_frame_payload_data";
    case close_code::policy_violation:
      return "policy_violation";
    case close_code::message_too_big:
      return "message_too_big";
    case close_code::mandatory_extension_missing:
      return "mandatory_extension_missing";
    case close_code::internal_server_error:
      return "internal_server_error";
    case close_code::tls_handshake_failure:
      return "tls_handshake_failure";
    default:
      return "unknown";
  }
}

}  // namespace wscoro
