#pragma once

#include <system_error>
#include <type_traits>

namespace wscoro {

enum class error {
  /// The client was shut down before the operation could run.
  /// Returned by send()/ping() once the owning client is being destroyed.
  operation_aborted = 1,

  /// The operation requires the `connected` status.
  /// Returned by send()/ping() while connecting or closed; the frame is dropped, not queued.
  not_connected,

  /// The backend threw while writing a frame. `cause_ec` carries the backend's error_code when
  /// it threw a std::system_error.
  write_failed,

  /// The backend raised a transport-level failure that has no more specific code.
  backend_failure,

  /// Construction parameters were rejected (negative interval, non-positive timeout, empty url,
  /// missing collaborator).
  invalid_configuration,
};

inline auto make_error_code(error e) -> std::error_code;

}  // namespace wscoro

namespace std {

template <>
struct is_error_code_enum<wscoro::error> : std::true_type {};

}  // namespace std

#include <wscoro/impl/error.ipp>
