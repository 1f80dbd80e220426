#pragma once

#include <wscoro/error.hpp>

#include <string>

namespace wscoro {
namespace detail {

struct error_category_impl : std::error_category {
  auto name() const noexcept -> char const* override { return "wscoro"; }

  auto message(int ev) const -> std::string override {
    // clang-format off
    switch (static_cast<error>(ev)) {
      case error::operation_aborted:     return "Operation aborted.";
      case error::not_connected:         return "Not connected.";
      case error::write_failed:          return "Failed to write frame.";
      case error::backend_failure:       return "Backend transport failure.";
      case error::invalid_configuration: return "Invalid configuration.";
      default:                           return "wscoro error.";
    }
    // clang-format on
  }
};

inline auto category() -> std::error_category const& {
  static error_category_impl instance;
  return instance;
}

}  // namespace detail

inline auto make_error_code(error e) -> std::error_code {
  return std::error_code{static_cast<int>(e), detail::category()};
}

}  // namespace wscoro
