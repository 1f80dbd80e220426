#pragma once

#include <wscoro/error.hpp>

#include <exception>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace wscoro {

/// Error value carried by expected<> results and `event::error`.
///
/// - `code`: stable error_code (wscoro or backend category)
/// - `detail`: human-oriented context, may be empty
/// - `cause_ec`: optional lower-level error_code (e.g. from the socket layer)
struct error_info {
  std::error_code code{};
  std::string detail{};
  std::error_code cause_ec{};

  error_info() = default;

  explicit error_info(std::error_code c) : code(c) {}

  error_info(std::error_code c, std::string d) : code(c), detail(std::move(d)) {}

  template <typename Errc>
    requires requires(Errc e) { std::error_code{e}; }
  explicit error_info(Errc e) : code(std::error_code{e}) {}

  template <typename Errc>
    requires requires(Errc e) { std::error_code{e}; }
  error_info(Errc e, std::string d) : code(std::error_code{e}), detail(std::move(d)) {}

  auto append_detail(std::string_view s) -> error_info& {
    if (s.empty()) {
      return *this;
    }
    if (!detail.empty()) {
      detail += " ";
    }
    detail.append(s.data(), s.size());
    return *this;
  }

  auto set_cause(std::error_code ec) -> error_info& {
    cause_ec = ec;
    return *this;
  }

  [[nodiscard]] auto to_string() const -> std::string {
    std::string out = code ? std::string{code.category().name()} + ": " + code.message()
                           : std::string{"unknown error"};

    if (!detail.empty()) {
      out += " (" + detail + ")";
    } else if (cause_ec) {
      out += " (cause=";
      out += cause_ec.category().name();
      out += ": " + cause_ec.message() + ")";
    }
    return out;
  }

  friend auto operator==(error_info const& a, error_info const& b) -> bool {
    return a.code == b.code && a.detail == b.detail && a.cause_ec == b.cause_ec;
  }
};

/// Convert an in-flight exception into an error_info tagged `backend_failure`.
///
/// Used where a backend or delegate call throws across the controller boundary.
inline auto error_info_from_exception(std::exception_ptr ep, std::string_view context)
  -> error_info {
  error_info out{error::backend_failure};
  out.append_detail(context);
  if (ep == nullptr) {
    return out;
  }
  try {
    std::rethrow_exception(ep);
  } catch (std::system_error const& e) {
    out.set_cause(e.code());
    out.append_detail(e.what());
  } catch (std::exception const& e) {
    out.append_detail(e.what());
  } catch (...) {
    out.append_detail("unknown exception");
  }
  return out;
}

}  // namespace wscoro
