#pragma once

#include <cstdint>
#include <string>

namespace wscoro {

enum class path_status : std::uint8_t {
  satisfied,
  unsatisfied,
  /// The path may become usable once a connection is brought up (e.g. on-demand VPN).
  requires_connection,
};

constexpr auto to_string(path_status s) noexcept -> char const* {
  switch (s) {
    case path_status::satisfied:
      return "satisfied";
    case path_status::unsatisfied:
      return "unsatisfied";
    case path_status::requires_connection:
      return "requires_connection";
    default:
      return "unknown";
  }
}

/// Snapshot of the host's network reachability.
struct network_path {
  path_status status{path_status::unsatisfied};
  bool is_expensive{false};
  bool is_constrained{false};
  /// Set by network_watcher on the first update delivered after fire().
  bool is_first_update{false};

  [[nodiscard]] constexpr auto is_satisfied() const noexcept -> bool {
    return status == path_status::satisfied;
  }

  friend constexpr auto operator==(network_path const&, network_path const&) -> bool = default;
};

[[nodiscard]] constexpr auto satisfied_path() noexcept -> network_path {
  return network_path{.status = path_status::satisfied};
}

[[nodiscard]] constexpr auto unsatisfied_path() noexcept -> network_path {
  return network_path{.status = path_status::unsatisfied};
}

inline auto to_string(network_path const& p) -> std::string {
  std::string out{"path("};
  out += wscoro::to_string(p.status);
  if (p.is_expensive) {
    out += ", expensive";
  }
  if (p.is_constrained) {
    out += ", constrained";
  }
  if (p.is_first_update) {
    out += ", first";
  }
  out += ")";
  return out;
}

}  // namespace wscoro
