#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace wscoro {

/// Outgoing frames handed to backend::write().
namespace frames {

struct ping {
  friend auto operator==(ping const&, ping const&) -> bool = default;
};

struct text {
  std::string payload{};
  friend auto operator==(text const&, text const&) -> bool = default;
};

struct data {
  std::vector<std::byte> payload{};
  friend auto operator==(data const&, data const&) -> bool = default;
};

}  // namespace frames

using frame = std::variant<frames::ping, frames::text, frames::data>;

inline auto to_string(frame const& f) -> char const* {
  if (std::holds_alternative<frames::ping>(f)) {
    return "ping";
  }
  if (std::holds_alternative<frames::text>(f)) {
    return "text";
  }
  return "data";
}

}  // namespace wscoro
