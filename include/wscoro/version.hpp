#pragma once

#define WSCORO_VERSION_MAJOR 0
#define WSCORO_VERSION_MINOR 1
#define WSCORO_VERSION_PATCH 0

namespace wscoro {

inline constexpr char const* version = "0.1.0";

}  // namespace wscoro
