#pragma once

#include <wscoro/error.hpp>
#include <wscoro/reconnect_strategy.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>

namespace wscoro {

namespace detail {

/// Uniform sample in [0, 1) from a per-thread xorshift64* generator.
inline auto jitter_unit(std::uint32_t salt) noexcept -> double {
  static thread_local std::uint64_t state = 0x4d595df4d0f33173ULL;
  state ^= (static_cast<std::uint64_t>(salt) << 1);
  state ^= (state >> 12);
  state ^= (state << 25);
  state ^= (state >> 27);
  return static_cast<double>((state * 2685821657736338717ULL) >> 11) *
         (1.0 / 9007199254740992.0);
}

inline auto to_delay(double ms) -> std::chrono::milliseconds {
  const auto out = static_cast<std::int64_t>(std::llround(ms));
  if (out <= 0) {
    return std::chrono::milliseconds{0};
  }
  return std::chrono::milliseconds{out};
}

inline auto invalid_strategy(char const* what) -> std::system_error {
  return std::system_error{make_error_code(error::invalid_configuration), what};
}

/// Gating shared by every built-in delaying policy.
inline auto gate(std::uint32_t attempt_count, std::uint32_t max_retry_count,
                 network_path const& path) -> std::optional<reconnect_method> {
  if (!path.is_satisfied()) {
    return none_for_unsatisfied_network();
  }
  if (attempt_count >= max_retry_count) {
    return none_for_max_retry_count();
  }
  return std::nullopt;
}

}  // namespace detail

inline auto to_string(reconnect_reason const& reason) -> std::string {
  if (auto const* e = std::get_if<reconnect_reasons::suggested_by_event>(&reason)) {
    return "suggested by event (" + to_string(e->ev) + ")";
  }
  return "network recovery (" + to_string(std::get<reconnect_reasons::network_recovery>(reason).path) +
         ")";
}

inline auto to_string(reconnect_method const& method) -> std::string {
  if (auto const* n = std::get_if<reconnect_methods::none>(&method)) {
    return "none (" + n->reason + ")";
  }
  return "delay " +
         std::to_string(std::get<reconnect_methods::delay>(method).interval.count()) + "ms";
}

// -------------------- no_reconnect_strategy --------------------

inline auto no_reconnect_strategy::reconnect_method_for(reconnect_reason const&, std::uint32_t,
                                                        network_path const&) const
  -> reconnect_method {
  return reconnect_methods::none{"Reconnect disabled"};
}

inline auto no_reconnect_strategy::should_reconnect_immediately_when_network_recovered(
  network_path const&) const -> bool {
  return false;
}

inline auto no_reconnect_strategy::should_reconnect_when_receiving_event(event const&) const
  -> bool {
  return false;
}

// -------------------- exponential_reconnect_strategy --------------------

inline exponential_reconnect_strategy::exponential_reconnect_strategy(options opts)
    : opts_(opts) {
  if (opts_.scale.count() < 0 || opts_.max_retry_interval.count() < 0) {
    throw detail::invalid_strategy("exponential strategy: negative scale or max interval");
  }
  if (!(opts_.jitter >= 0.0 && opts_.jitter <= 1.0)) {
    throw detail::invalid_strategy("exponential strategy: jitter must be within [0, 1]");
  }
}

inline auto exponential_reconnect_strategy::base_delay(std::uint32_t attempt_count) const
  -> std::chrono::milliseconds {
  const auto factor = std::pow(static_cast<double>(opts_.base), static_cast<double>(attempt_count));
  const auto delay_ms = factor * static_cast<double>(opts_.scale.count());
  const auto max_ms = static_cast<double>(opts_.max_retry_interval.count());
  return detail::to_delay(std::min(delay_ms, max_ms));
}

inline auto exponential_reconnect_strategy::reconnect_method_for(reconnect_reason const&,
                                                                 std::uint32_t attempt_count,
                                                                 network_path const& path) const
  -> reconnect_method {
  if (auto gated = detail::gate(attempt_count, opts_.max_retry_count, path)) {
    return *gated;
  }

  auto delay_ms = static_cast<double>(base_delay(attempt_count).count());
  if (delay_ms > 0.0 && opts_.jitter > 0.0) {
    const double unit = detail::jitter_unit(attempt_count);
    delay_ms += delay_ms * opts_.jitter * (2.0 * unit - 1.0);
  }
  return reconnect_methods::delay{detail::to_delay(std::max(delay_ms, 0.0))};
}

// -------------------- fixed_delay_reconnect_strategy --------------------

inline fixed_delay_reconnect_strategy::fixed_delay_reconnect_strategy(options opts)
    : opts_(opts) {
  if (opts_.delay.count() < 0) {
    throw detail::invalid_strategy("fixed strategy: negative delay");
  }
}

inline auto fixed_delay_reconnect_strategy::reconnect_method_for(reconnect_reason const&,
                                                                 std::uint32_t attempt_count,
                                                                 network_path const& path) const
  -> reconnect_method {
  if (auto gated = detail::gate(attempt_count, opts_.max_retry_count, path)) {
    return *gated;
  }
  return reconnect_methods::delay{opts_.delay};
}

// -------------------- linear_delay_reconnect_strategy --------------------

inline linear_delay_reconnect_strategy::linear_delay_reconnect_strategy(options opts)
    : opts_(opts) {
  if (opts_.delay.count() < 0 || opts_.max_retry_interval.count() < 0) {
    throw detail::invalid_strategy("linear strategy: negative delay or max interval");
  }
}

inline auto linear_delay_reconnect_strategy::reconnect_method_for(reconnect_reason const&,
                                                                  std::uint32_t attempt_count,
                                                                  network_path const& path) const
  -> reconnect_method {
  if (auto gated = detail::gate(attempt_count, opts_.max_retry_count, path)) {
    return *gated;
  }
  const auto delay_ms =
    static_cast<double>(opts_.delay.count()) * static_cast<double>(attempt_count);
  const auto max_ms = static_cast<double>(opts_.max_retry_interval.count());
  return reconnect_methods::delay{detail::to_delay(std::min(delay_ms, max_ms))};
}

}  // namespace wscoro
