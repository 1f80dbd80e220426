#pragma once

#include <wscoro/event.hpp>
#include <wscoro/network_path.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>
#include <variant>

namespace wscoro {

/// Why the controller is considering a reconnect. Informational only.
namespace reconnect_reasons {

struct suggested_by_event {
  event ev{};
  friend auto operator==(suggested_by_event const&, suggested_by_event const&) -> bool = default;
};

struct network_recovery {
  network_path path{};
  friend auto operator==(network_recovery const&, network_recovery const&) -> bool = default;
};

}  // namespace reconnect_reasons

using reconnect_reason =
  std::variant<reconnect_reasons::suggested_by_event, reconnect_reasons::network_recovery>;

inline auto to_string(reconnect_reason const& reason) -> std::string;

/// Output of a reconnect strategy.
namespace reconnect_methods {

/// Do not reconnect; `reason` is logged.
struct none {
  std::string reason{};
  friend auto operator==(none const&, none const&) -> bool = default;
};

/// Reconnect after `interval`. A non-positive interval is treated as "do not reconnect".
struct delay {
  std::chrono::milliseconds interval{0};
  friend auto operator==(delay const&, delay const&) -> bool = default;
};

}  // namespace reconnect_methods

using reconnect_method = std::variant<reconnect_methods::none, reconnect_methods::delay>;

[[nodiscard]] inline auto none_for_unsatisfied_network() -> reconnect_method {
  return reconnect_methods::none{"Network not satisfied"};
}

[[nodiscard]] inline auto none_for_max_retry_count() -> reconnect_method {
  return reconnect_methods::none{"Max retry count reached"};
}

inline auto to_string(reconnect_method const& method) -> std::string;

/// Pluggable reconnect policy.
///
/// A strategy is a pure decision object: it owns no timers and has no side effects apart from
/// the jitter random source. The controller calls it on its strand only.
///
/// Default behavior (overridable):
/// - reconnect on network recovery without waiting, if the recovered path is satisfied
/// - reconnect after events that denote an abnormal close or an explicit reconnect suggestion
class reconnect_strategy {
 public:
  virtual ~reconnect_strategy() = default;

  /// Primary decision: whether and after how long to attempt the next reconnect.
  ///
  /// `attempt_count` is the number of attempts already issued since the last successful
  /// connection or explicit disconnect.
  [[nodiscard]] virtual auto reconnect_method_for(reconnect_reason const& reason,
                                                  std::uint32_t attempt_count,
                                                  network_path const& path) const
    -> reconnect_method = 0;

  [[nodiscard]] virtual auto should_reconnect_immediately_when_network_recovered(
    network_path const& path) const -> bool {
    return path.is_satisfied();
  }

  [[nodiscard]] virtual auto should_reconnect_when_receiving_event(event const& ev) const -> bool {
    return is_abnormal_closed(ev) || is_reconnect_suggested(ev);
  }
};

/// Never reconnects.
class no_reconnect_strategy final : public reconnect_strategy {
 public:
  [[nodiscard]] auto reconnect_method_for(reconnect_reason const& reason,
                                          std::uint32_t attempt_count,
                                          network_path const& path) const
    -> reconnect_method override;

  [[nodiscard]] auto should_reconnect_immediately_when_network_recovered(
    network_path const& path) const -> bool override;

  [[nodiscard]] auto should_reconnect_when_receiving_event(event const& ev) const
    -> bool override;
};

/// delay = min(base^attempt * scale, max_retry_interval), then +/- delay * jitter (uniform).
class exponential_reconnect_strategy final : public reconnect_strategy {
 public:
  struct options {
    std::uint32_t base{2};
    std::chrono::milliseconds scale{500};
    std::uint32_t max_retry_count{std::numeric_limits<std::uint32_t>::max()};
    std::chrono::milliseconds max_retry_interval{std::chrono::minutes{10}};
    /// Fraction of the computed delay used as symmetric jitter, in [0, 1].
    double jitter{0.2};
  };

  exponential_reconnect_strategy() : exponential_reconnect_strategy(options{}) {}
  explicit exponential_reconnect_strategy(options opts);

  [[nodiscard]] auto reconnect_method_for(reconnect_reason const& reason,
                                          std::uint32_t attempt_count,
                                          network_path const& path) const
    -> reconnect_method override;

  /// Un-jittered delay for `attempt_count`, clipped at max_retry_interval.
  [[nodiscard]] auto base_delay(std::uint32_t attempt_count) const -> std::chrono::milliseconds;

  [[nodiscard]] auto get_options() const noexcept -> options const& { return opts_; }

 private:
  options opts_;
};

/// Constant delay between attempts.
class fixed_delay_reconnect_strategy final : public reconnect_strategy {
 public:
  struct options {
    std::chrono::milliseconds delay{std::chrono::seconds{5}};
    std::uint32_t max_retry_count{std::numeric_limits<std::uint32_t>::max()};
  };

  explicit fixed_delay_reconnect_strategy(options opts);

  [[nodiscard]] auto reconnect_method_for(reconnect_reason const& reason,
                                          std::uint32_t attempt_count,
                                          network_path const& path) const
    -> reconnect_method override;

 private:
  options opts_;
};

/// delay = min(linear_delay * attempt, max_retry_interval).
class linear_delay_reconnect_strategy final : public reconnect_strategy {
 public:
  struct options {
    std::chrono::milliseconds delay{std::chrono::seconds{1}};
    std::uint32_t max_retry_count{std::numeric_limits<std::uint32_t>::max()};
    std::chrono::milliseconds max_retry_interval{std::chrono::minutes{10}};
  };

  explicit linear_delay_reconnect_strategy(options opts);

  [[nodiscard]] auto reconnect_method_for(reconnect_reason const& reason,
                                          std::uint32_t attempt_count,
                                          network_path const& path) const
    -> reconnect_method override;

 private:
  options opts_;
};

}  // namespace wscoro

#include <wscoro/impl/reconnect_strategy.ipp>
