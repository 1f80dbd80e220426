#pragma once

#include <wscoro/backend.hpp>
#include <wscoro/channel.hpp>
#include <wscoro/config.hpp>
#include <wscoro/delegate.hpp>
#include <wscoro/detail/actor_executor.hpp>
#include <wscoro/error_info.hpp>
#include <wscoro/expected.hpp>
#include <wscoro/logger.hpp>
#include <wscoro/network_watcher.hpp>
#include <wscoro/path_monitor.hpp>
#include <wscoro/reconnect_strategy.hpp>
#include <wscoro/status.hpp>
#include <wscoro/timer.hpp>

#include <iocoro/awaitable.hpp>
#include <iocoro/io_executor.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

namespace wscoro::detail {

/// Resilient connection actor behind wscoro::client.
///
/// High-level model:
/// - A background actor (`actor_loop`) runs two strand-bound loops: `event_loop` drains the
///   backend's event stream, `network_loop` drains debounced network path updates.
/// - Two timers hang off the same strand: the one-shot reconnect timer and the repeating
///   auto-ping timer. At most one of each exists at any time.
/// - User entry points (connect/disconnect/send) switch onto the strand first, so every
///   "status is X, therefore do Y" decision is made by one writer.
///
/// Status write authority (CRITICAL):
/// - Only update_status() writes `status_`; it is a no-op for the current value.
/// - update_status() stores, then applies side effects (on_status_changed()), then notifies.
///
/// Reconnect count rules:
/// - Incremented by exactly one when a reconnect attempt actually starts a connect.
/// - Reset when the status becomes `connected`, when it becomes `closed(normal)`, on
///   disconnect(), and when an event is not considered a reason to reconnect.
/// - Preserved across `closed(abnormal)` so backoff keeps escalating.
///
/// Lifetime:
/// - actor_loop() keeps the controller alive via shared_from_this() until shutdown().
/// - Timers and the network watcher only hold weak references back to the controller.
/// - Entry points pin the controller for the duration of their coroutine.
/// - Tasks started from timer fires (reconnect connect, auto-ping write) pin the controller and
///   run under its stop token, not the timer's.
class controller : public std::enable_shared_from_this<controller> {
 public:
  controller(iocoro::io_executor ex, config cfg, std::unique_ptr<backend> be,
             std::unique_ptr<path_monitor> monitor,
             std::shared_ptr<reconnect_strategy const> strategy);

  controller(controller const&) = delete;
  auto operator=(controller const&) -> controller& = delete;

  ~controller() noexcept = default;

  /// Spawn the actor and subscribe to the network watcher. Called once by client.
  auto start() -> void;

  /// Detach the delegate, then stop consuming events and path updates, cancel both timers and
  /// unsubscribe from the watcher. Safe from any thread; the strand-bound part is posted.
  /// Entry points that reach the strand afterwards fail with `error::operation_aborted`.
  auto shutdown() -> void;

  /// Start a connection attempt.
  ///
  /// Returns true when the attempt was initiated (status was closed and is now connecting),
  /// false when rejected because a connection is already in flight or open.
  auto connect() -> iocoro::awaitable<bool>;

  /// Intentional close. Always cancels auto-ping and any pending reconnect (resetting the
  /// reconnect count) before asking the backend to close.
  auto disconnect(close_code code, std::optional<std::string> reason) -> iocoro::awaitable<void>;

  /// Write a frame. Rejected with `error::not_connected` unless the status is `connected`.
  /// A backend that throws yields `error::write_failed`.
  auto send(frame f) -> iocoro::awaitable<write_result>;

  auto set_delegate(client_delegate* d) noexcept -> void {
    delegate_.store(d, std::memory_order_release);
  }

  [[nodiscard]] auto current_status() const noexcept -> status {
    return status_snapshot_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto reconnect_count() const noexcept -> std::uint32_t {
    return count_snapshot_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto has_reconnect_timer() const noexcept -> bool {
    return reconnect_timer_snapshot_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto has_auto_ping_timer() const noexcept -> bool {
    return auto_ping_timer_snapshot_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto current_path() const noexcept -> network_path {
    return watcher_->current_path();
  }

  [[nodiscard]] auto get_config() const noexcept -> config const& { return cfg_; }

  /// Format a log line once and send it to both the global logger and the delegate.
  template <typename... Args>
  auto emit_log(log_level level, std::string_view file, int line,
                format_impl::format_string<Args...> fmt, Args&&... args) -> void {
    auto* d = delegate_.load(std::memory_order_acquire);
    if (d == nullptr && !get_logger().should_log(level)) {
      return;
    }
    auto message = format_impl::format(fmt, std::forward<Args>(args)...);
    get_logger().log(level, message, file, line);
    notify_delegate([&](client_delegate& del) {
      del.did_output_log(log_record{.level = level, .message = message});
    });
  }

 private:
  // -------------------- actor --------------------

  auto actor_loop() -> iocoro::awaitable<void>;
  auto event_loop() -> iocoro::awaitable<void>;
  auto network_loop() -> iocoro::awaitable<void>;

  /// Release timers and subscriptions. Strand only; idempotent.
  auto teardown() -> void;

  /// Run `op(*this)` as its own strand task under the controller's stop token.
  template <typename Op>
  auto spawn_on_strand(char const* what, Op op) -> void;

  // -------------------- inputs --------------------

  auto handle_event(event ev) -> iocoro::awaitable<void>;
  auto handle_network_path(network_path path) -> iocoro::awaitable<void>;

  // -------------------- status --------------------

  auto update_status(status next) -> void;
  auto on_status_changed(status next) -> void;

  // -------------------- connect / disconnect --------------------

  /// Synchronous half of connect(): status check and the `connecting` transition.
  auto begin_connect() -> bool;

  /// Await backend::connect(); a thrown failure is republished as `events::error`.
  auto backend_connect() -> iocoro::awaitable<void>;

  auto do_disconnect(close_code code, std::optional<std::string> reason)
    -> iocoro::awaitable<void>;

  // -------------------- reconnect --------------------

  auto reconnect(reconnect_reason reason, bool immediate) -> iocoro::awaitable<void>;
  auto schedule_reconnect(reconnect_reason reason, std::chrono::milliseconds interval)
    -> iocoro::awaitable<void>;
  /// Start one attempt: `connecting` transition, count, notification. The backend connect itself
  /// is spawned so it outlives the timer fire that triggered it.
  auto execute_reconnect(reconnect_reason reason) -> void;
  auto destroy_reconnect_timer(bool reset_count) -> void;
  auto set_reconnect_count(std::uint32_t n) noexcept -> void;

  // -------------------- auto-ping --------------------

  auto enable_auto_ping() -> void;
  auto disable_auto_ping() -> void;
  auto send_auto_ping() -> iocoro::awaitable<void>;

  template <typename F>
  auto notify_delegate(F&& fn) -> void {
    auto* d = delegate_.load(std::memory_order_acquire);
    if (d == nullptr) {
      return;
    }
    try {
      fn(*d);
    } catch (std::exception const& e) {
      WSCORO_LOG_ERROR("delegate.callback.threw what={}", e.what());
    }
  }

  auto set_status(status next) noexcept -> void {
    status_ = next;
    status_snapshot_.store(next, std::memory_order_release);
  }

  auto sync_timer_snapshots() noexcept -> void {
    reconnect_timer_snapshot_.store(reconnect_timer_ != nullptr, std::memory_order_release);
    auto_ping_timer_snapshot_.store(auto_ping_timer_ != nullptr, std::memory_order_release);
  }

 private:
  config cfg_;
  actor_executor executor_;
  std::unique_ptr<backend> backend_;
  std::shared_ptr<network_watcher> watcher_;
  std::shared_ptr<reconnect_strategy const> strategy_;

  // Strand-only state.
  status status_{status::closed(closure_state::normal)};
  std::uint32_t reconnect_count_{0};
  std::unique_ptr<async_timer> reconnect_timer_{};
  std::unique_ptr<async_timer> auto_ping_timer_{};
  bool torn_down_{false};

  // Debounced path updates handed from the watcher to network_loop().
  channel<network_path> path_inbox_{};

  std::stop_source stop_{};
  std::atomic<client_delegate*> delegate_{nullptr};

  // Snapshots for thread-safe diagnostics.
  std::atomic<status> status_snapshot_{status::closed(closure_state::normal)};
  std::atomic<std::uint32_t> count_snapshot_{0};
  std::atomic<bool> reconnect_timer_snapshot_{false};
  std::atomic<bool> auto_ping_timer_snapshot_{false};
};

}  // namespace wscoro::detail

/// Log through the controller so the delegate sees the line too. Use inside controller members.
#define WSCORO_ACTOR_LOG(level, fmt, ...) \
  emit_log(::wscoro::log_level::level, __FILE__, __LINE__, fmt __VA_OPT__(, ) __VA_ARGS__)

#include <wscoro/impl/controller/actor_loops.ipp>
#include <wscoro/impl/controller/core.ipp>
#include <wscoro/impl/controller/network.ipp>
#include <wscoro/impl/controller/reconnect.ipp>
