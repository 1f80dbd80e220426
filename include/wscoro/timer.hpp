#pragma once

#include <wscoro/detail/actor_executor.hpp>

#include <iocoro/awaitable.hpp>
#include <iocoro/condition_event.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>

namespace wscoro {

enum class timer_mode : std::uint8_t {
  /// Fire once after `interval`, then complete.
  one_shot,
  /// Fire every `interval` until stopped.
  repeating,
};

/// Cancelable, restartable delayed execution on a strand.
///
/// Each start() creates a fresh run that owns a stop source, a wakeup event and copies of the
/// handlers. stop() requests stop on the current run, wakes its sleep and forgets it; a run that
/// observes the stop request exits without touching the timer object again, so the timer may be
/// destroyed while a run is still unwinding.
///
/// Cancellation contract:
/// - The stop flag is checked on the strand immediately before every handler invocation.
///   Since stop() is also called on the strand, no handler starts after stop() returns.
/// - A handler already running when stop() is called completes; a repeating run exits right
///   after it.
/// - The cancel handler runs at most once per run, only when the run observes a stop request.
///   A one-shot run that fired normally never invokes it.
///
/// Thread-safety: not thread-safe. All member functions must be called on the strand passed
/// at construction.
class async_timer {
 public:
  using handler_type = std::function<iocoro::awaitable<void>()>;
  using cancel_handler_type = std::function<void()>;

  async_timer(detail::actor_executor ex, std::chrono::milliseconds interval, timer_mode mode,
              bool fires_immediately, handler_type handler, cancel_handler_type on_cancel = {});

  async_timer(async_timer const&) = delete;
  auto operator=(async_timer const&) -> async_timer& = delete;

  ~async_timer();

  /// Cancel any current run, then schedule a new one.
  void start();

  /// Cancel the current run. Safe to call when idle.
  void stop();

  void restart() {
    stop();
    start();
  }

  /// Update the period and restart.
  void set_interval(std::chrono::milliseconds interval);

  /// True from start() until stop(), or until a one-shot run has invoked its handler.
  [[nodiscard]] auto is_running() const noexcept -> bool;

  [[nodiscard]] auto interval() const noexcept -> std::chrono::milliseconds { return interval_; }

  [[nodiscard]] auto mode() const noexcept -> timer_mode { return mode_; }

 private:
  struct run_state {
    std::stop_source stop{};
    iocoro::condition_event wakeup{};
    handler_type handler;
    cancel_handler_type on_cancel;
    bool fired_once{false};
    bool cancel_notified{false};

    void notify_cancelled();
  };

  struct run_params {
    std::chrono::milliseconds interval;
    timer_mode mode;
    bool fires_immediately;
  };

  static auto run(std::shared_ptr<run_state> st, iocoro::io_executor io_ex, run_params p)
    -> iocoro::awaitable<void>;

  static auto sleep(run_state& st, iocoro::io_executor io_ex, std::chrono::milliseconds d)
    -> iocoro::awaitable<void>;

  detail::actor_executor executor_;
  std::chrono::milliseconds interval_;
  timer_mode mode_;
  bool fires_immediately_;
  handler_type handler_;
  cancel_handler_type on_cancel_;
  std::shared_ptr<run_state> current_{};
};

}  // namespace wscoro

#include <wscoro/impl/timer.ipp>
