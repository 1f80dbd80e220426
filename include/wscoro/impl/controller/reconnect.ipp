#pragma once

#include <wscoro/assert.hpp>
#include <wscoro/detail/controller.hpp>

#include <chrono>
#include <utility>
#include <variant>

namespace wscoro::detail {

inline auto controller::set_reconnect_count(std::uint32_t n) noexcept -> void {
  reconnect_count_ = n;
  count_snapshot_.store(n, std::memory_order_release);
}

inline auto controller::destroy_reconnect_timer(bool reset_count) -> void {
  if (reconnect_timer_) {
    reconnect_timer_->stop();
    reconnect_timer_.reset();
    sync_timer_snapshots();
    WSCORO_ACTOR_LOG(verbose, "reconnect.timer.destroyed reset_count={}", reset_count);
  }
  if (reset_count) {
    set_reconnect_count(0);
  }
}

inline auto controller::reconnect(reconnect_reason reason, bool immediate)
  -> iocoro::awaitable<void> {
  // An attempt is already in flight; a second one would double-connect.
  if (status_.is_connecting()) {
    WSCORO_ACTOR_LOG(debug, "reconnect.skipped reason=already_connecting cause={}",
                     to_string(reason));
    co_return;
  }

  auto const method =
    strategy_->reconnect_method_for(reason, reconnect_count_, watcher_->current_path());
  if (auto const* none = std::get_if<reconnect_methods::none>(&method)) {
    WSCORO_ACTOR_LOG(debug, "reconnect.none detail={} cause={}", none->reason,
                     to_string(reason));
    co_return;
  }

  auto const interval = std::get<reconnect_methods::delay>(method).interval;
  if (interval.count() <= 0) {
    WSCORO_ACTOR_LOG(debug, "reconnect.none detail=no valid delay cause={}", to_string(reason));
    co_return;
  }

  if (status_.is_connected()) {
    co_await do_disconnect(close_code::normal_closure, std::nullopt);
  }

  co_await schedule_reconnect(std::move(reason),
                              immediate ? std::chrono::milliseconds{0} : interval);
}

inline auto controller::schedule_reconnect(reconnect_reason reason,
                                           std::chrono::milliseconds interval)
  -> iocoro::awaitable<void> {
  WSCORO_ACTOR_LOG(debug, "reconnect.schedule interval_ms={} attempts={} cause={}",
                   interval.count(), reconnect_count_, to_string(reason));

  // The old timer is gone before the new one exists.
  destroy_reconnect_timer(false);
  WSCORO_ASSERT(!reconnect_timer_, "at most one reconnect timer");
  notify_delegate([&](client_delegate& d) { d.will_reconnect(reason, interval); });

  if (interval.count() <= 0) {
    execute_reconnect(std::move(reason));
    co_return;
  }

  reconnect_timer_ = std::make_unique<async_timer>(
    executor_, interval, timer_mode::one_shot, false,
    [weak = weak_from_this(), reason]() -> iocoro::awaitable<void> {
      if (auto self = weak.lock()) {
        self->execute_reconnect(reason);
      }
      co_return;
    });
  reconnect_timer_->start();
  sync_timer_snapshots();
}

inline auto controller::execute_reconnect(reconnect_reason reason) -> void {
  // Lost the race against a user connect() or a connected event: not an attempt.
  if (!begin_connect()) {
    return;
  }

  set_reconnect_count(reconnect_count_ + 1);
  auto const attempt = reconnect_count_;
  WSCORO_ACTOR_LOG(info, "reconnect.attempt index={} cause={}", attempt, to_string(reason));
  notify_delegate([&](client_delegate& d) { d.did_reconnect(reason, attempt); });

  // Runs under the controller's stop token: the connected event destroys the reconnect timer
  // while backend::connect() may still be suspended.
  spawn_on_strand("reconnect attempt", [](controller& c) { return c.backend_connect(); });
}

}  // namespace wscoro::detail
