#pragma once

#include <wscoro/assert.hpp>
#include <wscoro/detail/controller.hpp>

#include <iocoro/co_spawn.hpp>
#include <iocoro/expected.hpp>
#include <iocoro/this_coro.hpp>

#include <exception>
#include <utility>

namespace wscoro::detail {

inline controller::controller(iocoro::io_executor ex, config cfg, std::unique_ptr<backend> be,
                              std::unique_ptr<path_monitor> monitor,
                              std::shared_ptr<reconnect_strategy const> strategy)
    : cfg_(std::move(cfg)),
      executor_(ex),
      backend_(std::move(be)),
      watcher_(std::make_shared<network_watcher>(executor_, std::move(monitor),
                                                 cfg_.network_debounce)),
      strategy_(std::move(strategy)) {
  WSCORO_ENSURE(backend_ != nullptr, "controller requires a backend");
  WSCORO_ENSURE(strategy_ != nullptr, "controller requires a reconnect strategy");
}

inline auto controller::shutdown() -> void {
  // Detach first: anything already queued on the strand may still run before teardown, and the
  // delegate is allowed to die as soon as the client is gone.
  delegate_.store(nullptr, std::memory_order_release);

  // Thread-safe part: unblock both loops. The strand-bound cleanup is posted.
  stop_.request_stop();
  path_inbox_.close();
  backend_->events().close();

  executor_.strand().executor().post([self = shared_from_this()]() { self->teardown(); });
}

inline auto controller::teardown() -> void {
  if (torn_down_) {
    return;
  }
  torn_down_ = true;

  disable_auto_ping();
  if (reconnect_timer_) {
    reconnect_timer_->stop();
    reconnect_timer_.reset();
  }
  sync_timer_snapshots();
  watcher_->invalidate();
  path_inbox_.close();
  backend_->events().close();
  WSCORO_LOG_DEBUG("client.teardown status={}", to_string(status_));
}

template <typename Op>
auto controller::spawn_on_strand(char const* what, Op op) -> void {
  auto self = shared_from_this();
  iocoro::co_spawn(
    executor_.strand().executor(), stop_.get_token(),
    [self, op = std::move(op)]() mutable -> iocoro::awaitable<void> { co_await op(*self); },
    [what](iocoro::expected<void, std::exception_ptr> r) {
      if (!r) {
        auto err = error_info_from_exception(r.error(), what);
        WSCORO_LOG_ERROR("client.task.failed detail={}", err.to_string());
      }
    });
}

// -------------------- status --------------------

inline auto controller::update_status(status next) -> void {
  if (next == status_) {
    return;
  }
  auto const prev = status_;
  set_status(next);
  WSCORO_ACTOR_LOG(info, "status.transition from={} to={}", to_string(prev), to_string(next));

  on_status_changed(next);
  notify_delegate([&](client_delegate& d) { d.did_update_status(next); });
}

inline auto controller::on_status_changed(status next) -> void {
  switch (next.kind) {
    case status_kind::connected:
      enable_auto_ping();
      destroy_reconnect_timer(true);
      break;
    case status_kind::closed:
      disable_auto_ping();
      // Abnormal closure keeps the attempt count so backoff keeps escalating.
      destroy_reconnect_timer(next.closure == closure_state::normal);
      break;
    case status_kind::connecting:
      break;
  }
}

// -------------------- connect / disconnect / send --------------------

inline auto controller::begin_connect() -> bool {
  if (!status_.is_closed()) {
    WSCORO_ACTOR_LOG(warning, "connect.rejected status={}", to_string(status_));
    return false;
  }
  WSCORO_ACTOR_LOG(debug, "connect.begin url={}", cfg_.target.url);
  update_status(status::connecting());
  return true;
}

inline auto controller::backend_connect() -> iocoro::awaitable<void> {
  std::exception_ptr failure{};
  try {
    co_await backend_->connect(cfg_.target);
  } catch (...) {
    failure = std::current_exception();
  }

  if (failure) {
    // Route the failure through the event stream so it is ordered with transport events.
    auto err = error_info_from_exception(failure, "backend connect");
    WSCORO_ACTOR_LOG(error, "connect.failed detail={}", err.to_string());
    (void)backend_->events().push(events::error{std::move(err)});
  }
}

inline auto controller::connect() -> iocoro::awaitable<bool> {
  auto self = shared_from_this();
  co_await iocoro::this_coro::switch_to(executor_.strand().executor());

  if (stop_.stop_requested()) {
    WSCORO_LOG_DEBUG("connect.aborted reason=shutdown");
    co_return false;
  }
  if (!begin_connect()) {
    co_return false;
  }
  co_await backend_connect();
  co_return true;
}

inline auto controller::do_disconnect(close_code code, std::optional<std::string> reason)
  -> iocoro::awaitable<void> {
  WSCORO_ACTOR_LOG(debug, "disconnect.begin code={} reason={}", to_string(code),
                   reason.value_or(""));
  disable_auto_ping();
  destroy_reconnect_timer(true);

  std::exception_ptr failure{};
  try {
    co_await backend_->disconnect(code, std::move(reason));
  } catch (...) {
    failure = std::current_exception();
  }
  if (failure) {
    auto err = error_info_from_exception(failure, "backend disconnect");
    WSCORO_ACTOR_LOG(error, "disconnect.failed detail={}", err.to_string());
  }
}

inline auto controller::disconnect(close_code code, std::optional<std::string> reason)
  -> iocoro::awaitable<void> {
  auto self = shared_from_this();
  co_await iocoro::this_coro::switch_to(executor_.strand().executor());
  co_await do_disconnect(code, std::move(reason));
}

inline auto controller::send(frame f) -> iocoro::awaitable<write_result> {
  auto self = shared_from_this();
  co_await iocoro::this_coro::switch_to(executor_.strand().executor());

  if (stop_.stop_requested()) {
    WSCORO_LOG_DEBUG("send.aborted frame={} reason=shutdown", to_string(f));
    co_return write_result{unexpect, error_info{error::operation_aborted}};
  }
  if (!status_.is_connected()) {
    WSCORO_ACTOR_LOG(warning, "send.rejected frame={} status={}", to_string(f),
                     to_string(status_));
    co_return write_result{unexpect, error_info{error::not_connected}};
  }

  auto const kind = to_string(f);
  write_result r{};
  std::exception_ptr failure{};
  try {
    r = co_await backend_->write(std::move(f));
  } catch (...) {
    failure = std::current_exception();
  }
  if (failure) {
    auto err = error_info_from_exception(failure, "backend write");
    err.code = make_error_code(error::write_failed);
    r = write_result{unexpect, std::move(err)};
  }
  if (!r) {
    WSCORO_ACTOR_LOG(warning, "send.failed frame={} detail={}", kind, r.error().to_string());
  }
  co_return r;
}

// -------------------- auto-ping --------------------

inline auto controller::enable_auto_ping() -> void {
  disable_auto_ping();
  WSCORO_ASSERT(!auto_ping_timer_);
  if (cfg_.auto_ping_interval.count() <= 0) {
    return;
  }

  auto_ping_timer_ = std::make_unique<async_timer>(
    executor_, cfg_.auto_ping_interval, timer_mode::repeating, true,
    [weak = weak_from_this()]() -> iocoro::awaitable<void> {
      // The write must not run under the timer's stop token: stopping the timer only cancels
      // future pings.
      if (auto self = weak.lock()) {
        self->spawn_on_strand("auto ping",
                              [](controller& c) { return c.send_auto_ping(); });
      }
      co_return;
    });
  auto_ping_timer_->start();
  sync_timer_snapshots();
  WSCORO_ACTOR_LOG(debug, "auto_ping.enabled interval_ms={}", cfg_.auto_ping_interval.count());
}

inline auto controller::disable_auto_ping() -> void {
  if (!auto_ping_timer_) {
    return;
  }
  auto_ping_timer_->stop();
  auto_ping_timer_.reset();
  sync_timer_snapshots();
  WSCORO_ACTOR_LOG(debug, "auto_ping.disabled");
}

inline auto controller::send_auto_ping() -> iocoro::awaitable<void> {
  // Auto-ping was disabled between the fire and this task running.
  if (!auto_ping_timer_ || !status_.is_connected()) {
    co_return;
  }
  auto r = co_await send(frames::ping{});
  if (!r) {
    WSCORO_ACTOR_LOG(debug, "auto_ping.dropped detail={}", r.error().to_string());
  }
  notify_delegate([](client_delegate& d) { d.did_send_auto_ping(); });
}

}  // namespace wscoro::detail
