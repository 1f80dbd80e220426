#pragma once

#include <wscoro/error_info.hpp>
#include <wscoro/logger.hpp>
#include <wscoro/timer.hpp>

#include <iocoro/co_spawn.hpp>
#include <iocoro/expected.hpp>
#include <iocoro/steady_timer.hpp>
#include <iocoro/when_any.hpp>

#include <exception>
#include <utility>

namespace wscoro {

inline void async_timer::run_state::notify_cancelled() {
  if (cancel_notified) {
    return;
  }
  cancel_notified = true;
  if (on_cancel) {
    on_cancel();
  }
}

inline async_timer::async_timer(detail::actor_executor ex, std::chrono::milliseconds interval,
                                timer_mode mode, bool fires_immediately, handler_type handler,
                                cancel_handler_type on_cancel)
    : executor_(std::move(ex)),
      interval_(interval),
      mode_(mode),
      fires_immediately_(fires_immediately),
      handler_(std::move(handler)),
      on_cancel_(std::move(on_cancel)) {}

inline async_timer::~async_timer() { stop(); }

inline void async_timer::start() {
  stop();
  if (mode_ == timer_mode::repeating && interval_.count() <= 0) {
    WSCORO_LOG_WARNING("timer.start.rejected reason=non_positive_repeat_interval interval_ms={}",
                       interval_.count());
    return;
  }

  auto st = std::make_shared<run_state>();
  st->handler = handler_;
  st->on_cancel = on_cancel_;
  current_ = st;

  auto params = run_params{
    .interval = interval_,
    .mode = mode_,
    .fires_immediately = fires_immediately_,
  };
  auto io_ex = executor_.get_io_executor();
  iocoro::co_spawn(
    executor_.strand().executor(), st->stop.get_token(),
    [st, io_ex, params]() mutable -> iocoro::awaitable<void> {
      co_await run(st, io_ex, params);
    },
    [](iocoro::expected<void, std::exception_ptr> r) {
      if (!r) {
        auto err = error_info_from_exception(r.error(), "timer handler");
        WSCORO_LOG_ERROR("timer.run.failed detail={}", err.to_string());
      }
    });
}

inline void async_timer::stop() {
  if (!current_) {
    return;
  }
  current_->stop.request_stop();
  current_->wakeup.notify();
  current_.reset();
}

inline void async_timer::set_interval(std::chrono::milliseconds interval) {
  interval_ = interval;
  restart();
}

inline auto async_timer::is_running() const noexcept -> bool {
  if (!current_) {
    return false;
  }
  return mode_ == timer_mode::repeating || !current_->fired_once;
}

inline auto async_timer::sleep(run_state& st, iocoro::io_executor io_ex,
                               std::chrono::milliseconds d) -> iocoro::awaitable<void> {
  // wakeup is a counting event: a wake only means "re-check", the full delay still applies
  // unless stop was requested.
  const auto deadline = std::chrono::steady_clock::now() + d;
  auto tok = st.stop.get_token();
  iocoro::steady_timer timer{io_ex};

  while (!tok.stop_requested()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }

    timer.expires_after(std::chrono::ceil<std::chrono::milliseconds>(deadline - now));
    auto timer_wait = timer.async_wait(iocoro::use_awaitable);
    auto wake_wait = st.wakeup.async_wait();
    (void)co_await iocoro::when_any(std::move(timer_wait), std::move(wake_wait));
  }
}

inline auto async_timer::run(std::shared_ptr<run_state> st, iocoro::io_executor io_ex,
                             run_params p) -> iocoro::awaitable<void> {
  auto tok = st->stop.get_token();
  bool skip_wait = p.fires_immediately;

  for (;;) {
    if (!skip_wait) {
      co_await sleep(*st, io_ex, p.interval);
    }
    skip_wait = false;

    if (tok.stop_requested()) {
      st->notify_cancelled();
      co_return;
    }

    st->fired_once = true;
    if (st->handler) {
      co_await st->handler();
    }

    if (p.mode == timer_mode::one_shot) {
      co_return;
    }
  }
}

}  // namespace wscoro
