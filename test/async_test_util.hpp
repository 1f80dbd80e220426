#pragma once

#include <iocoro/co_sleep.hpp>
#include <iocoro/co_spawn.hpp>
#include <iocoro/expected.hpp>
#include <iocoro/io_context.hpp>
#include <iocoro/work_guard.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <utility>

namespace wscoro::test_util {

inline void fail_and_stop_on_exception(std::exception_ptr eptr) {
  if (!eptr) {
    return;
  }
  try {
    std::rethrow_exception(eptr);
  } catch (std::exception const& e) {
    ADD_FAILURE() << "Unhandled exception in spawned coroutine: " << e.what();
  } catch (...) {
    ADD_FAILURE() << "Unhandled unknown exception in spawned coroutine";
  }
}

/// Run a coroutine on the given io_context until completion.
///
/// - Uses completion-token `co_spawn` so exceptions are captured and reported
/// - The work guard is released when the coroutine finishes; ctx.run() then drains whatever
///   the coroutine left behind (client teardown, stopped timers)
template <class Factory>
inline void run_async(iocoro::io_context& ctx, Factory&& factory) {
  auto guard = iocoro::make_work_guard(ctx);

  iocoro::co_spawn(
    ctx.get_executor(),
    [f = std::forward<Factory>(factory)]() mutable -> iocoro::awaitable<void> { co_await f(); },
    [&](iocoro::expected<void, std::exception_ptr> r) mutable {
      guard.reset();
      if (!r) {
        fail_and_stop_on_exception(r.error());
      }
    });

  ctx.run();
}

/// Poll `pred` every `step` until it holds. Returns false if `timeout` elapses first.
template <class Pred>
inline auto wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds{2},
                       std::chrono::milliseconds step = std::chrono::milliseconds{2})
  -> iocoro::awaitable<bool> {
  auto const deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      co_return false;
    }
    co_await iocoro::co_sleep(step);
  }
  co_return true;
}

}  // namespace wscoro::test_util
