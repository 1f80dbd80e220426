#pragma once

#include <wscoro/detail/controller.hpp>

#include <iocoro/bind_executor.hpp>
#include <iocoro/co_spawn.hpp>
#include <iocoro/expected.hpp>
#include <iocoro/this_coro.hpp>
#include <iocoro/when_all.hpp>

#include <exception>
#include <type_traits>
#include <utility>
#include <variant>

namespace wscoro::detail {

inline auto controller::start() -> void {
  auto ex = executor_.strand().executor();
  auto self = shared_from_this();
  iocoro::co_spawn(
    ex, stop_.get_token(),
    [self, ex]() mutable -> iocoro::awaitable<void> {
      // Keep the controller alive until the actor completes.
      co_return co_await iocoro::bind_executor(ex, self->actor_loop());
    },
    [self, ex](iocoro::expected<void, std::exception_ptr> r) mutable {
      ex.post([self = std::move(self), r = std::move(r)]() mutable {
        if (!r) {
          auto err = error_info_from_exception(r.error(), "client actor");
          WSCORO_LOG_ERROR("client.actor.failed detail={}", err.to_string());
        }
        self->teardown();
      });
    });
}

inline auto controller::actor_loop() -> iocoro::awaitable<void> {
  auto parent_stop = co_await iocoro::this_coro::stop_token;
  auto ex = executor_.strand().executor();
  WSCORO_LOG_DEBUG("client.actor.start url={}", cfg_.target.url);

  watcher_->on_change([weak = weak_from_this()](network_path const& path) {
    if (auto self = weak.lock()) {
      (void)self->path_inbox_.push(path);
    }
  });
  watcher_->fire();

  auto event_task = iocoro::co_spawn(ex, parent_stop, iocoro::bind_executor(ex, event_loop()),
                                     iocoro::use_awaitable);
  auto network_task = iocoro::co_spawn(ex, parent_stop,
                                       iocoro::bind_executor(ex, network_loop()),
                                       iocoro::use_awaitable);

  (void)co_await iocoro::when_all(std::move(event_task), std::move(network_task));

  WSCORO_LOG_DEBUG("client.actor.end");
  teardown();
}

inline auto controller::event_loop() -> iocoro::awaitable<void> {
  auto tok = co_await iocoro::this_coro::stop_token;
  WSCORO_LOG_DEBUG("client.event_loop.start");
  while (!tok.stop_requested()) {
    auto ev = co_await backend_->events().async_next();
    if (!ev || tok.stop_requested()) {
      break;
    }
    co_await handle_event(std::move(*ev));
  }
  WSCORO_LOG_DEBUG("client.event_loop.stop");
}

inline auto controller::network_loop() -> iocoro::awaitable<void> {
  auto tok = co_await iocoro::this_coro::stop_token;
  WSCORO_LOG_DEBUG("client.network_loop.start");
  while (!tok.stop_requested()) {
    auto path = co_await path_inbox_.async_next();
    if (!path || tok.stop_requested()) {
      break;
    }
    co_await handle_network_path(*path);
  }
  WSCORO_LOG_DEBUG("client.network_loop.stop");
}

inline auto controller::handle_event(event ev) -> iocoro::awaitable<void> {
  WSCORO_ACTOR_LOG(debug, "event.received {}", to_string(ev));

  std::visit(
    [this](auto const& e) {
      using T = std::decay_t<decltype(e)>;
      if constexpr (std::is_same_v<T, events::connected>) {
        update_status(status::connected());
      } else if constexpr (std::is_same_v<T, events::disconnected>) {
        update_status(status::closed(is_abnormal(e.code) ? closure_state::abnormal
                                                         : closure_state::normal));
      } else if constexpr (std::is_same_v<T, events::error> ||
                           std::is_same_v<T, events::cancelled> ||
                           std::is_same_v<T, events::peer_closed>) {
        update_status(status::closed(closure_state::abnormal));
      }
    },
    ev);

  notify_delegate([&](client_delegate& d) { d.did_receive_event(ev); });

  if (strategy_->should_reconnect_when_receiving_event(ev)) {
    co_await reconnect(reconnect_reasons::suggested_by_event{ev}, false);
  } else {
    destroy_reconnect_timer(true);
  }
}

}  // namespace wscoro::detail
