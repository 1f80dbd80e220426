#pragma once

#include <wscoro/detail/controller.hpp>

namespace wscoro::detail {

inline auto controller::handle_network_path(network_path path) -> iocoro::awaitable<void> {
  notify_delegate([&](client_delegate& d) { d.did_update_network_path(path); });

  if (!path.is_satisfied()) {
    WSCORO_ACTOR_LOG(debug, "network.unsatisfied {}", to_string(path));
    co_return;
  }

  // Monitoring just started and the network happens to be up: nothing recovered.
  if (path.is_first_update) {
    WSCORO_ACTOR_LOG(verbose, "network.first_update ignored {}", to_string(path));
    co_return;
  }

  // Never interrupt an intentional close or an attempt in flight.
  if (!status_.is_abnormal_closed()) {
    WSCORO_ACTOR_LOG(verbose, "network.recovered ignored status={}", to_string(status_));
    co_return;
  }

  const bool immediate = strategy_->should_reconnect_immediately_when_network_recovered(path);
  WSCORO_ACTOR_LOG(debug, "network.recovered immediate={}", immediate);
  co_await reconnect(reconnect_reasons::network_recovery{path}, immediate);
}

}  // namespace wscoro::detail
