#pragma once

#include <wscoro/assert.hpp>
#include <wscoro/logger.hpp>
#include <wscoro/network_watcher.hpp>

#include <utility>

namespace wscoro {

inline network_watcher::network_watcher(detail::actor_executor ex,
                                        std::unique_ptr<path_monitor> monitor,
                                        std::chrono::milliseconds debounce)
    : executor_(std::move(ex)), monitor_(std::move(monitor)), debounce_(debounce) {
  WSCORO_ENSURE(monitor_ != nullptr, "network_watcher requires a path monitor");
  path_snapshot_.store(monitor_->current_path(), std::memory_order_release);
}

inline network_watcher::~network_watcher() {
  if (active_) {
    monitor_->cancel();
  }
}

inline void network_watcher::on_change(change_handler handler) { handler_ = std::move(handler); }

inline void network_watcher::fire() {
  if (active_) {
    return;
  }
  active_ = true;
  active_snapshot_.store(true, std::memory_order_release);
  first_pending_ = true;
  generation_ += 1;
  set_current(monitor_->current_path());
  WSCORO_LOG_DEBUG("network_watcher.fire debounce_ms={} generation={}", debounce_.count(),
                   generation_);

  auto ex = executor_.strand().executor();
  auto gen = generation_;
  monitor_->start([weak = weak_from_this(), ex, gen](network_path path) mutable {
    ex.post([weak, gen, path]() {
      if (auto self = weak.lock()) {
        self->on_raw_update(gen, path);
      }
    });
  });
}

inline void network_watcher::invalidate() {
  if (!active_) {
    return;
  }
  active_ = false;
  active_snapshot_.store(false, std::memory_order_release);
  generation_ += 1;
  monitor_->cancel();
  if (debounce_timer_) {
    debounce_timer_->stop();
  }
  pending_.reset();
  WSCORO_LOG_DEBUG("network_watcher.invalidate");
}

inline void network_watcher::on_raw_update(std::uint64_t generation, network_path path) {
  if (!active_ || generation != generation_) {
    return;
  }
  WSCORO_LOG_VERBOSE("network_watcher.raw_update {}", to_string(path));
  pending_ = path;

  if (debounce_.count() <= 0) {
    deliver();
    return;
  }

  if (!debounce_timer_) {
    debounce_timer_ = std::make_unique<async_timer>(
      executor_, debounce_, timer_mode::one_shot, false,
      [weak = weak_from_this()]() -> iocoro::awaitable<void> {
        if (auto self = weak.lock()) {
          self->deliver();
        }
        co_return;
      });
  }
  debounce_timer_->restart();
}

inline void network_watcher::deliver() {
  if (!active_ || !pending_) {
    return;
  }
  auto path = *pending_;
  pending_.reset();
  path.is_first_update = first_pending_;
  first_pending_ = false;
  set_current(path);

  WSCORO_LOG_DEBUG("network_watcher.deliver {}", to_string(path));
  if (handler_) {
    handler_(path);
  }
}

inline void network_watcher::set_current(network_path path) noexcept {
  path_snapshot_.store(path, std::memory_order_release);
}

}  // namespace wscoro
