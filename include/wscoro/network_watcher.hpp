#pragma once

#include <wscoro/detail/actor_executor.hpp>
#include <wscoro/network_path.hpp>
#include <wscoro/path_monitor.hpp>
#include <wscoro/timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace wscoro {

/// Debounced view of a path_monitor, serialized on a client strand.
///
/// Raw updates from the monitor (any thread) are posted onto the strand. With a zero debounce
/// each raw update is delivered at once; otherwise a one-shot timer is restarted on every raw
/// update and only the last value of a burst is delivered when it fires.
///
/// The first update delivered after fire() carries `is_first_update = true`, so a consumer can
/// tell "monitoring just started and the network happens to be up" from a real recovery.
///
/// Thread-safety: fire(), invalidate() and on_change() must be called on the strand.
/// is_active() and current_path() may be called from any thread.
class network_watcher : public std::enable_shared_from_this<network_watcher> {
 public:
  using change_handler = std::function<void(network_path const&)>;

  network_watcher(detail::actor_executor ex, std::unique_ptr<path_monitor> monitor,
                  std::chrono::milliseconds debounce);

  network_watcher(network_watcher const&) = delete;
  auto operator=(network_watcher const&) -> network_watcher& = delete;

  ~network_watcher();

  /// Replace the subscriber. Invoked on the strand for every debounced update.
  void on_change(change_handler handler);

  /// Start monitoring. No-op when already active.
  void fire();

  /// Stop monitoring and drop any update still being debounced. No-op when idle.
  void invalidate();

  [[nodiscard]] auto is_active() const noexcept -> bool {
    return active_snapshot_.load(std::memory_order_acquire);
  }

  /// Last delivered path, or the monitor's current path before the first delivery.
  [[nodiscard]] auto current_path() const noexcept -> network_path {
    return path_snapshot_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto debounce() const noexcept -> std::chrono::milliseconds { return debounce_; }

 private:
  void on_raw_update(std::uint64_t generation, network_path path);
  void deliver();
  void set_current(network_path path) noexcept;

  detail::actor_executor executor_;
  std::unique_ptr<path_monitor> monitor_;
  std::chrono::milliseconds debounce_;
  change_handler handler_{};

  std::unique_ptr<async_timer> debounce_timer_{};
  std::optional<network_path> pending_{};
  bool active_{false};
  bool first_pending_{false};
  // Bumped by fire()/invalidate() so updates posted for an older subscription are dropped.
  std::uint64_t generation_{0};

  std::atomic<bool> active_snapshot_{false};
  std::atomic<network_path> path_snapshot_{};
};

}  // namespace wscoro

#include <wscoro/impl/network_watcher.ipp>
