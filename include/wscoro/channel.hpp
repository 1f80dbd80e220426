#pragma once

#include <iocoro/awaitable.hpp>
#include <iocoro/condition_event.hpp>

#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace wscoro {

/// Unbounded multi-producer, single-consumer FIFO with a coroutine receive side.
///
/// - push()/close() may be called from any thread.
/// - async_next() must have at most one waiter at a time.
/// - After close(), buffered values are still delivered; then async_next() yields nullopt.
template <typename T>
class channel {
 public:
  channel() = default;
  channel(channel const&) = delete;
  auto operator=(channel const&) -> channel& = delete;

  /// Returns false (and drops the value) when the channel is closed.
  auto push(T value) -> bool {
    {
      std::lock_guard lock(mu_);
      if (closed_) {
        return false;
      }
      items_.push_back(std::move(value));
    }
    wakeup_.notify();
    return true;
  }

  void close() {
    {
      std::lock_guard lock(mu_);
      closed_ = true;
    }
    wakeup_.notify();
  }

  /// Reopen a closed channel, discarding anything still buffered.
  void reset() {
    std::lock_guard lock(mu_);
    items_.clear();
    closed_ = false;
  }

  [[nodiscard]] auto is_closed() const -> bool {
    std::lock_guard lock(mu_);
    return closed_;
  }

  [[nodiscard]] auto size() const -> std::size_t {
    std::lock_guard lock(mu_);
    return items_.size();
  }

  auto async_next() -> iocoro::awaitable<std::optional<T>> {
    for (;;) {
      std::optional<T> out{};
      bool closed = false;
      {
        std::lock_guard lock(mu_);
        if (!items_.empty()) {
          out.emplace(std::move(items_.front()));
          items_.pop_front();
        } else {
          closed = closed_;
        }
      }
      if (out.has_value() || closed) {
        co_return out;
      }
      (void)co_await wakeup_.async_wait();
    }
  }

 private:
  mutable std::mutex mu_{};
  std::deque<T> items_{};
  bool closed_{false};
  iocoro::condition_event wakeup_{};
};

}  // namespace wscoro
