#pragma once

#include <wscoro/backend.hpp>
#include <wscoro/config.hpp>
#include <wscoro/delegate.hpp>
#include <wscoro/detail/controller.hpp>
#include <wscoro/error.hpp>
#include <wscoro/expected.hpp>
#include <wscoro/frame.hpp>
#include <wscoro/path_monitor.hpp>
#include <wscoro/reconnect_strategy.hpp>
#include <wscoro/status.hpp>

#include <iocoro/awaitable.hpp>
#include <iocoro/io_executor.hpp>

#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace wscoro {

/// Resilient WebSocket client with coroutine-based async API.
///
/// Responsibilities:
/// - Own the connection lifecycle (status, reconnect count, reconnect and auto-ping timers)
/// - Decide when to reconnect, via the supplied reconnect_strategy, after transport failures
///   and after network recovery
/// - Publish one ordered status/event feed to a client_delegate
///
/// NOT responsible for:
/// - WebSocket framing, TLS or the upgrade handshake (delegated to the backend)
/// - Reachability detection (delegated to the path_monitor)
///
/// Thread safety:
/// - All methods can be called from any executor
/// - Internally everything is serialized on one strand
///
/// Usage:
///   client c{ctx.get_executor(), cfg, std::move(be), std::move(monitor)};
///   c.set_delegate(&observer);
///   co_await c.connect();
///   co_await c.send(frames::text{"hello"});
///   co_await c.disconnect();
class client {
 public:
  /// Construct a client and start consuming backend events and network updates.
  ///
  /// Throws std::system_error with `error::invalid_configuration` when `cfg` fails validate()
  /// or when a collaborator is null.
  client(iocoro::io_executor ex, config cfg, std::unique_ptr<backend> be,
         std::unique_ptr<path_monitor> monitor,
         std::shared_ptr<reconnect_strategy const> strategy =
           std::make_shared<exponential_reconnect_strategy>())
      : ctl_(make_controller(ex, std::move(cfg), std::move(be), std::move(monitor),
                             std::move(strategy))) {
    ctl_->start();
  }

  client(client const&) = delete;
  auto operator=(client const&) -> client& = delete;

  /// Cancels both timers, unsubscribes from the network watcher and stops consuming the
  /// backend's event stream. Does not close the transport; call disconnect() first for a clean
  /// close handshake.
  ~client() {
    if (ctl_) {
      ctl_->shutdown();
    }
  }

  /// Attach an observer, or detach with nullptr. Not owned.
  void set_delegate(client_delegate* d) noexcept { ctl_->set_delegate(d); }

  /// Start a connection attempt.
  ///
  /// Returns:
  /// - true: status was closed, is now connecting, and backend::connect() was issued
  /// - false: rejected (already connecting or connected), logged at warning level
  ///
  /// The outcome of the attempt arrives later as a status change.
  auto connect() -> iocoro::awaitable<bool> { co_return co_await ctl_->connect(); }

  /// Close intentionally. Cancels auto-ping and any pending reconnect (the reconnect count is
  /// reset), then asks the backend to close. No reconnect scheduled before this call fires
  /// after it.
  auto disconnect(close_code code = close_code::normal_closure,
                  std::optional<std::string> reason = std::nullopt) -> iocoro::awaitable<void> {
    co_await ctl_->disconnect(code, std::move(reason));
  }

  /// Send a frame.
  ///
  /// Returns:
  /// - success when the backend accepted the frame
  /// - `error::not_connected` when the status is not connected (dropped, not queued)
  /// - the backend's error on transport failure
  auto send(frame f) -> iocoro::awaitable<write_result> {
    co_return co_await ctl_->send(std::move(f));
  }

  auto ping() -> iocoro::awaitable<write_result> { co_return co_await ctl_->send(frames::ping{}); }

  [[nodiscard]] auto get_status() const noexcept -> status { return ctl_->current_status(); }

  [[nodiscard]] auto is_connected() const noexcept -> bool {
    return ctl_->current_status().is_connected();
  }

  /// Reconnect attempts issued since the last success or explicit disconnect.
  [[nodiscard]] auto reconnect_count() const noexcept -> std::uint32_t {
    return ctl_->reconnect_count();
  }

  /// Diagnostics: whether a reconnect timer handle currently exists.
  [[nodiscard]] auto has_reconnect_timer() const noexcept -> bool {
    return ctl_->has_reconnect_timer();
  }

  /// Diagnostics: whether an auto-ping timer handle currently exists.
  [[nodiscard]] auto has_auto_ping_timer() const noexcept -> bool {
    return ctl_->has_auto_ping_timer();
  }

  [[nodiscard]] auto current_path() const noexcept -> network_path {
    return ctl_->current_path();
  }

  [[nodiscard]] auto get_config() const noexcept -> config const& { return ctl_->get_config(); }

 private:
  static auto make_controller(iocoro::io_executor ex, config cfg, std::unique_ptr<backend> be,
                              std::unique_ptr<path_monitor> monitor,
                              std::shared_ptr<reconnect_strategy const> strategy)
    -> std::shared_ptr<detail::controller> {
    if (auto ok = validate(cfg); !ok) {
      throw std::system_error{ok.error().code, ok.error().detail};
    }
    if (!be || !monitor || !strategy) {
      throw std::system_error{make_error_code(error::invalid_configuration),
                              "backend, path monitor and strategy are required"};
    }
    return std::make_shared<detail::controller>(ex, std::move(cfg), std::move(be),
                                                std::move(monitor), std::move(strategy));
  }

  std::shared_ptr<detail::controller> ctl_;
};

}  // namespace wscoro
